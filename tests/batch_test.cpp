// batch_test.cpp: parallel diff of independent pairs

#include <jsondiff-cpp/batch.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

using namespace jsondiff_cpp;
using json = nlohmann::json;

namespace {

auto make_pairs(std::size_t count) -> std::vector<ValuePair> {
    auto pairs = std::vector<ValuePair>{};
    pairs.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto a = json{{"id", i}, {"items", json::array()}};
        auto b = json{{"id", i}, {"items", json::array()}, {"name", "item-" + std::to_string(i)}};
        for (std::size_t k = 0; k < i % 7; ++k) {
            a["items"].push_back(k);
            b["items"].push_back(k * 2);
        }
        pairs.emplace_back(std::move(a), std::move(b));
    }
    return pairs;
}

}  // namespace

TEST(Batch, empty_input) {
    EXPECT_TRUE(invertible_diff_all({}).empty());
    EXPECT_TRUE(cheap_diff_all({}, 4).empty());
}

TEST(Batch, results_match_sequential_order) {
    const auto pairs = make_pairs(50);
    const auto results = invertible_diff_all(pairs, 4);
    ASSERT_EQ(results.size(), pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        EXPECT_EQ(results[i], invertible_diff(pairs[i].first, pairs[i].second)) << "pair " << i;
    }
}

TEST(Batch, single_thread_runs_inline) {
    const auto pairs = make_pairs(10);
    const auto results = invertible_diff_all(pairs, 1);
    ASSERT_EQ(results.size(), pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        EXPECT_EQ(results[i], invertible_diff(pairs[i].first, pairs[i].second));
    }
}

TEST(Batch, default_thread_count) {
    const auto pairs = make_pairs(20);
    const auto results = cheap_diff_all(pairs);
    ASSERT_EQ(results.size(), pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        EXPECT_EQ(results[i], cheap_diff(pairs[i].first, pairs[i].second));
    }
}

TEST(Batch, more_threads_than_pairs) {
    const auto pairs = make_pairs(3);
    const auto results = invertible_diff_all(pairs, 16);
    ASSERT_EQ(results.size(), 3u);
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        auto r = jsondiff_cpp::apply(results[i], pairs[i].first);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(*r, pairs[i].second);
    }
}

TEST(Batch, options_are_shared) {
    const auto pairs = make_pairs(30);
    auto calls = std::atomic<std::size_t>{0};
    auto options = DiffOptions{};
    options.weight = [&calls](const InvertiblePatch& p) {
        calls.fetch_add(1, std::memory_order_relaxed);
        return operation_count_weight(p);
    };
    const auto results = invertible_diff_all(pairs, 3, options);
    ASSERT_EQ(results.size(), pairs.size());
    EXPECT_GT(calls.load(), 0u);
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        auto r = jsondiff_cpp::apply(results[i], pairs[i].first);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(*r, pairs[i].second);
    }
}
