#include <jsondiff-cpp/batch.hpp>
#include <jsondiff-cpp/logging.hpp>

#include "thread_pool.hpp"

#include <algorithm>
#include <cstddef>
#include <thread>

namespace jsondiff_cpp {

namespace {

auto resolve_threads(unsigned int num_threads, std::size_t count) -> unsigned int {
    auto n = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
    if (n == 0) n = 1;
    return static_cast<unsigned int>(std::min<std::size_t>(n, count));
}

template <typename Fn>
auto diff_all(std::span<const ValuePair> pairs, unsigned int num_threads, Fn&& fn)
    -> std::vector<InvertiblePatch> {
    auto results = std::vector<InvertiblePatch>(pairs.size());
    const auto threads = resolve_threads(num_threads, pairs.size());
    logger()->debug("diffing {} value pairs on {} thread(s)", pairs.size(), threads);

    if (threads <= 1) {
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            results[i] = fn(pairs[i].first, pairs[i].second);
        }
        return results;
    }

    // Each index writes only its own slot; diffing shares no mutable state.
    auto pool = detail::ThreadPool{threads};
    pool.for_each_index(pairs.size(), [&](std::size_t i) {
        results[i] = fn(pairs[i].first, pairs[i].second);
    });
    return results;
}

}  // anonymous namespace

auto invertible_diff_all(std::span<const ValuePair> pairs, unsigned int num_threads,
                         const DiffOptions& options) -> std::vector<InvertiblePatch> {
    return diff_all(pairs, num_threads, [&](const Value& a, const Value& b) {
        return invertible_diff(a, b, options);
    });
}

auto cheap_diff_all(std::span<const ValuePair> pairs, unsigned int num_threads)
    -> std::vector<InvertiblePatch> {
    return diff_all(pairs, num_threads, [](const Value& a, const Value& b) {
        return cheap_diff(a, b);
    });
}

}  // namespace jsondiff_cpp
