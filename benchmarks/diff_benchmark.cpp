// jsondiff-cpp benchmarks: measures throughput of diffing and patching.

#include <jsondiff-cpp/jsondiff.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace jsondiff_cpp;
using json = nlohmann::json;

namespace {

auto int_list(std::size_t n, std::size_t skip_every) -> json {
    auto v = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        if (skip_every != 0 && i % skip_every == 0) continue;
        v.push_back(i);
    }
    return v;
}

auto record_map(std::size_t n, std::size_t version) -> json {
    auto v = json::object();
    for (std::size_t i = 0; i < n; ++i) {
        v["key" + std::to_string(i)] = {
            {"value", (i * 31 + version * (i % 5 == 0 ? 1 : 0)) % 97},
            {"tag", "t" + std::to_string(i % 4)},
        };
    }
    return v;
}

}  // namespace

// =============================================================================
// Optimizing diff
// =============================================================================

static void bm_diff_list(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = int_list(n, 0);
    const auto b = int_list(n, 7);
    for (auto _ : state) {
        auto p = invertible_diff(a, b);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_list)->RangeMultiplier(2)->Range(8, 128);

static void bm_diff_list_operation_count(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = int_list(n, 0);
    const auto b = int_list(n, 7);
    for (auto _ : state) {
        auto p = diff_with_custom_weight(a, b, operation_count_weight);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_list_operation_count)->RangeMultiplier(2)->Range(8, 128);

static void bm_diff_map(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = record_map(n, 0);
    const auto b = record_map(n, 1);
    for (auto _ : state) {
        auto p = invertible_diff(a, b);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_map)->Range(10, 1000);

// =============================================================================
// Cheap diff
// =============================================================================

static void bm_cheap_diff_list(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = int_list(n, 0);
    const auto b = int_list(n, 7);
    for (auto _ : state) {
        auto p = cheap_diff(a, b);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_cheap_diff_list)->Range(8, 8192);

// =============================================================================
// Patch algebra
// =============================================================================

static void bm_apply(benchmark::State& state) {
    const auto a = record_map(200, 0);
    const auto b = record_map(200, 1);
    const auto p = invertible_diff(a, b);
    for (auto _ : state) {
        auto r = jsondiff_cpp::apply(p, a);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply);

static void bm_merge(benchmark::State& state) {
    const auto a = int_list(64, 0);
    auto b = a;
    b.erase(b.begin());
    b.push_back(0);
    const auto p = invertible_diff(a, b);
    for (auto _ : state) {
        auto m = merge(p);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge);

static void bm_encode_decode_invertible(benchmark::State& state) {
    const auto p = invertible_diff(record_map(200, 0), record_map(200, 1));
    for (auto _ : state) {
        auto decoded = decode_invertible(encode_invertible(p));
        benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_decode_invertible);

// =============================================================================
// Batch
// =============================================================================

static void bm_diff_all(benchmark::State& state) {
    const auto threads = static_cast<unsigned int>(state.range(0));
    auto pairs = std::vector<ValuePair>{};
    for (std::size_t v = 0; v < 32; ++v) {
        pairs.emplace_back(record_map(100, v), record_map(100, v + 1));
    }
    for (auto _ : state) {
        auto results = invertible_diff_all(pairs, threads);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * pairs.size()));
}
BENCHMARK(bm_diff_all)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

BENCHMARK_MAIN();
