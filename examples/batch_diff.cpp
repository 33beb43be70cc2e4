// batch_diff: diff many document versions on a worker pool
//
// Generates a series of record snapshots and diffs each consecutive pair,
// once on the calling thread and once with all hardware threads.
//
// Build: cmake -B build -DJSONDIFF_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/batch_diff

#include <jsondiff-cpp/jsondiff.hpp>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace jd = jsondiff_cpp;
using json = nlohmann::json;

namespace {

auto snapshot(std::size_t version) -> json {
    auto records = json::array();
    for (std::size_t i = 0; i < 60; ++i) {
        if ((i + version) % 11 == 0) continue;
        records.push_back({
            {"id", i},
            {"score", (i * 7 + version * 3) % 50},
            {"label", "record-" + std::to_string(i % (version + 3))},
        });
    }
    return {{"version", version}, {"records", records}};
}

template <typename F>
auto timed(F&& fn) -> double {
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

}  // namespace

int main() {
    auto pairs = std::vector<jd::ValuePair>{};
    for (std::size_t v = 0; v < 64; ++v) {
        pairs.emplace_back(snapshot(v), snapshot(v + 1));
    }

    auto sequential = std::vector<jd::InvertiblePatch>{};
    auto parallel = std::vector<jd::InvertiblePatch>{};

    const auto seq_ms = timed([&] { sequential = jd::invertible_diff_all(pairs, 1); });
    const auto par_ms = timed([&] { parallel = jd::invertible_diff_all(pairs); });

    auto total_ops = std::size_t{0};
    for (const auto& p : parallel) total_ops += p.size();

    std::printf("%zu pairs, %zu operations total\n", pairs.size(), total_ops);
    std::printf("sequential: %.1f ms\n", seq_ms);
    std::printf("parallel (%u threads): %.1f ms\n", std::thread::hardware_concurrency(), par_ms);
    std::printf("results identical: %s\n", sequential == parallel ? "yes" : "no");

    return 0;
}
