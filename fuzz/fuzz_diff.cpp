// Fuzz target for the diff engine. The input is split at the first newline
// into two JSON documents; the diff between them must reach the second and
// its inverse must restore the first.

#include <jsondiff-cpp/jsondiff.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = text.find('\n');
    if (split == std::string_view::npos) return 0;

    const auto a = nlohmann::json::parse(text.substr(0, split), nullptr, false);
    const auto b = nlohmann::json::parse(text.substr(split + 1), nullptr, false);
    if (a.is_discarded() || b.is_discarded()) return 0;

    // Bound the quadratic list search.
    const auto options = jsondiff_cpp::DiffOptions{.list_cost_limit = 4096};
    const auto patch = jsondiff_cpp::invertible_diff(a, b, options);

    auto forward = jsondiff_cpp::apply(patch, a);
    if (!forward || *forward != b) std::abort();

    auto back = jsondiff_cpp::apply(jsondiff_cpp::invert(patch), b);
    if (!back || *back != a) std::abort();

    auto cheap = jsondiff_cpp::apply(jsondiff_cpp::cheap_diff(a, b), a);
    if (!cheap || *cheap != b) std::abort();
    return 0;
}
