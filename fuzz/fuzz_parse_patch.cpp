// Fuzz target for parse_patch() and from_patch(). Any patch that decodes
// must re-encode to JSON that decodes to the same patch.

#include <jsondiff-cpp/jsondiff.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto patch = jsondiff_cpp::parse_patch(text);
    if (!patch) return 0;

    auto again = jsondiff_cpp::decode_patch(jsondiff_cpp::encode_patch(*patch));
    if (!again || *again != *patch) std::abort();

    if (auto invertible = jsondiff_cpp::from_patch(*patch)) {
        if (jsondiff_cpp::to_patch(*invertible) != *patch) std::abort();
        auto inverted = jsondiff_cpp::invert(jsondiff_cpp::invert(*invertible));
        if (inverted != *invertible) std::abort();
    }
    return 0;
}
