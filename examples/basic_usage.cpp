// basic_usage: demonstrates core jsondiff-cpp API
//
// Computes a minimal patch between two documents, prints it as RFC 6902
// JSON, applies it, and shows the recoverable form with embedded tests.
//
// Build: cmake -B build -DJSONDIFF_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsondiff-cpp/jsondiff.hpp>

#include <cstdio>
#include <string>

namespace jd = jsondiff_cpp;
using json = nlohmann::json;

int main() {
    const auto before = json::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs", "Bread", "Butter"],
        "owner": {"name": "Alice", "email": "alice@example.com"}
    })");
    const auto after = json::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Jam", "Butter"],
        "owner": {"name": "Alice", "email": "alice@example.org"},
        "shared": true
    })");

    // -- Minimal plain patch --------------------------------------------------
    const auto patch = jd::diff(before, after);
    std::printf("Patch (%zu operations):\n%s\n\n", patch.size(),
                jd::encode_patch(patch).dump(2).c_str());

    // -- Apply it -------------------------------------------------------------
    auto result = jd::apply_patch(patch, before);
    if (!result) {
        std::printf("apply failed: %s\n", result.error().message.c_str());
        return 1;
    }
    std::printf("Applied patch reaches target: %s\n\n", *result == after ? "yes" : "no");

    // -- Recoverable form: every remove/replace is preceded by a test ---------
    const auto invertible = jd::invertible_diff(before, after);
    std::printf("Recoverable form:\n%s\n\n", jd::encode_invertible(invertible).dump(2).c_str());

    // -- Parse patches from text ----------------------------------------------
    auto parsed = jd::parse_patch(R"([{"op": "copy", "from": "/title", "path": "/name"}])");
    if (parsed) {
        auto strict = jd::from_patch(*parsed);
        if (!strict) {
            std::printf("Not invertible: [%s] %s\n",
                        std::string{jd::to_string_view(strict.error().kind)}.c_str(),
                        strict.error().message.c_str());
        }
    }

    // -- Cheap diff for comparison ---------------------------------------------
    const auto cheap = jd::cheap_diff(before, after);
    std::printf("\nOptimal weight: %zu, cheap weight: %zu\n",
                jd::default_weight(invertible), jd::default_weight(cheap));

    return 0;
}
