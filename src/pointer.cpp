#include <jsondiff-cpp/pointer.hpp>

#include <algorithm>
#include <string>

namespace jsondiff_cpp {

auto parse_pointer(std::string_view text) -> Result<Pointer> {
    try {
        return Pointer{std::string{text}};
    } catch (const nlohmann::json::parse_error& e) {
        return make_error(ErrorKind::invalid_pointer,
                          "invalid JSON Pointer \"" + std::string{text} + "\": " + e.what());
    }
}

auto child(const Pointer& p, std::string_view key) -> Pointer {
    return p / std::string{key};
}

auto child(const Pointer& p, std::size_t index) -> Pointer {
    return p / index;
}

// Escaped reference tokens never contain '/', so prefix tests on the
// rendered form follow token boundaries.
auto is_prefix(const Pointer& prefix, const Pointer& p) -> bool {
    const auto a = prefix.to_string();
    const auto b = p.to_string();
    if (a.size() > b.size()) return false;
    if (b.compare(0, a.size(), a) != 0) return false;
    return a.size() == b.size() || b[a.size()] == '/';
}

auto is_proper_prefix(const Pointer& prefix, const Pointer& p) -> bool {
    return is_prefix(prefix, p) && prefix != p;
}

namespace {

/// True when the token could address an array element.
auto index_like(const std::string& token) -> bool {
    if (token == "-") return true;
    return !token.empty() &&
           std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; });
}

/// True when inserting or removing at `at` may renumber `other`.
auto may_renumber(const Pointer& at, const Pointer& other) -> bool {
    return index_like(at.back()) && is_prefix(at.parent_pointer(), other);
}

}  // anonymous namespace

auto interferes(const Pointer& a, const Pointer& b) -> bool {
    if (a.empty() || b.empty()) return true;
    if (is_prefix(a, b) || is_prefix(b, a)) return true;
    return may_renumber(a, b) || may_renumber(b, a);
}

}  // namespace jsondiff_cpp
