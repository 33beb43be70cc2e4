/// @file value.hpp
/// @brief Value model: the JSON tree type and its decoded views.

#pragma once

#include <nlohmann/json.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace jsondiff_cpp {

/// A JSON-like value tree. Supplied by nlohmann/json.
using Value = nlohmann::json;

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A decoded leaf value.
///
/// Alternatives, in decode order: string, bool, int64_t, double, Null.
using Primitive = std::variant<
    std::string,
    bool,
    std::int64_t,
    double,
    Null
>;

/// The shape a Value decodes as.
enum class ValueKind : std::uint8_t {
    primitive,  ///< string, bool, number or null.
    sequence,   ///< An ordered sequence of values (JSON array).
    map,        ///< A string-keyed map of values (JSON object).
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::primitive: return "primitive";
        case ValueKind::sequence:  return "sequence";
        case ValueKind::map:       return "map";
    }
    return "unknown";
}

/// Classify a value by the shape it decodes as.
auto kind_of(const Value& v) noexcept -> ValueKind;

/// Decode a value as a primitive, trying string, bool, int, float and null
/// in that order. Integral numbers (including floats with an exactly
/// representable integral value) decode as int64_t. Unsigned values above
/// INT64_MAX fall back to double. Arrays and objects yield nullopt.
auto decode_primitive(const Value& v) -> std::optional<Primitive>;

/// The ordered elements of an array value, or nullptr for any other value.
auto decode_sequence(const Value& v) noexcept -> const Value::array_t*;

/// The members of an object value in key order, or nullptr for any other
/// value.
auto decode_map(const Value& v) noexcept -> const Value::object_t*;

/// True when both primitives hold the same alternative.
auto same_primitive_kind(const Primitive& a, const Primitive& b) noexcept -> bool;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const InvertibleAdd& op) { ... },
///     [](const auto&) { ... },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsondiff_cpp
