#include <jsondiff-cpp/value.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace jsondiff_cpp {

namespace {

// Bounds of int64_t as exactly representable doubles: [-2^63, 2^63).
constexpr auto int64_lower = static_cast<double>(std::numeric_limits<std::int64_t>::min());
constexpr auto int64_upper = -int64_lower;

auto integral_double(double d) -> std::optional<std::int64_t> {
    if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
    if (d < int64_lower || d >= int64_upper) return std::nullopt;
    return static_cast<std::int64_t>(d);
}

}  // anonymous namespace

auto kind_of(const Value& v) noexcept -> ValueKind {
    if (v.is_array()) return ValueKind::sequence;
    if (v.is_object()) return ValueKind::map;
    return ValueKind::primitive;
}

auto decode_primitive(const Value& v) -> std::optional<Primitive> {
    if (v.is_string()) {
        return Primitive{v.get<std::string>()};
    }
    if (v.is_boolean()) {
        return Primitive{v.get<bool>()};
    }
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Primitive{static_cast<std::int64_t>(u)};
        }
        return Primitive{static_cast<double>(u)};
    }
    if (v.is_number_integer()) {
        return Primitive{v.get<std::int64_t>()};
    }
    if (v.is_number_float()) {
        auto d = v.get<double>();
        if (auto i = integral_double(d)) return Primitive{*i};
        return Primitive{d};
    }
    if (v.is_null()) {
        return Primitive{Null{}};
    }
    return std::nullopt;
}

auto decode_sequence(const Value& v) noexcept -> const Value::array_t* {
    return v.get_ptr<const Value::array_t*>();
}

auto decode_map(const Value& v) noexcept -> const Value::object_t* {
    return v.get_ptr<const Value::object_t*>();
}

auto same_primitive_kind(const Primitive& a, const Primitive& b) noexcept -> bool {
    return a.index() == b.index();
}

}  // namespace jsondiff_cpp
