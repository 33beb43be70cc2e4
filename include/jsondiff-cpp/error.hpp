/// @file error.hpp
/// @brief Error types for the jsondiff-cpp library.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace jsondiff_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_patch,    ///< A plain patch does not have the invertible shape.
    invalid_pointer,  ///< A JSON Pointer string is malformed.
    decoding_error,   ///< A JSON value is not a well-formed RFC 6902 patch.
    apply_failed,     ///< The patch engine rejected an operation.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_patch:   return "invalid_patch";
        case ErrorKind::invalid_pointer: return "invalid_pointer";
        case ErrorKind::decoding_error:  return "decoding_error";
        case ErrorKind::apply_failed:    return "apply_failed";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The outcome of a fallible operation: a value or an Error.
template <typename T>
using Result = std::expected<T, Error>;

/// Shorthand for building the error side of a Result.
inline auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected<Error>{Error{kind, std::move(message)}};
}

}  // namespace jsondiff_cpp
