/// @file patch.hpp
/// @brief Plain RFC 6902 patch operations.

#pragma once

#include <jsondiff-cpp/pointer.hpp>
#include <jsondiff-cpp/value.hpp>

#include <string_view>
#include <variant>
#include <vector>

namespace jsondiff_cpp {

/// Insert a value into an array or set an object member.
struct PatchAdd {
    Pointer path;  ///< Where the value is added.
    Value value;   ///< The added value.
    auto operator==(const PatchAdd&) const -> bool = default;
};

/// Remove the value at a location.
struct PatchRemove {
    Pointer path;  ///< The removed location.
    auto operator==(const PatchRemove&) const -> bool = default;
};

/// Replace the value at an existing location.
struct PatchReplace {
    Pointer path;  ///< The replaced location.
    Value value;   ///< The new value.
    auto operator==(const PatchReplace&) const -> bool = default;
};

/// Remove a value and add it at another location.
struct PatchMove {
    Pointer from;  ///< The source location.
    Pointer path;  ///< The target location.
    auto operator==(const PatchMove&) const -> bool = default;
};

/// Add a copy of a value at another location.
struct PatchCopy {
    Pointer from;  ///< The source location.
    Pointer path;  ///< The target location.
    auto operator==(const PatchCopy&) const -> bool = default;
};

/// Assert that the value at a location equals the given value.
struct PatchTest {
    Pointer path;  ///< The tested location.
    Value value;   ///< The expected value.
    auto operator==(const PatchTest&) const -> bool = default;
};

/// A single RFC 6902 operation.
using PatchOp = std::variant<
    PatchAdd,
    PatchRemove,
    PatchReplace,
    PatchMove,
    PatchCopy,
    PatchTest
>;

/// An ordered list of operations, applied left to right. Each operation
/// resolves its pointers against the document as mutated by the ones
/// before it.
using Patch = std::vector<PatchOp>;

/// The RFC 6902 "op" member naming an operation.
auto op_name(const PatchOp& op) noexcept -> std::string_view;

/// The "path" member of an operation.
auto op_path(const PatchOp& op) noexcept -> const Pointer&;

}  // namespace jsondiff_cpp
