/// @file invertible.hpp
/// @brief Invertible patch operations and their algebra.
///
/// An invertible operation carries the value it overwrites or removes, so
/// that the edit can be undone exactly. The carried values are metadata:
/// forward application never consults them.

#pragma once

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/patch.hpp>
#include <jsondiff-cpp/pointer.hpp>
#include <jsondiff-cpp/value.hpp>

#include <string_view>
#include <variant>
#include <vector>

namespace jsondiff_cpp {

/// A value was added. Inverts to InvertibleRemove.
struct InvertibleAdd {
    Pointer path;  ///< Where the value is added.
    Value value;   ///< The added value.
    auto operator==(const InvertibleAdd&) const -> bool = default;
};

/// A value was removed. Inverts to InvertibleAdd.
struct InvertibleRemove {
    Pointer path;     ///< The removed location.
    Value old_value;  ///< The value that was there.
    auto operator==(const InvertibleRemove&) const -> bool = default;
};

/// A value was replaced. Inverts by swapping old and new.
struct InvertibleReplace {
    Pointer path;     ///< The replaced location.
    Value old_value;  ///< The value that was there.
    Value new_value;  ///< The value put in its place.
    auto operator==(const InvertibleReplace&) const -> bool = default;
};

/// A value was moved. Inverts by swapping source and target.
struct InvertibleMove {
    Pointer from;  ///< The source location.
    Pointer path;  ///< The target location.
    auto operator==(const InvertibleMove&) const -> bool = default;
};

/// The closed set of invertible operations.
using InvertibleOp = std::variant<
    InvertibleAdd,
    InvertibleRemove,
    InvertibleReplace,
    InvertibleMove
>;

/// An ordered list of invertible operations, applied left to right.
using InvertiblePatch = std::vector<InvertibleOp>;

/// The RFC 6902 name of the operation ("add", "remove", "replace", "move").
auto op_name(const InvertibleOp& op) noexcept -> std::string_view;

/// Reverse a patch: the order of operations is reversed and each operation
/// is mapped to its opposite. invert(invert(p)) == p.
auto invert(const InvertiblePatch& patch) -> InvertiblePatch;

/// Translate to a plain patch that from_patch() can read back. Removes and
/// replaces are preceded by a test carrying the old value.
auto to_patch(const InvertiblePatch& patch) -> Patch;

/// Translate to the smallest equivalent plain patch. The old values are
/// dropped, so the result cannot be read back with from_patch().
auto to_minimal_patch(const InvertiblePatch& patch) -> Patch;

/// Apply a patch to a value. Equivalent to apply_patch(to_minimal_patch(p)).
/// @return The patched value, or an ErrorKind::apply_failed error carrying
///   the engine's description.
auto apply(const InvertiblePatch& patch, const Value& value) -> Result<Value>;

/// Recover an invertible patch from a plain patch built by to_patch().
///
/// A remove or replace must immediately follow a test at the same pointer;
/// copy operations and standalone tests are rejected.
/// @return The invertible patch, or an ErrorKind::invalid_patch error naming
///   the offending operation.
auto from_patch(const Patch& patch) -> Result<InvertiblePatch>;

/// Fold matching add/remove pairs into moves.
///
/// An add and a remove carrying equal values become a single move from the
/// remove's pointer to the add's pointer when that leaves the net effect of
/// the patch unchanged. Pairs are considered in order of the earlier
/// operation, then the later one; the first qualifying pair is folded in
/// place of the earlier operation and the scan restarts. All other
/// operations keep their relative order.
auto merge(const InvertiblePatch& patch) -> InvertiblePatch;

}  // namespace jsondiff_cpp
