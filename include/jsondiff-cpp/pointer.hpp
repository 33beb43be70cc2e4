/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) helpers.

#pragma once

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/value.hpp>

#include <cstddef>
#include <string_view>

namespace jsondiff_cpp {

/// A path into a value tree: an ordered sequence of reference tokens.
/// The empty pointer refers to the whole document.
using Pointer = Value::json_pointer;

/// Parse an RFC 6901 pointer string ("" or "/a/b/0").
auto parse_pointer(std::string_view text) -> Result<Pointer>;

/// Extend a pointer with an object key.
auto child(const Pointer& p, std::string_view key) -> Pointer;

/// Extend a pointer with an array index.
auto child(const Pointer& p, std::size_t index) -> Pointer;

/// True when `prefix` equals `p` or is one of its ancestors.
auto is_prefix(const Pointer& prefix, const Pointer& p) -> bool;

/// True when `prefix` is a strict ancestor of `p`.
auto is_proper_prefix(const Pointer& prefix, const Pointer& p) -> bool;

/// Conservative test for whether an insertion or removal at one pointer can
/// change what the other resolves to.
///
/// Two pointers interfere when one is an ancestor of (or equal to) the
/// other, or when one ends in an index-like token ("0", "17", "-") and the
/// other lies inside the same container, which may then be an array whose
/// elements get renumbered. The root pointer interferes with everything.
auto interferes(const Pointer& a, const Pointer& b) -> bool;

}  // namespace jsondiff_cpp
