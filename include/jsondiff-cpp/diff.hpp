/// @file diff.hpp
/// @brief The diff engine: edit scripts between two values.

#pragma once

#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/patch.hpp>
#include <jsondiff-cpp/value.hpp>

#include <cstddef>
#include <functional>

namespace jsondiff_cpp {

/// Cost of a candidate patch. The diff engine keeps the cheapest candidate.
using Weight = std::function<std::size_t(const InvertiblePatch&)>;

/// Length of the compact JSON encoding of the patch's minimal plain form.
/// Accounts for large embedded values, at the price of re-encoding every
/// candidate.
auto default_weight(const InvertiblePatch& patch) -> std::size_t;

/// Number of operations in the patch. Cheap, but may prefer many small
/// operations over one large replace even when the replace encodes shorter.
auto operation_count_weight(const InvertiblePatch& patch) -> std::size_t;

/// Tuning knobs for the optimizing diff.
struct DiffOptions {
    /// Cost function used to choose between candidate edit scripts.
    Weight weight = default_weight;

    /// Upper bound on the (len(a) + 1) * (len(b) + 1) search states of a
    /// single list. Lists above the bound are diffed index by index, as
    /// cheap_diff() does. 0 means no bound.
    std::size_t list_cost_limit = 0;
};

/// Compute a plain patch that turns `a` into `b`.
auto diff(const Value& a, const Value& b) -> Patch;

/// Compute an invertible patch that turns `a` into `b`, minimising the
/// encoded size of the result.
///
/// List diffing searches removals, insertions and in-place edits from the
/// tail of both lists. The search is memoized, but its cost still grows
/// with the product of the list lengths; see DiffOptions::list_cost_limit
/// and cheap_diff().
auto invertible_diff(const Value& a, const Value& b) -> InvertiblePatch;

/// invertible_diff() with a caller-supplied cost function.
auto diff_with_custom_weight(const Value& a, const Value& b, const Weight& weight)
    -> InvertiblePatch;

/// invertible_diff() with explicit options.
auto invertible_diff(const Value& a, const Value& b, const DiffOptions& options)
    -> InvertiblePatch;

/// Compute an invertible patch in time linear in the compared elements.
///
/// Lists are compared index by index, so one leading insertion makes every
/// later element look replaced. The result is correct but not minimal.
auto cheap_diff(const Value& a, const Value& b) -> InvertiblePatch;

}  // namespace jsondiff_cpp
