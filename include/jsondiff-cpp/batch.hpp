/// @file batch.hpp
/// @brief Diffing many independent value pairs in parallel.

#pragma once

#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/value.hpp>

#include <span>
#include <utility>
#include <vector>

namespace jsondiff_cpp {

/// A (before, after) pair to diff.
using ValuePair = std::pair<Value, Value>;

/// invertible_diff() every pair. Result i belongs to pair i.
/// @param num_threads Worker count. 0 = hardware_concurrency(),
///   1 = run on the calling thread.
/// @param options Shared by all workers: options.weight is called
///   concurrently and must not throw.
auto invertible_diff_all(std::span<const ValuePair> pairs,
                         unsigned int num_threads = 0,
                         const DiffOptions& options = {})
    -> std::vector<InvertiblePatch>;

/// cheap_diff() every pair. Result i belongs to pair i.
auto cheap_diff_all(std::span<const ValuePair> pairs,
                    unsigned int num_threads = 0)
    -> std::vector<InvertiblePatch>;

}  // namespace jsondiff_cpp
