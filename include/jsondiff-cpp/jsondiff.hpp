/// @file jsondiff.hpp
/// @brief Umbrella header for the jsondiff-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Pointer, Patch, InvertiblePatch, the diff engine, and Error.

#pragma once

#include <jsondiff-cpp/batch.hpp>
#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/logging.hpp>
#include <jsondiff-cpp/patch.hpp>
#include <jsondiff-cpp/pointer.hpp>
#include <jsondiff-cpp/value.hpp>
