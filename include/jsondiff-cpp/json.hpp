/// @file json.hpp
/// @brief nlohmann/json glue: RFC 6902 encoding, decoding and application.
///
/// Patch application and pointer resolution are delegated to
/// nlohmann::json::patch(). This header only converts between the typed
/// operation model and the wire form, and turns engine exceptions into
/// Result errors.

#pragma once

#include <jsondiff-cpp/error.hpp>
#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/patch.hpp>
#include <jsondiff-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace jsondiff_cpp {

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(nlohmann::json& j, const PatchOp& op);

// =============================================================================
// Plain patches
// =============================================================================

/// Encode a plain patch as an RFC 6902 JSON array.
auto encode_patch(const Patch& patch) -> nlohmann::json;

/// Decode an RFC 6902 JSON array.
/// @return The patch, or an ErrorKind::decoding_error naming the offending
///   operation index.
auto decode_patch(const nlohmann::json& j) -> Result<Patch>;

/// Parse RFC 6902 JSON text.
auto parse_patch(std::string_view text) -> Result<Patch>;

/// Apply a plain patch with the nlohmann/json patch engine.
/// @return The patched value, or an ErrorKind::apply_failed error carrying
///   the engine's message.
auto apply_patch(const Patch& patch, const Value& value) -> Result<Value>;

// =============================================================================
// Invertible patches
// =============================================================================

/// Encode an invertible patch in its recoverable plain form (to_patch()).
auto encode_invertible(const InvertiblePatch& patch) -> nlohmann::json;

/// Decode a recoverable plain form back into an invertible patch.
auto decode_invertible(const nlohmann::json& j) -> Result<InvertiblePatch>;

}  // namespace jsondiff_cpp
