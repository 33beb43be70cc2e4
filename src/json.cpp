#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/logging.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace jsondiff_cpp {

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(nlohmann::json& j, const PatchOp& op) {
    j = nlohmann::json::object();
    j["op"] = std::string{op_name(op)};
    std::visit(overload{
        [&](const PatchAdd& o) {
            j["path"] = o.path.to_string();
            j["value"] = o.value;
        },
        [&](const PatchRemove& o) {
            j["path"] = o.path.to_string();
        },
        [&](const PatchReplace& o) {
            j["path"] = o.path.to_string();
            j["value"] = o.value;
        },
        [&](const PatchMove& o) {
            j["from"] = o.from.to_string();
            j["path"] = o.path.to_string();
        },
        [&](const PatchCopy& o) {
            j["from"] = o.from.to_string();
            j["path"] = o.path.to_string();
        },
        [&](const PatchTest& o) {
            j["path"] = o.path.to_string();
            j["value"] = o.value;
        },
    }, op);
}

// =============================================================================
// Plain patches
// =============================================================================

namespace {

auto decode_failure(std::size_t index, const std::string& what) -> std::unexpected<Error> {
    auto message = "operation " + std::to_string(index) + ": " + what;
    logger()->debug("decode_patch rejected {}", message);
    return make_error(ErrorKind::decoding_error, std::move(message));
}

/// Read a pointer-valued member ("path" or "from") of an operation object.
auto pointer_member(const nlohmann::json& op, const char* name, std::size_t index)
    -> Result<Pointer> {
    auto it = op.find(name);
    if (it == op.end() || !it->is_string()) {
        return decode_failure(index, std::string{"missing string member \""} + name + "\"");
    }
    auto ptr = parse_pointer(it->get_ref<const std::string&>());
    if (!ptr) return decode_failure(index, ptr.error().message);
    return ptr;
}

auto value_member(const nlohmann::json& op, std::size_t index) -> Result<Value> {
    auto it = op.find("value");
    if (it == op.end()) return decode_failure(index, "missing member \"value\"");
    return *it;
}

auto decode_op(const nlohmann::json& op, std::size_t index) -> Result<PatchOp> {
    if (!op.is_object()) return decode_failure(index, "operation must be an object");
    auto name_it = op.find("op");
    if (name_it == op.end() || !name_it->is_string()) {
        return decode_failure(index, "missing string member \"op\"");
    }
    const auto& name = name_it->get_ref<const std::string&>();

    auto path = pointer_member(op, "path", index);
    if (!path) return std::unexpected{path.error()};

    if (name == "add" || name == "replace" || name == "test") {
        auto value = value_member(op, index);
        if (!value) return std::unexpected{value.error()};
        if (name == "add") return PatchAdd{std::move(*path), std::move(*value)};
        if (name == "replace") return PatchReplace{std::move(*path), std::move(*value)};
        return PatchTest{std::move(*path), std::move(*value)};
    }
    if (name == "remove") {
        return PatchRemove{std::move(*path)};
    }
    if (name == "move" || name == "copy") {
        auto from = pointer_member(op, "from", index);
        if (!from) return std::unexpected{from.error()};
        if (name == "move") return PatchMove{std::move(*from), std::move(*path)};
        return PatchCopy{std::move(*from), std::move(*path)};
    }
    return decode_failure(index, "unknown operation \"" + name + "\"");
}

}  // anonymous namespace

auto encode_patch(const Patch& patch) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& op : patch) {
        auto item = nlohmann::json{};
        to_json(item, op);
        j.push_back(std::move(item));
    }
    return j;
}

auto decode_patch(const nlohmann::json& j) -> Result<Patch> {
    if (!j.is_array()) {
        logger()->debug("decode_patch rejected a non-array document");
        return make_error(ErrorKind::decoding_error, "JSON Patch must be an array");
    }
    auto patch = Patch{};
    patch.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        auto op = decode_op(j[i], i);
        if (!op) return std::unexpected{op.error()};
        patch.push_back(std::move(*op));
    }
    return patch;
}

auto parse_patch(std::string_view text) -> Result<Patch> {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        logger()->debug("parse_patch rejected malformed JSON text");
        return make_error(ErrorKind::decoding_error, "JSON Patch text is not valid JSON");
    }
    return decode_patch(j);
}

auto apply_patch(const Patch& patch, const Value& value) -> Result<Value> {
    try {
        return value.patch(encode_patch(patch));
    } catch (const nlohmann::json::exception& e) {
        logger()->debug("apply_patch failed: {}", e.what());
        return make_error(ErrorKind::apply_failed, e.what());
    }
}

// =============================================================================
// Invertible patches
// =============================================================================

auto encode_invertible(const InvertiblePatch& patch) -> nlohmann::json {
    return encode_patch(to_patch(patch));
}

auto decode_invertible(const nlohmann::json& j) -> Result<InvertiblePatch> {
    auto plain = decode_patch(j);
    if (!plain) return std::unexpected{plain.error()};
    return from_patch(*plain);
}

}  // namespace jsondiff_cpp
