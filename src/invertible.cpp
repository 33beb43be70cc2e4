#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/logging.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace jsondiff_cpp {

auto op_name(const InvertibleOp& op) noexcept -> std::string_view {
    return std::visit(overload{
        [](const InvertibleAdd&) -> std::string_view { return "add"; },
        [](const InvertibleRemove&) -> std::string_view { return "remove"; },
        [](const InvertibleReplace&) -> std::string_view { return "replace"; },
        [](const InvertibleMove&) -> std::string_view { return "move"; },
    }, op);
}

// =============================================================================
// invert
// =============================================================================

namespace {

auto invert_op(const InvertibleOp& op) -> InvertibleOp {
    return std::visit(overload{
        [](const InvertibleAdd& o) -> InvertibleOp {
            return InvertibleRemove{o.path, o.value};
        },
        [](const InvertibleRemove& o) -> InvertibleOp {
            return InvertibleAdd{o.path, o.old_value};
        },
        [](const InvertibleReplace& o) -> InvertibleOp {
            return InvertibleReplace{o.path, o.new_value, o.old_value};
        },
        [](const InvertibleMove& o) -> InvertibleOp {
            return InvertibleMove{o.path, o.from};
        },
    }, op);
}

}  // anonymous namespace

auto invert(const InvertiblePatch& patch) -> InvertiblePatch {
    auto result = InvertiblePatch{};
    result.reserve(patch.size());
    for (auto it = patch.rbegin(); it != patch.rend(); ++it) {
        result.push_back(invert_op(*it));
    }
    return result;
}

// =============================================================================
// Conversion to plain patches
// =============================================================================

namespace {

void append_plain(Patch& out, const InvertibleOp& op, bool with_tests) {
    std::visit(overload{
        [&](const InvertibleAdd& o) {
            out.push_back(PatchAdd{o.path, o.value});
        },
        [&](const InvertibleRemove& o) {
            if (with_tests) out.push_back(PatchTest{o.path, o.old_value});
            out.push_back(PatchRemove{o.path});
        },
        [&](const InvertibleReplace& o) {
            if (with_tests) out.push_back(PatchTest{o.path, o.old_value});
            out.push_back(PatchReplace{o.path, o.new_value});
        },
        [&](const InvertibleMove& o) {
            out.push_back(PatchMove{o.from, o.path});
        },
    }, op);
}

}  // anonymous namespace

auto to_patch(const InvertiblePatch& patch) -> Patch {
    auto result = Patch{};
    result.reserve(patch.size() * 2);
    for (const auto& op : patch) append_plain(result, op, true);
    return result;
}

auto to_minimal_patch(const InvertiblePatch& patch) -> Patch {
    auto result = Patch{};
    result.reserve(patch.size());
    for (const auto& op : patch) append_plain(result, op, false);
    return result;
}

auto apply(const InvertiblePatch& patch, const Value& value) -> Result<Value> {
    return apply_patch(to_minimal_patch(patch), value);
}

// =============================================================================
// from_patch
// =============================================================================

namespace {

auto quoted(const Pointer& p) -> std::string {
    return "\"" + p.to_string() + "\"";
}

auto shape_error(std::size_t index, const std::string& what) -> std::unexpected<Error> {
    auto message = "operation " + std::to_string(index) + ": " + what;
    logger()->debug("from_patch rejected {}", message);
    return make_error(ErrorKind::invalid_patch, std::move(message));
}

}  // anonymous namespace

auto from_patch(const Patch& patch) -> Result<InvertiblePatch> {
    auto result = InvertiblePatch{};
    auto i = std::size_t{0};
    while (i < patch.size()) {
        const auto& op = patch[i];

        if (const auto* add = std::get_if<PatchAdd>(&op)) {
            result.push_back(InvertibleAdd{add->path, add->value});
            ++i;
        } else if (const auto* move = std::get_if<PatchMove>(&op)) {
            result.push_back(InvertibleMove{move->from, move->path});
            ++i;
        } else if (const auto* remove = std::get_if<PatchRemove>(&op)) {
            return shape_error(i, "remove at " + quoted(remove->path) +
                                  " must be preceded by matching test");
        } else if (const auto* replace = std::get_if<PatchReplace>(&op)) {
            return shape_error(i, "replace at " + quoted(replace->path) +
                                  " must be preceded by matching test");
        } else if (const auto* copy = std::get_if<PatchCopy>(&op)) {
            return shape_error(i, "copy from " + quoted(copy->from) + " to " +
                                  quoted(copy->path) + " is ambiguous to invert");
        } else {
            const auto& test = std::get<PatchTest>(op);
            if (i + 1 == patch.size()) {
                return shape_error(i, "standalone test at " + quoted(test.path));
            }
            const auto& next = patch[i + 1];
            if (const auto* r = std::get_if<PatchRemove>(&next)) {
                if (r->path != test.path) {
                    return shape_error(i + 1, "remove at " + quoted(r->path) +
                                              " does not match preceding test at " +
                                              quoted(test.path));
                }
                result.push_back(InvertibleRemove{test.path, test.value});
            } else if (const auto* r = std::get_if<PatchReplace>(&next)) {
                if (r->path != test.path) {
                    return shape_error(i + 1, "replace at " + quoted(r->path) +
                                              " does not match preceding test at " +
                                              quoted(test.path));
                }
                result.push_back(InvertibleReplace{test.path, test.value, r->value});
            } else {
                return shape_error(i, "standalone test at " + quoted(test.path));
            }
            i += 2;
        }
    }
    return result;
}

// =============================================================================
// merge
// =============================================================================

namespace {

auto pointers_of(const InvertibleOp& op) -> std::vector<Pointer> {
    if (const auto* move = std::get_if<InvertibleMove>(&op)) {
        return {move->from, move->path};
    }
    return {std::visit([](const auto& o) -> const Pointer& { return o.path; }, op)};
}

/// True when `op` can be reordered across every operation strictly between
/// positions `first` and `last`.
auto commutes_between(const InvertiblePatch& ops, std::size_t first, std::size_t last,
                      const Pointer& op) -> bool {
    for (auto k = first + 1; k < last; ++k) {
        for (const auto& q : pointers_of(ops[k])) {
            if (interferes(op, q)) return false;
        }
    }
    return true;
}

/// The move equivalent to ops[i] and ops[j] when the pair can be folded.
auto fold_pair(const InvertiblePatch& ops, std::size_t i, std::size_t j)
    -> std::optional<InvertibleMove> {
    const InvertibleRemove* remove = nullptr;
    const InvertibleAdd* add = nullptr;
    bool remove_first = false;

    if ((remove = std::get_if<InvertibleRemove>(&ops[i]))) {
        add = std::get_if<InvertibleAdd>(&ops[j]);
        remove_first = true;
    } else if ((add = std::get_if<InvertibleAdd>(&ops[i]))) {
        remove = std::get_if<InvertibleRemove>(&ops[j]);
    }
    if (!remove || !add) return std::nullopt;
    if (remove->old_value != add->value) return std::nullopt;

    // A value cannot be moved into one of its own descendants.
    if (is_proper_prefix(remove->path, add->path)) return std::nullopt;

    // Bring the later operation next to the earlier one.
    const auto& later = remove_first ? add->path : remove->path;
    if (!commutes_between(ops, i, j, later)) return std::nullopt;

    // add-then-remove must also swap so the removal happens first.
    if (!remove_first && interferes(add->path, remove->path)) return std::nullopt;

    return InvertibleMove{remove->path, add->path};
}

}  // anonymous namespace

auto merge(const InvertiblePatch& patch) -> InvertiblePatch {
    auto ops = patch;
    auto folded = true;
    while (folded) {
        folded = false;
        for (std::size_t i = 0; i < ops.size() && !folded; ++i) {
            for (auto j = i + 1; j < ops.size(); ++j) {
                if (auto move = fold_pair(ops, i, j)) {
                    logger()->trace("merge folded operations {} and {} into a move from {} to {}",
                                    i, j, move->from.to_string(), move->path.to_string());
                    ops[i] = std::move(*move);
                    ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(j));
                    folded = true;
                    break;
                }
            }
        }
    }
    return ops;
}

}  // namespace jsondiff_cpp
