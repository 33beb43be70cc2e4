#include <jsondiff-cpp/diff.hpp>
#include <jsondiff-cpp/json.hpp>
#include <jsondiff-cpp/logging.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsondiff_cpp {

auto default_weight(const InvertiblePatch& patch) -> std::size_t {
    // Invalid UTF-8 in strings must not make weighing throw.
    return encode_patch(to_minimal_patch(patch))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        .size();
}

auto operation_count_weight(const InvertiblePatch& patch) -> std::size_t {
    return patch.size();
}

namespace {

auto make_replace(const Pointer& ptr, const Value& a, const Value& b) -> InvertiblePatch {
    return {InvertibleReplace{ptr, a, b}};
}

void append(InvertiblePatch& out, InvertiblePatch&& ops) {
    std::move(ops.begin(), ops.end(), std::back_inserter(out));
}

/// Shared state of one diff computation.
class DiffContext {
public:
    DiffContext(const Weight& weight, std::size_t list_cost_limit, bool cheap)
        : weight_{weight}, list_cost_limit_{list_cost_limit}, cheap_{cheap} {}

    auto weigh(const InvertiblePatch& patch) const -> std::size_t { return weight_(patch); }

    auto diff_value(const Pointer& ptr, const Value& a, const Value& b) -> InvertiblePatch;

private:
    auto diff_map(const Pointer& ptr, const Value::object_t& a, const Value::object_t& b)
        -> InvertiblePatch;
    auto diff_list(const Pointer& ptr, const Value::array_t& a, const Value::array_t& b)
        -> InvertiblePatch;
    auto diff_list_by_index(const Pointer& ptr, const Value::array_t& a,
                            const Value::array_t& b) -> InvertiblePatch;

    const Weight& weight_;
    std::size_t list_cost_limit_;
    bool cheap_;
};

// =============================================================================
// Optimizing list search
// =============================================================================

/// Tail-first search for the cheapest list edit script.
///
/// A state (i, j) stands for the unprocessed prefixes a[0..i) and b[0..j).
/// From a state where a[i-1] and b[j-1] differ, the candidates are: remove
/// a[i-1] at index i-1, insert b[j-1] at index j-1, or edit a[i-1] in place
/// at index j-1. Removals address the original list and are emitted in
/// descending index order; insertions and edits address the final list and
/// are emitted in ascending index order after all removals.
class ListSearch {
public:
    ListSearch(DiffContext& ctx, const Pointer& ptr,
               const Value::array_t& a, const Value::array_t& b)
        : ctx_{ctx}, ptr_{ptr}, a_{a}, b_{b}, stride_{b.size() + 1} {}

    auto run() -> InvertiblePatch {
        best(a_.size(), b_.size());
        if (logger()->should_log(spdlog::level::trace)) {
            logger()->trace("list diff at \"{}\": {}x{} elements, {} search states",
                            ptr_.to_string(), a_.size(), b_.size(), memo_.size());
        }
        return collect();
    }

private:
    enum class Step : std::uint8_t { remove, add, edit };

    struct Cell {
        std::size_t weight;
        Step step;
    };

    auto key(std::size_t i, std::size_t j) const -> std::size_t { return i * stride_ + j; }

    auto remove_op(std::size_t i) const -> InvertibleOp {
        return InvertibleRemove{child(ptr_, i - 1), a_[i - 1]};
    }

    auto add_op(std::size_t j) const -> InvertibleOp {
        return InvertibleAdd{child(ptr_, j - 1), b_[j - 1]};
    }

    /// Element diff between a[i-1] and b[j-1], addressed at index j-1.
    auto edit(std::size_t i, std::size_t j) -> const InvertiblePatch& {
        auto it = edits_.find(key(i, j));
        if (it == edits_.end()) {
            auto ops = ctx_.diff_value(child(ptr_, j - 1), a_[i - 1], b_[j - 1]);
            it = edits_.emplace(key(i, j), std::move(ops)).first;
        }
        return it->second;
    }

    /// Consume trailing elements that are already equal.
    auto skip_matches(std::size_t& i, std::size_t& j) -> void {
        while (i > 0 && j > 0 && edit(i, j).empty()) {
            --i;
            --j;
        }
    }

    /// Remaining operations once one side is exhausted.
    auto tail(std::size_t i, std::size_t j) const -> InvertiblePatch {
        auto ops = InvertiblePatch{};
        for (auto k = i; k > 0; --k) ops.push_back(remove_op(k));
        for (std::size_t k = 1; k <= j; ++k) ops.push_back(add_op(k));
        return ops;
    }

    auto best(std::size_t i, std::size_t j) -> std::size_t {
        skip_matches(i, j);
        if (auto it = memo_.find(key(i, j)); it != memo_.end()) return it->second.weight;

        // The step of an exhausted state is never read.
        auto cell = Cell{0, Step::remove};
        if (i == 0 || j == 0) {
            cell.weight = ctx_.weigh(tail(i, j));
        } else {
            const auto by_remove = ctx_.weigh({remove_op(i)}) + best(i - 1, j);
            const auto by_add = ctx_.weigh({add_op(j)}) + best(i, j - 1);
            const auto by_edit = ctx_.weigh(edit(i, j)) + best(i - 1, j - 1);
            // First minimum in candidate order wins ties.
            if (by_remove <= by_add && by_remove <= by_edit) {
                cell = Cell{by_remove, Step::remove};
            } else if (by_add <= by_edit) {
                cell = Cell{by_add, Step::add};
            } else {
                cell = Cell{by_edit, Step::edit};
            }
        }
        memo_.emplace(key(i, j), cell);
        return cell.weight;
    }

    auto collect() -> InvertiblePatch {
        // Removal at index k sorts under -(k + 1); insertions and edits at
        // index k sort under k.
        auto groups = std::vector<std::pair<std::int64_t, InvertiblePatch>>{};
        auto i = a_.size();
        auto j = b_.size();
        skip_matches(i, j);
        while (i > 0 && j > 0) {
            switch (memo_.at(key(i, j)).step) {
                case Step::remove:
                    groups.emplace_back(-static_cast<std::int64_t>(i), InvertiblePatch{remove_op(i)});
                    --i;
                    break;
                case Step::add:
                    groups.emplace_back(static_cast<std::int64_t>(j - 1), InvertiblePatch{add_op(j)});
                    --j;
                    break;
                case Step::edit:
                    groups.emplace_back(static_cast<std::int64_t>(j - 1), edit(i, j));
                    --i;
                    --j;
                    break;
            }
            skip_matches(i, j);
        }
        for (auto k = i; k > 0; --k) {
            groups.emplace_back(-static_cast<std::int64_t>(k), InvertiblePatch{remove_op(k)});
        }
        for (std::size_t k = 1; k <= j; ++k) {
            groups.emplace_back(static_cast<std::int64_t>(k - 1), InvertiblePatch{add_op(k)});
        }

        std::stable_sort(groups.begin(), groups.end(),
                         [](const auto& x, const auto& y) { return x.first < y.first; });
        auto result = InvertiblePatch{};
        for (auto& [order, ops] : groups) append(result, std::move(ops));
        return result;
    }

    DiffContext& ctx_;
    const Pointer& ptr_;
    const Value::array_t& a_;
    const Value::array_t& b_;
    std::size_t stride_;
    std::unordered_map<std::size_t, Cell> memo_;
    std::unordered_map<std::size_t, InvertiblePatch> edits_;
};

// =============================================================================
// DiffContext
// =============================================================================

auto DiffContext::diff_value(const Pointer& ptr, const Value& a, const Value& b)
    -> InvertiblePatch {
    const auto pa = decode_primitive(a);
    const auto pb = decode_primitive(b);
    if (pa && pb && same_primitive_kind(*pa, *pb)) {
        // Unsigned values above INT64_MAX decode lossily, so equal decodes
        // are confirmed on the values themselves.
        if (*pa == *pb && a == b) return {};
        return make_replace(ptr, a, b);
    }

    const auto* sa = decode_sequence(a);
    const auto* sb = decode_sequence(b);
    if (sa && sb) return diff_list(ptr, *sa, *sb);

    const auto* ma = decode_map(a);
    const auto* mb = decode_map(b);
    if (ma && mb) {
        auto fields = diff_map(ptr, *ma, *mb);
        if (cheap_) return fields;
        auto whole = make_replace(ptr, a, b);
        return weigh(whole) < weigh(fields) ? whole : fields;
    }

    return make_replace(ptr, a, b);
}

auto DiffContext::diff_map(const Pointer& ptr, const Value::object_t& a,
                           const Value::object_t& b) -> InvertiblePatch {
    auto result = InvertiblePatch{};
    auto a_i = a.begin(), a_end = a.end();
    auto b_i = b.begin(), b_end = b.end();
    while (a_i != a_end || b_i != b_end) {
        if (b_i == b_end || (a_i != a_end && a_i->first < b_i->first)) {
            result.push_back(InvertibleRemove{child(ptr, a_i->first), a_i->second});
            ++a_i;
        } else if (a_i == a_end || b_i->first < a_i->first) {
            result.push_back(InvertibleAdd{child(ptr, b_i->first), b_i->second});
            ++b_i;
        } else {
            append(result, diff_value(child(ptr, a_i->first), a_i->second, b_i->second));
            ++a_i;
            ++b_i;
        }
    }
    return result;
}

auto DiffContext::diff_list(const Pointer& ptr, const Value::array_t& a,
                            const Value::array_t& b) -> InvertiblePatch {
    if (cheap_) return diff_list_by_index(ptr, a, b);
    if (list_cost_limit_ != 0) {
        const auto states = (a.size() + 1) * (b.size() + 1);
        if (states > list_cost_limit_) {
            logger()->debug("list at \"{}\" has {} search states (limit {}); diffing by index",
                            ptr.to_string(), states, list_cost_limit_);
            return diff_list_by_index(ptr, a, b);
        }
    }
    return ListSearch{*this, ptr, a, b}.run();
}

auto DiffContext::diff_list_by_index(const Pointer& ptr, const Value::array_t& a,
                                     const Value::array_t& b) -> InvertiblePatch {
    auto result = InvertiblePatch{};
    if (a.size() >= b.size()) {
        // Descending, so removals past the end of b never shift an index
        // that is still to be visited.
        for (auto idx = a.size(); idx > 0; --idx) {
            const auto k = idx - 1;
            if (k >= b.size()) {
                result.push_back(InvertibleRemove{child(ptr, k), a[k]});
            } else {
                append(result, diff_value(child(ptr, k), a[k], b[k]));
            }
        }
    } else {
        for (std::size_t k = 0; k < b.size(); ++k) {
            if (k >= a.size()) {
                result.push_back(InvertibleAdd{child(ptr, k), b[k]});
            } else {
                append(result, diff_value(child(ptr, k), a[k], b[k]));
            }
        }
    }
    return result;
}

}  // anonymous namespace

// =============================================================================
// Entry points
// =============================================================================

auto diff(const Value& a, const Value& b) -> Patch {
    return to_minimal_patch(invertible_diff(a, b));
}

auto invertible_diff(const Value& a, const Value& b) -> InvertiblePatch {
    return invertible_diff(a, b, DiffOptions{});
}

auto diff_with_custom_weight(const Value& a, const Value& b, const Weight& weight)
    -> InvertiblePatch {
    return invertible_diff(a, b, DiffOptions{.weight = weight});
}

auto invertible_diff(const Value& a, const Value& b, const DiffOptions& options)
    -> InvertiblePatch {
    const auto weight = options.weight ? options.weight : Weight{default_weight};
    auto ctx = DiffContext{weight, options.list_cost_limit, false};
    return ctx.diff_value(Pointer{}, a, b);
}

auto cheap_diff(const Value& a, const Value& b) -> InvertiblePatch {
    const auto weight = Weight{operation_count_weight};
    auto ctx = DiffContext{weight, 0, true};
    return ctx.diff_value(Pointer{}, a, b);
}

}  // namespace jsondiff_cpp
