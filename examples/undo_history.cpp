// undo_history: an undo/redo stack built on invertible patches
//
// Each edit is recorded as the invertible diff between the document before
// and after it. Undo applies the inverse, redo reapplies the patch. The
// history is stored in the recoverable wire form and decoded back.
//
// Build: cmake -B build -DJSONDIFF_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/undo_history

#include <jsondiff-cpp/jsondiff.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace jd = jsondiff_cpp;
using json = nlohmann::json;

namespace {

class History {
public:
    explicit History(json doc) : doc_{std::move(doc)} {}

    auto edit(const json& next) -> bool {
        const auto patch = jd::merge(jd::invertible_diff(doc_, next));
        if (patch.empty()) return false;
        // Persist in the self-checking form.
        done_.push_back(jd::encode_invertible(patch));
        undone_.clear();
        doc_ = next;
        return true;
    }

    auto undo() -> bool { return step(done_, undone_, true); }
    auto redo() -> bool { return step(undone_, done_, false); }

    auto document() const -> const json& { return doc_; }

private:
    auto step(std::vector<json>& from, std::vector<json>& to, bool backwards) -> bool {
        if (from.empty()) return false;
        auto patch = jd::decode_invertible(from.back());
        if (!patch) {
            std::printf("corrupt history entry: %s\n", patch.error().message.c_str());
            return false;
        }
        auto next = jd::apply(backwards ? jd::invert(*patch) : *patch, doc_);
        if (!next) {
            std::printf("history does not apply: %s\n", next.error().message.c_str());
            return false;
        }
        doc_ = std::move(*next);
        to.push_back(std::move(from.back()));
        from.pop_back();
        return true;
    }

    json doc_;
    std::vector<json> done_;
    std::vector<json> undone_;
};

void show(const char* label, const History& h) {
    std::printf("%-8s %s\n", label, h.document().dump().c_str());
}

}  // namespace

int main() {
    auto history = History{json::parse(R"({"todos": [], "filter": "all"})")};
    show("start", history);

    auto doc = history.document();
    doc["todos"].push_back({{"text", "write report"}, {"done", false}});
    history.edit(doc);
    show("add", history);

    doc["todos"].push_back({{"text", "review patch"}, {"done", false}});
    history.edit(doc);
    show("add", history);

    doc["todos"][0]["done"] = true;
    doc["filter"] = "open";
    history.edit(doc);
    show("edit", history);

    // Swap the two items: merge() turns the remove/add pair into a move.
    std::swap(doc["todos"][0], doc["todos"][1]);
    history.edit(doc);
    show("swap", history);

    history.undo();
    show("undo", history);
    history.undo();
    show("undo", history);
    history.redo();
    show("redo", history);

    return 0;
}
