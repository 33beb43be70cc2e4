// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.

#include <jsondiff-cpp/jsondiff.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    using json = nlohmann::json;
    const auto patch_dir = std::string{"fuzz/corpus/parse_patch"};
    const auto diff_dir = std::string{"fuzz/corpus/diff"};
    fs::create_directories(patch_dir);
    fs::create_directories(diff_dir);

    const auto docs = std::pair{
        json::parse(R"({"items": [1, 2, 3, 4], "name": "a", "meta": {"k": null}})"),
        json::parse(R"({"items": [1, 5, 4], "name": "b", "extra": [true]})"),
    };

    // Seed 1: empty patch
    write_seed(patch_dir + "/seed_empty.json", "[]");

    // Seed 2: plain minimal patch
    write_seed(patch_dir + "/seed_minimal.json",
               jsondiff_cpp::encode_patch(jsondiff_cpp::diff(docs.first, docs.second)).dump());

    // Seed 3: recoverable form
    write_seed(patch_dir + "/seed_invertible.json",
               jsondiff_cpp::encode_invertible(
                   jsondiff_cpp::invertible_diff(docs.first, docs.second)).dump());

    // Seed 4: every operation kind
    write_seed(patch_dir + "/seed_all_ops.json", R"([
        {"op": "add", "path": "/a", "value": 1},
        {"op": "test", "path": "/a", "value": 1},
        {"op": "remove", "path": "/a"},
        {"op": "copy", "from": "/b", "path": "/c"},
        {"op": "move", "from": "/c", "path": "/d"},
        {"op": "replace", "path": "/d", "value": [1]}
    ])");

    // Diff seeds: two documents separated by a newline
    write_seed(diff_dir + "/seed_docs.json", docs.first.dump() + "\n" + docs.second.dump());
    write_seed(diff_dir + "/seed_lists.json", "[1,2,3]\n[0,1,2,3]");
    write_seed(diff_dir + "/seed_scalars.json", "1\n\"1\"");

    return 0;
}
