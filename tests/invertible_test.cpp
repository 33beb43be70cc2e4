// invertible_test.cpp: invert, apply, to_patch, to_minimal_patch, from_patch

#include <jsondiff-cpp/invertible.hpp>
#include <jsondiff-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace jsondiff_cpp;
using json = nlohmann::json;

namespace {

auto sample_patch() -> InvertiblePatch {
    return {
        InvertibleAdd{Pointer{"/a"}, 1},
        InvertibleRemove{Pointer{"/b"}, json{{"x", true}}},
        InvertibleReplace{Pointer{"/c/0"}, "old", "new"},
        InvertibleMove{Pointer{"/d"}, Pointer{"/e"}},
    };
}

}  // namespace

// =============================================================================
// op_name
// =============================================================================

TEST(InvertibleOp, names_follow_rfc6902) {
    EXPECT_EQ(op_name(InvertibleOp{InvertibleAdd{Pointer{"/a"}, 1}}), "add");
    EXPECT_EQ(op_name(InvertibleOp{InvertibleRemove{Pointer{"/a"}, 1}}), "remove");
    EXPECT_EQ(op_name(InvertibleOp{InvertibleReplace{Pointer{"/a"}, 1, 2}}), "replace");
    EXPECT_EQ(op_name(InvertibleOp{InvertibleMove{Pointer{"/a"}, Pointer{"/b"}}}), "move");
}

// =============================================================================
// invert
// =============================================================================

TEST(Invert, reverses_order_and_maps_each_operation) {
    const auto expected = InvertiblePatch{
        InvertibleMove{Pointer{"/e"}, Pointer{"/d"}},
        InvertibleReplace{Pointer{"/c/0"}, "new", "old"},
        InvertibleAdd{Pointer{"/b"}, json{{"x", true}}},
        InvertibleRemove{Pointer{"/a"}, 1},
    };
    EXPECT_EQ(invert(sample_patch()), expected);
}

TEST(Invert, double_inversion_is_identity) {
    const auto p = sample_patch();
    EXPECT_EQ(invert(invert(p)), p);
}

TEST(Invert, empty_patch) {
    EXPECT_TRUE(invert(InvertiblePatch{}).empty());
}

TEST(Invert, undoes_apply) {
    const auto doc = json::parse(R"({"list": [1, 2, 3], "name": "a", "gone": {"k": 1}})");
    const auto patch = InvertiblePatch{
        InvertibleRemove{Pointer{"/gone"}, json{{"k", 1}}},
        InvertibleReplace{Pointer{"/name"}, "a", "b"},
        InvertibleAdd{Pointer{"/list/1"}, 7},
        InvertibleMove{Pointer{"/list/0"}, Pointer{"/list/3"}},
    };
    auto forward = jsondiff_cpp::apply(patch, doc);
    ASSERT_TRUE(forward.has_value());
    EXPECT_EQ(*forward, json::parse(R"({"list": [7, 2, 3, 1], "name": "b"})"));

    auto back = jsondiff_cpp::apply(invert(patch), *forward);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, doc);
}

// =============================================================================
// to_patch / to_minimal_patch
// =============================================================================

TEST(ToPatch, carries_old_values_in_tests) {
    const auto expected = Patch{
        PatchAdd{Pointer{"/a"}, 1},
        PatchTest{Pointer{"/b"}, json{{"x", true}}},
        PatchRemove{Pointer{"/b"}},
        PatchTest{Pointer{"/c/0"}, "old"},
        PatchReplace{Pointer{"/c/0"}, "new"},
        PatchMove{Pointer{"/d"}, Pointer{"/e"}},
    };
    EXPECT_EQ(to_patch(sample_patch()), expected);
}

TEST(ToMinimalPatch, drops_tests) {
    const auto expected = Patch{
        PatchAdd{Pointer{"/a"}, 1},
        PatchRemove{Pointer{"/b"}},
        PatchReplace{Pointer{"/c/0"}, "new"},
        PatchMove{Pointer{"/d"}, Pointer{"/e"}},
    };
    EXPECT_EQ(to_minimal_patch(sample_patch()), expected);
}

TEST(ToMinimalPatch, encodes_smaller_than_to_patch) {
    const auto p = sample_patch();
    EXPECT_LT(encode_patch(to_minimal_patch(p)).dump().size(),
              encode_patch(to_patch(p)).dump().size());
}

// =============================================================================
// apply
// =============================================================================

TEST(Apply, ignores_carried_old_values) {
    // The old value is metadata; forward application does not test it.
    const auto patch = InvertiblePatch{InvertibleReplace{Pointer{"/a"}, "stale", 2}};
    auto r = jsondiff_cpp::apply(patch, json{{"a", 1}});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (json{{"a", 2}}));
}

TEST(Apply, recoverable_form_checks_old_values) {
    const auto patch = InvertiblePatch{InvertibleReplace{Pointer{"/a"}, "stale", 2}};
    auto r = apply_patch(to_patch(patch), json{{"a", 1}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::apply_failed);
}

TEST(Apply, propagates_engine_errors) {
    const auto patch = InvertiblePatch{InvertibleRemove{Pointer{"/missing"}, 1}};
    auto r = jsondiff_cpp::apply(patch, json::object());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::apply_failed);
    EXPECT_FALSE(r.error().message.empty());
}

// =============================================================================
// from_patch
// =============================================================================

TEST(FromPatch, inverse_of_to_patch) {
    const auto p = sample_patch();
    auto r = from_patch(to_patch(p));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, p);
}

TEST(FromPatch, empty_input) {
    auto r = from_patch(Patch{});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->empty());
}

TEST(FromPatch, remove_without_test) {
    auto r = from_patch(Patch{PatchRemove{Pointer{"/a"}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_patch);
    EXPECT_NE(r.error().message.find("remove at \"/a\" must be preceded by matching test"),
              std::string::npos);
}

TEST(FromPatch, replace_without_test) {
    auto r = from_patch(Patch{PatchAdd{Pointer{"/a"}, 1}, PatchReplace{Pointer{"/a"}, 2}});
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("operation 1"), std::string::npos);
    EXPECT_NE(r.error().message.find("replace at \"/a\" must be preceded by matching test"),
              std::string::npos);
}

TEST(FromPatch, copy_is_ambiguous) {
    auto r = from_patch(Patch{PatchCopy{Pointer{"/a"}, Pointer{"/b"}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_patch);
    EXPECT_NE(r.error().message.find("ambiguous"), std::string::npos);
}

TEST(FromPatch, standalone_test_at_end) {
    auto r = from_patch(Patch{PatchTest{Pointer{"/a"}, 1}});
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("standalone test"), std::string::npos);
}

TEST(FromPatch, test_followed_by_add_is_standalone) {
    auto r = from_patch(Patch{PatchTest{Pointer{"/a"}, 1}, PatchAdd{Pointer{"/a"}, 2}});
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("standalone test"), std::string::npos);
}

TEST(FromPatch, mismatched_pointers_name_both) {
    auto r = from_patch(Patch{PatchTest{Pointer{"/a"}, 1}, PatchRemove{Pointer{"/b"}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_patch);
    EXPECT_NE(r.error().message.find("\"/a\""), std::string::npos);
    EXPECT_NE(r.error().message.find("\"/b\""), std::string::npos);
}

TEST(FromPatch, mismatched_replace_pointers) {
    auto r = from_patch(Patch{PatchTest{Pointer{"/a/0"}, 1}, PatchReplace{Pointer{"/a/1"}, 2}});
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("\"/a/0\""), std::string::npos);
    EXPECT_NE(r.error().message.find("\"/a/1\""), std::string::npos);
}

TEST(FromPatch, error_after_valid_prefix) {
    auto r = from_patch(Patch{
        PatchTest{Pointer{"/a"}, 1},
        PatchRemove{Pointer{"/a"}},
        PatchCopy{Pointer{"/b"}, Pointer{"/c"}},
    });
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("operation 2"), std::string::npos);
}

// =============================================================================
// encode_invertible / decode_invertible
// =============================================================================

TEST(EncodeInvertible, wire_form_includes_tests) {
    const auto p = InvertiblePatch{InvertibleRemove{Pointer{"/k"}, 5}};
    EXPECT_EQ(encode_invertible(p), json::parse(R"([
        {"op": "test", "path": "/k", "value": 5},
        {"op": "remove", "path": "/k"}
    ])"));
}

TEST(DecodeInvertible, round_trip) {
    const auto p = sample_patch();
    auto r = decode_invertible(encode_invertible(p));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, p);
}

TEST(DecodeInvertible, rejects_minimal_form) {
    const auto p = InvertiblePatch{InvertibleRemove{Pointer{"/k"}, 5}};
    auto r = decode_invertible(encode_patch(to_minimal_patch(p)));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_patch);
}
