// json_test.cpp: tests for nlohmann/json interoperability

#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

#include "test_support.hpp"

namespace jv = jsonverse_cpp;
using jv::Json;
using jv::Path;
using jv::Tree;
using jsonverse_cpp::testing::thrown_kind;

namespace {

auto idx(std::size_t i) -> jv::PathElement { return i; }

}  // anonymous namespace

// =============================================================================
// Text parsing
// =============================================================================

TEST(Parse, scalars) {
    EXPECT_EQ(jv::parse("null"), Tree{});
    EXPECT_EQ(jv::parse("true"), Tree{true});
    EXPECT_EQ(jv::parse("-3"), Tree{-3});
    EXPECT_EQ(jv::parse("1.5"), Tree{1.5});
    EXPECT_EQ(jv::parse(R"("text")"), Tree{"text"});
}

TEST(Parse, large_unsigned_integer) {
    const auto t = jv::parse("18446744073709551615");
    ASSERT_NE(t.get_if<std::uint64_t>(), nullptr);
    EXPECT_EQ(*t.get_if<std::uint64_t>(), std::numeric_limits<std::uint64_t>::max());
}

TEST(Parse, nested_document_keeps_key_order) {
    const auto t = jv::parse(R"({"z": [1, {"id": 2}], "a": {}})");
    EXPECT_EQ(t.as_map().keys(), (std::vector<std::string>{"z", "a"}));
    EXPECT_EQ(*t.find(Path{"z", idx(1), "id"}), Tree{2});
}

TEST(Parse, malformed_text_is_invalid_content) {
    for (auto text : {"", "{", "[1,]", "{\"a\" 1}", "nul", "{} trailing"}) {
        EXPECT_EQ(thrown_kind([&] { jv::parse(text); }), jv::ErrorKind::invalid_content) << text;
    }
}

TEST(Parse, duplicate_key_is_invalid_content) {
    EXPECT_EQ(thrown_kind([] { jv::parse(R"({"a": 1, "a": 2})"); }), jv::ErrorKind::invalid_content);
    EXPECT_EQ(thrown_kind([] { jv::parse(R"({"o": {"k": 1, "k": 1}})"); }), jv::ErrorKind::invalid_content);
}

TEST(Parse, same_key_in_sibling_objects_is_fine) {
    const auto t = jv::parse(R"([{"a": 1}, {"a": 2}, {"b": {"a": 3}, "a": 4}])");
    EXPECT_EQ(t.size(), 3u);
}

// =============================================================================
// Serialization
// =============================================================================

TEST(Serialize, compact_keeps_insertion_order) {
    const auto t = Tree::map({{"b", 1}, {"a", Tree::list({true, nullptr})}});
    EXPECT_EQ(jv::serialize(t, -1), R"({"b":1,"a":[true,null]})");
}

TEST(Serialize, pretty_prints_two_spaces_by_default) {
    EXPECT_EQ(jv::serialize(Tree::map({{"a", 1}})), "{\n  \"a\": 1\n}");
}

TEST(Serialize, parse_round_trip) {
    const auto text = std::string{R"({"name":"doc","items":[{"id":1,"tags":["x","y"]},2.5,false,null]})"};
    EXPECT_EQ(jv::serialize(jv::parse(text), -1), text);
}

TEST(Serialize, invalid_utf8_is_invalid_content) {
    const auto t = Tree{std::string{"\xff\xfe"}};
    EXPECT_EQ(thrown_kind([&] { jv::serialize(t); }), jv::ErrorKind::invalid_content);
}

// =============================================================================
// ADL serialization
// =============================================================================

TEST(JsonAdl, tree_converts_both_ways) {
    const auto t = Tree::map({{"a", Tree::list({1, "two"})}});
    const Json j = t;
    EXPECT_EQ(j.dump(), R"({"a":[1,"two"]})");
    EXPECT_EQ(j.get<Tree>(), t);
}

TEST(JsonAdl, timestamp_is_rfc3339) {
    const Json j = jv::Timestamp{1714566600250};
    EXPECT_EQ(j.get<std::string>(), "2024-05-01T12:30:00.250Z");
    EXPECT_EQ(j.get<jv::Timestamp>(), jv::Timestamp{1714566600250});
}

TEST(JsonAdl, ids_are_strings) {
    const Json j = jv::VersionId{"v-1"};
    EXPECT_EQ(j, Json("v-1"));
    EXPECT_EQ(Json("d-1").get<jv::DocumentId>(), jv::DocumentId{"d-1"});
}

TEST(JsonAdl, path_keeps_keys_and_indices_apart) {
    const auto path = Path{"items", idx(0), "0"};
    const auto j = jv::path_to_json(path);
    EXPECT_EQ(j.dump(), R"(["items",0,"0"])");
    EXPECT_EQ(jv::path_from_json(j), path);
}

TEST(JsonAdl, path_rejects_other_elements) {
    EXPECT_EQ(thrown_kind([] { jv::path_from_json(Json::parse("[-1]")); }), jv::ErrorKind::invalid_content);
    EXPECT_EQ(thrown_kind([] { jv::path_from_json(Json::parse("[1.5]")); }), jv::ErrorKind::invalid_content);
    EXPECT_EQ(thrown_kind([] { jv::path_from_json(Json::parse(R"("a/b")")); }), jv::ErrorKind::invalid_content);
}

TEST(JsonAdl, patch_wire_shape) {
    const auto patch = jv::Patch{{
        jv::AddOp{Path{"a"}, Tree{1}},
        jv::RemoveOp{Path{"b"}, Tree{2}},
        jv::ReplaceOp{Path{"c"}, Tree{3}, Tree{4}},
        jv::MoveOp{Path{"d", idx(0)}, Path{"d", idx(2)}},
    }};
    const Json j = patch;
    const auto expected = Json::parse(R"([
        {"op": "add", "path": ["a"], "value": 1},
        {"op": "remove", "path": ["b"], "oldValue": 2},
        {"op": "replace", "path": ["c"], "oldValue": 3, "value": 4},
        {"op": "move", "from": ["d", 0], "path": ["d", 2]}
    ])");
    EXPECT_EQ(j, expected);
    EXPECT_EQ(j.get<jv::Patch>(), patch);
}

TEST(JsonAdl, unknown_patch_op_is_invalid_content) {
    const auto j = Json::parse(R"([{"op": "copy", "path": ["a"]}])");
    EXPECT_EQ(thrown_kind([&] { j.get<jv::Patch>(); }), jv::ErrorKind::invalid_content);
}

TEST(JsonAdl, version_wire_shape) {
    const auto version = jv::Version{
        .id = jv::VersionId{"v2"},
        .document_id = jv::DocumentId{"d1"},
        .content = Tree::map({{"a", 2}}),
        .parent_id = jv::VersionId{"v1"},
        .merged_from_id = std::nullopt,
        .created_at = jv::Timestamp{0},
        .is_auto_save = true,
        .patch = jv::Patch{{jv::ReplaceOp{Path{"a"}, Tree{1}, Tree{2}}}},
        .sequence = 2,
    };
    const Json j = version;
    EXPECT_EQ(j.at("id"), "v2");
    EXPECT_EQ(j.at("documentId"), "d1");
    EXPECT_EQ(j.at("parentId"), "v1");
    EXPECT_TRUE(j.at("mergedFromId").is_null());
    EXPECT_EQ(j.at("createdAt"), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(j.at("isAutoSave"), true);
    EXPECT_EQ(j.at("patch").size(), 1u);
    EXPECT_EQ(j.get<jv::Version>(), version);
}

TEST(JsonAdl, first_version_has_null_parent_and_patch) {
    const auto version = jv::Version{
        .id = jv::VersionId{"v1"},
        .document_id = jv::DocumentId{"d1"},
        .content = Tree::map({{"a", 1}}),
        .parent_id = std::nullopt,
        .merged_from_id = std::nullopt,
        .created_at = jv::Timestamp{0},
        .is_auto_save = false,
        .patch = std::nullopt,
        .sequence = 1,
    };
    const Json j = version;
    EXPECT_TRUE(j.at("parentId").is_null());
    EXPECT_TRUE(j.at("patch").is_null());
    EXPECT_EQ(j.get<jv::Version>(), version);
}

TEST(JsonAdl, document_round_trip) {
    const auto document = jv::Document{
        .id = jv::DocumentId{"d1"},
        .name = "settings",
        .content = Tree::map({{"theme", "dark"}}),
        .created_at = jv::Timestamp{1000},
        .head_version_id = jv::VersionId{"v3"},
        .version_count = 3,
    };
    const Json j = document;
    EXPECT_EQ(j.at("headVersionId"), "v3");
    EXPECT_EQ(j.at("versionCount"), 3);
    EXPECT_EQ(j.get<jv::Document>(), document);
}
