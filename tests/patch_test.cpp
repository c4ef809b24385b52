#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/patch.hpp>

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace jsonverse_cpp;
using jsonverse_cpp::testing::thrown_kind;

namespace {

auto idx(std::size_t i) -> PathElement { return i; }

}  // anonymous namespace

// -- apply: add ---------------------------------------------------------------

TEST(PatchApply, add_map_key) {
    const auto before = Tree::map({{"a", 1}});
    const auto patch = Patch{{AddOp{Path{"b"}, Tree{2}}}};
    EXPECT_EQ(apply(before, patch), Tree::map({{"a", 1}, {"b", 2}}));
}

TEST(PatchApply, add_list_element_shifts_rest) {
    const auto before = Tree::list({1, 3});
    const auto patch = Patch{{AddOp{Path{idx(1)}, Tree{2}}}};
    EXPECT_EQ(apply(before, patch), Tree::list({1, 2, 3}));
}

TEST(PatchApply, add_at_end_of_list) {
    const auto before = Tree::list({1});
    EXPECT_EQ(apply(before, Patch{{AddOp{Path{idx(1)}, Tree{2}}}}), Tree::list({1, 2}));
}

TEST(PatchApply, add_existing_key_conflicts) {
    const auto before = Tree::map({{"a", 1}});
    EXPECT_EQ(thrown_kind([&] { apply(before, Patch{{AddOp{Path{"a"}, Tree{2}}}}); }),
              ErrorKind::patch_conflict);
}

TEST(PatchApply, add_past_end_conflicts) {
    const auto before = Tree::list({1});
    EXPECT_EQ(thrown_kind([&] { apply(before, Patch{{AddOp{Path{idx(3)}, Tree{2}}}}); }),
              ErrorKind::patch_conflict);
}

TEST(PatchApply, add_at_root_conflicts) {
    EXPECT_EQ(thrown_kind([] { apply(Tree{}, Patch{{AddOp{Path{}, Tree{1}}}}); }),
              ErrorKind::patch_conflict);
}

// -- apply: remove / replace --------------------------------------------------

TEST(PatchApply, remove_checks_old_value) {
    const auto before = Tree::map({{"a", 1}, {"b", 2}});
    EXPECT_EQ(apply(before, Patch{{RemoveOp{Path{"a"}, Tree{1}}}}), Tree::map({{"b", 2}}));
    EXPECT_EQ(thrown_kind([&] { apply(before, Patch{{RemoveOp{Path{"a"}, Tree{9}}}}); }),
              ErrorKind::patch_conflict);
}

TEST(PatchApply, remove_missing_path_conflicts) {
    EXPECT_EQ(thrown_kind([] { apply(Tree::map({}), Patch{{RemoveOp{Path{"x"}, Tree{1}}}}); }),
              ErrorKind::patch_conflict);
}

TEST(PatchApply, replace_nested_value) {
    const auto before = Tree::map({{"a", Tree::list({Tree::map({{"v", 1}})})}});
    const auto patch = Patch{{ReplaceOp{Path{"a", idx(0), "v"}, Tree{1}, Tree{"one"}}}};
    EXPECT_EQ(apply(before, patch), Tree::map({{"a", Tree::list({Tree::map({{"v", "one"}})})}}));
}

TEST(PatchApply, replace_root) {
    const auto patch = Patch{{ReplaceOp{Path{}, Tree::map({}), Tree::list({1})}}};
    EXPECT_EQ(apply(Tree::map({}), patch), Tree::list({1}));
}

TEST(PatchApply, replace_on_wrong_base_conflicts) {
    const auto patch = Patch{{ReplaceOp{Path{"a"}, Tree{1}, Tree{2}}}};
    EXPECT_EQ(thrown_kind([&] { apply(Tree::map({{"a", 5}}), patch); }), ErrorKind::patch_conflict);
}

// -- apply: move --------------------------------------------------------------

TEST(PatchApply, move_forward_and_back) {
    const auto before = Tree::list({"a", "b", "c", "d"});
    EXPECT_EQ(apply(before, Patch{{MoveOp{Path{idx(0)}, Path{idx(3)}}}}),
              Tree::list({"b", "c", "d", "a"}));
    EXPECT_EQ(apply(before, Patch{{MoveOp{Path{idx(3)}, Path{idx(0)}}}}),
              Tree::list({"d", "a", "b", "c"}));
}

TEST(PatchApply, move_across_lists_conflicts) {
    const auto before = Tree::map({{"x", Tree::list({1})}, {"y", Tree::list({2})}});
    const auto patch = Patch{{MoveOp{Path{"x", idx(0)}, Path{"y", idx(0)}}}};
    EXPECT_EQ(thrown_kind([&] { apply(before, patch); }), ErrorKind::patch_conflict);
}

TEST(PatchApply, move_out_of_range_conflicts) {
    const auto before = Tree::list({1, 2});
    EXPECT_EQ(thrown_kind([&] { apply(before, Patch{{MoveOp{Path{idx(2)}, Path{idx(0)}}}}); }),
              ErrorKind::patch_conflict);
    EXPECT_EQ(thrown_kind([&] { apply(before, Patch{{MoveOp{Path{idx(0)}, Path{idx(2)}}}}); }),
              ErrorKind::patch_conflict);
}

TEST(PatchApply, input_is_untouched_on_conflict) {
    const auto before = Tree::map({{"a", 1}});
    const auto patch = Patch{{AddOp{Path{"b"}, Tree{2}}, RemoveOp{Path{"a"}, Tree{7}}}};
    EXPECT_EQ(thrown_kind([&] { apply(before, patch); }), ErrorKind::patch_conflict);
    EXPECT_EQ(before, Tree::map({{"a", 1}}));
}

TEST(PatchApply, ops_apply_in_sequence) {
    const auto patch = Patch{{
        AddOp{Path{"list"}, Tree::list({})},
        AddOp{Path{"list", idx(0)}, Tree{"x"}},
        ReplaceOp{Path{"list", idx(0)}, Tree{"x"}, Tree{"y"}},
    }};
    EXPECT_EQ(apply(Tree::map({}), patch), Tree::map({{"list", Tree::list({"y"})}}));
}

// -- invert -------------------------------------------------------------------

TEST(PatchInvert, swaps_and_reverses) {
    const auto patch = Patch{{
        AddOp{Path{"a"}, Tree{1}},
        ReplaceOp{Path{"b"}, Tree{2}, Tree{3}},
        MoveOp{Path{"c", idx(0)}, Path{"c", idx(2)}},
    }};
    const auto expected = Patch{{
        MoveOp{Path{"c", idx(2)}, Path{"c", idx(0)}},
        ReplaceOp{Path{"b"}, Tree{3}, Tree{2}},
        RemoveOp{Path{"a"}, Tree{1}},
    }};
    EXPECT_EQ(invert(patch), expected);
    EXPECT_EQ(invert(invert(patch)), patch);
}

TEST(PatchInvert, undoes_apply) {
    const auto before = Tree::map({{"b", 2}, {"c", Tree::list({"x", "y", "z"})}});
    const auto patch = Patch{{
        AddOp{Path{"a"}, Tree{1}},
        ReplaceOp{Path{"b"}, Tree{2}, Tree{3}},
        MoveOp{Path{"c", idx(0)}, Path{"c", idx(2)}},
        RemoveOp{Path{"c", idx(0)}, Tree{"y"}},
    }};
    const auto after = apply(before, patch);
    EXPECT_EQ(after, Tree::map({{"a", 1}, {"b", 3}, {"c", Tree::list({"z", "x"})}}));
    EXPECT_EQ(apply(after, invert(patch)), before);
}

TEST(Patch, counts_by_kind) {
    const auto patch = Patch{{
        AddOp{Path{"a"}, Tree{1}},
        AddOp{Path{"b"}, Tree{1}},
        RemoveOp{Path{"c"}, Tree{1}},
    }};
    EXPECT_EQ(patch.size(), 3u);
    EXPECT_EQ(patch.count(OpKind::add), 2u);
    EXPECT_EQ(patch.count(OpKind::remove), 1u);
    EXPECT_EQ(patch.count(OpKind::move), 0u);
    EXPECT_EQ(kind_of(patch.ops[2]), OpKind::remove);
    EXPECT_EQ(to_string_view(OpKind::replace), "replace");
}
