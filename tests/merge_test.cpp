#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/repository.hpp>

#include <gtest/gtest.h>

#include <vector>

#include "test_support.hpp"

using namespace jsonverse_cpp;
using jsonverse_cpp::testing::deterministic_options;
using jsonverse_cpp::testing::thrown_kind;

namespace {

auto ids_of(const std::vector<Version>& versions) -> std::vector<VersionId> {
    auto ids = std::vector<VersionId>{};
    for (const auto& v : versions) ids.push_back(v.id);
    return ids;
}

}  // anonymous namespace

TEST(MergeEngine, adopts_past_version_as_new_head) {
    auto repo = Repository{deterministic_options()};
    const auto doc = repo.documents().create_document("d", Tree::map({{"a", 1}}));
    auto& coordinator = repo.coordinator();

    const auto v1 = coordinator.save(doc.id);
    coordinator.edit(doc.id, Tree::map({{"a", 2}}));
    const auto v2 = coordinator.save(doc.id);
    coordinator.edit(doc.id, Tree::map({{"a", 3}}));
    const auto v3 = coordinator.save(doc.id);

    const auto v4 = repo.merger().merge(doc.id, v1.id);
    EXPECT_EQ(v4.content, Tree::map({{"a", 1}}));
    EXPECT_EQ(v4.merged_from_id, v1.id);
    EXPECT_EQ(v4.parent_id, v3.id);
    EXPECT_FALSE(v4.is_auto_save);

    EXPECT_EQ(ids_of(repo.versions().list_versions(doc.id)),
              (std::vector<VersionId>{v4.id, v3.id, v2.id, v1.id}));
    EXPECT_EQ(repo.documents().get(doc.id).content, Tree::map({{"a", 1}}));
    EXPECT_EQ(repo.documents().get(doc.id).head_version_id, v4.id);
}

TEST(MergeEngine, history_is_untouched) {
    auto repo = Repository{deterministic_options()};
    const auto doc = repo.documents().create_document("d");
    repo.coordinator().edit(doc.id, Tree{1});
    const auto v1 = repo.coordinator().save(doc.id);
    repo.coordinator().edit(doc.id, Tree{2});
    const auto v2 = repo.coordinator().save(doc.id);

    repo.merger().merge(doc.id, v1.id);
    EXPECT_EQ(repo.versions().get_version(doc.id, v1.id), v1);
    EXPECT_EQ(repo.versions().get_version(doc.id, v2.id), v2);
    EXPECT_TRUE(repo.versions().verify_history(doc.id).empty());
}

TEST(MergeEngine, merging_the_head_still_appends) {
    auto repo = Repository{deterministic_options()};
    const auto doc = repo.documents().create_document("d");
    const auto v1 = repo.coordinator().save(doc.id);
    const auto v2 = repo.merger().merge(doc.id, v1.id);
    EXPECT_EQ(v2.parent_id, v1.id);
    EXPECT_EQ(v2.merged_from_id, v1.id);
    EXPECT_TRUE(v2.patch->empty());
}

TEST(MergeEngine, discards_unsaved_edits) {
    auto repo = Repository{deterministic_options()};
    const auto doc = repo.documents().create_document("d");
    repo.coordinator().edit(doc.id, Tree{1});
    const auto v1 = repo.coordinator().save(doc.id);
    repo.coordinator().edit(doc.id, Tree{2});

    repo.merger().merge(doc.id, v1.id);
    EXPECT_EQ(repo.coordinator().working_content(doc.id), Tree{1});
    EXPECT_FALSE(repo.coordinator().is_dirty(doc.id));
    EXPECT_EQ(repo.coordinator().autosave_tick(doc.id).result, SaveResult::not_dirty);
}

TEST(MergeEngine, merge_version_can_itself_be_merged) {
    auto repo = Repository{deterministic_options()};
    const auto doc = repo.documents().create_document("d");
    repo.coordinator().edit(doc.id, Tree{1});
    const auto v1 = repo.coordinator().save(doc.id);
    repo.coordinator().edit(doc.id, Tree{2});
    repo.coordinator().save(doc.id);
    const auto m1 = repo.merger().merge(doc.id, v1.id);
    repo.coordinator().edit(doc.id, Tree{3});
    repo.coordinator().save(doc.id);

    const auto m2 = repo.merger().merge(doc.id, m1.id);
    EXPECT_EQ(m2.content, Tree{1});
    EXPECT_EQ(m2.merged_from_id, m1.id);
}

TEST(MergeEngine, errors) {
    auto repo = Repository{deterministic_options()};
    const auto a = repo.documents().create_document("a");
    const auto b = repo.documents().create_document("b");
    const auto va = repo.coordinator().save(a.id);

    EXPECT_EQ(thrown_kind([&] { repo.merger().merge(DocumentId{"missing"}, va.id); }),
              ErrorKind::document_not_found);
    EXPECT_EQ(thrown_kind([&] { repo.merger().merge(a.id, VersionId{"missing"}); }),
              ErrorKind::version_not_found);
    EXPECT_EQ(thrown_kind([&] { repo.merger().merge(b.id, va.id); }),
              ErrorKind::version_not_found);
    EXPECT_TRUE(repo.versions().list_versions(b.id).empty());
    EXPECT_EQ(repo.versions().list_versions(a.id).size(), 1u);
}
