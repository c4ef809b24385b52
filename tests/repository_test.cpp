#include <jsonverse-cpp/jsonverse.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "test_support.hpp"

namespace jv = jsonverse_cpp;
using namespace std::chrono_literals;

TEST(Repository, components_share_one_backend) {
    auto backend = std::make_shared<jv::MemoryBackend>();
    auto doc_id = jv::DocumentId{};
    auto version_id = jv::VersionId{};
    {
        auto repo = jv::Repository{backend, jv::testing::deterministic_options()};
        const auto doc = repo.documents().create_document("config");
        repo.coordinator().edit(doc.id, jv::Tree::map({{"port", 8080}}));
        doc_id = doc.id;
        version_id = repo.coordinator().save(doc.id).id;
    }

    auto reopened = jv::Repository{backend};
    EXPECT_EQ(reopened.documents().get(doc_id).head_version_id, version_id);
    EXPECT_EQ(reopened.versions().get_version(doc_id, version_id).content,
              jv::Tree::map({{"port", 8080}}));
    EXPECT_EQ(&reopened.backend(), backend.get());
}

TEST(Repository, in_memory_by_default) {
    auto repo = jv::Repository{};
    const auto doc = repo.documents().create_document("d");
    EXPECT_EQ(doc.id.value.size(), 32u);
    EXPECT_EQ(repo.options().autosave_interval, 5000ms);
    EXPECT_FALSE(repo.autosave_running());
}

TEST(Repository, autosave_lifecycle) {
    auto options = jv::testing::deterministic_options();
    options.autosave_interval = 5ms;
    auto repo = jv::Repository{options};
    const auto doc = repo.documents().create_document("d");
    repo.coordinator().edit(doc.id, jv::Tree{1});

    repo.start_autosave();
    repo.start_autosave();
    EXPECT_TRUE(repo.autosave_running());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (repo.versions().list_versions(doc.id).empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    repo.stop_autosave();
    EXPECT_FALSE(repo.autosave_running());

    const auto versions = repo.versions().list_versions(doc.id);
    ASSERT_EQ(versions.size(), 1u);
    EXPECT_TRUE(versions.front().is_auto_save);
}

TEST(Repository, destructor_stops_autosave) {
    auto options = jv::testing::deterministic_options();
    options.autosave_interval = 1ms;
    auto repo = std::make_unique<jv::Repository>(options);
    repo->start_autosave();
    repo.reset();
    SUCCEED();
}

TEST(Repository, end_to_end_history) {
    auto repo = jv::Repository{jv::testing::deterministic_options()};
    const auto doc = repo.documents().create_document("todo");
    auto& editor = repo.coordinator();

    ASSERT_TRUE(editor.edit_text(doc.id, R"({"items": [{"id": 1, "t": "milk"}]})"));
    const auto v1 = editor.save(doc.id);
    ASSERT_TRUE(editor.edit_text(doc.id,
        R"({"items": [{"id": 2, "t": "eggs"}, {"id": 1, "t": "milk"}]})"));
    editor.autosave_tick(doc.id);
    ASSERT_TRUE(editor.edit_text(doc.id, R"({"items": [{"id": 2, "t": "eggs!"}]})"));
    editor.save(doc.id);

    const auto merged = repo.merger().merge(doc.id, v1.id);
    EXPECT_EQ(repo.versions().list_versions(doc.id).size(), 4u);
    EXPECT_EQ(repo.versions().reconstruct(doc.id, v1.id), v1.content);
    EXPECT_EQ(merged.content, v1.content);
    EXPECT_TRUE(repo.versions().verify_history(doc.id).empty());

    EXPECT_EQ(repo.documents().remove(doc.id), 4u);
    EXPECT_TRUE(repo.documents().list().empty());
}
