#include <jsonverse-cpp/document_store.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/version_store.hpp>

#include <gtest/gtest.h>

#include <memory>

#include "test_support.hpp"

using namespace jsonverse_cpp;
using jsonverse_cpp::testing::deterministic_options;
using jsonverse_cpp::testing::thrown_kind;

namespace {

struct Stores {
    std::shared_ptr<MemoryBackend> backend = std::make_shared<MemoryBackend>();
    RepositoryOptions options = deterministic_options();
    DocumentStore documents{backend, options};
    VersionStore versions{backend, documents, options};
};

}  // anonymous namespace

TEST(DocumentStore, requires_backend) {
    EXPECT_EQ(thrown_kind([] { DocumentStore{nullptr, RepositoryOptions{}}; }),
              ErrorKind::storage_error);
}

TEST(DocumentStore, create_defaults_to_empty_map) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("notes");
    EXPECT_EQ(doc.id, DocumentId{"id-1"});
    EXPECT_EQ(doc.name, "notes");
    EXPECT_EQ(doc.content, Tree{Map{}});
    EXPECT_EQ(doc.created_at, Timestamp{1704067200000});
    EXPECT_FALSE(doc.head_version_id.has_value());
    EXPECT_EQ(doc.version_count, 0u);
}

TEST(DocumentStore, create_with_seed_content_makes_no_version) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("seeded", Tree::map({{"a", 1}}));
    EXPECT_EQ(s.documents.get(doc.id).content, Tree::map({{"a", 1}}));
    EXPECT_TRUE(s.versions.list_versions(doc.id).empty());
}

TEST(DocumentStore, get_and_find) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("a");
    EXPECT_EQ(s.documents.get(doc.id), doc);
    EXPECT_EQ(s.documents.find(doc.id), doc);
    EXPECT_TRUE(s.documents.contains(doc.id));

    EXPECT_FALSE(s.documents.find(DocumentId{"missing"}).has_value());
    EXPECT_FALSE(s.documents.contains(DocumentId{"missing"}));
    EXPECT_EQ(thrown_kind([&] { s.documents.get(DocumentId{"missing"}); }),
              ErrorKind::document_not_found);
}

TEST(DocumentStore, rename) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("old");
    EXPECT_EQ(s.documents.rename(doc.id, "new").name, "new");
    EXPECT_EQ(s.documents.get(doc.id).name, "new");
    EXPECT_EQ(thrown_kind([&] { s.documents.rename(DocumentId{"missing"}, "x"); }),
              ErrorKind::document_not_found);
}

TEST(DocumentStore, list_is_oldest_first) {
    auto s = Stores{};
    const auto a = s.documents.create_document("a");
    const auto b = s.documents.create_document("b");
    const auto c = s.documents.create_document("c");
    const auto all = s.documents.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, a.id);
    EXPECT_EQ(all[1].id, b.id);
    EXPECT_EQ(all[2].id, c.id);
}

TEST(DocumentStore, list_page) {
    auto s = Stores{};
    for (int i = 0; i < 5; ++i) s.documents.create_document("doc" + std::to_string(i));

    const auto first = s.documents.list_page(1, 2);
    EXPECT_EQ(first.total, 5u);
    ASSERT_EQ(first.items.size(), 2u);
    EXPECT_EQ(first.items[0].name, "doc0");

    const auto last = s.documents.list_page(3, 2);
    ASSERT_EQ(last.items.size(), 1u);
    EXPECT_EQ(last.items[0].name, "doc4");

    EXPECT_TRUE(s.documents.list_page(4, 2).items.empty());
    EXPECT_TRUE(s.documents.list_page(0, 2).items.empty());
    EXPECT_TRUE(s.documents.list_page(1, 0).items.empty());
}

TEST(DocumentStore, remove_cascades_to_versions) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("a");
    const auto other = s.documents.create_document("b");
    s.versions.create_version(doc.id, Tree::map({{"a", 1}}), false);
    s.versions.create_version(doc.id, Tree::map({{"a", 2}}), true);
    const auto kept = s.versions.create_version(other.id, Tree::map({{"b", 1}}), false);

    EXPECT_EQ(s.documents.remove(doc.id), 2u);
    EXPECT_FALSE(s.documents.contains(doc.id));
    EXPECT_EQ(thrown_kind([&] { s.versions.list_versions(doc.id); }),
              ErrorKind::document_not_found);
    EXPECT_EQ(s.versions.get_version(other.id, kept.id), kept);
    EXPECT_EQ(thrown_kind([&] { s.documents.remove(doc.id); }), ErrorKind::document_not_found);
}

TEST(DocumentStore, update_may_not_change_id) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("a");
    EXPECT_EQ(thrown_kind([&] {
                  s.documents.update(doc.id, [](Document& d) { d.id = DocumentId{"other"}; });
              }),
              ErrorKind::storage_error);
    EXPECT_EQ(s.documents.get(doc.id), doc);
}

TEST(DocumentStore, duplicate_generated_id_is_storage_error) {
    auto backend = std::make_shared<MemoryBackend>();
    auto options = RepositoryOptions{};
    options.id_generator = [] { return std::string{"same"}; };
    auto documents = DocumentStore{backend, options};
    documents.create_document("first");
    EXPECT_EQ(thrown_kind([&] { documents.create_document("second"); }), ErrorKind::storage_error);
    EXPECT_EQ(documents.get(DocumentId{"same"}).name, "first");
}

TEST(DocumentStore, stores_share_a_backend) {
    auto s = Stores{};
    const auto doc = s.documents.create_document("a", Tree::map({{"k", "v"}}));
    auto reopened = DocumentStore{s.backend, s.options};
    EXPECT_EQ(reopened.get(doc.id), doc);
}
