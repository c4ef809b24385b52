/// @file version_store.hpp
/// @brief VersionStore: the append-only version DAG of every document.

#pragma once

#include <jsonverse-cpp/backend.hpp>
#include <jsonverse-cpp/document.hpp>
#include <jsonverse-cpp/document_store.hpp>
#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/patch.hpp>
#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>
#include <jsonverse-cpp/version.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonverse_cpp {

// -- HEAD subscriptions -------------------------------------------------------

/// How a document's head moved.
enum class HeadEventKind : std::uint8_t {
    created,  ///< A new version was appended by a save.
    amended,  ///< The head version was rewritten in place.
    merged,   ///< A merge version was appended.
};

constexpr auto to_string_view(HeadEventKind kind) noexcept -> std::string_view {
    switch (kind) {
        case HeadEventKind::created: return "created";
        case HeadEventKind::amended: return "amended";
        case HeadEventKind::merged:  return "merged";
    }
    return "unknown";
}

/// Delivered to subscribers after the head has durably moved.
struct HeadEvent {
    DocumentId document_id;
    VersionId version_id;                   ///< The new (or amended) head.
    std::optional<VersionId> previous_head; ///< Head before the change.
    HeadEventKind kind{HeadEventKind::created};

    auto operator==(const HeadEvent&) const -> bool = default;
};

using HeadListener = std::function<void(const HeadEvent&)>;
using SubscriptionId = std::uint64_t;

// -- Graph view ---------------------------------------------------------------

/// A document's versions with their edges resolved to node indices,
/// most recent first.
struct VersionGraph {
    struct Node {
        VersionId id;
        std::optional<std::size_t> parent;       ///< Index of the parent node.
        std::optional<std::size_t> merged_from;  ///< Index of the adopted version.
        bool is_auto_save{false};
        bool is_head{false};
        Timestamp created_at;
    };

    std::vector<Node> nodes;

    /// Index of a version's node, if present.
    auto index_of(const VersionId& id) const -> std::optional<std::size_t>;
};

// -- VersionStore -------------------------------------------------------------

/// Append-only per-document history.
///
/// Every write stores the version record first and only then advances
/// Document::head_version_id, so a reader never sees a head that is not
/// stored. Writes are serialized store-wide; reads are lock-free with
/// respect to each other.
///
/// @code
/// auto v1 = versions.create_version(doc.id, Tree::map({{"a", 1}}), false);
/// auto v2 = versions.create_version(doc.id, Tree::map({{"a", 2}}), false);
/// // v2.parent_id == v1.id, v2.patch holds Replace(["a"], 1, 2)
/// @endcode
class VersionStore {
public:
    VersionStore(std::shared_ptr<Backend> backend, DocumentStore& documents,
                 RepositoryOptions options);

    VersionStore(const VersionStore&) = delete;
    auto operator=(const VersionStore&) -> VersionStore& = delete;

    // -- Writes ---------------------------------------------------------------

    /// Append a version holding `content` on top of the current head.
    /// The first version has no parent and no patch.
    /// @throws Exception(document_not_found)
    auto create_version(const DocumentId& document, Tree content, bool is_auto_save) -> Version;

    /// Append a manual version adopting `content`, tagged with the
    /// version it was merged from.
    /// @throws Exception(document_not_found)
    auto create_merge_version(const DocumentId& document, Tree content,
                              const VersionId& merged_from) -> Version;

    /// Rewrite the head version's content and recompute its patch against
    /// its parent. id, parent, created_at and sequence are kept. Unchanged
    /// content returns the head untouched; a document without versions gets
    /// its first (autosave) version instead.
    /// @throws Exception(document_not_found)
    auto update_head_in_place(const DocumentId& document, Tree content) -> Version;

    // -- Reads ----------------------------------------------------------------

    /// All versions of a document, most recent first.
    /// @throws Exception(document_not_found)
    auto list_versions(const DocumentId& document) const -> std::vector<Version>;

    /// One page of list_versions(). Pages are numbered from 1.
    auto list_versions_page(const DocumentId& document, std::size_t page,
                            std::size_t page_size) const -> Page<Version>;

    /// @throws Exception(document_not_found) if the document is unknown.
    /// @throws Exception(version_not_found) if the version does not belong to it.
    auto get_version(const DocumentId& document, const VersionId& version) const -> Version;

    auto find_version(const DocumentId& document, const VersionId& version) const
        -> std::optional<Version>;

    /// The current head, or nullopt before the first save.
    /// @throws Exception(document_not_found)
    auto head(const DocumentId& document) const -> std::optional<Version>;

    /// Patch turning `version`'s content into the head's content.
    auto diff_against_head(const DocumentId& document, const VersionId& version) const -> Patch;

    /// Rebuild `version`'s content from the head snapshot by applying the
    /// inverted patches of every version after it on the parent chain.
    /// @throws Exception(patch_conflict) if a stored patch does not fit.
    auto reconstruct(const DocumentId& document, const VersionId& version) const -> Tree;

    auto graph(const DocumentId& document) const -> VersionGraph;

    /// Check every stored patch against its parent and own snapshots.
    /// @return Ids of the versions that fail, most recent first.
    auto verify_history(const DocumentId& document) const -> std::vector<VersionId>;

    // -- Subscriptions --------------------------------------------------------

    /// Listen to head moves of one document, or of all documents when
    /// `document` is nullopt. Listeners run on the writing thread after the
    /// write completed; exceptions they throw are logged and dropped.
    auto subscribe(std::optional<DocumentId> document, HeadListener listener) -> SubscriptionId;

    /// Returns false if the id is unknown.
    auto unsubscribe(SubscriptionId id) -> bool;

private:
    struct Subscription {
        std::optional<DocumentId> document;
        HeadListener listener;
    };

    auto load(const DocumentId& document, const VersionId& version) const -> std::optional<Version>;
    auto load_required(const DocumentId& document, const VersionId& version) const -> Version;
    void require_document(const DocumentId& document) const;

    auto append(const DocumentId& document, Tree content, bool is_auto_save,
                std::optional<VersionId> merged_from) -> std::pair<Version, HeadEvent>;
    void publish(const HeadEvent& event);

    std::shared_ptr<Backend> backend_;
    DocumentStore& documents_;
    RepositoryOptions options_;
    DiffOptions diff_options_;

    std::mutex write_mutex_;

    std::mutex subscriptions_mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    std::atomic<SubscriptionId> next_subscription_{1};
};

}  // namespace jsonverse_cpp
