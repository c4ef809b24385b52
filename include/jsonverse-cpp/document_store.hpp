/// @file document_store.hpp
/// @brief DocumentStore: owns Document records and their HEAD pointers.

#pragma once

#include <jsonverse-cpp/backend.hpp>
#include <jsonverse-cpp/document.hpp>
#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace jsonverse_cpp {

/// Create, read, rename, list and delete Document records.
///
/// Creating a document does not create a Version; the first save does.
/// Content and head pointer change only through VersionStore (saves and
/// merges), which goes through update().
///
/// Thread-safe: every method may be called concurrently.
class DocumentStore {
public:
    DocumentStore(std::shared_ptr<Backend> backend, RepositoryOptions options);

    DocumentStore(const DocumentStore&) = delete;
    auto operator=(const DocumentStore&) -> DocumentStore& = delete;

    /// Create a document, empty (an empty map) or with seed content.
    auto create_document(std::string name, Tree content = Tree{Map{}}) -> Document;

    /// @throws Exception(document_not_found)
    auto get(const DocumentId& id) const -> Document;

    auto find(const DocumentId& id) const -> std::optional<Document>;

    auto contains(const DocumentId& id) const -> bool;

    /// @throws Exception(document_not_found)
    auto rename(const DocumentId& id, std::string name) -> Document;

    /// All documents, oldest first (ties by id).
    auto list() const -> std::vector<Document>;

    /// One page of list(). Pages are numbered from 1.
    auto list_page(std::size_t page, std::size_t page_size) const -> Page<Document>;

    /// Delete a document together with all of its versions, versions first.
    /// @return The number of versions deleted.
    /// @throws Exception(document_not_found)
    auto remove(const DocumentId& id) -> std::size_t;

    /// Read-modify-write one document under the store's write lock.
    /// The id may not be changed by `mutate`.
    /// @throws Exception(document_not_found)
    auto update(const DocumentId& id, const std::function<void(Document&)>& mutate) -> Document;

    auto backend() const -> Backend& { return *backend_; }

private:
    auto load(const DocumentId& id) const -> std::optional<Document>;
    void store(const Document& document);

    std::shared_ptr<Backend> backend_;
    RepositoryOptions options_;
    mutable std::shared_mutex mutex_;
};

}  // namespace jsonverse_cpp
