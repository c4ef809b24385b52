#include <jsonverse-cpp/document_store.hpp>
#include <jsonverse-cpp/error.hpp>
#include "storage/records.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace jsonverse_cpp {

namespace {

[[noreturn]] void not_found(const DocumentId& id) {
    throw Exception{ErrorKind::document_not_found, "no document \"" + id.value + "\""};
}

}  // anonymous namespace

DocumentStore::DocumentStore(std::shared_ptr<Backend> backend, RepositoryOptions options)
    : backend_{std::move(backend)}, options_{std::move(options)} {
    if (!backend_) throw Exception{ErrorKind::storage_error, "document store needs a backend"};
}

auto DocumentStore::load(const DocumentId& id) const -> std::optional<Document> {
    const auto key = storage::document_key(id);
    auto bytes = backend_->get(key);
    if (!bytes) return std::nullopt;
    return storage::decode_record<Document>(*bytes, key);
}

void DocumentStore::store(const Document& document) {
    backend_->put(storage::document_key(document.id),
                  storage::encode_record(document, options_.compression_threshold));
}

auto DocumentStore::create_document(std::string name, Tree content) -> Document {
    auto document = Document{
        .id = DocumentId{options_.next_id()},
        .name = std::move(name),
        .content = std::move(content),
        .created_at = options_.current_time(),
        .head_version_id = std::nullopt,
        .version_count = 0,
    };
    storage::require_key_segment(document.id.value, "document");

    auto lock = std::unique_lock{mutex_};
    if (load(document.id)) {
        throw Exception{ErrorKind::storage_error, "document id \"" + document.id.value + "\" already in use"};
    }
    store(document);
    PLOGD << "created document " << document.id.value << " \"" << document.name << "\"";
    return document;
}

auto DocumentStore::get(const DocumentId& id) const -> Document {
    auto document = find(id);
    if (!document) not_found(id);
    return std::move(*document);
}

auto DocumentStore::find(const DocumentId& id) const -> std::optional<Document> {
    auto lock = std::shared_lock{mutex_};
    return load(id);
}

auto DocumentStore::contains(const DocumentId& id) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return backend_->get(storage::document_key(id)).has_value();
}

auto DocumentStore::rename(const DocumentId& id, std::string name) -> Document {
    return update(id, [&](Document& document) { document.name = std::move(name); });
}

auto DocumentStore::list() const -> std::vector<Document> {
    auto documents = std::vector<Document>{};
    {
        auto lock = std::shared_lock{mutex_};
        for (const auto& key : backend_->list(storage::document_prefix)) {
            if (!storage::is_direct_child(key, storage::document_prefix)) continue;
            if (auto bytes = backend_->get(key)) {
                documents.push_back(storage::decode_record<Document>(*bytes, key));
            }
        }
    }
    std::ranges::sort(documents, [](const Document& a, const Document& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return documents;
}

auto DocumentStore::list_page(std::size_t page, std::size_t page_size) const -> Page<Document> {
    return make_page(list(), page, page_size);
}

auto DocumentStore::remove(const DocumentId& id) -> std::size_t {
    auto lock = std::unique_lock{mutex_};
    if (!load(id)) not_found(id);

    const auto prefix = storage::version_prefix(id);
    auto removed = std::size_t{0};
    for (const auto& key : backend_->list(prefix)) {
        if (!storage::is_direct_child(key, prefix)) continue;
        if (backend_->erase(key)) ++removed;
    }
    backend_->erase(storage::document_key(id));
    PLOGI << "removed document " << id.value << " and " << removed << " versions";
    return removed;
}

auto DocumentStore::update(const DocumentId& id,
                           const std::function<void(Document&)>& mutate) -> Document {
    auto lock = std::unique_lock{mutex_};
    auto document = load(id);
    if (!document) not_found(id);
    mutate(*document);
    if (document->id != id) {
        throw Exception{ErrorKind::storage_error, "update may not change a document's id"};
    }
    store(*document);
    return std::move(*document);
}

}  // namespace jsonverse_cpp
