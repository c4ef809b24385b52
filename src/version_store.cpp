#include <jsonverse-cpp/version_store.hpp>
#include <jsonverse-cpp/diff.hpp>
#include <jsonverse-cpp/error.hpp>
#include "executor.hpp"
#include "storage/records.hpp"

#include <plog/Log.h>
#include <taskflow/algorithm/for_each.hpp>

#include <algorithm>
#include <exception>
#include <unordered_map>
#include <utility>

namespace jsonverse_cpp {

auto newer_first(const Version& a, const Version& b) -> bool {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.sequence > b.sequence;
}

void sort_by_recency(std::vector<Version>& versions) {
    std::ranges::sort(versions, newer_first);
}

auto VersionGraph::index_of(const VersionId& id) const -> std::optional<std::size_t> {
    auto it = std::ranges::find_if(nodes, [&](const Node& n) { return n.id == id; });
    if (it == nodes.end()) return std::nullopt;
    return static_cast<std::size_t>(it - nodes.begin());
}

VersionStore::VersionStore(std::shared_ptr<Backend> backend, DocumentStore& documents,
                           RepositoryOptions options)
    : backend_{std::move(backend)},
      documents_{documents},
      options_{std::move(options)},
      diff_options_{options_.diff_options()} {
    if (!backend_) throw Exception{ErrorKind::storage_error, "version store needs a backend"};
}

// =============================================================================
// Record access
// =============================================================================

auto VersionStore::load(const DocumentId& document, const VersionId& version) const
    -> std::optional<Version> {
    if (!storage::is_key_segment(version.value)) return std::nullopt;
    const auto key = storage::version_key(document, version);
    auto bytes = backend_->get(key);
    if (!bytes) return std::nullopt;
    auto found = storage::decode_record<Version>(*bytes, key);
    if (found.document_id != document) return std::nullopt;
    return found;
}

auto VersionStore::load_required(const DocumentId& document, const VersionId& version) const
    -> Version {
    auto found = load(document, version);
    if (!found) {
        throw Exception{ErrorKind::version_not_found,
                        "no version \"" + version.value + "\" in document \"" + document.value + "\""};
    }
    return std::move(*found);
}

void VersionStore::require_document(const DocumentId& document) const {
    if (!documents_.contains(document)) {
        throw Exception{ErrorKind::document_not_found, "no document \"" + document.value + "\""};
    }
}

// =============================================================================
// Writes
// =============================================================================

// Caller holds write_mutex_.
auto VersionStore::append(const DocumentId& document, Tree content, bool is_auto_save,
                          std::optional<VersionId> merged_from) -> std::pair<Version, HeadEvent> {
    const auto current = documents_.get(document);

    auto previous = std::optional<Version>{};
    if (current.head_version_id) previous = load_required(document, *current.head_version_id);

    auto created_at = options_.current_time();
    // A version never predates its parent, so recency order keeps the head first.
    if (previous) created_at = std::max(created_at, previous->created_at);

    auto version = Version{
        .id = VersionId{options_.next_id()},
        .document_id = document,
        .content = std::move(content),
        .parent_id = current.head_version_id,
        .merged_from_id = std::move(merged_from),
        .created_at = created_at,
        .is_auto_save = is_auto_save,
        .patch = std::nullopt,
        .sequence = current.version_count + 1,
    };
    storage::require_key_segment(version.id.value, "version");
    if (previous) version.patch = diff(previous->content, version.content, diff_options_);

    const auto key = storage::version_key(document, version.id);
    backend_->put(key, storage::encode_record(version, options_.compression_threshold));
    try {
        documents_.update(document, [&](Document& d) {
            if (d.head_version_id != current.head_version_id) {
                throw Exception{ErrorKind::storage_error,
                                "head of \"" + document.value + "\" moved outside the version store"};
            }
            d.content = version.content;
            d.head_version_id = version.id;
            d.version_count = version.sequence;
        });
    } catch (...) {
        backend_->erase(key);
        throw;
    }

    PLOGI << "document " << document.value << " head -> " << version.id.value
          << " (sequence " << version.sequence
          << (version.is_auto_save ? ", autosave" : "")
          << (version.is_merge() ? ", merge" : "") << ")";

    auto event = HeadEvent{
        .document_id = document,
        .version_id = version.id,
        .previous_head = current.head_version_id,
        .kind = version.is_merge() ? HeadEventKind::merged : HeadEventKind::created,
    };
    return {std::move(version), std::move(event)};
}

auto VersionStore::create_version(const DocumentId& document, Tree content, bool is_auto_save)
    -> Version {
    auto result = [&] {
        auto lock = std::lock_guard{write_mutex_};
        return append(document, std::move(content), is_auto_save, std::nullopt);
    }();
    publish(result.second);
    return std::move(result.first);
}

auto VersionStore::create_merge_version(const DocumentId& document, Tree content,
                                        const VersionId& merged_from) -> Version {
    auto result = [&] {
        auto lock = std::lock_guard{write_mutex_};
        return append(document, std::move(content), false, merged_from);
    }();
    publish(result.second);
    return std::move(result.first);
}

auto VersionStore::update_head_in_place(const DocumentId& document, Tree content) -> Version {
    auto lock = std::unique_lock{write_mutex_};
    const auto current = documents_.get(document);

    if (!current.head_version_id) {
        auto result = append(document, std::move(content), true, std::nullopt);
        lock.unlock();
        publish(result.second);
        return std::move(result.first);
    }

    auto head = load_required(document, *current.head_version_id);
    if (head.content == content) return head;

    if (head.parent_id) {
        const auto parent = load_required(document, *head.parent_id);
        head.patch = diff(parent.content, content, diff_options_);
    }
    head.content = std::move(content);

    const auto key = storage::version_key(document, head.id);
    auto original = backend_->get(key);
    backend_->put(key, storage::encode_record(head, options_.compression_threshold));
    try {
        documents_.update(document, [&](Document& d) {
            if (d.head_version_id != head.id) {
                throw Exception{ErrorKind::storage_error,
                                "head of \"" + document.value + "\" moved outside the version store"};
            }
            d.content = head.content;
        });
    } catch (...) {
        if (original) backend_->put(key, std::move(*original));
        throw;
    }
    lock.unlock();

    PLOGD << "document " << document.value << " head " << head.id.value << " amended in place";
    publish(HeadEvent{
        .document_id = document,
        .version_id = head.id,
        .previous_head = head.id,
        .kind = HeadEventKind::amended,
    });
    return head;
}

// =============================================================================
// Reads
// =============================================================================

auto VersionStore::list_versions(const DocumentId& document) const -> std::vector<Version> {
    require_document(document);
    const auto prefix = storage::version_prefix(document);
    auto versions = std::vector<Version>{};
    for (const auto& key : backend_->list(prefix)) {
        if (!storage::is_direct_child(key, prefix)) continue;
        if (auto bytes = backend_->get(key)) {
            auto version = storage::decode_record<Version>(*bytes, key);
            if (version.document_id == document) versions.push_back(std::move(version));
        }
    }
    sort_by_recency(versions);
    return versions;
}

auto VersionStore::list_versions_page(const DocumentId& document, std::size_t page,
                                      std::size_t page_size) const -> Page<Version> {
    return make_page(list_versions(document), page, page_size);
}

auto VersionStore::get_version(const DocumentId& document, const VersionId& version) const
    -> Version {
    require_document(document);
    return load_required(document, version);
}

auto VersionStore::find_version(const DocumentId& document, const VersionId& version) const
    -> std::optional<Version> {
    return load(document, version);
}

auto VersionStore::head(const DocumentId& document) const -> std::optional<Version> {
    const auto current = documents_.get(document);
    if (!current.head_version_id) return std::nullopt;
    return load_required(document, *current.head_version_id);
}

auto VersionStore::diff_against_head(const DocumentId& document, const VersionId& version) const
    -> Patch {
    const auto from = get_version(document, version);
    const auto current = documents_.get(document);
    return diff(from.content, current.content, diff_options_);
}

auto VersionStore::reconstruct(const DocumentId& document, const VersionId& version) const
    -> Tree {
    const auto target = get_version(document, version);
    auto current = head(document);
    if (!current) {
        throw Exception{ErrorKind::version_not_found, "document \"" + document.value + "\" has no versions"};
    }

    auto content = current->content;
    while (current->id != target.id) {
        if (!current->parent_id) {
            throw Exception{ErrorKind::version_not_found,
                            "version \"" + version.value + "\" is not an ancestor of the head"};
        }
        if (!current->patch) {
            throw Exception{ErrorKind::patch_conflict,
                            "version \"" + current->id.value + "\" has no stored patch"};
        }
        content = apply(content, invert(*current->patch));
        current = load_required(document, *current->parent_id);
    }
    return content;
}

auto VersionStore::graph(const DocumentId& document) const -> VersionGraph {
    const auto versions = list_versions(document);
    const auto current = documents_.get(document);

    auto index = std::unordered_map<VersionId, std::size_t>{};
    for (std::size_t i = 0; i < versions.size(); ++i) index.emplace(versions[i].id, i);

    auto resolve = [&](const std::optional<VersionId>& id) -> std::optional<std::size_t> {
        if (!id) return std::nullopt;
        auto it = index.find(*id);
        if (it == index.end()) return std::nullopt;
        return it->second;
    };

    auto result = VersionGraph{};
    result.nodes.reserve(versions.size());
    for (const auto& v : versions) {
        result.nodes.push_back(VersionGraph::Node{
            .id = v.id,
            .parent = resolve(v.parent_id),
            .merged_from = resolve(v.merged_from_id),
            .is_auto_save = v.is_auto_save,
            .is_head = current.head_version_id == v.id,
            .created_at = v.created_at,
        });
    }
    return result;
}

auto VersionStore::verify_history(const DocumentId& document) const -> std::vector<VersionId> {
    const auto versions = list_versions(document);

    auto index = std::unordered_map<VersionId, std::size_t>{};
    for (std::size_t i = 0; i < versions.size(); ++i) index.emplace(versions[i].id, i);

    const auto& ignored = diff_options_.ignored_properties;
    auto check = [&](std::size_t i) -> bool {
        const auto& v = versions[i];
        if (!v.parent_id) return !v.patch.has_value();
        auto parent = index.find(*v.parent_id);
        if (parent == index.end() || !v.patch) return false;
        try {
            const auto rebuilt = apply(versions[parent->second].content, *v.patch);
            return without_properties(rebuilt, ignored) == without_properties(v.content, ignored);
        } catch (const Exception& e) {
            PLOGD << "version " << v.id.value << ": " << e.what();
            return false;
        }
    };

    auto ok = std::vector<char>(versions.size(), 0);
    if (options_.parallel_verify && versions.size() > 1) {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, versions.size(), std::size_t{1},
            [&](std::size_t i) { ok[i] = check(i) ? 1 : 0; });
        detail::global_executor().run(taskflow).wait();
    } else {
        for (std::size_t i = 0; i < versions.size(); ++i) ok[i] = check(i) ? 1 : 0;
    }

    auto bad = std::vector<VersionId>{};
    for (std::size_t i = 0; i < versions.size(); ++i) {
        if (!ok[i]) bad.push_back(versions[i].id);
    }
    if (!bad.empty()) {
        PLOGW << "document " << document.value << ": " << bad.size() << " versions fail verification";
    }
    return bad;
}

// =============================================================================
// Subscriptions
// =============================================================================

auto VersionStore::subscribe(std::optional<DocumentId> document, HeadListener listener)
    -> SubscriptionId {
    const auto id = next_subscription_.fetch_add(1);
    auto lock = std::lock_guard{subscriptions_mutex_};
    subscriptions_.emplace(id, Subscription{std::move(document), std::move(listener)});
    return id;
}

auto VersionStore::unsubscribe(SubscriptionId id) -> bool {
    auto lock = std::lock_guard{subscriptions_mutex_};
    return subscriptions_.erase(id) > 0;
}

void VersionStore::publish(const HeadEvent& event) {
    auto listeners = std::vector<HeadListener>{};
    {
        auto lock = std::lock_guard{subscriptions_mutex_};
        for (const auto& [id, sub] : subscriptions_) {
            if (!sub.document || *sub.document == event.document_id) {
                listeners.push_back(sub.listener);
            }
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            PLOGW << "head listener for " << event.document_id.value << " threw: " << e.what();
        }
    }
}

}  // namespace jsonverse_cpp
