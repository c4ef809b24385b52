/// @file save_coordinator.hpp
/// @brief SaveCoordinator: per-document serialization of saves and autosaves.

#pragma once

#include <jsonverse-cpp/document_store.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>
#include <jsonverse-cpp/version.hpp>
#include <jsonverse-cpp/version_store.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace jsonverse_cpp {

/// Per-document coordinator state.
enum class SaveState : std::uint8_t {
    idle,
    saving,
};

constexpr auto to_string_view(SaveState state) noexcept -> std::string_view {
    switch (state) {
        case SaveState::idle:   return "idle";
        case SaveState::saving: return "saving";
    }
    return "unknown";
}

/// What an autosave tick did.
enum class SaveResult : std::uint8_t {
    saved,            ///< A new autosave version was appended.
    amended,          ///< The autosave head was rewritten in place.
    not_dirty,        ///< Nothing changed since the last save.
    invalid_content,  ///< The working copy does not parse; skipped.
    superseded,       ///< Collapsed into an autosave already queued.
};

constexpr auto to_string_view(SaveResult result) noexcept -> std::string_view {
    switch (result) {
        case SaveResult::saved:           return "saved";
        case SaveResult::amended:         return "amended";
        case SaveResult::not_dirty:       return "not_dirty";
        case SaveResult::invalid_content: return "invalid_content";
        case SaveResult::superseded:      return "superseded";
    }
    return "unknown";
}

struct SaveOutcome {
    SaveResult result{SaveResult::not_dirty};
    std::optional<Version> version;  ///< Set for saved and amended.

    auto wrote() const -> bool { return version.has_value(); }

    /// The error kind a skipped tick reports: concurrent_save_superseded or
    /// invalid_content. nullopt for writes and clean documents.
    auto error_kind() const -> std::optional<ErrorKind> {
        switch (result) {
            case SaveResult::superseded:      return ErrorKind::concurrent_save_superseded;
            case SaveResult::invalid_content: return ErrorKind::invalid_content;
            default:                          return std::nullopt;
        }
    }
};

/// Snapshot of one document's coordinator state.
struct SaveStatus {
    SaveState state{SaveState::idle};
    std::size_t queued{0};  ///< Saves waiting for the current one.
    bool dirty{false};      ///< Working copy differs from the last saved content.
    bool valid{true};       ///< Working copy parses.
};

/// Serializes every version-creating write per document.
///
/// Each document has a working copy (the editor's content) and a
/// baseline (the last successfully saved content). Manual saves, autosave
/// ticks and exclusive operations such as merges move a document from
/// Idle to Saving one at a time; later callers wait their turn. Back-to-back
/// queued autosaves collapse: the first one waiting saves the latest
/// content and the others return SaveResult::superseded.
///
/// Sessions are created on first use from the document's current content;
/// open() does the same explicitly.
class SaveCoordinator {
public:
    SaveCoordinator(DocumentStore& documents, VersionStore& versions, RepositoryOptions options);

    SaveCoordinator(const SaveCoordinator&) = delete;
    auto operator=(const SaveCoordinator&) -> SaveCoordinator& = delete;

    // -- Sessions -------------------------------------------------------------

    /// Load the document's content as working copy and baseline.
    /// No-op for a document that is already open.
    /// @throws Exception(document_not_found)
    void open(const DocumentId& document);

    /// Drop the working copy, waiting for an in-flight save first.
    /// Returns false if the document was not open.
    auto close(const DocumentId& document) -> bool;

    auto is_open(const DocumentId& document) const -> bool;
    auto open_documents() const -> std::vector<DocumentId>;

    // -- Editing --------------------------------------------------------------

    /// Replace the working copy.
    void edit(const DocumentId& document, Tree content);

    /// Replace the working copy with parsed text. Text that does not parse
    /// leaves the last valid working copy in place and marks the document
    /// invalid until the next successful edit.
    /// @return false if the text did not parse.
    auto edit_text(const DocumentId& document, std::string_view text) -> bool;

    /// The working copy; nullopt while it is invalid.
    auto working_content(const DocumentId& document) const -> std::optional<Tree>;

    auto is_dirty(const DocumentId& document) const -> bool;

    auto status(const DocumentId& document) const -> SaveStatus;

    // -- Saving ---------------------------------------------------------------

    /// Save the working copy as a new manual version, waiting for any
    /// in-flight save. Always appends, even when nothing changed. On
    /// failure the baseline and working copy are untouched.
    /// @throws Exception(invalid_content) if the working copy is invalid.
    auto save(const DocumentId& document) -> Version;

    /// One autosave tick. Fires only for a dirty, valid working copy;
    /// anything else is a logged no-op.
    auto autosave_tick(const DocumentId& document) -> SaveOutcome;

    /// Tick every open document. Failures are logged per document.
    /// Sessions of documents that no longer exist are dropped.
    /// @return Number of documents that wrote a version.
    auto autosave_all() -> std::size_t;

    /// Run a version-creating write in the document's save slot. The
    /// version it returns becomes baseline and working copy; unsaved edits
    /// are discarded.
    auto run_exclusive(const DocumentId& document, const std::function<Version()>& write)
        -> Version;

private:
    struct Session {
        Tree working;
        Tree baseline;
        std::optional<std::string> invalid_reason;
        SaveState state{SaveState::idle};
        std::size_t waiting{0};
        bool autosave_queued{false};
        std::condition_variable idle;

        auto dirty() const -> bool { return !(working == baseline); }
    };

    auto session_for(const DocumentId& document) -> std::shared_ptr<Session>;
    auto existing(const DocumentId& document) const -> std::shared_ptr<Session>;
    void wait_idle(std::unique_lock<std::mutex>& lock, Session& session);
    void finish(Session& session, const std::optional<Tree>& saved);
    void forget(const DocumentId& document);
    auto write_autosave(const DocumentId& document, const Tree& content) -> SaveOutcome;

    DocumentStore& documents_;
    VersionStore& versions_;
    RepositoryOptions options_;

    mutable std::mutex mutex_;
    std::map<DocumentId, std::shared_ptr<Session>> sessions_;
};

/// Drives SaveCoordinator::autosave_all() from a background thread.
///
/// Ticks once per interval until destroyed or stopped. Stopping wakes the
/// thread immediately.
class AutosaveTimer {
public:
    AutosaveTimer(SaveCoordinator& coordinator, std::chrono::milliseconds interval);
    ~AutosaveTimer();

    AutosaveTimer(const AutosaveTimer&) = delete;
    auto operator=(const AutosaveTimer&) -> AutosaveTimer& = delete;

    /// Stop ticking and join the thread. Idempotent.
    void stop();

    auto interval() const -> std::chrono::milliseconds { return interval_; }

    /// Completed ticks so far.
    auto ticks() const -> std::uint64_t { return ticks_.load(); }

private:
    void run(std::stop_token stop);

    SaveCoordinator& coordinator_;
    std::chrono::milliseconds interval_;
    std::atomic<std::uint64_t> ticks_{0};
    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::jthread worker_;
};

}  // namespace jsonverse_cpp
