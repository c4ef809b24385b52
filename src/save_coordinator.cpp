#include <jsonverse-cpp/save_coordinator.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/json.hpp>

#include <plog/Log.h>

#include <exception>
#include <utility>

namespace jsonverse_cpp {

SaveCoordinator::SaveCoordinator(DocumentStore& documents, VersionStore& versions,
                                 RepositoryOptions options)
    : documents_{documents}, versions_{versions}, options_{std::move(options)} {}

// =============================================================================
// Sessions
// =============================================================================

// Caller holds mutex_.
auto SaveCoordinator::session_for(const DocumentId& document) -> std::shared_ptr<Session> {
    if (auto it = sessions_.find(document); it != sessions_.end()) return it->second;

    const auto current = documents_.get(document);
    auto session = std::make_shared<Session>();
    session->working = current.content;
    session->baseline = current.content;
    sessions_.emplace(document, session);
    PLOGD << "opened session for document " << document.value;
    return session;
}

// Caller holds mutex_.
auto SaveCoordinator::existing(const DocumentId& document) const -> std::shared_ptr<Session> {
    auto it = sessions_.find(document);
    return it == sessions_.end() ? nullptr : it->second;
}

void SaveCoordinator::open(const DocumentId& document) {
    auto lock = std::lock_guard{mutex_};
    session_for(document);
}

auto SaveCoordinator::close(const DocumentId& document) -> bool {
    auto lock = std::unique_lock{mutex_};
    auto session = existing(document);
    if (!session) return false;
    wait_idle(lock, *session);
    if (session->dirty()) {
        PLOGW << "closing document " << document.value << " with unsaved edits";
    }
    sessions_.erase(document);
    return true;
}

auto SaveCoordinator::is_open(const DocumentId& document) const -> bool {
    auto lock = std::lock_guard{mutex_};
    return sessions_.contains(document);
}

auto SaveCoordinator::open_documents() const -> std::vector<DocumentId> {
    auto lock = std::lock_guard{mutex_};
    auto ids = std::vector<DocumentId>{};
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) ids.push_back(id);
    return ids;
}

// =============================================================================
// Editing
// =============================================================================

void SaveCoordinator::edit(const DocumentId& document, Tree content) {
    auto lock = std::lock_guard{mutex_};
    auto session = session_for(document);
    session->working = std::move(content);
    session->invalid_reason.reset();
}

auto SaveCoordinator::edit_text(const DocumentId& document, std::string_view text) -> bool {
    auto parsed = std::optional<Tree>{};
    auto reason = std::string{};
    try {
        parsed = parse(text);
    } catch (const Exception& e) {
        if (e.kind() != ErrorKind::invalid_content) throw;
        reason = e.error().message;
    }

    auto lock = std::lock_guard{mutex_};
    auto session = session_for(document);
    if (!parsed) {
        session->invalid_reason = std::move(reason);
        PLOGD << "document " << document.value << " has invalid content: " << *session->invalid_reason;
        return false;
    }
    session->working = std::move(*parsed);
    session->invalid_reason.reset();
    return true;
}

auto SaveCoordinator::working_content(const DocumentId& document) const -> std::optional<Tree> {
    auto lock = std::lock_guard{mutex_};
    auto session = existing(document);
    if (!session) return documents_.get(document).content;
    if (session->invalid_reason) return std::nullopt;
    return session->working;
}

auto SaveCoordinator::is_dirty(const DocumentId& document) const -> bool {
    auto lock = std::lock_guard{mutex_};
    auto session = existing(document);
    return session && session->dirty();
}

auto SaveCoordinator::status(const DocumentId& document) const -> SaveStatus {
    auto lock = std::lock_guard{mutex_};
    auto session = existing(document);
    if (!session) return SaveStatus{};
    return SaveStatus{
        .state = session->state,
        .queued = session->waiting,
        .dirty = session->dirty(),
        .valid = !session->invalid_reason.has_value(),
    };
}

// =============================================================================
// Saving
// =============================================================================

void SaveCoordinator::wait_idle(std::unique_lock<std::mutex>& lock, Session& session) {
    ++session.waiting;
    session.idle.wait(lock, [&] { return session.state == SaveState::idle; });
    --session.waiting;
}

// Leave Saving. `saved` is the content that became the head, if any.
void SaveCoordinator::finish(Session& session, const std::optional<Tree>& saved) {
    if (saved) session.baseline = *saved;
    session.state = SaveState::idle;
    session.idle.notify_all();
}

auto SaveCoordinator::save(const DocumentId& document) -> Version {
    auto lock = std::unique_lock{mutex_};
    auto session = session_for(document);
    wait_idle(lock, *session);
    if (session->invalid_reason) {
        throw Exception{ErrorKind::invalid_content, *session->invalid_reason};
    }
    session->state = SaveState::saving;
    const auto content = session->working;
    lock.unlock();

    auto version = Version{};
    try {
        version = versions_.create_version(document, content, false);
    } catch (...) {
        lock.lock();
        finish(*session, std::nullopt);
        throw;
    }

    lock.lock();
    finish(*session, version.content);
    return version;
}

auto SaveCoordinator::write_autosave(const DocumentId& document, const Tree& content)
    -> SaveOutcome {
    if (options_.autosave_policy == AutosavePolicy::amend_head) {
        const auto head = versions_.head(document);
        if (head && head->is_auto_save && !head->is_merge()) {
            return {SaveResult::amended, versions_.update_head_in_place(document, content)};
        }
    }
    return {SaveResult::saved, versions_.create_version(document, content, true)};
}

auto SaveCoordinator::autosave_tick(const DocumentId& document) -> SaveOutcome {
    auto lock = std::unique_lock{mutex_};
    auto session = session_for(document);

    if (session->state == SaveState::saving) {
        if (session->autosave_queued) {
            PLOGD << "autosave of " << document.value << " superseded by a queued autosave";
            return {SaveResult::superseded, std::nullopt};
        }
        session->autosave_queued = true;
        wait_idle(lock, *session);
        session->autosave_queued = false;
    }

    if (session->invalid_reason) {
        PLOGD << "autosave of " << document.value << " skipped: invalid content";
        return {SaveResult::invalid_content, std::nullopt};
    }
    if (!session->dirty()) {
        return {SaveResult::not_dirty, std::nullopt};
    }

    session->state = SaveState::saving;
    const auto content = session->working;
    lock.unlock();

    auto outcome = SaveOutcome{};
    try {
        outcome = write_autosave(document, content);
    } catch (...) {
        lock.lock();
        finish(*session, std::nullopt);
        throw;
    }

    lock.lock();
    finish(*session, outcome.version->content);
    return outcome;
}

auto SaveCoordinator::autosave_all() -> std::size_t {
    auto written = std::size_t{0};
    for (const auto& document : open_documents()) {
        if (!documents_.contains(document)) {
            forget(document);
            continue;
        }
        try {
            if (autosave_tick(document).wrote()) ++written;
        } catch (const Exception& e) {
            if (e.kind() == ErrorKind::document_not_found) {
                forget(document);
                continue;
            }
            PLOGW << "autosave of " << document.value << " failed: " << e.what();
        } catch (const std::exception& e) {
            PLOGW << "autosave of " << document.value << " failed: " << e.what();
        }
    }
    return written;
}

void SaveCoordinator::forget(const DocumentId& document) {
    auto lock = std::lock_guard{mutex_};
    if (sessions_.erase(document) > 0) {
        PLOGI << "dropped session of removed document " << document.value;
    }
}

auto SaveCoordinator::run_exclusive(const DocumentId& document,
                                    const std::function<Version()>& write) -> Version {
    auto lock = std::unique_lock{mutex_};
    auto session = session_for(document);
    wait_idle(lock, *session);
    session->state = SaveState::saving;
    lock.unlock();

    auto version = Version{};
    try {
        version = write();
    } catch (...) {
        lock.lock();
        finish(*session, std::nullopt);
        throw;
    }

    lock.lock();
    if (session->dirty() || session->invalid_reason) {
        PLOGW << "document " << document.value << ": unsaved edits replaced by version "
              << version.id.value;
    }
    session->working = version.content;
    session->invalid_reason.reset();
    finish(*session, version.content);
    return version;
}

// =============================================================================
// AutosaveTimer
// =============================================================================

AutosaveTimer::AutosaveTimer(SaveCoordinator& coordinator, std::chrono::milliseconds interval)
    : coordinator_{coordinator},
      interval_{interval},
      worker_{[this](std::stop_token stop) { run(std::move(stop)); }} {}

AutosaveTimer::~AutosaveTimer() {
    stop();
}

void AutosaveTimer::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
}

void AutosaveTimer::run(std::stop_token stop) {
    auto lock = std::unique_lock{mutex_};
    while (!stop.stop_requested()) {
        if (wake_.wait_for(lock, stop, interval_, [&stop] { return stop.stop_requested(); })) {
            break;
        }

        lock.unlock();
        const auto written = coordinator_.autosave_all();
        ++ticks_;
        if (written > 0) PLOGD << "autosave tick wrote " << written << " versions";
        lock.lock();
    }
}

}  // namespace jsonverse_cpp
