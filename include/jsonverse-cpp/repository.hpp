/// @file repository.hpp
/// @brief Repository: one object wiring every component together.

#pragma once

#include <jsonverse-cpp/backend.hpp>
#include <jsonverse-cpp/document_store.hpp>
#include <jsonverse-cpp/merge.hpp>
#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/save_coordinator.hpp>
#include <jsonverse-cpp/version_store.hpp>

#include <memory>

namespace jsonverse_cpp {

/// Owns a backend, both stores, the save coordinator, the merge engine
/// and (once started) the autosave timer, all sharing one set of options.
///
/// @code
/// auto repo = jsonverse_cpp::Repository{};
/// auto doc = repo.documents().create_document("config");
/// repo.coordinator().edit(doc.id, Tree::map({{"port", 8080}}));
/// auto v1 = repo.coordinator().save(doc.id);
/// @endcode
class Repository {
public:
    /// In-memory repository.
    explicit Repository(RepositoryOptions options = {});

    /// Repository over an existing backend.
    Repository(std::shared_ptr<Backend> backend, RepositoryOptions options = {});

    ~Repository();

    Repository(const Repository&) = delete;
    auto operator=(const Repository&) -> Repository& = delete;

    auto options() const -> const RepositoryOptions& { return options_; }
    auto backend() const -> Backend& { return *backend_; }
    auto documents() -> DocumentStore& { return *documents_; }
    auto versions() -> VersionStore& { return *versions_; }
    auto coordinator() -> SaveCoordinator& { return *coordinator_; }
    auto merger() -> MergeEngine& { return *merger_; }

    /// Start ticking every open document at options().autosave_interval.
    /// No-op if already running.
    void start_autosave();

    /// Stop the autosave timer, waiting for a running tick.
    void stop_autosave();

    auto autosave_running() const -> bool { return timer_ != nullptr; }

private:
    RepositoryOptions options_;
    std::shared_ptr<Backend> backend_;
    std::unique_ptr<DocumentStore> documents_;
    std::unique_ptr<VersionStore> versions_;
    std::unique_ptr<SaveCoordinator> coordinator_;
    std::unique_ptr<MergeEngine> merger_;
    std::unique_ptr<AutosaveTimer> timer_;
};

}  // namespace jsonverse_cpp
