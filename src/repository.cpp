#include <jsonverse-cpp/repository.hpp>

#include <plog/Log.h>

#include <utility>

namespace jsonverse_cpp {

Repository::Repository(RepositoryOptions options)
    : Repository{std::make_shared<MemoryBackend>(), std::move(options)} {}

Repository::Repository(std::shared_ptr<Backend> backend, RepositoryOptions options)
    : options_{std::move(options)},
      backend_{std::move(backend)},
      documents_{std::make_unique<DocumentStore>(backend_, options_)},
      versions_{std::make_unique<VersionStore>(backend_, *documents_, options_)},
      coordinator_{std::make_unique<SaveCoordinator>(*documents_, *versions_, options_)},
      merger_{std::make_unique<MergeEngine>(*versions_, *coordinator_)} {}

Repository::~Repository() {
    stop_autosave();
}

void Repository::start_autosave() {
    if (timer_) return;
    timer_ = std::make_unique<AutosaveTimer>(*coordinator_, options_.autosave_interval);
    PLOGI << "autosave every " << options_.autosave_interval.count() << " ms ("
          << to_string_view(options_.autosave_policy) << ")";
}

void Repository::stop_autosave() {
    if (!timer_) return;
    timer_->stop();
    timer_.reset();
}

}  // namespace jsonverse_cpp
