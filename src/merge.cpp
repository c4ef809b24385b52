#include <jsonverse-cpp/merge.hpp>

#include <plog/Log.h>

namespace jsonverse_cpp {

MergeEngine::MergeEngine(VersionStore& versions, SaveCoordinator& coordinator)
    : versions_{versions}, coordinator_{coordinator} {}

auto MergeEngine::merge(const DocumentId& document, const VersionId& source) -> Version {
    const auto adopted = versions_.get_version(document, source);

    auto merged = coordinator_.run_exclusive(document, [&] {
        return versions_.create_merge_version(document, adopted.content, adopted.id);
    });

    PLOGI << "merged version " << source.value << " into document " << document.value
          << " as " << merged.id.value;
    return merged;
}

}  // namespace jsonverse_cpp
