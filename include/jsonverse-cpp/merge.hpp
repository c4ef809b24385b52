/// @file merge.hpp
/// @brief MergeEngine: adopt a past version as the new head.

#pragma once

#include <jsonverse-cpp/save_coordinator.hpp>
#include <jsonverse-cpp/types.hpp>
#include <jsonverse-cpp/version.hpp>
#include <jsonverse-cpp/version_store.hpp>

namespace jsonverse_cpp {

/// Makes a historical version the head again without touching history.
///
/// A merge is not a three-way merge: the new head's content is exactly the
/// source version's content, its parent is the previous head, and its
/// merged_from_id names the source. The write runs in the document's save
/// slot, so it never overlaps a save or autosave of the same document.
class MergeEngine {
public:
    MergeEngine(VersionStore& versions, SaveCoordinator& coordinator);

    /// @throws Exception(document_not_found) if the document is unknown.
    /// @throws Exception(version_not_found) if the version is not one of its versions.
    auto merge(const DocumentId& document, const VersionId& source) -> Version;

private:
    VersionStore& versions_;
    SaveCoordinator& coordinator_;
};

}  // namespace jsonverse_cpp
