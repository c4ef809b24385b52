/// @file version.hpp
/// @brief Version: an immutable snapshot in a document's history.

#pragma once

#include <jsonverse-cpp/patch.hpp>
#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace jsonverse_cpp {

/// One node of a document's version DAG.
///
/// Versions store the full content, not just the delta, so history stays
/// readable even if patches are dropped. The patch records how the
/// parent's content became this content. A merge version additionally
/// names the version whose content it adopted; that is a back-reference,
/// not a second parent.
struct Version {
    VersionId id;                            ///< Unique identifier.
    DocumentId document_id;                  ///< The owning document.
    Tree content;                            ///< Full snapshot.
    std::optional<VersionId> parent_id;      ///< Previous head; nullopt for the first version.
    std::optional<VersionId> merged_from_id; ///< Version adopted by a merge, if any.
    Timestamp created_at;                    ///< Creation time.
    bool is_auto_save{false};                ///< Written by autosave rather than a manual save.
    std::optional<Patch> patch;              ///< Parent content -> this content; nullopt without parent.
    std::uint64_t sequence{0};               ///< Per-document insertion counter, starting at 1.

    auto is_merge() const -> bool { return merged_from_id.has_value(); }

    auto operator==(const Version&) const -> bool = default;
};

/// Strict weak order putting the most recent version first: newer
/// created_at first, ties broken by higher sequence.
auto newer_first(const Version& a, const Version& b) -> bool;

/// Sort versions most recent first (see newer_first).
void sort_by_recency(std::vector<Version>& versions);

}  // namespace jsonverse_cpp
