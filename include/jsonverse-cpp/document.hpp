/// @file document.hpp
/// @brief Document record and paged listing type.

#pragma once

#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace jsonverse_cpp {

/// A named document and its current materialized content.
///
/// `content` always equals the content of the head version once one
/// exists. Documents are owned by the DocumentStore and only change
/// through saves, merges and renames.
struct Document {
    DocumentId id;                           ///< Unique identifier.
    std::string name;                        ///< Display name.
    Tree content;                            ///< Current content.
    Timestamp created_at;                    ///< Creation time.
    std::optional<VersionId> head_version_id;///< Current head; nullopt before the first save.
    std::uint64_t version_count{0};          ///< Versions created so far (last sequence number).

    auto operator==(const Document&) const -> bool = default;
};

/// One page of a listing. Pages are numbered from 1.
template <typename T>
struct Page {
    std::vector<T> items;       ///< The records on this page.
    std::size_t total{0};       ///< Records across all pages.
    std::size_t page{1};        ///< This page's number.
    std::size_t page_size{0};   ///< Requested page size.
};

/// Cut page `page` (1-based) of `page_size` records out of `all`.
template <typename T>
auto make_page(std::vector<T> all, std::size_t page, std::size_t page_size) -> Page<T> {
    auto result = Page<T>{.items = {}, .total = all.size(), .page = page, .page_size = page_size};
    if (page == 0 || page_size == 0) return result;
    const auto first = (page - 1) * page_size;
    if (first >= all.size()) return result;
    const auto last = std::min(all.size(), first + page_size);
    result.items.assign(std::make_move_iterator(all.begin() + static_cast<std::ptrdiff_t>(first)),
                        std::make_move_iterator(all.begin() + static_cast<std::ptrdiff_t>(last)));
    return result;
}

}  // namespace jsonverse_cpp
