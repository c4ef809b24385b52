/// @file types.hpp
/// @brief Core identity types: DocumentId, VersionId, Timestamp, Path.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonverse_cpp {

/// Opaque identifier of a document.
///
/// Ids are generated by the repository (128-bit random hex by default)
/// and compared lexicographically.
struct DocumentId {
    std::string value;  ///< The textual identifier.

    DocumentId() = default;

    /// Construct from a string.
    explicit DocumentId(std::string v) : value{std::move(v)} {}

    auto empty() const -> bool { return value.empty(); }

    auto operator<=>(const DocumentId&) const = default;
    auto operator==(const DocumentId&) const -> bool = default;
};

/// Opaque identifier of a version. Unique across all documents.
struct VersionId {
    std::string value;  ///< The textual identifier.

    VersionId() = default;

    /// Construct from a string.
    explicit VersionId(std::string v) : value{std::move(v)} {}

    auto empty() const -> bool { return value.empty(); }

    auto operator<=>(const VersionId&) const = default;
    auto operator==(const VersionId&) const -> bool = default;
};

/// A millisecond-precision UTC timestamp.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// Read the system clock as a Timestamp.
auto now() -> Timestamp;

/// Format a Timestamp as RFC 3339 UTC, e.g. "2024-05-01T12:30:00.250Z".
auto to_rfc3339(Timestamp ts) -> std::string;

/// Parse an RFC 3339 timestamp. Accepts a "Z" or "+hh:mm"/"-hh:mm" offset
/// and an optional fractional second. Throws Exception(invalid_content).
auto parse_rfc3339(std::string_view text) -> Timestamp;

/// A path element: either a map key or a list index.
using PathElement = std::variant<std::string, std::size_t>;

/// A path into a tree (e.g. "config" / "items" / 0). Empty = the root.
using Path = std::vector<PathElement>;

/// Render a path as an RFC 6901 JSON Pointer ("/config/items/0").
auto to_pointer(const Path& path) -> std::string;

/// Generator of fresh opaque identifiers.
using IdGenerator = std::function<std::string()>;

/// Source of the current time.
using Clock = std::function<Timestamp()>;

/// Default id generator: 16 random bytes rendered as 32 hex characters.
auto random_id() -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& key) { ... },
///     [](std::size_t index) { ... },
/// }, path_element);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonverse_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<jsonverse_cpp::DocumentId> {
    auto operator()(const jsonverse_cpp::DocumentId& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

template <>
struct std::hash<jsonverse_cpp::VersionId> {
    auto operator()(const jsonverse_cpp::VersionId& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

/// @endcond
