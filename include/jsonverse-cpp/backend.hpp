/// @file backend.hpp
/// @brief Key-value persistence behind the document and version stores.

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace jsonverse_cpp {

/// Raw record bytes.
using Bytes = std::vector<std::byte>;

/// Abstract key-value store.
///
/// Keys are slash-separated strings ("doc/<id>", "ver/<doc>/<version>").
/// Implementations must be safe to call from several threads at once and
/// report failures by throwing Exception(storage_error).
class Backend {
public:
    virtual ~Backend() = default;

    /// Read a record, or nullopt if the key is absent.
    virtual auto get(const std::string& key) const -> std::optional<Bytes> = 0;

    /// Create or overwrite a record.
    virtual void put(const std::string& key, Bytes value) = 0;

    /// Delete a record. Returns false if it was absent.
    virtual auto erase(const std::string& key) -> bool = 0;

    /// All keys starting with `prefix`, in ascending order.
    virtual auto list(std::string_view prefix) const -> std::vector<std::string> = 0;
};

/// Thread-safe in-memory Backend.
class MemoryBackend final : public Backend {
public:
    auto get(const std::string& key) const -> std::optional<Bytes> override;
    void put(const std::string& key, Bytes value) override;
    auto erase(const std::string& key) -> bool override;
    auto list(std::string_view prefix) const -> std::vector<std::string> override;

    /// Number of stored records.
    auto size() const -> std::size_t;

    /// Total bytes across all stored records.
    auto stored_bytes() const -> std::size_t;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Bytes, std::less<>> records_;
};

}  // namespace jsonverse_cpp
