#include <jsonverse-cpp/backend.hpp>

#include <mutex>
#include <utility>

namespace jsonverse_cpp {

auto MemoryBackend::get(const std::string& key) const -> std::optional<Bytes> {
    auto lock = std::shared_lock{mutex_};
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void MemoryBackend::put(const std::string& key, Bytes value) {
    auto lock = std::unique_lock{mutex_};
    records_.insert_or_assign(key, std::move(value));
}

auto MemoryBackend::erase(const std::string& key) -> bool {
    auto lock = std::unique_lock{mutex_};
    return records_.erase(key) > 0;
}

auto MemoryBackend::list(std::string_view prefix) const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto keys = std::vector<std::string>{};
    for (auto it = records_.lower_bound(prefix);
         it != records_.end() && it->first.starts_with(prefix); ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

auto MemoryBackend::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return records_.size();
}

auto MemoryBackend::stored_bytes() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    auto total = std::size_t{0};
    for (const auto& [key, value] : records_) total += value.size();
    return total;
}

}  // namespace jsonverse_cpp
