#pragma once

// Shared fixtures for the test suites: deterministic ids and clocks,
// and a matcher for the ErrorKind an operation throws.

#include <jsonverse-cpp/backend.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/types.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonverse_cpp::testing {

// Run `f` and report the ErrorKind of the Exception it throws, if any.
template <typename F>
auto thrown_kind(F&& f) -> std::optional<ErrorKind> {
    try {
        f();
    } catch (const Exception& e) {
        return e.kind();
    }
    return std::nullopt;
}

// Options with ids "id-1", "id-2", ... and a clock that advances by one
// second per reading, starting at 2024-01-01T00:00:00Z.
inline auto deterministic_options(RepositoryOptions options = {}) -> RepositoryOptions {
    auto counter = std::make_shared<std::atomic<std::uint64_t>>(0);
    options.id_generator = [counter] { return "id-" + std::to_string(++*counter); };

    auto ticks = std::make_shared<std::atomic<std::int64_t>>(0);
    options.clock = [ticks] {
        return Timestamp{1704067200000 + 1000 * (*ticks)++};
    };
    return options;
}

// Options whose clock never moves, so ordering falls back to sequence.
inline auto frozen_clock_options(RepositoryOptions options = {}) -> RepositoryOptions {
    options = deterministic_options(std::move(options));
    options.clock = [] { return Timestamp{1704067200000}; };
    return options;
}

// Backend that forwards to an in-memory store. Tests override put() to
// inject failures or block writers.
class ForwardingBackend : public Backend {
public:
    auto get(const std::string& key) const -> std::optional<Bytes> override {
        return inner_.get(key);
    }
    void put(const std::string& key, Bytes value) override { inner_.put(key, std::move(value)); }
    auto erase(const std::string& key) -> bool override { return inner_.erase(key); }
    auto list(std::string_view prefix) const -> std::vector<std::string> override {
        return inner_.list(prefix);
    }

private:
    MemoryBackend inner_;
};

}  // namespace jsonverse_cpp::testing
