/// @file options.hpp
/// @brief RepositoryOptions: the single configuration object.

#pragma once

#include <jsonverse-cpp/diff.hpp>
#include <jsonverse-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonverse_cpp {

/// What an autosave tick does with a dirty document.
enum class AutosavePolicy : std::uint8_t {
    append,      ///< Always append a new autosave version.
    amend_head,  ///< Rewrite the head in place when it is itself an autosave.
};

/// Convert an AutosavePolicy to its configuration name.
constexpr auto to_string_view(AutosavePolicy policy) noexcept -> std::string_view {
    switch (policy) {
        case AutosavePolicy::append:     return "append";
        case AutosavePolicy::amend_head: return "amend_head";
    }
    return "unknown";
}

/// Parse a configuration name; nullopt if unknown.
auto parse_autosave_policy(std::string_view name) -> std::optional<AutosavePolicy>;

/// Configuration shared by every component of a Repository.
///
/// @code
/// auto opts = RepositoryOptions{};
/// opts.autosave_interval = std::chrono::seconds{2};
/// opts.ignored_properties = {"$hashKey"};
/// auto repo = Repository{opts};
/// @endcode
struct RepositoryOptions {
    std::chrono::milliseconds autosave_interval{5000};   ///< AutosaveTimer period.
    AutosavePolicy autosave_policy{AutosavePolicy::append};
    std::string identity_key{"id"};                      ///< Field matching list elements.
    std::vector<std::string> ignored_properties;         ///< Map keys the diff skips.
    std::size_t compression_threshold{256};              ///< Records at least this large are deflated.
    bool parallel_verify{true};                          ///< verify_history on the global executor.
    Clock clock;                                         ///< Empty = system clock.
    IdGenerator id_generator;                            ///< Empty = random_id.

    /// Diff settings derived from identity_key and ignored_properties.
    auto diff_options() const -> DiffOptions;

    /// The configured clock, or the system clock.
    auto current_time() const -> Timestamp;

    /// A fresh id from the configured generator, or random_id().
    auto next_id() const -> std::string;
};

/// Read options from a JSON configuration object. Missing keys keep
/// their defaults; clock and id generator are never configured this way.
/// @throws Exception(invalid_content) on a wrong type or unknown policy.
auto options_from_json(const nlohmann::json& j) -> RepositoryOptions;

/// Render the configurable subset of the options.
auto options_to_json(const RepositoryOptions& options) -> nlohmann::json;

/// Read options from a JSON file.
/// @throws Exception(storage_error) if the file cannot be read.
/// @throws Exception(invalid_content) if it is not a valid configuration.
auto options_from_file(const std::filesystem::path& path) -> RepositoryOptions;

}  // namespace jsonverse_cpp
