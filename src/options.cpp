#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/error.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace jsonverse_cpp {

auto parse_autosave_policy(std::string_view name) -> std::optional<AutosavePolicy> {
    for (auto policy : {AutosavePolicy::append, AutosavePolicy::amend_head}) {
        if (name == to_string_view(policy)) return policy;
    }
    return std::nullopt;
}

auto RepositoryOptions::diff_options() const -> DiffOptions {
    auto options = DiffOptions{};
    if (identity_key != "id") options.identity_hash = identity_key_hash(identity_key);
    options.ignored_properties = ignored_properties;
    return options;
}

auto RepositoryOptions::current_time() const -> Timestamp {
    return clock ? clock() : now();
}

auto RepositoryOptions::next_id() const -> std::string {
    return id_generator ? id_generator() : random_id();
}

auto options_from_json(const nlohmann::json& j) -> RepositoryOptions {
    if (!j.is_object()) {
        throw Exception{ErrorKind::invalid_content, "configuration must be a JSON object"};
    }

    auto options = RepositoryOptions{};
    try {
        if (auto it = j.find("autosaveIntervalMs"); it != j.end()) {
            const auto ms = it->get<std::int64_t>();
            if (ms <= 0) {
                throw Exception{ErrorKind::invalid_content, "autosaveIntervalMs must be positive"};
            }
            options.autosave_interval = std::chrono::milliseconds{ms};
        }
        if (auto it = j.find("autosavePolicy"); it != j.end()) {
            const auto name = it->get<std::string>();
            auto policy = parse_autosave_policy(name);
            if (!policy) {
                throw Exception{ErrorKind::invalid_content, "unknown autosave policy \"" + name + "\""};
            }
            options.autosave_policy = *policy;
        }
        if (auto it = j.find("identityKey"); it != j.end()) {
            options.identity_key = it->get<std::string>();
        }
        if (auto it = j.find("ignoredProperties"); it != j.end()) {
            options.ignored_properties = it->get<std::vector<std::string>>();
        }
        if (auto it = j.find("compressionThreshold"); it != j.end()) {
            options.compression_threshold = it->get<std::size_t>();
        }
        if (auto it = j.find("parallelVerify"); it != j.end()) {
            options.parallel_verify = it->get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::invalid_content, e.what()};
    }
    return options;
}

auto options_to_json(const RepositoryOptions& options) -> nlohmann::json {
    return nlohmann::json{
        {"autosaveIntervalMs", options.autosave_interval.count()},
        {"autosavePolicy", std::string{to_string_view(options.autosave_policy)}},
        {"identityKey", options.identity_key},
        {"ignoredProperties", options.ignored_properties},
        {"compressionThreshold", options.compression_threshold},
        {"parallelVerify", options.parallel_verify},
    };
}

auto options_from_file(const std::filesystem::path& path) -> RepositoryOptions {
    auto in = std::ifstream{path};
    if (!in) {
        throw Exception{ErrorKind::storage_error, "cannot open " + path.string()};
    }
    auto buffer = std::stringstream{};
    buffer << in.rdbuf();

    auto j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::invalid_content, path.string() + " is not valid JSON"};
    }
    return options_from_json(j);
}

}  // namespace jsonverse_cpp
