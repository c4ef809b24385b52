#include <jsonverse-cpp/json.hpp>
#include <jsonverse-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonverse_cpp {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

// Works for both nlohmann::json (sorted keys) and ordered_json.
template <typename BasicJson>
auto to_basic_json(const Tree& tree) -> BasicJson {
    return std::visit(overload{
        [](Null) -> BasicJson { return nullptr; },
        [](bool b) -> BasicJson { return b; },
        [](std::int64_t i) -> BasicJson { return i; },
        [](std::uint64_t u) -> BasicJson { return u; },
        [](double d) -> BasicJson { return d; },
        [](const std::string& s) -> BasicJson { return s; },
        [](const List& items) -> BasicJson {
            auto arr = BasicJson::array();
            for (const auto& item : items) arr.push_back(to_basic_json<BasicJson>(item));
            return arr;
        },
        [](const Map& entries) -> BasicJson {
            auto obj = BasicJson::object();
            for (const auto& entry : entries) {
                obj[entry.key] = to_basic_json<BasicJson>(entry.value);
            }
            return obj;
        },
    }, tree.storage());
}

[[noreturn]] void invalid(std::string message) {
    throw Exception{ErrorKind::invalid_content, std::move(message)};
}

template <typename T>
auto optional_id(const Json& j, const char* key) -> std::optional<T> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

template <typename T>
void put_optional(Json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

}  // anonymous namespace

// =============================================================================
// Text <-> Tree
// =============================================================================

auto tree_from_json(const Json& j) -> Tree {
    switch (j.type()) {
        case Json::value_t::null:
            return Tree{};
        case Json::value_t::boolean:
            return Tree{j.get<bool>()};
        case Json::value_t::number_integer:
            return Tree{j.get<std::int64_t>()};
        case Json::value_t::number_unsigned:
            return Tree{j.get<std::uint64_t>()};
        case Json::value_t::number_float:
            return Tree{j.get<double>()};
        case Json::value_t::string:
            return Tree{j.get<std::string>()};
        case Json::value_t::array: {
            auto items = List{};
            items.reserve(j.size());
            for (const auto& item : j) items.push_back(tree_from_json(item));
            return Tree{std::move(items)};
        }
        case Json::value_t::object: {
            auto entries = Map{};
            for (const auto& [key, value] : j.items()) {
                entries.insert(key, tree_from_json(value));
            }
            return Tree{std::move(entries)};
        }
        case Json::value_t::binary:
            invalid("binary values are not JSON content");
        case Json::value_t::discarded:
            break;
    }
    invalid("discarded JSON value");
}

auto tree_to_json(const Tree& tree) -> Json {
    return to_basic_json<Json>(tree);
}

auto parse(std::string_view text) -> Tree {
    // ordered_json silently keeps the first of two equal keys; track the
    // keys of every open object so duplicates surface as errors instead.
    auto open_objects = std::vector<std::set<std::string>>{};
    auto reject_duplicates = [&](int /*depth*/, Json::parse_event_t event, Json& parsed) {
        switch (event) {
            case Json::parse_event_t::object_start:
                open_objects.emplace_back();
                break;
            case Json::parse_event_t::object_end:
                if (!open_objects.empty()) open_objects.pop_back();
                break;
            case Json::parse_event_t::key: {
                auto key = parsed.get<std::string>();
                if (!open_objects.empty() && !open_objects.back().insert(key).second) {
                    invalid("duplicate key \"" + key + "\"");
                }
                break;
            }
            case Json::parse_event_t::array_start:
            case Json::parse_event_t::array_end:
            case Json::parse_event_t::value:
                break;
        }
        return true;
    };

    try {
        return tree_from_json(Json::parse(text.begin(), text.end(), reject_duplicates));
    } catch (const Json::parse_error& e) {
        invalid(e.what());
    }
}

auto serialize(const Tree& tree, int indent) -> std::string {
    try {
        return tree_to_json(tree).dump(indent);
    } catch (const Json::type_error& e) {
        invalid(e.what());
    }
}

auto canonical_string(const Tree& tree) -> std::string {
    return to_basic_json<nlohmann::json>(tree).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(Json& j, const Tree& tree) {
    j = tree_to_json(tree);
}

void from_json(const Json& j, Tree& tree) {
    tree = tree_from_json(j);
}

void to_json(Json& j, const DocumentId& id) {
    j = id.value;
}

void from_json(const Json& j, DocumentId& id) {
    id = DocumentId{j.get<std::string>()};
}

void to_json(Json& j, const VersionId& id) {
    j = id.value;
}

void from_json(const Json& j, VersionId& id) {
    id = VersionId{j.get<std::string>()};
}

void to_json(Json& j, const Timestamp& ts) {
    j = to_rfc3339(ts);
}

void from_json(const Json& j, Timestamp& ts) {
    ts = parse_rfc3339(j.get<std::string>());
}

// -- Paths and patches --------------------------------------------------------

auto path_to_json(const Path& path) -> Json {
    auto arr = Json::array();
    for (const auto& element : path) {
        std::visit(overload{
            [&](const std::string& key) { arr.push_back(key); },
            [&](std::size_t index) { arr.push_back(index); },
        }, element);
    }
    return arr;
}

auto path_from_json(const Json& j) -> Path {
    if (!j.is_array()) invalid("path must be an array");
    auto path = Path{};
    path.reserve(j.size());
    for (const auto& element : j) {
        if (element.is_string()) {
            path.emplace_back(element.get<std::string>());
        } else if (element.is_number_unsigned() ||
                   (element.is_number_integer() && element.get<std::int64_t>() >= 0)) {
            path.emplace_back(element.get<std::size_t>());
        } else {
            invalid("path elements must be strings or non-negative integers");
        }
    }
    return path;
}

void to_json(Json& j, const PatchOp& op) {
    j = Json::object();
    j["op"] = std::string{to_string_view(kind_of(op))};
    std::visit(overload{
        [&](const AddOp& o) {
            j["path"] = path_to_json(o.path);
            j["value"] = o.value;
        },
        [&](const RemoveOp& o) {
            j["path"] = path_to_json(o.path);
            j["oldValue"] = o.old_value;
        },
        [&](const ReplaceOp& o) {
            j["path"] = path_to_json(o.path);
            j["oldValue"] = o.old_value;
            j["value"] = o.new_value;
        },
        [&](const MoveOp& o) {
            j["from"] = path_to_json(o.from);
            j["path"] = path_to_json(o.to);
        },
    }, op);
}

void from_json(const Json& j, PatchOp& op) {
    const auto name = j.at("op").get<std::string>();
    if (name == to_string_view(OpKind::add)) {
        op = AddOp{path_from_json(j.at("path")), tree_from_json(j.at("value"))};
    } else if (name == to_string_view(OpKind::remove)) {
        op = RemoveOp{path_from_json(j.at("path")), tree_from_json(j.at("oldValue"))};
    } else if (name == to_string_view(OpKind::replace)) {
        op = ReplaceOp{path_from_json(j.at("path")),
                       tree_from_json(j.at("oldValue")),
                       tree_from_json(j.at("value"))};
    } else if (name == to_string_view(OpKind::move)) {
        op = MoveOp{path_from_json(j.at("from")), path_from_json(j.at("path"))};
    } else {
        invalid("unknown patch op \"" + name + "\"");
    }
}

void to_json(Json& j, const Patch& patch) {
    j = Json::array();
    for (const auto& op : patch.ops) j.push_back(op);
}

void from_json(const Json& j, Patch& patch) {
    if (!j.is_array()) invalid("patch must be an array");
    patch.ops.clear();
    patch.ops.reserve(j.size());
    for (const auto& op : j) patch.ops.push_back(op.get<PatchOp>());
}

// -- Records ------------------------------------------------------------------

void to_json(Json& j, const Version& version) {
    j = Json::object();
    j["id"] = version.id;
    j["documentId"] = version.document_id;
    j["content"] = version.content;
    put_optional(j, "parentId", version.parent_id);
    put_optional(j, "mergedFromId", version.merged_from_id);
    j["createdAt"] = version.created_at;
    j["isAutoSave"] = version.is_auto_save;
    put_optional(j, "patch", version.patch);
    j["sequence"] = version.sequence;
}

void from_json(const Json& j, Version& version) {
    version.id = j.at("id").get<VersionId>();
    version.document_id = j.at("documentId").get<DocumentId>();
    version.content = tree_from_json(j.at("content"));
    version.parent_id = optional_id<VersionId>(j, "parentId");
    version.merged_from_id = optional_id<VersionId>(j, "mergedFromId");
    version.created_at = j.at("createdAt").get<Timestamp>();
    version.is_auto_save = j.value("isAutoSave", false);
    version.patch = optional_id<Patch>(j, "patch");
    version.sequence = j.value("sequence", std::uint64_t{0});
}

void to_json(Json& j, const Document& document) {
    j = Json::object();
    j["id"] = document.id;
    j["name"] = document.name;
    j["content"] = document.content;
    j["createdAt"] = document.created_at;
    put_optional(j, "headVersionId", document.head_version_id);
    j["versionCount"] = document.version_count;
}

void from_json(const Json& j, Document& document) {
    document.id = j.at("id").get<DocumentId>();
    document.name = j.at("name").get<std::string>();
    document.content = tree_from_json(j.at("content"));
    document.created_at = j.at("createdAt").get<Timestamp>();
    document.head_version_id = optional_id<VersionId>(j, "headVersionId");
    document.version_count = j.value("versionCount", std::uint64_t{0});
}

}  // namespace jsonverse_cpp
