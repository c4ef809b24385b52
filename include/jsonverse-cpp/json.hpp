/// @file json.hpp
/// @brief nlohmann/json interoperability for jsonverse-cpp.
///
/// Provides text parsing and serialization of Trees and ADL
/// serialization (to_json/from_json) for every record the store persists.
/// Object key order is preserved, so the library works with
/// nlohmann::ordered_json throughout.

#pragma once

#include <jsonverse-cpp/document.hpp>
#include <jsonverse-cpp/patch.hpp>
#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>
#include <jsonverse-cpp/version.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jsonverse_cpp {

/// The JSON value type used for all interop.
using Json = nlohmann::ordered_json;

// =============================================================================
// Text <-> Tree
// =============================================================================

/// Parse JSON text into a Tree.
/// @throws Exception(invalid_content) on malformed text or a duplicate key
///         within one object.
auto parse(std::string_view text) -> Tree;

/// Serialize a Tree as JSON text. Map keys keep insertion order.
/// @param indent Spaces per nesting level; negative means compact.
/// @throws Exception(invalid_content) if a string is not valid UTF-8.
auto serialize(const Tree& tree, int indent = 2) -> std::string;

/// Convert a JSON value into a Tree. Objects must not repeat keys.
auto tree_from_json(const Json& j) -> Tree;

/// Convert a Tree into a JSON value.
auto tree_to_json(const Tree& tree) -> Json;

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Tree ---------------------------------------------------------------------

void to_json(Json& j, const Tree& tree);
void from_json(const Json& j, Tree& tree);

// -- Identity and time --------------------------------------------------------

void to_json(Json& j, const DocumentId& id);
void from_json(const Json& j, DocumentId& id);

void to_json(Json& j, const VersionId& id);
void from_json(const Json& j, VersionId& id);

/// Timestamps travel as RFC 3339 strings.
void to_json(Json& j, const Timestamp& ts);
void from_json(const Json& j, Timestamp& ts);

// -- Paths and patches --------------------------------------------------------

/// Paths travel as arrays of keys (strings) and indices (numbers), so a
/// key "0" and index 0 stay distinguishable.
auto path_to_json(const Path& path) -> Json;
auto path_from_json(const Json& j) -> Path;

/// {"op":"add","path":[...],"value":...}, {"op":"remove","path":[...],
/// "oldValue":...}, {"op":"replace","path":[...],"oldValue":...,"value":...},
/// {"op":"move","from":[...],"path":[...]}.
void to_json(Json& j, const PatchOp& op);
void from_json(const Json& j, PatchOp& op);

/// A patch is an array of operations.
void to_json(Json& j, const Patch& patch);
void from_json(const Json& j, Patch& patch);

// -- Records ------------------------------------------------------------------

void to_json(Json& j, const Version& version);
void from_json(const Json& j, Version& version);

void to_json(Json& j, const Document& document);
void from_json(const Json& j, Document& document);

}  // namespace jsonverse_cpp
