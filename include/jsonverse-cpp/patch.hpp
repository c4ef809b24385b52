/// @file patch.hpp
/// @brief Patch types: a structural edit script between two Trees.

#pragma once

#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonverse_cpp {

/// A value was added at a map key or inserted at a list index.
struct AddOp {
    Path path;   ///< Where the value lands.
    Tree value;  ///< The added value.
    auto operator==(const AddOp&) const -> bool = default;
};

/// A map entry or list element was removed.
struct RemoveOp {
    Path path;       ///< The removed location.
    Tree old_value;  ///< The value that must be present before removal.
    auto operator==(const RemoveOp&) const -> bool = default;
};

/// The value at a path was replaced wholesale.
struct ReplaceOp {
    Path path;       ///< The replaced location (empty = the root).
    Tree old_value;  ///< The value that must be present before replacement.
    Tree new_value;  ///< The replacement.
    auto operator==(const ReplaceOp&) const -> bool = default;
};

/// A list element was moved within its list.
///
/// Applied as: remove the element at `from`, then insert it at `to`
/// in the shortened list. Both paths share the same parent.
struct MoveOp {
    Path from;  ///< The element's index before the move.
    Path to;    ///< The element's index after the move.
    auto operator==(const MoveOp&) const -> bool = default;
};

/// The set of possible patch operations.
using PatchOp = std::variant<
    AddOp,
    RemoveOp,
    ReplaceOp,
    MoveOp
>;

/// Tag for the alternatives of PatchOp.
enum class OpKind : std::uint8_t {
    add,
    remove,
    replace,
    move,
};

/// Convert an OpKind to its wire name.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add:     return "add";
        case OpKind::remove:  return "remove";
        case OpKind::replace: return "replace";
        case OpKind::move:    return "move";
    }
    return "unknown";
}

/// The kind of a single operation.
auto kind_of(const PatchOp& op) -> OpKind;

/// An ordered edit script. Operations apply in sequence, each against the
/// tree produced by the ones before it.
struct Patch {
    std::vector<PatchOp> ops;  ///< The operations, in application order.

    auto empty() const -> bool { return ops.empty(); }
    auto size() const -> std::size_t { return ops.size(); }

    /// Number of operations of the given kind.
    auto count(OpKind kind) const -> std::size_t;

    auto operator==(const Patch&) const -> bool = default;
};

/// Apply a patch, returning the resulting tree. The input is left untouched.
///
/// Every Remove, Replace and Move checks its precondition (the path exists
/// and holds the recorded old value) before mutating.
/// @throws Exception(patch_conflict) if any operation does not fit.
auto apply(const Tree& tree, const Patch& patch) -> Tree;

/// Build the patch that undoes `patch`: operations in reverse order,
/// Add/Remove swapped, Replace old/new swapped, Move direction reversed.
/// For any tree t on which apply(t, p) succeeds:
/// apply(apply(t, p), invert(p)) == t.
auto invert(const Patch& patch) -> Patch;

}  // namespace jsonverse_cpp
