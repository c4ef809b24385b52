/// @file diff.hpp
/// @brief Structural diff between two Trees.

#pragma once

#include <jsonverse-cpp/patch.hpp>
#include <jsonverse-cpp/tree.hpp>

#include <string>
#include <vector>

namespace jsonverse_cpp {

/// Knobs for diff().
struct DiffOptions {
    /// Matches list elements across positions. Empty = default_identity_hash.
    IdentityHash identity_hash = default_identity_hash;
    /// Map keys that are invisible to the diff (e.g. "$hashKey").
    std::vector<std::string> ignored_properties;
};

/// Compute the edit script turning `before` into `after`.
///
/// Pure and deterministic. Maps are compared key by key (keys of `after`
/// in insertion order, then keys only in `before`). Lists are aligned by
/// identity hash: the longest in-order alignment stays put, other matched
/// elements emit Move, unmatched elements emit Remove / Add, and matched
/// pairs are diffed recursively. A change of kind at a path is a single
/// Replace. For every pair: apply(before, diff(before, after)) == after
/// (modulo ignored properties).
///
/// List operations are emitted in four phases per list so that indices
/// stay valid under sequential application: removes (descending index),
/// moves, adds (ascending index), then nested changes at final indices.
auto diff(const Tree& before, const Tree& after, const DiffOptions& options = {}) -> Patch;

/// Copy of `tree` with the named map keys removed at every depth. Two
/// trees the diff considers identical are equal after this.
auto without_properties(const Tree& tree, const std::vector<std::string>& properties) -> Tree;

}  // namespace jsonverse_cpp
