#include <jsonverse-cpp/patch.hpp>
#include <jsonverse-cpp/error.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace jsonverse_cpp {

auto kind_of(const PatchOp& op) -> OpKind {
    return std::visit(overload{
        [](const AddOp&) { return OpKind::add; },
        [](const RemoveOp&) { return OpKind::remove; },
        [](const ReplaceOp&) { return OpKind::replace; },
        [](const MoveOp&) { return OpKind::move; },
    }, op);
}

auto Patch::count(OpKind kind) const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(ops,
        [kind](const PatchOp& op) { return kind_of(op) == kind; }));
}

namespace {

[[noreturn]] void conflict(std::string_view what, const Path& path) {
    throw Exception{ErrorKind::patch_conflict,
        std::string{what} + " at \"" + to_pointer(path) + "\""};
}

// Resolve the container holding the last step of `path`.
auto parent_of(Tree& root, const Path& path) -> Tree& {
    auto parent_path = Path(path.begin(), path.end() - 1);
    auto* parent = root.find(parent_path);
    if (!parent) conflict("missing parent", path);
    return *parent;
}

void apply_add(Tree& root, const AddOp& op) {
    if (op.path.empty()) conflict("cannot add at the root", op.path);
    auto& parent = parent_of(root, op.path);
    std::visit(overload{
        [&](const std::string& key) {
            auto* map = parent.get_if<Map>();
            if (!map) conflict("add of a key into a non-map", op.path);
            if (map->contains(key)) conflict("add of an existing key", op.path);
            map->insert(key, op.value);
        },
        [&](std::size_t index) {
            auto* list = parent.get_if<List>();
            if (!list) conflict("add of an element into a non-list", op.path);
            if (index > list->size()) conflict("add past the end of a list", op.path);
            list->insert(list->begin() + static_cast<std::ptrdiff_t>(index), op.value);
        },
    }, op.path.back());
}

void apply_remove(Tree& root, const RemoveOp& op) {
    if (op.path.empty()) conflict("cannot remove the root", op.path);
    const auto* current = root.find(op.path);
    if (!current) conflict("remove of a missing value", op.path);
    if (!(*current == op.old_value)) conflict("remove of an unexpected value", op.path);
    auto& parent = parent_of(root, op.path);
    std::visit(overload{
        [&](const std::string& key) { parent.as_map().erase(key); },
        [&](std::size_t index) {
            auto& list = parent.as_list();
            list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
        },
    }, op.path.back());
}

void apply_replace(Tree& root, const ReplaceOp& op) {
    auto* current = root.find(op.path);
    if (!current) conflict("replace of a missing value", op.path);
    if (!(*current == op.old_value)) conflict("replace of an unexpected value", op.path);
    *current = op.new_value;
}

void apply_move(Tree& root, const MoveOp& op) {
    if (op.from.empty() || op.to.empty()) conflict("cannot move the root", op.from);
    if (!std::equal(op.from.begin(), op.from.end() - 1, op.to.begin(), op.to.end() - 1)) {
        conflict("move across containers", op.from);
    }
    const auto* from_index = std::get_if<std::size_t>(&op.from.back());
    const auto* to_index = std::get_if<std::size_t>(&op.to.back());
    if (!from_index || !to_index) conflict("move of a non-list element", op.from);

    auto& parent = parent_of(root, op.from);
    auto* list = parent.get_if<List>();
    if (!list) conflict("move within a non-list", op.from);
    if (*from_index >= list->size()) conflict("move of a missing element", op.from);
    if (*to_index >= list->size()) conflict("move past the end of a list", op.to);

    auto element = std::move((*list)[*from_index]);
    list->erase(list->begin() + static_cast<std::ptrdiff_t>(*from_index));
    list->insert(list->begin() + static_cast<std::ptrdiff_t>(*to_index), std::move(element));
}

}  // anonymous namespace

auto apply(const Tree& tree, const Patch& patch) -> Tree {
    auto result = tree;
    for (const auto& op : patch.ops) {
        std::visit(overload{
            [&](const AddOp& o) { apply_add(result, o); },
            [&](const RemoveOp& o) { apply_remove(result, o); },
            [&](const ReplaceOp& o) { apply_replace(result, o); },
            [&](const MoveOp& o) { apply_move(result, o); },
        }, op);
    }
    return result;
}

auto invert(const Patch& patch) -> Patch {
    auto result = Patch{};
    result.ops.reserve(patch.ops.size());
    for (auto it = patch.ops.rbegin(); it != patch.ops.rend(); ++it) {
        result.ops.push_back(std::visit(overload{
            [](const AddOp& o) -> PatchOp { return RemoveOp{o.path, o.value}; },
            [](const RemoveOp& o) -> PatchOp { return AddOp{o.path, o.old_value}; },
            [](const ReplaceOp& o) -> PatchOp { return ReplaceOp{o.path, o.new_value, o.old_value}; },
            [](const MoveOp& o) -> PatchOp { return MoveOp{o.to, o.from}; },
        }, *it));
    }
    return result;
}

}  // namespace jsonverse_cpp
