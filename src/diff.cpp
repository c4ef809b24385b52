#include <jsonverse-cpp/diff.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsonverse_cpp {

namespace {

// Which old element (if any) each new element was paired with, and
// whether the pair belongs to the in-order alignment.
struct ListAlignment {
    std::vector<std::optional<std::size_t>> old_to_new;
    std::vector<std::optional<std::size_t>> new_to_old;
    std::vector<bool> stable;  // indexed by new position

    ListAlignment(std::size_t n, std::size_t m)
        : old_to_new(n), new_to_old(m), stable(m, false) {}

    void pair(std::size_t i, std::size_t j, bool in_order) {
        old_to_new[i] = j;
        new_to_old[j] = i;
        stable[j] = in_order;
    }
};

// Longest common subsequence of hashes over old[lo_old, hi_old) and
// new[lo_new, hi_new). Walks forward through the suffix table; on ties
// skips the old element first, so the result depends only on the input.
void align_in_order(const std::vector<std::string>& old_hashes,
                    const std::vector<std::string>& new_hashes,
                    std::size_t lo_old, std::size_t hi_old,
                    std::size_t lo_new, std::size_t hi_new,
                    ListAlignment& alignment) {
    const auto rows = hi_old - lo_old;
    const auto cols = hi_new - lo_new;
    if (rows == 0 || cols == 0) return;

    auto table = std::vector<std::uint32_t>((rows + 1) * (cols + 1), 0);
    auto at = [cols](std::size_t r, std::size_t c) { return r * (cols + 1) + c; };

    for (auto r = rows; r-- > 0;) {
        for (auto c = cols; c-- > 0;) {
            if (old_hashes[lo_old + r] == new_hashes[lo_new + c]) {
                table[at(r, c)] = table[at(r + 1, c + 1)] + 1;
            } else {
                table[at(r, c)] = std::max(table[at(r + 1, c)], table[at(r, c + 1)]);
            }
        }
    }

    auto r = std::size_t{0};
    auto c = std::size_t{0};
    while (r < rows && c < cols) {
        if (old_hashes[lo_old + r] == new_hashes[lo_new + c]) {
            alignment.pair(lo_old + r, lo_new + c, true);
            ++r;
            ++c;
        } else if (table[at(r + 1, c)] >= table[at(r, c + 1)]) {
            ++r;
        } else {
            ++c;
        }
    }
}

class Differ {
public:
    explicit Differ(const DiffOptions& options) : options_{options} {}

    void diff_value(const Tree& before, const Tree& after, Path& path) {
        if (before.kind() != after.kind()) {
            ops_.push_back(ReplaceOp{path, before, after});
            return;
        }
        switch (before.kind()) {
            case Kind::map:
                diff_map(before.as_map(), after.as_map(), path);
                return;
            case Kind::list:
                diff_list(before.as_list(), after.as_list(), path);
                return;
            case Kind::null:
            case Kind::boolean:
            case Kind::number:
            case Kind::string:
                if (!(before == after)) {
                    ops_.push_back(ReplaceOp{path, before, after});
                }
                return;
        }
    }

    auto take() -> Patch { return Patch{std::move(ops_)}; }

private:
    auto ignored(std::string_view key) const -> bool {
        const auto& ignored = options_.ignored_properties;
        return std::find(ignored.begin(), ignored.end(), key) != ignored.end();
    }

    // Ignored properties must not make otherwise identical elements differ.
    auto identity(const Tree& tree) const -> std::string {
        if (!options_.ignored_properties.empty()) {
            return hash(without_properties(tree, options_.ignored_properties));
        }
        return hash(tree);
    }

    auto hash(const Tree& tree) const -> std::string {
        return options_.identity_hash ? options_.identity_hash(tree)
                                      : default_identity_hash(tree);
    }

    void diff_map(const Map& before, const Map& after, Path& path) {
        for (const auto& entry : after) {
            if (ignored(entry.key)) continue;
            path.emplace_back(entry.key);
            if (const auto* old = before.find(entry.key)) {
                diff_value(*old, entry.value, path);
            } else {
                ops_.push_back(AddOp{path, entry.value});
            }
            path.pop_back();
        }
        for (const auto& entry : before) {
            if (ignored(entry.key) || after.contains(entry.key)) continue;
            path.emplace_back(entry.key);
            ops_.push_back(RemoveOp{path, entry.value});
            path.pop_back();
        }
    }

    void diff_list(const List& before, const List& after, Path& path) {
        const auto n = before.size();
        const auto m = after.size();

        auto old_hashes = std::vector<std::string>{};
        auto new_hashes = std::vector<std::string>{};
        old_hashes.reserve(n);
        new_hashes.reserve(m);
        for (const auto& t : before) old_hashes.push_back(identity(t));
        for (const auto& t : after) new_hashes.push_back(identity(t));

        auto alignment = ListAlignment{n, m};

        // Common prefix and suffix never need the quadratic table.
        auto prefix = std::size_t{0};
        while (prefix < n && prefix < m && old_hashes[prefix] == new_hashes[prefix]) {
            alignment.pair(prefix, prefix, true);
            ++prefix;
        }
        auto suffix = std::size_t{0};
        while (suffix < n - prefix && suffix < m - prefix &&
               old_hashes[n - 1 - suffix] == new_hashes[m - 1 - suffix]) {
            alignment.pair(n - 1 - suffix, m - 1 - suffix, true);
            ++suffix;
        }
        align_in_order(old_hashes, new_hashes, prefix, n - suffix, prefix, m - suffix, alignment);

        // Pair the leftovers by hash, first come first served: these moved.
        auto unpaired_old = std::unordered_map<std::string, std::deque<std::size_t>>{};
        for (std::size_t i = 0; i < n; ++i) {
            if (!alignment.old_to_new[i]) unpaired_old[old_hashes[i]].push_back(i);
        }
        for (std::size_t j = 0; j < m; ++j) {
            if (alignment.new_to_old[j]) continue;
            auto it = unpaired_old.find(new_hashes[j]);
            if (it == unpaired_old.end() || it->second.empty()) continue;
            alignment.pair(it->second.front(), j, false);
            it->second.pop_front();
        }

        emit_removes(before, alignment, path);
        emit_moves(alignment, path);
        emit_adds(after, alignment, path);

        for (std::size_t j = 0; j < m; ++j) {
            if (const auto i = alignment.new_to_old[j]) {
                path.emplace_back(j);
                diff_value(before[*i], after[j], path);
                path.pop_back();
            }
        }
    }

    void emit_removes(const List& before, const ListAlignment& alignment, Path& path) {
        for (auto i = before.size(); i-- > 0;) {
            if (alignment.old_to_new[i]) continue;
            path.emplace_back(i);
            ops_.push_back(RemoveOp{path, before[i]});
            path.pop_back();
        }
    }

    // After removals the list holds the kept elements in old order. Each
    // out-of-order element is moved once, right behind the element that
    // precedes it in the new order; in-order elements never move.
    void emit_moves(const ListAlignment& alignment, Path& path) {
        auto working = std::vector<std::size_t>{};  // new index of each kept element
        for (const auto& j : alignment.old_to_new) {
            if (j) working.push_back(*j);
        }
        auto target = working;
        std::ranges::sort(target);

        auto position_of = [&](std::size_t j) {
            return static_cast<std::size_t>(std::ranges::find(working, j) - working.begin());
        };

        for (std::size_t j = 0; j < alignment.new_to_old.size(); ++j) {
            if (!alignment.new_to_old[j] || alignment.stable[j]) continue;

            const auto from = position_of(j);
            const auto rank = static_cast<std::size_t>(std::ranges::lower_bound(target, j) - target.begin());
            auto to = std::size_t{0};
            if (rank > 0) {
                to = position_of(target[rank - 1]) + 1;
                if (from < to) --to;
            }
            if (from == to) continue;

            working.erase(working.begin() + static_cast<std::ptrdiff_t>(from));
            working.insert(working.begin() + static_cast<std::ptrdiff_t>(to), j);

            auto from_path = path;
            from_path.emplace_back(from);
            auto to_path = path;
            to_path.emplace_back(to);
            ops_.push_back(MoveOp{std::move(from_path), std::move(to_path)});
        }
    }

    void emit_adds(const List& after, const ListAlignment& alignment, Path& path) {
        for (std::size_t j = 0; j < after.size(); ++j) {
            if (alignment.new_to_old[j]) continue;
            path.emplace_back(j);
            ops_.push_back(AddOp{path, after[j]});
            path.pop_back();
        }
    }

    const DiffOptions& options_;
    std::vector<PatchOp> ops_;
};

}  // anonymous namespace

auto diff(const Tree& before, const Tree& after, const DiffOptions& options) -> Patch {
    auto differ = Differ{options};
    auto path = Path{};
    differ.diff_value(before, after, path);
    auto patch = differ.take();
    PLOGD << "diff produced " << patch.size() << " ops ("
          << patch.count(OpKind::add) << " add, "
          << patch.count(OpKind::remove) << " remove, "
          << patch.count(OpKind::replace) << " replace, "
          << patch.count(OpKind::move) << " move)";
    return patch;
}

auto without_properties(const Tree& tree, const std::vector<std::string>& properties) -> Tree {
    if (properties.empty()) return tree;
    if (const auto* items = tree.get_if<List>()) {
        auto stripped = List{};
        stripped.reserve(items->size());
        for (const auto& item : *items) stripped.push_back(without_properties(item, properties));
        return Tree{std::move(stripped)};
    }
    if (const auto* entries = tree.get_if<Map>()) {
        auto stripped = Map{};
        for (const auto& entry : *entries) {
            if (std::find(properties.begin(), properties.end(), entry.key) != properties.end()) continue;
            stripped.insert(entry.key, without_properties(entry.value, properties));
        }
        return Tree{std::move(stripped)};
    }
    return tree;
}

}  // namespace jsonverse_cpp
