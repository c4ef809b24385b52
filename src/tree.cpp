#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/error.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace jsonverse_cpp {

// -- Map ----------------------------------------------------------------------

Map::Map() = default;
Map::~Map() = default;
Map::Map(const Map&) = default;
Map::Map(Map&&) noexcept = default;
auto Map::operator=(const Map&) -> Map& = default;
auto Map::operator=(Map&&) noexcept -> Map& = default;

auto Map::size() const -> std::size_t { return entries_.size(); }

auto Map::empty() const -> bool { return entries_.empty(); }

auto Map::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Map::find(std::string_view key) const -> const Tree* {
    auto it = std::ranges::find_if(entries_, [&](const MapEntry& e) { return e.key == key; });
    return it != entries_.end() ? &it->value : nullptr;
}

auto Map::find(std::string_view key) -> Tree* {
    return const_cast<Tree*>(std::as_const(*this).find(key));
}

void Map::insert(std::string key, Tree value) {
    if (contains(key)) {
        throw Exception{ErrorKind::invalid_content, "duplicate map key \"" + key + "\""};
    }
    entries_.push_back(MapEntry{std::move(key), std::move(value)});
}

void Map::assign(std::string key, Tree value) {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.push_back(MapEntry{std::move(key), std::move(value)});
}

auto Map::erase(std::string_view key) -> bool {
    auto it = std::ranges::find_if(entries_, [&](const MapEntry& e) { return e.key == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Map::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    std::ranges::transform(entries_, std::back_inserter(result),
        [](const MapEntry& e) { return e.key; });
    return result;
}

auto Map::begin() const -> const_iterator { return entries_.data(); }

auto Map::end() const -> const_iterator { return entries_.data() + entries_.size(); }

auto Map::operator==(const Map& other) const -> bool {
    if (entries_.size() != other.entries_.size()) return false;
    return std::ranges::all_of(entries_, [&](const MapEntry& e) {
        const auto* theirs = other.find(e.key);
        return theirs && *theirs == e.value;
    });
}

// -- Tree ---------------------------------------------------------------------

Tree::Tree() : storage_{Null{}} {}
Tree::~Tree() = default;
Tree::Tree(const Tree&) = default;
Tree::Tree(Tree&&) noexcept = default;
auto Tree::operator=(const Tree&) -> Tree& = default;
auto Tree::operator=(Tree&&) noexcept -> Tree& = default;

Tree::Tree(Null) : storage_{Null{}} {}
Tree::Tree(std::nullptr_t) : storage_{Null{}} {}
Tree::Tree(bool b) : storage_{b} {}
Tree::Tree(double d) : storage_{d} {
    if (!std::isfinite(d)) {
        throw Exception{ErrorKind::invalid_content, "non-finite number is not valid JSON"};
    }
}
Tree::Tree(const char* s) : storage_{std::string{s}} {}
Tree::Tree(std::string s) : storage_{std::move(s)} {}
Tree::Tree(std::string_view s) : storage_{std::string{s}} {}
Tree::Tree(List items) : storage_{std::move(items)} {}
Tree::Tree(Map entries) : storage_{std::move(entries)} {}

auto Tree::list(std::initializer_list<Tree> items) -> Tree {
    return Tree{List(items)};
}

auto Tree::map(std::initializer_list<std::pair<std::string_view, Tree>> entries) -> Tree {
    auto result = Map{};
    for (const auto& [key, value] : entries) {
        result.insert(std::string{key}, value);
    }
    return Tree{std::move(result)};
}

auto Tree::kind() const -> Kind {
    return std::visit(overload{
        [](Null) { return Kind::null; },
        [](bool) { return Kind::boolean; },
        [](std::int64_t) { return Kind::number; },
        [](std::uint64_t) { return Kind::number; },
        [](double) { return Kind::number; },
        [](const std::string&) { return Kind::string; },
        [](const List&) { return Kind::list; },
        [](const Map&) { return Kind::map; },
    }, storage_);
}

auto Tree::size() const -> std::size_t {
    if (const auto* l = get_if<List>()) return l->size();
    if (const auto* m = get_if<Map>()) return m->size();
    return 0;
}

namespace {

[[noreturn]] void kind_mismatch(Kind expected, Kind found) {
    throw Exception{ErrorKind::invalid_content,
        "expected " + std::string{to_string_view(expected)} +
        ", found " + std::string{to_string_view(found)}};
}

}  // anonymous namespace

auto Tree::as_bool() const -> bool {
    if (const auto* b = get_if<bool>()) return *b;
    kind_mismatch(Kind::boolean, kind());
}

auto Tree::as_double() const -> double {
    if (const auto* i = get_if<std::int64_t>()) return static_cast<double>(*i);
    if (const auto* u = get_if<std::uint64_t>()) return static_cast<double>(*u);
    if (const auto* d = get_if<double>()) return *d;
    kind_mismatch(Kind::number, kind());
}

auto Tree::as_int() const -> std::int64_t {
    if (const auto* i = get_if<std::int64_t>()) return *i;
    kind_mismatch(Kind::number, kind());
}

auto Tree::as_string() const -> const std::string& {
    if (const auto* s = get_if<std::string>()) return *s;
    kind_mismatch(Kind::string, kind());
}

auto Tree::as_list() const -> const List& {
    if (const auto* l = get_if<List>()) return *l;
    kind_mismatch(Kind::list, kind());
}

auto Tree::as_list() -> List& {
    if (auto* l = get_if<List>()) return *l;
    kind_mismatch(Kind::list, kind());
}

auto Tree::as_map() const -> const Map& {
    if (const auto* m = get_if<Map>()) return *m;
    kind_mismatch(Kind::map, kind());
}

auto Tree::as_map() -> Map& {
    if (auto* m = get_if<Map>()) return *m;
    kind_mismatch(Kind::map, kind());
}

auto Tree::find(const Path& path) const -> const Tree* {
    const auto* current = this;
    for (const auto& step : path) {
        current = std::visit(overload{
            [&](const std::string& key) -> const Tree* {
                const auto* m = current->get_if<Map>();
                return m ? m->find(key) : nullptr;
            },
            [&](std::size_t index) -> const Tree* {
                const auto* l = current->get_if<List>();
                return (l && index < l->size()) ? &(*l)[index] : nullptr;
            },
        }, step);
        if (!current) return nullptr;
    }
    return current;
}

auto Tree::find(const Path& path) -> Tree* {
    return const_cast<Tree*>(std::as_const(*this).find(path));
}

auto Tree::operator==(const Tree& other) const -> bool {
    if (storage_.index() != other.storage_.index()) return false;
    return std::visit([&](const auto& lhs) {
        using T = std::decay_t<decltype(lhs)>;
        return lhs == std::get<T>(other.storage_);
    }, storage_);
}

// -- Identity hashing ---------------------------------------------------------

auto identity_key_hash(std::string key) -> IdentityHash {
    return [key = std::move(key)](const Tree& tree) -> std::string {
        if (const auto* m = tree.get_if<Map>()) {
            if (const auto* id = m->find(key); id && !id->is_null()) {
                return canonical_string(*id);
            }
        }
        return canonical_string(tree);
    };
}

auto default_identity_hash(const Tree& tree) -> std::string {
    if (const auto* m = tree.get_if<Map>()) {
        if (const auto* id = m->find("id"); id && !id->is_null()) {
            return canonical_string(*id);
        }
    }
    return canonical_string(tree);
}

auto operator<<(std::ostream& os, const Tree& tree) -> std::ostream& {
    return os << canonical_string(tree);
}

}  // namespace jsonverse_cpp
