/// @file tree.hpp
/// @brief Tree: the canonical in-memory JSON-shaped value, plus identity hashing.

#pragma once

#include <jsonverse-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonverse_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The six shapes a Tree can take. All numeric representations are `number`.
enum class Kind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    list,
    map,
};

/// Convert a Kind to its string representation.
constexpr auto to_string_view(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::null:    return "null";
        case Kind::boolean: return "boolean";
        case Kind::number:  return "number";
        case Kind::string:  return "string";
        case Kind::list:    return "list";
        case Kind::map:     return "map";
    }
    return "unknown";
}

class Tree;
struct MapEntry;

/// An ordered sequence of Trees.
using List = std::vector<Tree>;

/// An insertion-ordered mapping from unique string keys to Trees.
///
/// Lookup is linear; maps in edited documents are small. Equality
/// ignores key order, everything else (iteration, serialization)
/// follows insertion order.
class Map {
public:
    using const_iterator = const MapEntry*;

    Map();
    ~Map();
    Map(const Map&);
    Map(Map&&) noexcept;
    auto operator=(const Map&) -> Map&;
    auto operator=(Map&&) noexcept -> Map&;

    auto size() const -> std::size_t;
    auto empty() const -> bool;

    auto contains(std::string_view key) const -> bool;

    /// Get the value at a key, or nullptr.
    auto find(std::string_view key) const -> const Tree*;
    auto find(std::string_view key) -> Tree*;

    /// Append a new key.
    /// @throws Exception(invalid_content) if the key already exists.
    void insert(std::string key, Tree value);

    /// Overwrite the value at a key in place, or append the key if absent.
    void assign(std::string key, Tree value);

    /// Remove a key. Returns false if it was not present.
    auto erase(std::string_view key) -> bool;

    /// All keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    auto operator==(const Map& other) const -> bool;

private:
    std::vector<MapEntry> entries_;
};

/// A JSON-shaped value: null, bool, number, string, list or map.
///
/// Trees are plain values: copying a Tree deep-copies it, so snapshots
/// held by different versions never share structure.
///
/// @code
/// auto doc = Tree::map({
///     {"name", "Example"},
///     {"items", Tree::list({Tree::map({{"id", 1}, {"label", "one"}})})},
/// });
/// auto label = doc.find(Path{"items", std::size_t{0}, "label"});
/// @endcode
class Tree {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        List,
        Map
    >;

    /// Construct a null Tree.
    Tree();
    ~Tree();
    Tree(const Tree&);
    Tree(Tree&&) noexcept;
    auto operator=(const Tree&) -> Tree&;
    auto operator=(Tree&&) noexcept -> Tree&;

    Tree(Null);
    Tree(std::nullptr_t);
    Tree(bool b);
    /// @throws Exception(invalid_content) for NaN or infinity.
    Tree(double d);
    Tree(const char* s);
    Tree(std::string s);
    Tree(std::string_view s);
    Tree(List items);
    Tree(Map entries);

    /// Signed integers are stored as int64.
    template <typename T>
        requires (std::is_integral_v<T> && std::is_signed_v<T> && !std::is_same_v<T, bool>)
    Tree(T v) : storage_{static_cast<std::int64_t>(v)} {}

    /// Unsigned integers are stored as int64 when they fit, uint64 otherwise.
    template <typename T>
        requires (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>)
    Tree(T v) {
        if (static_cast<std::uint64_t>(v) <=
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            storage_ = static_cast<std::int64_t>(v);
        } else {
            storage_ = static_cast<std::uint64_t>(v);
        }
    }

    /// Build a list from its elements.
    static auto list(std::initializer_list<Tree> items) -> Tree;

    /// Build a map from key/value pairs in insertion order.
    /// @throws Exception(invalid_content) on a duplicate key.
    static auto map(std::initializer_list<std::pair<std::string_view, Tree>> entries) -> Tree;

    // -- Inspection -----------------------------------------------------------

    auto kind() const -> Kind;

    auto is_null() const -> bool { return kind() == Kind::null; }
    auto is_bool() const -> bool { return kind() == Kind::boolean; }
    auto is_number() const -> bool { return kind() == Kind::number; }
    auto is_string() const -> bool { return kind() == Kind::string; }
    auto is_list() const -> bool { return kind() == Kind::list; }
    auto is_map() const -> bool { return kind() == Kind::map; }

    /// Number of list elements or map entries; 0 for scalars.
    auto size() const -> std::size_t;

    /// Get a pointer to the stored alternative, or nullptr on mismatch.
    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&storage_); }

    template <typename T>
    auto get_if() -> T* { return std::get_if<T>(&storage_); }

    auto storage() const -> const Storage& { return storage_; }

    // -- Checked accessors (throw Exception(invalid_content) on mismatch) ----

    auto as_bool() const -> bool;
    auto as_double() const -> double;
    auto as_int() const -> std::int64_t;
    auto as_string() const -> const std::string&;
    auto as_list() const -> const List&;
    auto as_list() -> List&;
    auto as_map() const -> const Map&;
    auto as_map() -> Map&;

    // -- Navigation -----------------------------------------------------------

    /// Resolve a path from this node. Returns nullptr if any step is missing
    /// or does not fit the node it is applied to.
    auto find(const Path& path) const -> const Tree*;
    auto find(const Path& path) -> Tree*;

    /// Explicit deep copy (equivalent to copy construction).
    auto clone() const -> Tree { return *this; }

    /// Deep equality. Map key order is not significant; int64 and double
    /// alternatives never compare equal to each other.
    auto operator==(const Tree& other) const -> bool;

private:
    Storage storage_;
};

/// One key/value pair of a Map.
struct MapEntry {
    std::string key;
    Tree value;
};

/// Compact JSON rendering with map keys sorted. Equal Trees render equally.
auto canonical_string(const Tree& tree) -> std::string;

/// Prints the canonical rendering.
auto operator<<(std::ostream& os, const Tree& tree) -> std::ostream&;

// -- Identity hashing ---------------------------------------------------------

/// Maps a list element to the key used to match it across two lists.
using IdentityHash = std::function<std::string(const Tree&)>;

/// Identity of a map carrying a non-null "id" entry is that id; any other
/// value is identified by its canonical rendering.
auto default_identity_hash(const Tree& tree) -> std::string;

/// Same as default_identity_hash but keyed on a different field name.
auto identity_key_hash(std::string key) -> IdentityHash;

}  // namespace jsonverse_cpp
