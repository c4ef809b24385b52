// Helper to generate seed corpus files for the fuzz targets.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include "../src/storage/records.hpp"

#include <jsonverse-cpp/jsonverse.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace jv = jsonverse_cpp;

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static void write_seed(const std::string& path, const jv::Bytes& data) {
    write_seed(path, std::string_view{reinterpret_cast<const char*>(data.data()), data.size()});
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir + "/parse");
    fs::create_directories(dir + "/diff");
    fs::create_directories(dir + "/record");

    // -- parse ----------------------------------------------------------------
    write_seed(dir + "/parse/scalars.json", R"([null, true, -1, 18446744073709551615, 2.5, "s"])");
    write_seed(dir + "/parse/nested.json", R"({"a": {"b": [1, {"c": "é"}]}})");
    write_seed(dir + "/parse/duplicate.json", R"({"k": 1, "k": 2})");

    // -- diff -----------------------------------------------------------------
    const auto pair = [](std::string_view a, std::string_view b) {
        auto s = std::string{a};
        s.push_back('\0');
        s.append(b);
        return s;
    };
    write_seed(dir + "/diff/replace.bin", pair(R"({"a": 1})", R"({"a": 2})"));
    write_seed(dir + "/diff/reorder.bin",
               pair(R"([{"id": 1}, {"id": 2}, {"id": 3}])", R"([{"id": 3}, {"id": 1}, {"id": 2}])"));
    write_seed(dir + "/diff/kind_change.bin", pair(R"({"x": [1, 2]})", R"({"x": {"y": 1}})"));

    // -- record ---------------------------------------------------------------
    auto repo = jv::Repository{};
    const auto doc = repo.documents().create_document("seed");
    repo.coordinator().edit(doc.id, jv::Tree::map({{"a", 1}}));
    repo.coordinator().save(doc.id);
    repo.coordinator().edit(doc.id, jv::Tree::map({{"a", 2}, {"b", jv::Tree::list({1, 2, 3})}}));
    const auto v2 = repo.coordinator().save(doc.id);
    write_seed(dir + "/record/raw.bin", jv::storage::encode_record(v2, std::size_t{1} << 20));
    write_seed(dir + "/record/deflated.bin", jv::storage::encode_record(v2, 0));
    return 0;
}
