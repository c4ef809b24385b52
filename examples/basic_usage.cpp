// basic_usage: create a document, save a few versions, inspect the history
// and bring an old version back with a merge.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonverse-cpp/jsonverse.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdio>

namespace jv = jsonverse_cpp;

int main() {
    static auto console = plog::ConsoleAppender<plog::TxtFormatter>{};
    plog::init(plog::info, &console);

    auto repo = jv::Repository{};
    auto& editor = repo.coordinator();

    // -- Create and edit ------------------------------------------------------
    const auto doc = repo.documents().create_document("settings", jv::Tree::map({
        {"theme", "dark"},
        {"fontSize", 12},
    }));

    const auto v1 = editor.save(doc.id);

    editor.edit(doc.id, jv::Tree::map({
        {"theme", "light"},
        {"fontSize", 12},
        {"plugins", jv::Tree::list({jv::Tree::map({{"id", "git"}, {"enabled", true}})})},
    }));
    const auto v2 = editor.save(doc.id);

    // -- Text edits go through the parser -------------------------------------
    const auto ok = editor.edit_text(doc.id, R"({"theme": "light", "fontSize": 14})");
    std::printf("text edit accepted: %s, dirty: %s\n", ok ? "yes" : "no",
                editor.is_dirty(doc.id) ? "yes" : "no");
    const auto v3 = editor.save(doc.id);

    // -- History --------------------------------------------------------------
    for (const auto& v : repo.versions().list_versions(doc.id)) {
        std::printf("%s  seq %llu  %s  %zu ops\n",
                    jv::to_rfc3339(v.created_at).c_str(),
                    static_cast<unsigned long long>(v.sequence),
                    v.id.value.c_str(),
                    v.patch ? v.patch->size() : std::size_t{0});
    }

    std::printf("v2 -> v3 patch: %s\n",
                jv::Json(*v3.patch).dump().c_str());

    // -- Merge: v1 becomes the head again -------------------------------------
    const auto v4 = repo.merger().merge(doc.id, v1.id);
    std::printf("head after merge: %s (merged from %s, parent %s)\n",
                jv::serialize(v4.content, -1).c_str(),
                v4.merged_from_id->value.c_str(),
                v4.parent_id->value.c_str());

    // Any version can be rebuilt from the head by walking patches backwards.
    std::printf("v2 reconstructed: %s\n",
                jv::serialize(repo.versions().reconstruct(doc.id, v2.id), -1).c_str());

    return 0;
}
