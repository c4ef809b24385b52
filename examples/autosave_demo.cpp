// autosave_demo: a background timer autosaves an open document while an
// "editor" thread keeps typing; manual saves interleave with the ticks.
//
// Build: cmake --build build
// Run:   ./build/examples/autosave_demo

#include <jsonverse-cpp/jsonverse.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

namespace jv = jsonverse_cpp;
using namespace std::chrono_literals;

int main() {
    static auto console = plog::ConsoleAppender<plog::TxtFormatter>{};
    plog::init(plog::debug, &console);

    auto options = jv::RepositoryOptions{};
    options.autosave_interval = 50ms;
    options.autosave_policy = jv::AutosavePolicy::amend_head;
    auto repo = jv::Repository{options};

    const auto doc = repo.documents().create_document("draft");
    repo.coordinator().open(doc.id);
    repo.start_autosave();

    auto typist = std::jthread{[&] {
        auto text = std::string{};
        for (int i = 0; i < 40; ++i) {
            text += static_cast<char>('a' + i % 26);
            // Every tenth keystroke produces broken JSON; autosave skips it.
            if (i % 10 == 9) {
                repo.coordinator().edit_text(doc.id, R"({"body": ")" + text);
            } else {
                repo.coordinator().edit(doc.id, jv::Tree::map({{"body", text}}));
            }
            if (i % 15 == 14) repo.coordinator().save(doc.id);
            std::this_thread::sleep_for(10ms);
        }
        repo.coordinator().edit(doc.id, jv::Tree::map({{"body", text}}));
    }};
    typist.join();

    std::this_thread::sleep_for(120ms);
    repo.stop_autosave();

    auto manual = 0;
    auto autos = 0;
    for (const auto& v : repo.versions().list_versions(doc.id)) {
        (v.is_auto_save ? autos : manual) += 1;
    }
    std::printf("manual versions: %d, autosave versions: %d, dirty: %s\n",
                manual, autos, repo.coordinator().is_dirty(doc.id) ? "yes" : "no");

    const auto broken = repo.versions().verify_history(doc.id);
    std::printf("history verified: %s\n", broken.empty() ? "ok" : "FAILED");
    return broken.empty() ? 0 : 1;
}
