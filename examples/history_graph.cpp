// history_graph: persist a document's history through a custom Backend and
// print its version graph and stored records.
//
// Build: cmake --build build
// Run:   ./build/examples/history_graph

#include <jsonverse-cpp/jsonverse.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jv = jsonverse_cpp;

// A backend that reports every write before handing it to memory.
class TracingBackend final : public jv::Backend {
public:
    auto get(const std::string& key) const -> std::optional<jv::Bytes> override {
        return inner_.get(key);
    }
    void put(const std::string& key, jv::Bytes value) override {
        std::printf("  put %-40s %6zu bytes\n", key.c_str(), value.size());
        inner_.put(key, std::move(value));
    }
    auto erase(const std::string& key) -> bool override {
        std::printf("  erase %s\n", key.c_str());
        return inner_.erase(key);
    }
    auto list(std::string_view prefix) const -> std::vector<std::string> override {
        return inner_.list(prefix);
    }

private:
    jv::MemoryBackend inner_;
};

int main() {
    static auto console = plog::ConsoleAppender<plog::TxtFormatter>{};
    plog::init(plog::warning, &console);

    auto options = jv::RepositoryOptions{};
    options.identity_key = "sku";
    options.ignored_properties = {"$hashKey"};
    auto repo = jv::Repository{std::make_shared<TracingBackend>(), options};

    const auto doc = repo.documents().create_document("inventory");
    auto& editor = repo.coordinator();

    editor.edit_text(doc.id, R"({"stock": [
        {"sku": "A1", "qty": 3, "$hashKey": "x1"},
        {"sku": "B2", "qty": 0, "$hashKey": "x2"}
    ]})");
    const auto v1 = editor.save(doc.id);

    editor.edit_text(doc.id, R"({"stock": [
        {"sku": "B2", "qty": 5, "$hashKey": "y2"},
        {"sku": "A1", "qty": 3, "$hashKey": "y1"}
    ]})");
    editor.autosave_tick(doc.id);

    repo.merger().merge(doc.id, v1.id);

    std::printf("\ngraph (newest first):\n");
    const auto g = repo.versions().graph(doc.id);
    for (std::size_t i = 0; i < g.nodes.size(); ++i) {
        const auto& n = g.nodes[i];
        std::printf("  [%zu] %s%s%s", i, n.id.value.c_str(),
                    n.is_head ? " HEAD" : "", n.is_auto_save ? " auto" : "");
        if (n.parent) std::printf("  parent=[%zu]", *n.parent);
        if (n.merged_from) std::printf("  merged_from=[%zu]", *n.merged_from);
        std::printf("\n");
    }

    std::printf("\nhead version record:\n%s\n",
                jv::Json(*repo.versions().head(doc.id)).dump(2).c_str());
    return 0;
}
