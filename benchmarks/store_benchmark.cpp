// jsonverse-cpp benchmarks: measures throughput of diff, patch and the stores.

#include <jsonverse-cpp/jsonverse.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using namespace jsonverse_cpp;

// A list of `n` records shaped like a typical document body.
static auto make_records(std::size_t n, std::uint64_t seed = 1) -> Tree {
    auto rng = std::mt19937_64{seed};
    auto items = List{};
    items.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        items.push_back(Tree::map({
            {"id", i},
            {"title", "item " + std::to_string(i)},
            {"score", static_cast<double>(rng() % 1000) / 10.0},
            {"tags", Tree::list({"a", "b"})},
        }));
    }
    return Tree::map({{"items", Tree{std::move(items)}}});
}

// Same records with every tenth changed and a block rotated to the front.
static auto edited(const Tree& base) -> Tree {
    auto copy = base;
    auto& items = copy.as_map().find("items")->as_list();
    for (std::size_t i = 0; i < items.size(); i += 10) {
        items[i].as_map().assign("title", Tree{"edited"});
    }
    if (items.size() > 4) {
        std::rotate(items.begin(), items.end() - 4, items.end());
    }
    return copy;
}

// =============================================================================
// Diff and patch
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto tree = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(diff(tree, tree));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical)->Range(10, 10000);

static void bm_diff_edited(benchmark::State& state) {
    const auto before = make_records(static_cast<std::size_t>(state.range(0)));
    const auto after = edited(before);
    for (auto _ : state) {
        benchmark::DoNotOptimize(diff(before, after));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_edited)->Range(10, 10000);

static void bm_apply(benchmark::State& state) {
    const auto before = make_records(static_cast<std::size_t>(state.range(0)));
    const auto patch = diff(before, edited(before));
    for (auto _ : state) {
        benchmark::DoNotOptimize(apply(before, patch));
    }
    state.counters["ops"] = static_cast<double>(patch.size());
}
BENCHMARK(bm_apply)->Range(10, 10000);

static void bm_parse_serialize(benchmark::State& state) {
    const auto text = serialize(make_records(static_cast<std::size_t>(state.range(0))), -1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(serialize(parse(text), -1));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_parse_serialize)->Range(10, 10000);

// =============================================================================
// Stores
// =============================================================================

static void bm_save(benchmark::State& state) {
    auto repo = Repository{};
    const auto doc = repo.documents().create_document("bench");
    auto content = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        content = edited(content);
        repo.coordinator().edit(doc.id, content);
        benchmark::DoNotOptimize(repo.coordinator().save(doc.id));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_save)->Range(10, 1000);

static void bm_list_versions(benchmark::State& state) {
    auto repo = Repository{};
    const auto doc = repo.documents().create_document("bench");
    auto content = make_records(50);
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        content = edited(content);
        repo.versions().create_version(doc.id, content, i % 2 == 0);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(repo.versions().list_versions(doc.id));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_list_versions)->Range(8, 512);

static void bm_verify_history(benchmark::State& state) {
    auto options = RepositoryOptions{};
    options.parallel_verify = state.range(1) != 0;
    auto repo = Repository{options};
    const auto doc = repo.documents().create_document("bench");
    auto content = make_records(200);
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        content = edited(content);
        repo.versions().create_version(doc.id, content, false);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(repo.versions().verify_history(doc.id));
    }
    state.SetLabel(options.parallel_verify ? "parallel" : "serial");
}
BENCHMARK(bm_verify_history)->Args({64, 0})->Args({64, 1})->Args({256, 0})->Args({256, 1});

BENCHMARK_MAIN();
