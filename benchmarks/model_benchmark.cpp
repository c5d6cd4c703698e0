// json-crdt-cpp benchmarks -- model editing, merging, diffing and storage.

#include <json-crdt-cpp/json-crdt.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace json_crdt_cpp;
using nlohmann::json;

namespace {

auto make_text_doc(std::size_t chars) -> Model {
    auto doc = Model{100};
    doc.edit([&](PatchBuilder& b) { b.root(b.json(std::string(chars, 'a'))); });
    return doc;
}

auto make_object_doc(int keys) -> Model {
    auto doc = Model{100};
    auto value = json::object();
    for (int i = 0; i < keys; ++i) value["key" + std::to_string(i)] = {{"n", i}, {"s", "text"}};
    doc.edit([&](PatchBuilder& b) { b.root(b.json(value)); });
    return doc;
}

}  // anonymous namespace

// =============================================================================
// Editing
// =============================================================================

static void bm_model_type_text(benchmark::State& state) {
    for (auto _ : state) {
        auto doc = make_text_doc(1);
        const auto str = doc.root();
        for (std::int64_t i = 0; i < state.range(0); ++i) {
            doc.edit([&](PatchBuilder& b) {
                const auto& node = std::get<StrNode>(*doc.node(str));
                b.ins_str(str, *node.find(node.size() - 1), "x");
            });
        }
        benchmark::DoNotOptimize(doc.view());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_model_type_text)->Range(16, 1024);

static void bm_model_view(benchmark::State& state) {
    const auto doc = make_object_doc(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto view = doc.view();
        benchmark::DoNotOptimize(view);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_model_view)->Range(8, 512);

// =============================================================================
// Merging
// =============================================================================

static void bm_model_merge_concurrent(benchmark::State& state) {
    const auto base = make_text_doc(16);
    const auto str = base.root();
    auto a = base.fork(200);
    auto patches = std::vector<Patch>{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        patches.push_back(a.edit([&](PatchBuilder& b) { b.ins_str(str, str, "y"); }));
    }

    for (auto _ : state) {
        auto b = base;
        for (const auto& p : patches) b.apply_patch(p);
        benchmark::DoNotOptimize(b.time());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_model_merge_concurrent)->Range(16, 1024);

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_one_key(benchmark::State& state) {
    const auto doc = make_object_doc(static_cast<int>(state.range(0)));
    auto dst = doc.view();
    dst["key0"]["s"] = "changed text";
    for (auto _ : state) {
        auto patch = JsonCrdtDiff{doc}.diff(dst);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_diff_one_key)->Range(8, 512);

// =============================================================================
// Storage
// =============================================================================

static void bm_model_to_binary(benchmark::State& state) {
    const auto doc = make_object_doc(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto bytes = doc.to_binary();
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_model_to_binary)->Range(8, 512);

static void bm_model_from_binary(benchmark::State& state) {
    const auto bytes = make_object_doc(static_cast<int>(state.range(0))).to_binary();
    for (auto _ : state) {
        auto doc = Model::from_binary(bytes);
        benchmark::DoNotOptimize(doc.node_count());
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_model_from_binary)->Range(8, 512);
