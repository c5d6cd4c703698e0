// json-crdt-cpp benchmarks -- patch encoding and decoding in every format.

#include <json-crdt-cpp/codec.hpp>
#include <json-crdt-cpp/patch_builder.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace json_crdt_cpp;
using nlohmann::json;

namespace {

// A document-sized patch: an object of strings, numbers and a list.
auto sample_patch(int keys) -> Patch {
    auto b = PatchBuilder{123456, 1};
    auto value = json::object();
    for (int i = 0; i < keys; ++i) {
        const auto key = "key" + std::to_string(i);
        if (i % 3 == 0) {
            value[key] = "value " + std::to_string(i);
        } else if (i % 3 == 1) {
            value[key] = i * 1.5;
        } else {
            value[key] = json::array({i, "x", true});
        }
    }
    b.root(b.json(value));
    return b.flush();
}

}  // anonymous namespace

static void bm_binary_encode(benchmark::State& state) {
    const auto patch = sample_patch(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto bytes = codec::binary::encode(patch);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.ops.size()));
}
BENCHMARK(bm_binary_encode)->Range(8, 512);

static void bm_binary_decode(benchmark::State& state) {
    const auto patch = sample_patch(static_cast<int>(state.range(0)));
    const auto bytes = codec::binary::encode(patch);
    for (auto _ : state) {
        auto decoded = codec::binary::decode(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_binary_decode)->Range(8, 512);

static void bm_compact_encode(benchmark::State& state) {
    const auto patch = sample_patch(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto encoded = codec::compact::encode(patch);
        benchmark::DoNotOptimize(encoded);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.ops.size()));
}
BENCHMARK(bm_compact_encode)->Range(8, 512);

static void bm_compact_binary_decode(benchmark::State& state) {
    const auto patch = sample_patch(static_cast<int>(state.range(0)));
    const auto bytes = codec::compact_binary::encode(patch);
    for (auto _ : state) {
        auto decoded = codec::compact_binary::decode(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_compact_binary_decode)->Range(8, 512);

static void bm_verbose_round_trip(benchmark::State& state) {
    const auto patch = sample_patch(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto text = codec::verbose::encode(patch).dump();
        auto decoded = codec::verbose::decode(json::parse(text));
        benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.ops.size()));
}
BENCHMARK(bm_verbose_round_trip)->Range(8, 512);
