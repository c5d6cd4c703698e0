// json-crdt-cpp benchmarks -- RGA sequence inserts, deletes and lookups.

#include <json-crdt-cpp/rga.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace json_crdt_cpp;

// Typing at the end of the text, one character per chunk anchor.
static void bm_rga_append(benchmark::State& state) {
    const auto n = static_cast<std::uint64_t>(state.range(0));
    for (auto _ : state) {
        auto rga = Rga<std::string>{};
        auto after = origin;
        for (std::uint64_t t = 1; t <= n; ++t) {
            rga.insert(after, ts(1, t), 1, "x");
            after = ts(1, t);
        }
        benchmark::DoNotOptimize(rga.size());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_rga_append)->Range(64, 4096);

// Every insert lands at the head, so each one scans for its position.
static void bm_rga_prepend(benchmark::State& state) {
    const auto n = static_cast<std::uint64_t>(state.range(0));
    for (auto _ : state) {
        auto rga = Rga<std::string>{};
        for (std::uint64_t t = 1; t <= n; ++t) rga.insert(origin, ts(1, t), 1, "x");
        benchmark::DoNotOptimize(rga.size());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_rga_prepend)->Range(64, 4096);

// Inserts into the middle of one large chunk, splitting it each time.
static void bm_rga_split_middle(benchmark::State& state) {
    const auto n = static_cast<std::uint64_t>(state.range(0));
    const auto text = std::string(static_cast<std::size_t>(n), 'a');
    for (auto _ : state) {
        auto rga = Rga<std::string>{};
        rga.insert(origin, ts(1, 1), n, text);
        for (std::uint64_t k = 0; k < n / 2; ++k) {
            rga.insert(ts(1, 1 + 2 * k), ts(2, 1 + k), 1, "b");
        }
        benchmark::DoNotOptimize(rga.chunk_count());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0) / 2);
}
BENCHMARK(bm_rga_split_middle)->Range(64, 4096);

static void bm_rga_find(benchmark::State& state) {
    auto rga = Rga<std::string>{};
    auto after = origin;
    for (std::uint64_t t = 1; t <= 1000; ++t) {
        rga.insert(after, ts(1 + t % 3, t), 1, "x");
        after = ts(1 + t % 3, t);
    }
    std::uint64_t pos = 0;
    for (auto _ : state) {
        auto id = rga.find(pos);
        benchmark::DoNotOptimize(id);
        pos = (pos + 37) % 1000;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_rga_find);

static void bm_rga_delete_range(benchmark::State& state) {
    const auto n = static_cast<std::uint64_t>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto rga = Rga<std::string>{};
        auto after = origin;
        for (std::uint64_t t = 1; t <= n; ++t) {
            rga.insert(after, ts(1 + t % 2, t), 1, "x");
            after = ts(1 + t % 2, t);
        }
        const auto spans = rga.find_interval(n / 4, n / 2);
        state.ResumeTiming();

        rga.del(spans);
        benchmark::DoNotOptimize(rga.size());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0) / 2);
}
BENCHMARK(bm_rga_delete_range)->Range(64, 4096);
