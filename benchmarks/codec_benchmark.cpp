// marshal-cpp benchmarks: throughput of the wire codec and the schema layer.

#include <marshal-cpp/marshal.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace marshal_cpp;

namespace {

auto make_map(std::size_t events) -> rpg::Map {
    auto map = rpg::Map{};
    map.width = 40;
    map.height = 30;
    map.data = Table{40, 30, 3};
    for (std::size_t i = 0; i < map.data.size(); ++i) {
        map.data.data()[i] = static_cast<std::uint16_t>(i % 384);
    }

    auto page = rpg::EventPage{};
    for (int line = 0; line < 20; ++line) {
        page.list.push_back(rpg::EventCommand{
            .code = 101,
            .indent = 0,
            .parameters = {rpg::Parameter{std::string{"Line " + std::to_string(line)}}},
        });
    }
    for (std::size_t id = 1; id <= events; ++id) {
        map.events[id] = rpg::Event{.id = id, .name = "EV" + std::to_string(id),
                                    .x = 0, .y = 0, .pages = {page}};
    }
    return map;
}

}  // anonymous namespace

// =============================================================================
// Wire codec
// =============================================================================

static void bm_decode_fixnum_array(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto graph = Graph{};
    auto elements = std::vector<Value>{};
    for (std::size_t i = 0; i < n; ++i) elements.emplace_back(static_cast<std::int64_t>(i * 7919));
    auto bytes = encode(graph, graph.make_array(std::move(elements)));

    for (auto _ : state) {
        auto doc = decode(bytes);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_decode_fixnum_array)->Range(64, 65536);

static void bm_decode_map(benchmark::State& state) {
    auto bytes = dump(make_map(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto doc = decode(bytes);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_decode_map)->Arg(10)->Arg(100);

static void bm_encode_map(benchmark::State& state) {
    auto doc = decode(dump(make_map(static_cast<std::size_t>(state.range(0)))));
    for (auto _ : state) {
        auto bytes = encode(doc);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_map)->Arg(10)->Arg(100);

// =============================================================================
// Schema layer
// =============================================================================

static void bm_load_map(benchmark::State& state) {
    auto bytes = dump(make_map(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto map = load<rpg::Map>(bytes);
        benchmark::DoNotOptimize(map);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_load_map)->Arg(10)->Arg(100);

static void bm_dump_map(benchmark::State& state) {
    auto map = make_map(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto bytes = dump(map);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_dump_map)->Arg(10)->Arg(100);

static void bm_table_codec(benchmark::State& state) {
    auto table = Table{500, 500, 3};
    for (auto _ : state) {
        auto back = decode_table(encode_table(table));
        benchmark::DoNotOptimize(back);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * table.size() * 2));
}
BENCHMARK(bm_table_codec);

// =============================================================================
// Batch decode: 200 map files, sequential vs decode_batch
//
// Arg: 0 = sequential, 1 = parallel on the shared executor.
// =============================================================================

static void bm_decode_many(benchmark::State& state) {
    const bool parallel = state.range(0) != 0;
    constexpr int file_count = 200;

    auto files = std::vector<std::vector<std::byte>>(file_count, dump(make_map(20)));

    for (auto _ : state) {
        if (!parallel) {
            auto docs = std::vector<Document>{};
            docs.reserve(file_count);
            for (const auto& file : files) docs.push_back(decode(file));
            benchmark::DoNotOptimize(docs);
        } else {
            auto results = decode_batch(files);
            benchmark::DoNotOptimize(results);
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * file_count);
    state.SetLabel(parallel ? "parallel" : "sequential");
}
BENCHMARK(bm_decode_many)->Arg(0)->Arg(1);
