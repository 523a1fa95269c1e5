// replidoc-cpp benchmarks: throughput of the mutation context and the document.

#include <replidoc-cpp/replidoc.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace replidoc_cpp;

static auto make_doc() -> Document {
    const std::uint8_t raw[16] = {1};
    return Document{ActorId{raw}};
}

static auto list_path(const Document& doc, std::string_view key) -> Path {
    const auto id = std::get<ObjectRef>(*doc.get(root_id, key)).id;
    return Path{{map_key(std::string{key}), id}};
}

// =============================================================================
// Map writes
// =============================================================================

static void bm_set_map_key(benchmark::State& state) {
    auto doc = make_doc();
    std::int64_t i = 0;
    for (auto _ : state) {
        doc.transact([&](Context& ctx) {
            ctx.set_map_key({}, "key", i++);
        });
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_map_key);

static void bm_set_map_key_batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto doc = make_doc();
    std::int64_t val = 0;
    for (auto _ : state) {
        doc.transact([&](Context& ctx) {
            for (std::size_t i = 0; i < n; ++i) {
                ctx.set_map_key({}, "key" + std::to_string(i), val++);
            }
        });
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_set_map_key_batch)->Range(10, 1000);

static void bm_elided_write(benchmark::State& state) {
    auto doc = make_doc();
    doc.transact([](Context& ctx) { ctx.set_map_key({}, "key", 1); });
    for (auto _ : state) {
        doc.transact([](Context& ctx) { ctx.set_map_key({}, "key", 1); });
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_elided_write);

// =============================================================================
// Nested objects
// =============================================================================

static void bm_nested_map(benchmark::State& state) {
    auto doc = make_doc();
    for (auto _ : state) {
        doc.transact([](Context& ctx) {
            ctx.set_map_key({}, "config", NestedMap{
                {"host", "localhost"},
                {"port", 8080},
                {"tags", NestedList{"a", "b", "c"}},
            });
        });
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_nested_map);

static void bm_create_list(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto values = NestedList{};
    for (std::size_t i = 0; i < n; ++i) values.values.emplace_back(static_cast<std::int64_t>(i));
    auto doc = make_doc();
    for (auto _ : state) {
        doc.transact([&](Context& ctx) { ctx.set_map_key({}, "list", values); });
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_create_list)->Range(8, 1024);

static void bm_create_text(benchmark::State& state) {
    const auto text = std::string(static_cast<std::size_t>(state.range(0)), 'x');
    auto doc = make_doc();
    for (auto _ : state) {
        doc.transact([&](Context& ctx) { ctx.set_map_key({}, "text", NestedText{text}); });
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_create_text)->Range(64, 4096);

// =============================================================================
// List insertion through a path
// =============================================================================

static void bm_list_append(benchmark::State& state) {
    auto doc = make_doc();
    doc.transact([](Context& ctx) { ctx.set_map_key({}, "list", NestedList{}); });
    const auto path = list_path(doc, "list");
    for (auto _ : state) {
        doc.transact([&](Context& ctx) {
            ctx.insert_list_items(path, 0, {"item"});
        });
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_list_append);

// =============================================================================
// Reads
// =============================================================================

static void bm_get(benchmark::State& state) {
    auto doc = make_doc();
    doc.transact([](Context& ctx) {
        for (int i = 0; i < 100; ++i) {
            ctx.set_map_key({}, "key" + std::to_string(i), i);
        }
    });
    for (auto _ : state) {
        auto val = doc.get(root_id, "key50");
        benchmark::DoNotOptimize(val);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get);
