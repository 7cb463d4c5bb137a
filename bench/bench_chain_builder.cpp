/**
 * @file  bench/bench_chain_builder.cpp
 * @brief Google Benchmark suite for causal chain enumeration.
 *
 * Benchmarks
 * ----------
 *   BM_ChainBuild_Layered  layered DAG, full enumeration up to depth 5
 *   BM_ChainBuild_Budgeted same graph, capped at 10k expansions
 *   BM_Discover_Window     pairwise hypothesis generation over N entities
 *
 * Build (CMake):
 *   cmake -DTKG_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_chain_builder
 *   ./build/bench_chain_builder --benchmark_format=json
 *
 * Throughput units: items/second (paths enumerated / entities scanned).
 */

#include "benchmark/benchmark.h"

#include "tkg/causal_discovery.hpp"
#include "tkg/chain_builder.hpp"
#include "tkg/entity_store.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <cstddef>
#include <vector>

using namespace tkg;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// `layers` layers of `width` nodes, every node linked to every node of the
/// next layer with strength 0.9.
static std::vector<causal::CausalHypothesis> make_layered(std::size_t layers,
                                                          std::size_t width) {
    std::vector<causal::CausalHypothesis> hyps;
    for (std::size_t l = 0; l + 1 < layers; ++l) {
        for (std::size_t a = 0; a < width; ++a) {
            for (std::size_t b = 0; b < width; ++b) {
                hyps.push_back(causal::CausalHypothesis{
                    .cause_id    = fmt::format("n{}_{}", l, a),
                    .effect_id   = fmt::format("n{}_{}", l + 1, b),
                    .cause_kind  = EntityKind::NewsEvent,
                    .effect_kind = EntityKind::PriceMovement,
                    .cause_time  = static_cast<double>(l) * 60.0,
                    .effect_time = static_cast<double>(l + 1) * 60.0,
                    .mechanism   = causal::CausalMechanism::InformationImpact,
                    .strength    = 0.9,
                    .evidence    = {},
                });
            }
        }
    }
    return hyps;
}

static void quiet() { spdlog::set_level(spdlog::level::off); }

// ── Chain enumeration ──────────────────────────────────────────────────────────

static void BM_ChainBuild_Layered(benchmark::State& state) {
    quiet();
    const auto hyps = make_layered(6, static_cast<std::size_t>(state.range(0)));
    const chain::ChainBuilder builder;
    std::size_t paths = 0;
    for (auto _ : state) {
        auto result = builder.build(hyps, 5);
        paths += result.paths_enumerated;
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(paths));
}
BENCHMARK(BM_ChainBuild_Layered)->Arg(2)->Arg(4)->Arg(6);

static void BM_ChainBuild_Budgeted(benchmark::State& state) {
    quiet();
    const auto hyps = make_layered(6, static_cast<std::size_t>(state.range(0)));
    const chain::ChainBuilder builder;
    chain::BuildBudget budget;
    budget.max_expansions = 10'000;
    for (auto _ : state) {
        auto result = builder.build(hyps, 5, budget);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ChainBuild_Budgeted)->Arg(6)->Arg(10);

// ── Discovery ──────────────────────────────────────────────────────────────────

static void BM_Discover_Window(benchmark::State& state) {
    quiet();
    const auto n = static_cast<std::size_t>(state.range(0));
    store::EntityStore entities;
    for (std::size_t i = 0; i < n; ++i) {
        TemporalEntity e;
        e.id        = fmt::format("e{}", i);
        e.kind      = (i % 2 == 0) ? EntityKind::NewsEvent : EntityKind::PriceMovement;
        e.timestamp = static_cast<double>(i) * 30.0;
        e.properties["value"] = static_cast<double>(i % 7);
        (void)entities.add_entity(std::move(e));
    }
    const causal::CausalDiscoveryEngine engine;
    const Timestamp now = static_cast<double>(n) * 30.0;
    for (auto _ : state) {
        auto hyps = engine.discover(entities, now, now);
        benchmark::DoNotOptimize(hyps);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * n));
}
BENCHMARK(BM_Discover_Window)->Arg(64)->Arg(256);

BENCHMARK_MAIN();
