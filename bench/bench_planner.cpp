#include "planner/placement_planner.hpp"
#include "simulation/workload.hpp"
#include <benchmark/benchmark.h>

using namespace frag_res;

// Full greedy pass: rank every (fragment, node) pair, then commit.
static void BM_Planner_Plan(benchmark::State &state) {
  const CostModel model;
  auto desc = sim::make_demo_descriptor(
      {.fragments = static_cast<std::size_t>(state.range(0)),
       .devices = static_cast<std::size_t>(state.range(1)),
       .fragments_per_device = static_cast<std::size_t>(state.range(0)) / 4,
       .seed = 42},
      model);
  const PlacementPlanner planner;

  for (auto _ : state) {
    auto plan = planner.plan(desc.fragments, desc.nodes);
    benchmark::DoNotOptimize(plan);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Ranking alone, to separate sort cost from ledger cost.
static void BM_Planner_Rank(benchmark::State &state) {
  const CostModel model;
  auto desc = sim::make_demo_descriptor(
      {.fragments = static_cast<std::size_t>(state.range(0)),
       .devices = 4,
       .seed = 42},
      model);
  const PlacementPlanner planner;

  for (auto _ : state) {
    auto ranked = planner.rank(desc.fragments, desc.nodes);
    benchmark::DoNotOptimize(ranked);
  }
}

BENCHMARK(BM_Planner_Plan)
    ->Args({64, 2})
    ->Args({1024, 4})
    ->Args({8192, 8});
BENCHMARK(BM_Planner_Rank)->Arg(64)->Arg(1024)->Arg(8192);

BENCHMARK_MAIN();
