#include "serialization/json_serializer.hpp"
#include "simulation/workload.hpp"
#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace frag_res;

static void BM_Serialization_EpochReport(benchmark::State &state) {
  EpochReport report{.epoch = 12345, .accesses = 8, .promotion_round = true};
  for (int i = 0; i < 4; ++i) {
    auto id = "f" + std::to_string(i);
    report.promoted.push_back(id);
    report.migrations.push_back({.fragment = id,
                                 .from = 0,
                                 .to = 1,
                                 .kind = MigrationKind::Promotion,
                                 .ok = true,
                                 .latency_s = 0.001});
  }
  report.events.push_back({.kind = EventKind::Deferred,
                           .fragment = "f9",
                           .detail = "eviction deferred: migration outstanding"});

  for (auto _ : state) {
    nlohmann::json j = report;
    std::string s = j.dump();
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Serialization_Snapshot(benchmark::State &state) {
  const CostModel model;
  auto desc = sim::make_demo_descriptor(
      {.fragments = static_cast<std::size_t>(state.range(0)), .seed = 1},
      model);
  ResidencyMap residency;
  if (!sim::build_residency(residency, desc, model)) {
    state.SkipWithError("initial residency failed");
    return;
  }

  for (auto _ : state) {
    std::string s = residency_snapshot_to_json(residency, 1).dump();
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Serialization_Plan(benchmark::State &state) {
  const CostModel model;
  auto desc = sim::make_demo_descriptor(
      {.fragments = static_cast<std::size_t>(state.range(0)), .seed = 1},
      model);
  const auto plan = PlacementPlanner{}.plan(desc.fragments, desc.nodes);

  for (auto _ : state) {
    nlohmann::json j = plan;
    std::string s = j.dump();
    benchmark::DoNotOptimize(s);
  }
}

BENCHMARK(BM_Serialization_EpochReport);
BENCHMARK(BM_Serialization_Snapshot)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_Serialization_Plan)->Arg(10)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
