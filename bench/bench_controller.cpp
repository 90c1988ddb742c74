#include "controller/residency_controller.hpp"
#include "simulation/access_generator.hpp"
#include "simulation/workload.hpp"
#include "transport/simulated_transport.hpp"
#include <benchmark/benchmark.h>
#include <utility>
#include <vector>

using namespace frag_res;

// One epoch per iteration over a demo workload, with an instant transport.
// Measures the bookkeeping and dispatch overhead of step().
static void BM_Controller_Step(benchmark::State &state) {
  const auto fragments = static_cast<std::size_t>(state.range(0));
  const CostModel model;
  auto desc = sim::make_demo_descriptor(
      {.fragments = fragments, .fragments_per_device = fragments, .seed = 7},
      model);

  ResidencyMap residency;
  if (!sim::build_residency(residency, desc, model)) {
    state.SkipWithError("initial residency failed");
    return;
  }
  SimulatedTransport transport{{.realtime = false, .seed = 7}};
  ResidencyController controller{residency, transport,
                                 {.promotion_interval = 5,
                                  .promotion_fanout = 8}};
  const auto seeds = sim::random_seeds(desc.fragments, 0, 7);
  for (const auto &f : desc.fragments) {
    if (!controller.track(f, seeds.at(f.id))) {
      state.SkipWithError("track failed");
      return;
    }
  }

  std::vector<FragmentId> universe;
  for (const auto &f : desc.fragments) {
    universe.push_back(f.id);
  }
  sim::AccessGenerator generator{std::move(universe),
                                 {.batch = fragments / 8, .seed = 7}};

  for (auto _ : state) {
    state.PauseTiming();
    auto batch = generator.next(controller.hotness_table());
    state.ResumeTiming();

    auto report = controller.step(batch);
    benchmark::DoNotOptimize(report);
  }
}

BENCHMARK(BM_Controller_Step)->Arg(64)->Arg(512)->Arg(4096);

BENCHMARK_MAIN();
