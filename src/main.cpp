/// @file main.cpp
/// @brief Host-side planner: reads a descriptor, computes a greedy
///        utility-per-cost placement under the node budgets and prints it.
///        With --execute the plan is applied through the simulated transfer
///        engine, starting from each fragment's origin node.

#include "config/config.hpp"
#include "controller/residency_controller.hpp"
#include "model/descriptor.hpp"
#include "planner/placement_planner.hpp"
#include "residency/residency_map.hpp"
#include "serialization/json_serializer.hpp"
#include "simulation/workload.hpp"
#include "transport/simulated_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace frag_res;

namespace {

struct PlanArgs {
  std::string descriptor;
  std::string config;
  bool json = false;
  bool execute = false;
  bool realtime = true;
};

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " <descriptor.json> [options]\n\n"
            << "Options:\n"
            << "  --config <path>  Runtime config JSON\n"
            << "  --json           Print the plan as JSON\n"
            << "  --execute        Apply the plan through the simulated "
               "transfer engine\n"
            << "  --no-realtime    Do not sleep for modeled transfer latency\n"
            << "  --help           Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> PlanArgs {
  PlanArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      args.config = argv[++i];
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--execute") {
      args.execute = true;
    } else if (arg == "--no-realtime") {
      args.realtime = false;
    } else if (!arg.starts_with("--") && args.descriptor.empty()) {
      args.descriptor = arg;
    } else {
      std::cerr << "WARNING: ignoring unknown argument '" << arg << "'\n";
    }
  }
  return args;
}

void print_plan(const PlacementPlan &plan) {
  std::cout << std::fixed;
  std::cout << "Placements (" << plan.assignments.size() << "):\n";
  for (const auto &a : plan.assignments) {
    std::cout << "  " << std::left << std::setw(12) << a.fragment << std::right
              << " -> node " << std::setw(3) << a.node
              << "  cost " << std::setprecision(1) << std::setw(12) << a.cost
              << "  utility " << std::setprecision(3) << a.utility
              << "  rho " << std::setprecision(9) << a.rho << '\n';
  }

  std::cout << "Unplaced (" << plan.unplaced.size() << "):\n";
  for (const auto &u : plan.unplaced) {
    std::cout << "  " << std::left << std::setw(12) << u.fragment << std::right
              << " " << to_string(u.reason) << '\n';
  }

  std::cout << "Remaining budget:\n" << std::setprecision(1);
  for (const auto &[node, budget] : plan.ledger.nodes()) {
    std::cout << "  node " << std::setw(3) << node << "  " << budget.capacity;
    if (budget.units) {
      std::cout << "  (" << *budget.units << " units)";
    }
    std::cout << '\n';
  }
}

/// Apply @p plan from the fragments' origin node through SimulatedTransport.
auto execute(const PlacementPlan &plan, const Descriptor &desc,
             const RuntimeConfig &cfg) -> int {
  const CostModel model{cfg.planner};
  ResidencyMap residency;
  const auto origin = sim::build_residency(residency, desc, model);
  if (!origin) {
    std::cerr << "ERROR: initial residency: " << to_string(origin.error())
              << '\n';
    return 1;
  }

  SimulatedTransport transport{cfg.transport};
  ResidencyController controller{residency, transport, cfg.controller,
                                 cfg.planner};
  for (const auto &f : desc.fragments) {
    if (auto ok = controller.track(f); !ok) {
      std::cerr << "ERROR: track " << f.id << ": " << to_string(ok.error())
                << '\n';
      return 1;
    }
  }

  std::cout << "Executing transfers from node " << *origin << " ...\n";
  const auto report = controller.apply_plan(plan);
  std::cout << std::fixed << std::setprecision(6);
  for (const auto &m : report.migrations) {
    std::cout << "  " << m.fragment << " -> node " << m.to << ": ";
    if (m.ok) {
      std::cout << m.latency_s << "s\n";
    } else {
      std::cout << "FAILED (" << (m.error ? to_string(*m.error) : "unknown")
                << ")\n";
    }
  }
  for (const auto &e : report.events) {
    if (e.kind != EventKind::TransportFailure) {
      std::cerr << "WARNING: " << e.fragment << ": " << e.detail << '\n';
    }
  }
  std::cout << report.placed.size() << " of " << plan.assignments.size()
            << " placements committed\n";
  return report.failures() == 0 ? 0 : 2;
}

} // namespace

int main(int argc, char *argv[]) {
  PlanArgs args = parse_args(argc, argv);
  if (args.descriptor.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  RuntimeConfig cfg;
  if (!args.config.empty()) {
    auto loaded = load_config(args.config);
    if (!loaded) {
      std::cerr << "ERROR: " << loaded.error().message() << '\n';
      return 1;
    }
    cfg = *loaded;
  }
  if (!args.realtime) {
    cfg.transport.realtime = false;
  }

  auto desc = load_descriptor(args.descriptor);
  if (!desc) {
    std::cerr << "ERROR: " << desc.error().message() << '\n';
    return 1;
  }

  const PlacementPlanner planner{cfg.planner};
  const auto plan = planner.plan(desc->fragments, desc->nodes);

  if (args.json) {
    nlohmann::json j = plan;
    std::cout << j.dump(2) << '\n';
  } else {
    std::cout << "Planning placements for " << desc->fragments.size()
              << " fragments over " << desc->nodes.size() << " nodes\n";
    print_plan(plan);
  }

  if (args.execute) {
    if (auto ok = validate_topology(cfg.controller, desc->nodes); !ok) {
      std::cerr << "ERROR: " << ok.error().message() << '\n';
      return 1;
    }
    return execute(plan, *desc, cfg);
  }
  return 0;
}
