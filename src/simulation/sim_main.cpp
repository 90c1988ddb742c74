/// @file sim_main.cpp
/// @brief Entry point for the residency simulation.
///
/// Loads a descriptor (or synthesizes the demo workload), plans an initial
/// placement, applies it, then drives the residency controller for a number
/// of epochs with generated access batches and prints a metrics report.
/// With --server, every epoch report is streamed to WebSocket clients.

#include "config/config.hpp"
#include "controller/residency_controller.hpp"
#include "model/descriptor.hpp"
#include "planner/placement_planner.hpp"
#include "residency/residency_map.hpp"
#include "serialization/json_serializer.hpp"
#include "server/telemetry_server.hpp"
#include "simulation/access_generator.hpp"
#include "simulation/metrics.hpp"
#include "simulation/workload.hpp"
#include "transport/simulated_transport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using namespace frag_res;
using namespace frag_res::sim;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct SimArgs {
  std::string descriptor; // Empty: synthesize the demo workload.
  std::string config;     // Optional JSON config file.
  std::size_t epochs = 100;
  std::size_t fragments = 64; // Demo workload only.
  std::size_t devices = 2;    // Demo workload only.
  std::uint32_t seed = 0;
  AccessPattern pattern = AccessPattern::HotnessWeighted;
  std::size_t batch = 8;
  bool random_init = true;
  bool plan = true;
  std::optional<double> fail_rate;
  std::optional<std::size_t> timeout_ms;
  bool realtime = true;
  std::size_t epoch_delay_ms = 20;
  bool enable_server = false;
  unsigned short port = 8080;
  bool quiet = false;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Options:\n"
      << "  --descriptor <path>  Fragment/node descriptor JSON (default: demo "
         "workload)\n"
      << "  --config <path>      Runtime config JSON\n"
      << "  --epochs <N>         Epochs to simulate (default: 100)\n"
      << "  --fragments <N>      Demo fragments (default: 64)\n"
      << "  --devices <N>        Demo device nodes (default: 2)\n"
      << "  --seed <N>           RNG seed, 0 = random (default: 0)\n"
      << "  --pattern <P>        Access pattern: uniform|hotness "
         "(default: hotness)\n"
      << "  --batch <N>          Accesses per epoch (default: 8)\n"
      << "  --no-random-init     Start with default leases and zero hotness\n"
      << "  --no-plan            Skip the initial placement\n"
      << "  --fail-rate <R>      Injected transfer failure rate (0.0-1.0)\n"
      << "  --timeout-ms <N>     Per-migration timeout\n"
      << "  --no-realtime        Do not sleep for modeled transfer latency\n"
      << "  --epoch-delay-ms <N> Pause between epochs (default: 20)\n"
      << "  --server             Enable the telemetry server\n"
      << "  --port <N>           Server port (default: 8080)\n"
      << "  --quiet              Only print the final report\n"
      << "  --help               Show this help\n";
}

auto parse_pattern(const std::string &s) -> AccessPattern {
  if (s == "uniform")
    return AccessPattern::Uniform;
  return AccessPattern::HotnessWeighted;
}

auto parse_args(int argc, char *argv[]) -> SimArgs {
  SimArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--descriptor" && i + 1 < argc) {
      args.descriptor = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      args.config = argv[++i];
    } else if (arg == "--epochs" && i + 1 < argc) {
      args.epochs = std::stoull(argv[++i]);
    } else if (arg == "--fragments" && i + 1 < argc) {
      args.fragments = std::stoull(argv[++i]);
    } else if (arg == "--devices" && i + 1 < argc) {
      args.devices = std::stoull(argv[++i]);
    } else if (arg == "--seed" && i + 1 < argc) {
      args.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
    } else if (arg == "--pattern" && i + 1 < argc) {
      args.pattern = parse_pattern(argv[++i]);
    } else if (arg == "--batch" && i + 1 < argc) {
      args.batch = std::stoull(argv[++i]);
    } else if (arg == "--no-random-init") {
      args.random_init = false;
    } else if (arg == "--no-plan") {
      args.plan = false;
    } else if (arg == "--fail-rate" && i + 1 < argc) {
      args.fail_rate = std::stod(argv[++i]);
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      args.timeout_ms = std::stoull(argv[++i]);
    } else if (arg == "--no-realtime") {
      args.realtime = false;
    } else if (arg == "--epoch-delay-ms" && i + 1 < argc) {
      args.epoch_delay_ms = std::stoull(argv[++i]);
    } else if (arg == "--server") {
      args.enable_server = true;
    } else if (arg == "--port" && i + 1 < argc) {
      args.port = static_cast<unsigned short>(std::stoul(argv[++i]));
    } else if (arg == "--quiet") {
      args.quiet = true;
    } else {
      std::cerr << "WARNING: ignoring unknown argument '" << arg << "'\n";
    }
  }
  return args;
}

/// CLI flags override the config file.
void apply_overrides(const SimArgs &args, RuntimeConfig &cfg) {
  if (args.fail_rate) {
    cfg.transport.fail_rate = *args.fail_rate;
  }
  if (args.timeout_ms) {
    cfg.controller.dispatch.timeout =
        std::chrono::milliseconds(*args.timeout_ms);
  }
  if (!args.realtime) {
    cfg.transport.realtime = false;
  }
  if (args.seed != 0 && cfg.transport.seed == 0) {
    cfg.transport.seed = args.seed;
  }
}

// ─── Epoch logging ──────────────────────────────────────────────────────

void print_epoch(const EpochReport &r) {
  std::cout << std::fixed << std::setprecision(6);
  for (const auto &m : r.migrations) {
    if (m.ok && m.kind == MigrationKind::Promotion) {
      std::cout << "Epoch " << r.epoch << ": migrated " << m.fragment
                << " to node " << m.to << " took " << m.latency_s << "s\n";
    }
  }
  if (!r.evicted.empty()) {
    std::cout << "Epoch " << r.epoch << ": evicted " << r.evicted.size()
              << " fragments (sample [";
    for (std::size_t i = 0; i < std::min<std::size_t>(3, r.evicted.size());
         ++i) {
      std::cout << (i ? ", " : "") << r.evicted[i];
    }
    std::cout << "])\n";
  }
  for (const auto &e : r.events) {
    if (e.kind == EventKind::TransportFailure) {
      std::cerr << "Epoch " << r.epoch << ": WARNING: " << e.fragment << ": "
                << e.detail << '\n';
    }
  }
}

// ─── Report formatting ─────────────────────────────────────────────────

void print_separator() { std::cout << std::string(60, '=') << '\n'; }

void print_report(const MigrationStats &m, const ResidencyMap &residency,
                  const SimulatedTransport &transport) {
  std::cout << '\n';
  print_separator();
  std::cout << "  RESIDENCY SIMULATION RESULTS\n";
  print_separator();

  std::cout << std::fixed << std::setprecision(1);

  std::cout << "\n  Migrations\n"
            << "    Epochs:      " << m.epochs << '\n'
            << "    Total:       " << m.total_migrations << '\n'
            << "    Successful:  " << m.successful << '\n'
            << "    Failed:      " << m.failed << " (" << m.timed_out
            << " timed out)\n"
            << "    Success Rate:" << std::setw(7) << m.success_rate() * 100
            << " %\n"
            << "    Placements:  " << m.placements << '\n'
            << "    Promotions:  " << m.promotions << '\n'
            << "    Evictions:   " << m.evictions << '\n'
            << "    In place:    " << m.in_place << '\n';

  std::cout << std::setprecision(2);
  std::cout << "\n  Transfer\n"
            << "    Duration:    " << std::setprecision(3) << m.elapsed_seconds
            << " s\n"
            << "    Moved:       " << m.bytes_moved / 1024 << " KB\n"
            << "    Bandwidth:   " << std::setprecision(2)
            << m.bandwidth_mbps() << " MB/s\n";

  std::cout << std::setprecision(3);
  std::cout << "\n  Latency\n"
            << "    Min:         " << m.min_latency_s * 1e3 << " ms\n"
            << "    Avg:         " << m.avg_latency_s * 1e3 << " ms\n"
            << "    P50:         " << m.p50_latency_s * 1e3 << " ms\n"
            << "    P95:         " << m.p95_latency_s * 1e3 << " ms\n"
            << "    P99:         " << m.p99_latency_s * 1e3 << " ms\n"
            << "    Max:         " << m.max_latency_s * 1e3 << " ms\n";

  std::cout << std::setprecision(1);
  std::cout << "\n  Nodes\n";
  for (const auto id : residency.node_ids()) {
    const auto load = residency.load(id);
    if (!load) {
      continue;
    }
    std::cout << "    Node " << std::setw(3) << id << ":  " << std::setw(4)
              << load->fragments << " fragments, " << load->resident / 1024
              << " KB";
    if (load->budget) {
      std::cout << " of " << *load->budget / 1024 << " KB ("
                << 100.0 * load->resident / *load->budget << " %)";
    } else {
      std::cout << " (backing)";
    }
    std::cout << '\n';
  }
  std::cout << "    " << transport.stats() << '\n';

  print_separator();
  std::cout << std::endl;
}

} // namespace

// ─── Main ───────────────────────────────────────────────────────────────

int main(int argc, char *argv[]) {
  SimArgs args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "ERROR: bad argument: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  // 1. Configuration.
  RuntimeConfig cfg;
  if (!args.config.empty()) {
    auto loaded = load_config(args.config);
    if (!loaded) {
      std::cerr << "ERROR: " << loaded.error().message() << '\n';
      return 1;
    }
    cfg = *loaded;
  }
  apply_overrides(args, cfg);

  // 2. Workload.
  const CostModel model{cfg.planner};
  Descriptor desc;
  if (!args.descriptor.empty()) {
    auto loaded = load_descriptor(args.descriptor);
    if (!loaded) {
      std::cerr << "ERROR: " << loaded.error().message() << '\n';
      return 1;
    }
    desc = std::move(*loaded);
  } else {
    desc = make_demo_descriptor({.fragments = args.fragments,
                                 .devices = args.devices,
                                 .seed = args.seed},
                                model);
  }

  if (auto ok = validate_topology(cfg.controller, desc.nodes); !ok) {
    std::cerr << "ERROR: " << ok.error().message() << '\n';
    return 1;
  }

  std::cout << "\n  Residency Simulation\n"
            << "  Workload:   "
            << (args.descriptor.empty() ? "demo" : args.descriptor) << '\n'
            << "  Fragments:  " << desc.fragments.size() << '\n'
            << "  Nodes:      " << desc.nodes.size() << '\n'
            << "  Epochs:     " << args.epochs << '\n'
            << "  Pattern:    " << to_string(args.pattern) << '\n';
  if (args.enable_server) {
    std::cout << "  Server:     http://localhost:" << args.port << '\n';
  }
  std::cout << '\n';

  // 3. Residency map, transport and controller.
  ResidencyMap residency;
  if (auto origin = build_residency(residency, desc, model); !origin) {
    std::cerr << "ERROR: initial residency: " << to_string(origin.error())
              << '\n';
    return 1;
  } else if (!origin_node(desc.nodes)) {
    std::cout << "[Workload] no backing node; fragments start on implicit "
                 "host node "
              << *origin << '\n';
  }

  SimulatedTransport transport{cfg.transport};
  ResidencyController controller{residency, transport, cfg.controller,
                                 cfg.planner};

  std::map<FragmentId, FragmentSeed> seeds;
  if (args.random_init) {
    seeds = random_seeds(desc.fragments, controller.epoch(), args.seed);
  }
  std::map<FragmentId, std::uint64_t> sizes;
  for (const auto &f : desc.fragments) {
    FragmentSeed seed{};
    if (auto it = seeds.find(f.id); it != seeds.end()) {
      seed = it->second;
    }
    if (auto ok = controller.track(f, seed); !ok) {
      std::cerr << "ERROR: track " << f.id << ": " << to_string(ok.error())
                << '\n';
      return 1;
    }
    sizes.emplace(f.id, f.size);
  }
  auto size_of = [&sizes](const FragmentId &id) -> std::uint64_t {
    auto it = sizes.find(id);
    return it != sizes.end() ? it->second : 0;
  };

  MigrationMetrics metrics;
  metrics.start();

  // 4. Initial placement.
  const PlacementPlanner planner{cfg.planner};
  PlacementPlan plan;
  if (args.plan) {
    plan = planner.plan(desc.fragments, desc.nodes);
    auto applied = controller.apply_plan(plan);
    metrics.record(applied, size_of);
    std::cout << "[Planner] " << plan.assignments.size() << " placed, "
              << plan.unplaced.size() << " unplaced; " << applied.placed.size()
              << " committed, " << applied.failures() << " failed\n";
  }

  // 5. Optional telemetry server.
  std::atomic<bool> stop_requested{false};
  PublishedJson snapshot;
  auto publish_snapshot = [&] {
    snapshot.publish(residency_snapshot_to_json(residency, controller.epoch(),
                                                controller.hotness_table())
                         .dump());
  };
  std::optional<TelemetryServer> server;
  std::thread server_thread;
  if (args.enable_server) {
    publish_snapshot();
    const nlohmann::json plan_json = plan;
    server.emplace(
        args.port,
        TelemetryHandlers{
            .snapshot = snapshot.provider(),
            .plan = [plan_dump = plan_json.dump()] { return plan_dump; },
            .on_command =
                [&stop_requested](const std::string &msg) {
                  auto j = nlohmann::json::parse(msg, nullptr, false);
                  if (j.is_discarded() || !j.is_object()) {
                    std::cerr << "[cmd] ignoring malformed message\n";
                    return;
                  }
                  if (j.value("command", "") == "stop") {
                    std::cout << "[cmd] stop requested\n";
                    stop_requested.store(true);
                  }
                },
        });
    server_thread = std::thread([&server] { server->run(); });
  }

  // 6. Run the epochs.
  std::vector<FragmentId> universe;
  universe.reserve(sizes.size());
  for (const auto &[id, size] : sizes) {
    universe.push_back(id);
  }
  AccessGenerator generator{std::move(universe), {.pattern = args.pattern,
                                                  .batch = args.batch,
                                                  .seed = args.seed}};

  for (std::size_t ep = 0; ep < args.epochs && !stop_requested.load(); ++ep) {
    auto accesses = generator.next(controller.hotness_table());
    auto report = controller.step(accesses);
    metrics.record(report, size_of);

    if (!args.quiet) {
      print_epoch(report);
    }
    if (server) {
      publish_snapshot();
      nlohmann::json j = report;
      server->broadcast(j.dump());
    }
    if (args.epoch_delay_ms > 0) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(args.epoch_delay_ms));
    }
  }
  metrics.stop();

  // 7. Print results.
  print_report(metrics.snapshot(), residency, transport);

  if (server) {
    if (!stop_requested.load()) {
      std::cout << "  Server running at http://localhost:" << args.port
                << " - press Enter to exit.\n";
      std::cin.get();
    }
    server->stop();
    server_thread.join();
  }

  return 0;
}
