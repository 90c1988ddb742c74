/// @file workload.cpp
/// @brief Workload setup helpers.

#include "simulation/workload.hpp"

#include <cmath>
#include <cstdio>
#include <random>
#include <set>

namespace frag_res::sim {

namespace {

auto make_rng(std::uint32_t seed) -> std::mt19937 {
  return std::mt19937{seed != 0 ? seed : std::random_device{}()};
}

} // namespace

auto make_demo_descriptor(const DemoWorkloadConfig &cfg,
                          const CostModel &model) -> Descriptor {
  auto rng = make_rng(cfg.seed);
  std::uniform_real_distribution<double> importance(0.0, 1.0);
  std::uniform_int_distribution<std::uint64_t> reuse(0, 5);

  Descriptor desc;
  desc.fragments.reserve(cfg.fragments);
  for (std::size_t i = 0; i < cfg.fragments; ++i) {
    char id[16];
    std::snprintf(id, sizeof(id), "f%04zu", i);
    desc.fragments.push_back(Fragment{
        .id = id,
        .size = cfg.fragment_size,
        .importance = importance(rng),
        .reuse = reuse(rng),
        .timescale = "short",
    });
  }

  desc.nodes.push_back(Node{.id = 0, .capacity_budget = 0, .backing = true});

  // Budget sized in whole demo fragments.
  const Fragment unit_fragment{.id = "", .size = cfg.fragment_size};
  const Node any{.id = 0, .capacity_budget = 0};
  const auto budget = static_cast<std::uint64_t>(
      std::ceil(model.cost(unit_fragment, any) *
                static_cast<double>(cfg.fragments_per_device)));
  for (std::size_t d = 1; d <= cfg.devices; ++d) {
    desc.nodes.push_back(Node{
        .id = static_cast<NodeId>(d),
        .capacity_budget = budget,
        .predicted_interference = 0.1 * static_cast<double>(d - 1),
    });
  }
  return desc;
}

auto origin_node(std::span<const Node> nodes) -> std::optional<NodeId> {
  for (const auto &n : nodes) {
    if (n.backing) {
      return n.id;
    }
  }
  return std::nullopt;
}

auto implicit_origin(std::span<const Node> nodes) -> Node {
  std::set<NodeId> used;
  for (const auto &n : nodes) {
    used.insert(n.id);
  }
  NodeId id = 0;
  while (used.contains(id)) {
    ++id;
  }
  return Node{.id = id, .capacity_budget = 0, .backing = true};
}

auto build_residency(ResidencyMap &residency, const Descriptor &desc,
                     const CostModel &model)
    -> std::expected<NodeId, ResidencyError> {
  for (const auto &n : desc.nodes) {
    if (auto r = residency.add_node(n); !r) {
      return std::unexpected(r.error());
    }
  }

  auto origin = origin_node(desc.nodes);
  if (!origin) {
    const Node host = implicit_origin(desc.nodes);
    if (auto r = residency.add_node(host); !r) {
      return std::unexpected(r.error());
    }
    origin = host.id;
  }

  const auto home = residency.node(*origin);
  if (!home) {
    return std::unexpected(ResidencyError::UnknownNode);
  }
  for (const auto &f : desc.fragments) {
    if (auto r = residency.install(f.id, *origin, model.cost(f, *home),
                                   model.units(f));
        !r) {
      return std::unexpected(r.error());
    }
  }
  return *origin;
}

auto random_seeds(std::span<const Fragment> fragments, Epoch now,
                  std::uint32_t seed) -> std::map<FragmentId, FragmentSeed> {
  auto rng = make_rng(seed);
  std::uniform_int_distribution<Epoch> lease(1, 5);
  std::uniform_real_distribution<double> hotness(0.0, 1.0);

  std::map<FragmentId, FragmentSeed> out;
  for (const auto &f : fragments) {
    // Draw order is fixed so a seed reproduces the same state.
    const Epoch expiry = now + lease(rng);
    const double h = hotness(rng);
    out.emplace(f.id, FragmentSeed{.expiry = expiry, .hotness = h});
  }
  return out;
}

} // namespace frag_res::sim
