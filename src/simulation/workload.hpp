#pragma once
/// @file workload.hpp
/// @brief Workload setup shared by the executables: the synthetic demo
/// descriptor, initial residency and randomized controller seeds.

#include "controller/residency_controller.hpp"
#include "model/descriptor.hpp"
#include "planner/cost_model.hpp"
#include "residency/residency_map.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>

namespace frag_res::sim {

/// @brief Shape of the synthetic demo workload.
struct DemoWorkloadConfig {
  std::size_t fragments = 64;
  std::uint64_t fragment_size = 4096;
  std::size_t devices = 2;               ///< Budgeted nodes 1..devices.
  std::size_t fragments_per_device = 16; ///< Budget, in demo fragments.
  std::uint32_t seed = 0;                ///< 0 = random_device.
};

/// @brief Backing host (node 0) plus @c devices budgeted nodes, and
/// fragments "f0000".. with random importance and reuse.
[[nodiscard]] auto make_demo_descriptor(const DemoWorkloadConfig &cfg,
                                        const CostModel &model)
    -> Descriptor;

/// @brief First backing node of @p nodes, if any.
[[nodiscard]] auto origin_node(std::span<const Node> nodes)
    -> std::optional<NodeId>;

/// @brief Backing host registered for descriptors that declare none: the
/// smallest id not used by @p nodes.
[[nodiscard]] auto implicit_origin(std::span<const Node> nodes) -> Node;

/// @brief Register every node and install every fragment on the origin.
///
/// The origin is the descriptor's first backing node. Descriptors without
/// one (plain device lists) get an implicit_origin() host, so the starting
/// residency is never charged against a device budget the planner treats as
/// empty.
/// @return The origin node.
auto build_residency(ResidencyMap &residency, const Descriptor &desc,
                     const CostModel &model)
    -> std::expected<NodeId, ResidencyError>;

/// @brief Random initial state: lease now + [1, 5], hotness in [0, 1).
[[nodiscard]] auto random_seeds(std::span<const Fragment> fragments,
                                Epoch now, std::uint32_t seed)
    -> std::map<FragmentId, FragmentSeed>;

} // namespace frag_res::sim
