#pragma once
/// @file cost_model.hpp
/// @brief Cost and utility scoring for (fragment, node) placement candidates.

#include "model/fragment.hpp"

#include <cstdint>

namespace frag_res {

/// @brief Utility weights: w_r * reuse + w_i * importance - w_c * interference.
struct UtilityWeights {
  double reuse = 1.0;
  double importance = 0.8;
  double interference = 0.5;
};

/// @brief Planner configuration. All values are overridable.
struct PlannerConfig {
  std::uint64_t unit_size = 4096;    ///< Bytes per indexing unit.
  double unit_pressure_weight = 0.1; ///< Scalar weight of unit pressure.
  UtilityWeights weights{};
};

/// @brief Cost and resource consumption of one candidate placement.
struct PlacementCost {
  double scalar;       ///< size + units * unit_size * unit_pressure_weight.
  std::uint64_t units; ///< ceil(size / unit_size).
};

/// @brief Stateless scoring of placement candidates under a PlannerConfig.
class CostModel {
public:
  explicit CostModel(PlannerConfig cfg = {}) noexcept;

  /// @brief Indexing units consumed by @p fragment.
  [[nodiscard]] auto units(const Fragment &fragment) const noexcept
      -> std::uint64_t;

  /// @brief Scalar cost of placing @p fragment on @p node.
  [[nodiscard]] auto cost(const Fragment &fragment,
                          const Node &node) const noexcept -> double;

  /// @brief Scalar cost plus unit count.
  [[nodiscard]] auto placement_cost(const Fragment &fragment,
                                    const Node &node) const noexcept
      -> PlacementCost;

  /// @brief Utility of placing @p fragment on @p node, clamped at 0.
  [[nodiscard]] auto utility(const Fragment &fragment,
                             const Node &node) const noexcept -> double;

  [[nodiscard]] auto config() const noexcept -> const PlannerConfig &;

private:
  PlannerConfig cfg_;
};

} // namespace frag_res
