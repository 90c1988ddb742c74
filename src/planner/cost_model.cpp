/// @file cost_model.cpp
/// @brief Implementation of the placement cost/utility model.

#include "planner/cost_model.hpp"

#include <algorithm>

namespace frag_res {

CostModel::CostModel(PlannerConfig cfg) noexcept : cfg_{cfg} {
  // A zero unit size would divide by zero; treat it as byte granularity.
  if (cfg_.unit_size == 0) {
    cfg_.unit_size = 1;
  }
}

auto CostModel::units(const Fragment &fragment) const noexcept
    -> std::uint64_t {
  return (fragment.size + cfg_.unit_size - 1) / cfg_.unit_size;
}

auto CostModel::cost(const Fragment &fragment,
                     const Node & /*node*/) const noexcept -> double {
  const auto unit_bytes = static_cast<double>(units(fragment)) *
                          static_cast<double>(cfg_.unit_size);
  return static_cast<double>(fragment.size) +
         unit_bytes * cfg_.unit_pressure_weight;
}

auto CostModel::placement_cost(const Fragment &fragment,
                               const Node &node) const noexcept
    -> PlacementCost {
  return PlacementCost{
      .scalar = cost(fragment, node),
      .units = units(fragment),
  };
}

auto CostModel::utility(const Fragment &fragment,
                        const Node &node) const noexcept -> double {
  const auto &w = cfg_.weights;
  const double ub = w.reuse * static_cast<double>(fragment.reuse) +
                    w.importance * fragment.importance -
                    w.interference * node.predicted_interference;
  return std::max(0.0, ub);
}

auto CostModel::config() const noexcept -> const PlannerConfig & {
  return cfg_;
}

} // namespace frag_res
