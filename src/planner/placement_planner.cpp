/// @file placement_planner.cpp
/// @brief Implementation of the greedy rho-ordered placement planner.

#include "planner/placement_planner.hpp"

#include <algorithm>

namespace frag_res {

// ─── BudgetLedger ───────────────────────────────────────────────────────

auto BudgetLedger::from_nodes(std::span<const Node> nodes) -> BudgetLedger {
  BudgetLedger ledger;
  for (const auto &n : nodes) {
    if (n.backing) {
      continue;
    }
    ledger.budgets_[n.id] = NodeBudget{
        .capacity = static_cast<double>(n.capacity_budget),
        .units = n.unit_budget,
    };
  }
  return ledger;
}

auto BudgetLedger::fits(NodeId node, const PlacementCost &cost) const
    -> bool {
  auto it = budgets_.find(node);
  if (it == budgets_.end()) {
    return false;
  }
  const auto &b = it->second;
  if (b.capacity < cost.scalar) {
    return false;
  }
  return !b.units.has_value() || *b.units >= cost.units;
}

void BudgetLedger::charge(NodeId node, const PlacementCost &cost) {
  auto &b = budgets_.at(node);
  b.capacity -= cost.scalar;
  if (b.units.has_value()) {
    *b.units -= cost.units;
  }
}

auto BudgetLedger::remaining(NodeId node) const -> std::optional<NodeBudget> {
  auto it = budgets_.find(node);
  if (it == budgets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto BudgetLedger::nodes() const -> const std::map<NodeId, NodeBudget> & {
  return budgets_;
}

// ─── Ordering ───────────────────────────────────────────────────────────

auto candidate_before(const Candidate &a, const Candidate &b) -> bool {
  if (a.rho != b.rho) {
    return a.rho > b.rho;
  }
  if (a.fragment->id != b.fragment->id) {
    return a.fragment->id < b.fragment->id;
  }
  return a.node->id < b.node->id;
}

// ─── PlacementPlan ──────────────────────────────────────────────────────

auto PlacementPlan::node_for(const FragmentId &id) const
    -> std::optional<NodeId> {
  auto it = placements.find(id);
  if (it == placements.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto PlacementPlan::unplaced_ids() const -> std::vector<FragmentId> {
  std::vector<FragmentId> ids;
  ids.reserve(unplaced.size());
  for (const auto &u : unplaced) {
    ids.push_back(u.fragment);
  }
  return ids;
}

// ─── PlacementPlanner ───────────────────────────────────────────────────

PlacementPlanner::PlacementPlanner(PlannerConfig cfg) noexcept
    : model_{cfg} {}

auto PlacementPlanner::rank(std::span<const Fragment> fragments,
                            std::span<const Node> nodes) const
    -> std::vector<Candidate> {
  std::vector<Candidate> candidates;
  candidates.reserve(fragments.size() * nodes.size());

  for (const auto &f : fragments) {
    for (const auto &n : nodes) {
      if (n.backing) {
        continue;
      }
      auto cost = model_.placement_cost(f, n);
      if (cost.scalar <= 0.0) {
        continue;
      }
      const double ub = model_.utility(f, n);
      candidates.push_back(Candidate{
          .fragment = &f,
          .node = &n,
          .cost = cost,
          .utility = ub,
          .rho = ub / cost.scalar,
      });
    }
  }

  // The comparator is a total order over distinct pairs, so the result does
  // not depend on the input permutation.
  std::sort(candidates.begin(), candidates.end(), candidate_before);
  return candidates;
}

auto PlacementPlanner::try_commit(BudgetLedger ledger, const Candidate &c)
    -> CommitStep {
  if (!ledger.fits(c.node->id, c.cost)) {
    return CommitStep{.ledger = std::move(ledger), .committed = false};
  }
  ledger.charge(c.node->id, c.cost);
  return CommitStep{.ledger = std::move(ledger), .committed = true};
}

auto PlacementPlanner::plan(std::span<const Fragment> fragments,
                            std::span<const Node> nodes) const
    -> PlacementPlan {
  PlacementPlan plan;
  auto ledger = BudgetLedger::from_nodes(nodes);

  for (const auto &c : rank(fragments, nodes)) {
    if (plan.placements.contains(c.fragment->id)) {
      continue;
    }
    auto step = try_commit(std::move(ledger), c);
    ledger = std::move(step.ledger);
    if (!step.committed) {
      continue;
    }
    plan.placements.emplace(c.fragment->id, c.node->id);
    plan.assignments.push_back(Assignment{
        .fragment = c.fragment->id,
        .node = c.node->id,
        .cost = c.cost.scalar,
        .utility = c.utility,
        .rho = c.rho,
    });
  }

  // Classify what is left against the full (initial) budgets.
  const auto full = BudgetLedger::from_nodes(nodes);
  for (const auto &f : fragments) {
    if (plan.placements.contains(f.id)) {
      continue;
    }
    const bool placeable =
        std::any_of(nodes.begin(), nodes.end(), [&](const Node &n) {
          return !n.backing && full.fits(n.id, model_.placement_cost(f, n));
        });
    plan.unplaced.push_back(Unplaced{
        .fragment = f.id,
        .reason = placeable ? UnplacedReason::BudgetExhausted
                            : UnplacedReason::ExceedsAllBudgets,
    });
  }

  plan.ledger = std::move(ledger);
  return plan;
}

auto PlacementPlanner::cost_model() const noexcept -> const CostModel & {
  return model_;
}

} // namespace frag_res
