#pragma once
/// @file placement_planner.hpp
/// @brief Greedy utility-per-cost placement of fragments onto budgeted nodes.
///
/// An approximation of multi-knapsack packing, not globally optimal:
/// every (fragment, node) pair is ranked by rho = utility / cost, and pairs
/// are committed in rank order while the node's remaining budget allows.
/// Ties on rho are broken by (fragment id, node id) ascending, so identical
/// input always yields an identical plan.

#include "model/fragment.hpp"
#include "planner/cost_model.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace frag_res {

/// @brief Remaining budget of one node during a planning pass.
struct NodeBudget {
  double capacity;                    ///< Remaining scalar cost budget.
  std::optional<std::uint64_t> units; ///< Remaining units, if constrained.
};

/// @brief Per-node remaining-budget accumulator threaded through a pass.
///
/// A ledger is a plain value: each pass starts from a fresh ledger built
/// from the node snapshot and hands it from commit step to commit step.
class BudgetLedger {
public:
  BudgetLedger() = default;

  /// @brief Full budgets of every non-backing node in @p nodes.
  [[nodiscard]] static auto from_nodes(std::span<const Node> nodes)
      -> BudgetLedger;

  /// @brief True if @p node can absorb @p cost in every budget dimension.
  [[nodiscard]] auto fits(NodeId node, const PlacementCost &cost) const
      -> bool;

  /// @brief Deduct @p cost from @p node. Caller checks fits() first.
  void charge(NodeId node, const PlacementCost &cost);

  /// @brief Remaining budget of @p node, if the ledger tracks it.
  [[nodiscard]] auto remaining(NodeId node) const
      -> std::optional<NodeBudget>;

  [[nodiscard]] auto nodes() const -> const std::map<NodeId, NodeBudget> &;

private:
  std::map<NodeId, NodeBudget> budgets_;
};

/// @brief A scored (fragment, node) pair.
struct Candidate {
  const Fragment *fragment;
  const Node *node;
  PlacementCost cost;
  double utility;
  double rho;
};

/// @brief Strict weak order: rho descending, then fragment id, then node id.
[[nodiscard]] auto candidate_before(const Candidate &a, const Candidate &b)
    -> bool;

/// @brief One committed placement, in commit order.
struct Assignment {
  FragmentId fragment;
  NodeId node;
  double cost;
  double utility;
  double rho;
};

/// @brief Why a fragment ended up without a placement.
enum class UnplacedReason : std::uint8_t {
  ExceedsAllBudgets, ///< Cost exceeds every node's full budget: never placeable.
  BudgetExhausted,   ///< Would fit an empty node, but budgets ran out.
};

/// @brief Human-readable UnplacedReason.
[[nodiscard]] constexpr auto to_string(UnplacedReason r) -> const char * {
  switch (r) {
  case UnplacedReason::ExceedsAllBudgets:
    return "exceeds every node budget";
  case UnplacedReason::BudgetExhausted:
    return "remaining budgets exhausted";
  }
  return "unknown";
}

/// @brief A fragment absent from the plan.
struct Unplaced {
  FragmentId fragment;
  UnplacedReason reason;
};

/// @brief Planner output: placements, unplaced fragments and final budgets.
struct PlacementPlan {
  std::map<FragmentId, NodeId> placements; ///< fragment -> node.
  std::vector<Assignment> assignments;     ///< Commit order.
  std::vector<Unplaced> unplaced;          ///< Input order.
  BudgetLedger ledger;                     ///< Budgets left after the pass.

  [[nodiscard]] auto node_for(const FragmentId &id) const
      -> std::optional<NodeId>;
  [[nodiscard]] auto unplaced_ids() const -> std::vector<FragmentId>;
};

/// @brief Result of offering one candidate to the ledger.
struct CommitStep {
  BudgetLedger ledger;
  bool committed;
};

/// @brief Pure greedy planner.
class PlacementPlanner {
public:
  explicit PlacementPlanner(PlannerConfig cfg = {}) noexcept;

  /// @brief Plan a placement for @p fragments over @p nodes.
  ///
  /// Backing nodes are never targets. Zero fragments or zero target nodes
  /// yield an empty plan (every fragment unplaced).
  [[nodiscard]] auto plan(std::span<const Fragment> fragments,
                          std::span<const Node> nodes) const -> PlacementPlan;

  /// @brief Score and rank every (fragment, target node) pair.
  [[nodiscard]] auto rank(std::span<const Fragment> fragments,
                          std::span<const Node> nodes) const
      -> std::vector<Candidate>;

  /// @brief Offer @p c to @p ledger: charge and commit if it fits.
  [[nodiscard]] static auto try_commit(BudgetLedger ledger, const Candidate &c)
      -> CommitStep;

  [[nodiscard]] auto cost_model() const noexcept -> const CostModel &;

private:
  CostModel model_;
};

} // namespace frag_res
