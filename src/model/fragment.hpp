#pragma once
/// @file fragment.hpp
/// @brief Core value types: fragments, nodes and the identifiers that link
/// them across the planner, the residency map and the controller.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace frag_res {

/// @brief Stable fragment identity (e.g. "f0001").
using FragmentId = std::string;

/// @brief Node identity. Ordered numerically for tie-breaking.
using NodeId = std::uint32_t;

/// @brief Discrete logical time step.
using Epoch = std::int64_t;

/// @brief A movable unit of data. Immutable for the duration of a planning
/// pass.
struct Fragment {
  FragmentId id;         ///< Unique identity.
  std::uint64_t size;    ///< Payload size in bytes (> 0).
  double importance;     ///< Caller-supplied weight.
  std::uint64_t reuse;   ///< Predicted reuse count.
  std::string timescale; ///< Informational category ("short", "long", ...).
};

/// @brief A placement target with one or more capacity budgets.
struct Node {
  NodeId id;                           ///< Unique identity.
  std::uint64_t capacity_budget;       ///< Scalar cost budget (pseudo-bytes).
  double predicted_interference = 0.0; ///< Utility penalty (>= 0).
  /// Optional second budget dimension counted in indexing units (mapping
  /// table slots). Unconstrained when empty.
  std::optional<std::uint64_t> unit_budget;
  /// Backing store (fragment origin). Never a planner target and never
  /// budget-limited in the residency map.
  bool backing = false;
};

} // namespace frag_res
