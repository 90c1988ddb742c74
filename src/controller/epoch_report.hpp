#pragma once
/// @file epoch_report.hpp
/// @brief Structured result of one controller epoch (or plan application):
/// every migration outcome and every non-fatal condition met on the way.

#include "model/fragment.hpp"
#include "transport/transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace frag_res {

/// @brief Why a migration was requested.
enum class MigrationKind : std::uint8_t {
  Placement, ///< Realizing a PlacementPlan.
  Promotion, ///< Hot fragment to the fast node.
  Eviction,  ///< Expired, cold fragment back to the fallback node.
};

[[nodiscard]] constexpr auto to_string(MigrationKind k) -> const char * {
  switch (k) {
  case MigrationKind::Placement:
    return "placement";
  case MigrationKind::Promotion:
    return "promotion";
  case MigrationKind::Eviction:
    return "eviction";
  }
  return "unknown";
}

/// @brief Transport priority for a migration kind (lower is more urgent).
[[nodiscard]] constexpr auto transfer_priority(MigrationKind k) -> int {
  switch (k) {
  case MigrationKind::Promotion:
    return 0;
  case MigrationKind::Placement:
    return 1;
  case MigrationKind::Eviction:
    return 2;
  }
  return 2;
}

/// @brief A decided move, before dispatch.
struct MigrationRequest {
  FragmentId fragment;
  NodeId from;
  NodeId to;
  std::uint64_t size_bytes;
  MigrationKind kind;
};

/// @brief The settled result of one dispatched migration.
struct MigrationOutcome {
  FragmentId fragment;
  NodeId from;
  NodeId to;
  MigrationKind kind;
  bool ok;
  double latency_s = 0.0;
  std::optional<TransportErrc> error;
};

/// @brief Non-fatal conditions surfaced to the caller.
enum class EventKind : std::uint8_t {
  UnknownFragment,      ///< Access or plan entry for an untracked fragment.
  UnknownNode,          ///< Target node not registered.
  Deferred,             ///< Fragment already has a migration outstanding.
  InsufficientCapacity, ///< Destination cannot reserve the fragment's cost.
  TransportFailure,     ///< Transport error or timeout; residency unchanged.
};

[[nodiscard]] constexpr auto to_string(EventKind k) -> const char * {
  switch (k) {
  case EventKind::UnknownFragment:
    return "unknown_fragment";
  case EventKind::UnknownNode:
    return "unknown_node";
  case EventKind::Deferred:
    return "deferred";
  case EventKind::InsufficientCapacity:
    return "insufficient_capacity";
  case EventKind::TransportFailure:
    return "transport_failure";
  }
  return "unknown";
}

struct ControllerEvent {
  EventKind kind;
  FragmentId fragment;
  std::string detail;
};

/// @brief Everything that happened in one epoch.
struct EpochReport {
  Epoch epoch = 0;
  std::size_t accesses = 0;
  bool promotion_round = false;
  std::vector<FragmentId> promoted; ///< Committed promotions, rank order.
  std::vector<FragmentId> evicted;  ///< Evicted this epoch, id order.
  std::vector<FragmentId> placed;   ///< Committed placements (apply_plan).
  std::vector<MigrationOutcome> migrations; ///< Transport calls, submit order.
  std::vector<ControllerEvent> events;

  [[nodiscard]] auto failures() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(migrations.begin(), migrations.end(),
                      [](const MigrationOutcome &m) { return !m.ok; }));
  }
};

} // namespace frag_res
