#pragma once
/// @file residency_map.hpp
/// @brief Authoritative fragment -> node mapping with per-node budget
/// accounting and per-fragment migration state.
///
/// Every fragment is in exactly one of two states, held as a tagged variant:
///   - Resident{node}
///   - Migrating{from, to}: still resident on `from`; capacity on `to` is
///     reserved until the migration is committed or aborted.
/// A fragment's current node is therefore always defined (one node per
/// fragment), and a second migration for a fragment that is already
/// Migrating is rejected.
///
/// Budget rule: for every budgeted node, resident cost + reserved cost never
/// exceeds the node's capacity budget, and resident units + reserved units
/// never exceed its unit budget when it has one. Reservations are checked
/// when a migration begins, and the resident totals are checked again at
/// commit.
///
/// Thread-safety: all members are internally synchronized (shared_mutex);
/// the controller is the only writer.

#include "model/fragment.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <variant>
#include <vector>

namespace frag_res {

/// @brief Errors reported by ResidencyMap operations.
enum class ResidencyError : std::uint8_t {
  UnknownFragment,
  UnknownNode,
  DuplicateNode,
  AlreadyPlaced,
  AlreadyMigrating,
  NotMigrating,
  SameNode,
  BudgetExceeded,
};

/// @brief Human-readable description of a ResidencyError.
[[nodiscard]] constexpr auto to_string(ResidencyError e) -> const char * {
  switch (e) {
  case ResidencyError::UnknownFragment:
    return "unknown fragment";
  case ResidencyError::UnknownNode:
    return "unknown node";
  case ResidencyError::DuplicateNode:
    return "node already registered";
  case ResidencyError::AlreadyPlaced:
    return "fragment already has a residency";
  case ResidencyError::AlreadyMigrating:
    return "fragment already has an outstanding migration";
  case ResidencyError::NotMigrating:
    return "fragment has no outstanding migration";
  case ResidencyError::SameNode:
    return "source and destination are the same node";
  case ResidencyError::BudgetExceeded:
    return "node budget exceeded";
  }
  return "unknown";
}

/// @brief Fragment is resident on `node`.
struct Resident {
  NodeId node;
};

/// @brief Fragment is resident on `from` with a migration to `to` in flight.
struct Migrating {
  NodeId from;
  NodeId to;
  double reserved;              ///< Cost reserved on `to`.
  std::uint64_t reserved_units; ///< Indexing units reserved on `to`.
};

using ResidencyState = std::variant<Resident, Migrating>;

/// @brief Budget usage of one node.
struct NodeLoad {
  std::optional<double> budget; ///< Empty for backing stores.
  double resident = 0.0;        ///< Sum of costs of resident fragments.
  double reserved = 0.0;        ///< Sum of costs reserved by migrations.
  std::size_t fragments = 0;    ///< Resident fragment count.
  std::optional<std::uint64_t> unit_budget; ///< Empty when unconstrained.
  std::uint64_t units = 0;          ///< Units held by resident fragments.
  std::uint64_t reserved_units = 0; ///< Units reserved by migrations.
};

/// @brief One row of a residency snapshot.
struct ResidencyRecord {
  FragmentId fragment;
  NodeId node;                        ///< Current residency.
  std::optional<NodeId> migrating_to; ///< Set while Migrating.
  double cost;                        ///< Cost charged on `node`.
};

/// @brief The shared fragment -> node mapping.
class ResidencyMap {
public:
  ResidencyMap() = default;

  ResidencyMap(const ResidencyMap &) = delete;
  ResidencyMap &operator=(const ResidencyMap &) = delete;

  // ─── Topology ────────────────────────────────────────────────────────

  /// @brief Register a node. Backing nodes are unbudgeted.
  auto add_node(const Node &node) -> std::expected<void, ResidencyError>;

  [[nodiscard]] auto has_node(NodeId id) const -> bool;
  [[nodiscard]] auto node(NodeId id) const -> std::optional<Node>;
  [[nodiscard]] auto node_count() const -> std::size_t;
  [[nodiscard]] auto node_ids() const -> std::vector<NodeId>;
  [[nodiscard]] auto load(NodeId id) const -> std::optional<NodeLoad>;

  // ─── Placement and migration ─────────────────────────────────────────

  /// @brief Initial placement of a new fragment (charged against budget).
  auto install(const FragmentId &fragment, NodeId node, double cost,
               std::uint64_t units = 0) -> std::expected<void, ResidencyError>;

  /// @brief Resident{from} -> Migrating{from, to}; reserves @p cost and
  /// @p units on @p to.
  /// @return The source node.
  auto begin_migration(const FragmentId &fragment, NodeId to, double cost,
                       std::uint64_t units = 0)
      -> std::expected<NodeId, ResidencyError>;

  /// @brief Migrating{from, to} -> Resident{to}; moves the charge to @p to.
  /// @return The new node.
  auto commit_migration(const FragmentId &fragment)
      -> std::expected<NodeId, ResidencyError>;

  /// @brief Migrating{from, to} -> Resident{from}; releases the reservation.
  /// @return The unchanged node.
  auto abort_migration(const FragmentId &fragment)
      -> std::expected<NodeId, ResidencyError>;

  // ─── Queries ─────────────────────────────────────────────────────────

  [[nodiscard]] auto contains(const FragmentId &fragment) const -> bool;
  [[nodiscard]] auto node_of(const FragmentId &fragment) const
      -> std::optional<NodeId>;
  [[nodiscard]] auto state_of(const FragmentId &fragment) const
      -> std::optional<ResidencyState>;
  [[nodiscard]] auto is_migrating(const FragmentId &fragment) const -> bool;

  /// @brief Fragments currently resident on @p node, in id order.
  [[nodiscard]] auto scan_for_node(NodeId node) const
      -> std::vector<FragmentId>;

  /// @brief All fragments, in id order.
  [[nodiscard]] auto snapshot() const -> std::vector<ResidencyRecord>;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  struct Entry {
    ResidencyState state;
    double cost;         ///< Cost charged on the current node.
    std::uint64_t units; ///< Units charged on the current node.
  };

  struct NodeSlot {
    Node node;
    NodeLoad load;
  };

  [[nodiscard]] static auto has_room(const NodeLoad &load, double extra,
                                     std::uint64_t extra_units) -> bool;
  [[nodiscard]] static auto current_node(const ResidencyState &s) -> NodeId;

  mutable std::shared_mutex mu_;
  std::map<NodeId, NodeSlot> nodes_;
  std::map<FragmentId, Entry> entries_;
};

} // namespace frag_res
