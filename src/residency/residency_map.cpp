/// @file residency_map.cpp
/// @brief Implementation of the residency map.

#include "residency/residency_map.hpp"

#include <mutex>

namespace frag_res {

namespace {

/// Absorbs rounding drift from repeated += / -= on resident totals.
constexpr double kRelativeSlack = 1e-9;

} // namespace

auto ResidencyMap::has_room(const NodeLoad &load, double extra,
                            std::uint64_t extra_units) -> bool {
  if (!load.budget.has_value()) {
    return true;
  }
  if (load.unit_budget.has_value() &&
      load.units + load.reserved_units + extra_units > *load.unit_budget) {
    return false;
  }
  const double limit = *load.budget * (1.0 + kRelativeSlack);
  return load.resident + load.reserved + extra <= limit;
}

auto ResidencyMap::current_node(const ResidencyState &s) -> NodeId {
  if (const auto *r = std::get_if<Resident>(&s)) {
    return r->node;
  }
  return std::get<Migrating>(s).from;
}

// ─── Topology ───────────────────────────────────────────────────────────

auto ResidencyMap::add_node(const Node &node)
    -> std::expected<void, ResidencyError> {
  std::unique_lock lock(mu_);
  if (nodes_.contains(node.id)) {
    return std::unexpected(ResidencyError::DuplicateNode);
  }
  NodeSlot slot{.node = node, .load = {}};
  if (!node.backing) {
    slot.load.budget = static_cast<double>(node.capacity_budget);
    slot.load.unit_budget = node.unit_budget;
  }
  nodes_.emplace(node.id, slot);
  return {};
}

auto ResidencyMap::has_node(NodeId id) const -> bool {
  std::shared_lock lock(mu_);
  return nodes_.contains(id);
}

auto ResidencyMap::node(NodeId id) const -> std::optional<Node> {
  std::shared_lock lock(mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second.node;
}

auto ResidencyMap::node_count() const -> std::size_t {
  std::shared_lock lock(mu_);
  return nodes_.size();
}

auto ResidencyMap::node_ids() const -> std::vector<NodeId> {
  std::shared_lock lock(mu_);
  std::vector<NodeId> ids;
  ids.reserve(nodes_.size());
  for (const auto &[id, slot] : nodes_) {
    ids.push_back(id);
  }
  return ids;
}

auto ResidencyMap::load(NodeId id) const -> std::optional<NodeLoad> {
  std::shared_lock lock(mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second.load;
}

// ─── Placement and migration ────────────────────────────────────────────

auto ResidencyMap::install(const FragmentId &fragment, NodeId node,
                           double cost, std::uint64_t units)
    -> std::expected<void, ResidencyError> {
  std::unique_lock lock(mu_);
  auto nit = nodes_.find(node);
  if (nit == nodes_.end()) {
    return std::unexpected(ResidencyError::UnknownNode);
  }
  if (entries_.contains(fragment)) {
    return std::unexpected(ResidencyError::AlreadyPlaced);
  }
  auto &load = nit->second.load;
  if (!has_room(load, cost, units)) {
    return std::unexpected(ResidencyError::BudgetExceeded);
  }

  load.resident += cost;
  load.units += units;
  ++load.fragments;
  entries_.emplace(fragment,
                   Entry{.state = Resident{node}, .cost = cost, .units = units});
  return {};
}

auto ResidencyMap::begin_migration(const FragmentId &fragment, NodeId to,
                                   double cost, std::uint64_t units)
    -> std::expected<NodeId, ResidencyError> {
  std::unique_lock lock(mu_);
  auto eit = entries_.find(fragment);
  if (eit == entries_.end()) {
    return std::unexpected(ResidencyError::UnknownFragment);
  }
  auto nit = nodes_.find(to);
  if (nit == nodes_.end()) {
    return std::unexpected(ResidencyError::UnknownNode);
  }

  auto &entry = eit->second;
  const auto *resident = std::get_if<Resident>(&entry.state);
  if (resident == nullptr) {
    return std::unexpected(ResidencyError::AlreadyMigrating);
  }
  const NodeId from = resident->node;
  if (from == to) {
    return std::unexpected(ResidencyError::SameNode);
  }

  auto &dst = nit->second.load;
  if (!has_room(dst, cost, units)) {
    return std::unexpected(ResidencyError::BudgetExceeded);
  }

  dst.reserved += cost;
  dst.reserved_units += units;
  entry.state = Migrating{
      .from = from, .to = to, .reserved = cost, .reserved_units = units};
  return from;
}

auto ResidencyMap::commit_migration(const FragmentId &fragment)
    -> std::expected<NodeId, ResidencyError> {
  std::unique_lock lock(mu_);
  auto eit = entries_.find(fragment);
  if (eit == entries_.end()) {
    return std::unexpected(ResidencyError::UnknownFragment);
  }
  auto &entry = eit->second;
  const auto *m = std::get_if<Migrating>(&entry.state);
  if (m == nullptr) {
    return std::unexpected(ResidencyError::NotMigrating);
  }

  auto &src = nodes_.at(m->from).load;
  auto &dst = nodes_.at(m->to).load;

  // Commit-time check: the reservation must still cover the move.
  dst.reserved -= m->reserved;
  dst.reserved_units -= m->reserved_units;
  if (!has_room(dst, m->reserved, m->reserved_units)) {
    dst.reserved += m->reserved;
    dst.reserved_units += m->reserved_units;
    return std::unexpected(ResidencyError::BudgetExceeded);
  }

  src.resident -= entry.cost;
  src.units -= entry.units;
  --src.fragments;
  dst.resident += m->reserved;
  dst.units += m->reserved_units;
  ++dst.fragments;

  const NodeId to = m->to;
  entry.cost = m->reserved;
  entry.units = m->reserved_units;
  entry.state = Resident{to};
  return to;
}

auto ResidencyMap::abort_migration(const FragmentId &fragment)
    -> std::expected<NodeId, ResidencyError> {
  std::unique_lock lock(mu_);
  auto eit = entries_.find(fragment);
  if (eit == entries_.end()) {
    return std::unexpected(ResidencyError::UnknownFragment);
  }
  auto &entry = eit->second;
  const auto *m = std::get_if<Migrating>(&entry.state);
  if (m == nullptr) {
    return std::unexpected(ResidencyError::NotMigrating);
  }

  auto &dst = nodes_.at(m->to).load;
  dst.reserved -= m->reserved;
  dst.reserved_units -= m->reserved_units;
  const NodeId from = m->from;
  entry.state = Resident{from};
  return from;
}

// ─── Queries ────────────────────────────────────────────────────────────

auto ResidencyMap::contains(const FragmentId &fragment) const -> bool {
  std::shared_lock lock(mu_);
  return entries_.contains(fragment);
}

auto ResidencyMap::node_of(const FragmentId &fragment) const
    -> std::optional<NodeId> {
  std::shared_lock lock(mu_);
  auto it = entries_.find(fragment);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return current_node(it->second.state);
}

auto ResidencyMap::state_of(const FragmentId &fragment) const
    -> std::optional<ResidencyState> {
  std::shared_lock lock(mu_);
  auto it = entries_.find(fragment);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

auto ResidencyMap::is_migrating(const FragmentId &fragment) const -> bool {
  std::shared_lock lock(mu_);
  auto it = entries_.find(fragment);
  return it != entries_.end() &&
         std::holds_alternative<Migrating>(it->second.state);
}

auto ResidencyMap::scan_for_node(NodeId node) const
    -> std::vector<FragmentId> {
  std::shared_lock lock(mu_);
  std::vector<FragmentId> out;
  for (const auto &[id, entry] : entries_) {
    if (current_node(entry.state) == node) {
      out.push_back(id);
    }
  }
  return out;
}

auto ResidencyMap::snapshot() const -> std::vector<ResidencyRecord> {
  std::shared_lock lock(mu_);
  std::vector<ResidencyRecord> out;
  out.reserve(entries_.size());
  for (const auto &[id, entry] : entries_) {
    ResidencyRecord rec{
        .fragment = id,
        .node = current_node(entry.state),
        .migrating_to = std::nullopt,
        .cost = entry.cost,
    };
    if (const auto *m = std::get_if<Migrating>(&entry.state)) {
      rec.migrating_to = m->to;
    }
    out.push_back(std::move(rec));
  }
  return out;
}

auto ResidencyMap::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return entries_.size();
}

} // namespace frag_res
