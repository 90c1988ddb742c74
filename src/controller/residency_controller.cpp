/// @file residency_controller.cpp
/// @brief Implementation of the epoch-driven residency controller.

#include "controller/residency_controller.hpp"
#include "residency/invariant.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace frag_res {

ResidencyController::ResidencyController(ResidencyMap &residency,
                                         Transport &transport,
                                         ControllerConfig cfg,
                                         PlannerConfig planner_cfg)
    : residency_{residency}, cfg_{cfg}, model_{planner_cfg},
      dispatcher_{transport, cfg.dispatch} {}

auto ResidencyController::track(const Fragment &fragment, FragmentSeed seed)
    -> std::expected<void, TrackError> {
  std::lock_guard lock(epoch_mutex_);
  if (!residency_.contains(fragment.id)) {
    return std::unexpected(TrackError::NotResident);
  }
  if (records_.contains(fragment.id)) {
    return std::unexpected(TrackError::AlreadyTracked);
  }
  if (!std::isfinite(seed.hotness) || seed.hotness < 0.0) {
    return std::unexpected(TrackError::InvalidSeed);
  }

  const Epoch expiry = seed.expiry.value_or(epoch_ + cfg_.initial_lease);
  records_.emplace(fragment.id, FragmentRecord{.fragment = fragment,
                                               .expiry = expiry,
                                               .hotness = seed.hotness});
  return {};
}

// ─── Epoch ──────────────────────────────────────────────────────────────

auto ResidencyController::step(std::span<const FragmentId> accessed)
    -> EpochReport {
  std::lock_guard lock(epoch_mutex_);
  ++epoch_;

  EpochReport report{.epoch = epoch_};
  access_phase(accessed, report);

  if (cfg_.promotion_interval > 0 && epoch_ % cfg_.promotion_interval == 0 &&
      residency_.node_count() > 1) {
    report.promotion_round = true;
    promotion_phase(report);
  }

  eviction_phase(report);
  settle(report);

  std::sort(report.evicted.begin(), report.evicted.end());
  return report;
}

auto ResidencyController::apply_plan(const PlacementPlan &plan)
    -> EpochReport {
  std::lock_guard lock(epoch_mutex_);
  EpochReport report{.epoch = epoch_};

  for (const auto &a : plan.assignments) {
    auto it = records_.find(a.fragment);
    if (it == records_.end()) {
      report.events.push_back({.kind = EventKind::UnknownFragment,
                               .fragment = a.fragment,
                               .detail = "planned fragment is not tracked"});
      continue;
    }
    if (residency_.node_of(a.fragment) == a.node) {
      report.placed.push_back(a.fragment);
      continue;
    }
    request(it->second, a.node, MigrationKind::Placement, report);
  }

  settle(report);
  return report;
}

void ResidencyController::access_phase(std::span<const FragmentId> accessed,
                                       EpochReport &report) {
  for (const auto &id : accessed) {
    auto it = records_.find(id);
    if (it == records_.end()) {
      report.events.push_back({.kind = EventKind::UnknownFragment,
                               .fragment = id,
                               .detail = "access to untracked fragment"});
      continue;
    }
    auto &rec = it->second;
    rec.hotness += cfg_.hotness_increment;
    rec.expiry = std::max(rec.expiry, epoch_ + cfg_.access_grace);
    ++report.accesses;
  }
}

void ResidencyController::promotion_phase(EpochReport &report) {
  for (const auto &id : hottest_locked(cfg_.promotion_fanout)) {
    if (residency_.node_of(id) == cfg_.fast_node) {
      continue;
    }
    request(records_.at(id), cfg_.fast_node, MigrationKind::Promotion, report);
  }
}

void ResidencyController::eviction_phase(EpochReport &report) {
  for (auto &[id, rec] : records_) {
    if (rec.expiry > epoch_ || rec.hotness >= cfg_.evict_threshold) {
      continue;
    }
    if (residency_.node_of(id) == cfg_.fallback_node &&
        !dispatcher_.busy(id)) {
      // Already home: no transfer, the lease is renewed in place.
      rec.expiry = epoch_ + kEvictionGrace;
      report.evicted.push_back(id);
      continue;
    }
    request(rec, cfg_.fallback_node, MigrationKind::Eviction, report);
  }
}

auto ResidencyController::request(const FragmentRecord &rec, NodeId to,
                                  MigrationKind kind, EpochReport &report)
    -> bool {
  const auto &id = rec.fragment.id;
  const auto dest = residency_.node(to);
  if (!dest) {
    report.events.push_back({.kind = EventKind::UnknownNode,
                             .fragment = id,
                             .detail = std::string(to_string(kind)) +
                                       " target node " + std::to_string(to) +
                                       " is not registered"});
    return false;
  }
  if (dispatcher_.busy(id)) {
    report.events.push_back({.kind = EventKind::Deferred,
                             .fragment = id,
                             .detail = std::string(to_string(kind)) +
                                       " deferred: migration outstanding"});
    return false;
  }

  const double cost = model_.cost(rec.fragment, *dest);
  auto from =
      residency_.begin_migration(id, to, cost, model_.units(rec.fragment));
  if (!from) {
    FRAG_RES_INVARIANT(from.error() == ResidencyError::BudgetExceeded,
                       "begin_migration on an idle, tracked fragment");
    report.events.push_back({.kind = EventKind::InsufficientCapacity,
                             .fragment = id,
                             .detail = std::string(to_string(kind)) +
                                       " to node " + std::to_string(to) +
                                       ": " + to_string(from.error())});
    return false;
  }

  auto submitted = dispatcher_.submit(MigrationRequest{
      .fragment = id,
      .from = *from,
      .to = to,
      .size_bytes = rec.fragment.size,
      .kind = kind,
  });
  FRAG_RES_INVARIANT(submitted.has_value(), "submit on an idle fragment");
  return true;
}

void ResidencyController::settle(EpochReport &report) {
  for (auto &out : dispatcher_.drain()) {
    auto &rec = records_.at(out.fragment);
    if (out.ok) {
      auto to = residency_.commit_migration(out.fragment);
      FRAG_RES_INVARIANT(to.has_value(), "commit of a reserved migration");
      switch (out.kind) {
      case MigrationKind::Placement:
        report.placed.push_back(out.fragment);
        break;
      case MigrationKind::Promotion:
        report.promoted.push_back(out.fragment);
        break;
      case MigrationKind::Eviction:
        rec.expiry = epoch_ + kEvictionGrace;
        report.evicted.push_back(out.fragment);
        break;
      }
    } else {
      auto from = residency_.abort_migration(out.fragment);
      FRAG_RES_INVARIANT(from.has_value(), "abort of a reserved migration");
      ++rec.soft_failures;
      const char *why = out.error ? to_string(*out.error) : "failed";
      report.events.push_back({.kind = EventKind::TransportFailure,
                               .fragment = out.fragment,
                               .detail = std::string(to_string(out.kind)) +
                                         " to node " +
                                         std::to_string(out.to) + ": " + why});
    }
    report.migrations.push_back(std::move(out));
  }
}

// ─── Queries ────────────────────────────────────────────────────────────

auto ResidencyController::hottest_locked(std::size_t k) const
    -> std::vector<FragmentId> {
  std::vector<const FragmentRecord *> ranked;
  ranked.reserve(records_.size());
  for (const auto &[id, rec] : records_) {
    ranked.push_back(&rec);
  }
  const auto n = std::min(k, ranked.size());
  std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n),
                    ranked.end(),
                    [](const FragmentRecord *a, const FragmentRecord *b) {
                      if (a->hotness != b->hotness) {
                        return a->hotness > b->hotness;
                      }
                      return a->fragment.id < b->fragment.id;
                    });

  std::vector<FragmentId> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(ranked[i]->fragment.id);
  }
  return out;
}

auto ResidencyController::hottest(std::size_t k) const
    -> std::vector<FragmentId> {
  std::lock_guard lock(epoch_mutex_);
  return hottest_locked(k);
}

auto ResidencyController::epoch() const -> Epoch {
  std::lock_guard lock(epoch_mutex_);
  return epoch_;
}

auto ResidencyController::lease(const FragmentId &id) const
    -> std::optional<Epoch> {
  std::lock_guard lock(epoch_mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.expiry;
}

auto ResidencyController::hotness(const FragmentId &id) const
    -> std::optional<double> {
  std::lock_guard lock(epoch_mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.hotness;
}

auto ResidencyController::record(const FragmentId &id) const
    -> std::optional<FragmentRecord> {
  std::lock_guard lock(epoch_mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ResidencyController::tracked() const -> std::size_t {
  std::lock_guard lock(epoch_mutex_);
  return records_.size();
}

auto ResidencyController::hotness_table() const
    -> std::map<FragmentId, double> {
  std::lock_guard lock(epoch_mutex_);
  std::map<FragmentId, double> out;
  for (const auto &[id, rec] : records_) {
    out.emplace(id, rec.hotness);
  }
  return out;
}

auto ResidencyController::stragglers() -> std::size_t {
  std::lock_guard lock(epoch_mutex_);
  return dispatcher_.stragglers();
}

auto ResidencyController::config() const noexcept -> const ControllerConfig & {
  return cfg_;
}

} // namespace frag_res
