#pragma once
/// @file residency_controller.hpp
/// @brief Online, epoch-driven residency policy: leases, hotness, promotion
/// to the fast node and eviction back to the fallback node.
///
/// Each step() advances the epoch by one and runs three phases in order:
///   1. access     hotness += dh, expiry = max(expiry, epoch + access_grace)
///   2. promotion  every promotion_interval epochs, top-K by hotness move to
///                 the fast node
///   3. eviction   expiry <= epoch and hotness < evict_threshold: move to the
///                 fallback node, lease = epoch + 1
/// The epoch ends only when every migration it requested has settled.
///
/// Steps and plan applications are serialized by an internal mutex.

#include "controller/epoch_report.hpp"
#include "controller/migration_dispatcher.hpp"
#include "model/fragment.hpp"
#include "planner/cost_model.hpp"
#include "planner/placement_planner.hpp"
#include "residency/residency_map.hpp"
#include "transport/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace frag_res {

/// @brief Lease extension granted by a successful eviction. Shorter than the
/// access grace: an evicted fragment gets one epoch to be touched again.
inline constexpr Epoch kEvictionGrace = 1;

/// @brief Controller policy constants.
struct ControllerConfig {
  double evict_threshold = 0.5;         ///< H_EVICT.
  double hotness_increment = 0.01;      ///< dh per access.
  Epoch access_grace = 2;               ///< Lease extension per access.
  Epoch initial_lease = 2;              ///< Default lease for track().
  Epoch promotion_interval = 5;         ///< P (0 disables promotion).
  std::size_t promotion_fanout = 4;     ///< K.
  NodeId fast_node = 1;                 ///< Promotion target.
  NodeId fallback_node = 0;             ///< Eviction target.
  DispatchConfig dispatch{};
};

/// @brief Optional initial state for a newly tracked fragment.
struct FragmentSeed {
  std::optional<Epoch> expiry; ///< Defaults to epoch + initial_lease.
  double hotness = 0.0;
};

/// @brief Per-fragment controller state.
struct FragmentRecord {
  Fragment fragment;
  Epoch expiry;
  double hotness;
  std::size_t soft_failures = 0; ///< Failed migrations so far.
};

enum class TrackError : std::uint8_t {
  NotResident,    ///< No ResidencyMap entry for the fragment.
  AlreadyTracked, ///< Fragment id already known to the controller.
  InvalidSeed,    ///< Negative or non-finite hotness.
};

[[nodiscard]] constexpr auto to_string(TrackError e) -> const char * {
  switch (e) {
  case TrackError::NotResident:
    return "fragment has no residency";
  case TrackError::AlreadyTracked:
    return "fragment already tracked";
  case TrackError::InvalidSeed:
    return "invalid fragment seed";
  }
  return "unknown";
}

class ResidencyController {
public:
  ResidencyController(ResidencyMap &residency, Transport &transport,
                      ControllerConfig cfg = {},
                      PlannerConfig planner_cfg = {});

  ResidencyController(const ResidencyController &) = delete;
  ResidencyController &operator=(const ResidencyController &) = delete;

  /// @brief Start managing a fragment that already has a residency.
  auto track(const Fragment &fragment, FragmentSeed seed = {})
      -> std::expected<void, TrackError>;

  /// @brief Advance one epoch with the given batch of accessed ids.
  auto step(std::span<const FragmentId> accessed) -> EpochReport;

  /// @brief Migrate every assigned fragment to its planned node.
  ///
  /// Runs in the current epoch (the epoch is not advanced). Assignments for
  /// untracked fragments are reported as UnknownFragment events.
  auto apply_plan(const PlacementPlan &plan) -> EpochReport;

  [[nodiscard]] auto epoch() const -> Epoch;
  [[nodiscard]] auto lease(const FragmentId &id) const -> std::optional<Epoch>;
  [[nodiscard]] auto hotness(const FragmentId &id) const
      -> std::optional<double>;
  [[nodiscard]] auto record(const FragmentId &id) const
      -> std::optional<FragmentRecord>;
  [[nodiscard]] auto tracked() const -> std::size_t;

  /// @brief Current hotness of every tracked fragment.
  [[nodiscard]] auto hotness_table() const -> std::map<FragmentId, double>;

  /// @brief Up to @p k fragment ids by hotness descending, id ascending.
  [[nodiscard]] auto hottest(std::size_t k) const -> std::vector<FragmentId>;

  /// @brief Timed-out migrations whose Transport call is still running.
  [[nodiscard]] auto stragglers() -> std::size_t;

  [[nodiscard]] auto config() const noexcept -> const ControllerConfig &;

private:
  void access_phase(std::span<const FragmentId> accessed, EpochReport &report);
  void promotion_phase(EpochReport &report);
  void eviction_phase(EpochReport &report);

  /// @brief Reserve capacity and submit one migration. Returns false and
  /// records an event when the migration cannot start.
  auto request(const FragmentRecord &rec, NodeId to, MigrationKind kind,
               EpochReport &report) -> bool;

  /// @brief Drain the dispatcher and commit or abort every outcome.
  void settle(EpochReport &report);

  [[nodiscard]] auto hottest_locked(std::size_t k) const
      -> std::vector<FragmentId>;

  ResidencyMap &residency_;
  ControllerConfig cfg_;
  CostModel model_;
  MigrationDispatcher dispatcher_;

  mutable std::mutex epoch_mutex_;
  Epoch epoch_ = 0;
  std::map<FragmentId, FragmentRecord> records_;
};

} // namespace frag_res
