#pragma once
/// @file metrics.hpp
/// @brief Migration metrics: transfer latency percentiles, bytes moved and
///        per-kind success/failure counts across a simulation run.

#include "controller/epoch_report.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace frag_res::sim {

/// @brief Snapshot of aggregate migration metrics.
struct MigrationStats {
  std::size_t total_migrations = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t timed_out = 0;
  std::size_t placements = 0; ///< Committed, by kind.
  std::size_t promotions = 0;
  std::size_t evictions = 0;
  /// Placements and evictions satisfied without a transfer (fragment was
  /// already on the target). Included in the per-kind counts above.
  std::size_t in_place = 0;
  std::size_t epochs = 0;        ///< Highest epoch recorded.
  std::uint64_t bytes_moved = 0; ///< Sum of sizes of committed moves.
  double elapsed_seconds = 0.0;

  // Transfer latency (seconds, as reported by the Transport).
  double min_latency_s = 0.0;
  double max_latency_s = 0.0;
  double avg_latency_s = 0.0;
  double p50_latency_s = 0.0;
  double p95_latency_s = 0.0;
  double p99_latency_s = 0.0;

  /// @brief Fraction of successful migrations (0.0–1.0).
  [[nodiscard]] auto success_rate() const -> double {
    return (total_migrations > 0) ? static_cast<double>(successful) /
                                        static_cast<double>(total_migrations)
                                  : 0.0;
  }

  /// @brief Committed bytes per wall-clock second, in MB/s.
  [[nodiscard]] auto bandwidth_mbps() const -> double {
    if (elapsed_seconds <= 0.0)
      return 0.0;
    return static_cast<double>(bytes_moved) / elapsed_seconds / 1'000'000.0;
  }
};

/// @brief Metrics collector fed with one EpochReport per epoch.
///
/// Keeps every latency sample and computes percentiles on demand.
/// Not thread-safe: fed from the epoch loop only.
class MigrationMetrics {
public:
  using Clock = std::chrono::steady_clock;

  MigrationMetrics() = default;

  /// @brief Record one migration outcome of @p size_bytes.
  void record(const MigrationOutcome &m, std::uint64_t size_bytes) {
    if (!m.ok) {
      ++fail_;
      if (m.error == TransportErrc::TimedOut) {
        ++timed_out_;
      }
      return;
    }
    ++ok_;
    latencies_.push_back(m.latency_s);
    bytes_ += size_bytes;
    switch (m.kind) {
    case MigrationKind::Placement:
      ++placements_;
      break;
    case MigrationKind::Promotion:
      ++promotions_;
      break;
    case MigrationKind::Eviction:
      ++evictions_;
      break;
    }
  }

  /// @brief Record every migration of @p report. @p size_of maps a fragment
  /// id to its size in bytes.
  template <typename SizeOf>
  void record(const EpochReport &report, SizeOf &&size_of) {
    epochs_ = std::max(epochs_, static_cast<std::size_t>(
                                    std::max<Epoch>(0, report.epoch)));
    std::size_t placed = 0;
    std::size_t evicted = 0;
    for (const auto &m : report.migrations) {
      record(m, size_of(m.fragment));
      if (m.ok && m.kind == MigrationKind::Placement) {
        ++placed;
      } else if (m.ok && m.kind == MigrationKind::Eviction) {
        ++evicted;
      }
    }

    // Listed as placed/evicted without a committed transfer.
    if (report.placed.size() > placed) {
      const auto extra = report.placed.size() - placed;
      placements_ += extra;
      in_place_ += extra;
    }
    if (report.evicted.size() > evicted) {
      const auto extra = report.evicted.size() - evicted;
      evictions_ += extra;
      in_place_ += extra;
    }
  }

  /// @brief Compute a snapshot with percentiles.
  [[nodiscard]] auto snapshot() const -> MigrationStats {
    MigrationStats s;
    s.successful = ok_;
    s.failed = fail_;
    s.timed_out = timed_out_;
    s.total_migrations = ok_ + fail_;
    s.placements = placements_;
    s.promotions = promotions_;
    s.evictions = evictions_;
    s.in_place = in_place_;
    s.epochs = epochs_;
    s.bytes_moved = bytes_;
    s.elapsed_seconds =
        std::chrono::duration<double>(end_time_ - start_time_).count();

    if (latencies_.empty()) {
      return s;
    }

    auto sorted = latencies_;
    std::sort(sorted.begin(), sorted.end());

    s.min_latency_s = sorted.front();
    s.max_latency_s = sorted.back();

    double sum = 0.0;
    for (auto v : sorted)
      sum += v;
    s.avg_latency_s = sum / static_cast<double>(sorted.size());

    auto pct = [&](double p) -> double {
      auto idx =
          static_cast<std::size_t>(p * static_cast<double>(sorted.size() - 1));
      return sorted[idx];
    };

    s.p50_latency_s = pct(0.50);
    s.p95_latency_s = pct(0.95);
    s.p99_latency_s = pct(0.99);

    return s;
  }

  void reset() {
    latencies_.clear();
    bytes_ = 0;
    ok_ = fail_ = timed_out_ = 0;
    placements_ = promotions_ = evictions_ = in_place_ = epochs_ = 0;
    start_time_ = end_time_ = Clock::time_point{};
  }

  void start() { start_time_ = Clock::now(); }
  void stop() { end_time_ = Clock::now(); }

private:
  std::vector<double> latencies_;
  std::uint64_t bytes_ = 0;
  std::size_t ok_ = 0;
  std::size_t fail_ = 0;
  std::size_t timed_out_ = 0;
  std::size_t placements_ = 0;
  std::size_t promotions_ = 0;
  std::size_t evictions_ = 0;
  std::size_t in_place_ = 0;
  std::size_t epochs_ = 0;
  Clock::time_point start_time_{};
  Clock::time_point end_time_{};
};

} // namespace frag_res::sim
