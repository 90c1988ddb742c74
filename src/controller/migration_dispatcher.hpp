#pragma once
/// @file migration_dispatcher.hpp
/// @brief Concurrent dispatch of one epoch's migrations with a bounded wait.
///
/// Migrations are handed to a worker pool and may run concurrently; drain()
/// is the epoch's suspension point and returns only when every submitted
/// migration has succeeded, failed or timed out.
///
/// There is no cancellation. A migration that times out is reported as a
/// TimedOut failure, but its Transport call keeps running; until it returns
/// the fragment counts as busy and no new migration is accepted for it, so a
/// fragment never has two Transport calls outstanding.
///
/// Not thread-safe: owned and driven by the controller thread.

#include "controller/epoch_report.hpp"
#include "transport/transport.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <future>
#include <map>
#include <vector>

namespace frag_res {

/// @brief Dispatch configuration.
struct DispatchConfig {
  std::size_t threads = 4;                 ///< Worker pool size.
  std::chrono::milliseconds timeout{1000}; ///< Per-migration bound.
};

enum class DispatchError : std::uint8_t {
  AlreadyInFlight, ///< Fragment already has an outstanding Transport call.
};

[[nodiscard]] constexpr auto to_string(DispatchError e) -> const char * {
  switch (e) {
  case DispatchError::AlreadyInFlight:
    return "migration already in flight";
  }
  return "unknown";
}

class MigrationDispatcher {
public:
  using Clock = std::chrono::steady_clock;
  using Result = std::expected<TransferReceipt, TransportErrc>;

  explicit MigrationDispatcher(Transport &transport, DispatchConfig cfg = {});

  /// @brief Waits for every outstanding Transport call, stragglers included.
  ~MigrationDispatcher();

  MigrationDispatcher(const MigrationDispatcher &) = delete;
  MigrationDispatcher &operator=(const MigrationDispatcher &) = delete;

  /// @brief True if @p fragment has a submitted or straggling migration.
  [[nodiscard]] auto busy(const FragmentId &fragment) -> bool;

  /// @brief Start a migration. Never forwards source == dest.
  auto submit(MigrationRequest req) -> std::expected<void, DispatchError>;

  /// @brief Wait for every submitted migration; outcomes in submit order.
  [[nodiscard]] auto drain() -> std::vector<MigrationOutcome>;

  [[nodiscard]] auto in_flight() const noexcept -> std::size_t;

  /// @brief Timed-out calls that have not returned yet.
  [[nodiscard]] auto stragglers() -> std::size_t;

private:
  struct InFlight {
    MigrationRequest req;
    std::future<Result> result;
    Clock::time_point deadline;
  };

  /// @brief Forget stragglers whose Transport call has returned.
  void reap();

  Transport &transport_;
  DispatchConfig cfg_;
  boost::asio::thread_pool pool_;
  std::vector<InFlight> in_flight_;
  std::map<FragmentId, std::future<Result>> stragglers_;
};

} // namespace frag_res
