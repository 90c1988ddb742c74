#pragma once
/// @file simulated_transport.hpp
/// @brief Prioritized transfer engine that models DMA/RDMA latency.
///
/// One worker thread services queued transfers in priority order (lower
/// value first, FIFO within a priority). Each transfer costs
///   base_latency + (size_bytes / MiB) * per_mib_latency
/// and urgent transfers (priority <= 0) take half that. Failures can be
/// injected at random or per node.

#include "transport/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace frag_res {

/// @brief SimulatedTransport configuration.
struct SimulatedTransportConfig {
  std::chrono::microseconds base_latency{2000};
  std::chrono::microseconds per_mib_latency{1000};
  double fail_rate = 0.0; ///< Probability a transfer is Rejected (0.0–1.0).
  bool realtime = true;   ///< Sleep for the modeled latency.
  std::uint64_t seed = 0; ///< RNG seed for failure injection (0 = random).
};

/// @brief In-process Transport with a modeled latency and failure profile.
class SimulatedTransport final : public Transport {
public:
  using Result = std::expected<TransferReceipt, TransportErrc>;

  explicit SimulatedTransport(SimulatedTransportConfig cfg = {});
  ~SimulatedTransport() override;

  SimulatedTransport(const SimulatedTransport &) = delete;
  SimulatedTransport &operator=(const SimulatedTransport &) = delete;

  /// @brief Enqueue and block until serviced.
  [[nodiscard]] auto migrate(const TransferRequest &req) -> Result override;

  /// @brief Enqueue without waiting.
  [[nodiscard]] auto enqueue(TransferRequest req) -> std::future<Result>;

  /// @brief Mark a node (un)reachable. Transfers touching it fail.
  void set_reachable(NodeId node, bool reachable);

  /// @brief Hold queued transfers until resume().
  void pause();
  void resume();

  /// @brief Stop the worker; queued transfers fail with Shutdown.
  void shutdown();

  /// @brief Modeled latency of @p req, in seconds.
  [[nodiscard]] auto latency_for(const TransferRequest &req) const -> double;

  [[nodiscard]] auto pending() const -> std::size_t;
  [[nodiscard]] auto completed() const -> std::size_t;

  /// @brief Fragment ids in the order they were serviced.
  [[nodiscard]] auto service_log() const -> std::vector<FragmentId>;

  /// @brief One-line queue summary.
  [[nodiscard]] auto stats() const -> std::string;

private:
  struct Pending {
    TransferRequest req;
    std::promise<Result> done;
  };

  void loop();
  [[nodiscard]] auto service(const TransferRequest &req) -> Result;

  SimulatedTransportConfig cfg_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Pending> pending_; ///< Sorted by priority, stable.
  std::set<NodeId> unreachable_;
  std::vector<FragmentId> service_log_;
  std::size_t completed_ = 0;
  bool paused_ = false;
  bool stopping_ = false;
  std::mt19937_64 rng_;

  std::thread worker_;
};

} // namespace frag_res
