/// @file simulated_transport.cpp
/// @brief Implementation of the prioritized simulated transfer engine.

#include "transport/simulated_transport.hpp"

#include <iterator>
#include <sstream>
#include <utility>

namespace frag_res {

namespace {

constexpr std::uint64_t kMiB = 1 << 20;

} // namespace

SimulatedTransport::SimulatedTransport(SimulatedTransportConfig cfg)
    : cfg_{cfg},
      rng_{cfg.seed != 0 ? cfg.seed : std::random_device{}()},
      worker_{[this] { loop(); }} {}

SimulatedTransport::~SimulatedTransport() { shutdown(); }

auto SimulatedTransport::latency_for(const TransferRequest &req) const
    -> double {
  using Seconds = std::chrono::duration<double>;
  const double base = Seconds(cfg_.base_latency).count();
  const double per_mib = Seconds(cfg_.per_mib_latency).count();
  // Whole MiB only: sub-MiB transfers cost the base latency.
  double latency =
      base + static_cast<double>(req.size_bytes / kMiB) * per_mib;
  if (req.priority <= 0) {
    latency /= 2.0;
  }
  return latency;
}

auto SimulatedTransport::enqueue(TransferRequest req) -> std::future<Result> {
  std::promise<Result> done;
  auto fut = done.get_future();

  if (req.source == req.dest) {
    done.set_value(TransferReceipt{.latency_s = 0.0});
    return fut;
  }

  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      done.set_value(std::unexpected(TransportErrc::Shutdown));
      return fut;
    }
    // Insert after every request of equal or higher urgency.
    auto pos = pending_.end();
    while (pos != pending_.begin() &&
           std::prev(pos)->req.priority > req.priority) {
      --pos;
    }
    pending_.insert(pos,
                    Pending{.req = std::move(req), .done = std::move(done)});
  }
  cv_.notify_one();
  return fut;
}

auto SimulatedTransport::migrate(const TransferRequest &req) -> Result {
  return enqueue(req).get();
}

void SimulatedTransport::set_reachable(NodeId node, bool reachable) {
  std::lock_guard lock(mu_);
  if (reachable) {
    unreachable_.erase(node);
  } else {
    unreachable_.insert(node);
  }
}

void SimulatedTransport::pause() {
  std::lock_guard lock(mu_);
  paused_ = true;
}

void SimulatedTransport::resume() {
  {
    std::lock_guard lock(mu_);
    paused_ = false;
  }
  cv_.notify_one();
}

void SimulatedTransport::shutdown() {
  std::deque<Pending> orphaned;
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    orphaned.swap(pending_);
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  for (auto &p : orphaned) {
    p.done.set_value(std::unexpected(TransportErrc::Shutdown));
  }
}

auto SimulatedTransport::service(const TransferRequest &req) -> Result {
  const double latency = latency_for(req);
  bool unreachable = false;
  bool rejected = false;
  {
    std::lock_guard lock(mu_);
    unreachable =
        unreachable_.contains(req.source) || unreachable_.contains(req.dest);
    if (!unreachable && cfg_.fail_rate > 0.0) {
      std::bernoulli_distribution fail(cfg_.fail_rate);
      rejected = fail(rng_);
    }
  }

  if (cfg_.realtime) {
    std::this_thread::sleep_for(std::chrono::duration<double>(latency));
  }

  if (unreachable) {
    return std::unexpected(TransportErrc::Unreachable);
  }
  if (rejected) {
    return std::unexpected(TransportErrc::Rejected);
  }
  return TransferReceipt{.latency_s = latency};
}

void SimulatedTransport::loop() {
  for (;;) {
    Pending next;
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, [this] {
        return stopping_ || (!paused_ && !pending_.empty());
      });
      if (stopping_) {
        return;
      }
      next = std::move(pending_.front());
      pending_.pop_front();
      service_log_.push_back(next.req.fragment);
    }

    auto result = service(next.req);
    {
      std::lock_guard lock(mu_);
      ++completed_;
    }
    next.done.set_value(std::move(result));
  }
}

auto SimulatedTransport::pending() const -> std::size_t {
  std::lock_guard lock(mu_);
  return pending_.size();
}

auto SimulatedTransport::completed() const -> std::size_t {
  std::lock_guard lock(mu_);
  return completed_;
}

auto SimulatedTransport::service_log() const -> std::vector<FragmentId> {
  std::lock_guard lock(mu_);
  return service_log_;
}

auto SimulatedTransport::stats() const -> std::string {
  std::lock_guard lock(mu_);
  std::ostringstream ss;
  ss << "SimulatedTransport: pending=" << pending_.size()
     << " completed=" << completed_;
  return ss.str();
}

} // namespace frag_res
