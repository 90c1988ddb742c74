/// @file migration_dispatcher.cpp
/// @brief Implementation of the pooled migration dispatcher.

#include "controller/migration_dispatcher.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

namespace frag_res {

MigrationDispatcher::MigrationDispatcher(Transport &transport,
                                         DispatchConfig cfg)
    : transport_{transport}, cfg_{cfg},
      pool_{std::max<std::size_t>(1, cfg.threads)} {}

MigrationDispatcher::~MigrationDispatcher() { pool_.join(); }

void MigrationDispatcher::reap() {
  std::erase_if(stragglers_, [](const auto &entry) {
    return entry.second.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
  });
}

auto MigrationDispatcher::busy(const FragmentId &fragment) -> bool {
  reap();
  if (stragglers_.contains(fragment)) {
    return true;
  }
  return std::any_of(in_flight_.begin(), in_flight_.end(),
                     [&](const InFlight &f) { return f.req.fragment == fragment; });
}

auto MigrationDispatcher::submit(MigrationRequest req)
    -> std::expected<void, DispatchError> {
  if (busy(req.fragment)) {
    return std::unexpected(DispatchError::AlreadyInFlight);
  }

  const auto deadline = Clock::now() + cfg_.timeout;

  if (req.from == req.to) {
    std::promise<Result> done;
    done.set_value(TransferReceipt{.latency_s = 0.0});
    in_flight_.push_back(InFlight{
        .req = std::move(req), .result = done.get_future(), .deadline = deadline});
    return {};
  }

  TransferRequest transfer{
      .fragment = req.fragment,
      .source = req.from,
      .dest = req.to,
      .size_bytes = req.size_bytes,
      .priority = transfer_priority(req.kind),
  };

  auto task = std::make_shared<std::packaged_task<Result()>>(
      [&transport = transport_, transfer = std::move(transfer)] {
        return transport.migrate(transfer);
      });
  auto result = task->get_future();
  boost::asio::post(pool_, [task] { (*task)(); });

  in_flight_.push_back(InFlight{
      .req = std::move(req), .result = std::move(result), .deadline = deadline});
  return {};
}

auto MigrationDispatcher::drain() -> std::vector<MigrationOutcome> {
  std::vector<MigrationOutcome> outcomes;
  outcomes.reserve(in_flight_.size());

  for (auto &f : in_flight_) {
    MigrationOutcome out{
        .fragment = f.req.fragment,
        .from = f.req.from,
        .to = f.req.to,
        .kind = f.req.kind,
        .ok = false,
    };

    if (f.result.wait_until(f.deadline) != std::future_status::ready) {
      out.error = TransportErrc::TimedOut;
      stragglers_.emplace(f.req.fragment, std::move(f.result));
      outcomes.push_back(std::move(out));
      continue;
    }

    try {
      auto result = f.result.get();
      if (result.has_value()) {
        out.ok = true;
        out.latency_s = result->latency_s;
      } else {
        out.error = result.error();
      }
    } catch (const std::exception &) {
      // A throwing Transport is a failed transfer, not a crashed epoch.
      out.error = TransportErrc::Rejected;
    }
    outcomes.push_back(std::move(out));
  }

  in_flight_.clear();
  return outcomes;
}

auto MigrationDispatcher::in_flight() const noexcept -> std::size_t {
  return in_flight_.size();
}

auto MigrationDispatcher::stragglers() -> std::size_t {
  reap();
  return stragglers_.size();
}

} // namespace frag_res
