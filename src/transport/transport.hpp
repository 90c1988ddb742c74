#pragma once
/// @file transport.hpp
/// @brief Interface of the collaborator that physically moves a fragment.
///
/// The core only decides what moves where and when. An implementation
/// performs the copy and reports latency or failure. Calls may block; the
/// controller dispatches them from worker threads and bounds the wait.

#include "model/fragment.hpp"

#include <cstdint>
#include <expected>

namespace frag_res {

/// @brief Why a transfer did not complete.
enum class TransportErrc : std::uint8_t {
  Unreachable, ///< Source or destination not reachable.
  Rejected,    ///< Transport refused or failed the copy.
  TimedOut,    ///< No answer within the dispatch timeout.
  Shutdown,    ///< Transport stopped before servicing the request.
};

/// @brief Human-readable description of a TransportErrc.
[[nodiscard]] constexpr auto to_string(TransportErrc e) -> const char * {
  switch (e) {
  case TransportErrc::Unreachable:
    return "unreachable";
  case TransportErrc::Rejected:
    return "rejected";
  case TransportErrc::TimedOut:
    return "timed out";
  case TransportErrc::Shutdown:
    return "transport shut down";
  }
  return "unknown";
}

/// @brief A single fragment transfer.
struct TransferRequest {
  FragmentId fragment;
  NodeId source;
  NodeId dest;
  std::uint64_t size_bytes = 0;
  int priority = 1; ///< Lower is more urgent.
};

/// @brief Successful transfer result.
struct TransferReceipt {
  double latency_s = 0.0; ///< Wall or simulated seconds (>= 0).
};

/// @brief Fragment mover.
///
/// Implementations must be safe to call concurrently for distinct
/// fragments, and must treat source == dest as an immediate zero-latency
/// success (the core never issues such a call).
class Transport {
public:
  virtual ~Transport() = default;

  [[nodiscard]] virtual auto migrate(const TransferRequest &req)
      -> std::expected<TransferReceipt, TransportErrc> = 0;
};

} // namespace frag_res
