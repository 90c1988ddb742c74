#pragma once
/// @file config.hpp
/// @brief Runtime configuration: planner, controller and simulated transport
/// settings, optionally loaded from a JSON file.
///
/// Every key is optional; absent keys keep their defaults.
/// @code
///   {
///     "planner":    {"unit_size":4096, "unit_pressure_weight":0.1,
///                    "weights":{"reuse":1.0,"importance":0.8,
///                               "interference":0.5}},
///     "controller": {"evict_threshold":0.5, "hotness_increment":0.01,
///                    "access_grace":2, "initial_lease":2,
///                    "promotion_interval":5, "promotion_fanout":4,
///                    "fast_node":1, "fallback_node":0,
///                    "dispatch":{"threads":4,"timeout_ms":1000}},
///     "transport":  {"base_latency_us":2000, "per_mib_latency_us":1000,
///                    "fail_rate":0.0, "realtime":true, "seed":0}
///   }
/// @endcode

#include "controller/residency_controller.hpp"
#include "model/fragment.hpp"
#include "planner/cost_model.hpp"
#include "transport/simulated_transport.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace frag_res {

enum class ConfigErrc : std::uint8_t {
  Unreadable,
  Syntax,
  WrongType,
  InvalidValue,
  UnknownNode, ///< fast/fallback node absent from the topology.
};

[[nodiscard]] constexpr auto to_string(ConfigErrc e) -> const char * {
  switch (e) {
  case ConfigErrc::Unreadable:
    return "config unreadable";
  case ConfigErrc::Syntax:
    return "config is not valid JSON";
  case ConfigErrc::WrongType:
    return "wrong config value type";
  case ConfigErrc::InvalidValue:
    return "invalid config value";
  case ConfigErrc::UnknownNode:
    return "config references an unknown node";
  }
  return "unknown";
}

struct ConfigError {
  ConfigErrc code;
  std::string detail; ///< e.g. "controller.dispatch.threads".

  [[nodiscard]] auto message() const -> std::string {
    return std::string{to_string(code)} + ": " + detail;
  }
};

/// @brief Everything the executables need to build a planner, a controller
/// and a simulated transport.
struct RuntimeConfig {
  PlannerConfig planner{};
  ControllerConfig controller{};
  SimulatedTransportConfig transport{};
};

[[nodiscard]] auto parse_config(const nlohmann::json &doc)
    -> std::expected<RuntimeConfig, ConfigError>;

[[nodiscard]] auto parse_config_text(std::string_view text)
    -> std::expected<RuntimeConfig, ConfigError>;

[[nodiscard]] auto load_config(const std::filesystem::path &path)
    -> std::expected<RuntimeConfig, ConfigError>;

/// @brief Check that the controller's fast and fallback nodes exist.
[[nodiscard]] auto validate_topology(const ControllerConfig &cfg,
                                     std::span<const Node> nodes)
    -> std::expected<void, ConfigError>;

/// @brief Serialize @p cfg in the same layout parse_config() reads.
[[nodiscard]] auto config_to_json(const RuntimeConfig &cfg) -> nlohmann::json;

} // namespace frag_res
