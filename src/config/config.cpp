/// @file config.cpp
/// @brief Runtime configuration parsing and validation.

#include "config/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace frag_res {

namespace {

using nlohmann::json;
using Status = std::expected<void, ConfigError>;

auto fail(ConfigErrc code, std::string detail) -> std::unexpected<ConfigError> {
  return std::unexpected(ConfigError{code, std::move(detail)});
}

auto read_real(const json &obj, const char *key, const std::string &where,
               double &out) -> Status {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return {};
  }
  if (!it->is_number()) {
    return fail(ConfigErrc::WrongType, where + "." + key);
  }
  out = it->get<double>();
  if (!std::isfinite(out)) {
    return fail(ConfigErrc::InvalidValue, where + "." + key);
  }
  return {};
}

auto read_int(const json &obj, const char *key, const std::string &where,
              std::int64_t &out) -> Status {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return {};
  }
  if (!it->is_number_integer()) {
    return fail(ConfigErrc::WrongType, where + "." + key);
  }
  out = it->get<std::int64_t>();
  return {};
}

auto read_bool(const json &obj, const char *key, const std::string &where,
               bool &out) -> Status {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return {};
  }
  if (!it->is_boolean()) {
    return fail(ConfigErrc::WrongType, where + "." + key);
  }
  out = it->get<bool>();
  return {};
}

/// Section object or nullptr when absent.
auto section(const json &obj, const char *key, const std::string &where)
    -> std::expected<const json *, ConfigError> {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    return fail(ConfigErrc::WrongType,
                where.empty() ? std::string{key} : where + "." + key);
  }
  return &*it;
}

auto parse_planner(const json &obj, PlannerConfig &cfg) -> Status {
  const std::string where = "planner";

  std::int64_t unit_size = static_cast<std::int64_t>(cfg.unit_size);
  if (auto s = read_int(obj, "unit_size", where, unit_size); !s) {
    return s;
  }
  if (unit_size <= 0) {
    return fail(ConfigErrc::InvalidValue, where + ".unit_size");
  }
  cfg.unit_size = static_cast<std::uint64_t>(unit_size);

  if (auto s = read_real(obj, "unit_pressure_weight", where,
                         cfg.unit_pressure_weight);
      !s) {
    return s;
  }
  if (cfg.unit_pressure_weight < 0.0) {
    return fail(ConfigErrc::InvalidValue, where + ".unit_pressure_weight");
  }

  auto weights = section(obj, "weights", where);
  if (!weights) {
    return std::unexpected(weights.error());
  }
  if (*weights != nullptr) {
    const std::string w = where + ".weights";
    for (auto [key, field] :
         {std::pair{"reuse", &cfg.weights.reuse},
          std::pair{"importance", &cfg.weights.importance},
          std::pair{"interference", &cfg.weights.interference}}) {
      if (auto s = read_real(**weights, key, w, *field); !s) {
        return s;
      }
    }
  }
  return {};
}

auto parse_controller(const json &obj, ControllerConfig &cfg) -> Status {
  const std::string where = "controller";

  if (auto s = read_real(obj, "evict_threshold", where, cfg.evict_threshold);
      !s) {
    return s;
  }
  if (auto s =
          read_real(obj, "hotness_increment", where, cfg.hotness_increment);
      !s) {
    return s;
  }
  if (cfg.hotness_increment < 0.0) {
    return fail(ConfigErrc::InvalidValue, where + ".hotness_increment");
  }

  for (auto [key, field] :
       {std::pair{"access_grace", &cfg.access_grace},
        std::pair{"initial_lease", &cfg.initial_lease},
        std::pair{"promotion_interval", &cfg.promotion_interval}}) {
    if (auto s = read_int(obj, key, where, *field); !s) {
      return s;
    }
    if (*field < 0) {
      return fail(ConfigErrc::InvalidValue, where + "." + key);
    }
  }

  std::int64_t fanout = static_cast<std::int64_t>(cfg.promotion_fanout);
  if (auto s = read_int(obj, "promotion_fanout", where, fanout); !s) {
    return s;
  }
  if (fanout < 0) {
    return fail(ConfigErrc::InvalidValue, where + ".promotion_fanout");
  }
  cfg.promotion_fanout = static_cast<std::size_t>(fanout);

  for (auto [key, field] : {std::pair{"fast_node", &cfg.fast_node},
                            std::pair{"fallback_node", &cfg.fallback_node}}) {
    std::int64_t id = *field;
    if (auto s = read_int(obj, key, where, id); !s) {
      return s;
    }
    constexpr auto kMaxId =
        static_cast<std::int64_t>(std::numeric_limits<NodeId>::max());
    if (id < 0 || id > kMaxId) {
      return fail(ConfigErrc::InvalidValue, where + "." + key);
    }
    *field = static_cast<NodeId>(id);
  }

  auto dispatch = section(obj, "dispatch", where);
  if (!dispatch) {
    return std::unexpected(dispatch.error());
  }
  if (*dispatch != nullptr) {
    const std::string d = where + ".dispatch";
    std::int64_t threads = static_cast<std::int64_t>(cfg.dispatch.threads);
    if (auto s = read_int(**dispatch, "threads", d, threads); !s) {
      return s;
    }
    if (threads < 1) {
      return fail(ConfigErrc::InvalidValue, d + ".threads");
    }
    cfg.dispatch.threads = static_cast<std::size_t>(threads);

    std::int64_t timeout_ms = cfg.dispatch.timeout.count();
    if (auto s = read_int(**dispatch, "timeout_ms", d, timeout_ms); !s) {
      return s;
    }
    if (timeout_ms <= 0) {
      return fail(ConfigErrc::InvalidValue, d + ".timeout_ms");
    }
    cfg.dispatch.timeout = std::chrono::milliseconds(timeout_ms);
  }
  return {};
}

auto parse_transport(const json &obj, SimulatedTransportConfig &cfg)
    -> Status {
  const std::string where = "transport";

  std::int64_t base = cfg.base_latency.count();
  std::int64_t per_mib = cfg.per_mib_latency.count();
  if (auto s = read_int(obj, "base_latency_us", where, base); !s) {
    return s;
  }
  if (auto s = read_int(obj, "per_mib_latency_us", where, per_mib); !s) {
    return s;
  }
  if (base < 0) {
    return fail(ConfigErrc::InvalidValue, where + ".base_latency_us");
  }
  if (per_mib < 0) {
    return fail(ConfigErrc::InvalidValue, where + ".per_mib_latency_us");
  }
  cfg.base_latency = std::chrono::microseconds(base);
  cfg.per_mib_latency = std::chrono::microseconds(per_mib);

  if (auto s = read_real(obj, "fail_rate", where, cfg.fail_rate); !s) {
    return s;
  }
  if (cfg.fail_rate < 0.0 || cfg.fail_rate > 1.0) {
    return fail(ConfigErrc::InvalidValue, where + ".fail_rate");
  }

  if (auto s = read_bool(obj, "realtime", where, cfg.realtime); !s) {
    return s;
  }

  std::int64_t seed = static_cast<std::int64_t>(cfg.seed);
  if (auto s = read_int(obj, "seed", where, seed); !s) {
    return s;
  }
  if (seed < 0) {
    return fail(ConfigErrc::InvalidValue, where + ".seed");
  }
  cfg.seed = static_cast<std::uint64_t>(seed);
  return {};
}

} // namespace

auto parse_config(const json &doc)
    -> std::expected<RuntimeConfig, ConfigError> {
  if (!doc.is_object()) {
    return fail(ConfigErrc::WrongType, "<root>");
  }

  RuntimeConfig cfg;

  auto planner = section(doc, "planner", "");
  if (!planner) {
    return std::unexpected(planner.error());
  }
  if (*planner != nullptr) {
    if (auto s = parse_planner(**planner, cfg.planner); !s) {
      return std::unexpected(s.error());
    }
  }

  auto controller = section(doc, "controller", "");
  if (!controller) {
    return std::unexpected(controller.error());
  }
  if (*controller != nullptr) {
    if (auto s = parse_controller(**controller, cfg.controller); !s) {
      return std::unexpected(s.error());
    }
  }

  auto transport = section(doc, "transport", "");
  if (!transport) {
    return std::unexpected(transport.error());
  }
  if (*transport != nullptr) {
    if (auto s = parse_transport(**transport, cfg.transport); !s) {
      return std::unexpected(s.error());
    }
  }

  return cfg;
}

auto parse_config_text(std::string_view text)
    -> std::expected<RuntimeConfig, ConfigError> {
  auto doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return fail(ConfigErrc::Syntax, "<input>");
  }
  return parse_config(doc);
}

auto load_config(const std::filesystem::path &path)
    -> std::expected<RuntimeConfig, ConfigError> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return fail(ConfigErrc::Unreadable, path.string());
  }
  std::ostringstream ss;
  ss << file.rdbuf();

  auto cfg = parse_config_text(ss.str());
  if (!cfg && cfg.error().code == ConfigErrc::Syntax) {
    return fail(ConfigErrc::Syntax, path.string());
  }
  return cfg;
}

auto validate_topology(const ControllerConfig &cfg,
                       std::span<const Node> nodes)
    -> std::expected<void, ConfigError> {
  auto known = [&](NodeId id) {
    return std::any_of(nodes.begin(), nodes.end(),
                       [id](const Node &n) { return n.id == id; });
  };
  if (!known(cfg.fallback_node)) {
    return fail(ConfigErrc::UnknownNode,
                "controller.fallback_node = " +
                    std::to_string(cfg.fallback_node));
  }
  // A single-node topology never promotes, so the fast node is not needed.
  if (nodes.size() > 1 && !known(cfg.fast_node)) {
    return fail(ConfigErrc::UnknownNode,
                "controller.fast_node = " + std::to_string(cfg.fast_node));
  }
  return {};
}

auto config_to_json(const RuntimeConfig &cfg) -> json {
  const auto &p = cfg.planner;
  const auto &c = cfg.controller;
  const auto &t = cfg.transport;
  return json{
      {"planner",
       {{"unit_size", p.unit_size},
        {"unit_pressure_weight", p.unit_pressure_weight},
        {"weights",
         {{"reuse", p.weights.reuse},
          {"importance", p.weights.importance},
          {"interference", p.weights.interference}}}}},
      {"controller",
       {{"evict_threshold", c.evict_threshold},
        {"hotness_increment", c.hotness_increment},
        {"access_grace", c.access_grace},
        {"initial_lease", c.initial_lease},
        {"promotion_interval", c.promotion_interval},
        {"promotion_fanout", c.promotion_fanout},
        {"fast_node", c.fast_node},
        {"fallback_node", c.fallback_node},
        {"dispatch",
         {{"threads", c.dispatch.threads},
          {"timeout_ms", c.dispatch.timeout.count()}}}}},
      {"transport",
       {{"base_latency_us", t.base_latency.count()},
        {"per_mib_latency_us", t.per_mib_latency.count()},
        {"fail_rate", t.fail_rate},
        {"realtime", t.realtime},
        {"seed", t.seed}}},
  };
}

} // namespace frag_res
