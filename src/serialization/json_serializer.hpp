#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for plans, epoch reports and residency
/// snapshots.

#include "controller/epoch_report.hpp"
#include "model/fragment.hpp"
#include "planner/placement_planner.hpp"
#include "residency/residency_map.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace frag_res {

inline void to_json(nlohmann::json &j, const Fragment &f) {
  j = nlohmann::json{
      {"id", f.id},
      {"size", f.size},
      {"importance", f.importance},
      {"reuse", f.reuse},
      {"timescale", f.timescale},
  };
}

inline void to_json(nlohmann::json &j, const Node &n) {
  j = nlohmann::json{
      {"id", n.id},
      {"capacity_budget", n.capacity_budget},
      {"predicted_interference", n.predicted_interference},
      {"backing", n.backing},
  };
  if (n.unit_budget) {
    j["unit_budget"] = *n.unit_budget;
  }
}

inline void to_json(nlohmann::json &j, const PlacementPlan &p) {
  j = nlohmann::json::object();
  j["type"] = "plan";

  auto &placements = j["placements"] = nlohmann::json::object();
  for (const auto &[fragment, node] : p.placements) {
    placements[fragment] = node;
  }

  auto &assignments = j["assignments"] = nlohmann::json::array();
  for (const auto &a : p.assignments) {
    assignments.push_back({
        {"fragment", a.fragment},
        {"node", a.node},
        {"cost", a.cost},
        {"utility", a.utility},
        {"rho", a.rho},
    });
  }

  auto &unplaced = j["unplaced"] = nlohmann::json::array();
  for (const auto &u : p.unplaced) {
    unplaced.push_back(
        {{"fragment", u.fragment}, {"reason", to_string(u.reason)}});
  }

  auto &remaining = j["remaining"] = nlohmann::json::object();
  for (const auto &[node, budget] : p.ledger.nodes()) {
    nlohmann::json b{{"capacity", budget.capacity}};
    if (budget.units) {
      b["units"] = *budget.units;
    }
    remaining[std::to_string(node)] = std::move(b);
  }
}

inline void to_json(nlohmann::json &j, const MigrationOutcome &m) {
  j = nlohmann::json{
      {"fragment", m.fragment},
      {"from", m.from},
      {"to", m.to},
      {"kind", to_string(m.kind)},
      {"ok", m.ok},
      {"latency_s", m.latency_s},
  };
  if (m.error) {
    j["error"] = to_string(*m.error);
  }
}

inline void to_json(nlohmann::json &j, const ControllerEvent &e) {
  j = nlohmann::json{
      {"kind", to_string(e.kind)},
      {"fragment", e.fragment},
      {"detail", e.detail},
  };
}

inline void to_json(nlohmann::json &j, const EpochReport &r) {
  j = nlohmann::json{
      {"type", "epoch"},
      {"epoch", r.epoch},
      {"accesses", r.accesses},
      {"promotion_round", r.promotion_round},
      {"promoted", r.promoted},
      {"evicted", r.evicted},
      {"placed", r.placed},
      {"migrations", r.migrations},
      {"events", r.events},
      {"failures", r.failures()},
  };
}

/// @brief Serialize the residency map (and per-fragment hotness, when known)
/// for initial client sync and the /snapshot endpoint.
inline auto residency_snapshot_to_json(
    const ResidencyMap &residency, Epoch epoch,
    const std::map<FragmentId, double> &hotness = {}) -> nlohmann::json {
  nlohmann::json j;
  j["type"] = "snapshot";
  j["epoch"] = epoch;

  j["nodes"] = nlohmann::json::array();
  for (const auto id : residency.node_ids()) {
    const auto load = residency.load(id);
    if (!load) {
      continue;
    }
    nlohmann::json n{
        {"id", id},
        {"resident", load->resident},
        {"reserved", load->reserved},
        {"fragments", load->fragments},
    };
    n["budget"] =
        load->budget ? nlohmann::json(*load->budget) : nlohmann::json(nullptr);
    if (load->unit_budget) {
      n["units"] = load->units;
      n["reserved_units"] = load->reserved_units;
      n["unit_budget"] = *load->unit_budget;
    }
    j["nodes"].push_back(std::move(n));
  }

  j["fragments"] = nlohmann::json::array();
  for (const auto &rec : residency.snapshot()) {
    nlohmann::json f{
        {"id", rec.fragment},
        {"node", rec.node},
        {"cost", rec.cost},
    };
    if (rec.migrating_to) {
      f["migrating_to"] = *rec.migrating_to;
    }
    if (auto it = hotness.find(rec.fragment); it != hotness.end()) {
      f["hotness"] = it->second;
    }
    j["fragments"].push_back(std::move(f));
  }

  return j;
}

} // namespace frag_res
