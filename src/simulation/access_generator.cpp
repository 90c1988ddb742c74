/// @file access_generator.cpp
/// @brief Access batch generation.

#include "simulation/access_generator.hpp"

#include <algorithm>
#include <utility>

namespace frag_res::sim {

AccessGenerator::AccessGenerator(std::vector<FragmentId> universe,
                                 GeneratorConfig cfg)
    : universe_{std::move(universe)}, cfg_{cfg},
      rng_{cfg.seed != 0 ? cfg.seed : std::random_device{}()} {}

auto AccessGenerator::next(const std::map<FragmentId, double> &hotness)
    -> std::vector<FragmentId> {
  if (universe_.empty() || cfg_.batch == 0) {
    return {};
  }
  switch (cfg_.pattern) {
  case AccessPattern::Uniform:
    return uniform();
  case AccessPattern::HotnessWeighted:
    return weighted(hotness);
  }
  return uniform();
}

auto AccessGenerator::uniform() -> std::vector<FragmentId> {
  std::uniform_int_distribution<std::size_t> pick(0, universe_.size() - 1);
  std::vector<FragmentId> out;
  out.reserve(cfg_.batch);
  for (std::size_t i = 0; i < cfg_.batch; ++i) {
    out.push_back(universe_[pick(rng_)]);
  }
  return out;
}

auto AccessGenerator::weighted(const std::map<FragmentId, double> &hotness)
    -> std::vector<FragmentId> {
  std::vector<double> weights;
  weights.reserve(universe_.size());
  double total = 0.0;
  for (const auto &id : universe_) {
    auto it = hotness.find(id);
    const double h = it != hotness.end() ? std::max(0.0, it->second) : 0.0;
    weights.push_back(h + std::max(0.0, cfg_.weight_floor));
    total += weights.back();
  }
  if (total <= 0.0) {
    return uniform();
  }

  std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
  std::vector<FragmentId> out;
  out.reserve(cfg_.batch);
  for (std::size_t i = 0; i < cfg_.batch; ++i) {
    out.push_back(universe_[pick(rng_)]);
  }
  return out;
}

auto AccessGenerator::universe() const -> const std::vector<FragmentId> & {
  return universe_;
}

auto AccessGenerator::config() const -> const GeneratorConfig & {
  return cfg_;
}

} // namespace frag_res::sim
