#pragma once
/// @file access_generator.hpp
/// @brief Per-epoch access batches for driving the residency controller.
///
/// HotnessWeighted samples with replacement, each fragment weighted by its
/// current hotness plus a floor, so hot fragments keep getting hotter while
/// cold ones are still touched now and then.

#include "model/fragment.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <vector>

namespace frag_res::sim {

enum class AccessPattern : std::uint8_t {
  Uniform,         ///< Every fragment equally likely.
  HotnessWeighted, ///< Weight = hotness + floor.
};

[[nodiscard]] constexpr auto to_string(AccessPattern p) -> const char * {
  switch (p) {
  case AccessPattern::Uniform:
    return "uniform";
  case AccessPattern::HotnessWeighted:
    return "hotness";
  }
  return "unknown";
}

struct GeneratorConfig {
  AccessPattern pattern = AccessPattern::HotnessWeighted;
  std::size_t batch = 8;      ///< Accesses per epoch.
  double weight_floor = 0.01; ///< Added to every weight (> 0 keeps all live).
  std::uint32_t seed = 0;     ///< 0 = random_device.
};

class AccessGenerator {
public:
  explicit AccessGenerator(std::vector<FragmentId> universe,
                           GeneratorConfig cfg = {});

  /// @brief One epoch's batch. @p hotness is consulted by HotnessWeighted;
  /// ids missing from it weigh only the floor.
  [[nodiscard]] auto next(const std::map<FragmentId, double> &hotness)
      -> std::vector<FragmentId>;

  [[nodiscard]] auto universe() const -> const std::vector<FragmentId> &;
  [[nodiscard]] auto config() const -> const GeneratorConfig &;

private:
  [[nodiscard]] auto uniform() -> std::vector<FragmentId>;
  [[nodiscard]] auto weighted(const std::map<FragmentId, double> &hotness)
      -> std::vector<FragmentId>;

  std::vector<FragmentId> universe_;
  GeneratorConfig cfg_;
  std::mt19937 rng_;
};

} // namespace frag_res::sim
