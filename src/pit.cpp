#include <pitwall/pit.hpp>
#include <algorithm>
#include <numeric>
#include <random>
#include <pitwall/errors.hpp>

namespace pitwall {

StrategyPlan generate_strategy(const std::string& entity_id,
                               int race_length,
                               const PitCountBounds& bounds,
                               std::mt19937_64& rng) {
  StrategyPlan plan;
  plan.entity_id = entity_id;

  const int slots = race_length - 2; // eligible laps are 2 .. L-1
  if (slots <= 0) return plan;

  const int lo = std::clamp(bounds.min_stops, 0, slots);
  const int hi = std::clamp(bounds.max_stops, lo, slots);
  std::uniform_int_distribution<int> count_dist(lo, hi);
  const int count = count_dist(rng);

  std::vector<int> laps(static_cast<std::size_t>(slots));
  std::iota(laps.begin(), laps.end(), 2);
  // Partial Fisher-Yates: the first `count` entries become a uniform sample.
  for (int i = 0; i < count; ++i) {
    std::uniform_int_distribution<int> pick(i, slots - 1);
    std::swap(laps[static_cast<std::size_t>(i)], laps[static_cast<std::size_t>(pick(rng))]);
  }
  plan.pit_laps.assign(laps.begin(), laps.begin() + count);
  std::sort(plan.pit_laps.begin(), plan.pit_laps.end());
  return plan;
}

void validate_strategy(const StrategyPlan& plan, int race_length) {
  int prev = 0;
  for (int lap : plan.pit_laps) {
    if (lap < 1 || lap > race_length) {
      throw InvalidConfigurationError("pit lap outside [1, " + std::to_string(race_length) + "]",
                                      plan.entity_id, lap);
    }
    if (lap <= prev) {
      throw InvalidConfigurationError("pit laps not strictly increasing", plan.entity_id, lap);
    }
    prev = lap;
  }
}

double draw_pit_loss(const LapProfile& profile, std::mt19937_64& rng) {
  if (profile.pit_loss_stddev <= 0.0) return std::max(0.0, profile.pit_loss_mean);
  std::normal_distribution<double> dist(profile.pit_loss_mean, profile.pit_loss_stddev);
  return std::max(0.0, dist(rng));
}

} // namespace pitwall
