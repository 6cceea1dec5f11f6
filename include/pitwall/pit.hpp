#pragma once
#include <random>
#include <string>
#include <vector>
#include <pitwall/profile.hpp>

namespace pitwall {

// Pit laps for one entity, strictly increasing, within [1, race_length].
struct StrategyPlan {
  std::string entity_id;
  std::vector<int> pit_laps;

  bool operator==(const StrategyPlan&) const = default;
};

// Bounded discrete distribution for the number of stops (uniform over
// [min_stops, max_stops]).
struct PitCountBounds {
  int min_stops = 1;
  int max_stops = 2;
};

// Random plan: stop count drawn from bounds (clamped to the laps available),
// pit laps drawn uniformly without replacement from [2, race_length - 1].
// Races shorter than 3 laps have no eligible pit laps and get an empty plan.
// Deterministic with caller-provided rng.
StrategyPlan generate_strategy(const std::string& entity_id,
                               int race_length,
                               const PitCountBounds& bounds,
                               std::mt19937_64& rng);

// Throws InvalidConfigurationError naming the entity and lap on the first
// pit lap that is out of [1, race_length] or not strictly increasing.
void validate_strategy(const StrategyPlan& plan, int race_length);

// Time lost on a pit lap: Normal(pit_loss_mean, pit_loss_stddev) floored at 0.
double draw_pit_loss(const LapProfile& profile, std::mt19937_64& rng);

} // namespace pitwall
