#pragma once
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>
#include <pitwall/pit.hpp>
#include <pitwall/profile.hpp>

namespace pitwall {

struct SimulationConfig {
  int race_length = 56;          // laps
  std::uint64_t seed = 42;
  PitCountBounds pit_stops{};    // used for entities without a supplied plan
  double lap_floor_s = 0.0;      // lower clip for drawn lap durations (>= 0)
};

struct LapPoint {
  int lap = 0;
  double lap_duration = 0.0;     // includes pit loss on pit laps
  double cumulative_time = 0.0;
  int position = 0;              // 1-based, total order per lap
  bool pitted = false;

  bool operator==(const LapPoint&) const = default;
};

// One simulated race. laps[entity] holds laps 1..race_length in order.
struct SimulatedTrajectory {
  std::uint64_t seed = 0;        // 0 when the caller supplied the generator
  int race_length = 0;
  std::map<std::string, std::vector<LapPoint>> laps;
  std::map<std::string, StrategyPlan> strategies;

  bool operator==(const SimulatedTrajectory&) const = default;

  // Entity ids by position on the final lap.
  std::vector<std::string> finishing_order() const;
  // Position on the final lap; 0 if the entity is not in this race.
  int final_position(const std::string& entity_id) const;
};

// Throws InvalidConfigurationError when race_length < 1, the roster is empty
// or has duplicates, lap_floor_s < 0, or a plan is invalid / names an entity
// outside the roster / repeats an entity.
void validate_simulation(const std::vector<std::string>& roster,
                         const SimulationConfig& config,
                         const std::vector<StrategyPlan>& plans);

// One Monte Carlo run drawing from the caller's generator. The trajectory's
// seed is left 0 since the generator state is not known here.
// Plans are generated (roster order) for entities without one, then laps are
// drawn entity by entity, lap by lap:
//   duration ~ Normal(baseline + degradation * lap + pace.offset, pace.stddev),
//   floored, where pace = pace_for(profile, entity),
//   plus Normal(pit_loss_mean, pit_loss_stddev) floored at 0 on pit laps.
// Positions rank cumulative time ascending, ties by entity id.
SimulatedTrajectory simulate_race(const LapProfile& profile,
                                  const std::vector<std::string>& roster,
                                  const SimulationConfig& config,
                                  const std::vector<StrategyPlan>& plans,
                                  std::mt19937_64& rng);

// Same, with a generator owned by this run and seeded from config.seed, which
// is recorded in the trajectory. Identical inputs give identical trajectories.
// Both overloads throw InvalidConfigurationError for an invalid profile.
SimulatedTrajectory simulate_race(const LapProfile& profile,
                                  const std::vector<std::string>& roster,
                                  const SimulationConfig& config,
                                  const std::vector<StrategyPlan>& plans = {});

} // namespace pitwall
