#include <pitwall/race_sim.hpp>
#include <algorithm>
#include <numeric>
#include <set>
#include <pitwall/errors.hpp>

namespace pitwall {

std::vector<std::string> SimulatedTrajectory::finishing_order() const {
  std::vector<std::pair<int, std::string>> order;
  order.reserve(laps.size());
  for (const auto& [id, points] : laps) {
    order.emplace_back(points.empty() ? 0 : points.back().position, id);
  }
  std::sort(order.begin(), order.end());
  std::vector<std::string> out;
  out.reserve(order.size());
  for (auto& o : order) out.push_back(std::move(o.second));
  return out;
}

int SimulatedTrajectory::final_position(const std::string& entity_id) const {
  auto it = laps.find(entity_id);
  if (it == laps.end() || it->second.empty()) return 0;
  return it->second.back().position;
}

void validate_simulation(const std::vector<std::string>& roster,
                         const SimulationConfig& config,
                         const std::vector<StrategyPlan>& plans) {
  if (config.race_length < 1) {
    throw InvalidConfigurationError("race length must be >= 1, got " +
                                    std::to_string(config.race_length));
  }
  if (roster.empty()) {
    throw InvalidConfigurationError("at least one entity is required");
  }
  if (config.lap_floor_s < 0.0) {
    throw InvalidConfigurationError("lap floor must be non-negative");
  }
  std::set<std::string> ids;
  for (const auto& id : roster) {
    if (!ids.insert(id).second) throw InvalidConfigurationError("duplicate entity in roster", id);
  }
  std::set<std::string> planned;
  for (const auto& plan : plans) {
    if (!ids.count(plan.entity_id)) {
      throw InvalidConfigurationError("strategy for entity not in roster", plan.entity_id);
    }
    if (!planned.insert(plan.entity_id).second) {
      throw InvalidConfigurationError("more than one strategy for entity", plan.entity_id);
    }
    validate_strategy(plan, config.race_length);
  }
}

static double draw_lap(const LapProfile& profile, const EntityPace& pace, int lap,
                       double floor_s, std::mt19937_64& rng) {
  const double mean = expected_lap_duration(profile, lap) + pace.offset;
  if (pace.stddev <= 0.0) return std::max(floor_s, mean);
  std::normal_distribution<double> dist(mean, pace.stddev);
  return std::max(floor_s, dist(rng));
}

SimulatedTrajectory simulate_race(const LapProfile& profile,
                                  const std::vector<std::string>& roster,
                                  const SimulationConfig& config,
                                  const std::vector<StrategyPlan>& plans,
                                  std::mt19937_64& rng) {
  validate_profile(profile);
  validate_simulation(roster, config, plans);

  const int L = config.race_length;
  SimulatedTrajectory out;
  out.race_length = L;

  for (const auto& plan : plans) out.strategies[plan.entity_id] = plan;
  for (const auto& id : roster) {
    if (!out.strategies.count(id)) {
      out.strategies[id] = generate_strategy(id, L, config.pit_stops, rng);
    }
  }

  for (const auto& id : roster) {
    const auto& pit_laps = out.strategies[id].pit_laps;
    const EntityPace pace = pace_for(profile, id);
    auto& points = out.laps[id];
    points.reserve(static_cast<std::size_t>(L));
    double cumulative = 0.0;
    for (int lap = 1; lap <= L; ++lap) {
      LapPoint p;
      p.lap = lap;
      p.lap_duration = draw_lap(profile, pace, lap, config.lap_floor_s, rng);
      p.pitted = std::binary_search(pit_laps.begin(), pit_laps.end(), lap);
      if (p.pitted) p.lap_duration += draw_pit_loss(profile, rng);
      cumulative += p.lap_duration;
      p.cumulative_time = cumulative;
      points.push_back(p);
    }
  }

  // Rank every lap; std::map iteration gives entity-id order for tie-breaks.
  std::vector<std::vector<LapPoint>*> columns;
  std::vector<const std::string*> ids;
  for (auto& [id, points] : out.laps) {
    columns.push_back(&points);
    ids.push_back(&id);
  }
  std::vector<std::size_t> order(columns.size());
  for (int k = 0; k < L; ++k) {
    const auto lap = static_cast<std::size_t>(k);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
      const double ta = (*columns[a])[lap].cumulative_time;
      const double tb = (*columns[b])[lap].cumulative_time;
      if (ta != tb) return ta < tb;
      return *ids[a] < *ids[b];
    });
    for (std::size_t rank = 0; rank < order.size(); ++rank) {
      (*columns[order[rank]])[lap].position = static_cast<int>(rank + 1);
    }
  }
  return out;
}

SimulatedTrajectory simulate_race(const LapProfile& profile,
                                  const std::vector<std::string>& roster,
                                  const SimulationConfig& config,
                                  const std::vector<StrategyPlan>& plans) {
  std::mt19937_64 rng(config.seed);
  SimulatedTrajectory out = simulate_race(profile, roster, config, plans, rng);
  out.seed = config.seed;
  return out;
}

} // namespace pitwall
