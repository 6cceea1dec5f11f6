#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <pitwall/ensemble.hpp>

namespace pitwall {

// Empirical finishing-position distribution of one entity.
struct PositionDistribution {
  std::string entity_id;
  std::vector<std::size_t> counts;   // counts[p - 1] = runs finished in position p
  std::vector<double> probability;   // counts / runs, sums to 1
  double win_probability = 0.0;
  double podium_probability = 0.0;   // positions 1..3
  double mean_position = 0.0;
};

struct PositionTable {
  std::size_t runs = 0;
  std::vector<PositionDistribution> entities; // sorted by entity id

  const PositionDistribution* find(const std::string& entity_id) const;
};

// Aggregates final positions across the ensemble. N >= 1 is required; at
// least 100 runs are recommended for stable estimates (not enforced, no
// resampling is done here).
// Throws InvalidConfigurationError on an empty ensemble or runs with
// differing rosters.
PositionTable predict_positions(const Ensemble& ensemble);

struct PodiumEntry {
  std::string entity_id;
  double podium_probability = 0.0;
  double win_probability = 0.0;
  double mean_position = 0.0;
};

// Entities ranked by podium probability, then mean position, then id.
std::vector<PodiumEntry> rank_podium(const PositionTable& table, std::size_t top_n = 3);

// Convenience: run the ensemble, aggregate, drop the trajectories.
PositionTable predict_podium(const LapProfile& profile,
                             const std::vector<std::string>& roster,
                             const SimulationConfig& config,
                             std::size_t runs,
                             const EnsembleOptions& options = {});

} // namespace pitwall
