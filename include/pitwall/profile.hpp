#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <pitwall/laps.hpp>

namespace pitwall {

// One competitor's pace relative to the venue trend.
struct EntityPace {
  double offset = 0.0;         // mean residual of its clean laps (s); negative = faster
  double stddev = 0.0;         // spread of its clean laps around trend + offset (s)
  double best_lap = 0.0;       // fastest clean lap (s)
  std::size_t clean_laps = 0;
  std::size_t sessions = 0;

  bool operator==(const EntityPace&) const = default;
};

// Statistical lap-time model for one venue. Immutable once built.
struct LapProfile {
  double baseline_duration = 0.0;   // median clean lap (s)
  double degradation_per_lap = 0.0; // seconds added per lap number
  double duration_stddev = 0.0;     // spread of clean laps around the trend (s)
  double pit_loss_mean = 0.0;       // time lost on a pit lap (s)
  double pit_loss_stddev = 0.0;
  // Entities with enough clean laps of their own. Anyone else races at the
  // venue pace (offset 0, duration_stddev).
  std::map<std::string, EntityPace> entities;

  bool operator==(const LapProfile&) const = default;
};

// Mean lap duration the simulator draws around.
inline double expected_lap_duration(const LapProfile& p, int lap_number) {
  return p.baseline_duration + p.degradation_per_lap * static_cast<double>(lap_number);
}

// Pace of entity_id, or the venue pace when the profile has none for it.
EntityPace pace_for(const LapProfile& p, const std::string& entity_id);

// Same, shifted by the entity's pace offset.
inline double expected_lap_duration(const LapProfile& p, const std::string& entity_id, int lap_number) {
  return expected_lap_duration(p, lap_number) + pace_for(p, entity_id).offset;
}

// Throws InvalidConfigurationError (naming the field, and the entity for a
// per-entity pace) when a value is not finite or a spread / loss is negative.
void validate_profile(const LapProfile& p);

struct ProfileFilter {
  double min_lap_s = 0.0;          // track-specific minimum; 0 accepts any positive duration
  double max_median_ratio = 2.0;   // reject laps slower than ratio * session median
  std::size_t min_valid_laps = 5;  // clean laps required after filtering
  double default_pit_loss_mean = 22.0;   // used when no pit laps survive filtering
  double default_pit_loss_stddev = 2.0;
  std::size_t min_entity_laps = 3;       // clean laps needed for an entity pace
};

// What the filter dropped and why. Nothing is discarded without being counted.
struct FilterReport {
  std::size_t total = 0;
  std::size_t dropped_invalid = 0;       // is_valid == false
  std::size_t dropped_out_of_order = 0;  // lap_number not strictly increasing
  std::size_t dropped_out_of_bounds = 0; // below min_lap_s or above ratio * median
  std::size_t clean_laps = 0;            // kept, not pit laps
  std::size_t pit_laps = 0;              // kept pit laps

  std::size_t dropped() const { return dropped_invalid + dropped_out_of_order + dropped_out_of_bounds; }
};

// Builds a profile from historical laps of one venue (any number of sessions).
// baseline = median of clean laps, degradation = least-squares slope of
// duration vs lap number, stddev from fit residuals, pit loss from pit laps
// relative to the fitted trend (and the entity's own pace). Each entity with
// at least filter.min_entity_laps clean laps gets an EntityPace.
// Throws InsufficientDataError when fewer than filter.min_valid_laps clean laps remain.
LapProfile build_lap_profile(const std::vector<LapRecord>& records,
                             const ProfileFilter& filter = {},
                             FilterReport* report = nullptr);

// Median of a sample (average of the middle pair for even sizes). 0 when empty.
double median_of(std::vector<double> values);

struct LinearFit {
  double intercept = 0.0;
  double slope = 0.0;
  double residual_stddev = 0.0;
};

// Least squares y = intercept + slope * x. A zero-variance x yields slope 0.
LinearFit fit_line(const std::vector<double>& xs, const std::vector<double>& ys);

} // namespace pitwall
