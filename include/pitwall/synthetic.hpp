#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <pitwall/laps.hpp>
#include <pitwall/telemetry.hpp>

namespace pitwall {

// Entities circling a closed loop (center (500, 500), radius 400), each
// phase-shifted by 0.2 lap. points_per_lap samples per lap, 0.1 s apart;
// lap = sample / points_per_lap + 1, speed = 200 + 50 sin(3 * angle).
// Entity ids are "1".."n" with display data from a demo grid.
TelemetrySet synthetic_telemetry(int num_entities = 5, int num_laps = 3, int points_per_lap = 100);

struct SyntheticHistorySpec {
  std::vector<std::string> sessions{"2023", "2024"};
  int entities = 5;
  int laps = 20;
  double baseline_s = 100.0;     // lap-0 intercept of the trend
  double degradation_s = 0.05;   // per lap
  double noise_s = 0.3;          // stddev of clean laps around the trend
  double pit_loss_s = 20.0;      // added on the single pit lap of each entity
  std::vector<double> pace_offsets_s; // per entity index, added to every lap (missing = 0)
  std::uint64_t seed = 7;
};

// Seeded lap records following a known linear trend, one pit stop per
// entity per session (at laps / 2 + entity index % 3).
std::vector<LapRecord> synthetic_lap_history(const SyntheticHistorySpec& hist = {});

} // namespace pitwall
