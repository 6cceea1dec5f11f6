#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pitwall {

// One raw position sample. Sample counts differ between entities.
struct RawTelemetrySample {
  double time_s = 0.0;  // session time or sample index
  double x = 0.0;
  double y = 0.0;
  double speed = 0.0;   // km/h
  int lap = 0;          // lap number the sample belongs to
};

// Static per-entity display data from the telemetry collaborator.
struct EntityMeta {
  std::string code;   // "VER"
  std::string name;
  std::string team;
  std::string color;  // "#RRGGBB"
};

struct EntityTelemetry {
  EntityMeta meta;
  std::vector<RawTelemetrySample> samples; // ordered by time
};

// entity id -> telemetry. Ordered so frame slots have a stable roster order.
using TelemetrySet = std::map<std::string, EntityTelemetry>;

// Bare hex colors ("0600EF", "fff") get a leading '#'; anything else is kept.
std::string normalize_color(const std::string& color);

// Smallest sample count among entities that have any samples (0 if none do).
std::size_t min_sample_count(const TelemetrySet& set);

} // namespace pitwall
