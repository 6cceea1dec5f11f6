#include <pitwall/config.hpp>
#include <fstream>
#include <limits>
#include <utility>
#include <pitwall/log.hpp>
#include "csv_util.hpp"

namespace pitwall {

static constexpr long long kIntMax = std::numeric_limits<int>::max();
static constexpr long long kWideMax = std::numeric_limits<long long>::max();

// Accepts integers in [lo, hi].
static bool apply_int(const std::string& v, long long lo, long long hi, long long& out) {
  bool ok = false;
  const auto n = csv::to_int_safe(v, ok);
  if (!ok || n < lo || n > hi) return false;
  out = n;
  return true;
}

static bool apply_double(const std::string& v, double& out) {
  bool ok = false;
  const double d = csv::to_double_safe(v, ok);
  if (ok) out = d;
  return ok;
}

// Returns false when the key is unknown or the value does not parse.
static bool apply_entry(Config& c, const std::string& key, const std::string& value) {
  long long n = 0;
  double d = 0.0;
  if (key == "sample_rate") {
    if (!apply_int(value, 1, kIntMax, n)) return false;
    c.sample_rate = static_cast<int>(n);
  } else if (key == "ensemble_size") {
    if (!apply_int(value, 1, kWideMax, n)) return false;
    c.ensemble_size = static_cast<std::size_t>(n);
  } else if (key == "race_length") {
    if (!apply_int(value, 1, kIntMax, n)) return false;
    c.race_length = static_cast<int>(n);
  } else if (key == "random_seed") {
    if (!apply_int(value, 0, kWideMax, n)) return false;
    c.random_seed = static_cast<std::uint64_t>(n);
  } else if (key == "min_pit_stops") {
    if (!apply_int(value, 0, kIntMax, n)) return false;
    c.min_pit_stops = static_cast<int>(n);
  } else if (key == "max_pit_stops") {
    if (!apply_int(value, 0, kIntMax, n)) return false;
    c.max_pit_stops = static_cast<int>(n);
  } else if (key == "min_valid_laps") {
    if (!apply_int(value, 1, kWideMax, n)) return false;
    c.min_valid_laps = static_cast<std::size_t>(n);
  } else if (key == "max_median_ratio") {
    if (!apply_double(value, d) || d <= 0.0) return false;
    c.max_median_ratio = d;
  } else if (key == "min_lap_s") {
    if (!apply_double(value, d) || d < 0.0) return false;
    c.min_lap_s = d;
  } else if (key == "lap_floor_s") {
    if (!apply_double(value, d) || d < 0.0) return false;
    c.lap_floor_s = d;
  } else if (key == "workers") {
    if (!apply_int(value, 0, kWideMax, n)) return false;
    c.workers = static_cast<std::size_t>(n);
  } else if (key == "viz_min") {
    if (!apply_double(value, d)) return false;
    c.viz_min = d;
  } else if (key == "viz_max") {
    if (!apply_double(value, d)) return false;
    c.viz_max = d;
  } else if (key == "preserve_aspect") {
    bool ok = false;
    const bool b = csv::to_bool_safe(value, ok);
    if (!ok) return false;
    c.preserve_aspect = b;
  } else if (key == "log_level") {
    if (value.empty()) return false;
    c.log_level = csv::lower(value);
  } else if (key == "venue") {
    if (value.empty()) return false;
    c.venue = value;
  } else {
    return false;
  }
  return true;
}

Config config_from_csv_stream(std::istream& in, Config base) {
  Config c = std::move(base);
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    const std::string key = cols.empty() ? std::string{} : csv::lower(cols[0]);
    if (!header_consumed && key == "key") {
      header_consumed = true;
      continue;
    }
    const std::string value = cols.size() >= 2 ? cols[1] : std::string{};
    if (!apply_entry(c, key, value)) {
      logger()->warn("config: skipping row '{}'", raw);
    }
  }
  return c;
}

std::optional<Config> load_config_csv(const std::string& path, Config base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_csv_stream(f, std::move(base));
}

SimulationConfig simulation_config(const Config& c) {
  SimulationConfig s;
  if (c.race_length) s.race_length = *c.race_length;
  s.seed = c.random_seed;
  s.pit_stops = PitCountBounds{c.min_pit_stops, c.max_pit_stops};
  s.lap_floor_s = c.lap_floor_s;
  return s;
}

SimulationConfig simulation_config(const Config& c, const Venue& venue) {
  SimulationConfig s = simulation_config(c);
  if (!c.race_length) s.race_length = venue.race_laps;
  return s;
}

ProfileFilter profile_filter(const Config& c) {
  ProfileFilter f;
  f.min_lap_s = c.min_lap_s;
  f.max_median_ratio = c.max_median_ratio;
  f.min_valid_laps = c.min_valid_laps;
  return f;
}

PreprocessOptions preprocess_options(const Config& c) {
  PreprocessOptions o;
  o.sample_rate = c.sample_rate;
  o.preserve_aspect = c.preserve_aspect;
  if (c.viz_min && c.viz_max) {
    const AxisRange axis{*c.viz_min, *c.viz_max};
    o.viz_bounds = Bounds2D{axis, axis};
  }
  return o;
}

} // namespace pitwall
