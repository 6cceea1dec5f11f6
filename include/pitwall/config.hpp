#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <pitwall/frames.hpp>
#include <pitwall/profile.hpp>
#include <pitwall/race_sim.hpp>
#include <pitwall/venue.hpp>

namespace pitwall {

// Options consumed by the core. Every field has a default except
// ensemble_size, which callers must supply for a prediction, and race_length,
// which defaults to the venue's scheduled distance.
struct Config {
  int sample_rate = 5;
  std::optional<std::size_t> ensemble_size;
  std::optional<int> race_length;
  std::uint64_t random_seed = 42;
  int min_pit_stops = 1;
  int max_pit_stops = 2;
  std::size_t min_valid_laps = 5;
  double max_median_ratio = 2.0;
  double min_lap_s = 0.0;
  double lap_floor_s = 0.0;
  std::size_t workers = 0;             // 0 = hardware concurrency
  std::optional<double> viz_min;       // target bounds (both axes) for frames
  std::optional<double> viz_max;
  bool preserve_aspect = false;        // one scale for both axes
  std::string log_level = "info";
  std::string venue = "Austin";
};

// key,value rows (e.g. "race_length, 56"). Header "key,value" optional,
// '#' comments and blank lines ignored, whitespace trimmed. Unknown keys and
// unparsable or out-of-range values are skipped with a warning; the rest
// still apply.
Config config_from_csv_stream(std::istream& in, Config base = {});

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<Config> load_config_csv(const std::string& path, Config base = {});

// race_length falls back to SimulationConfig's default, or to the venue's
// race_laps in the second overload.
SimulationConfig simulation_config(const Config& c);
SimulationConfig simulation_config(const Config& c, const Venue& venue);
ProfileFilter profile_filter(const Config& c);
PreprocessOptions preprocess_options(const Config& c);

} // namespace pitwall
