#include <pitwall/venue.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include "csv_util.hpp"

namespace pitwall {

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 8) return false;
  return csv::lower(cols[0]) == "key";
}

static std::optional<Venue> parse_venue_row(const std::vector<std::string>& cols) {
  if (cols.size() < 8) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;

  bool ok[7];
  const auto laps = csv::to_int_safe(cols[1], ok[0]);
  double vals[6];
  for (int i = 0; i < 6; ++i) vals[i] = csv::to_double_safe(cols[2 + i], ok[1 + i]);
  if (!std::all_of(std::begin(ok), std::end(ok), [](bool b){ return b; })) return std::nullopt;
  if (laps < 1) return std::nullopt;

  auto non_neg = [](double x){ return x < 0.0 ? 0.0 : x; };
  return Venue{key, static_cast<int>(laps),
               non_neg(vals[0]), non_neg(vals[1]), vals[2],
               non_neg(vals[3]), non_neg(vals[4]), non_neg(vals[5])};
}

static std::vector<Venue> make_catalog_builtin() {
  return {
    {"Austin",  56, 94.0, 100.5, 0.030, 0.80, 21.0, 1.5},
    {"Bahrain", 57, 90.0,  96.5, 0.050, 0.90, 23.0, 1.8},
    {"Monaco",  78, 70.0,  75.5, 0.020, 0.60, 20.5, 1.2},
  };
}

const std::vector<Venue>& venue_catalog() {
  static const std::vector<Venue> cat = make_catalog_builtin();
  return cat;
}

std::optional<Venue> venue_by_key(const std::string& key) {
  return venue_by_key_in(venue_catalog(), key);
}

std::optional<Venue> venue_by_key_in(const std::vector<Venue>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Venue& v){ return v.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<Venue> venue_catalog_from_csv_stream(std::istream& in) {
  std::vector<Venue> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    auto cols = csv::split_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_venue_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Venue>> load_venue_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return venue_catalog_from_csv_stream(f);
}

LapProfile fallback_profile(const Venue& v) {
  LapProfile p;
  p.baseline_duration = v.baseline_lap_s;
  p.degradation_per_lap = v.degradation_per_lap_s;
  p.duration_stddev = v.lap_stddev_s;
  p.pit_loss_mean = v.pit_loss_mean_s;
  p.pit_loss_stddev = v.pit_loss_stddev_s;
  return p;
}

ProfileFilter profile_filter_for(const Venue& v) {
  ProfileFilter f;
  f.min_lap_s = v.min_lap_s;
  f.default_pit_loss_mean = v.pit_loss_mean_s;
  f.default_pit_loss_stddev = v.pit_loss_stddev_s;
  return f;
}

} // namespace pitwall
