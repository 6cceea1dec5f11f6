#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/profile.hpp>

namespace pitwall {

struct Venue {
  std::string key;               // e.g., "Austin"
  int race_laps;                 // scheduled race distance
  double min_lap_s;              // fastest plausible lap; shorter laps are timing errors
  double baseline_lap_s;         // fallback profile values
  double degradation_per_lap_s;
  double lap_stddev_s;
  double pit_loss_mean_s;
  double pit_loss_stddev_s;
};

// Built-in tiny catalog (default/fallback).
const std::vector<Venue>& venue_catalog();

// Lookup helpers
std::optional<Venue> venue_by_key(const std::string& key);
std::optional<Venue> venue_by_key_in(const std::vector<Venue>& cat, const std::string& key);

// Stream-based CSV loader.
// Columns: key,race_laps,min_lap_s,baseline_lap_s,degradation_per_lap_s,
//          lap_stddev_s,pit_loss_mean_s,pit_loss_stddev_s
// Accepts an optional header row; ignores '#' comments and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<Venue> venue_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Venue>> load_venue_catalog_csv(const std::string& path);

// Profile to simulate with when history is too thin to build one.
LapProfile fallback_profile(const Venue& v);

// Filter tuned to the venue (minimum lap bound, default pit loss).
ProfileFilter profile_filter_for(const Venue& v);

} // namespace pitwall
