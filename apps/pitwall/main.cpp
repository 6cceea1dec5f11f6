#include <cstdio>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <pitwall/config.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>
#include <pitwall/podium.hpp>
#include <pitwall/replay_cache.hpp>
#include <pitwall/synthetic.hpp>
#include <pitwall/venue.hpp>

using namespace pitwall;

static constexpr std::size_t kDefaultEnsembleSize = 1000;

static void usage() {
  std::fprintf(stderr,
               "usage: pitwall predict <laps.csv|-> [config.csv]\n"
               "       pitwall replay [config.csv]\n");
}

static Config load_config_or_default(int argc, char** argv, int index) {
  if (index >= argc) return Config{};
  auto cfg = load_config_csv(argv[index]);
  if (!cfg) throw InvalidConfigurationError(std::string("cannot open config ") + argv[index]);
  return *cfg;
}

static std::vector<std::string> roster_of(const std::vector<LapRecord>& records) {
  std::set<std::string> ids;
  for (const auto& r : records) ids.insert(r.entity_id);
  return {ids.begin(), ids.end()};
}

static int run_predict(int argc, char** argv) {
  if (argc < 3) { usage(); return 2; }
  const std::string laps_path = argv[2];
  const Config cfg = load_config_or_default(argc, argv, 3);
  if (!set_log_level(cfg.log_level)) logger()->warn("unknown log_level '{}'", cfg.log_level);

  const auto venue = venue_by_key(cfg.venue);
  if (!venue) throw InvalidConfigurationError("unknown venue " + cfg.venue);

  LapHistoryLoad history;
  if (laps_path == "-") {
    history = lap_records_from_csv_stream(std::cin);
  } else {
    auto loaded = load_lap_history_csv(laps_path);
    if (!loaded) throw InvalidConfigurationError("cannot open lap history " + laps_path);
    history = std::move(*loaded);
  }

  ProfileFilter filter = profile_filter_for(*venue);
  filter.max_median_ratio = cfg.max_median_ratio;
  filter.min_valid_laps = cfg.min_valid_laps;
  if (cfg.min_lap_s > 0.0) filter.min_lap_s = cfg.min_lap_s;

  LapProfile profile;
  try {
    profile = build_lap_profile(history.records, filter);
  } catch (const InsufficientDataError& e) {
    logger()->warn("{}; using {} fallback profile", e.what(), venue->key);
    profile = fallback_profile(*venue);
  }

  const auto roster = roster_of(history.records);
  const std::size_t runs = cfg.ensemble_size.value_or(kDefaultEnsembleSize);
  EnsembleOptions opts;
  opts.workers = cfg.workers;

  const SimulationConfig sim = simulation_config(cfg, *venue);
  const PositionTable table = predict_podium(profile, roster, sim, runs, opts);

  std::printf("%s: baseline %.3f s, degradation %.4f s/lap, stddev %.3f s, pit loss %.2f +/- %.2f s\n",
              venue->key.c_str(), profile.baseline_duration, profile.degradation_per_lap,
              profile.duration_stddev, profile.pit_loss_mean, profile.pit_loss_stddev);
  std::printf("%zu runs, %d laps\n\n", table.runs, sim.race_length);
  std::printf("%-8s %8s %8s %8s\n", "entity", "win", "podium", "mean");
  for (const auto& e : rank_podium(table, table.entities.size())) {
    std::printf("%-8s %7.1f%% %7.1f%% %8.2f\n", e.entity_id.c_str(),
                100.0 * e.win_probability, 100.0 * e.podium_probability, e.mean_position);
  }
  return 0;
}

static int run_replay(int argc, char** argv) {
  const Config cfg = load_config_or_default(argc, argv, 2);
  if (!set_log_level(cfg.log_level)) logger()->warn("unknown log_level '{}'", cfg.log_level);

  const PreprocessOptions opts = preprocess_options(cfg);
  ReplayCache cache(
      [](const std::string&) { return synthetic_telemetry(); },
      [](const std::string&) { return synthetic_lap_history(); },
      opts.viz_bounds, opts.preserve_aspect);

  const auto frames = cache.frames("synthetic", opts.sample_rate);
  const auto outline = cache.outline("synthetic");

  std::printf("session synthetic: %zu entities, %zu raw samples (min), sample rate %d\n",
              frames->roster.size(), frames->min_raw_samples, frames->sample_rate);
  std::printf("%zu frames, outline %zu points, length %.1f\n",
              frames->size(), outline->points().size(), outline->length());
  if (const Frame* last = frames->frame_at(frames->size() - 1)) {
    for (std::size_t k = 0; k < frames->roster.size(); ++k) {
      const auto& s = last->slots[k];
      if (!s) continue;
      std::printf("  %-4s lap %d  (%.1f, %.1f)  %.0f km/h\n",
                  s->code.c_str(), s->lap, s->x, s->y, s->speed);
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return 2; }
  const std::string cmd = argv[1];
  try {
    if (cmd == "predict") return run_predict(argc, argv);
    if (cmd == "replay") return run_replay(argc, argv);
  } catch (const PitwallError& e) {
    logger()->error("{}", e.what());
    return 1;
  }
  usage();
  return 2;
}
