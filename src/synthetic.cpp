#include <pitwall/synthetic.hpp>
#include <array>
#include <cmath>
#include <random>
#include <pitwall/track_geom.hpp>

namespace pitwall {

namespace {
struct DemoDriver { const char* code; const char* name; const char* team; const char* color; };

constexpr std::array<DemoDriver, 10> kDemoGrid{{
  {"VER", "Verstappen", "Red Bull",     "#0600EF"},
  {"HAM", "Hamilton",   "Mercedes",     "#00D2BE"},
  {"LEC", "Leclerc",    "Ferrari",      "#DC0000"},
  {"NOR", "Norris",     "McLaren",      "#FF8700"},
  {"PER", "Perez",      "Red Bull",     "#0600EF"},
  {"SAI", "Sainz",      "Ferrari",      "#DC0000"},
  {"RUS", "Russell",    "Mercedes",     "#00D2BE"},
  {"ALO", "Alonso",     "Aston Martin", "#006F62"},
  {"OCO", "Ocon",       "Alpine",       "#0090FF"},
  {"GAS", "Gasly",      "Alpine",       "#0090FF"},
}};

EntityMeta demo_meta(int i) {
  if (i < static_cast<int>(kDemoGrid.size())) {
    const auto& d = kDemoGrid[static_cast<std::size_t>(i)];
    return EntityMeta{d.code, d.name, d.team, d.color};
  }
  const std::string n = std::to_string(i + 1);
  return EntityMeta{"D" + n, "Driver " + n, "Privateer", "#FFFFFF"};
}
} // namespace

TelemetrySet synthetic_telemetry(int num_entities, int num_laps, int points_per_lap) {
  TelemetrySet out;
  if (num_entities <= 0 || num_laps <= 0 || points_per_lap <= 0) return out;

  const TrackPath loop = TrackPath::Circle(500.0, 500.0, 400.0, 360);
  const int total = points_per_lap * num_laps;

  for (int i = 0; i < num_entities; ++i) {
    EntityTelemetry t;
    t.meta = demo_meta(i);
    t.samples.reserve(static_cast<std::size_t>(total));
    const double phase = 0.2 * double(i);
    for (int p = 0; p < total; ++p) {
      const double progress = double(p) / double(points_per_lap) + phase;
      const Vec2 pos = loop.sample_progress(progress);
      RawTelemetrySample s;
      s.time_s = 0.1 * double(p);
      s.x = pos.x;
      s.y = pos.y;
      s.speed = 200.0 + 50.0 * std::sin(3.0 * progress * kTAU);
      s.lap = p / points_per_lap + 1;
      t.samples.push_back(s);
    }
    out.emplace(std::to_string(i + 1), std::move(t));
  }
  return out;
}

std::vector<LapRecord> synthetic_lap_history(const SyntheticHistorySpec& hist) {
  std::vector<LapRecord> out;
  std::mt19937_64 rng(hist.seed);
  std::normal_distribution<double> noise(0.0, hist.noise_s > 0.0 ? hist.noise_s : 1.0);

  for (const auto& session : hist.sessions) {
    for (int e = 0; e < hist.entities; ++e) {
      const int pit_lap = hist.laps / 2 + e % 3;
      const auto idx = static_cast<std::size_t>(e);
      const double pace = idx < hist.pace_offsets_s.size() ? hist.pace_offsets_s[idx] : 0.0;
      for (int lap = 1; lap <= hist.laps; ++lap) {
        LapRecord r;
        r.session = session;
        r.entity_id = std::to_string(e + 1);
        r.lap_number = lap;
        const double jitter = hist.noise_s > 0.0 ? noise(rng) : 0.0;
        r.lap_duration = hist.baseline_s + hist.degradation_s * double(lap) + pace + jitter;
        r.pit_flag = lap == pit_lap;
        if (r.pit_flag) r.lap_duration += hist.pit_loss_s;
        out.push_back(std::move(r));
      }
    }
  }
  return out;
}

} // namespace pitwall
