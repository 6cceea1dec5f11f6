#include <pitwall/track_outline.hpp>
#include <algorithm>
#include <cmath>
#include <pitwall/log.hpp>

namespace pitwall {

TrackOutline default_track_outline() {
  // Simplified Austin layout, in arbitrary units. The loop closes on (0, 0).
  static const std::vector<Vec2> corners = {
    { 0,  0}, {10,  5}, {20,  8}, {30, 10}, {35, 15}, {40, 18}, {45, 20},
    {50, 22}, {55, 23}, {60, 22}, {65, 20}, {70, 18}, {75, 15}, {80, 12},
    {85, 10}, {85,  0}, {80, -5}, {75,-10}, {70,-12}, {60,-15}, {50,-18},
    {40,-20}, {30,-22}, {20,-20}, {10,-10},
  };
  return TrackPath{corners};
}

// The lap to trace: the first one with a lap change on both sides when there
// is one (telemetry usually starts mid-lap), else the first lap present.
static int pick_outline_lap(const std::vector<RawTelemetrySample>& samples) {
  std::vector<int> laps;
  for (const auto& s : samples) {
    if (laps.empty() || laps.back() != s.lap) laps.push_back(s.lap);
  }
  if (laps.empty()) return 0;
  return laps.size() >= 3 ? laps[1] : laps[0];
}

TrackOutline extract_track_outline(const std::vector<RawTelemetrySample>& samples,
                                   std::size_t max_points) {
  const int lap = pick_outline_lap(samples);
  std::vector<Vec2> pts;
  for (const auto& s : samples) {
    if (s.lap != lap) continue;
    if (!std::isfinite(s.x) || !std::isfinite(s.y)) continue;
    pts.push_back({s.x, s.y});
  }

  const std::size_t cap = std::max<std::size_t>(3, max_points);
  if (pts.size() > cap) {
    const std::size_t step = (pts.size() + cap - 1) / cap;
    std::vector<Vec2> kept;
    kept.reserve(cap);
    for (std::size_t i = 0; i < pts.size(); i += step) kept.push_back(pts[i]);
    pts = std::move(kept);
  }

  if (pts.size() < 3) {
    logger()->warn("track outline: {} usable points, using default outline", pts.size());
    return default_track_outline();
  }
  return TrackPath{std::move(pts)};
}

TrackOutline extract_track_outline(const TelemetrySet& telemetry, std::size_t max_points) {
  const EntityTelemetry* best = nullptr;
  for (const auto& [id, t] : telemetry) {
    if (!best || t.samples.size() > best->samples.size()) best = &t;
  }
  if (!best) return extract_track_outline(std::vector<RawTelemetrySample>{}, max_points);
  return extract_track_outline(best->samples, max_points);
}

Vec2 position_on_outline(const TrackOutline& outline, double lap_progress) {
  return outline.sample_progress(lap_progress);
}

TrackOutline normalize_outline(const TrackOutline& outline, const AffineMap& map) {
  return TrackPath{map.apply(outline.points())};
}

} // namespace pitwall
