#include <pitwall/normalize.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <pitwall/errors.hpp>

namespace pitwall {

double normalize_coordinate(double raw, const AxisRange& raw_range, const AxisRange& viz, char axis) {
  if (raw_range.max == raw_range.min) throw DegenerateRangeError(axis, raw_range.min);
  const double t = (raw - raw_range.min) / (raw_range.max - raw_range.min);
  // lerp is exact at t == 0 and t == 1.
  return std::lerp(viz.min, viz.max, t);
}

static void extend(AxisRange& r, double v, bool first) {
  if (first) { r.min = r.max = v; return; }
  r.min = std::min(r.min, v);
  r.max = std::max(r.max, v);
}

std::optional<Bounds2D> observe_bounds(const TelemetrySet& set) {
  Bounds2D b;
  bool any = false;
  for (const auto& [id, t] : set) {
    for (const auto& s : t.samples) {
      if (!std::isfinite(s.x) || !std::isfinite(s.y)) continue;
      extend(b.x, s.x, !any);
      extend(b.y, s.y, !any);
      any = true;
    }
  }
  if (!any) return std::nullopt;
  return b;
}

std::optional<Bounds2D> observe_bounds(const std::vector<Vec2>& points) {
  Bounds2D b;
  bool any = false;
  for (const auto& p : points) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) continue;
    extend(b.x, p.x, !any);
    extend(b.y, p.y, !any);
    any = true;
  }
  if (!any) return std::nullopt;
  return b;
}

AffineMap::AffineMap(const Bounds2D& raw, const Bounds2D& viz) : raw_(raw), viz_(viz) {
  if (raw.x.max == raw.x.min) throw DegenerateRangeError('x', raw.x.min);
  if (raw.y.max == raw.y.min) throw DegenerateRangeError('y', raw.y.min);
}

AffineMap AffineMap::collapse_degenerate(const Bounds2D& raw, const Bounds2D& viz) {
  AffineMap m;
  m.raw_ = raw;
  m.viz_ = viz;
  m.collapse_x_ = raw.x.max == raw.x.min;
  m.collapse_y_ = raw.y.max == raw.y.min;
  return m;
}

AffineMap AffineMap::uniform(const Bounds2D& raw, const Bounds2D& viz) {
  AffineMap m = collapse_degenerate(raw, viz);
  double scale = std::numeric_limits<double>::infinity();
  if (!m.collapse_x_) scale = std::min(scale, std::abs(viz.x.span() / raw.x.span()));
  if (!m.collapse_y_) scale = std::min(scale, std::abs(viz.y.span() / raw.y.span()));
  m.uniform_scale_ = std::isfinite(scale) ? scale : 0.0;
  return m;
}

AffineMap fit_coordinate_map(const Bounds2D& raw, const Bounds2D& viz, bool preserve_aspect) {
  return preserve_aspect ? AffineMap::uniform(raw, viz) : AffineMap::collapse_degenerate(raw, viz);
}

double AffineMap::map_axis_(double v, const AxisRange& raw, const AxisRange& viz, bool collapsed) const {
  if (collapsed) return viz.midpoint();
  if (uniform_scale_) {
    // Signed so an inverted target axis stays inverted.
    const double s = std::copysign(*uniform_scale_, viz.span() / raw.span());
    return viz.midpoint() + (v - raw.midpoint()) * s;
  }
  const double t = (v - raw.min) / (raw.max - raw.min);
  return std::lerp(viz.min, viz.max, t);
}

std::vector<Vec2> AffineMap::apply(const std::vector<Vec2>& pts) const {
  std::vector<Vec2> out;
  out.reserve(pts.size());
  for (const auto& p : pts) out.push_back(apply(p));
  return out;
}

} // namespace pitwall
