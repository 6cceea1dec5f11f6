#pragma once
#include <optional>
#include <vector>
#include <pitwall/telemetry.hpp>
#include <pitwall/track_geom.hpp>

namespace pitwall {

struct AxisRange {
  double min = 0.0;
  double max = 0.0;

  double span() const { return max - min; }
  double midpoint() const { return min + 0.5 * (max - min); }
  bool operator==(const AxisRange&) const = default;
};

struct Bounds2D {
  AxisRange x;
  AxisRange y;

  bool operator==(const Bounds2D&) const = default;
};

// viz = viz.min + (raw - raw_range.min) / raw_range.span() * viz.span()
// raw_range.min maps exactly to viz.min and raw_range.max exactly to viz.max.
// Throws DegenerateRangeError(axis) when raw_range.min == raw_range.max.
double normalize_coordinate(double raw, const AxisRange& raw_range, const AxisRange& viz, char axis = 'x');

// Bounds over every finite sample of every entity; nullopt when there are none.
std::optional<Bounds2D> observe_bounds(const TelemetrySet& set);
std::optional<Bounds2D> observe_bounds(const std::vector<Vec2>& points);

// Per-axis affine map fitted once to the raw bounds of a whole session and
// applied unchanged to every sample, so the track shape is preserved.
class AffineMap {
public:
  // Throws DegenerateRangeError on a flat axis.
  AffineMap(const Bounds2D& raw, const Bounds2D& viz);

  // Flat axes are sent to the target-axis midpoint instead of throwing.
  static AffineMap collapse_degenerate(const Bounds2D& raw, const Bounds2D& viz);

  // One scale for both axes (the smaller of the two per-axis scales), raw
  // center mapped to target center, so the aspect ratio of the track is kept.
  // The longer axis fills its target range; the other is centered in it.
  // Flat axes go to the midpoint as in collapse_degenerate.
  static AffineMap uniform(const Bounds2D& raw, const Bounds2D& viz);

  double map_x(double raw_x) const { return map_axis_(raw_x, raw_.x, viz_.x, collapse_x_); }
  double map_y(double raw_y) const { return map_axis_(raw_y, raw_.y, viz_.y, collapse_y_); }
  bool preserves_aspect() const { return uniform_scale_.has_value(); }
  Vec2 apply(const Vec2& p) const { return Vec2{ map_x(p.x), map_y(p.y) }; }
  std::vector<Vec2> apply(const std::vector<Vec2>& pts) const;

  const Bounds2D& raw_bounds() const { return raw_; }
  const Bounds2D& viz_bounds() const { return viz_; }
  bool collapsed_x() const { return collapse_x_; }
  bool collapsed_y() const { return collapse_y_; }

private:
  AffineMap() = default;
  double map_axis_(double v, const AxisRange& raw, const AxisRange& viz, bool collapsed) const;

  Bounds2D raw_{};
  Bounds2D viz_{};
  bool collapse_x_{false};
  bool collapse_y_{false};
  std::optional<double> uniform_scale_;
};

// Session map used by the preprocessor and the outline cache: uniform when
// preserve_aspect is set, else per-axis with flat axes collapsed.
AffineMap fit_coordinate_map(const Bounds2D& raw, const Bounds2D& viz, bool preserve_aspect);

} // namespace pitwall
