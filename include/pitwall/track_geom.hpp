#pragma once
#include <cstddef>
#include <numbers>
#include <vector>

namespace pitwall {

inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

struct Vec2 {
  double x{};
  double y{};

  bool operator==(const Vec2&) const = default;
};

// Closed polyline with arc-length lookup. Track outlines and the synthetic
// circuit are both stored this way.
class TrackPath {
public:
  TrackPath() = default;
  // Fewer than two points gives an empty path. The first point is appended
  // at the end when the loop is not already closed.
  explicit TrackPath(std::vector<Vec2> pts);

  const std::vector<Vec2>& points() const { return pts_; }
  double length() const { return length_; }
  bool empty() const { return pts_.size() < 2; }

  // Point at arc length s, wrapped into [0, length). Origin for an empty path.
  Vec2 sample(double s) const;
  // Point at lap progress; 0 is the first point, values outside [0, 1) wrap.
  Vec2 sample_progress(double progress) const { return sample(progress * length_); }

  // Regular polygon with `segments` corners, counter-clockwise from angle 0.
  static TrackPath Circle(double cx, double cy, double radius, int segments = 100);

private:
  std::vector<Vec2> pts_;
  std::vector<double> dist_;   // dist_[i] = arc length from pts_[0] to pts_[i]
  double length_{0.0};
};

} // namespace pitwall
