#include <pitwall/track_geom.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace pitwall {

TrackPath::TrackPath(std::vector<Vec2> pts) {
  if (pts.size() < 2) return;
  if (!(pts.front() == pts.back())) pts.push_back(pts.front());
  pts_ = std::move(pts);

  dist_.assign(pts_.size(), 0.0);
  for (std::size_t i = 1; i < pts_.size(); ++i) {
    dist_[i] = dist_[i - 1] + std::hypot(pts_[i].x - pts_[i - 1].x, pts_[i].y - pts_[i - 1].y);
  }
  length_ = dist_.back();
}

Vec2 TrackPath::sample(double s) const {
  if (empty() || length_ <= 0.0) return {};
  double at = std::fmod(s, length_);
  if (at < 0.0) at += length_;

  // Segment [k - 1, k] containing `at`.
  const auto hi = std::upper_bound(dist_.begin() + 1, dist_.end() - 1, at);
  const auto k = static_cast<std::size_t>(hi - dist_.begin());
  const Vec2& a = pts_[k - 1];
  const Vec2& b = pts_[k];
  const double seg = dist_[k] - dist_[k - 1];
  const double t = seg > 0.0 ? (at - dist_[k - 1]) / seg : 0.0;
  return Vec2{ std::lerp(a.x, b.x, t), std::lerp(a.y, b.y, t) };
}

TrackPath TrackPath::Circle(double cx, double cy, double radius, int segments) {
  if (segments < 3 || radius <= 0.0) return TrackPath{};
  std::vector<Vec2> pts;
  pts.reserve(static_cast<std::size_t>(segments));
  for (int i = 0; i < segments; ++i) {
    const double a = kTAU * double(i) / double(segments);
    pts.push_back({ cx + radius * std::cos(a), cy + radius * std::sin(a) });
  }
  return TrackPath{std::move(pts)};
}

} // namespace pitwall
