#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <vector>

namespace fuelhud {

inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

struct Vec2 {
  double x{};
  double y{};
};

// Closed polyline with arc-length parameterization.
class TrackPath {
public:
  TrackPath() = default;
  explicit TrackPath(std::vector<Vec2> pts) { set_points(std::move(pts)); }

  void set_points(std::vector<Vec2> pts) {
    pts_ = std::move(pts);
    if (pts_.size() < 2) { pts_.clear(); cum_.clear(); length_ = 0.0; return; }
    if (pts_.front().x != pts_.back().x || pts_.front().y != pts_.back().y) {
      pts_.push_back(pts_.front());
    }
    build_cumulative_();
  }

  const std::vector<Vec2>& points() const { return pts_; }
  double length() const { return length_; }
  bool empty() const { return pts_.size() < 2; }

  // s wraps into [0, length).
  void sample_pose(double s, double& x, double& y, double& heading_rad) const {
    if (empty() || length_ <= 0.0) { x = y = heading_rad = 0.0; return; }
    const std::size_t i1 = segment_end_(wrap_(s));
    const std::size_t i0 = i1 - 1;
    const double seg_len = cum_[i1] - cum_[i0];
    const double t = (seg_len > 0.0) ? (wrap_(s) - cum_[i0]) / seg_len : 0.0;

    const Vec2& a = pts_[i0];
    const Vec2& b = pts_[i1];
    x = a.x + (b.x - a.x) * t;
    y = a.y + (b.y - a.y) * t;
    heading_rad = std::atan2(b.y - a.y, b.x - a.x);
  }

  // Absolute heading change (rad) between s and s + ahead. Zero on straights.
  double heading_change(double s, double ahead) const {
    double x, y, h0, h1;
    sample_pose(s, x, y, h0);
    sample_pose(s + ahead, x, y, h1);
    double d = std::fmod(h1 - h0, kTAU);
    if (d > kPI) d -= kTAU;
    if (d < -kPI) d += kTAU;
    return std::fabs(d);
  }

  // Rounded-rectangle track centered at (0,0), starting at the bottom of the right arc.
  static TrackPath Stadium(double straight_len, double radius, int arc_pts_per_quadrant = 12) {
    std::vector<Vec2> pts;
    const double R = radius;
    const double L = straight_len * 0.5;

    auto arc = [&](double cx, double cy, double a0, double a1, int steps) {
      for (int i = 0; i <= steps; ++i) {
        const double a = a0 + (a1 - a0) * (double(i) / double(steps));
        pts.push_back({ cx + R * std::cos(a), cy + R * std::sin(a) });
      }
    };

    arc( L, 0.0, -kPI / 2.0, +kPI / 2.0, arc_pts_per_quadrant * 2);
    pts.push_back({ -L, +R });
    arc(-L, 0.0, +kPI / 2.0, 3.0 * kPI / 2.0, arc_pts_per_quadrant * 2);
    pts.push_back({ +L, -R });
    return TrackPath{std::move(pts)};
  }

private:
  double wrap_(double s) const {
    double sw = std::fmod(s, length_);
    if (sw < 0.0) sw += length_;
    return sw;
  }

  std::size_t segment_end_(double sw) const {
    auto it = std::upper_bound(cum_.begin(), cum_.end(), sw);
    return std::clamp<std::size_t>(std::distance(cum_.begin(), it), 1, pts_.size() - 1);
  }

  void build_cumulative_() {
    cum_.resize(pts_.size());
    cum_[0] = 0.0;
    for (std::size_t i = 1; i < pts_.size(); ++i) {
      const double dx = pts_[i].x - pts_[i-1].x;
      const double dy = pts_[i].y - pts_[i-1].y;
      cum_[i] = cum_[i-1] + std::sqrt(dx*dx + dy*dy);
    }
    length_ = cum_.back();
  }

  std::vector<Vec2> pts_;
  std::vector<double> cum_;
  double length_{0.0};
};

} // namespace fuelhud
