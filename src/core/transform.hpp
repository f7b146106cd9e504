#pragma once
#include <cmath>
#include <optional>
#include <vector>
#include "core/frame.h"

// Maps sensor-relative points onto the ground plane used by bay polygons:
// undo the radar's down-tilt (rotation about x), lift z by the mounting height,
// then clip to the monitored area |x| <= x_extent/2 + boundary_ext, 0 <= y <= y_extent.
// Points with a NaN or infinite coordinate are always dropped.
struct Registration {
  float x_extent{10.0f};
  float y_extent{10.0f};
  float sensor_height{2.0f};
  float tilt_deg{10.0f};
  float boundary_ext{15.0f};
  bool clip{true};

  std::optional<Point> apply(const Point& p) const {
    if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) return std::nullopt;
    const float el = -tilt_deg * static_cast<float>(M_PI / 180.0);
    const float c = std::cos(el), s = std::sin(el);
    Point out = p;
    out.y = c*p.y - s*p.z;
    out.z = s*p.y + c*p.z + sensor_height;
    if (!std::isfinite(out.y) || !std::isfinite(out.z)) return std::nullopt;
    if (clip) {
      const float lim_x = x_extent * 0.5f + boundary_ext;
      if (out.x < -lim_x || out.x > lim_x) return std::nullopt;
      if (out.y < 0.0f || out.y > y_extent) return std::nullopt;
    }
    return out;
  }

  std::vector<Point> apply(const std::vector<Point>& pts) const {
    std::vector<Point> out;
    out.reserve(pts.size());
    for (const auto& p : pts) {
      if (auto q = apply(p)) out.push_back(*q);
    }
    return out;
  }
};
