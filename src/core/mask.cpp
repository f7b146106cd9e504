#include "mask.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace core {

bool Polygon::contains(const Point2D& p) const {
  if (points.size() < 3) return false;

  bool inside = false;
  size_t n = points.size();

  // even-odd ray cast
  for (size_t i = 0, j = n - 1; i < n; j = i++) {
    const auto& pi = points[i];
    const auto& pj = points[j];

    if (((pi.y > p.y) != (pj.y > p.y)) &&
        (p.x < (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y) + pi.x)) {
      inside = !inside;
    }
  }

  return inside;
}

Box Polygon::bounds() const {
  Box b{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
        std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
  if (points.empty()) return Box{};
  for (const auto& p : points) {
    b.minx = std::min(b.minx, p.x);
    b.miny = std::min(b.miny, p.y);
    b.maxx = std::max(b.maxx, p.x);
    b.maxy = std::max(b.maxy, p.y);
  }
  return b;
}

double Polygon::area() const {
  if (points.size() < 3) return 0.0;
  double acc = 0.0;
  for (size_t i = 0, j = points.size() - 1; i < points.size(); j = i++) {
    acc += points[j].x * points[i].y - points[i].x * points[j].y;
  }
  return std::abs(acc) * 0.5;
}

double Polygon::coverage(const Box& b, int samples) const {
  if (empty()) return 0.0;
  if (b.degenerate()) return contains(b.center()) ? 1.0 : 0.0;

  samples = std::max(1, samples);
  const double sx = (b.maxx - b.minx) / samples;
  const double sy = (b.maxy - b.miny) / samples;
  int hits = 0;
  for (int ix = 0; ix < samples; ++ix) {
    for (int iy = 0; iy < samples; ++iy) {
      if (contains({b.minx + (ix + 0.5) * sx, b.miny + (iy + 0.5) * sy})) ++hits;
    }
  }
  return static_cast<double>(hits) / (samples * samples);
}

Polygon Polygon::rectangle(double minx, double miny, double maxx, double maxy) {
  Polygon p;
  p.points = {{minx, miny}, {maxx, miny}, {maxx, maxy}, {minx, maxy}};
  return p;
}

bool WorldMask::allows(const Point2D& p) const {
  // If no include polygons, point is allowed by default
  bool included = include.empty();

  if (!included) {
    for (const auto& poly : include) {
      if (poly.contains(p)) {
        included = true;
        break;
      }
    }
  }

  if (!included) return false;

  for (const auto& poly : exclude) {
    if (poly.contains(p)) {
      return false;
    }
  }

  return true;
}

} // namespace core
