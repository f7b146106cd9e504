#pragma once
#include <vector>

namespace core {

struct Point2D {
  double x{0.0};
  double y{0.0};

  Point2D() = default;
  Point2D(double x_, double y_) : x(x_), y(y_) {}
};

struct Box {
  double minx{0.0}, miny{0.0}, maxx{0.0}, maxy{0.0};

  bool degenerate() const { return maxx <= minx || maxy <= miny; }
  Point2D center() const { return {(minx + maxx) * 0.5, (miny + maxy) * 0.5}; }
};

struct Polygon {
  std::vector<Point2D> points;

  bool contains(const Point2D& p) const;
  bool empty() const { return points.size() < 3; }

  Box bounds() const;
  double area() const;  // absolute shoelace area

  // Share of the box inside the polygon, sampled on a samples x samples grid
  // of cell centres. A degenerate box is tested at its centre (0 or 1).
  double coverage(const Box& b, int samples = 8) const;

  static Polygon rectangle(double minx, double miny, double maxx, double maxy);
};

struct WorldMask {
  std::vector<Polygon> include;
  std::vector<Polygon> exclude;

  bool empty() const { return include.empty() && exclude.empty(); }
  bool allows(const Point2D& p) const;
};

} // namespace core
