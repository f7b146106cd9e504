#pragma once

#include <vector>
#include <cstdint>
#include <span>
#include "core/frame.h"

struct ClusteringConfig;

struct Cluster {
  uint32_t id;                 // scoped to one frame, 0..n-1 in discovery order
  std::vector<Point> members;
  float cx, cy;                // mean of member x,y
  float minx, miny, maxx, maxy;
  float mean_z;
  float mean_doppler;

  uint32_t count() const { return static_cast<uint32_t>(members.size()); }
};

struct ClusterSet {
  std::vector<Cluster> clusters;
  std::vector<int> labels;     // per input point: cluster id, or -1 for noise
  float eps{0.0f};             // neighbourhood radius actually used
  bool eps_from_knee{false};   // false: default eps fallback
  bool degenerate{false};      // fewer than minPts points, nothing clustered
};

class DBSCAN2D {
  float default_eps_; int minPts_;
  int k_;                      // neighbour rank for the k-distance graph
  float eps_min_, eps_max_;    // clamp for the knee-derived radius
  float sensitivity_;          // Kneedle S

public:
  DBSCAN2D(float default_eps, int minPts): default_eps_(default_eps), minPts_(minPts), k_(4),
    eps_min_(0.1f), eps_max_(2.0f), sensitivity_(1.0f) {}
  explicit DBSCAN2D(const ClusteringConfig& cfg);

  void setNeighbourRank(int k) { k_ = k; }

  float defaultEps() const { return default_eps_; }
  int minPts() const { return minPts_; }
  int neighbourRank() const { return k_; }

  // Radius from the knee of the k-distance graph, or the default eps.
  float selectEps(std::span<const Point> points, bool* from_knee = nullptr) const;

  // Clusters the (x,y) projection; z and doppler are only carried along.
  // Note: minPts semantics are INCLUSIVE (neighbor count includes the query point itself)
  ClusterSet run(std::span<const Point> points) const;
  // Points with a non-finite x or y are labelled noise.
  ClusterSet runWithEps(std::span<const Point> points, float eps) const;
};
