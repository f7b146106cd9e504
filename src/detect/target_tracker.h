#pragma once

#include <cstdint>
#include <vector>
#include "config/config.h"
#include "detect/dbscan.h"

// Constant-position Kalman filter on one axis (A = H = 1).
struct AxisFilter {
  float x{0.0f};    // estimate
  float p{1.0f};    // estimate variance

  void update(float z, float q, float r);
};

// A cluster followed across frames. Ids are unique for the session and
// never reused.
struct Target {
  uint32_t id{0};
  AxisFilter fx;
  AxisFilter fy;
  uint32_t hits{0};              // frames with a matched cluster
  int missed{0};                 // consecutive frames without one
  uint32_t first_seq{0};
  uint32_t last_seq{0};
  bool parked{false};            // set from the heatmap, false when it is off

  float x() const { return fx.x; }
  float y() const { return fy.x; }
};

class TargetTracker {
public:
  explicit TargetTracker(const TrackingConfig& cfg);

  // Pairs cluster centroids with targets, closest pair first and at most
  // one cluster per target. Unmatched clusters start new targets. Targets
  // that leave the view box or miss more than max_missed frames are dropped.
  const std::vector<Target>& update(const std::vector<Cluster>& clusters, uint32_t seq);

  // |x| <= lim_x, 0 <= y <= lim_y
  void setView(float lim_x, float lim_y);

  std::vector<Target>& targets() { return targets_; }
  const std::vector<Target>& targets() const { return targets_; }
  uint32_t targetsStarted() const { return next_id_ - 1; }
  void reset();

private:
  bool inView(const Target& t) const;

  TrackingConfig cfg_;
  float lim_x_{20.0f};
  float lim_y_{10.0f};
  std::vector<Target> targets_;
  uint32_t next_id_{1};
};
