#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "config/config.h"
#include "core/frame.h"
#include "core/mask.h"
#include "core/transform.hpp"
#include "detect/dbscan.h"
#include "detect/heatmap.h"
#include "detect/occupancy.h"
#include "detect/postfilter.h"
#include "detect/target_tracker.h"
#include "io/wire.h"

struct FrameResult {
  uint32_t seq{0};
  double t{0.0};
  std::vector<Point> points;          // registered and masked
  ClusterSet clusters;                // after the postfilter
  std::vector<ParkingBay> bays;       // snapshot after this frame
  std::vector<BayChange> changes;
  std::vector<Target> targets;        // live targets, empty when tracking is off
};

struct PipelineStats {
  uint64_t frames{0};
  uint64_t points_in{0};
  uint64_t points_kept{0};
  uint64_t clusters{0};
  uint64_t degenerate_frames{0};
  uint64_t default_eps_frames{0};    // no knee in the k-distance graph
  uint64_t bay_changes{0};
  float last_eps{0.0f};
};

struct BaySummary {
  std::string id;
  uint64_t occupied_frames{0};
  float occupancy{0.0f};              // occupied_frames / frames
  uint32_t entries{0};                // transitions into Occupied
};

// End-of-session report: per-bay occupancy plus the spots the heatmap found.
struct SessionSummary {
  uint64_t frames{0};
  double duration{0.0};               // s, first to last frame timestamp
  uint32_t targets{0};                // targets started during the session
  std::vector<BaySummary> bays;
  HeatmapSummary heatmap;
};

// Per-session processing chain: registration, world mask, clustering,
// postfilter, bay tracking, target tracking and the heatmap. Not thread-safe; one consumer per session.
class OccupancyPipeline {
public:
  explicit OccupancyPipeline(const AppConfig& cfg);

  FrameResult process(const Frame& f);

  // Geometry from the session (handshake or archive header).
  void setMetadata(const Handshake& hs);
  Handshake metadata() const;

  const BayTracker& tracker() const { return tracker_; }
  const TargetTracker& targets() const { return targets_; }
  const OccupancyHeatmap& heatmap() const { return heatmap_; }
  SessionSummary summary() const;
  const PipelineStats& stats() const { return stats_; }
  const Registration& registration() const { return reg_; }

private:
  Registration reg_;
  core::WorldMask mask_;
  DBSCAN2D dbscan_;
  Postfilter postfilter_;
  bool postfilter_enabled_;
  BayTracker tracker_;
  TargetTracker targets_;
  bool tracking_enabled_;
  OccupancyHeatmap heatmap_;
  bool heatmap_enabled_;
  PipelineStats stats_;
  bool in_degenerate_run_{false};

  std::vector<uint64_t> occupied_frames_;
  std::vector<uint32_t> entries_;
  double first_t_{0.0};
  double last_t_{0.0};
};
