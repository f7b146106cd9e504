#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "config/config.h"
#include "detect/target_tracker.h"

// Group of hot cells where targets kept coming to rest.
struct HeatSpot {
  float x{0.0f};                 // m, centroid of the group
  float y{0.0f};
  float occupancy{0.0f};         // share of frames a target sat on the spot, 0..1
  uint32_t cells{0};
};

// A spot snapped to the bay pitch along x; y is shared by all of them.
struct EstimatedBay {
  float x{0.0f};
  float y{0.0f};
  float occupancy{0.0f};
};

struct HeatmapSummary {
  uint64_t frames{0};
  std::vector<HeatSpot> spots;
  std::vector<EstimatedBay> bays;
};

// Session-long activity grid over the monitored area, x in
// [-x_extent/2, x_extent/2] and y in [0, y_extent]. Every update stamps a
// 5x5 kernel (1 at the target's cell, 0.75 on the first ring, 0.5 on the
// second) and counts the centre cell separately for the summary. Heat is
// normalised as value / (max + 1).
class OccupancyHeatmap {
public:
  OccupancyHeatmap(const HeatmapConfig& cfg, float bay_width);

  // New geometry; clears the accumulated heat.
  void resize(float x_extent, float y_extent);
  void reset();

  // Adds the targets matched this frame and marks those on cells hotter
  // than activity_threshold as parked.
  void update(std::vector<Target>& targets);

  // Normalised heat under (x, y), 0 outside the grid.
  float heat(float x, float y) const;
  HeatmapSummary summary() const;

  int cols() const { return cols_; }
  int rows() const { return rows_; }
  uint64_t iterations() const { return iterations_; }

private:
  std::optional<std::pair<int, int>> cellOf(float x, float y) const;
  size_t index(int cx, int cy) const { return static_cast<size_t>(cy) * cols_ + cx; }

  HeatmapConfig cfg_;
  float bay_width_;
  float x_extent_{10.0f};
  float y_extent_{10.0f};
  int cols_{0};
  int rows_{0};
  std::vector<float> data_;      // kernel sums
  std::vector<float> hits_;      // centre-cell counts
  float max_{0.0f};
  uint64_t iterations_{0};
};
