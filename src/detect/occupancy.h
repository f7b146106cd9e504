#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "config/config.h"
#include "core/mask.h"
#include "detect/dbscan.h"

enum class DebounceState { Empty, TentativeOccupied, Occupied, TentativeEmpty };

// What the rendering layer sees.
enum class BayOccupancy { Empty, Occupied, Transitioning };

struct ParkingBay {
  std::string id;
  core::Polygon polygon;
  DebounceState state{DebounceState::Empty};
  int streak{0};                   // consecutive observations towards the pending state
  uint32_t last_change_frame{0};
  bool observed{false};            // instantaneous occupancy of the last update

  BayOccupancy occupancy() const;
  // Last settled state: a tentative state still reports where it came from.
  BayOccupancy committed() const;
};

struct BayChange {
  std::string id;
  DebounceState from;
  DebounceState to;
  uint32_t seq;
};

// Debounce rule for one observation. Returns true when the state changed.
bool step_debounce(ParkingBay& bay, bool occupied, uint32_t seq, int enter_frames, int exit_frames);

class BayTracker {
public:
  BayTracker(const std::vector<BayConfig>& bays, const OccupancyConfig& cfg);

  // Instantaneous observation for every bay followed by the debounce step.
  std::vector<BayChange> update(const std::vector<Cluster>& clusters, uint32_t seq);

  // True when any cluster occupies the bay under the configured rule.
  bool observe(const ParkingBay& bay, const std::vector<Cluster>& clusters) const;

  const std::vector<ParkingBay>& bays() const { return bays_; }
  const OccupancyConfig& config() const { return cfg_; }
  size_t occupiedCount() const;
  void reset();

private:
  OccupancyConfig cfg_;
  std::vector<ParkingBay> bays_;
};

const char* to_string(DebounceState s);
const char* to_string(BayOccupancy o);
