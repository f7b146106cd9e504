#include "occupancy.h"
#include <algorithm>

BayOccupancy ParkingBay::occupancy() const {
  switch (state) {
    case DebounceState::Empty:    return BayOccupancy::Empty;
    case DebounceState::Occupied: return BayOccupancy::Occupied;
    default:                      return BayOccupancy::Transitioning;
  }
}

BayOccupancy ParkingBay::committed() const {
  return (state == DebounceState::Occupied || state == DebounceState::TentativeEmpty)
             ? BayOccupancy::Occupied : BayOccupancy::Empty;
}

bool step_debounce(ParkingBay& bay, bool occupied, uint32_t seq, int enter_frames, int exit_frames) {
  const DebounceState before = bay.state;
  bay.observed = occupied;

  switch (bay.state) {
    case DebounceState::Empty:
      if (occupied) {
        bay.streak = 1;
        bay.state = bay.streak >= enter_frames ? DebounceState::Occupied : DebounceState::TentativeOccupied;
      }
      break;

    case DebounceState::TentativeOccupied:
      if (occupied) {
        if (++bay.streak >= enter_frames) bay.state = DebounceState::Occupied;
      } else {
        bay.state = DebounceState::Empty;
      }
      break;

    case DebounceState::Occupied:
      if (!occupied) {
        bay.streak = 1;
        bay.state = bay.streak >= exit_frames ? DebounceState::Empty : DebounceState::TentativeEmpty;
      }
      break;

    case DebounceState::TentativeEmpty:
      if (!occupied) {
        if (++bay.streak >= exit_frames) bay.state = DebounceState::Empty;
      } else {
        bay.state = DebounceState::Occupied;
      }
      break;
  }

  if (bay.state == DebounceState::Empty || bay.state == DebounceState::Occupied) {
    bay.streak = 0;
  }
  if (bay.state != before) {
    bay.last_change_frame = seq;
    return true;
  }
  return false;
}

BayTracker::BayTracker(const std::vector<BayConfig>& bays, const OccupancyConfig& cfg) : cfg_(cfg) {
  bays_.reserve(bays.size());
  for (const auto& b : bays) {
    ParkingBay pb;
    pb.id = b.id;
    pb.polygon = b.polygon;
    bays_.push_back(std::move(pb));
  }
}

bool BayTracker::observe(const ParkingBay& bay, const std::vector<Cluster>& clusters) const {
  for (const auto& c : clusters) {
    if (cfg_.rule == OccupancyRule::Centroid) {
      if (bay.polygon.contains({c.cx, c.cy})) return true;
    } else {
      const core::Box box{c.minx, c.miny, c.maxx, c.maxy};
      if (bay.polygon.coverage(box) >= cfg_.bbox_fraction) return true;
    }
  }
  return false;
}

std::vector<BayChange> BayTracker::update(const std::vector<Cluster>& clusters, uint32_t seq) {
  std::vector<BayChange> changes;
  for (auto& bay : bays_) {
    const bool occupied = observe(bay, clusters);
    const DebounceState before = bay.state;
    if (step_debounce(bay, occupied, seq, cfg_.enter_frames, cfg_.exit_frames)) {
      changes.push_back({bay.id, before, bay.state, seq});
    }
  }
  return changes;
}

size_t BayTracker::occupiedCount() const {
  return static_cast<size_t>(std::count_if(bays_.begin(), bays_.end(), [](const ParkingBay& b) {
    return b.committed() == BayOccupancy::Occupied;
  }));
}

void BayTracker::reset() {
  for (auto& bay : bays_) {
    bay.state = DebounceState::Empty;
    bay.streak = 0;
    bay.last_change_frame = 0;
    bay.observed = false;
  }
}

const char* to_string(DebounceState s) {
  switch (s) {
    case DebounceState::Empty:             return "EMPTY";
    case DebounceState::TentativeOccupied: return "TENTATIVE_OCCUPIED";
    case DebounceState::Occupied:          return "OCCUPIED";
    case DebounceState::TentativeEmpty:    return "TENTATIVE_EMPTY";
  }
  return "UNKNOWN";
}

const char* to_string(BayOccupancy o) {
  switch (o) {
    case BayOccupancy::Empty:         return "EMPTY";
    case BayOccupancy::Occupied:      return "OCCUPIED";
    case BayOccupancy::Transitioning: return "TRANSITIONING";
  }
  return "UNKNOWN";
}
