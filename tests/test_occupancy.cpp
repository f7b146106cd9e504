#include <gtest/gtest.h>
#include "config/config.h"
#include "detect/occupancy.h"

namespace {

ParkingBay bay() {
  ParkingBay b;
  b.id = "B1";
  b.polygon = core::Polygon::rectangle(0, 0, 2.4, 5.4);
  return b;
}

Cluster cluster_at(float cx, float cy, float half = 0.5f) {
  Cluster c{};
  c.id = 0;
  c.members.push_back(Point{cx, cy, 0, 0, 0});
  c.cx = cx; c.cy = cy;
  c.minx = cx - half; c.maxx = cx + half;
  c.miny = cy - half; c.maxy = cy + half;
  return c;
}

} // namespace

TEST(Debounce, EntersAfterNConsecutiveObservations) {
  ParkingBay b = bay();
  EXPECT_TRUE(step_debounce(b, true, 1, 3, 3));
  EXPECT_EQ(b.state, DebounceState::TentativeOccupied);
  EXPECT_EQ(b.occupancy(), BayOccupancy::Transitioning);
  EXPECT_EQ(b.committed(), BayOccupancy::Empty);

  EXPECT_FALSE(step_debounce(b, true, 2, 3, 3));
  EXPECT_EQ(b.streak, 2);
  EXPECT_TRUE(step_debounce(b, true, 3, 3, 3));
  EXPECT_EQ(b.state, DebounceState::Occupied);
  EXPECT_EQ(b.occupancy(), BayOccupancy::Occupied);
  EXPECT_EQ(b.last_change_frame, 3u);
}

TEST(Debounce, IsolatedObservationNeverCommits) {
  ParkingBay b = bay();
  const bool pattern[] = {true, false, false, true, false, true, false, false};
  uint32_t seq = 0;
  for (bool occ : pattern) {
    step_debounce(b, occ, ++seq, 3, 3);
    EXPECT_NE(b.state, DebounceState::Occupied);
    EXPECT_EQ(b.committed(), BayOccupancy::Empty);
  }
  EXPECT_EQ(b.state, DebounceState::Empty);
}

TEST(Debounce, ExitNeedsMConsecutiveEmptyFrames) {
  ParkingBay b = bay();
  step_debounce(b, true, 1, 1, 3);
  ASSERT_EQ(b.state, DebounceState::Occupied);

  step_debounce(b, false, 2, 1, 3);
  EXPECT_EQ(b.state, DebounceState::TentativeEmpty);
  EXPECT_EQ(b.committed(), BayOccupancy::Occupied);
  EXPECT_EQ(b.occupancy(), BayOccupancy::Transitioning);

  // A single occupied frame cancels the pending exit.
  step_debounce(b, true, 3, 1, 3);
  EXPECT_EQ(b.state, DebounceState::Occupied);
  EXPECT_EQ(b.last_change_frame, 3u);

  step_debounce(b, false, 4, 1, 3);
  step_debounce(b, false, 5, 1, 3);
  EXPECT_EQ(b.state, DebounceState::TentativeEmpty);
  step_debounce(b, false, 6, 1, 3);
  EXPECT_EQ(b.state, DebounceState::Empty);
  EXPECT_EQ(b.last_change_frame, 6u);
  EXPECT_EQ(b.streak, 0);
}

TEST(Debounce, SingleFrameThresholdsSkipTentativeStates) {
  ParkingBay b = bay();
  EXPECT_TRUE(step_debounce(b, true, 10, 1, 1));
  EXPECT_EQ(b.state, DebounceState::Occupied);
  EXPECT_TRUE(step_debounce(b, false, 11, 1, 1));
  EXPECT_EQ(b.state, DebounceState::Empty);
}

TEST(BayTracker, CentroidRule) {
  OccupancyConfig oc;
  oc.enter_frames = 1;
  std::vector<BayConfig> bays = {{"A", core::Polygon::rectangle(0, 0, 2.4, 5.4)},
                                 {"B", core::Polygon::rectangle(2.4, 0, 4.8, 5.4)}};
  BayTracker tracker(bays, oc);

  const auto changes = tracker.update({cluster_at(1.0f, 2.0f)}, 7);
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes[0].id, "A");
  EXPECT_EQ(changes[0].from, DebounceState::Empty);
  EXPECT_EQ(changes[0].to, DebounceState::Occupied);
  EXPECT_EQ(changes[0].seq, 7u);
  EXPECT_EQ(tracker.occupiedCount(), 1u);
  EXPECT_TRUE(tracker.bays()[0].observed);
  EXPECT_FALSE(tracker.bays()[1].observed);

  tracker.reset();
  EXPECT_EQ(tracker.occupiedCount(), 0u);
  EXPECT_EQ(tracker.bays()[0].state, DebounceState::Empty);
}

TEST(BayTracker, BoundingBoxRuleUsesCoverage) {
  OccupancyConfig oc;
  oc.enter_frames = 1;
  oc.rule = OccupancyRule::BoundingBox;
  oc.bbox_fraction = 0.5f;
  std::vector<BayConfig> bays = {{"A", core::Polygon::rectangle(0, 0, 2.4, 5.4)}};
  BayTracker tracker(bays, oc);

  // Centre outside the bay but most of the box inside.
  Cluster c = cluster_at(2.5f, 2.0f, 1.0f);
  c.cx = 2.6f;
  EXPECT_TRUE(tracker.observe(tracker.bays()[0], {c}));

  // A box reaching only its edge into the bay.
  EXPECT_FALSE(tracker.observe(tracker.bays()[0], {cluster_at(3.2f, 2.0f, 1.0f)}));

  // Single-point cluster: falls back to the box centre.
  EXPECT_TRUE(tracker.observe(tracker.bays()[0], {cluster_at(1.0f, 1.0f, 0.0f)}));
}

TEST(BayTracker, UnrelatedBaysAreIndependent) {
  OccupancyConfig oc;
  oc.enter_frames = 2;
  oc.exit_frames = 2;
  std::vector<BayConfig> bays = {{"A", core::Polygon::rectangle(0, 0, 2, 2)},
                                 {"B", core::Polygon::rectangle(10, 0, 12, 2)}};
  BayTracker tracker(bays, oc);
  tracker.update({cluster_at(1, 1)}, 1);
  tracker.update({cluster_at(1, 1), cluster_at(11, 1)}, 2);
  EXPECT_EQ(tracker.bays()[0].state, DebounceState::Occupied);
  EXPECT_EQ(tracker.bays()[1].state, DebounceState::TentativeOccupied);
}
