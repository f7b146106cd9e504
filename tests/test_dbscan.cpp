#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numeric>
#include "config/config.h"
#include "detect/dbscan.h"
#include "detect/postfilter.h"

namespace {

std::vector<Point> blob(float ox, float oy, int n = 5, float step = 0.1f) {
  std::vector<Point> out;
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j)
      out.push_back(Point{ox + step * static_cast<float>(i), oy + step * static_cast<float>(j), 0.5f, -1.0f, 10.0f});
  return out;
}

std::vector<Point> two_blobs_and_noise() {
  auto pts = blob(0.0f, 0.0f);
  auto b = blob(5.0f, 5.0f);
  pts.insert(pts.end(), b.begin(), b.end());
  pts.push_back(Point{20.0f, 20.0f, 0.0f, 0.0f, 1.0f});
  return pts;
}

} // namespace

TEST(DBSCAN2D, SeparatesBlobsAndMarksNoise) {
  DBSCAN2D db(0.5f, 4);
  const auto pts = two_blobs_and_noise();
  const ClusterSet cs = db.run(pts);

  ASSERT_EQ(cs.clusters.size(), 2u);
  EXPECT_EQ(cs.clusters[0].count(), 25u);
  EXPECT_EQ(cs.clusters[1].count(), 25u);
  EXPECT_EQ(cs.labels.back(), -1);
  EXPECT_FALSE(cs.degenerate);
  EXPECT_GE(cs.eps, 0.1f);
  EXPECT_LE(cs.eps, 2.0f);

  EXPECT_NEAR(cs.clusters[0].cx, 0.2f, 1e-4f);
  EXPECT_NEAR(cs.clusters[0].cy, 0.2f, 1e-4f);
  EXPECT_NEAR(cs.clusters[1].cx, 5.2f, 1e-4f);
  EXPECT_FLOAT_EQ(cs.clusters[1].mean_z, 0.5f);
  EXPECT_FLOAT_EQ(cs.clusters[1].mean_doppler, -1.0f);
  EXPECT_NEAR(cs.clusters[0].maxx, 0.4f, 1e-5f);
}

TEST(DBSCAN2D, LabelsPartitionTheInput) {
  DBSCAN2D db(0.5f, 4);
  const auto pts = two_blobs_and_noise();
  const ClusterSet cs = db.run(pts);

  ASSERT_EQ(cs.labels.size(), pts.size());
  size_t labelled = 0;
  std::vector<size_t> per_cluster(cs.clusters.size(), 0);
  for (int l : cs.labels) {
    ASSERT_GE(l, -1);
    ASSERT_LT(l, static_cast<int>(cs.clusters.size()));
    if (l >= 0) {
      ++labelled;
      ++per_cluster[static_cast<size_t>(l)];
    }
  }
  size_t members = 0;
  for (size_t c = 0; c < cs.clusters.size(); ++c) {
    EXPECT_EQ(cs.clusters[c].id, c);
    EXPECT_EQ(cs.clusters[c].count(), per_cluster[c]);
    EXPECT_GT(cs.clusters[c].count(), 0u);
    members += cs.clusters[c].count();
  }
  EXPECT_EQ(members, labelled);
}

TEST(DBSCAN2D, RunIsDeterministic) {
  DBSCAN2D db(0.5f, 4);
  const auto pts = two_blobs_and_noise();
  const ClusterSet a = db.run(pts);
  const ClusterSet b = db.run(pts);
  EXPECT_EQ(a.labels, b.labels);
  EXPECT_EQ(a.eps, b.eps);
  ASSERT_EQ(a.clusters.size(), b.clusters.size());
  for (size_t i = 0; i < a.clusters.size(); ++i) {
    EXPECT_EQ(a.clusters[i].members, b.clusters[i].members);
  }
}

TEST(DBSCAN2D, FewerThanMinPtsIsDegenerate) {
  DBSCAN2D db(0.5f, 4);
  const std::vector<Point> pts = {{0, 0, 0, 0, 0}, {0.1f, 0, 0, 0, 0}, {0.2f, 0, 0, 0, 0}};
  const ClusterSet cs = db.run(pts);
  EXPECT_TRUE(cs.degenerate);
  EXPECT_TRUE(cs.clusters.empty());
  EXPECT_EQ(cs.labels, std::vector<int>(3, -1));

  EXPECT_TRUE(db.run(std::vector<Point>{}).clusters.empty());
}

TEST(DBSCAN2D, MinPtsCountsThePointItself) {
  // Three collinear points 0.3 apart: the middle one has exactly two
  // neighbours, so with minPts = 3 it is a core point.
  DBSCAN2D db(0.35f, 3);
  const std::vector<Point> pts = {{0, 0, 0, 0, 0}, {0.3f, 0, 0, 0, 0}, {0.6f, 0, 0, 0, 0}};
  const ClusterSet cs = db.runWithEps(pts, 0.35f);
  ASSERT_EQ(cs.clusters.size(), 1u);
  EXPECT_EQ(cs.clusters[0].count(), 3u);
}

TEST(DBSCAN2D, EvenlySpacedPointsFallBackToDefaultEps) {
  // Three 0.5 m squares far apart: every point's 3rd neighbour is its
  // square's diagonal, so the k-distance graph is flat.
  std::vector<Point> pts;
  for (float ox : {0.0f, 10.0f, 20.0f}) {
    pts.push_back({ox, 0.0f, 0, 0, 0});
    pts.push_back({ox + 0.5f, 0.0f, 0, 0, 0});
    pts.push_back({ox, 0.5f, 0, 0, 0});
    pts.push_back({ox + 0.5f, 0.5f, 0, 0, 0});
  }
  DBSCAN2D db(0.6f, 3);
  db.setNeighbourRank(3);

  bool from_knee = true;
  EXPECT_FLOAT_EQ(db.selectEps(pts, &from_knee), 0.6f);
  EXPECT_FALSE(from_knee);

  const ClusterSet cs = db.run(pts);
  EXPECT_FALSE(cs.eps_from_knee);
  EXPECT_FLOAT_EQ(cs.eps, 0.6f);
  ASSERT_EQ(cs.clusters.size(), 3u);
  for (const auto& c : cs.clusters) EXPECT_EQ(c.count(), 4u);
}

TEST(DBSCAN2D, KneeEpsIsClampedToRange) {
  ClusteringConfig cfg;
  cfg.default_eps = 0.5f;
  cfg.minPts = 4;
  cfg.eps_min = 0.3f;
  cfg.eps_max = 2.0f;
  DBSCAN2D db(cfg);
  // Dense 0.1 m blobs give a knee well below eps_min.
  const auto pts = two_blobs_and_noise();
  bool from_knee = false;
  const float eps = db.selectEps(pts, &from_knee);
  if (from_knee) {
    EXPECT_GE(eps, 0.3f);
    EXPECT_LE(eps, 2.0f);
  } else {
    EXPECT_FLOAT_EQ(eps, 0.5f);
  }
}

TEST(Postfilter, DropsSmallAndOversizedClustersAndRenumbers) {
  DBSCAN2D db(0.5f, 4);
  auto pts = blob(0.0f, 0.0f, 2);          // 4 points
  auto big = blob(5.0f, 5.0f, 5, 2.0f);    // 8 m wide
  auto ok = blob(30.0f, 0.0f, 4);          // 16 points
  pts.insert(pts.end(), big.begin(), big.end());
  pts.insert(pts.end(), ok.begin(), ok.end());
  const ClusterSet cs = db.runWithEps(pts, 2.05f);
  ASSERT_EQ(cs.clusters.size(), 3u);

  PostfilterConfig pc;
  pc.min_points = 5;
  pc.max_extent_m = 7.0f;
  const auto res = Postfilter(pc).apply(cs.clusters);
  ASSERT_EQ(res.clusters.size(), 1u);
  EXPECT_EQ(res.clusters[0].id, 0u);
  EXPECT_EQ(res.clusters[0].count(), 16u);
  EXPECT_EQ(res.stats.removed_by_size, 1u);
  EXPECT_EQ(res.stats.removed_by_extent, 1u);
  EXPECT_EQ(res.remap, (std::vector<int>{-1, -1, 0}));
}

TEST(DBSCAN2D, NonFinitePointsAreNoise) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();
  auto pts = blob(0.0f, 0.0f);
  pts.push_back(Point{nan, 0.1f, 0.0f, 0.0f, 1.0f});
  pts.push_back(Point{0.1f, inf, 0.0f, 0.0f, 1.0f});
  pts.push_back(Point{-inf, nan, 0.0f, 0.0f, 1.0f});
  pts.push_back(Point{3.0e38f, 0.0f, 0.0f, 0.0f, 1.0f});

  DBSCAN2D db(0.5f, 4);
  const ClusterSet fixed = db.runWithEps(pts, 0.2f);
  ASSERT_EQ(fixed.clusters.size(), 1u);
  EXPECT_EQ(fixed.clusters[0].count(), 25u);
  for (size_t i = 25; i < pts.size(); ++i) EXPECT_EQ(fixed.labels[i], -1) << i;

  const ClusterSet picked = db.run(pts);
  ASSERT_EQ(picked.labels.size(), pts.size());
  EXPECT_TRUE(std::isfinite(picked.eps));
  ASSERT_EQ(picked.clusters.size(), 1u);
  EXPECT_EQ(picked.clusters[0].count(), 25u);
}
