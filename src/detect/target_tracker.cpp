#include "target_tracker.h"
#include <algorithm>
#include <cmath>
#include <tuple>

void AxisFilter::update(float z, float q, float r) {
  // Predict with the identity model, then correct.
  const float p_est = p + q;
  const float k = p_est / (p_est + r);
  x += k * (z - x);
  p = (1.0f - k) * p_est;
}

TargetTracker::TargetTracker(const TrackingConfig& cfg) : cfg_(cfg) {}

void TargetTracker::setView(float lim_x, float lim_y) {
  lim_x_ = lim_x;
  lim_y_ = lim_y;
}

void TargetTracker::reset() {
  targets_.clear();
  next_id_ = 1;
}

bool TargetTracker::inView(const Target& t) const {
  return t.x() >= -lim_x_ && t.x() <= lim_x_ && t.y() >= 0.0f && t.y() <= lim_y_;
}

const std::vector<Target>& TargetTracker::update(const std::vector<Cluster>& clusters, uint32_t seq) {
  const float gate_sq = cfg_.dist_threshold * cfg_.dist_threshold;

  // (distance^2, target, cluster) for every pair inside the gate.
  std::vector<std::tuple<float, size_t, size_t>> pairs;
  for (size_t t = 0; t < targets_.size(); ++t) {
    for (size_t c = 0; c < clusters.size(); ++c) {
      const float dx = clusters[c].cx - targets_[t].x();
      const float dy = clusters[c].cy - targets_[t].y();
      const float d2 = dx * dx + dy * dy;
      if (d2 < gate_sq) pairs.emplace_back(d2, t, c);
    }
  }
  std::sort(pairs.begin(), pairs.end());

  std::vector<bool> target_used(targets_.size(), false);
  std::vector<bool> cluster_used(clusters.size(), false);
  for (const auto& [d2, t, c] : pairs) {
    if (target_used[t] || cluster_used[c]) continue;
    target_used[t] = cluster_used[c] = true;
    Target& tgt = targets_[t];
    tgt.fx.update(clusters[c].cx, cfg_.process_noise, cfg_.measurement_noise);
    tgt.fy.update(clusters[c].cy, cfg_.process_noise, cfg_.measurement_noise);
    ++tgt.hits;
    tgt.missed = 0;
    tgt.last_seq = seq;
  }

  for (size_t t = 0; t < targets_.size(); ++t) {
    if (!target_used[t]) ++targets_[t].missed;
  }

  for (size_t c = 0; c < clusters.size(); ++c) {
    if (cluster_used[c]) continue;
    Target tgt;
    tgt.id = next_id_++;
    tgt.fx.x = clusters[c].cx;
    tgt.fy.x = clusters[c].cy;
    tgt.hits = 1;
    tgt.first_seq = tgt.last_seq = seq;
    targets_.push_back(tgt);
  }

  std::erase_if(targets_, [this](const Target& t) {
    return !inView(t) || (cfg_.max_missed > 0 && t.missed > cfg_.max_missed);
  });
  return targets_;
}
