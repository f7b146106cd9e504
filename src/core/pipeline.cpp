#include "pipeline.h"
#include <iostream>
#include <vector>

OccupancyPipeline::OccupancyPipeline(const AppConfig& cfg)
  : mask_(cfg.world_mask),
    dbscan_(cfg.clustering),
    postfilter_(cfg.postfilter),
    postfilter_enabled_(cfg.postfilter.enabled),
    tracker_(resolve_bays(cfg), cfg.occupancy),
    targets_(cfg.tracking),
    tracking_enabled_(cfg.tracking.enabled),
    heatmap_(cfg.heatmap, cfg.bay_grid.bay_width),
    heatmap_enabled_(cfg.heatmap.enabled && cfg.tracking.enabled),
    occupied_frames_(tracker_.bays().size(), 0),
    entries_(tracker_.bays().size(), 0) {
  reg_.x_extent = cfg.session.x_extent;
  reg_.y_extent = cfg.session.y_extent;
  reg_.sensor_height = cfg.session.sensor_height;
  reg_.tilt_deg = cfg.registration.tilt_deg;
  reg_.boundary_ext = cfg.registration.boundary_ext;
  reg_.clip = cfg.registration.clip;
  targets_.setView(reg_.x_extent * 0.5f + reg_.boundary_ext, reg_.y_extent);
  heatmap_.resize(reg_.x_extent, reg_.y_extent);

  std::cout << "[Pipeline] " << tracker_.bays().size() << " bays, k=" << dbscan_.neighbourRank()
            << " minPts=" << dbscan_.minPts() << " default_eps=" << dbscan_.defaultEps()
            << " N=" << cfg.occupancy.enter_frames << " M=" << cfg.occupancy.exit_frames
            << " tracking=" << (tracking_enabled_ ? "on" : "off")
            << " heatmap=" << (heatmap_enabled_ ? "on" : "off") << std::endl;
}

void OccupancyPipeline::setMetadata(const Handshake& hs) {
  reg_.x_extent = hs.x_extent;
  reg_.y_extent = hs.y_extent;
  reg_.sensor_height = hs.sensor_height;
  targets_.setView(reg_.x_extent * 0.5f + reg_.boundary_ext, reg_.y_extent);
  heatmap_.resize(reg_.x_extent, reg_.y_extent);
}

Handshake OccupancyPipeline::metadata() const {
  return Handshake{reg_.x_extent, reg_.y_extent, reg_.sensor_height};
}

FrameResult OccupancyPipeline::process(const Frame& f) {
  FrameResult r;
  r.seq = f.seq;
  r.t = f.t;

  r.points = reg_.apply(f.points);
  if (!mask_.empty()) {
    std::erase_if(r.points, [this](const Point& p) {
      return !mask_.allows(core::Point2D(p.x, p.y));
    });
  }

  r.clusters = dbscan_.run(r.points);
  if (r.clusters.degenerate) {
    ++stats_.degenerate_frames;
    if (!in_degenerate_run_) {
      std::cout << "[Pipeline] seq=" << f.seq << ": " << r.points.size()
                << " points, fewer than minPts, nothing to cluster" << std::endl;
    }
    in_degenerate_run_ = true;
  } else {
    in_degenerate_run_ = false;
    if (!r.clusters.eps_from_knee) ++stats_.default_eps_frames;
  }

  if (postfilter_enabled_ && !r.clusters.clusters.empty()) {
    auto filtered = postfilter_.apply(r.clusters.clusters);
    for (int& label : r.clusters.labels) {
      if (label >= 0) label = filtered.remap[static_cast<size_t>(label)];
    }
    r.clusters.clusters = std::move(filtered.clusters);
  }

  r.changes = tracker_.update(r.clusters.clusters, f.seq);
  for (const auto& c : r.changes) {
    std::cout << "[Pipeline] bay " << c.id << ": " << to_string(c.from) << " -> "
              << to_string(c.to) << " at seq=" << c.seq << std::endl;
  }
  r.bays = tracker_.bays();
  for (size_t i = 0; i < r.bays.size(); ++i) {
    if (r.bays[i].occupancy() == BayOccupancy::Occupied) ++occupied_frames_[i];
  }
  for (const auto& c : r.changes) {
    if (c.to != DebounceState::Occupied) continue;
    for (size_t i = 0; i < r.bays.size(); ++i) {
      if (r.bays[i].id == c.id) ++entries_[i];
    }
  }

  if (tracking_enabled_) {
    targets_.update(r.clusters.clusters, f.seq);
    if (heatmap_enabled_) heatmap_.update(targets_.targets());
    r.targets = targets_.targets();
  }

  if (stats_.frames == 0) first_t_ = f.t;
  last_t_ = f.t;

  ++stats_.frames;
  stats_.points_in += f.points.size();
  stats_.points_kept += r.points.size();
  stats_.clusters += r.clusters.clusters.size();
  stats_.bay_changes += r.changes.size();
  stats_.last_eps = r.clusters.eps;
  return r;
}

SessionSummary OccupancyPipeline::summary() const {
  SessionSummary out;
  out.frames = stats_.frames;
  out.duration = stats_.frames > 0 ? last_t_ - first_t_ : 0.0;
  out.targets = targets_.targetsStarted();
  const auto& bays = tracker_.bays();
  for (size_t i = 0; i < bays.size(); ++i) {
    BaySummary b;
    b.id = bays[i].id;
    b.occupied_frames = occupied_frames_[i];
    b.entries = entries_[i];
    b.occupancy = stats_.frames > 0
        ? static_cast<float>(static_cast<double>(occupied_frames_[i]) / static_cast<double>(stats_.frames))
        : 0.0f;
    out.bays.push_back(b);
  }
  if (heatmap_enabled_) out.heatmap = heatmap_.summary();
  return out;
}
