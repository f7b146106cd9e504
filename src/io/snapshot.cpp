#include "snapshot.h"
#include <fstream>
#include "core/errors.h"

Json::Value bays_to_json(uint32_t seq, const std::vector<ParkingBay>& bays) {
  Json::Value arr(Json::arrayValue);
  for (const auto& b : bays) {
    Json::Value o;
    o["id"] = b.id;
    o["state"] = to_string(b.state);
    o["occupancy"] = to_string(b.occupancy());
    o["committed"] = to_string(b.committed());
    o["streak"] = b.streak;
    o["last_change_frame"] = Json::UInt(b.last_change_frame);
    o["observed"] = b.observed;
    o["polygon"] = Json::arrayValue;
    for (const auto& p : b.polygon.points) {
      Json::Value pt(Json::arrayValue);
      pt.append(p.x);
      pt.append(p.y);
      o["polygon"].append(pt);
    }
    arr.append(o);
  }
  Json::Value j;
  j["seq"] = Json::UInt(seq);
  j["bays"] = arr;
  return j;
}

Json::Value clusters_to_json(const std::vector<Cluster>& clusters) {
  Json::Value items(Json::arrayValue);
  for (const auto& c : clusters) {
    Json::Value o; o["id"] = Json::UInt(c.id); o["cx"] = c.cx; o["cy"] = c.cy;
    o["minx"] = c.minx; o["miny"] = c.miny; o["maxx"] = c.maxx; o["maxy"] = c.maxy;
    o["count"] = Json::UInt(c.count()); o["mean_z"] = c.mean_z; o["mean_doppler"] = c.mean_doppler;
    items.append(o);
  }
  return items;
}

Json::Value targets_to_json(const std::vector<Target>& targets) {
  Json::Value items(Json::arrayValue);
  for (const auto& t : targets) {
    Json::Value o;
    o["id"] = Json::UInt(t.id);
    o["x"] = t.x();
    o["y"] = t.y();
    o["hits"] = Json::UInt(t.hits);
    o["missed"] = t.missed;
    o["parked"] = t.parked;
    items.append(o);
  }
  return items;
}

Json::Value summary_to_json(const SessionSummary& s) {
  Json::Value j;
  j["type"] = "summary";
  j["frames"] = Json::UInt64(s.frames);
  j["duration"] = s.duration;
  j["targets"] = Json::UInt(s.targets);
  j["bays"] = Json::arrayValue;
  for (const auto& b : s.bays) {
    Json::Value o;
    o["id"] = b.id;
    o["occupied_frames"] = Json::UInt64(b.occupied_frames);
    o["occupancy"] = b.occupancy;
    o["entries"] = Json::UInt(b.entries);
    j["bays"].append(o);
  }
  j["heatmap"]["frames"] = Json::UInt64(s.heatmap.frames);
  j["heatmap"]["spots"] = Json::arrayValue;
  for (const auto& sp : s.heatmap.spots) {
    Json::Value o;
    o["x"] = sp.x; o["y"] = sp.y; o["occupancy"] = sp.occupancy; o["cells"] = Json::UInt(sp.cells);
    j["heatmap"]["spots"].append(o);
  }
  j["heatmap"]["estimated_bays"] = Json::arrayValue;
  for (const auto& eb : s.heatmap.bays) {
    Json::Value o;
    o["x"] = eb.x; o["y"] = eb.y; o["occupancy"] = eb.occupancy;
    j["heatmap"]["estimated_bays"].append(o);
  }
  return j;
}

Json::Value frame_lite_to_json(const FrameResult& r) {
  Json::Value j;
  j["type"] = "frame-lite";
  j["seq"] = Json::UInt(r.seq);
  j["t"] = r.t;
  j["eps"] = r.clusters.eps;
  j["eps_from_knee"] = r.clusters.eps_from_knee;

  // [x, y, z, doppler, label] per registered point
  j["points"] = Json::arrayValue;
  for (size_t i = 0; i < r.points.size(); ++i) {
    const auto& p = r.points[i];
    Json::Value pt(Json::arrayValue);
    pt.append(p.x); pt.append(p.y); pt.append(p.z); pt.append(p.doppler);
    pt.append(i < r.clusters.labels.size() ? r.clusters.labels[i] : -1);
    j["points"].append(pt);
  }
  j["clusters"] = clusters_to_json(r.clusters.clusters);
  j["targets"] = targets_to_json(r.targets);
  return j;
}

Json::Value bays_message(const FrameResult& r) {
  Json::Value j = bays_to_json(r.seq, r.bays);
  j["type"] = "bays";
  j["changes"] = Json::arrayValue;
  for (const auto& c : r.changes) {
    Json::Value o;
    o["id"] = c.id;
    o["from"] = to_string(c.from);
    o["to"] = to_string(c.to);
    o["seq"] = Json::UInt(c.seq);
    j["changes"].append(o);
  }
  return j;
}

Json::Value stats_to_json(SessionMode mode, const SessionStats& s, const PipelineStats& p) {
  Json::Value j;
  j["mode"] = to_string(mode);
  j["session"]["frames"] = Json::UInt64(s.frames);
  j["session"]["dropped"] = Json::UInt64(s.dropped);
  j["session"]["malformed"] = Json::UInt64(s.malformed);
  j["session"]["desyncs"] = Json::UInt64(s.desyncs);
  j["session"]["reconnects"] = Json::UInt64(s.reconnects);
  j["pipeline"]["frames"] = Json::UInt64(p.frames);
  j["pipeline"]["points_in"] = Json::UInt64(p.points_in);
  j["pipeline"]["points_kept"] = Json::UInt64(p.points_kept);
  j["pipeline"]["clusters"] = Json::UInt64(p.clusters);
  j["pipeline"]["degenerate_frames"] = Json::UInt64(p.degenerate_frames);
  j["pipeline"]["default_eps_frames"] = Json::UInt64(p.default_eps_frames);
  j["pipeline"]["bay_changes"] = Json::UInt64(p.bay_changes);
  j["pipeline"]["last_eps"] = p.last_eps;
  return j;
}

Json::Value config_to_json(const AppConfig& cfg) {
  Json::Value j;
  j["session"]["mode"] = to_string(cfg.session.mode);
  j["session"]["host"] = cfg.session.host;
  j["session"]["port"] = cfg.session.port;
  j["session"]["archive"] = cfg.session.archive;
  j["session"]["x_extent"] = cfg.session.x_extent;
  j["session"]["y_extent"] = cfg.session.y_extent;
  j["session"]["sensor_height"] = cfg.session.sensor_height;

  const auto& c = cfg.clustering;
  j["clustering"]["k"] = c.k;
  j["clustering"]["minPts"] = c.minPts;
  j["clustering"]["default_eps"] = c.default_eps;
  j["clustering"]["eps_min"] = c.eps_min;
  j["clustering"]["eps_max"] = c.eps_max;
  j["clustering"]["knee_sensitivity"] = c.knee_sensitivity;

  j["postfilter"]["enabled"] = cfg.postfilter.enabled;
  j["postfilter"]["min_points"] = cfg.postfilter.min_points;
  j["postfilter"]["max_extent_m"] = cfg.postfilter.max_extent_m;

  j["occupancy"]["enter_frames"] = cfg.occupancy.enter_frames;
  j["occupancy"]["exit_frames"] = cfg.occupancy.exit_frames;
  j["occupancy"]["rule"] = to_string(cfg.occupancy.rule);
  j["occupancy"]["bbox_fraction"] = cfg.occupancy.bbox_fraction;

  j["registration"]["tilt_deg"] = cfg.registration.tilt_deg;
  j["registration"]["boundary_ext"] = cfg.registration.boundary_ext;
  j["registration"]["clip"] = cfg.registration.clip;

  j["tracking"]["enabled"] = cfg.tracking.enabled;
  j["tracking"]["dist_threshold"] = cfg.tracking.dist_threshold;
  j["tracking"]["max_missed"] = cfg.tracking.max_missed;
  j["heatmap"]["enabled"] = cfg.heatmap.enabled;
  j["heatmap"]["cell_size"] = cfg.heatmap.cell_size;
  j["heatmap"]["activity_threshold"] = cfg.heatmap.activity_threshold;

  j["bays"] = Json::arrayValue;
  for (const auto& b : resolve_bays(cfg)) {
    Json::Value o;
    o["id"] = b.id;
    o["area"] = b.polygon.area();
    j["bays"].append(o);
  }
  return j;
}

std::string to_compact(const Json::Value& v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}

void write_summary(const std::string& path, const SessionSummary& s) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw StorageError("cannot open summary file " + path);
  }
  out << summary_to_json(s).toStyledString();
  out.flush();
  if (!out) {
    throw StorageError("write failed on " + path);
  }
}

void SnapshotStore::update(const FrameResult& r, SessionMode mode, const SessionStats& s,
                           const PipelineStats& p) {
  Json::Value bays = bays_to_json(r.seq, r.bays);
  Json::Value stats = stats_to_json(mode, s, p);
  std::lock_guard<std::mutex> lk(mu_);
  bays_ = std::move(bays);
  stats_ = std::move(stats);
}

void SnapshotStore::setConfig(const AppConfig& cfg) {
  Json::Value c = config_to_json(cfg);
  std::lock_guard<std::mutex> lk(mu_);
  config_ = std::move(c);
}

Json::Value SnapshotStore::bays() const {
  std::lock_guard<std::mutex> lk(mu_);
  return bays_;
}

Json::Value SnapshotStore::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

void SnapshotStore::setSummary(const SessionSummary& s) {
  Json::Value j = summary_to_json(s);
  std::lock_guard<std::mutex> lk(mu_);
  summary_ = std::move(j);
}

Json::Value SnapshotStore::summary() const {
  std::lock_guard<std::mutex> lk(mu_);
  return summary_;
}

Json::Value SnapshotStore::config() const {
  std::lock_guard<std::mutex> lk(mu_);
  return config_;
}
