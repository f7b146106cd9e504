#include "config.h"
#include "core/errors.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>

static float clampf(float v, float lo, float hi){ return std::max(lo, std::min(hi, v)); }

static std::vector<core::Point2D> parsePointList(const YAML::Node& pts) {
  std::vector<core::Point2D> out;
  if (!pts || !pts.IsSequence()) return out;
  out.reserve(pts.size());
  for (const auto& n : pts) {
    if (n.IsSequence() && n.size() >= 2) {
      out.push_back({n[0].as<double>(), n[1].as<double>()});
    }
  }
  return out;
}

static void parseMode(const std::string& m, SessionMode& out) {
  if (m == "live") out = SessionMode::Live;
  else if (m == "playback") out = SessionMode::Playback;
  else throw ConfigError("session.mode must be 'live' or 'playback', got '" + m + "'");
}

static AppConfig from_yaml(const YAML::Node& y) {
  AppConfig cfg;

  if (auto s = y["session"]) {
    if (s["mode"])    parseMode(s["mode"].as<std::string>(), cfg.session.mode);
    if (s["host"])    cfg.session.host    = s["host"].as<std::string>(cfg.session.host);
    if (s["port"])    cfg.session.port    = s["port"].as<int>(cfg.session.port);
    if (s["archive"]) cfg.session.archive = s["archive"].as<std::string>(cfg.session.archive);
    if (s["x_extent"]) {
      cfg.session.x_extent = std::max(0.1f, s["x_extent"].as<float>(cfg.session.x_extent));
      cfg.session.x_explicit = true;
    }
    if (s["y_extent"]) {
      cfg.session.y_extent = std::max(0.1f, s["y_extent"].as<float>(cfg.session.y_extent));
      cfg.session.y_explicit = true;
    }
    if (s["sensor_height"]) {
      cfg.session.sensor_height = s["sensor_height"].as<float>(cfg.session.sensor_height);
      cfg.session.height_explicit = true;
    }
  }

  if (auto p = y["playback"]) {
    if (p["realtime_pacing"]) cfg.playback.realtime_pacing = p["realtime_pacing"].as<bool>(cfg.playback.realtime_pacing);
    if (p["speed"])           cfg.playback.speed = std::max(0.01f, p["speed"].as<float>(cfg.playback.speed));
  }

  if (auto n = y["network"]) {
    if (n["listen"])             cfg.network.listen             = n["listen"].as<std::string>(cfg.network.listen);
    if (n["port"])               cfg.network.port               = n["port"].as<int>(cfg.network.port);
    if (n["send_queue"])         cfg.network.send_queue         = std::max(1, n["send_queue"].as<int>(cfg.network.send_queue));
    if (n["send_timeout_ms"])    cfg.network.send_timeout_ms    = std::max(1, n["send_timeout_ms"].as<int>(cfg.network.send_timeout_ms));
    if (n["connect_timeout_ms"]) cfg.network.connect_timeout_ms = std::max(1, n["connect_timeout_ms"].as<int>(cfg.network.connect_timeout_ms));
    if (auto b = n["backoff"]) {
      if (b["initial_ms"])   cfg.network.backoff_initial_ms = std::max(1, b["initial_ms"].as<int>(cfg.network.backoff_initial_ms));
      if (b["max_ms"])       cfg.network.backoff_max_ms     = std::max(cfg.network.backoff_initial_ms, b["max_ms"].as<int>(cfg.network.backoff_max_ms));
      if (b["factor"])       cfg.network.backoff_factor     = std::max(1.0f, b["factor"].as<float>(cfg.network.backoff_factor));
      if (b["max_attempts"]) cfg.network.max_reconnect_attempts = std::max(0, b["max_attempts"].as<int>(0));
    }
  }
  if (cfg.network.port < 0 || cfg.network.port > 65535 || cfg.session.port < 0 || cfg.session.port > 65535) {
    throw ConfigError("port out of range");
  }

  if (auto r = y["registration"]) {
    if (r["tilt_deg"])     cfg.registration.tilt_deg     = clampf(r["tilt_deg"].as<float>(cfg.registration.tilt_deg), -90.0f, 90.0f);
    if (r["boundary_ext"]) cfg.registration.boundary_ext = std::max(0.0f, r["boundary_ext"].as<float>(cfg.registration.boundary_ext));
    if (r["clip"])         cfg.registration.clip         = r["clip"].as<bool>(cfg.registration.clip);
  }

  if (auto c = y["clustering"]) {
    if (c["k"])                cfg.clustering.k                = std::max(1, c["k"].as<int>(cfg.clustering.k));
    if (c["minPts"])           cfg.clustering.minPts           = std::max(1, c["minPts"].as<int>(cfg.clustering.minPts));
    if (c["default_eps"])      cfg.clustering.default_eps      = std::max(0.001f, c["default_eps"].as<float>(cfg.clustering.default_eps));
    if (c["eps_min"])          cfg.clustering.eps_min          = std::max(0.001f, c["eps_min"].as<float>(cfg.clustering.eps_min));
    if (c["eps_max"])          cfg.clustering.eps_max          = std::max(cfg.clustering.eps_min, c["eps_max"].as<float>(cfg.clustering.eps_max));
    if (c["knee_sensitivity"]) cfg.clustering.knee_sensitivity = std::max(0.0f, c["knee_sensitivity"].as<float>(cfg.clustering.knee_sensitivity));
  }

  if (auto p = y["postfilter"]) {
    if (p["enabled"])      cfg.postfilter.enabled      = p["enabled"].as<bool>(cfg.postfilter.enabled);
    if (p["min_points"])   cfg.postfilter.min_points   = std::max(0, p["min_points"].as<int>(cfg.postfilter.min_points));
    if (p["max_extent_m"]) cfg.postfilter.max_extent_m = std::max(0.0f, p["max_extent_m"].as<float>(cfg.postfilter.max_extent_m));
  }

  if (auto o = y["occupancy"]) {
    if (o["enter_frames"]) cfg.occupancy.enter_frames = std::max(1, o["enter_frames"].as<int>(cfg.occupancy.enter_frames));
    if (o["exit_frames"])  cfg.occupancy.exit_frames  = std::max(1, o["exit_frames"].as<int>(cfg.occupancy.exit_frames));
    if (o["rule"]) {
      const auto rule = o["rule"].as<std::string>();
      if (rule == "centroid")  cfg.occupancy.rule = OccupancyRule::Centroid;
      else if (rule == "bbox") cfg.occupancy.rule = OccupancyRule::BoundingBox;
      else throw ConfigError("occupancy.rule must be 'centroid' or 'bbox', got '" + rule + "'");
    }
    if (o["bbox_fraction"]) cfg.occupancy.bbox_fraction = clampf(o["bbox_fraction"].as<float>(cfg.occupancy.bbox_fraction), 0.0f, 1.0f);
  }

  if (auto t = y["tracking"]) {
    if (t["enabled"])           cfg.tracking.enabled           = t["enabled"].as<bool>(cfg.tracking.enabled);
    if (t["dist_threshold"])    cfg.tracking.dist_threshold    = std::max(0.01f, t["dist_threshold"].as<float>(cfg.tracking.dist_threshold));
    if (t["max_missed"])        cfg.tracking.max_missed        = std::max(0, t["max_missed"].as<int>(cfg.tracking.max_missed));
    if (t["process_noise"])     cfg.tracking.process_noise     = std::max(1e-9f, t["process_noise"].as<float>(cfg.tracking.process_noise));
    if (t["measurement_noise"]) cfg.tracking.measurement_noise = std::max(1e-9f, t["measurement_noise"].as<float>(cfg.tracking.measurement_noise));
  }

  if (auto h = y["heatmap"]) {
    if (h["enabled"])            cfg.heatmap.enabled            = h["enabled"].as<bool>(cfg.heatmap.enabled);
    if (h["cell_size"])          cfg.heatmap.cell_size          = clampf(h["cell_size"].as<float>(cfg.heatmap.cell_size), 0.05f, 5.0f);
    if (h["activity_threshold"]) cfg.heatmap.activity_threshold = clampf(h["activity_threshold"].as<float>(cfg.heatmap.activity_threshold), 0.0f, 1.0f);
    if (h["spot_radius_cells"])  cfg.heatmap.spot_radius_cells  = std::max(1.0f, h["spot_radius_cells"].as<float>(cfg.heatmap.spot_radius_cells));
  }

  if (auto sm = y["summary"]) {
    if (sm["path"]) cfg.summary.path = sm["path"].as<std::string>(cfg.summary.path);
  }

  if (y["bays"] && y["bays"].IsSequence()) {
    for (const auto& b : y["bays"]) {
      BayConfig bc;
      bc.id = b["id"] ? b["id"].as<std::string>() : ("B" + std::to_string(cfg.bays.size() + 1));
      bc.polygon.points = parsePointList(b["polygon"]);
      if (bc.polygon.empty()) {
        throw ConfigError("bay '" + bc.id + "' needs a polygon with at least 3 vertices");
      }
      cfg.bays.push_back(std::move(bc));
    }
  }

  if (auto g = y["bay_grid"]) {
    if (g["rows"])      cfg.bay_grid.rows      = std::max(0, g["rows"].as<int>(0));
    if (g["cols"])      cfg.bay_grid.cols      = std::max(0, g["cols"].as<int>(0));
    if (auto o = g["origin"]) {
      if (o.IsSequence() && o.size() >= 2) {
        cfg.bay_grid.origin_x = o[0].as<float>();
        cfg.bay_grid.origin_y = o[1].as<float>();
      }
    }
    if (g["bay_width"]) cfg.bay_grid.bay_width = std::max(0.1f, g["bay_width"].as<float>(cfg.bay_grid.bay_width));
    if (g["bay_depth"]) cfg.bay_grid.bay_depth = std::max(0.1f, g["bay_depth"].as<float>(cfg.bay_grid.bay_depth));
    if (g["gap"])       cfg.bay_grid.gap       = std::max(0.0f, g["gap"].as<float>(cfg.bay_grid.gap));
  }

  if (auto s = y["sensor"]) {
    if (s["id"])           cfg.sensor.id           = s["id"].as<std::string>(cfg.sensor.id);
    if (s["type"])         cfg.sensor.type         = s["type"].as<std::string>(cfg.sensor.type);
    if (s["radar_config"]) cfg.sensor.radar_config = s["radar_config"].as<std::string>("");
    if (s["source"])       cfg.sensor.source       = s["source"].as<std::string>("");
    if (s["loop"])         cfg.sensor.loop         = s["loop"].as<bool>(cfg.sensor.loop);
  }

  if (auto r = y["recording"]) {
    if (r["enabled"]) cfg.recording.enabled = r["enabled"].as<bool>(cfg.recording.enabled);
    if (r["dir"])     cfg.recording.dir     = r["dir"].as<std::string>(cfg.recording.dir);
  }

  if (auto u = y["ui"]) {
    if (u["listen"])   cfg.ui.listen   = u["listen"].as<std::string>(cfg.ui.listen);
  }

  // World mask configuration
  if (auto wm = y["world_mask"]) {
    if (auto inc = wm["include"]) {
      for (const auto& polyNode : inc) {
        core::Polygon poly;
        poly.points = parsePointList(polyNode);
        if (!poly.points.empty()) {
          cfg.world_mask.include.push_back(std::move(poly));
        }
      }
    }
    if (auto exc = wm["exclude"]) {
      for (const auto& polyNode : exc) {
        core::Polygon poly;
        poly.points = parsePointList(polyNode);
        if (!poly.points.empty()) {
          cfg.world_mask.exclude.push_back(std::move(poly));
        }
      }
    }
  }

  if (y["sinks"] && y["sinks"].IsSequence()) {
    for (const auto& sn : y["sinks"]) {
      SinkConfig sc;

      std::string type = sn["type"].as<std::string>("nng");
      if (type != "nng") {
        std::cerr << "[Config] ignoring sink of unsupported type '" << type << "'" << std::endl;
        continue;
      }
      if (sn["topic"])     sc.topic     = sn["topic"].as<std::string>("");
      if (sn["rate_limit"])sc.rate_limit= std::max(0, sn["rate_limit"].as<int>(0));
      if (sn["url"])       sc.nng.url   = sn["url"].as<std::string>("");

      cfg.sinks.push_back(std::move(sc));
    }
  }

  return cfg;
}

AppConfig load_app_config(const std::string& path){
  try {
    return from_yaml(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

AppConfig parse_app_config(const std::string& yaml_text){
  try {
    return from_yaml(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("inline config: ") + e.what());
  }
}

std::vector<BayConfig> resolve_bays(const AppConfig& cfg) {
  std::vector<BayConfig> out = cfg.bays;
  const auto& g = cfg.bay_grid;
  int n = 0;
  for (int r = 0; r < g.rows; ++r) {
    for (int c = 0; c < g.cols; ++c) {
      const double x0 = g.origin_x + c * (g.bay_width + g.gap);
      const double y0 = g.origin_y + r * (g.bay_depth + g.gap);
      BayConfig bc;
      bc.id = "B" + std::to_string(cfg.bays.size() + (++n));
      bc.polygon = core::Polygon::rectangle(x0, y0, x0 + g.bay_width, y0 + g.bay_depth);
      out.push_back(std::move(bc));
    }
  }
  return out;
}

const char* to_string(SessionMode m) {
  return m == SessionMode::Live ? "live" : "playback";
}

const char* to_string(OccupancyRule r) {
  return r == OccupancyRule::Centroid ? "centroid" : "bbox";
}

std::string dump_app_config(const AppConfig& cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  auto emitPolygon = [&](const core::Polygon& poly) {
    out << YAML::BeginSeq;
    for (const auto& pt : poly.points) {
      out << YAML::Flow << YAML::BeginSeq << pt.x << pt.y << YAML::EndSeq;
    }
    out << YAML::EndSeq;
  };

  out << YAML::Key << "session" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "mode" << YAML::Value << to_string(cfg.session.mode);
  out << YAML::Key << "host" << YAML::Value << cfg.session.host;
  out << YAML::Key << "port" << YAML::Value << cfg.session.port;
  out << YAML::Key << "archive" << YAML::Value << cfg.session.archive;
  if (cfg.session.x_explicit) out << YAML::Key << "x_extent" << YAML::Value << cfg.session.x_extent;
  if (cfg.session.y_explicit) out << YAML::Key << "y_extent" << YAML::Value << cfg.session.y_extent;
  if (cfg.session.height_explicit) out << YAML::Key << "sensor_height" << YAML::Value << cfg.session.sensor_height;
  out << YAML::EndMap;

  out << YAML::Key << "playback" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "realtime_pacing" << YAML::Value << cfg.playback.realtime_pacing;
  out << YAML::Key << "speed" << YAML::Value << cfg.playback.speed;
  out << YAML::EndMap;

  out << YAML::Key << "network" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "listen" << YAML::Value << cfg.network.listen;
  out << YAML::Key << "port" << YAML::Value << cfg.network.port;
  out << YAML::Key << "send_queue" << YAML::Value << cfg.network.send_queue;
  out << YAML::Key << "send_timeout_ms" << YAML::Value << cfg.network.send_timeout_ms;
  out << YAML::Key << "connect_timeout_ms" << YAML::Value << cfg.network.connect_timeout_ms;
  out << YAML::Key << "backoff" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "initial_ms" << YAML::Value << cfg.network.backoff_initial_ms;
  out << YAML::Key << "max_ms" << YAML::Value << cfg.network.backoff_max_ms;
  out << YAML::Key << "factor" << YAML::Value << cfg.network.backoff_factor;
  out << YAML::Key << "max_attempts" << YAML::Value << cfg.network.max_reconnect_attempts;
  out << YAML::EndMap;
  out << YAML::EndMap;

  out << YAML::Key << "registration" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "tilt_deg" << YAML::Value << cfg.registration.tilt_deg;
  out << YAML::Key << "boundary_ext" << YAML::Value << cfg.registration.boundary_ext;
  out << YAML::Key << "clip" << YAML::Value << cfg.registration.clip;
  out << YAML::EndMap;

  out << YAML::Key << "clustering" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "k" << YAML::Value << cfg.clustering.k;
  out << YAML::Key << "minPts" << YAML::Value << cfg.clustering.minPts;
  out << YAML::Key << "default_eps" << YAML::Value << cfg.clustering.default_eps;
  out << YAML::Key << "eps_min" << YAML::Value << cfg.clustering.eps_min;
  out << YAML::Key << "eps_max" << YAML::Value << cfg.clustering.eps_max;
  out << YAML::Key << "knee_sensitivity" << YAML::Value << cfg.clustering.knee_sensitivity;
  out << YAML::EndMap;

  out << YAML::Key << "postfilter" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << cfg.postfilter.enabled;
  out << YAML::Key << "min_points" << YAML::Value << cfg.postfilter.min_points;
  out << YAML::Key << "max_extent_m" << YAML::Value << cfg.postfilter.max_extent_m;
  out << YAML::EndMap;

  out << YAML::Key << "occupancy" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enter_frames" << YAML::Value << cfg.occupancy.enter_frames;
  out << YAML::Key << "exit_frames" << YAML::Value << cfg.occupancy.exit_frames;
  out << YAML::Key << "rule" << YAML::Value << to_string(cfg.occupancy.rule);
  out << YAML::Key << "bbox_fraction" << YAML::Value << cfg.occupancy.bbox_fraction;
  out << YAML::EndMap;

  out << YAML::Key << "tracking" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << cfg.tracking.enabled;
  out << YAML::Key << "dist_threshold" << YAML::Value << cfg.tracking.dist_threshold;
  out << YAML::Key << "max_missed" << YAML::Value << cfg.tracking.max_missed;
  out << YAML::Key << "process_noise" << YAML::Value << cfg.tracking.process_noise;
  out << YAML::Key << "measurement_noise" << YAML::Value << cfg.tracking.measurement_noise;
  out << YAML::EndMap;

  out << YAML::Key << "heatmap" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << cfg.heatmap.enabled;
  out << YAML::Key << "cell_size" << YAML::Value << cfg.heatmap.cell_size;
  out << YAML::Key << "activity_threshold" << YAML::Value << cfg.heatmap.activity_threshold;
  out << YAML::Key << "spot_radius_cells" << YAML::Value << cfg.heatmap.spot_radius_cells;
  out << YAML::EndMap;

  out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "path" << YAML::Value << cfg.summary.path;
  out << YAML::EndMap;

  out << YAML::Key << "bays" << YAML::Value << YAML::BeginSeq;
  for (const auto& b : cfg.bays) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << b.id;
    out << YAML::Key << "polygon" << YAML::Value;
    emitPolygon(b.polygon);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "bay_grid" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "rows" << YAML::Value << cfg.bay_grid.rows;
  out << YAML::Key << "cols" << YAML::Value << cfg.bay_grid.cols;
  out << YAML::Key << "origin" << YAML::Value << YAML::Flow << YAML::BeginSeq
      << cfg.bay_grid.origin_x << cfg.bay_grid.origin_y << YAML::EndSeq;
  out << YAML::Key << "bay_width" << YAML::Value << cfg.bay_grid.bay_width;
  out << YAML::Key << "bay_depth" << YAML::Value << cfg.bay_grid.bay_depth;
  out << YAML::Key << "gap" << YAML::Value << cfg.bay_grid.gap;
  out << YAML::EndMap;

  out << YAML::Key << "sensor" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << cfg.sensor.id;
  out << YAML::Key << "type" << YAML::Value << cfg.sensor.type;
  out << YAML::Key << "radar_config" << YAML::Value << cfg.sensor.radar_config;
  out << YAML::Key << "source" << YAML::Value << cfg.sensor.source;
  out << YAML::Key << "loop" << YAML::Value << cfg.sensor.loop;
  out << YAML::EndMap;

  out << YAML::Key << "recording" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << cfg.recording.enabled;
  out << YAML::Key << "dir" << YAML::Value << cfg.recording.dir;
  out << YAML::EndMap;

  // UI
  out << YAML::Key << "ui" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "listen" << YAML::Value << cfg.ui.listen;
  out << YAML::EndMap;

  // World mask
  out << YAML::Key << "world_mask" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "include" << YAML::Value << YAML::BeginSeq;
  for (const auto& poly : cfg.world_mask.include) emitPolygon(poly);
  out << YAML::EndSeq;
  out << YAML::Key << "exclude" << YAML::Value << YAML::BeginSeq;
  for (const auto& poly : cfg.world_mask.exclude) emitPolygon(poly);
  out << YAML::EndSeq;
  out << YAML::EndMap;

  // Sinks
  out << YAML::Key << "sinks" << YAML::Value << YAML::BeginSeq;
  for (const auto& sink : cfg.sinks) {
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << "nng";
    out << YAML::Key << "url" << YAML::Value << sink.nng.url;
    out << YAML::Key << "topic" << YAML::Value << sink.topic;
    out << YAML::Key << "rate_limit" << YAML::Value << sink.rate_limit;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return std::string(out.c_str());
}
