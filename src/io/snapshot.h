#pragma once
#include <json/json.h>
#include <mutex>
#include <string>
#include <vector>
#include "config/config.h"
#include "core/pipeline.h"
#include "core/session_source.h"

// JSON documents published by the viewer (WebSocket, REST, nng).
Json::Value bays_to_json(uint32_t seq, const std::vector<ParkingBay>& bays);
Json::Value clusters_to_json(const std::vector<Cluster>& clusters);
Json::Value targets_to_json(const std::vector<Target>& targets);
// {"type":"summary", frames, duration, targets, bays:[...], heatmap:{spots, estimated_bays}}
Json::Value summary_to_json(const SessionSummary& s);
// {"type":"frame-lite", seq, t, eps, eps_from_knee, points, clusters, targets}
Json::Value frame_lite_to_json(const FrameResult& r);
// {"type":"bays", seq, bays:[...], changes:[...]}
Json::Value bays_message(const FrameResult& r);
Json::Value stats_to_json(SessionMode mode, const SessionStats& s, const PipelineStats& p);
Json::Value config_to_json(const AppConfig& cfg);

std::string to_compact(const Json::Value& v);
// Styled JSON of the summary. Throws StorageError when the file cannot be written.
void write_summary(const std::string& path, const SessionSummary& s);

// Latest documents shared between the processing loop and the HTTP threads.
class SnapshotStore {
public:
  void update(const FrameResult& r, SessionMode mode, const SessionStats& s, const PipelineStats& p);
  void setConfig(const AppConfig& cfg);
  // Set once the session has ended; an empty object until then.
  void setSummary(const SessionSummary& s);

  Json::Value bays() const;
  Json::Value stats() const;
  Json::Value config() const;
  Json::Value summary() const;

private:
  mutable std::mutex mu_;
  Json::Value bays_{Json::objectValue};
  Json::Value stats_{Json::objectValue};
  Json::Value config_{Json::objectValue};
  Json::Value summary_{Json::objectValue};
};
