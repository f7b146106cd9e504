#pragma once
#include <string>
#include <vector>
#include "core/mask.h"

enum class SessionMode { Live, Playback };

struct SessionConfig {
  SessionMode mode{SessionMode::Playback};
  std::string host{""};          // LIVE: sensor node IPv4 address
  int port{4811};
  std::string archive{""};       // PLAYBACK: recording path

  // Deployment geometry. The handshake or archive header supplies these;
  // a value given in YAML or on the command line overrides its own field.
  float x_extent{10.0f};         // m, width of the monitored area
  float y_extent{10.0f};         // m, depth from the sensor
  float sensor_height{2.0f};     // m
  bool x_explicit{false};
  bool y_explicit{false};
  bool height_explicit{false};

  bool anyExplicit() const { return x_explicit || y_explicit || height_explicit; }
};

struct PlaybackConfig {
  bool realtime_pacing{true};
  float speed{1.0f};             // pacing multiplier, 2.0 = twice as fast
};

struct NetworkConfig {
  std::string listen{"0.0.0.0"}; // sensor node bind address
  int port{4811};
  int send_queue{4};             // frames buffered per client before dropping
  int send_timeout_ms{200};
  int connect_timeout_ms{2000};

  int backoff_initial_ms{250};
  int backoff_max_ms{5000};
  float backoff_factor{2.0f};
  int max_reconnect_attempts{0}; // 0 = retry forever
};

struct RegistrationConfig {
  float tilt_deg{10.0f};         // radar down-tilt
  float boundary_ext{15.0f};     // m added to x_extent/2 on each side
  bool clip{true};
};

struct ClusteringConfig {
  int k{4};                      // k-th neighbour for the k-distance graph
  int minPts{4};                 // Minimum points for core (inclusive of self)
  float default_eps{0.5f};       // Used when no knee is found
  float eps_min{0.1f};
  float eps_max{2.0f};
  float knee_sensitivity{1.0f};  // Kneedle S
};

struct PostfilterConfig {
  bool enabled{true};
  int min_points{0};             // 0 = off
  float max_extent_m{0.0f};      // bounding box diagonal, 0 = off
};

enum class OccupancyRule { Centroid, BoundingBox };

struct OccupancyConfig {
  int enter_frames{3};           // N consecutive occupied observations
  int exit_frames{3};            // M consecutive empty observations
  OccupancyRule rule{OccupancyRule::Centroid};
  float bbox_fraction{0.5f};
};

// Per-target position smoothing across frames. Each axis runs an
// identity-model Kalman filter.
struct TrackingConfig {
  bool enabled{true};
  float dist_threshold{4.0f};    // m, farthest a cluster may be from its track
  int max_missed{10};            // frames without a match before the track ends, 0 = never
  float process_noise{1e-3f};
  float measurement_noise{1e-2f};
};

// Accumulated target activity over the session, in square cells.
struct HeatmapConfig {
  bool enabled{true};
  float cell_size{0.5f};         // m
  float activity_threshold{0.3f};// normalised heat above which a target counts as parked
  float spot_radius_cells{3.0f}; // hot cells closer than this join one spot
};

struct SummaryConfig {
  std::string path{""};          // JSON written at end of session, empty = off
};

struct BayConfig {
  std::string id;
  core::Polygon polygon;
};

// Row-major grid of rectangular bays, ids B1..Bn.
struct BayGridConfig {
  int rows{0};
  int cols{0};
  float origin_x{0.0f};          // lower-left corner of the first bay
  float origin_y{0.0f};
  float bay_width{2.4f};
  float bay_depth{5.4f};
  float gap{0.0f};
};

struct SensorConfig {
  std::string id{"radar0"};
  std::string type{"replay"};
  std::string radar_config{""};  // vendor chirp configuration file
  std::string source{""};        // replay: archive to stream
  bool loop{false};
};

struct RecordingConfig {
  bool enabled{true};
  std::string dir{"recordings"};
};

struct UiConfig {
  std::string listen{"0.0.0.0:8080"};
};

struct NngConfig {
  std::string url{"tcp://0.0.0.0:5555"};
};

struct SinkConfig {
  std::string topic{"bays"};
  int         rate_limit{0};
  NngConfig   nng{};
};

struct AppConfig {
  SessionConfig session{};
  PlaybackConfig playback{};
  NetworkConfig network{};
  RegistrationConfig registration{};
  ClusteringConfig clustering{};
  PostfilterConfig postfilter{};
  OccupancyConfig occupancy{};
  TrackingConfig tracking{};
  HeatmapConfig heatmap{};
  SummaryConfig summary{};
  std::vector<BayConfig> bays;
  BayGridConfig bay_grid{};
  SensorConfig sensor{};
  RecordingConfig recording{};
  UiConfig ui{};
  std::vector<SinkConfig> sinks;
  core::WorldMask world_mask{};
};

// Both throw ConfigError on unreadable YAML or structurally invalid values.
AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const std::string& yaml_text);
std::string dump_app_config(const AppConfig& cfg);

// Explicit bays followed by the generated grid.
std::vector<BayConfig> resolve_bays(const AppConfig& cfg);

const char* to_string(SessionMode m);
const char* to_string(OccupancyRule r);
