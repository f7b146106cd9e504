#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <cstdint>
#include "config/config.h"
#include "core/frame.h"
#include "sensors/ISensor.h"

// Owns the radar driver on the sensor node and turns its scans into
// numbered frames. Sequence numbers start at 1 and increase by one per scan;
// timestamps are seconds since the first scan of this run.
class SensorManager {
public:
  using FrameCallback = std::function<void(const Frame&)>;

  explicit SensorManager(const SensorConfig& cfg);
  ~SensorManager();

  SensorManager(const SensorManager&) = delete;
  SensorManager& operator=(const SensorManager&) = delete;

  // Replaces the driver created by the factory (tests, custom hardware).
  void setDevice(std::unique_ptr<ISensor> dev);

  // False when no driver handles the configured type or it fails to start.
  bool start(FrameCallback cb);
  void stop();

  bool isRunning() const;
  uint32_t framesProduced() const { return seq_; }

  // Conversion used by the scan callback; public for tests.
  Frame toFrame(const RadarScan& rs);

private:
  SensorConfig cfg_;
  std::unique_ptr<ISensor> dev_;
  FrameCallback cb_;
  std::mutex mu_;
  std::atomic<uint32_t> seq_{0};
  uint64_t first_ts_ns_{0};
  bool started_{false};
};
