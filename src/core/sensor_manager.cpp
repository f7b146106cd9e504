#include "sensor_manager.h"

#include "sensors/SensorFactory.h"

#include <iostream>

SensorManager::SensorManager(const SensorConfig& cfg) : cfg_(cfg) {
  dev_ = create_sensor(cfg_);
  if (!dev_) {
    std::cerr << "[SensorManager] no driver for type: " << cfg_.type << " (id=" << cfg_.id << ")\n";
  }
}

SensorManager::~SensorManager() {
  stop();
}

void SensorManager::setDevice(std::unique_ptr<ISensor> dev) {
  stop();
  dev_ = std::move(dev);
}

Frame SensorManager::toFrame(const RadarScan& rs) {
  std::lock_guard<std::mutex> lk(mu_);
  if (seq_ == 0) first_ts_ns_ = rs.monotonic_ts_ns;

  Frame f;
  f.seq = ++seq_;
  f.t = static_cast<double>(rs.monotonic_ts_ns - first_ts_ns_) * 1e-9;
  f.points = rs.points;
  return f;
}

bool SensorManager::start(FrameCallback cb) {
  if (!dev_) return false;
  if (started_) return true;
  cb_ = std::move(cb);

  dev_->subscribe([this](const RadarScan& rs) {
    const Frame f = toFrame(rs);
    if (cb_) cb_(f);
  });

  if (!dev_->start(cfg_)) {
    std::cerr << "[SensorManager] FAILED to start sensor id=" << cfg_.id << std::endl;
    return false;
  }
  started_ = true;
  std::cout << "[SensorManager] started sensor id=" << cfg_.id << " type=" << cfg_.type << std::endl;
  return true;
}

void SensorManager::stop() {
  if (!started_) return;
  dev_->stop();
  started_ = false;
  std::cout << "[SensorManager] stopped sensor id=" << cfg_.id << " after " << seq_ << " frames" << std::endl;
}

bool SensorManager::isRunning() const {
  return started_ && dev_ && dev_->isRunning();
}
