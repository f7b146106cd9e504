#include "ReplaySensor.h"
#include "core/errors.h"
#include "io/archive.h"
#include <chrono>
#include <iostream>

using clock_mono = std::chrono::steady_clock;

ReplaySensor::ReplaySensor(std::string id) : id_(std::move(id)) {}

ReplaySensor::~ReplaySensor() {
    stop();
}

bool ReplaySensor::start(const SensorConfig& cfg) {
    if (running_) return true;
    cfg_ = cfg;
    if (!cfg_.id.empty()) id_ = cfg_.id;

    if (cfg_.source.empty()) {
        std::cerr << "[ReplaySensor] " << id_ << ": no source recording configured" << std::endl;
        return false;
    }
    try {
        frames_ = read_archive(cfg_.source).frames;
    } catch (const ArchiveCorrupt& e) {
        std::cerr << "[ReplaySensor] " << id_ << ": " << e.what() << std::endl;
        return false;
    }
    if (!cfg_.radar_config.empty()) {
        std::cout << "[ReplaySensor] " << id_ << ": radar config " << cfg_.radar_config
                  << " has no effect on a replay" << std::endl;
    }
    std::cout << "[ReplaySensor] " << id_ << ": " << frames_.size() << " frames from " << cfg_.source
              << (cfg_.loop ? " (loop)" : "") << std::endl;

    running_ = true;
    th_ = std::thread([this] { rxLoop(); });
    return true;
}

void ReplaySensor::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_mu_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (th_.joinable()) th_.join();
}

void ReplaySensor::subscribe(Callback cb) {
    std::lock_guard<std::mutex> lk(cb_mu_);
    cb_ = std::move(cb);
}

bool ReplaySensor::waitUntil(clock_mono::time_point deadline) {
    std::unique_lock<std::mutex> lk(wait_mu_);
    return !wait_cv_.wait_until(lk, deadline, [this] { return !running_.load(); });
}

void ReplaySensor::rxLoop() {
    do {
        if (frames_.empty()) break;
        const auto t0 = clock_mono::now();
        const double first_t = frames_.front().t;

        for (const auto& f : frames_) {
            const auto offset = std::chrono::duration<double>(f.t - first_t);
            if (offset.count() > 0.0 &&
                !waitUntil(t0 + std::chrono::duration_cast<clock_mono::duration>(offset))) {
                return;
            }
            if (!running_) return;

            RadarScan out;
            out.monotonic_ts_ns = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(clock_mono::now().time_since_epoch()).count());
            out.points = f.points;
            out.sensor_id = id_;

            std::lock_guard<std::mutex> lk(cb_mu_);
            if (cb_) cb_(out);
        }
    } while (cfg_.loop && running_);

    std::cout << "[ReplaySensor] " << id_ << ": end of recording" << std::endl;
    running_ = false;
}
