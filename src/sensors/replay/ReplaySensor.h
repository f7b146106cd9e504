#pragma once
#include "sensors/ISensor.h"
#include <atomic>
#include <condition_variable>
#include <thread>
#include <mutex>
#include <vector>

// Plays the point sets of a recording back as if a radar produced them, at
// the recorded frame rate. Used for bench setups and tests of the node.
class ReplaySensor final : public ISensor {
public:
    explicit ReplaySensor(std::string id = "");
    ~ReplaySensor() override;

    bool start(const SensorConfig& cfg) override;
    void stop() override;
    void subscribe(Callback cb) override;
    bool isRunning() const override { return running_; }

private:
    void rxLoop();
    bool waitUntil(std::chrono::steady_clock::time_point deadline);

    std::string id_;
    SensorConfig cfg_{};
    std::vector<Frame> frames_;

    std::atomic<bool> running_{false};
    std::thread th_;
    std::mutex wait_mu_;
    std::condition_variable wait_cv_;

    std::mutex cb_mu_;
    Callback cb_{};
};
