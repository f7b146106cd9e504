#pragma once
#include <vector>
#include <functional>
#include <cstdint>
#include <string>
#include "config/config.h"
#include "core/frame.h"

// One detection batch as the radar delivers it: sensor-relative points,
// before sequence numbering.
struct RadarScan {
    uint64_t monotonic_ts_ns{0};      // receive time (steady clock)
    std::vector<Point> points;
    std::string sensor_id{""};
};

class ISensor {
public:
    using Callback = std::function<void(const RadarScan&)>;
    virtual ~ISensor() = default;
    virtual bool start(const SensorConfig& cfg) = 0;
    virtual void stop() = 0;
    virtual void subscribe(Callback cb) = 0;
    // False once the device has nothing more to deliver.
    virtual bool isRunning() const = 0;
};
