#include "SensorFactory.h"
#include "sensors/replay/ReplaySensor.h"

std::unique_ptr<ISensor> create_sensor(const SensorConfig& cfg) {
    if (cfg.type == "replay") {
        return std::make_unique<ReplaySensor>(cfg.id);
    }
    return nullptr;
}
