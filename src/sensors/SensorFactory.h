#pragma once
#include "sensors/ISensor.h"
#include "config/config.h"
#include <memory>

// nullptr when no driver handles cfg.type.
std::unique_ptr<ISensor> create_sensor(const SensorConfig& cfg);
