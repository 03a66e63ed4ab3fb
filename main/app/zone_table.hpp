#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "app/zone_sensor.hpp"
#include "app/zone_types.hpp"

namespace zone {

struct ZoneRecord
{
    ZoneInfo info;
    std::unique_ptr<ZoneMotionSensor> sensor;
};

// zone id -> record. An id is present iff its sensor exists.
using ZoneTable = std::unordered_map<std::string, ZoneRecord>;

} // namespace zone
