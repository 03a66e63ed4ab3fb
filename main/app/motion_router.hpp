#pragma once

#include <string>

#include "app/zone_table.hpp"

namespace zone {

// Delivers motion changes to the sensor of a known zone.
// Holds a read-only view of the table: it never adds, removes or renames
// zones, it only updates the motion state kept by their sensors.
class MotionRouter
{
public:
    explicit MotionRouter(const ZoneTable &zones) : zones_(zones) {}

    // Returns true if a notification was sent.
    bool update(const std::string &zone_id, bool motion);

private:
    const ZoneTable &zones_;
};

} // namespace zone
