#pragma once

#include <string>
#include <vector>

#include "esp_err.h"

#include "app/zone_sensor.hpp"

namespace zone {

struct DeviceEntry
{
    std::string id;         // registry-assigned
    std::string identifier; // see device_identifier()
    std::string name;
    std::string via_device;
};

struct EntityEntry
{
    std::string unique_id;
    std::string device_id;
    std::string name_override; // empty when the label is derived
};

// Receives newly created sensors (the presentation layer).
class EntitySink
{
public:
    virtual ~EntitySink() = default;

    // Register a batch of sensors in one call. The sensors stay owned by
    // the caller and outlive their registration.
    virtual esp_err_t add_sensors(const std::vector<ZoneMotionSensor *> &sensors) = 0;

    // Drop every reference to these sensors; they are destroyed right after.
    // The entities themselves stay registered.
    virtual void release_sensors(const std::vector<ZoneMotionSensor *> &sensors) = 0;
};

// Device and entity registries of the host.
class ZoneRegistry
{
public:
    virtual ~ZoneRegistry() = default;

    virtual const DeviceEntry *find_device(const std::string &identifier) const = 0;
    virtual const EntityEntry *find_entity(const std::string &unique_id) const = 0;

    virtual esp_err_t remove_entity(const std::string &unique_id) = 0;
    virtual esp_err_t remove_device(const std::string &device_id) = 0;
    virtual esp_err_t update_device_name(const std::string &device_id, const std::string &name) = 0;
    virtual esp_err_t clear_entity_name_override(const std::string &unique_id) = 0;
};

} // namespace zone
