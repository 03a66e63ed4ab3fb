#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "app/zone_registry.hpp"

namespace zone {

// In-RAM device/entity registry of the firmware. Zone sensors added here
// get a listener that forwards their state as ZONE_EVENTS on the default
// event loop.
class MemoryRegistry : public ZoneRegistry, public EntitySink
{
public:
    MemoryRegistry() = default;

    // Create the hub device (identifier = session id) if it does not exist.
    esp_err_t ensure_hub(const std::string &session_id, const std::string &name);

    // A sensor whose entity is already registered replaces the previous
    // handle of that entity.
    esp_err_t add_sensors(const std::vector<ZoneMotionSensor *> &sensors) override;
    void release_sensors(const std::vector<ZoneMotionSensor *> &sensors) override;

    const DeviceEntry *find_device(const std::string &identifier) const override;
    const EntityEntry *find_entity(const std::string &unique_id) const override;

    esp_err_t remove_entity(const std::string &unique_id) override;
    esp_err_t remove_device(const std::string &device_id) override;
    esp_err_t update_device_name(const std::string &device_id, const std::string &name) override;
    esp_err_t clear_entity_name_override(const std::string &unique_id) override;

    // Manual label set from a UI.
    esp_err_t set_entity_name_override(const std::string &unique_id, const std::string &name);

    const std::vector<DeviceEntry> &devices() const { return devices_; }
    std::size_t entity_count() const { return entities_.size(); }

private:
    struct Slot
    {
        EntityEntry entry;
        ZoneMotionSensor *sensor = nullptr;
    };

    DeviceEntry *device_by_id(const std::string &device_id);
    Slot *slot_by_unique_id(const std::string &unique_id);
    const DeviceEntry &get_or_create_device(const DeviceInfo &info);

    std::vector<DeviceEntry> devices_;
    std::vector<Slot> entities_;
    int next_device_id_ = 1;
};

} // namespace zone
