#include "app/memory_registry.hpp"

#include <cstdint>
#include <cstdio>
#include <utility>

#include "esp_log.h"
#include "esp_timer.h"

#include "app/zone_events.hpp"

namespace zone
{

    namespace
    {
        static const char *TAG = "registry";

        void forward_state(const ZoneMotionSensor &sensor)
        {
            bool motion = false;
            bool known = sensor.current_state(motion);
            (void)zone_events::post_zone_motion_changed(sensor.zone_id().c_str(), known, motion, esp_timer_get_time());
        }
    } // namespace

    esp_err_t MemoryRegistry::ensure_hub(const std::string &session_id, const std::string &name)
    {
        if (session_id.empty())
            return ESP_ERR_INVALID_ARG;

        DeviceInfo info;
        info.identifier = session_id;
        info.name = name;
        (void)get_or_create_device(info);
        return ESP_OK;
    }

    const DeviceEntry &MemoryRegistry::get_or_create_device(const DeviceInfo &info)
    {
        for (const auto &d : devices_)
        {
            if (d.identifier == info.identifier)
                return d;
        }

        char id[16];
        std::snprintf(id, sizeof(id), "dev_%d", next_device_id_++);

        DeviceEntry entry;
        entry.id = id;
        entry.identifier = info.identifier;
        entry.name = info.name;
        entry.via_device = info.via_device;
        devices_.push_back(std::move(entry));
        ESP_LOGI(TAG, "Device %s created (%s)", id, info.name.c_str());
        return devices_.back();
    }

    DeviceEntry *MemoryRegistry::device_by_id(const std::string &device_id)
    {
        for (auto &d : devices_)
        {
            if (d.id == device_id)
                return &d;
        }
        return nullptr;
    }

    esp_err_t MemoryRegistry::add_sensors(const std::vector<ZoneMotionSensor *> &sensors)
    {
        const std::int64_t now = esp_timer_get_time();
        for (ZoneMotionSensor *sensor : sensors)
        {
            if (!sensor)
                continue;
            Slot *existing = slot_by_unique_id(sensor->unique_id());
            if (existing)
            {
                if (existing->sensor && existing->sensor != sensor)
                    existing->sensor->detach();
                existing->sensor = sensor;
                sensor->attach(&forward_state);
                ESP_LOGI(TAG, "Entity %s rebound to a new sensor", sensor->unique_id().c_str());
                (void)zone_events::post_zone_added(sensor->zone_id().c_str(), sensor->zone_name().c_str(), now);
                continue;
            }

            const std::string device_id = get_or_create_device(sensor->device_info()).id;

            Slot slot;
            slot.entry.unique_id = sensor->unique_id();
            slot.entry.device_id = device_id;
            slot.sensor = sensor;
            entities_.push_back(std::move(slot));

            sensor->attach(&forward_state);
            (void)zone_events::post_zone_added(sensor->zone_id().c_str(), sensor->zone_name().c_str(), now);
        }
        return ESP_OK;
    }

    void MemoryRegistry::release_sensors(const std::vector<ZoneMotionSensor *> &sensors)
    {
        for (ZoneMotionSensor *sensor : sensors)
        {
            for (auto &slot : entities_)
            {
                if (sensor && slot.sensor == sensor)
                {
                    sensor->detach();
                    slot.sensor = nullptr;
                }
            }
        }
    }

    MemoryRegistry::Slot *MemoryRegistry::slot_by_unique_id(const std::string &unique_id)
    {
        for (auto &slot : entities_)
        {
            if (slot.entry.unique_id == unique_id)
                return &slot;
        }
        return nullptr;
    }

    const DeviceEntry *MemoryRegistry::find_device(const std::string &identifier) const
    {
        for (const auto &d : devices_)
        {
            if (d.identifier == identifier)
                return &d;
        }
        return nullptr;
    }

    const EntityEntry *MemoryRegistry::find_entity(const std::string &unique_id) const
    {
        for (const auto &slot : entities_)
        {
            if (slot.entry.unique_id == unique_id)
                return &slot.entry;
        }
        return nullptr;
    }

    esp_err_t MemoryRegistry::remove_entity(const std::string &unique_id)
    {
        for (auto it = entities_.begin(); it != entities_.end(); ++it)
        {
            if (it->entry.unique_id != unique_id)
                continue;

            if (it->sensor)
            {
                it->sensor->detach();
                (void)zone_events::post_zone_removed(it->sensor->zone_id().c_str(), esp_timer_get_time());
            }
            entities_.erase(it);
            return ESP_OK;
        }
        return ESP_OK; // already gone
    }

    esp_err_t MemoryRegistry::remove_device(const std::string &device_id)
    {
        for (auto it = devices_.begin(); it != devices_.end(); ++it)
        {
            if (it->id != device_id)
                continue;

            // Entities die with their device.
            for (auto e = entities_.begin(); e != entities_.end();)
            {
                if (e->entry.device_id == device_id)
                {
                    if (e->sensor)
                        e->sensor->detach();
                    e = entities_.erase(e);
                }
                else
                {
                    ++e;
                }
            }
            devices_.erase(it);
            return ESP_OK;
        }
        return ESP_OK;
    }

    esp_err_t MemoryRegistry::update_device_name(const std::string &device_id, const std::string &name)
    {
        DeviceEntry *device = device_by_id(device_id);
        if (!device)
            return ESP_ERR_NOT_FOUND;
        device->name = name;

        for (const auto &slot : entities_)
        {
            if (slot.entry.device_id == device_id && slot.sensor)
            {
                (void)zone_events::post_zone_renamed(slot.sensor->zone_id().c_str(), name.c_str(), esp_timer_get_time());
            }
        }
        return ESP_OK;
    }

    esp_err_t MemoryRegistry::clear_entity_name_override(const std::string &unique_id)
    {
        for (auto &slot : entities_)
        {
            if (slot.entry.unique_id == unique_id)
            {
                slot.entry.name_override.clear();
                return ESP_OK;
            }
        }
        return ESP_ERR_NOT_FOUND;
    }

    esp_err_t MemoryRegistry::set_entity_name_override(const std::string &unique_id, const std::string &name)
    {
        for (auto &slot : entities_)
        {
            if (slot.entry.unique_id == unique_id)
            {
                slot.entry.name_override = name;
                return ESP_OK;
            }
        }
        return ESP_ERR_NOT_FOUND;
    }

} // namespace zone
