#include "app/zone_manager.hpp"

#include <memory>
#include <new>
#include <unordered_set>
#include <utility>

#include "esp_log.h"

namespace zone
{

    namespace
    {
        static const char *TAG = "zone_mgr";
    }

    ZoneManager::ZoneManager(ZoneRegistry &registry, const std::string &session_id)
        : registry_(registry), session_id_(session_id), router_(zones_)
    {
    }

    void ZoneManager::on_zone_config_update(const Roster &zones)
    {
        // Duplicated ids: the last entry wins.
        std::unordered_map<std::string, ZoneInfo> new_zone_info;
        new_zone_info.reserve(zones.size());
        for (const auto &z : zones)
        {
            new_zone_info[z.id] = z;
        }

        // New zones, in roster order
        std::vector<const ZoneInfo *> added;
        std::unordered_set<std::string> seen;
        for (const auto &z : zones)
        {
            if (zone_info_.count(z.id) == 0 && seen.insert(z.id).second)
            {
                added.push_back(&new_zone_info[z.id]);
            }
        }
        if (!added.empty())
        {
            create_zones(added);
        }

        std::vector<std::string> removed;
        for (const auto &entry : zone_info_)
        {
            if (new_zone_info.count(entry.first) == 0)
            {
                removed.push_back(entry.first);
            }
        }
        if (!removed.empty())
        {
            remove_zones(removed);
        }

        for (const auto &entry : new_zone_info)
        {
            auto old = zone_info_.find(entry.first);
            if (old != zone_info_.end() && old->second.name != entry.second.name)
            {
                rename_zone(entry.second);
            }
        }

        zone_info_ = std::move(new_zone_info);
    }

    void ZoneManager::on_zone_motion_update(const std::string &zone_id, bool motion)
    {
        (void)router_.update(zone_id, motion);
    }

    void ZoneManager::clear()
    {
        std::vector<ZoneMotionSensor *> sensors;
        sensors.reserve(zones_.size());
        for (auto &entry : zones_)
        {
            if (entry.second.sensor)
            {
                sensors.push_back(entry.second.sensor.get());
            }
        }
        if (sink_ && !sensors.empty())
        {
            sink_->release_sensors(sensors);
        }
        for (ZoneMotionSensor *sensor : sensors)
        {
            sensor->detach();
        }
        zones_.clear();
        zone_info_.clear();
    }

    const ZoneRecord *ZoneManager::find(const std::string &zone_id) const
    {
        auto it = zones_.find(zone_id);
        if (it == zones_.end())
            return nullptr;
        return &it->second;
    }

    void ZoneManager::create_zones(const std::vector<const ZoneInfo *> &added)
    {
        if (!sink_)
        {
            ESP_LOGW(TAG, "Cannot create entities - entity sink not available");
            return;
        }

        std::vector<ZoneMotionSensor *> batch;
        batch.reserve(added.size());
        for (const ZoneInfo *zone : added)
        {
            if (zones_.count(zone->id) != 0)
                continue;

            std::unique_ptr<ZoneMotionSensor> sensor(new (std::nothrow) ZoneMotionSensor(session_id_, *zone));
            if (!sensor)
            {
                ESP_LOGE(TAG, "No memory for zone %s", zone->id.c_str());
                continue;
            }
            batch.push_back(sensor.get());

            ZoneRecord record;
            record.info = *zone;
            record.sensor = std::move(sensor);
            zones_.emplace(zone->id, std::move(record));
        }

        if (batch.empty())
            return;

        esp_err_t err = sink_->add_sensors(batch);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "Registering %d zone entities failed: %s",
                     static_cast<int>(batch.size()), esp_err_to_name(err));
            return;
        }
        ESP_LOGI(TAG, "Created %d new zone entities", static_cast<int>(batch.size()));
    }

    void ZoneManager::remove_zones(const std::vector<std::string> &zone_ids)
    {
        for (const auto &zone_id : zone_ids)
        {
            // Take the zone out of our table first; the sensor is kept alive
            // until the registries have let go of it.
            std::unique_ptr<ZoneMotionSensor> sensor;
            auto it = zones_.find(zone_id);
            if (it != zones_.end())
            {
                sensor = std::move(it->second.sensor);
                zones_.erase(it);
            }

            const std::string unique_id = entity_unique_id(session_id_, zone_id);
            if (registry_.find_entity(unique_id))
            {
                esp_err_t err = registry_.remove_entity(unique_id);
                if (err == ESP_OK)
                {
                    ESP_LOGI(TAG, "Removed entity for zone %s", zone_id.c_str());
                }
                else
                {
                    ESP_LOGW(TAG, "Removing entity %s failed: %s", unique_id.c_str(), esp_err_to_name(err));
                }
            }

            // Zone identifiers always carry a "<session>_" prefix, so this
            // lookup never yields the hub device.
            const DeviceEntry *device = registry_.find_device(device_identifier(session_id_, zone_id));
            if (device)
            {
                const std::string device_id = device->id;
                esp_err_t err = registry_.remove_device(device_id);
                if (err == ESP_OK)
                {
                    ESP_LOGI(TAG, "Removed device for zone %s", zone_id.c_str());
                }
                else
                {
                    ESP_LOGW(TAG, "Removing device %s failed: %s", device_id.c_str(), esp_err_to_name(err));
                }
            }

            if (sensor)
            {
                if (sink_)
                {
                    sink_->release_sensors({sensor.get()});
                }
                sensor->detach();
            }
        }
    }

    void ZoneManager::rename_zone(const ZoneInfo &zone)
    {
        const std::string expected_name = device_name(zone.name);

        const DeviceEntry *device = registry_.find_device(device_identifier(session_id_, zone.id));
        if (device && device->name != expected_name)
        {
            const std::string device_id = device->id;
            esp_err_t err = registry_.update_device_name(device_id, expected_name);
            if (err == ESP_OK)
            {
                ESP_LOGI(TAG, "Updated device name for zone %s to %s", zone.id.c_str(), zone.name.c_str());
            }
            else
            {
                ESP_LOGW(TAG, "Renaming device %s failed: %s", device_id.c_str(), esp_err_to_name(err));
            }
        }

        // The entity label is derived from the device; drop manual overrides.
        const std::string unique_id = entity_unique_id(session_id_, zone.id);
        const EntityEntry *entity = registry_.find_entity(unique_id);
        if (entity && !entity->name_override.empty())
        {
            esp_err_t err = registry_.clear_entity_name_override(unique_id);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "Clearing label of %s failed: %s", unique_id.c_str(), esp_err_to_name(err));
            }
        }

        auto it = zones_.find(zone.id);
        if (it == zones_.end() || !it->second.sensor)
            return;

        it->second.info.name = zone.name;
        ZoneMotionSensor &sensor = *it->second.sensor;
        sensor.set_name(zone.name);
        DeviceInfo info = sensor.device_info();
        info.name = expected_name;
        sensor.set_device_info(info);
        if (sensor.is_attached())
        {
            sensor.publish_state();
        }
    }

} // namespace zone
