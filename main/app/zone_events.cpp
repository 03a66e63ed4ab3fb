#include "zone_events.hpp"

#include "esp_log.h"
#include <cstdio>
#include <cstring>

ESP_EVENT_DEFINE_BASE(ZONE_EVENTS);

namespace zone_events
{

    namespace
    {
        static const char *TAG = "zone_events";

        esp_err_t post_event(int32_t id, const void *payload, size_t size)
        {
            esp_err_t err = esp_event_post(ZONE_EVENTS, id, payload, size, 0);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "post %s failed: %s", id_to_string(id), esp_err_to_name(err));
            }
            return err;
        }

        // Copies src into dst; false when src did not fit.
        bool copy_field(char *dst, size_t size, const char *src)
        {
            if (!src)
                src = "";
            std::snprintf(dst, size, "%s", src);
            return std::strlen(src) < size;
        }

        esp_err_t post_zone(int32_t id, const char *zone_id, const char *name, std::int64_t timestamp_us)
        {
            if (!zone_id || !*zone_id)
            {
                return ESP_ERR_INVALID_ARG;
            }

            ZonePayload payload{};
            if (!fill_zone_payload(payload, zone_id, name, timestamp_us))
            {
                ESP_LOGW(TAG, "%s payload for zone %s truncated", id_to_string(id), zone_id);
            }
            return post_event(id, &payload, sizeof(payload));
        }
    } // namespace

    esp_err_t post_zone_added(const char *zone_id, const char *name, std::int64_t timestamp_us)
    {
        return post_zone(ZONE_ADDED, zone_id, name, timestamp_us);
    }

    esp_err_t post_zone_removed(const char *zone_id, std::int64_t timestamp_us)
    {
        return post_zone(ZONE_REMOVED, zone_id, nullptr, timestamp_us);
    }

    esp_err_t post_zone_renamed(const char *zone_id, const char *name, std::int64_t timestamp_us)
    {
        return post_zone(ZONE_RENAMED, zone_id, name, timestamp_us);
    }

    esp_err_t post_zone_motion_changed(const char *zone_id, bool known, bool motion, std::int64_t timestamp_us)
    {
        if (!zone_id || !*zone_id)
        {
            return ESP_ERR_INVALID_ARG;
        }

        ZoneMotionPayload payload{};
        if (!copy_field(payload.zone_id, sizeof(payload.zone_id), zone_id))
        {
            ESP_LOGW(TAG, "ZONE_MOTION_CHANGED payload for zone %s truncated", zone_id);
        }
        payload.known = known;
        payload.motion = motion;
        payload.timestamp_us = timestamp_us;
        return post_event(ZONE_MOTION_CHANGED, &payload, sizeof(payload));
    }

    esp_err_t post_link_changed(bool connected, std::int64_t timestamp_us)
    {
        LinkPayload payload{};
        payload.connected = connected;
        payload.timestamp_us = timestamp_us;
        return post_event(LINK_CHANGED, &payload, sizeof(payload));
    }

    bool fill_zone_payload(ZonePayload &payload, const char *zone_id, const char *name, std::int64_t timestamp_us)
    {
        const bool id_fits = copy_field(payload.zone_id, sizeof(payload.zone_id), zone_id);
        const bool name_fits = copy_field(payload.name, sizeof(payload.name), name);
        payload.timestamp_us = timestamp_us;
        return id_fits && name_fits;
    }

    const char *id_to_string(int32_t id)
    {
        switch (id)
        {
        case ZONE_ADDED:
            return "ZONE_ADDED";
        case ZONE_REMOVED:
            return "ZONE_REMOVED";
        case ZONE_RENAMED:
            return "ZONE_RENAMED";
        case ZONE_MOTION_CHANGED:
            return "ZONE_MOTION_CHANGED";
        case LINK_CHANGED:
            return "LINK_CHANGED";
        default:
            return "UNKNOWN";
        }
    }

} // namespace zone_events
