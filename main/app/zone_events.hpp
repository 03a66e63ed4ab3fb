#pragma once

#include "esp_event.h"
#include <cstddef>
#include <cstdint>

// Zone lifecycle / motion events posted on the default event loop
ESP_EVENT_DECLARE_BASE(ZONE_EVENTS);

namespace zone_events
{

    // Payload field sizes, terminator included. Longer values are cut and
    // the cut is logged.
    constexpr std::size_t kZoneIdSize = 64;
    constexpr std::size_t kZoneNameSize = 64;

    enum Id : int32_t
    {
        ZONE_ADDED = 1,
        ZONE_REMOVED = 2,
        ZONE_RENAMED = 3,
        ZONE_MOTION_CHANGED = 10,
        LINK_CHANGED = 20,
    };

    struct ZonePayload
    {
        char zone_id[kZoneIdSize];
        char name[kZoneNameSize];
        std::int64_t timestamp_us = 0;
    };

    struct ZoneMotionPayload
    {
        char zone_id[kZoneIdSize];
        bool known = false; // false until the first motion update
        bool motion = false;
        std::int64_t timestamp_us = 0;
    };

    struct LinkPayload
    {
        bool connected = false;
        std::int64_t timestamp_us = 0;
    };

    const char *id_to_string(int32_t id);

    // Fill a lifecycle payload. Returns false if the id or the name had to
    // be shortened.
    bool fill_zone_payload(ZonePayload &payload, const char *zone_id, const char *name, std::int64_t timestamp_us);

    esp_err_t post_zone_added(const char *zone_id, const char *name, std::int64_t timestamp_us);
    esp_err_t post_zone_removed(const char *zone_id, std::int64_t timestamp_us);
    esp_err_t post_zone_renamed(const char *zone_id, const char *name, std::int64_t timestamp_us);
    esp_err_t post_zone_motion_changed(const char *zone_id, bool known, bool motion, std::int64_t timestamp_us);
    esp_err_t post_link_changed(bool connected, std::int64_t timestamp_us);

} // namespace zone_events
