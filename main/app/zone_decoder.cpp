#include "app/zone_decoder.hpp"

#include <cstring>
#include <utility>

#include "cJSON.h"
#include "esp_log.h"

namespace zone
{

    namespace
    {
        static const char *TAG = "zone_decoder";

        bool read_roster(const cJSON *zones, Roster &out)
        {
            out.clear();
            const int count = cJSON_GetArraySize(zones);
            out.reserve(static_cast<size_t>(count));
            for (int i = 0; i < count; ++i)
            {
                const cJSON *item = cJSON_GetArrayItem(zones, i);
                if (!cJSON_IsObject(item))
                    return false;

                const cJSON *id = cJSON_GetObjectItem(item, "id");
                const cJSON *name = cJSON_GetObjectItem(item, "name");
                if (!cJSON_IsString(id) || id->valuestring == nullptr ||
                    !cJSON_IsString(name) || name->valuestring == nullptr)
                {
                    return false;
                }

                ZoneInfo zone;
                zone.id = id->valuestring;
                zone.name = name->valuestring;
                out.push_back(std::move(zone));
            }
            return true;
        }

    } // namespace

    bool parse_motion(const char *literal, bool &known)
    {
        known = true;
        if (literal)
        {
            if (std::strcmp(literal, "detected") == 0 || std::strcmp(literal, "holding") == 0)
                return true;
            if (std::strcmp(literal, "clear") == 0)
                return false;
        }
        known = false;
        return false;
    }

    esp_err_t decode_zone_state(const char *data, std::size_t len, ZoneStateEvent &out)
    {
        if (!data || len == 0)
        {
            ESP_LOGW(TAG, "Received empty message");
            return ESP_ERR_INVALID_ARG;
        }

        cJSON *root = cJSON_ParseWithLength(data, len);
        if (!root)
        {
            ESP_LOGW(TAG, "Received non-JSON message: %.*s", static_cast<int>(len), data);
            return ESP_ERR_INVALID_ARG;
        }

        const cJSON *zone_id = cJSON_GetObjectItem(root, "zoneId");
        const cJSON *motion = cJSON_GetObjectItem(root, "motion");
        const cJSON *zones = cJSON_GetObjectItem(root, "zones");

        if (!cJSON_IsObject(root) ||
            !cJSON_IsString(zone_id) || zone_id->valuestring == nullptr ||
            motion == nullptr ||
            !cJSON_IsArray(zones))
        {
            ESP_LOGW(TAG, "Received unexpected message format: %.*s", static_cast<int>(len), data);
            cJSON_Delete(root);
            return ESP_ERR_INVALID_RESPONSE;
        }

        ZoneStateEvent ev;
        ev.zone_id = zone_id->valuestring;

        if (!read_roster(zones, ev.zones))
        {
            ESP_LOGW(TAG, "Zone list entry without id/name: %.*s", static_cast<int>(len), data);
            cJSON_Delete(root);
            return ESP_ERR_INVALID_RESPONSE;
        }

        const char *literal = cJSON_IsString(motion) ? motion->valuestring : nullptr;
        bool known = true;
        ev.motion = parse_motion(literal, known);
        if (!known)
        {
            ESP_LOGW(TAG, "Unknown or missing motion state '%s' for zone %s, defaulting to false",
                     literal ? literal : "<none>",
                     ev.zone_id.c_str());
        }

        cJSON_Delete(root);
        out = std::move(ev);
        return ESP_OK;
    }

} // namespace zone
