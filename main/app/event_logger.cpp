#include "event_logger.hpp"

#include "esp_event.h"
#include "esp_log.h"
#include "zone_events.hpp"

namespace event_logger
{

    namespace
    {
        static const char *TAG = "APP_EVENT_BUS";
        static esp_event_handler_instance_t s_any_instance = nullptr;

        static void log_event(void * /*arg*/,
                              esp_event_base_t event_base,
                              int32_t event_id,
                              void *event_data)
        {
            const char *base_str = event_base ? event_base : "NULL";
            switch (event_id)
            {
            case zone_events::ZONE_ADDED:
            case zone_events::ZONE_REMOVED:
            case zone_events::ZONE_RENAMED:
            {
                auto *p = static_cast<const zone_events::ZonePayload *>(event_data);
                const char *id_str = (p && p->zone_id[0]) ? p->zone_id : "<null>";
                const char *name = (p && p->name[0]) ? p->name : "-";
                ESP_LOGI(TAG,
                         "event: base=%s id=%s zone=%s name=%s",
                         base_str,
                         zone_events::id_to_string(event_id),
                         id_str,
                         name);
                break;
            }
            case zone_events::ZONE_MOTION_CHANGED:
            {
                auto *p = static_cast<const zone_events::ZoneMotionPayload *>(event_data);
                const char *id_str = (p && p->zone_id[0]) ? p->zone_id : "<null>";
                const char *state = (!p || !p->known) ? "unknown" : (p->motion ? "on" : "off");
                ESP_LOGI(TAG,
                         "event: base=%s id=ZONE_MOTION_CHANGED zone=%s motion=%s",
                         base_str,
                         id_str,
                         state);
                break;
            }
            case zone_events::LINK_CHANGED:
            {
                auto *p = static_cast<const zone_events::LinkPayload *>(event_data);
                ESP_LOGI(TAG,
                         "event: base=%s id=LINK_CHANGED connected=%d",
                         base_str,
                         p ? (int)p->connected : -1);
                break;
            }
            default:
                ESP_LOGI(TAG,
                         "event: base=%s id=%ld (ZONE_EVENTS unknown)",
                         base_str,
                         static_cast<long>(event_id));
                break;
            }
        }
    } // namespace

    esp_err_t init()
    {
        if (s_any_instance)
        {
            return ESP_OK;
        }

        esp_err_t err = esp_event_handler_instance_register(
            ZONE_EVENTS,
            ESP_EVENT_ANY_ID,
            &log_event,
            nullptr,
            &s_any_instance);

        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "failed to register event logger: %s", esp_err_to_name(err));
        }

        return err;
    }

} // namespace event_logger
