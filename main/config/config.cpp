#include "config/config.hpp"

#include <cstring>

#include "esp_log.h"
#include "zone_mqtt_config.h"

namespace config
{

    namespace
    {
        constexpr const char *TAG = "config";

        ZoneSettings s_cfg{};
        bool s_loaded = false;

        inline void copy_field(char *dst, size_t len, const char *src)
        {
            if (!dst || len == 0)
                return;
            if (!src)
                src = "";
            std::strncpy(dst, src, len - 1);
            dst[len - 1] = '\0';
        }

    } // namespace

    esp_err_t resolve(const config_store::HubConn *stored, ZoneSettings &out)
    {
        std::memset(&out, 0, sizeof(out));
        copy_field(out.host, sizeof(out.host), TOMMY_MQTT_HOST);
        out.mqtt_port = TOMMY_MQTT_PORT;
        copy_field(out.session_id, sizeof(out.session_id), TOMMY_SESSION_ID);

        if (stored)
        {
            // A stored entry is authoritative for host and port.
            copy_field(out.host, sizeof(out.host), stored->host);
            out.mqtt_port = stored->mqtt_port;
            if (stored->session_id[0] != '\0')
            {
                copy_field(out.session_id, sizeof(out.session_id), stored->session_id);
            }
        }

        bool ok = true;
        if (out.host[0] == '\0')
        {
            ESP_LOGE(TAG, "missing configuration: host");
            ok = false;
        }
        if (out.mqtt_port == 0)
        {
            ESP_LOGE(TAG, "missing configuration: mqtt_port");
            ok = false;
        }
        if (out.session_id[0] == '\0')
        {
            ESP_LOGE(TAG, "missing configuration: session_id");
            ok = false;
        }
        return ok ? ESP_OK : ESP_ERR_INVALID_ARG;
    }

    esp_err_t load()
    {
        if (s_loaded)
            return ESP_OK;

        config_store::HubConn stored;
        esp_err_t err = config_store::load_hub(stored);
        const bool have_stored = (err == ESP_OK);
        if (!have_stored && err != ESP_ERR_NOT_FOUND)
        {
            ESP_LOGW(TAG, "Reading stored hub config failed (%s), using defaults", esp_err_to_name(err));
        }

        err = resolve(have_stored ? &stored : nullptr, s_cfg);
        if (err != ESP_OK)
            return err;

        ESP_LOGI(TAG, "Hub: host=%s mqtt_port=%u session=%s (%s)",
                 s_cfg.host,
                 static_cast<unsigned>(s_cfg.mqtt_port),
                 s_cfg.session_id,
                 have_stored ? "nvs" : "defaults");
        s_loaded = true;
        return ESP_OK;
    }

    const ZoneSettings &zone()
    {
        return s_cfg;
    }

    esp_err_t save(const config_store::HubConn &conn)
    {
        ZoneSettings resolved;
        esp_err_t err = resolve(&conn, resolved);
        if (err != ESP_OK)
            return err;

        err = config_store::save_hub(conn);
        if (err != ESP_OK)
            return err;

        s_cfg = resolved;
        s_loaded = true;
        ESP_LOGI(TAG, "Hub saved: host=%s mqtt_port=%u session=%s",
                 s_cfg.host, static_cast<unsigned>(s_cfg.mqtt_port), s_cfg.session_id);
        return ESP_OK;
    }

} // namespace config
