#include "config/config_store.hpp"

#include "esp_check.h"
#include "esp_log.h"
#include "nvs.h"
#include "nvs_flash.h"

namespace config_store
{

    namespace
    {
        const char *TAG = "cfg_store";
        const char *NS = "cfg";
        const char *KEY_HUB = "hub";

        esp_err_t open_handle(nvs_handle_t &handle, nvs_open_mode_t mode)
        {
            esp_err_t err = nvs_open(NS, mode, &handle);
            if (err != ESP_OK && err != ESP_ERR_NVS_NOT_FOUND)
            {
                ESP_LOGE(TAG, "nvs_open failed: %s", esp_err_to_name(err));
            }
            return err;
        }

    } // namespace

    esp_err_t init()
    {
        esp_err_t err = nvs_flash_init();
        if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND)
        {
            ESP_LOGW(TAG, "NVS partition needs erase (%s)", esp_err_to_name(err));
            ESP_RETURN_ON_ERROR(nvs_flash_erase(), TAG, "nvs_flash_erase failed");
            err = nvs_flash_init();
        }
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "nvs_flash_init failed: %s", esp_err_to_name(err));
        }
        return err;
    }

    esp_err_t load_hub(HubConn &out)
    {
        out = HubConn{};
        nvs_handle_t handle{};
        esp_err_t err = open_handle(handle, NVS_READONLY);
        if (err == ESP_ERR_NVS_NOT_FOUND)
        {
            return ESP_ERR_NOT_FOUND;
        }
        ESP_RETURN_ON_ERROR(err, TAG, "open_handle failed");

        size_t len = sizeof(HubConn);
        err = nvs_get_blob(handle, KEY_HUB, &out, &len);
        nvs_close(handle);
        if (err == ESP_ERR_NVS_NOT_FOUND)
        {
            out = HubConn{};
            return ESP_ERR_NOT_FOUND;
        }
        if (err != ESP_OK || len != sizeof(HubConn))
        {
            ESP_LOGW(TAG, "nvs_get_blob %s failed: %s", KEY_HUB, esp_err_to_name(err));
            out = HubConn{};
            return err != ESP_OK ? err : ESP_ERR_INVALID_SIZE;
        }
        out.host[sizeof(out.host) - 1] = '\0';
        out.session_id[sizeof(out.session_id) - 1] = '\0';
        return ESP_OK;
    }

    esp_err_t save_hub(const HubConn &conn)
    {
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle, NVS_READWRITE), TAG, "open_handle failed");

        esp_err_t err = nvs_set_blob(handle, KEY_HUB, &conn, sizeof(conn));
        if (err == ESP_OK)
        {
            err = nvs_commit(handle);
        }
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "saving hub config failed: %s", esp_err_to_name(err));
        }
        nvs_close(handle);
        return err;
    }

} // namespace config_store
