#pragma once

#include "esp_err.h"
#include <cstdint>

// NVS-backed storage of the TOMMY hub connection.
namespace config_store
{

    struct HubConn
    {
        char host[64]{};
        std::uint16_t mqtt_port{1886};
        // Config session identifier; empty means "use the default".
        char session_id[40]{};
    };

    // Initialize NVS flash (must be called before other operations).
    esp_err_t init();

    // ESP_ERR_NOT_FOUND when nothing has been saved yet.
    esp_err_t load_hub(HubConn &out);

    esp_err_t save_hub(const HubConn &conn);

} // namespace config_store
