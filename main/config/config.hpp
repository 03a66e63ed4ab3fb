#pragma once

#include <cstdint>

#include "esp_err.h"
#include "config/config_store.hpp"

namespace config {

struct ZoneSettings {
    char host[64];
    std::uint16_t mqtt_port;
    char session_id[40];
};

// Merge a stored hub connection (may be nullptr) over the compile-time
// defaults and validate the result. Missing host or port is reported by
// name and yields ESP_ERR_INVALID_ARG.
esp_err_t resolve(const config_store::HubConn *stored, ZoneSettings &out);

// Load from NVS, falling back to defaults. Result available via zone().
esp_err_t load();
const ZoneSettings &zone();

// Provision a hub connection: validated like load(), then persisted and
// made current. Nothing is written when validation fails.
esp_err_t save(const config_store::HubConn &conn);

} // namespace config
