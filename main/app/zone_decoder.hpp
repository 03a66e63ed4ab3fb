#pragma once

#include <cstddef>

#include "esp_err.h"

#include "app/zone_types.hpp"

namespace zone {

// Map a motion literal to a boolean. "detected" and "holding" mean motion,
// "clear" means none. Anything else (including nullptr) yields false and
// sets `known` to false.
bool parse_motion(const char *literal, bool &known);

// Decode one zone-state payload:
//   {"zoneId": "...", "motion": "...", "zones": [{"id": "...", "name": "..."}]}
// Returns ESP_ERR_INVALID_ARG for non-JSON input and
// ESP_ERR_INVALID_RESPONSE for JSON of the wrong shape. Both are logged.
esp_err_t decode_zone_state(const char *data, std::size_t len, ZoneStateEvent &out);

} // namespace zone
