#include "app/motion_router.hpp"

#include "esp_log.h"

namespace zone {

namespace {
static const char *TAG = "motion_router";
}

bool MotionRouter::update(const std::string &zone_id, bool motion)
{
    auto it = zones_.find(zone_id);
    if (it == zones_.end() || !it->second.sensor) {
        ESP_LOGD(TAG, "Motion for unknown zone %s dropped", zone_id.c_str());
        return false;
    }

    ZoneMotionSensor &sensor = *it->second.sensor;
    bool last = false;
    if (sensor.current_state(last) && last == motion) {
        return false;
    }

    sensor.set_state(motion);
    ESP_LOGI(TAG, "Zone %s motion -> %s", zone_id.c_str(), motion ? "on" : "off");
    sensor.publish_state();
    return true;
}

} // namespace zone
