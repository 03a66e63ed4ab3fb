#include "esp_err.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "app/event_logger.hpp"
#include "app/memory_registry.hpp"
#include "app/zone_events.hpp"
#include "app/zone_manager.hpp"
#include "config/config.hpp"
#include "config/config_store.hpp"
#include "core/work_queue.hpp"
#include "infra/transport/mqtt_transport.hpp"
#include "services/zone_service.hpp"
#include "zone_mqtt_config.h"

static const char *TAG_APP = "app";

// Everything below lives for the lifetime of the firmware.
static core::WorkQueue g_queue;
static zone::MemoryRegistry g_registry;

extern "C" void app_main(void)
{
    // Initialize config store (NVS backed).
    esp_err_t err = config_store::init();
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "NVS init failed: %s", esp_err_to_name(err));
        return;
    }

    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE)
    {
        ESP_LOGE(TAG_APP, "Default event loop: %s", esp_err_to_name(err));
        return;
    }

    // Log all zone events from the default ESP event loop
    (void)event_logger::init();

    if (config::load() != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "No usable TOMMY hub configuration, not starting");
        return;
    }
    const config::ZoneSettings &settings = config::zone();

    err = g_registry.ensure_hub(settings.session_id, TOMMY_HUB_NAME);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Hub device: %s", esp_err_to_name(err));
        return;
    }

    err = g_queue.init(TOMMY_WORK_QUEUE_DEPTH);
    if (err == ESP_OK)
    {
        err = g_queue.start("zone_worker", TOMMY_WORK_QUEUE_STACK, TOMMY_WORK_QUEUE_PRIO);
    }
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Work queue: %s", esp_err_to_name(err));
        return;
    }

    static transport::MqttTransport transport(g_queue);
    static zone::ZoneManager manager(g_registry, settings.session_id);
    static zone::ZoneService service(transport, g_queue, settings);

    manager.set_entity_sink(&g_registry);
    service.set_link_callback([](bool connected)
                              { (void)zone_events::post_link_changed(connected, esp_timer_get_time()); });

    err = service.start(manager);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Zone service failed to start: %s", esp_err_to_name(err));
        (void)g_queue.stop();
        return;
    }
    ESP_LOGI(TAG_APP, "TOMMY zone bridge running");
}
