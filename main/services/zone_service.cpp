#include "services/zone_service.hpp"

#include <utility>

#include "esp_log.h"

#include "app/zone_decoder.hpp"
#include "app/zone_manager.hpp"

namespace zone {

namespace {
const char *TAG = "zone_service";
constexpr TickType_t kDetachWait = pdMS_TO_TICKS(2000);

// Set by start(), cleared once the service is fully detached.
std::atomic<ZoneService *> s_active{nullptr};
} // namespace

ZoneService::ZoneService(transport::ITransport &transport, core::WorkQueue &queue,
                         const config::ZoneSettings &settings)
    : transport_(transport), queue_(queue), settings_(settings)
{
}

ZoneService::~ZoneService()
{
    stop();
}

esp_err_t ZoneService::start(ZoneConfigCallback on_config, ZoneMotionCallback on_motion)
{
    if (!on_config || !on_motion) {
        return ESP_ERR_INVALID_ARG;
    }
    ZoneService *expected = nullptr;
    if (!s_active.compare_exchange_strong(expected, this)) {
        ESP_LOGE(TAG, "A TOMMY hub is already running");
        return ESP_ERR_INVALID_STATE;
    }
    config_cb_ = std::move(on_config);
    motion_cb_ = std::move(on_motion);

    for (int i = 0; i < transport::kTopicCount; ++i) {
        handler_ids_[i] = transport_.subscribe(static_cast<transport::Topic>(i),
                                               [this](const transport::InboundMessage &msg) {
                                                   return handle_message(msg);
                                               });
    }
    transport_.set_connection_handler([this](bool up) {
        ESP_LOGI(TAG, "Broker link %s", up ? "up" : "down");
        if (link_cb_) {
            link_cb_(up);
        }
    });
    started_ = true;

    esp_err_t err = transport_.connect(settings_.host, settings_.mqtt_port);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Cannot connect to %s:%u: %s", settings_.host,
                 static_cast<unsigned>(settings_.mqtt_port), esp_err_to_name(err));
        stop();
        return err;
    }
    ESP_LOGI(TAG, "Zone service started (session %s)", settings_.session_id);
    return ESP_OK;
}

esp_err_t ZoneService::start(ZoneManager &manager)
{
    if (s_active.load() != nullptr) {
        ESP_LOGE(TAG, "A TOMMY hub is already running");
        return ESP_ERR_INVALID_STATE;
    }
    manager_ = &manager;
    esp_err_t err = start(
        [&manager](const Roster &zones) { manager.on_zone_config_update(zones); },
        [&manager](const std::string &zone_id, bool motion) { manager.on_zone_motion_update(zone_id, motion); });
    if (err != ESP_OK) {
        manager_ = nullptr;
    }
    return err;
}

void ZoneService::stop()
{
    if (!started_.exchange(false)) {
        return;
    }
    // Stops the network task and drops deliveries not yet started, so the
    // only work left is whatever the consumer is executing right now.
    transport_.disconnect();

    ZoneManager *manager = manager_;
    manager_ = nullptr;
    esp_err_t err = queue_.run_sync([this, manager]() { detach(manager); }, kDetachWait);
    if (err == ESP_ERR_NOT_FINISHED) {
        ESP_LOGD(TAG, "Stop requested from a callback, detaching after it returns");
        return;
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Detaching zone service failed: %s", esp_err_to_name(err));
        return;
    }
    ESP_LOGI(TAG, "Zone service stopped");
}

void ZoneService::detach(ZoneManager *manager)
{
    for (int i = 0; i < transport::kTopicCount; ++i) {
        if (handler_ids_[i] != 0) {
            transport_.unsubscribe(static_cast<transport::Topic>(i), handler_ids_[i]);
            handler_ids_[i] = 0;
        }
    }
    transport_.set_connection_handler(nullptr);

    if (manager) {
        manager->clear();
    }
    config_cb_ = nullptr;
    motion_cb_ = nullptr;

    ZoneService *self = this;
    s_active.compare_exchange_strong(self, nullptr);
}

bool ZoneService::connected() const
{
    return started_ && transport_.is_connected();
}

esp_err_t ZoneService::handle_message(const transport::InboundMessage &msg)
{
    if (!started_) {
        return ESP_OK;
    }
    ZoneStateEvent event;
    esp_err_t err = decode_zone_state(msg.payload.data(), msg.payload.size(), event);
    if (err != ESP_OK) {
        // Already logged by the decoder; the message is dropped.
        return ESP_OK;
    }
    ESP_LOGD(TAG, "%s: zone=%s motion=%d zones=%u", transport::topic_name(msg.topic),
             event.zone_id.c_str(), event.motion ? 1 : 0, static_cast<unsigned>(event.zones.size()));

    if (config_cb_) {
        config_cb_(event.zones);
    }
    // A roster callback may have stopped the service.
    if (started_ && motion_cb_) {
        motion_cb_(event.zone_id, event.motion);
    }
    return ESP_OK;
}

} // namespace zone
