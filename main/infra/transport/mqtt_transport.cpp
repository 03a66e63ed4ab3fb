#include "infra/transport/mqtt_transport.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cstdio>
#include <cstring>

#include "esp_log.h"

#include "zone_mqtt_config.h"

namespace transport {

namespace {
const char *TAG = "zone_mqtt";

constexpr EventBits_t kConnectedBit = BIT0;
constexpr TickType_t kPostWait = pdMS_TO_TICKS(100);

inline int topic_index(Topic topic)
{
    return static_cast<int>(topic);
}

class LockGuard {
public:
    explicit LockGuard(SemaphoreHandle_t mutex) : mutex_(mutex)
    {
        if (mutex_) xSemaphoreTake(mutex_, portMAX_DELAY);
    }
    ~LockGuard()
    {
        if (mutex_) xSemaphoreGive(mutex_);
    }

    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;

private:
    SemaphoreHandle_t mutex_;
};
} // namespace

const char *topic_name(Topic topic)
{
    switch (topic) {
    case Topic::ZoneConfig:
        return TOMMY_TOPIC_ZONE_CONFIG;
    case Topic::ZoneState:
        return TOMMY_TOPIC_ZONE_STATE;
    }
    return "";
}

bool topic_from_name(const char *name, std::size_t len, Topic &out)
{
    if (!name) return false;
    for (int i = 0; i < kTopicCount; ++i) {
        Topic t = static_cast<Topic>(i);
        const char *known = topic_name(t);
        if (std::strlen(known) == len && std::strncmp(known, name, len) == 0) {
            out = t;
            return true;
        }
    }
    return false;
}

MqttTransport::MqttTransport(core::WorkQueue &queue)
    : queue_(queue), lock_(xSemaphoreCreateMutex()), backoff_s_(TOMMY_MQTT_RECONNECT_MIN_S)
{
    if (!lock_) {
        ESP_LOGE(TAG, "Failed to create transport mutex");
    }
}

MqttTransport::~MqttTransport()
{
    disconnect();
    if (lock_) {
        vSemaphoreDelete(lock_);
        lock_ = nullptr;
    }
}

std::uint32_t MqttTransport::next_reconnect_delay(std::uint32_t current_s)
{
    if (current_s < TOMMY_MQTT_RECONNECT_MIN_S) return TOMMY_MQTT_RECONNECT_MIN_S;
    std::uint32_t next = current_s * 2;
    return next > TOMMY_MQTT_RECONNECT_MAX_S ? TOMMY_MQTT_RECONNECT_MAX_S : next;
}

esp_err_t MqttTransport::connect(const char *host, std::uint16_t port)
{
    if (!lock_) return ESP_ERR_NO_MEM;
    if (client_) {
        ESP_LOGW(TAG, "MQTT client already connecting/connected");
        return ESP_OK;
    }
    if (!host || !*host || port == 0) {
        ESP_LOGE(TAG, "Invalid broker address host='%s' port=%u", host ? host : "",
                 static_cast<unsigned>(port));
        return ESP_ERR_INVALID_ARG;
    }

    // esp-mqtt resolves asynchronously; check the host up front so an
    // unusable address fails the caller instead of looping in the background.
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *res = nullptr;
    int rc = getaddrinfo(host, nullptr, &hints, &res);
    if (rc != 0 || !res) {
        ESP_LOGE(TAG, "Cannot resolve broker host '%s' (rc=%d)", host, rc);
        if (res) freeaddrinfo(res);
        return ESP_ERR_NOT_FOUND;
    }
    freeaddrinfo(res);

    char uri[128];
    std::snprintf(uri, sizeof(uri), "mqtt://%s:%u", host, static_cast<unsigned>(port));
    uri_ = uri;
    ESP_LOGI(TAG, "Connecting to TOMMY MQTT broker at %s", uri_.c_str());

    events_ = xEventGroupCreate();
    if (!events_) return ESP_ERR_NO_MEM;

    esp_mqtt_client_config_t cfg = {};
    cfg.broker.address.uri = uri_.c_str();
    cfg.session.keepalive = TOMMY_MQTT_KEEPALIVE_S;
    // Reconnects are driven by our own backoff timer.
    cfg.network.disable_auto_reconnect = true;
    cfg.task.priority = 6;
    cfg.task.stack_size = 6144;
    cfg.buffer.size = 2048;

    stopping_ = false;
    backoff_s_ = TOMMY_MQTT_RECONNECT_MIN_S;

    client_ = esp_mqtt_client_init(&cfg);
    if (!client_) {
        release_client();
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = esp_mqtt_client_register_event(client_, MQTT_EVENT_ANY, &MqttTransport::on_mqtt_event, this);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register MQTT events: %s", esp_err_to_name(err));
        release_client();
        return err;
    }

    esp_timer_create_args_t targs = {};
    targs.callback = &MqttTransport::on_reconnect_timer;
    targs.arg = this;
    targs.name = "mqtt_backoff";
    err = esp_timer_create(&targs, &reconnect_timer_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to create reconnect timer: %s", esp_err_to_name(err));
        release_client();
        return err;
    }

    err = esp_mqtt_client_start(client_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start MQTT client: %s", esp_err_to_name(err));
        release_client();
        return err;
    }

    // Give the network task a chance to establish the session.
    EventBits_t bits = xEventGroupWaitBits(events_, kConnectedBit, pdFALSE, pdTRUE,
                                           pdMS_TO_TICKS(TOMMY_MQTT_CONNECT_WAIT_MS));
    if (!(bits & kConnectedBit)) {
        ESP_LOGW(TAG, "Broker %s not reachable yet, retrying in background", uri_.c_str());
    }
    return ESP_OK;
}

void MqttTransport::disconnect()
{
    if (client_) {
        {
            LockGuard guard(lock_);
            stopping_ = true;
            if (reconnect_timer_) {
                (void)esp_timer_stop(reconnect_timer_); // not armed -> ESP_ERR_INVALID_STATE
            }
        }
        // Outside the lock: this waits for the esp-mqtt task, which may be
        // about to take it in handle_disconnected().
        esp_err_t err = esp_mqtt_client_stop(client_);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "esp_mqtt_client_stop: %s", esp_err_to_name(err));
        }
        release_client();
        ESP_LOGI(TAG, "MQTT connection stopped");
    }

    connected_ = false;
    rx_topic_.clear();
    rx_payload_.clear();
    rx_overflow_ = false;

    std::size_t dropped = queue_.discard_pending();
    if (dropped > 0) {
        ESP_LOGI(TAG, "Discarded %u undelivered message(s)", static_cast<unsigned>(dropped));
    }
}

void MqttTransport::release_client()
{
    LockGuard guard(lock_);
    if (reconnect_timer_) {
        (void)esp_timer_stop(reconnect_timer_);
        esp_timer_delete(reconnect_timer_);
        reconnect_timer_ = nullptr;
    }
    if (client_) {
        esp_mqtt_client_destroy(client_);
        client_ = nullptr;
    }
    if (events_) {
        vEventGroupDelete(events_);
        events_ = nullptr;
    }
    stopping_ = false;
}

ITransport::HandlerId MqttTransport::subscribe(Topic topic, MessageHandler handler)
{
    if (!handler) return 0;
    HandlerId id = next_handler_id_++;
    handlers_[topic_index(topic)].push_back(HandlerEntry{id, std::move(handler)});
    ESP_LOGD(TAG, "Handler %d registered for %s", id, topic_name(topic));
    return id;
}

void MqttTransport::unsubscribe(Topic topic, HandlerId id)
{
    auto &list = handlers_[topic_index(topic)];
    for (auto it = list.begin(); it != list.end(); ++it) {
        if (it->id == id) {
            list.erase(it);
            return;
        }
    }
}

void MqttTransport::set_connection_handler(ConnectionHandler handler)
{
    conn_handler_ = std::move(handler);
}

bool MqttTransport::is_connected() const
{
    return connected_;
}

void MqttTransport::ingest(const char *topic, int topic_len,
                           const char *data, int data_len,
                           int offset, int total_len)
{
    if (offset == 0) {
        // Only the first fragment carries the topic.
        rx_topic_.assign(topic ? topic : "", topic && topic_len > 0 ? static_cast<std::size_t>(topic_len) : 0);
        rx_payload_.clear();
        rx_overflow_ = total_len > TOMMY_MQTT_MAX_PAYLOAD;
        if (!rx_overflow_ && total_len > 0) {
            rx_payload_.reserve(static_cast<std::size_t>(total_len));
        }
    }
    if (!rx_overflow_ && data && data_len > 0) {
        rx_payload_.append(data, static_cast<std::size_t>(data_len));
    }
    if (offset + data_len < total_len) {
        return;
    }

    if (rx_overflow_) {
        ESP_LOGW(TAG, "Dropping oversized message on %s (%d bytes)", rx_topic_.c_str(), total_len);
        rx_payload_.clear();
        return;
    }

    Topic parsed;
    if (!topic_from_name(rx_topic_.data(), rx_topic_.size(), parsed)) {
        ESP_LOGD(TAG, "Ignoring message on unexpected topic '%s'", rx_topic_.c_str());
        rx_payload_.clear();
        return;
    }

    InboundMessage msg{parsed, std::move(rx_payload_)};
    rx_payload_.clear();
    esp_err_t err = queue_.post([this, msg]() { dispatch(msg); }, kPostWait);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Message on %s dropped: %s", topic_name(parsed), esp_err_to_name(err));
    }
}

void MqttTransport::dispatch(const InboundMessage &msg)
{
    // Copy so a handler may (un)subscribe while we iterate.
    const std::vector<HandlerEntry> handlers = handlers_[topic_index(msg.topic)];
    if (handlers.empty()) {
        ESP_LOGD(TAG, "No handler for %s", topic_name(msg.topic));
        return;
    }
    for (const auto &entry : handlers) {
        esp_err_t err = entry.handler(msg);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Error in message handler %d for topic %s: %s",
                     entry.id, topic_name(msg.topic), esp_err_to_name(err));
        }
    }
}

void MqttTransport::notify_connection(bool connected)
{
    esp_err_t err = queue_.post([this, connected]() {
        if (conn_handler_) {
            conn_handler_(connected);
        }
    }, kPostWait);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Connection change not delivered: %s", esp_err_to_name(err));
    }
}

void MqttTransport::handle_connected()
{
    connected_ = true;
    backoff_s_ = TOMMY_MQTT_RECONNECT_MIN_S;
    if (events_) {
        xEventGroupSetBits(events_, kConnectedBit);
    }
    ESP_LOGI(TAG, "MQTT connected to %s", uri_.c_str());

    for (int i = 0; i < kTopicCount; ++i) {
        const char *name = topic_name(static_cast<Topic>(i));
        int mid = esp_mqtt_client_subscribe(client_, name, 1);
        if (mid < 0) {
            ESP_LOGW(TAG, "Subscribe to %s failed", name);
        } else {
            ESP_LOGI(TAG, "Subscribed to %s (mid=%d)", name, mid);
        }
    }
    notify_connection(true);
}

void MqttTransport::handle_disconnected()
{
    bool was_connected = connected_.exchange(false);
    if (events_) {
        xEventGroupClearBits(events_, kConnectedBit);
    }
    if (stopping_) {
        return;
    }
    ESP_LOGW(TAG, "MQTT disconnected from %s", uri_.c_str());
    if (was_connected) {
        notify_connection(false);
    }
    LockGuard guard(lock_);
    schedule_reconnect();
}

void MqttTransport::schedule_reconnect()
{
    if (stopping_ || !reconnect_timer_) return;
    if (esp_timer_is_active(reconnect_timer_)) return;

    std::uint32_t delay_s = backoff_s_;
    backoff_s_ = next_reconnect_delay(delay_s);
    esp_err_t err = esp_timer_start_once(reconnect_timer_, static_cast<std::uint64_t>(delay_s) * 1000000ULL);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to arm reconnect timer: %s", esp_err_to_name(err));
        return;
    }
    ESP_LOGI(TAG, "Reconnecting in %u s", static_cast<unsigned>(delay_s));
}

void MqttTransport::on_reconnect_timer(void *arg)
{
    auto *self = static_cast<MqttTransport *>(arg);
    if (!self) return;
    LockGuard guard(self->lock_);
    if (self->stopping_ || !self->client_) return;

    esp_err_t err = esp_mqtt_client_reconnect(self->client_);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Reconnect attempt failed: %s", esp_err_to_name(err));
        self->schedule_reconnect();
    }
}

void MqttTransport::on_mqtt_event(void *handler_args, esp_event_base_t /*base*/,
                                  int32_t /*event_id*/, void *event_data)
{
    auto *self = static_cast<MqttTransport *>(handler_args);
    auto *event = static_cast<esp_mqtt_event_handle_t>(event_data);
    if (!self || !event) return;

    switch (event->event_id) {
    case MQTT_EVENT_CONNECTED:
        self->handle_connected();
        break;
    case MQTT_EVENT_DISCONNECTED:
        self->handle_disconnected();
        break;
    case MQTT_EVENT_SUBSCRIBED:
        ESP_LOGD(TAG, "SUBACK mid=%d", event->msg_id);
        break;
    case MQTT_EVENT_ERROR:
        if (event->error_handle) {
            ESP_LOGW(TAG, "MQTT error type=%d tls_last=%d sock=%d",
                     event->error_handle->error_type,
                     event->error_handle->esp_tls_last_esp_err,
                     event->error_handle->esp_transport_sock_errno);
        } else {
            ESP_LOGW(TAG, "MQTT error");
        }
        break;
    case MQTT_EVENT_DATA:
        self->ingest(event->topic, event->topic_len,
                     event->data, event->data_len,
                     event->current_data_offset, event->total_data_len);
        break;
    default:
        break;
    }
}

} // namespace transport
