#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "esp_event.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/semphr.h"
#include "mqtt_client.h"

#include "core/work_queue.hpp"
#include "infra/transport/i_transport.hpp"

namespace transport {

// esp-mqtt backed transport. The esp-mqtt task only copies deliveries into
// the work queue; handlers always run on the queue's consumer task.
class MqttTransport : public ITransport {
public:
    explicit MqttTransport(core::WorkQueue &queue);
    ~MqttTransport() override;

    MqttTransport(const MqttTransport &) = delete;
    MqttTransport &operator=(const MqttTransport &) = delete;

    esp_err_t connect(const char *host, std::uint16_t port) override;
    void disconnect() override;
    HandlerId subscribe(Topic topic, MessageHandler handler) override;
    void unsubscribe(Topic topic, HandlerId id) override;
    void set_connection_handler(ConnectionHandler handler) override;
    bool is_connected() const override;

    // Network side of the hand-off: accumulate one (possibly fragmented)
    // MQTT delivery and post it to the consumer once complete.
    void ingest(const char *topic, int topic_len,
                const char *data, int data_len,
                int offset, int total_len);

    // Consumer side: invoke every handler registered for msg.topic.
    void dispatch(const InboundMessage &msg);

    // Delay (seconds) to use after a failed attempt that waited `current_s`.
    static std::uint32_t next_reconnect_delay(std::uint32_t current_s);

    // esp_timer callback for the backoff timer. A no-op once the client
    // has been stopped or released.
    static void on_reconnect_timer(void *arg);

private:
    struct HandlerEntry {
        HandlerId id;
        MessageHandler handler;
    };

    static void on_mqtt_event(void *handler_args, esp_event_base_t base,
                              int32_t event_id, void *event_data);

    void handle_connected();
    void handle_disconnected();
    // Caller holds lock_.
    void schedule_reconnect();
    void notify_connection(bool connected);
    void release_client();

    core::WorkQueue &queue_;

    // Guards client_ and reconnect_timer_ against the esp_timer task.
    SemaphoreHandle_t lock_ = nullptr;
    esp_mqtt_client_handle_t client_ = nullptr;
    esp_timer_handle_t reconnect_timer_ = nullptr;
    EventGroupHandle_t events_ = nullptr;
    std::string uri_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint32_t> backoff_s_;

    // Fragment reassembly; touched by the network task only.
    std::string rx_topic_;
    std::string rx_payload_;
    bool rx_overflow_ = false;

    std::array<std::vector<HandlerEntry>, kTopicCount> handlers_;
    HandlerId next_handler_id_ = 1;
    ConnectionHandler conn_handler_;
};

} // namespace transport
