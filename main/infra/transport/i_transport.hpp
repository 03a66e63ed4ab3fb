#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "esp_err.h"

namespace transport {

// Topics consumed from the TOMMY broker.
enum class Topic : int {
    ZoneConfig = 0,
    ZoneState = 1,
};

constexpr int kTopicCount = 2;

// Broker-side name of a topic.
const char *topic_name(Topic topic);

// Map a broker topic name (not null-terminated) onto a Topic.
bool topic_from_name(const char *name, std::size_t len, Topic &out);

struct InboundMessage {
    Topic topic;
    std::string payload;
};

class ITransport {
public:
    using MessageHandler = std::function<esp_err_t(const InboundMessage &msg)>;
    using ConnectionHandler = std::function<void(bool connected)>;
    using HandlerId = int;

    virtual ~ITransport() = default;

    virtual esp_err_t connect(const char *host, std::uint16_t port) = 0;
    virtual void disconnect() = 0;
    virtual HandlerId subscribe(Topic topic, MessageHandler handler) = 0;
    virtual void unsubscribe(Topic topic, HandlerId id) = 0;
    virtual void set_connection_handler(ConnectionHandler handler) = 0;
    virtual bool is_connected() const = 0;
};

} // namespace transport
