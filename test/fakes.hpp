#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "app/zone_registry.hpp"
#include "infra/transport/i_transport.hpp"

// Records every registry call; failures can be injected per key.
class FakeRegistry : public zone::ZoneRegistry, public zone::EntitySink
{
public:
    esp_err_t add_sensors(const std::vector<zone::ZoneMotionSensor *> &sensors) override
    {
        ++add_batches;
        for (zone::ZoneMotionSensor *s : sensors)
        {
            calls.push_back("add:" + s->zone_id());

            zone::DeviceEntry dev;
            dev.id = "dev_" + s->zone_id();
            dev.identifier = s->device_info().identifier;
            dev.name = s->device_info().name;
            dev.via_device = s->device_info().via_device;
            devices[dev.identifier] = dev;

            zone::EntityEntry ent;
            ent.unique_id = s->unique_id();
            ent.device_id = dev.id;
            entities[ent.unique_id] = ent;

            sensors_added.push_back(s);
            s->attach([this](const zone::ZoneMotionSensor &sensor)
                      {
                          bool motion = false;
                          sensor.current_state(motion);
                          publishes.push_back(sensor.zone_id() + (motion ? "=on" : "=off"));
                      });
        }
        return ESP_OK;
    }

    void release_sensors(const std::vector<zone::ZoneMotionSensor *> &sensors) override
    {
        for (zone::ZoneMotionSensor *s : sensors)
        {
            released.push_back(s->zone_id());
            sensors_added.erase(std::remove(sensors_added.begin(), sensors_added.end(), s), sensors_added.end());
        }
    }

    const zone::DeviceEntry *find_device(const std::string &identifier) const override
    {
        auto it = devices.find(identifier);
        return it == devices.end() ? nullptr : &it->second;
    }

    const zone::EntityEntry *find_entity(const std::string &unique_id) const override
    {
        auto it = entities.find(unique_id);
        return it == entities.end() ? nullptr : &it->second;
    }

    esp_err_t remove_entity(const std::string &unique_id) override
    {
        calls.push_back("remove_entity:" + unique_id);
        if (fail_key == unique_id)
            return ESP_FAIL;
        entities.erase(unique_id);
        return ESP_OK;
    }

    esp_err_t remove_device(const std::string &device_id) override
    {
        calls.push_back("remove_device:" + device_id);
        if (fail_key == device_id)
            return ESP_FAIL;
        for (auto it = devices.begin(); it != devices.end(); ++it)
        {
            if (it->second.id == device_id)
            {
                devices.erase(it);
                break;
            }
        }
        return ESP_OK;
    }

    esp_err_t update_device_name(const std::string &device_id, const std::string &name) override
    {
        calls.push_back("rename_device:" + device_id + ":" + name);
        if (fail_key == device_id)
            return ESP_FAIL;
        for (auto &d : devices)
        {
            if (d.second.id == device_id)
                d.second.name = name;
        }
        return ESP_OK;
    }

    esp_err_t clear_entity_name_override(const std::string &unique_id) override
    {
        calls.push_back("clear_override:" + unique_id);
        auto it = entities.find(unique_id);
        if (it == entities.end())
            return ESP_ERR_NOT_FOUND;
        it->second.name_override.clear();
        return ESP_OK;
    }

    void add_hub(const std::string &session_id)
    {
        zone::DeviceEntry hub;
        hub.id = "dev_hub";
        hub.identifier = session_id;
        hub.name = "TOMMY Hub";
        devices[hub.identifier] = hub;
    }

    std::vector<std::string> calls;
    std::vector<std::string> publishes;
    std::vector<std::string> released;
    std::vector<zone::ZoneMotionSensor *> sensors_added;
    std::map<std::string, zone::DeviceEntry> devices;
    std::map<std::string, zone::EntityEntry> entities;
    std::string fail_key;
    int add_batches = 0;
};

// In-process transport: messages are delivered synchronously by deliver().
class FakeTransport : public transport::ITransport
{
public:
    esp_err_t connect(const char *host, std::uint16_t port) override
    {
        ++connect_calls;
        last_host = host ? host : "";
        last_port = port;
        if (connect_result == ESP_OK)
            connected = true;
        return connect_result;
    }

    void disconnect() override
    {
        ++disconnect_calls;
        connected = false;
    }

    HandlerId subscribe(transport::Topic topic, MessageHandler handler) override
    {
        HandlerId id = next_id++;
        handlers[static_cast<int>(topic)].push_back(Entry{id, std::move(handler)});
        return id;
    }

    void unsubscribe(transport::Topic topic, HandlerId id) override
    {
        auto &list = handlers[static_cast<int>(topic)];
        for (auto it = list.begin(); it != list.end(); ++it)
        {
            if (it->id == id)
            {
                list.erase(it);
                return;
            }
        }
    }

    void set_connection_handler(ConnectionHandler handler) override { conn = std::move(handler); }
    bool is_connected() const override { return connected; }

    void deliver(transport::Topic topic, const std::string &payload)
    {
        transport::InboundMessage msg{topic, payload};
        // Copy so a handler may stop the service while we iterate.
        const std::vector<Entry> list = handlers[static_cast<int>(topic)];
        for (const auto &e : list)
            (void)e.handler(msg);
    }

    std::size_t handler_count(transport::Topic topic) const
    {
        return handlers[static_cast<int>(topic)].size();
    }

    struct Entry
    {
        HandlerId id;
        MessageHandler handler;
    };

    std::vector<Entry> handlers[transport::kTopicCount];
    ConnectionHandler conn;
    esp_err_t connect_result = ESP_OK;
    bool connected = false;
    int connect_calls = 0;
    int disconnect_calls = 0;
    std::string last_host;
    std::uint16_t last_port = 0;
    HandlerId next_id = 1;
};
