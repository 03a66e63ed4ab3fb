#pragma once

// Default configuration for the TOMMY zone bridge.
// Values stored in NVS (config_store) take precedence over these.

// Broker host; empty means "not configured" and startup fails until set.
#ifndef TOMMY_MQTT_HOST
#define TOMMY_MQTT_HOST ""
#endif

#ifndef TOMMY_MQTT_PORT
#define TOMMY_MQTT_PORT 1886
#endif

// Identifier of this hub/config session. Zone devices and entities derive
// their identifiers from it.
#ifndef TOMMY_SESSION_ID
#define TOMMY_SESSION_ID "tommy_hub"
#endif

#ifndef TOMMY_HUB_NAME
#define TOMMY_HUB_NAME "TOMMY Hub"
#endif

// Topics published by the TOMMY device
#define TOMMY_TOPIC_ZONE_CONFIG "/topic/zone-config"
#define TOMMY_TOPIC_ZONE_STATE "/topic/zone-state"

#ifndef TOMMY_MQTT_KEEPALIVE_S
#define TOMMY_MQTT_KEEPALIVE_S 60
#endif

// Reconnect backoff bounds (seconds), doubled after every failed attempt
#define TOMMY_MQTT_RECONNECT_MIN_S 1
#define TOMMY_MQTT_RECONNECT_MAX_S 120

// How long connect() waits for the first CONNECTED event
#define TOMMY_MQTT_CONNECT_WAIT_MS 1000

// Largest payload accepted from the broker (reassembled across fragments)
#define TOMMY_MQTT_MAX_PAYLOAD 16384

// Consumer work queue
#define TOMMY_WORK_QUEUE_DEPTH 16
#define TOMMY_WORK_QUEUE_STACK 6144
#define TOMMY_WORK_QUEUE_PRIO 5
