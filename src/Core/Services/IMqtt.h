#pragma once
/**
 * @file IMqtt.h
 * @brief MQTT publish service used by discovery.
 */
#include <stddef.h>

/**
 * @brief Publishing side of `MQTTModule`.
 *
 * `formatTopic` expands a suffix such as `rt/azan/state` under
 * `<base>/<deviceId>/`. `publish` returns false while disconnected.
 */
struct MqttService {
    bool (*publish)(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    void (*formatTopic)(void* ctx, const char* suffix, char* out, size_t outLen);
    bool (*isConnected)(void* ctx);
    void* ctx;
};
