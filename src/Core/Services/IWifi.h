#pragma once
/**
 * @file IWifi.h
 * @brief Station link service.
 */
#include <stdint.h>
#include <stddef.h>

enum class WifiState : uint8_t {
    Disabled,
    Idle,
    Connecting,
    Connected,
    ErrorWait
};

/**
 * @brief Link status for modules doing HTTP.
 *
 * `getIP` fills a dotted quad; the playback driver puts it in media URLs
 * when no media base is configured.
 */
struct WifiService {
    bool (*isConnected)(void* ctx);
    bool (*getIP)(void* ctx, char* out, size_t len);
    void* ctx;
};
