#pragma once
/**
 * @file ITime.h
 * @brief Wall clock service.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief SNTP state of `TimeModule`. Prayer instants are only armed once Synced. */
enum class TimeSyncState : uint8_t { Disabled, WaitingNetwork, Syncing, Synced, ErrorWait };

/**
 * @brief Read-only view of the wall clock.
 *
 * `formatLocalTime` uses the configured POSIX TZ, e.g. `2026-03-29 05:00:00`.
 */
struct TimeService {
    bool (*isSynced)(void* ctx);
    bool (*formatLocalTime)(void* ctx, char* out, size_t len);
    void* ctx;
};
