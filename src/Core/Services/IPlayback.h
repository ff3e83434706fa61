#pragma once
/**
 * @file IPlayback.h
 * @brief Playback driver service interface.
 */
#include <stdint.h>

/**
 * @brief Queues backend start/stop operations.
 *
 * Both calls return immediately. The outcome is published as a
 * PlaybackCompleted event carrying the same `seq`.
 */
struct PlaybackService {
    bool (*requestStart)(void* ctx, uint32_t seq, const char* localPath);
    bool (*requestStop)(void* ctx, uint32_t seq, uint32_t handle);
    const char* (*backendName)(void* ctx);
    void* ctx;
};
