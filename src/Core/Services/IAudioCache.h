#pragma once
/**
 * @file IAudioCache.h
 * @brief Audio asset cache service interface.
 */
#include <stddef.h>
#include <stdint.h>

enum class AudioAssetId : uint8_t {
    Primary = 0,
    Fajr = 1
};

constexpr uint8_t AUDIO_ASSET_COUNT = 2;

enum class AudioResolve : uint8_t {
    Ready = 0,   // `path` holds the cached file
    Fetching,    // completion is announced by an AssetResolved event for `generation`
    Failed       // no source configured or the request could not be queued
};

/** @brief Non-blocking asset resolution with shared in-flight fetches. */
struct AudioCacheService {
    AudioResolve (*resolve)(void* ctx, AudioAssetId id, uint32_t* generation, char* path, size_t pathLen);
    bool (*hasSource)(void* ctx, AudioAssetId id);
    bool (*invalidate)(void* ctx, AudioAssetId id);
    void* ctx;
};
