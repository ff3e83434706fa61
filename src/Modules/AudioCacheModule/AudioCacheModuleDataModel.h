#pragma once
/**
 * @file AudioCacheModuleDataModel.h
 * @brief Audio cache runtime data model contribution.
 */

#include <stdint.h>

constexpr uint8_t AUDIO_RUNTIME_ASSETS = 2;

/** @brief Per-asset cache status. */
struct AudioCacheRuntimeData {
    uint8_t state[AUDIO_RUNTIME_ASSETS] = {0, 0}; // AssetState
    uint32_t bytes[AUDIO_RUNTIME_ASSETS] = {0, 0};
    uint32_t fetchCount = 0;
    uint32_t fetchFailCount = 0;
};
