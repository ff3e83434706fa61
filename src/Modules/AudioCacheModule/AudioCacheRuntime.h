#pragma once
/**
 * @file AudioCacheRuntime.h
 * @brief Audio cache runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

constexpr DataKey DATAKEY_AUDIO_ASSETS = DataKeys::AudioAssets;

static inline uint8_t audioAssetState(const DataStore& ds, uint8_t idx)
{
    return (idx < AUDIO_RUNTIME_ASSETS) ? ds.data().audio.state[idx] : 0;
}

static inline uint32_t audioAssetBytes(const DataStore& ds, uint8_t idx)
{
    return (idx < AUDIO_RUNTIME_ASSETS) ? ds.data().audio.bytes[idx] : 0;
}

static inline uint32_t audioFetchCount(const DataStore& ds) { return ds.data().audio.fetchCount; }
static inline uint32_t audioFetchFailCount(const DataStore& ds) { return ds.data().audio.fetchFailCount; }

static inline void setAudioAsset(DataStore& ds, uint8_t idx, uint8_t state, uint32_t bytes)
{
    if (idx >= AUDIO_RUNTIME_ASSETS) return;
    RuntimeData& rt = ds.dataMutable();
    if (rt.audio.state[idx] == state && rt.audio.bytes[idx] == bytes) return;
    rt.audio.state[idx] = state;
    rt.audio.bytes[idx] = bytes;
    ds.notifyChanged(DATAKEY_AUDIO_ASSETS, DIRTY_AUDIO);
}

static inline void noteAudioFetch(DataStore& ds, bool ok)
{
    RuntimeData& rt = ds.dataMutable();
    ++rt.audio.fetchCount;
    if (!ok) ++rt.audio.fetchFailCount;
    ds.notifyChanged(DATAKEY_AUDIO_ASSETS, DIRTY_AUDIO);
}
