#pragma once
/**
 * @file TimeRuntime.h
 * @brief Time runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

constexpr DataKey DATAKEY_TIME_READY = DataKeys::TimeReady;

static inline bool timeReady(const DataStore& ds)
{
    return ds.data().time.timeReady;
}

static inline uint32_t timeSyncCount(const DataStore& ds)
{
    return ds.data().time.syncCount;
}

/** @brief `nowEpoch` is recorded as the last sync instant on a not-ready to ready edge. */
static inline void setTimeReady(DataStore& ds, bool ready, uint64_t nowEpoch)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.time.timeReady == ready) return;
    rt.time.timeReady = ready;
    if (ready) {
        ++rt.time.syncCount;
        rt.time.lastSyncEpoch = nowEpoch;
    }
    ds.notifyChanged(DATAKEY_TIME_READY, DIRTY_TIME);
}
