#pragma once
/**
 * @file AzanRuntime.h
 * @brief Azan runtime helpers and keys.
 */

#include <stdio.h>
#include <string.h>

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

constexpr DataKey DATAKEY_AZAN_STATUS = DataKeys::AzanStatus;
constexpr DataKey DATAKEY_AZAN_NEXT = DataKeys::AzanNext;
constexpr DataKey DATAKEY_AZAN_SCHEDULE = DataKeys::AzanSchedule;
constexpr DataKey DATAKEY_AZAN_TABLE = DataKeys::AzanTable;
constexpr DataKey DATAKEY_AZAN_LAST_ERROR = DataKeys::AzanLastError;

/** @brief Coherent copy for serializers running on other tasks. */
static inline AzanRuntimeData azanSnapshot(const DataStore& ds)
{
    DataStore::ScopedLock lock(ds);
    return ds.data().azan;
}

static inline void setAzanStatus(DataStore& ds, uint8_t status, uint8_t activeKind)
{
    DataStore::ScopedLock lock(ds);
    RuntimeData& rt = ds.dataMutable();
    if (rt.azan.status == status && rt.azan.activeKind == activeKind) return;
    rt.azan.status = status;
    rt.azan.activeKind = activeKind;
    ds.notifyChanged(DATAKEY_AZAN_STATUS, DIRTY_AZAN);
}

/** @brief Stores the armed instants (0 = not armed) and derives the next entry. */
static inline void setAzanSchedule(DataStore& ds, const uint64_t* kindEpoch)
{
    DataStore::ScopedLock lock(ds);
    RuntimeData& rt = ds.dataMutable();
    uint8_t nextKind = AZAN_KIND_NONE;
    uint64_t nextEpoch = 0;
    bool changed = false;
    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        const uint64_t e = kindEpoch ? kindEpoch[k] : 0;
        if (rt.azan.kindEpoch[k] != e) {
            rt.azan.kindEpoch[k] = e;
            changed = true;
        }
        if (e != 0 && (nextEpoch == 0 || e < nextEpoch)) {
            nextEpoch = e;
            nextKind = k;
        }
    }
    if (changed) ds.notifyChanged(DATAKEY_AZAN_SCHEDULE, DIRTY_AZAN);
    if (rt.azan.nextKind != nextKind || rt.azan.nextEpoch != nextEpoch) {
        rt.azan.nextKind = nextKind;
        rt.azan.nextEpoch = nextEpoch;
        ds.notifyChanged(DATAKEY_AZAN_NEXT, DIRTY_AZAN);
    }
}

static inline void setAzanTable(DataStore& ds, const TimeTable& table)
{
    DataStore::ScopedLock lock(ds);
    RuntimeData& rt = ds.dataMutable();
    ++rt.azan.refreshCount;
    if (rt.azan.tableValid && rt.azan.tableDay == table.day &&
        strcmp(rt.azan.hijri, table.hijri) == 0 && strcmp(rt.azan.source, table.source) == 0) {
        return;
    }
    rt.azan.tableDay = table.day;
    rt.azan.tableValid = table.valid;
    snprintf(rt.azan.source, sizeof(rt.azan.source), "%s", table.source);
    snprintf(rt.azan.hijri, sizeof(rt.azan.hijri), "%s", table.hijri);
    ds.notifyChanged(DATAKEY_AZAN_TABLE, DIRTY_AZAN);
}

static inline void noteAzanRefreshFailure(DataStore& ds)
{
    DataStore::ScopedLock lock(ds);
    ++ds.dataMutable().azan.refreshFailCount;
}

static inline void setAzanLastError(DataStore& ds, uint16_t code)
{
    DataStore::ScopedLock lock(ds);
    RuntimeData& rt = ds.dataMutable();
    if (rt.azan.lastError == code) return;
    rt.azan.lastError = code;
    ds.notifyChanged(DATAKEY_AZAN_LAST_ERROR, DIRTY_AZAN);
}
