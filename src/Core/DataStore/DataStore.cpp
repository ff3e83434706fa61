/**
 * @file DataStore.cpp
 * @brief Implementation file.
 */
#include "Core/DataStore/DataStore.h"

DataStore::DataStore()
{
    _mutex = xSemaphoreCreateRecursiveMutex();
}

DataStore::ScopedLock::ScopedLock(const DataStore& ds)
    : _mutex(ds._mutex), _held(false)
{
    if (_mutex) _held = (xSemaphoreTakeRecursive(_mutex, portMAX_DELAY) == pdTRUE);
}

DataStore::ScopedLock::~ScopedLock()
{
    if (_held) xSemaphoreGiveRecursive(_mutex);
}

void DataStore::notifyChanged(DataKey key, uint32_t dirtyMask)
{
    if (!_bus) return;

    DataChangedPayload changed{ key };
    (void)_bus->post(EventId::DataChanged, &changed, sizeof(changed));
    if (dirtyMask == DIRTY_NONE) return;

    DataSnapshotPayload snap{ dirtyMask };
    (void)_bus->post(EventId::DataSnapshotAvailable, &snap, sizeof(snap));
}
