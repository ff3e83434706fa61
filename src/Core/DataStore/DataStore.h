#pragma once
/**
 * @file DataStore.h
 * @brief Runtime data store with EventBus notifications.
 */
#include <stdint.h>
#include <string.h>

#include "Core/DataModel.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventId.h"
#include "Core/EventBus/EventPayloads.h"

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

/**
 * @brief Shared `RuntimeData` written by module tasks and read by publishers.
 *
 * Each field group has a single writer (its module). Writers that update
 * several fields at once, and readers that need a coherent copy (the azan
 * state JSON), hold a `ScopedLock`.
 */
class DataStore {
public:
    DataStore();

    void setEventBus(EventBus* bus) { _bus = bus; }

    const RuntimeData& data() const { return _rt; }
    /** @brief Writer access, reserved to the `<Module>Runtime.h` setters. */
    RuntimeData& dataMutable() { return _rt; }

    /**
     * @brief Posts `DataChanged{key}` then `DataSnapshotAvailable{dirtyMask}`.
     *
     * The snapshot mask only carries this change so MQTT republishes the
     * matching topics and nothing else.
     */
    void notifyChanged(DataKey key, uint32_t dirtyMask);

    class ScopedLock {
    public:
        explicit ScopedLock(const DataStore& ds);
        ~ScopedLock();
        ScopedLock(const ScopedLock&) = delete;
        ScopedLock& operator=(const ScopedLock&) = delete;

    private:
        SemaphoreHandle_t _mutex;
        bool _held;
    };

private:
    RuntimeData _rt{};
    EventBus* _bus = nullptr;
    SemaphoreHandle_t _mutex = nullptr;
};
