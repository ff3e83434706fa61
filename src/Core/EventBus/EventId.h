#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // DataStore (runtime model changes)
    DataChanged = 50,
    DataSnapshotAvailable = 51,

    // Configuration
    ConfigChanged = 100,

    // Time scheduler
    SchedulerEventTriggered = 420,

    // Azan engine
    TimeTableFetched = 490,
    AssetResolved = 500,
    PlaybackCompleted = 510,
    AzanStatusChanged = 520,
};
