#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[32];
};

/** @brief Identifiers for DataStore values. */
using DataKey = uint16_t;

/** @brief Payload for data change events. */
struct DataChangedPayload {
    DataKey id;
};

/** @brief Dirty flags for snapshot payloads. */
enum DirtyFlags : uint32_t {
    DIRTY_NONE    = 0,
    DIRTY_NETWORK = 1 << 0,
    DIRTY_TIME    = 1 << 1,
    DIRTY_MQTT    = 1 << 2,
    DIRTY_AZAN    = 1 << 3,
    DIRTY_AUDIO   = 1 << 4,
};

/** @brief Payload indicating a new data snapshot. */
struct DataSnapshotPayload {
    uint32_t dirtyFlags;
};

/** @brief Edge reported by a time scheduler slot. */
enum class SchedulerEdge : uint8_t {
    Trigger = 0
};

/** @brief Payload for SchedulerEventTriggered events. */
struct SchedulerEventTriggeredPayload {
    uint8_t slot;
    uint8_t edge;       // SchedulerEdge
    uint8_t replayed;   // 1 when fired by the first scan after boot
    uint16_t eventId;
    uint64_t epochSec;  // armed instant for one-shot slots, evaluation time otherwise
};

/** @brief Payload for TimeTableFetched events (one per completed table fetch). */
struct TimeTableFetchedPayload {
    int16_t year;
    uint8_t month;
    uint8_t day;
    uint8_t status;     // TimeTableStatus
};

/** @brief Payload for AssetResolved events (one per completed fetch generation). */
struct AssetResolvedPayload {
    uint8_t assetIdx;
    uint8_t ok;
    uint16_t errorCode; // ErrorCode when !ok
    uint32_t generation;
};

/** @brief Operation carried by a PlaybackCompleted event. */
enum class PlaybackOp : uint8_t {
    Start = 0,
    Stop = 1
};

/** @brief Payload for PlaybackCompleted events. */
struct PlaybackCompletedPayload {
    uint32_t seq;
    uint8_t op;       // PlaybackOp
    uint8_t ok;
    uint16_t errorCode;
    uint32_t handle;
};

/** @brief Payload for AzanStatusChanged events. */
struct AzanStatusChangedPayload {
    uint8_t status;   // AzanStatus
    uint8_t kind;     // PrayerKind of the active request
};
