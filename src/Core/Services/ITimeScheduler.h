#pragma once
/**
 * @file ITimeScheduler.h
 * @brief "time.scheduler" service: clock-driven trigger slots owned by TimeModule.
 *
 * Slot 0 is the daily 00:00 tick that rolls the timetable over to the new
 * day. AzanModule arms one one-shot slot per prayer from
 * `Limits::Azan::FirstSchedulerSlot` on. A fired slot is announced with
 * EventId::SchedulerEventTriggered carrying `eventId`.
 */
#include <stdint.h>

constexpr uint8_t TIME_SCHED_MAX_SLOTS = 16;
constexpr uint8_t TIME_SCHED_LABEL_MAX = 24;

/** @brief Bit 0 is Monday, bit 6 Sunday. */
constexpr uint8_t TIME_WEEKDAY_ALL = 0x7F;

constexpr uint8_t TIME_SLOT_SYS_DAY_START = 0;
/** @brief Slots below this index refuse setSlot/clearSlot from other modules. */
constexpr uint8_t TIME_SLOT_SYS_RESERVED_COUNT = 1;
constexpr uint16_t TIME_EVENT_SYS_DAY_START = 0xF001;

enum class TimeSchedulerMode : uint8_t {
    RecurringClock = 0, // local hour:minute on the days of weekdayMask
    OneShotEpoch = 1    // fires once at epochSec, then the slot frees itself
};

struct TimeSchedulerSlot {
    uint8_t slot = 0;
    uint16_t eventId = 0;
    bool enabled = true;
    char label[TIME_SCHED_LABEL_MAX] = {0}; // shown by time.scheduler.get

    TimeSchedulerMode mode = TimeSchedulerMode::RecurringClock;

    uint8_t weekdayMask = TIME_WEEKDAY_ALL;
    uint8_t hour = 0;
    uint8_t minute = 0;

    uint64_t epochSec = 0;
};

/** @brief Thread-safe; may be called from any module task. */
struct TimeSchedulerService {
    bool (*setSlot)(void* ctx, const TimeSchedulerSlot* slotDef);
    bool (*getSlot)(void* ctx, uint8_t slot, TimeSchedulerSlot* outDef);
    bool (*clearSlot)(void* ctx, uint8_t slot);
    uint8_t (*usedCount)(void* ctx);
    void* ctx;
};
