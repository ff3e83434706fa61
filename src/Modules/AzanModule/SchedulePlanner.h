#pragma once
/**
 * @file SchedulePlanner.h
 * @brief Turns time tables into absolute callback instants.
 *
 * Wall times are converted with the process local time zone (`mktime` with
 * DST resolution left to the C library). The signed offset is applied in
 * absolute seconds afterwards, so an instant pushed past midnight belongs to
 * the adjacent civil day.
 */

#include <stdint.h>

#include "Core/SystemLimits.h"
#include "Modules/PrayerTimesModule/TimeTable.h"

struct PlannerConfig {
    int16_t offsetMin = 0;
    bool enabled[PRAYER_SCHEDULED_COUNT] = {true, false, true, true, true, true};
};

struct ScheduleEntry {
    PrayerKind kind = PrayerKind::Fajr;
    int64_t instant = 0;
    bool enabled = false;
    int16_t offsetMin = 0;
};

/** @brief Earliest future instant per kind, plus the same entries sorted by time. */
struct SchedulePlan {
    ScheduleEntry entries[PRAYER_SCHEDULED_COUNT];
    uint8_t count = 0;
    int64_t kindEpoch[PRAYER_SCHEDULED_COUNT] = {0, 0, 0, 0, 0, 0};
    bool dayComplete = false;
};

/** @brief Local wall time of `day` at `minuteOfDay` as a Unix epoch. */
bool localEpochFor(const CivilDate& day, int16_t minuteOfDay, int64_t& out);
/** @brief Local civil date containing `epoch`. */
bool localDateOf(int64_t epoch, CivilDate& out);

/** @brief All entries of `table` (enabled or not) with the offset applied. */
uint8_t buildEntries(const TimeTable& table, const PlannerConfig& cfg, ScheduleEntry* out, uint8_t maxOut);

/** @brief True once `now` is at or past the offset Isha instant of `table`. */
bool isDayComplete(const TimeTable& table, int16_t offsetMin, int64_t now);

/**
 * @brief Builds the armed set for `now`.
 *
 * `previous` contributes entries spilled past midnight, `tomorrow` is only
 * consulted once `today` is complete. Either may be null. Only enabled
 * entries strictly after `now` are kept, one per kind (the earliest).
 */
void planSchedule(const TimeTable* previous,
                  const TimeTable& today,
                  const TimeTable* tomorrow,
                  const PlannerConfig& cfg,
                  int64_t now,
                  SchedulePlan& out);

bool samePlan(const SchedulePlan& a, const SchedulePlan& b);

/** @brief Availability of one table during a refresh pass. */
enum class TableLoad : uint8_t {
    Loaded = 0,
    Pending,
    Failed
};

enum class RefreshAction : uint8_t {
    Plan = 0,  // arm a new plan
    Wait,      // a table fetch is in flight, the armed set stays
    Retry      // a table is unavailable, the armed set stays
};

struct RefreshDecision {
    RefreshAction action = RefreshAction::Retry;
    bool useTomorrow = false;
    uint32_t delayMs = Limits::Azan::RefreshRetryMs;
};

/**
 * @brief Whether tomorrow's table gates the plan.
 *
 * A source without future days plans the rest of a complete day with
 * nothing armed; the day-start refresh picks up the new table.
 */
bool needsTomorrow(bool dayComplete, bool sourceHasFutureDays);

/** @brief Next step of a refresh pass. `tomorrow` is ignored unless `tomorrowNeeded`. */
RefreshDecision decideRefresh(TableLoad today, bool tomorrowNeeded, TableLoad tomorrow);
