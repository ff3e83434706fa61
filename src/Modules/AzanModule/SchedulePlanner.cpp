/**
 * @file SchedulePlanner.cpp
 * @brief Implementation file.
 */

#include "Modules/AzanModule/SchedulePlanner.h"

#include <time.h>

bool localEpochFor(const CivilDate& day, int16_t minuteOfDay, int64_t& out)
{
    if (!civilDateValid(day)) return false;
    if (minuteOfDay < 0 || minuteOfDay >= 24 * 60) return false;

    struct tm tmv = {};
    tmv.tm_year = (int)day.year - 1900;
    tmv.tm_mon = (int)day.month - 1;
    tmv.tm_mday = (int)day.day;
    tmv.tm_hour = minuteOfDay / 60;
    tmv.tm_min = minuteOfDay % 60;
    tmv.tm_sec = 0;
    tmv.tm_isdst = -1;

    const time_t t = mktime(&tmv);
    if (t == (time_t)-1) return false;
    out = (int64_t)t;
    return true;
}

bool localDateOf(int64_t epoch, CivilDate& out)
{
    const time_t t = (time_t)epoch;
    struct tm tmv = {};
    if (!localtime_r(&t, &tmv)) return false;
    out.year = (int16_t)(tmv.tm_year + 1900);
    out.month = (uint8_t)(tmv.tm_mon + 1);
    out.day = (uint8_t)tmv.tm_mday;
    return true;
}

uint8_t buildEntries(const TimeTable& table, const PlannerConfig& cfg, ScheduleEntry* out, uint8_t maxOut)
{
    if (!out || !table.valid) return 0;
    uint8_t n = 0;
    for (uint8_t i = 0; i < PRAYER_SCHEDULED_COUNT && n < maxOut; ++i) {
        int64_t wall = 0;
        if (!localEpochFor(table.day, table.minuteOfDay[i], wall)) continue;
        ScheduleEntry& e = out[n++];
        e.kind = (PrayerKind)i;
        e.instant = wall + (int64_t)cfg.offsetMin * 60;
        e.enabled = cfg.enabled[i];
        e.offsetMin = cfg.offsetMin;
    }
    return n;
}

bool isDayComplete(const TimeTable& table, int16_t offsetMin, int64_t now)
{
    if (!table.valid) return false;
    int64_t isha = 0;
    if (!localEpochFor(table.day, table.minuteOfDay[(uint8_t)PrayerKind::Isha], isha)) return false;
    return now >= isha + (int64_t)offsetMin * 60;
}

static void mergeTable(const TimeTable* table, const PlannerConfig& cfg, int64_t now, SchedulePlan& out)
{
    if (!table || !table->valid) return;
    ScheduleEntry entries[PRAYER_SCHEDULED_COUNT];
    const uint8_t n = buildEntries(*table, cfg, entries, PRAYER_SCHEDULED_COUNT);
    for (uint8_t i = 0; i < n; ++i) {
        const ScheduleEntry& e = entries[i];
        if (!e.enabled || e.instant <= now) continue;
        int64_t& slot = out.kindEpoch[(uint8_t)e.kind];
        if (slot == 0 || e.instant < slot) slot = e.instant;
    }
}

void planSchedule(const TimeTable* previous,
                  const TimeTable& today,
                  const TimeTable* tomorrow,
                  const PlannerConfig& cfg,
                  int64_t now,
                  SchedulePlan& out)
{
    out = SchedulePlan{};
    out.dayComplete = isDayComplete(today, cfg.offsetMin, now);

    mergeTable(previous, cfg, now, out);
    mergeTable(&today, cfg, now, out);
    if (out.dayComplete) mergeTable(tomorrow, cfg, now, out);

    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        if (out.kindEpoch[k] == 0) continue;
        ScheduleEntry e;
        e.kind = (PrayerKind)k;
        e.instant = out.kindEpoch[k];
        e.enabled = true;
        e.offsetMin = cfg.offsetMin;

        // Insertion keeps entries sorted by instant, ties by kind order.
        uint8_t pos = out.count;
        while (pos > 0 && out.entries[pos - 1].instant > e.instant) {
            out.entries[pos] = out.entries[pos - 1];
            --pos;
        }
        out.entries[pos] = e;
        ++out.count;
    }
}

bool samePlan(const SchedulePlan& a, const SchedulePlan& b)
{
    if (a.count != b.count) return false;
    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        if (a.kindEpoch[k] != b.kindEpoch[k]) return false;
    }
    return true;
}

bool needsTomorrow(bool dayComplete, bool sourceHasFutureDays)
{
    return dayComplete && sourceHasFutureDays;
}

RefreshDecision decideRefresh(TableLoad today, bool tomorrowNeeded, TableLoad tomorrow)
{
    RefreshDecision d;
    const TableLoad gate = (today == TableLoad::Loaded && tomorrowNeeded) ? tomorrow : today;
    switch (gate) {
    case TableLoad::Loaded:
        d.action = RefreshAction::Plan;
        d.useTomorrow = tomorrowNeeded;
        d.delayMs = Limits::Azan::RefreshPeriodMs;
        break;
    case TableLoad::Pending:
        d.action = RefreshAction::Wait;
        d.delayMs = Limits::Azan::RefreshWaitMs;
        break;
    case TableLoad::Failed:
    default:
        d.action = RefreshAction::Retry;
        d.delayMs = Limits::Azan::RefreshRetryMs;
        break;
    }
    return d;
}
