#pragma once
/**
 * @file IPrayerTimes.h
 * @brief Prayer time table provider service interface.
 */
#include "Modules/PrayerTimesModule/TimeTable.h"

/** @brief Outcome of a table request. */
enum class TimeTableFetch : uint8_t {
    Ready = 0,  // `out` holds the table of the requested day
    Pending,    // fetch queued or in flight, TimeTableFetched follows
    Failed      // `st` holds the reason
};

/**
 * @brief Non-blocking access to the table of one civil day.
 *
 * request() hands out a result completed within `maxAgeMs`. Otherwise it
 * queues one fetch on the provider task and returns Pending. Each completed
 * fetch is announced with `EventId::TimeTableFetched`. A failed result is
 * handed out once, the next request fetches again. Fetches never retry;
 * callers own the retry policy.
 */
struct PrayerTimesService {
    TimeTableFetch (*request)(void* ctx, const CivilDate* day, uint32_t maxAgeMs,
                              TimeTable* out, TimeTableStatus* st);
    bool (*providesFutureDays)(void* ctx);
    const char* (*sourceName)(void* ctx);
    void* ctx;
};
