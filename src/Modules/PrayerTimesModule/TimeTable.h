#pragma once
/**
 * @file TimeTable.h
 * @brief Daily prayer time table, prayer kinds and civil date helpers.
 */

#include <stddef.h>
#include <stdint.h>

/** @brief Daily event kinds in canonical order. `Test` is never scheduled. */
enum class PrayerKind : uint8_t {
    Fajr = 0,
    Sunrise,
    Dhuhr,
    Asr,
    Maghrib,
    Isha,
    Test
};

constexpr uint8_t PRAYER_KIND_COUNT = 7;
/** @brief Number of kinds carried by a time table (all except Test). */
constexpr uint8_t PRAYER_SCHEDULED_COUNT = 6;

const char* prayerKindName(PrayerKind kind);
/** @brief Lowercase identifier used for config keys, topics and HA object ids. */
const char* prayerKindSlug(PrayerKind kind);
/** @brief Case-insensitive lookup by name. Returns false for unknown text. */
bool parsePrayerKind(const char* text, PrayerKind& out);

struct CivilDate {
    int16_t year = 1970;
    uint8_t month = 1;
    uint8_t day = 1;
};

bool operator==(const CivilDate& a, const CivilDate& b);
bool operator!=(const CivilDate& a, const CivilDate& b);

/** @brief Days since 1970-01-01 in the proleptic Gregorian calendar. */
int32_t daysFromCivil(const CivilDate& d);
CivilDate civilFromDays(int32_t days);
CivilDate civilDateAddDays(const CivilDate& d, int32_t delta);
bool civilDateValid(const CivilDate& d);
/** @brief Writes `YYYY-MM-DD`. */
bool formatCivilDate(const CivilDate& d, char* out, size_t len);

enum class TimeTableStatus : uint8_t {
    Ok = 0,
    SourceUnavailable,
    ParseError,
    DataQuality
};

const char* timeTableStatusStr(TimeTableStatus st);

constexpr int16_t TIMETABLE_MINUTE_UNSET = -1;
constexpr uint8_t TIMETABLE_SOURCE_MAX = 12;
constexpr uint8_t TIMETABLE_HIJRI_MAX = 40;

/** @brief Minute-of-day per kind for one civil day. */
struct TimeTable {
    CivilDate day{};
    int16_t minuteOfDay[PRAYER_SCHEDULED_COUNT] = {
        TIMETABLE_MINUTE_UNSET, TIMETABLE_MINUTE_UNSET, TIMETABLE_MINUTE_UNSET,
        TIMETABLE_MINUTE_UNSET, TIMETABLE_MINUTE_UNSET, TIMETABLE_MINUTE_UNSET
    };
    char source[TIMETABLE_SOURCE_MAX] = {0};
    char hijri[TIMETABLE_HIJRI_MAX] = {0};
    bool valid = false;
};

/**
 * @brief Parses `HH:MM` with optional trailing text such as ` (CET)`.
 * @return false when the text is not a 24h wall time.
 */
bool parseHhMm(const char* text, int16_t& minuteOfDay);
bool formatHhMm(int16_t minuteOfDay, char* out, size_t len);

/**
 * @brief Checks every kind is present, in range and non-decreasing.
 * @return `Ok` or `DataQuality`. Sets `valid` accordingly.
 */
TimeTableStatus validateTimeTable(TimeTable& table);
