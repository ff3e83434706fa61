/**
 * @file TimeTable.cpp
 * @brief Implementation file.
 */

#include "Modules/PrayerTimesModule/TimeTable.h"

#include <ctype.h>
#include <stdio.h>

static const char* const kKindNames[PRAYER_KIND_COUNT] = {
    "Fajr", "Sunrise", "Dhuhr", "Asr", "Maghrib", "Isha", "Test"
};

static const char* const kKindSlugs[PRAYER_KIND_COUNT] = {
    "fajr", "sunrise", "dhuhr", "asr", "maghrib", "isha", "test"
};

const char* prayerKindName(PrayerKind kind)
{
    const uint8_t i = (uint8_t)kind;
    return (i < PRAYER_KIND_COUNT) ? kKindNames[i] : "Unknown";
}

const char* prayerKindSlug(PrayerKind kind)
{
    const uint8_t i = (uint8_t)kind;
    return (i < PRAYER_KIND_COUNT) ? kKindSlugs[i] : "unknown";
}

static bool equalsIgnoreCase(const char* a, const char* b)
{
    while (*a && *b) {
        if (tolower((unsigned char)*a) != tolower((unsigned char)*b)) return false;
        ++a;
        ++b;
    }
    return *a == '\0' && *b == '\0';
}

bool parsePrayerKind(const char* text, PrayerKind& out)
{
    if (!text) return false;
    for (uint8_t i = 0; i < PRAYER_KIND_COUNT; ++i) {
        if (equalsIgnoreCase(text, kKindNames[i])) {
            out = (PrayerKind)i;
            return true;
        }
    }
    return false;
}

bool operator==(const CivilDate& a, const CivilDate& b)
{
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CivilDate& a, const CivilDate& b)
{
    return !(a == b);
}

int32_t daysFromCivil(const CivilDate& d)
{
    int32_t y = d.year;
    const int32_t m = d.month;
    y -= (m <= 2) ? 1 : 0;
    const int32_t era = (y >= 0 ? y : y - 399) / 400;
    const int32_t yoe = y - era * 400;
    const int32_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + (int32_t)d.day - 1;
    const int32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(int32_t days)
{
    days += 719468;
    const int32_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int32_t doe = days - era * 146097;
    const int32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int32_t mp = (5 * doy + 2) / 153;
    const int32_t d = doy - (153 * mp + 2) / 5 + 1;
    const int32_t m = mp + (mp < 10 ? 3 : -9);

    CivilDate out;
    out.year = (int16_t)(yoe + era * 400 + (m <= 2 ? 1 : 0));
    out.month = (uint8_t)m;
    out.day = (uint8_t)d;
    return out;
}

CivilDate civilDateAddDays(const CivilDate& d, int32_t delta)
{
    return civilFromDays(daysFromCivil(d) + delta);
}

bool civilDateValid(const CivilDate& d)
{
    if (d.month < 1 || d.month > 12 || d.day < 1) return false;
    return civilFromDays(daysFromCivil(d)) == d;
}

bool formatCivilDate(const CivilDate& d, char* out, size_t len)
{
    if (!out || len == 0) return false;
    const int n = snprintf(out, len, "%04d-%02u-%02u", (int)d.year, (unsigned)d.month, (unsigned)d.day);
    return n > 0 && (size_t)n < len;
}

const char* timeTableStatusStr(TimeTableStatus st)
{
    switch (st) {
    case TimeTableStatus::Ok: return "Ok";
    case TimeTableStatus::SourceUnavailable: return "SourceUnavailable";
    case TimeTableStatus::ParseError: return "ParseError";
    case TimeTableStatus::DataQuality: return "DataQuality";
    default: return "Unknown";
    }
}

bool parseHhMm(const char* text, int16_t& minuteOfDay)
{
    if (!text) return false;
    while (*text == ' ') ++text;

    int hh = 0;
    int digits = 0;
    while (isdigit((unsigned char)*text) && digits < 2) {
        hh = hh * 10 + (*text - '0');
        ++text;
        ++digits;
    }
    if (digits == 0 || *text != ':') return false;
    ++text;

    if (!isdigit((unsigned char)text[0]) || !isdigit((unsigned char)text[1])) return false;
    const int mm = (text[0] - '0') * 10 + (text[1] - '0');
    text += 2;

    // Trailing text is only accepted after a separator, e.g. "05:12 (CET)".
    if (*text != '\0' && *text != ' ') return false;
    if (hh > 23 || mm > 59) return false;

    minuteOfDay = (int16_t)(hh * 60 + mm);
    return true;
}

bool formatHhMm(int16_t minuteOfDay, char* out, size_t len)
{
    if (!out || len == 0) return false;
    if (minuteOfDay < 0 || minuteOfDay >= 24 * 60) {
        out[0] = '\0';
        return false;
    }
    const int n = snprintf(out, len, "%02d:%02d", minuteOfDay / 60, minuteOfDay % 60);
    return n > 0 && (size_t)n < len;
}

TimeTableStatus validateTimeTable(TimeTable& table)
{
    table.valid = false;
    if (!civilDateValid(table.day)) return TimeTableStatus::DataQuality;

    int16_t prev = 0;
    for (uint8_t i = 0; i < PRAYER_SCHEDULED_COUNT; ++i) {
        const int16_t m = table.minuteOfDay[i];
        if (m < 0 || m >= 24 * 60) return TimeTableStatus::DataQuality;
        if (m < prev) return TimeTableStatus::DataQuality;
        prev = m;
    }
    table.valid = true;
    return TimeTableStatus::Ok;
}
