/**
 * @file TimeTableParsers.cpp
 * @brief Implementation file.
 */

#include "Modules/PrayerTimesModule/TimeTableParsers.h"
#include "Modules/PrayerTimesModule/HijriCalendar.h"
#include "Core/SystemLimits.h"

#include <ArduinoJson.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static void copyText(char* dst, size_t dstLen, const char* src)
{
    if (!dst || dstLen == 0) return;
    if (!src) src = "";
    snprintf(dst, dstLen, "%s", src);
}

// Accepts "DD-MM-YYYY" as echoed by the calculation API.
static bool parseDmy(const char* text, CivilDate& out)
{
    if (!text) return false;
    int d = 0, m = 0, y = 0;
    if (sscanf(text, "%2d-%2d-%4d", &d, &m, &y) != 3) return false;
    out.year = (int16_t)y;
    out.month = (uint8_t)m;
    out.day = (uint8_t)d;
    return civilDateValid(out);
}

TimeTableStatus parseAladhanTimings(const char* body, size_t len, const CivilDate& day, TimeTable& out)
{
    out = TimeTable{};
    out.day = day;
    copyText(out.source, sizeof(out.source), "aladhan");
    if (!body || len == 0) return TimeTableStatus::ParseError;

    StaticJsonDocument<256> filter;
    filter["data"]["timings"] = true;
    filter["data"]["date"]["gregorian"]["date"] = true;
    filter["data"]["date"]["hijri"]["day"] = true;
    filter["data"]["date"]["hijri"]["month"]["en"] = true;
    filter["data"]["date"]["hijri"]["year"] = true;

    static StaticJsonDocument<Limits::Prayer::JsonTimingsBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, body, len, DeserializationOption::Filter(filter));
    if (err) return TimeTableStatus::ParseError;

    JsonObjectConst data = doc["data"];
    JsonObjectConst timings = data["timings"];
    if (data.isNull() || timings.isNull()) return TimeTableStatus::ParseError;

    const char* echoed = data["date"]["gregorian"]["date"].as<const char*>();
    if (echoed) {
        CivilDate echoDay;
        if (!parseDmy(echoed, echoDay) || echoDay != day) return TimeTableStatus::ParseError;
    }

    for (uint8_t i = 0; i < PRAYER_SCHEDULED_COUNT; ++i) {
        const char* v = timings[prayerKindName((PrayerKind)i)].as<const char*>();
        // A missing kind is a data quality failure, a malformed one is a parse failure.
        if (!v) continue;
        if (!parseHhMm(v, out.minuteOfDay[i])) return TimeTableStatus::ParseError;
    }

    JsonObjectConst hijri = data["date"]["hijri"];
    const char* hDay = hijri["day"] | "";
    const char* hMonth = hijri["month"]["en"] | "";
    const char* hYear = hijri["year"] | "";
    if (hDay[0] != '\0' && hMonth[0] != '\0' && hYear[0] != '\0') {
        snprintf(out.hijri, sizeof(out.hijri), "%d %s %s AH", atoi(hDay), hMonth, hYear);
    }

    return validateTimeTable(out);
}

static const char* findBounded(const char* hay, const char* end, const char* needle)
{
    const size_t n = strlen(needle);
    if (n == 0 || hay >= end) return nullptr;
    for (const char* p = hay; p + n <= end; ++p) {
        if (memcmp(p, needle, n) == 0) return p;
    }
    return nullptr;
}

// Reads the next quoted "HH:MM" at or after `p`, stopping at `end`.
static const char* readQuotedTime(const char* p, const char* end, int16_t& minute)
{
    while (p < end && *p != '"') {
        if (*p == ']') return nullptr;
        ++p;
    }
    if (p >= end) return nullptr;
    ++p;

    char buf[8] = {0};
    size_t n = 0;
    while (p < end && *p != '"' && n < sizeof(buf) - 1) buf[n++] = *p++;
    if (p >= end || *p != '"') return nullptr;
    if (!parseHhMm(buf, minute)) return nullptr;
    return p + 1;
}

TimeTableStatus parsePortalTimes(const char* body, size_t len, const CivilDate& day, TimeTable& out)
{
    static const PrayerKind kTimesOrder[5] = {
        PrayerKind::Fajr, PrayerKind::Dhuhr, PrayerKind::Asr, PrayerKind::Maghrib, PrayerKind::Isha
    };

    out = TimeTable{};
    out.day = day;
    copyText(out.source, sizeof(out.source), "portal");
    if (!body || len == 0) return TimeTableStatus::ParseError;
    const char* end = body + len;

    const char* times = findBounded(body, end, "\"times\":[");
    if (!times) return TimeTableStatus::ParseError;
    const char* p = times + strlen("\"times\":[");
    for (uint8_t i = 0; i < 5; ++i) {
        int16_t minute = TIMETABLE_MINUTE_UNSET;
        p = readQuotedTime(p, end, minute);
        if (!p) return TimeTableStatus::ParseError;
        out.minuteOfDay[(uint8_t)kTimesOrder[i]] = minute;
    }

    const char* shuruq = findBounded(body, end, "\"shuruq\":");
    if (shuruq) {
        int16_t minute = TIMETABLE_MINUTE_UNSET;
        if (!readQuotedTime(shuruq + strlen("\"shuruq\":"), end, minute)) return TimeTableStatus::ParseError;
        out.minuteOfDay[(uint8_t)PrayerKind::Sunrise] = minute;
    }

    return validateTimeTable(out);
}

void fillHijriIfMissing(TimeTable& table)
{
    if (table.hijri[0] != '\0') return;
    if (!civilDateValid(table.day)) return;
    (void)formatHijri(hijriFromCivil(table.day), table.hijri, sizeof(table.hijri));
}
