/**
 * @file HijriCalendar.cpp
 * @brief Implementation file.
 */

#include "Modules/PrayerTimesModule/HijriCalendar.h"

#include <stdio.h>

static constexpr int32_t kUnixEpochJdn = 2440588;

static const char* const kMonthNames[12] = {
    "Muharram", "Safar", "Rabi al-Awwal", "Rabi al-Thani",
    "Jumada al-Ula", "Jumada al-Akhirah", "Rajab", "Shaban",
    "Ramadan", "Shawwal", "Dhu al-Qadah", "Dhu al-Hijjah"
};

HijriDate hijriFromCivil(const CivilDate& d)
{
    const int32_t jd = daysFromCivil(d) + kUnixEpochJdn;

    // 30-year cycle arithmetic, Kuwaiti tabular variant.
    int32_t l = jd - 1948440 + 10632;
    const int32_t n = (l - 1) / 10631;
    l = l - 10631 * n + 354;
    const int32_t j = ((10985 - l) / 5316) * ((50 * l) / 17719) + (l / 5670) * ((43 * l) / 15238);
    l = l - ((30 - j) / 15) * ((17719 * j) / 50) - (j / 16) * ((15238 * j) / 43) + 29;
    const int32_t m = (24 * l) / 709;

    HijriDate out;
    out.day = (uint8_t)(l - (709 * m) / 24);
    out.month = (uint8_t)m;
    out.year = (int16_t)(30 * n + j - 30);
    return out;
}

const char* hijriMonthName(uint8_t month)
{
    if (month < 1 || month > 12) return "";
    return kMonthNames[month - 1];
}

bool formatHijri(const HijriDate& h, char* out, size_t len)
{
    if (!out || len == 0) return false;
    if (h.month < 1 || h.month > 12) {
        out[0] = '\0';
        return false;
    }
    const int n = snprintf(out, len, "%u %s %d AH", (unsigned)h.day, hijriMonthName(h.month), (int)h.year);
    return n > 0 && (size_t)n < len;
}
