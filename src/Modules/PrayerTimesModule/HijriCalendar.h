#pragma once
/**
 * @file HijriCalendar.h
 * @brief Tabular Islamic calendar conversion (civil epoch).
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/PrayerTimesModule/TimeTable.h"

struct HijriDate {
    int16_t year = 0;
    uint8_t month = 0;   // 1..12
    uint8_t day = 0;     // 1..30
};

HijriDate hijriFromCivil(const CivilDate& d);
const char* hijriMonthName(uint8_t month);
/** @brief Writes `<day> <month name> <year> AH`. */
bool formatHijri(const HijriDate& h, char* out, size_t len);
