#pragma once
/**
 * @file TimeTableParsers.h
 * @brief Body parsers for the calculation API and the mosque portal page.
 */

#include <stddef.h>

#include "Modules/PrayerTimesModule/TimeTable.h"

/**
 * @brief Parses a calculation API `timings` response for `day`.
 *
 * Reads `data.timings.{Fajr..Isha}`, the gregorian date echo and the hijri
 * date. A gregorian echo that does not match `day` is a parse error.
 */
TimeTableStatus parseAladhanTimings(const char* body, size_t len, const CivilDate& day, TimeTable& out);

/**
 * @brief Extracts today's times from a mosque portal page.
 *
 * The page embeds `"times":["HH:MM" x5]` (Fajr, Dhuhr, Asr, Maghrib, Isha)
 * and `"shuruq":"HH:MM"` for sunrise.
 */
TimeTableStatus parsePortalTimes(const char* body, size_t len, const CivilDate& day, TimeTable& out);

/** @brief Fills `hijri` from the tabular calendar when the source left it empty. */
void fillHijriIfMissing(TimeTable& table);
