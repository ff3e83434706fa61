#pragma once
/**
 * @file TimeTableSource.h
 * @brief Remote time table sources.
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/PrayerTimesModule/TimeTable.h"

/** @brief Prayer time source configuration values. */
struct PrayerConfig {
    char source[12] = "aladhan";
    char apiBase[64] = "https://api.aladhan.com";
    float latitude = 48.8566f;
    float longitude = 2.3522f;
    int32_t method = 12;
    int32_t school = 0;
    char portalUrl[128] = "";
};

/** @brief Shared body buffer handed to sources by the owner. */
struct SourceBuffer {
    char* data;
    size_t cap;
};

class TimeTableSource {
public:
    virtual ~TimeTableSource() = default;
    virtual const char* name() const = 0;
    /** @brief Fetches and parses the table of `day`. No retries. */
    virtual TimeTableStatus fetch(const CivilDate& day, TimeTable& out) = 0;
    /** @brief False when only today's table can be fetched. */
    virtual bool providesFutureDays() const { return true; }
};

/** @brief Calculation API (`/v1/timings/DD-MM-YYYY`). */
class AladhanSource : public TimeTableSource {
public:
    AladhanSource(const PrayerConfig& cfg, SourceBuffer buf) : cfg_(cfg), buf_(buf) {}
    const char* name() const override { return "aladhan"; }
    TimeTableStatus fetch(const CivilDate& day, TimeTable& out) override;

    /** @brief Builds the request URL for `day`. */
    static bool buildUrl(const PrayerConfig& cfg, const CivilDate& day, char* out, size_t len);

private:
    const PrayerConfig& cfg_;
    SourceBuffer buf_;
};

/** @brief Mosque portal page. Only today's times are published. */
class PortalSource : public TimeTableSource {
public:
    PortalSource(const PrayerConfig& cfg, SourceBuffer buf) : cfg_(cfg), buf_(buf) {}
    const char* name() const override { return "portal"; }
    TimeTableStatus fetch(const CivilDate& day, TimeTable& out) override;
    bool providesFutureDays() const override { return false; }

private:
    const PrayerConfig& cfg_;
    SourceBuffer buf_;
};
