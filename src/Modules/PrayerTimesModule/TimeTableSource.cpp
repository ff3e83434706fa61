/**
 * @file TimeTableSource.cpp
 * @brief Implementation file.
 */

#include "Modules/PrayerTimesModule/TimeTableSource.h"
#include "Modules/PrayerTimesModule/TimeTableParsers.h"
#include "Core/HttpSession.h"
#include "Core/SystemLimits.h"
#include <time.h>
#include <stdio.h>
#include <string.h>

#define LOG_TAG "PrayerSr"
#include "Core/ModuleLog.h"

static bool localToday(CivilDate& out)
{
    const time_t now = time(nullptr);
    struct tm local{};
    if (!localtime_r(&now, &local)) return false;
    out.year = (int16_t)(local.tm_year + 1900);
    out.month = (uint8_t)(local.tm_mon + 1);
    out.day = (uint8_t)local.tm_mday;
    return true;
}

// Transport and HTTP status failures are SourceUnavailable.
static bool fetchBody(const char* url, const SourceBuffer& buf, size_t& len)
{
    len = 0;
    HttpSession session;
    if (!session.begin(url, Limits::Prayer::HttpTimeoutMs)) {
        LOGW("http begin failed url=%s", url);
        return false;
    }
    const int code = session.client().GET();
    if (code != HTTP_CODE_OK) {
        LOGW("http %d url=%s", code, url);
        return false;
    }
    bool truncated = false;
    if (!session.readBody(buf.data, buf.cap, len, truncated, Limits::Prayer::HttpTimeoutMs)) {
        LOGW("body read failed url=%s got=%u", url, (unsigned)len);
        return false;
    }
    if (truncated) {
        LOGD("body truncated at %u bytes url=%s", (unsigned)len, url);
    }
    return true;
}

bool AladhanSource::buildUrl(const PrayerConfig& cfg, const CivilDate& day, char* out, size_t len)
{
    if (!out || len == 0 || cfg.apiBase[0] == '\0') return false;
    size_t baseLen = strlen(cfg.apiBase);
    while (baseLen > 0 && cfg.apiBase[baseLen - 1] == '/') --baseLen;
    const int n = snprintf(out, len,
                           "%.*s/v1/timings/%02u-%02u-%04d?latitude=%.4f&longitude=%.4f&method=%ld&school=%ld",
                           (int)baseLen, cfg.apiBase,
                           (unsigned)day.day, (unsigned)day.month, (int)day.year,
                           (double)cfg.latitude, (double)cfg.longitude,
                           (long)cfg.method, (long)cfg.school);
    return n > 0 && (size_t)n < len;
}

TimeTableStatus AladhanSource::fetch(const CivilDate& day, TimeTable& out)
{
    char url[192] = {0};
    if (!buildUrl(cfg_, day, url, sizeof(url))) {
        LOGW("calculation API url invalid");
        return TimeTableStatus::SourceUnavailable;
    }

    size_t len = 0;
    if (!fetchBody(url, buf_, len)) return TimeTableStatus::SourceUnavailable;
    return parseAladhanTimings(buf_.data, len, day, out);
}

TimeTableStatus PortalSource::fetch(const CivilDate& day, TimeTable& out)
{
    if (cfg_.portalUrl[0] == '\0') {
        LOGW("portal url not configured");
        return TimeTableStatus::SourceUnavailable;
    }

    CivilDate today;
    if (!localToday(today) || today != day) {
        char d[12] = {0};
        (void)formatCivilDate(day, d, sizeof(d));
        LOGD("portal has no table for %s", d);
        return TimeTableStatus::SourceUnavailable;
    }

    size_t len = 0;
    if (!fetchBody(cfg_.portalUrl, buf_, len)) return TimeTableStatus::SourceUnavailable;
    return parsePortalTimes(buf_.data, len, day, out);
}
