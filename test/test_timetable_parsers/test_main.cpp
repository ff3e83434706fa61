#include <unity.h>
#include <string.h>

#include "Modules/PrayerTimesModule/TimeTableParsers.h"

static CivilDate civil(int16_t y, uint8_t m, uint8_t d)
{
    CivilDate c;
    c.year = y;
    c.month = m;
    c.day = d;
    return c;
}

static const char* kAladhanOk =
    "{\"code\":200,\"status\":\"OK\",\"data\":{"
    "\"timings\":{\"Fajr\":\"05:00 (CET)\",\"Sunrise\":\"06:20 (CET)\",\"Dhuhr\":\"12:05 (CET)\","
    "\"Asr\":\"15:30 (CET)\",\"Sunset\":\"18:08 (CET)\",\"Maghrib\":\"18:10 (CET)\",\"Isha\":\"19:40 (CET)\","
    "\"Imsak\":\"04:50 (CET)\",\"Midnight\":\"00:14 (CET)\"},"
    "\"date\":{\"readable\":\"17 Oct 2026\",\"timestamp\":\"1792224000\","
    "\"gregorian\":{\"date\":\"17-10-2026\",\"day\":\"17\"},"
    "\"hijri\":{\"date\":\"05-05-1448\",\"day\":\"05\",\"month\":{\"number\":5,\"en\":\"Jumada al-Ula\"},\"year\":\"1448\"}},"
    "\"meta\":{\"method\":{\"id\":3}}}}";

static const char* kPortalPage =
    "<html><head><script>var confData = {\"name\":\"Grande Mosquee\","
    "\"times\":[\"05:48\",\"13:52\",\"17:01\",\"19:33\",\"20:55\"],"
    "\"shuruq\":\"07:20\",\"jumua\":\"13:30\","
    "\"calendar\":[{\"1\":[\"05:40\",\"07:15\"]}]};</script></head></html>";

void test_aladhan_parses_timings_and_hijri()
{
    TimeTable t;
    const TimeTableStatus st = parseAladhanTimings(kAladhanOk, strlen(kAladhanOk), civil(2026, 10, 17), t);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::Ok, (uint8_t)st);
    TEST_ASSERT_TRUE(t.valid);
    TEST_ASSERT_EQUAL_INT16(300, t.minuteOfDay[(uint8_t)PrayerKind::Fajr]);
    TEST_ASSERT_EQUAL_INT16(380, t.minuteOfDay[(uint8_t)PrayerKind::Sunrise]);
    TEST_ASSERT_EQUAL_INT16(725, t.minuteOfDay[(uint8_t)PrayerKind::Dhuhr]);
    TEST_ASSERT_EQUAL_INT16(930, t.minuteOfDay[(uint8_t)PrayerKind::Asr]);
    TEST_ASSERT_EQUAL_INT16(1090, t.minuteOfDay[(uint8_t)PrayerKind::Maghrib]);
    TEST_ASSERT_EQUAL_INT16(1180, t.minuteOfDay[(uint8_t)PrayerKind::Isha]);
    TEST_ASSERT_EQUAL_STRING("aladhan", t.source);
    TEST_ASSERT_EQUAL_STRING("5 Jumada al-Ula 1448 AH", t.hijri);
}

void test_aladhan_rejects_other_day_echo()
{
    TimeTable t;
    const TimeTableStatus st = parseAladhanTimings(kAladhanOk, strlen(kAladhanOk), civil(2026, 10, 18), t);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::ParseError, (uint8_t)st);
    TEST_ASSERT_FALSE(t.valid);
}

void test_aladhan_malformed_json_is_parse_error()
{
    const char* body = "{\"data\":{\"timings\":{\"Fajr\":";
    TimeTable t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::ParseError,
                            (uint8_t)parseAladhanTimings(body, strlen(body), civil(2026, 10, 17), t));
}

void test_aladhan_non_monotonic_is_data_quality()
{
    const char* body =
        "{\"data\":{\"timings\":{\"Fajr\":\"05:00\",\"Sunrise\":\"06:20\",\"Dhuhr\":\"16:05\","
        "\"Asr\":\"15:30\",\"Maghrib\":\"18:10\",\"Isha\":\"19:40\"}}}";
    TimeTable t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::DataQuality,
                            (uint8_t)parseAladhanTimings(body, strlen(body), civil(2026, 10, 17), t));
}

void test_aladhan_missing_kind_is_data_quality()
{
    const char* body =
        "{\"data\":{\"timings\":{\"Fajr\":\"05:00\",\"Sunrise\":\"06:20\",\"Dhuhr\":\"12:05\","
        "\"Asr\":\"15:30\",\"Isha\":\"19:40\"}}}";
    TimeTable t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::DataQuality,
                            (uint8_t)parseAladhanTimings(body, strlen(body), civil(2026, 10, 17), t));
}

void test_portal_extracts_times_and_shuruq()
{
    TimeTable t;
    const TimeTableStatus st = parsePortalTimes(kPortalPage, strlen(kPortalPage), civil(2026, 10, 17), t);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::Ok, (uint8_t)st);
    TEST_ASSERT_EQUAL_INT16(5 * 60 + 48, t.minuteOfDay[(uint8_t)PrayerKind::Fajr]);
    TEST_ASSERT_EQUAL_INT16(7 * 60 + 20, t.minuteOfDay[(uint8_t)PrayerKind::Sunrise]);
    TEST_ASSERT_EQUAL_INT16(13 * 60 + 52, t.minuteOfDay[(uint8_t)PrayerKind::Dhuhr]);
    TEST_ASSERT_EQUAL_INT16(17 * 60 + 1, t.minuteOfDay[(uint8_t)PrayerKind::Asr]);
    TEST_ASSERT_EQUAL_INT16(19 * 60 + 33, t.minuteOfDay[(uint8_t)PrayerKind::Maghrib]);
    TEST_ASSERT_EQUAL_INT16(20 * 60 + 55, t.minuteOfDay[(uint8_t)PrayerKind::Isha]);
    TEST_ASSERT_EQUAL_STRING("portal", t.source);
    TEST_ASSERT_EQUAL_STRING("", t.hijri);
}

void test_portal_short_times_array_is_parse_error()
{
    const char* page = "{\"times\":[\"05:48\",\"13:52\",\"17:01\"],\"shuruq\":\"07:20\"}";
    TimeTable t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::ParseError,
                            (uint8_t)parsePortalTimes(page, strlen(page), civil(2026, 10, 17), t));
}

void test_portal_without_shuruq_is_data_quality()
{
    const char* page = "{\"times\":[\"05:48\",\"13:52\",\"17:01\",\"19:33\",\"20:55\"]}";
    TimeTable t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::DataQuality,
                            (uint8_t)parsePortalTimes(page, strlen(page), civil(2026, 10, 17), t));
}

void test_fill_hijri_uses_tabular_calendar_when_missing()
{
    TimeTable t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::Ok,
                            (uint8_t)parsePortalTimes(kPortalPage, strlen(kPortalPage), civil(2026, 3, 29), t));
    fillHijriIfMissing(t);
    TEST_ASSERT_EQUAL_STRING("10 Shawwal 1447 AH", t.hijri);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_aladhan_parses_timings_and_hijri);
    RUN_TEST(test_aladhan_rejects_other_day_echo);
    RUN_TEST(test_aladhan_malformed_json_is_parse_error);
    RUN_TEST(test_aladhan_non_monotonic_is_data_quality);
    RUN_TEST(test_aladhan_missing_kind_is_data_quality);
    RUN_TEST(test_portal_extracts_times_and_shuruq);
    RUN_TEST(test_portal_short_times_array_is_parse_error);
    RUN_TEST(test_portal_without_shuruq_is_data_quality);
    RUN_TEST(test_fill_hijri_uses_tabular_calendar_when_missing);
    return UNITY_END();
}
