#include <unity.h>

#include "Modules/PrayerTimesModule/TimeTable.h"

static TimeTable makeTable(int16_t f, int16_t s, int16_t d, int16_t a, int16_t m, int16_t i)
{
    TimeTable t;
    t.day.year = 2026;
    t.day.month = 10;
    t.day.day = 17;
    t.minuteOfDay[0] = f;
    t.minuteOfDay[1] = s;
    t.minuteOfDay[2] = d;
    t.minuteOfDay[3] = a;
    t.minuteOfDay[4] = m;
    t.minuteOfDay[5] = i;
    return t;
}

void test_parse_hhmm_plain_and_with_zone_suffix()
{
    int16_t m = -1;
    TEST_ASSERT_TRUE(parseHhMm("05:12", m));
    TEST_ASSERT_EQUAL_INT16(312, m);
    TEST_ASSERT_TRUE(parseHhMm("19:40 (CET)", m));
    TEST_ASSERT_EQUAL_INT16(1180, m);
    TEST_ASSERT_TRUE(parseHhMm("0:00", m));
    TEST_ASSERT_EQUAL_INT16(0, m);
}

void test_parse_hhmm_rejects_out_of_range_and_garbage()
{
    int16_t m = 7;
    TEST_ASSERT_FALSE(parseHhMm("24:00", m));
    TEST_ASSERT_FALSE(parseHhMm("12:60", m));
    TEST_ASSERT_FALSE(parseHhMm("12-30", m));
    TEST_ASSERT_FALSE(parseHhMm("12:3", m));
    TEST_ASSERT_FALSE(parseHhMm("12:345", m));
    TEST_ASSERT_FALSE(parseHhMm("", m));
    TEST_ASSERT_FALSE(parseHhMm(nullptr, m));
    TEST_ASSERT_EQUAL_INT16(7, m);
}

void test_kind_names_parse_case_insensitive()
{
    PrayerKind k = PrayerKind::Fajr;
    TEST_ASSERT_TRUE(parsePrayerKind("maghrib", k));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Maghrib, (uint8_t)k);
    TEST_ASSERT_TRUE(parsePrayerKind("TEST", k));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Test, (uint8_t)k);
    TEST_ASSERT_FALSE(parsePrayerKind("Jumuah", k));
    TEST_ASSERT_EQUAL_STRING("Isha", prayerKindName(PrayerKind::Isha));
    TEST_ASSERT_EQUAL_STRING("sunrise", prayerKindSlug(PrayerKind::Sunrise));
}

void test_civil_days_roundtrip_across_leap_day()
{
    CivilDate d;
    d.year = 2024;
    d.month = 2;
    d.day = 28;
    const CivilDate next = civilDateAddDays(d, 1);
    TEST_ASSERT_EQUAL_UINT8(2, next.month);
    TEST_ASSERT_EQUAL_UINT8(29, next.day);
    const CivilDate after = civilDateAddDays(d, 2);
    TEST_ASSERT_EQUAL_UINT8(3, after.month);
    TEST_ASSERT_EQUAL_UINT8(1, after.day);

    CivilDate epoch;
    TEST_ASSERT_EQUAL_INT32(0, daysFromCivil(epoch));
    CivilDate dst;
    dst.year = 2026;
    dst.month = 3;
    dst.day = 29;
    TEST_ASSERT_EQUAL_INT32(20541, daysFromCivil(dst));

    CivilDate bad;
    bad.year = 2026;
    bad.month = 2;
    bad.day = 30;
    TEST_ASSERT_FALSE(civilDateValid(bad));
}

void test_validate_accepts_monotonic_table()
{
    TimeTable t = makeTable(300, 380, 725, 930, 1090, 1180);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::Ok, (uint8_t)validateTimeTable(t));
    TEST_ASSERT_TRUE(t.valid);
}

void test_validate_rejects_non_monotonic_table()
{
    TimeTable t = makeTable(300, 380, 725, 700, 1090, 1180);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::DataQuality, (uint8_t)validateTimeTable(t));
    TEST_ASSERT_FALSE(t.valid);
}

void test_validate_rejects_missing_kind()
{
    TimeTable t = makeTable(300, TIMETABLE_MINUTE_UNSET, 725, 930, 1090, 1180);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)TimeTableStatus::DataQuality, (uint8_t)validateTimeTable(t));
}

void test_format_helpers()
{
    char buf[16];
    TEST_ASSERT_TRUE(formatHhMm(1180, buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("19:40", buf);
    TEST_ASSERT_FALSE(formatHhMm(-1, buf, sizeof(buf)));

    CivilDate d;
    d.year = 2026;
    d.month = 3;
    d.day = 9;
    TEST_ASSERT_TRUE(formatCivilDate(d, buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("2026-03-09", buf);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_parse_hhmm_plain_and_with_zone_suffix);
    RUN_TEST(test_parse_hhmm_rejects_out_of_range_and_garbage);
    RUN_TEST(test_kind_names_parse_case_insensitive);
    RUN_TEST(test_civil_days_roundtrip_across_leap_day);
    RUN_TEST(test_validate_accepts_monotonic_table);
    RUN_TEST(test_validate_rejects_non_monotonic_table);
    RUN_TEST(test_validate_rejects_missing_kind);
    RUN_TEST(test_format_helpers);
    return UNITY_END();
}
