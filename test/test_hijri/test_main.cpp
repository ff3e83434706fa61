#include <unity.h>

#include "Modules/PrayerTimesModule/HijriCalendar.h"

static CivilDate civil(int16_t y, uint8_t m, uint8_t d)
{
    CivilDate c;
    c.year = y;
    c.month = m;
    c.day = d;
    return c;
}

void test_y2k_is_ramadan_1420()
{
    const HijriDate h = hijriFromCivil(civil(2000, 1, 1));
    TEST_ASSERT_EQUAL_INT16(1420, h.year);
    TEST_ASSERT_EQUAL_UINT8(9, h.month);
    TEST_ASSERT_EQUAL_UINT8(24, h.day);
}

void test_first_of_ramadan_1445()
{
    const HijriDate h = hijriFromCivil(civil(2024, 3, 11));
    TEST_ASSERT_EQUAL_INT16(1445, h.year);
    TEST_ASSERT_EQUAL_UINT8(9, h.month);
    TEST_ASSERT_EQUAL_UINT8(1, h.day);
}

void test_unix_epoch_day()
{
    const HijriDate h = hijriFromCivil(civil(1970, 1, 1));
    TEST_ASSERT_EQUAL_INT16(1389, h.year);
    TEST_ASSERT_EQUAL_UINT8(10, h.month);
    TEST_ASSERT_EQUAL_UINT8(22, h.day);
}

void test_format_uses_month_name()
{
    char buf[40];
    TEST_ASSERT_TRUE(formatHijri(hijriFromCivil(civil(2026, 3, 29)), buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("10 Shawwal 1447 AH", buf);
}

void test_format_rejects_invalid_month()
{
    HijriDate h;
    char buf[40] = "x";
    TEST_ASSERT_FALSE(formatHijri(h, buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("", buf);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_y2k_is_ramadan_1420);
    RUN_TEST(test_first_of_ramadan_1445);
    RUN_TEST(test_unix_epoch_day);
    RUN_TEST(test_format_uses_month_name);
    RUN_TEST(test_format_rejects_invalid_month);
    return UNITY_END();
}
