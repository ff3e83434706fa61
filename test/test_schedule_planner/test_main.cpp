#include <unity.h>
#include <stdlib.h>
#include <time.h>

#include "Modules/AzanModule/SchedulePlanner.h"

static const int64_t kDay = 86400;
// 2026-10-17 00:00 UTC
static const int64_t kBase = 20743LL * kDay;

static void useTz(const char* tz)
{
    setenv("TZ", tz, 1);
    tzset();
}

static TimeTable scenarioTable(int16_t y, uint8_t m, uint8_t d)
{
    TimeTable t;
    t.day.year = y;
    t.day.month = m;
    t.day.day = d;
    const int16_t minutes[PRAYER_SCHEDULED_COUNT] = {300, 380, 725, 930, 1090, 1180};
    for (uint8_t i = 0; i < PRAYER_SCHEDULED_COUNT; ++i) t.minuteOfDay[i] = minutes[i];
    validateTimeTable(t);
    return t;
}

static PlannerConfig allEnabled(int16_t offset)
{
    PlannerConfig cfg;
    cfg.offsetMin = offset;
    for (uint8_t i = 0; i < PRAYER_SCHEDULED_COUNT; ++i) cfg.enabled[i] = true;
    return cfg;
}

static int64_t at(int64_t base, int h, int m)
{
    return base + h * 3600 + m * 60;
}

void setUp()
{
    useTz("UTC0");
}

void tearDown() {}

void test_negative_offset_arms_six_instants_before_fajr()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    SchedulePlan plan;
    planSchedule(nullptr, today, nullptr, allEnabled(-5), at(kBase, 4, 0), plan);

    TEST_ASSERT_EQUAL_UINT8(6, plan.count);
    TEST_ASSERT_FALSE(plan.dayComplete);
    const int64_t expected[6] = {
        at(kBase, 4, 55), at(kBase, 6, 15), at(kBase, 12, 0),
        at(kBase, 15, 25), at(kBase, 18, 5), at(kBase, 19, 35)
    };
    for (uint8_t i = 0; i < 6; ++i) {
        TEST_ASSERT_EQUAL_UINT8(i, (uint8_t)plan.entries[i].kind);
        TEST_ASSERT_TRUE(expected[i] == plan.entries[i].instant);
        TEST_ASSERT_TRUE(expected[i] == plan.kindEpoch[i]);
        TEST_ASSERT_EQUAL_INT16(-5, plan.entries[i].offsetMin);
    }
}

void test_refresh_twice_yields_identical_plan()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    SchedulePlan first;
    SchedulePlan second;
    planSchedule(nullptr, today, nullptr, allEnabled(-5), at(kBase, 4, 0), first);
    planSchedule(nullptr, today, nullptr, allEnabled(-5), at(kBase, 4, 30), second);
    TEST_ASSERT_TRUE(samePlan(first, second));
}

void test_past_entries_are_skipped()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    SchedulePlan plan;
    planSchedule(nullptr, today, nullptr, allEnabled(0), at(kBase, 12, 5), plan);
    // Dhuhr at exactly now is not strictly in the future.
    TEST_ASSERT_EQUAL_UINT8(3, plan.count);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Asr, (uint8_t)plan.entries[0].kind);
    TEST_ASSERT_TRUE(plan.kindEpoch[(uint8_t)PrayerKind::Dhuhr] == 0);
}

void test_disabled_kinds_are_not_armed()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    PlannerConfig cfg = allEnabled(0);
    cfg.enabled[(uint8_t)PrayerKind::Sunrise] = false;
    cfg.enabled[(uint8_t)PrayerKind::Asr] = false;
    SchedulePlan plan;
    planSchedule(nullptr, today, nullptr, cfg, at(kBase, 1, 0), plan);
    TEST_ASSERT_EQUAL_UINT8(4, plan.count);
    TEST_ASSERT_TRUE(plan.kindEpoch[(uint8_t)PrayerKind::Sunrise] == 0);
    TEST_ASSERT_TRUE(plan.kindEpoch[(uint8_t)PrayerKind::Asr] == 0);
}

void test_past_isha_arms_nothing_today_and_targets_tomorrow()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    SchedulePlan plan;
    planSchedule(nullptr, today, nullptr, allEnabled(-5), at(kBase, 19, 36), plan);
    TEST_ASSERT_TRUE(plan.dayComplete);
    TEST_ASSERT_EQUAL_UINT8(0, plan.count);

    const TimeTable tomorrow = scenarioTable(2026, 10, 18);
    planSchedule(nullptr, today, &tomorrow, allEnabled(-5), at(kBase, 19, 36), plan);
    TEST_ASSERT_EQUAL_UINT8(6, plan.count);
    TEST_ASSERT_TRUE(plan.entries[0].instant == at(kBase + kDay, 4, 55));
}

void test_tomorrow_is_ignored_before_day_complete()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    const TimeTable tomorrow = scenarioTable(2026, 10, 18);
    SchedulePlan plan;
    planSchedule(nullptr, today, &tomorrow, allEnabled(0), at(kBase, 19, 0), plan);
    TEST_ASSERT_FALSE(plan.dayComplete);
    TEST_ASSERT_EQUAL_UINT8(1, plan.count);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Isha, (uint8_t)plan.entries[0].kind);
}

void test_positive_offset_carries_isha_into_next_day()
{
    TimeTable today = scenarioTable(2026, 10, 17);
    today.minuteOfDay[(uint8_t)PrayerKind::Isha] = 23 * 60 + 50;
    validateTimeTable(today);

    SchedulePlan plan;
    planSchedule(nullptr, today, nullptr, allEnabled(15), at(kBase, 23, 0), plan);
    TEST_ASSERT_EQUAL_UINT8(1, plan.count);
    TEST_ASSERT_TRUE(plan.entries[0].instant == at(kBase + kDay, 0, 5));

    CivilDate armedDay;
    TEST_ASSERT_TRUE(localDateOf(plan.entries[0].instant, armedDay));
    TEST_ASSERT_EQUAL_UINT8(18, armedDay.day);
}

void test_spilled_entry_survives_midnight_refresh()
{
    TimeTable yesterday = scenarioTable(2026, 10, 17);
    yesterday.minuteOfDay[(uint8_t)PrayerKind::Isha] = 23 * 60 + 50;
    validateTimeTable(yesterday);
    const TimeTable today = scenarioTable(2026, 10, 18);

    SchedulePlan plan;
    planSchedule(&yesterday, today, nullptr, allEnabled(15), at(kBase + kDay, 0, 0), plan);
    TEST_ASSERT_TRUE(plan.kindEpoch[(uint8_t)PrayerKind::Isha] == at(kBase + kDay, 0, 5));
    TEST_ASSERT_TRUE(plan.kindEpoch[(uint8_t)PrayerKind::Fajr] == at(kBase + kDay, 5, 15));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Isha, (uint8_t)plan.entries[0].kind);
}

void test_dst_day_converts_with_summer_offset()
{
    useTz("CET-1CEST,M3.5.0,M10.5.0/3");
    CivilDate day;
    day.year = 2026;
    day.month = 3;
    day.day = 29;
    int64_t fajr = 0;
    TEST_ASSERT_TRUE(localEpochFor(day, 5 * 60, fajr));
    TEST_ASSERT_TRUE(fajr == 20541LL * kDay + 3 * 3600);

    // Before the 02:00 switch the winter offset still applies.
    int64_t early = 0;
    TEST_ASSERT_TRUE(localEpochFor(day, 60, early));
    TEST_ASSERT_TRUE(early == 20541LL * kDay);
}

void test_offset_is_applied_in_absolute_seconds()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    ScheduleEntry entries[PRAYER_SCHEDULED_COUNT];
    PlannerConfig cfg = allEnabled(7);
    cfg.enabled[(uint8_t)PrayerKind::Sunrise] = false;
    const uint8_t n = buildEntries(today, cfg, entries, PRAYER_SCHEDULED_COUNT);
    TEST_ASSERT_EQUAL_UINT8(6, n);
    for (uint8_t i = 0; i < n; ++i) {
        int64_t wall = 0;
        TEST_ASSERT_TRUE(localEpochFor(today.day, today.minuteOfDay[i], wall));
        TEST_ASSERT_TRUE(entries[i].instant == wall + 7 * 60);
    }
    TEST_ASSERT_FALSE(entries[(uint8_t)PrayerKind::Sunrise].enabled);
}

void test_unavailable_source_keeps_armed_set()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    SchedulePlan armed;
    planSchedule(nullptr, today, nullptr, allEnabled(0), at(kBase, 4, 0), armed);
    const SchedulePlan before = armed;

    // The 10:00 refresh cannot reach the source.
    const RefreshDecision d = decideRefresh(TableLoad::Failed, false, TableLoad::Failed);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Retry, (uint8_t)d.action);
    TEST_ASSERT_EQUAL_UINT32(Limits::Azan::RefreshRetryMs, d.delayMs);
    if (d.action == RefreshAction::Plan) {
        planSchedule(nullptr, today, nullptr, allEnabled(0), at(kBase, 10, 0), armed);
    }
    TEST_ASSERT_TRUE(samePlan(before, armed));
    TEST_ASSERT_EQUAL_UINT8(6, armed.count);

    // Same when only tomorrow's table is missing after Isha.
    const RefreshDecision late = decideRefresh(TableLoad::Loaded, true, TableLoad::Failed);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Retry, (uint8_t)late.action);
}

void test_fetch_in_flight_waits_without_replanning()
{
    const RefreshDecision d = decideRefresh(TableLoad::Pending, false, TableLoad::Failed);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Wait, (uint8_t)d.action);
    TEST_ASSERT_EQUAL_UINT32(Limits::Azan::RefreshWaitMs, d.delayMs);

    const RefreshDecision next = decideRefresh(TableLoad::Loaded, true, TableLoad::Pending);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Wait, (uint8_t)next.action);
}

void test_today_only_source_plans_empty_evening()
{
    const TimeTable today = scenarioTable(2026, 10, 17);
    const int64_t now = at(kBase, 19, 40);
    const bool complete = isDayComplete(today, 0, now);
    TEST_ASSERT_TRUE(complete);
    TEST_ASSERT_TRUE(needsTomorrow(complete, true));
    TEST_ASSERT_FALSE(needsTomorrow(complete, false));

    const RefreshDecision d = decideRefresh(TableLoad::Loaded, needsTomorrow(complete, false), TableLoad::Failed);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Plan, (uint8_t)d.action);
    TEST_ASSERT_FALSE(d.useTomorrow);
    TEST_ASSERT_EQUAL_UINT32(Limits::Azan::RefreshPeriodMs, d.delayMs);

    SchedulePlan plan;
    planSchedule(nullptr, today, nullptr, allEnabled(0), now, plan);
    TEST_ASSERT_EQUAL_UINT8(0, plan.count);
}

void test_calculated_source_plans_with_tomorrow_after_isha()
{
    const RefreshDecision d = decideRefresh(TableLoad::Loaded, needsTomorrow(true, true), TableLoad::Loaded);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Plan, (uint8_t)d.action);
    TEST_ASSERT_TRUE(d.useTomorrow);

    const RefreshDecision morning = decideRefresh(TableLoad::Loaded, needsTomorrow(false, true), TableLoad::Failed);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RefreshAction::Plan, (uint8_t)morning.action);
    TEST_ASSERT_FALSE(morning.useTomorrow);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_negative_offset_arms_six_instants_before_fajr);
    RUN_TEST(test_refresh_twice_yields_identical_plan);
    RUN_TEST(test_past_entries_are_skipped);
    RUN_TEST(test_disabled_kinds_are_not_armed);
    RUN_TEST(test_past_isha_arms_nothing_today_and_targets_tomorrow);
    RUN_TEST(test_tomorrow_is_ignored_before_day_complete);
    RUN_TEST(test_positive_offset_carries_isha_into_next_day);
    RUN_TEST(test_spilled_entry_survives_midnight_refresh);
    RUN_TEST(test_dst_day_converts_with_summer_offset);
    RUN_TEST(test_offset_is_applied_in_absolute_seconds);
    RUN_TEST(test_unavailable_source_keeps_armed_set);
    RUN_TEST(test_fetch_in_flight_waits_without_replanning);
    RUN_TEST(test_today_only_source_plans_empty_evening);
    RUN_TEST(test_calculated_source_plans_with_tomorrow_after_isha);
    return UNITY_END();
}
