#include <unity.h>

#include "Modules/AzanModule/PlaybackArbiter.h"

static PlaybackArbiter arb;

static ArbiterAction pop()
{
    ArbiterAction a;
    TEST_ASSERT_TRUE(arb.popAction(a));
    return a;
}

static void expectEmpty()
{
    ArbiterAction a;
    TEST_ASSERT_FALSE(arb.popAction(a));
}

static void assertType(ArbiterActionType t, const ArbiterAction& a)
{
    TEST_ASSERT_EQUAL_UINT8((uint8_t)t, (uint8_t)a.type);
}

// Drives one request through resolve and start to Playing.
static uint32_t playKind(PrayerKind kind, uint32_t handle, uint32_t now)
{
    const uint32_t seq = arb.request(kind, now);
    assertType(ArbiterActionType::ResolveAsset, pop());
    arb.onAssetReady(seq, now);
    assertType(ArbiterActionType::StartPlayback, pop());
    arb.onStartCompleted(seq, true, handle, now);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());
    return seq;
}

void setUp()
{
    arb = PlaybackArbiter();
    ArbiterTimeouts t;
    t.preemptMs = 5000;
    t.fetchWaitMs = 60000;
    t.startMs = 20000;
    t.playMaxMs = 300000;
    arb.setTimeouts(t);
}

void tearDown() {}

void test_stop_with_nothing_active_is_noop()
{
    arb.stop(0);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
    TEST_ASSERT_FALSE(arb.active());
    expectEmpty();
}

void test_cache_miss_goes_downloading_then_playing()
{
    const uint32_t seq = arb.request(PrayerKind::Dhuhr, 0);
    const ArbiterAction r = pop();
    assertType(ArbiterActionType::ResolveAsset, r);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Dhuhr, (uint8_t)r.kind);

    arb.onAssetPending(seq);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Downloading, (uint8_t)arb.status());
    arb.onAssetReady(seq, 100);
    const ArbiterAction s = pop();
    assertType(ArbiterActionType::StartPlayback, s);
    TEST_ASSERT_EQUAL_UINT32(seq, s.seq);
    arb.onStartCompleted(seq, true, 42, 200);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());
    TEST_ASSERT_EQUAL_UINT32(42, arb.handle());
}

void test_fetch_failure_returns_to_idle_without_start()
{
    const uint32_t seq = arb.request(PrayerKind::Fajr, 0);
    pop();
    arb.onAssetPending(seq);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Downloading, (uint8_t)arb.status());
    arb.onAssetFailed(seq);

    const ArbiterAction e = pop();
    assertType(ArbiterActionType::ReportError, e);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::FetchFailed, (uint16_t)e.error);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
    TEST_ASSERT_FALSE(arb.active());
    expectEmpty();

    // The next independent request is unaffected.
    playKind(PrayerKind::Dhuhr, 7, 1000);
}

void test_missing_source_reports_missing_url()
{
    const uint32_t seq = arb.request(PrayerKind::Test, 0);
    pop();
    arb.onAssetFailed(seq, ErrorCode::MissingUrl);

    const ArbiterAction e = pop();
    assertType(ArbiterActionType::ReportError, e);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::MissingUrl, (uint16_t)e.error);
    TEST_ASSERT_FALSE(arb.active());
    expectEmpty();
}

void test_second_request_before_start_supersedes_first()
{
    const uint32_t a = arb.request(PrayerKind::Fajr, 0);
    pop();
    const uint32_t b = arb.request(PrayerKind::Test, 10);
    const ArbiterAction rb = pop();
    assertType(ArbiterActionType::ResolveAsset, rb);
    TEST_ASSERT_EQUAL_UINT32(b, rb.seq);

    arb.onAssetReady(a, 20);
    expectEmpty();
    arb.onAssetReady(b, 30);
    const ArbiterAction s = pop();
    assertType(ArbiterActionType::StartPlayback, s);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Test, (uint8_t)s.kind);
    expectEmpty();
}

void test_request_while_starting_stops_first_session_after_start()
{
    const uint32_t a = arb.request(PrayerKind::Asr, 0);
    pop();
    arb.onAssetReady(a, 0);
    pop();
    const uint32_t b = arb.request(PrayerKind::Test, 10);
    expectEmpty();

    arb.onStartCompleted(a, true, 5, 20);
    const ArbiterAction stop = pop();
    assertType(ArbiterActionType::StopPlayback, stop);
    TEST_ASSERT_EQUAL_UINT32(5, stop.handle);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ArbiterPhase::Stopping, (uint8_t)arb.phase());

    arb.onStopCompleted(stop.seq, true, 30);
    const ArbiterAction r = pop();
    assertType(ArbiterActionType::ResolveAsset, r);
    TEST_ASSERT_EQUAL_UINT32(b, r.seq);
}

void test_test_trigger_preempts_playing_session_stop_then_start()
{
    playKind(PrayerKind::Fajr, 11, 0);
    const uint32_t t = arb.request(PrayerKind::Test, 1000);

    const ArbiterAction stop = pop();
    assertType(ArbiterActionType::StopPlayback, stop);
    TEST_ASSERT_EQUAL_UINT32(11, stop.handle);
    expectEmpty();
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());

    arb.onStopCompleted(stop.seq, true, 1500);
    const ArbiterAction r = pop();
    assertType(ArbiterActionType::ResolveAsset, r);
    TEST_ASSERT_EQUAL_UINT32(t, r.seq);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
}

void test_preemption_timeout_lets_new_request_proceed()
{
    playKind(PrayerKind::Maghrib, 3, 0);
    const uint32_t t = arb.request(PrayerKind::Test, 1000);
    const ArbiterAction stop = pop();
    assertType(ArbiterActionType::StopPlayback, stop);

    arb.tick(5999);
    expectEmpty();
    arb.tick(6000);
    const ArbiterAction e = pop();
    assertType(ArbiterActionType::ReportError, e);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::PreemptionTimeout, (uint16_t)e.error);
    const ArbiterAction r = pop();
    assertType(ArbiterActionType::ResolveAsset, r);
    TEST_ASSERT_EQUAL_UINT32(t, r.seq);

    // A late stop acknowledgment no longer matches anything.
    arb.onStopCompleted(stop.seq, true, 6100);
    expectEmpty();
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ArbiterPhase::Resolving, (uint8_t)arb.phase());
}

void test_latest_request_wins_while_stopping()
{
    playKind(PrayerKind::Isha, 9, 0);
    arb.request(PrayerKind::Fajr, 100);
    const ArbiterAction stop = pop();
    const uint32_t last = arb.request(PrayerKind::Test, 200);
    expectEmpty();

    arb.onStopCompleted(stop.seq, true, 300);
    const ArbiterAction r = pop();
    assertType(ArbiterActionType::ResolveAsset, r);
    TEST_ASSERT_EQUAL_UINT32(last, r.seq);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Test, (uint8_t)r.kind);
    expectEmpty();
}

void test_stop_while_playing_waits_for_confirmation()
{
    playKind(PrayerKind::Dhuhr, 21, 0);
    arb.stop(100);
    const ArbiterAction stop = pop();
    assertType(ArbiterActionType::StopPlayback, stop);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());
    arb.stop(150);
    expectEmpty();
    arb.onStopCompleted(stop.seq, true, 200);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
    TEST_ASSERT_FALSE(arb.active());
    expectEmpty();
}

void test_start_failure_reports_and_resets()
{
    const uint32_t seq = arb.request(PrayerKind::Asr, 0);
    pop();
    arb.onAssetReady(seq, 0);
    pop();
    arb.onStartCompleted(seq, false, 0, 10);
    const ArbiterAction e = pop();
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::PlaybackFailed, (uint16_t)e.error);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
    TEST_ASSERT_FALSE(arb.active());
}

void test_late_start_after_timeout_is_stopped()
{
    const uint32_t seq = arb.request(PrayerKind::Asr, 0);
    pop();
    arb.onAssetReady(seq, 0);
    pop();
    arb.tick(20000);
    const ArbiterAction e = pop();
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::PlaybackFailed, (uint16_t)e.error);
    TEST_ASSERT_FALSE(arb.active());

    arb.onStartCompleted(seq, true, 77, 25000);
    const ArbiterAction cleanup = pop();
    assertType(ArbiterActionType::StopPlayback, cleanup);
    TEST_ASSERT_EQUAL_UINT32(0, cleanup.seq);
    TEST_ASSERT_EQUAL_UINT32(77, cleanup.handle);
    TEST_ASSERT_FALSE(arb.active());
}

void test_late_start_does_not_stop_newer_session()
{
    const uint32_t old = arb.request(PrayerKind::Asr, 0);
    pop();
    arb.onAssetReady(old, 0);
    pop();
    arb.tick(20000);
    assertType(ArbiterActionType::ReportError, pop());

    const uint32_t seq = arb.request(PrayerKind::Test, 21000);
    assertType(ArbiterActionType::ResolveAsset, pop());
    arb.onAssetReady(seq, 21000);
    assertType(ArbiterActionType::StartPlayback, pop());

    // Old start lands while the new one is in flight.
    arb.onStartCompleted(old, true, 77, 21500);
    expectEmpty();
    arb.onStartCompleted(seq, true, 78, 22000);
    expectEmpty();
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());
    TEST_ASSERT_EQUAL_UINT32(78, arb.handle());

    // And once the new session plays.
    arb.onStartCompleted(old, true, 77, 23000);
    expectEmpty();
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ArbiterPhase::Playing, (uint8_t)arb.phase());
}

void test_stop_timeout_without_pending_request_reports_playback_failed()
{
    playKind(PrayerKind::Dhuhr, 5, 0);
    arb.stop(1000);
    assertType(ArbiterActionType::StopPlayback, pop());
    arb.tick(6000);
    const ArbiterAction e = pop();
    assertType(ArbiterActionType::ReportError, e);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::PlaybackFailed, (uint16_t)e.error);
    TEST_ASSERT_FALSE(arb.active());
    expectEmpty();
}

void test_fajr_fetch_failure_leaves_later_dhuhr_fire_intact()
{
    const uint32_t fajr = arb.request(PrayerKind::Fajr, 0);
    pop();
    arb.onAssetPending(fajr);
    arb.onAssetFailed(fajr, ErrorCode::FetchFailed);
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::FetchFailed, (uint16_t)pop().error);

    // Dhuhr fires hours later and resolves a different asset.
    const uint32_t dhuhr = arb.request(PrayerKind::Dhuhr, 25000000u);
    const ArbiterAction r = pop();
    assertType(ArbiterActionType::ResolveAsset, r);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrayerKind::Dhuhr, (uint8_t)r.kind);
    arb.onAssetFailed(fajr, ErrorCode::FetchFailed);
    expectEmpty();
    arb.onAssetReady(dhuhr, 25000100u);
    assertType(ArbiterActionType::StartPlayback, pop());
    arb.onStartCompleted(dhuhr, true, 12, 25000200u);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());
    expectEmpty();
}

void test_fetch_wait_timeout_returns_to_idle()
{
    const uint32_t seq = arb.request(PrayerKind::Fajr, 1000);
    pop();
    arb.onAssetPending(seq);
    arb.tick(61000);
    const ArbiterAction e = pop();
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::FetchFailed, (uint16_t)e.error);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
}

void test_playing_auto_resets_after_play_max()
{
    playKind(PrayerKind::Maghrib, 4, 0);
    arb.tick(299999);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Playing, (uint8_t)arb.status());
    arb.tick(300000);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AzanStatus::Idle, (uint8_t)arb.status());
    TEST_ASSERT_FALSE(arb.active());
    expectEmpty();
}

void test_timeouts_survive_millis_wraparound()
{
    const uint32_t start = 0xFFFFF000u;
    const uint32_t seq = arb.request(PrayerKind::Fajr, start);
    pop();
    arb.onAssetPending(seq);
    arb.tick(start + 59999u);
    expectEmpty();
    arb.tick(start + 60000u);
    assertType(ArbiterActionType::ReportError, pop());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_stop_with_nothing_active_is_noop);
    RUN_TEST(test_cache_miss_goes_downloading_then_playing);
    RUN_TEST(test_fetch_failure_returns_to_idle_without_start);
    RUN_TEST(test_missing_source_reports_missing_url);
    RUN_TEST(test_second_request_before_start_supersedes_first);
    RUN_TEST(test_request_while_starting_stops_first_session_after_start);
    RUN_TEST(test_test_trigger_preempts_playing_session_stop_then_start);
    RUN_TEST(test_preemption_timeout_lets_new_request_proceed);
    RUN_TEST(test_latest_request_wins_while_stopping);
    RUN_TEST(test_stop_while_playing_waits_for_confirmation);
    RUN_TEST(test_start_failure_reports_and_resets);
    RUN_TEST(test_late_start_after_timeout_is_stopped);
    RUN_TEST(test_late_start_does_not_stop_newer_session);
    RUN_TEST(test_stop_timeout_without_pending_request_reports_playback_failed);
    RUN_TEST(test_fajr_fetch_failure_leaves_later_dhuhr_fire_intact);
    RUN_TEST(test_fetch_wait_timeout_returns_to_idle);
    RUN_TEST(test_playing_auto_resets_after_play_max);
    RUN_TEST(test_timeouts_survive_millis_wraparound);
    return UNITY_END();
}
