#include <unity.h>
#include <string.h>

#include "Modules/AudioCacheModule/AssetTable.h"

static const char* kUrlA = "http://media.local/azan-makkah.mp3";
static const char* kUrlB = "http://media.local/azan-madinah.mp3";

void test_concurrent_requests_share_one_fetch()
{
    AssetTable table;
    uint32_t gens[5] = {0};
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::StartFetch, (uint8_t)table.request(0, kUrlA, gens[0]));
    for (uint8_t i = 1; i < 5; ++i) {
        TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Joined, (uint8_t)table.request(0, kUrlA, gens[i]));
        TEST_ASSERT_EQUAL_UINT32(gens[0], gens[i]);
    }
    TEST_ASSERT_EQUAL_UINT32(1, table.fetchCount(0));
    TEST_ASSERT_TRUE(table.complete(0, gens[0], true));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetState::Ready, (uint8_t)table.state(0));

    uint32_t g = 0;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Ready, (uint8_t)table.request(0, kUrlA, g));
    TEST_ASSERT_EQUAL_UINT32(1, table.fetchCount(0));
}

void test_failure_is_shared_and_not_retried_until_next_request()
{
    AssetTable table;
    uint32_t g1 = 0;
    uint32_t g2 = 0;
    table.request(1, kUrlA, g1);
    table.request(1, kUrlA, g2);
    TEST_ASSERT_TRUE(table.complete(1, g1, false));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetState::Failed, (uint8_t)table.state(1));
    TEST_ASSERT_EQUAL_UINT32(1, table.fetchCount(1));

    uint32_t g3 = 0;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::StartFetch, (uint8_t)table.request(1, kUrlA, g3));
    TEST_ASSERT_TRUE(g3 != g1);
    TEST_ASSERT_EQUAL_UINT32(2, table.fetchCount(1));
}

void test_url_change_discards_and_stale_completion_is_ignored()
{
    AssetTable table;
    uint32_t gA = 0;
    uint32_t gB = 0;
    table.request(0, kUrlA, gA);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::StartFetch, (uint8_t)table.request(0, kUrlB, gB));
    TEST_ASSERT_TRUE(gA != gB);

    TEST_ASSERT_FALSE(table.complete(0, gA, true));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetState::Fetching, (uint8_t)table.state(0));
    TEST_ASSERT_TRUE(table.complete(0, gB, true));
    TEST_ASSERT_EQUAL_STRING(kUrlB, table.url(0));
}

void test_seeded_marker_is_ready_until_url_changes()
{
    AssetTable table;
    TEST_ASSERT_TRUE(table.seed(0, kUrlA));
    uint32_t g = 0;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Ready, (uint8_t)table.request(0, kUrlA, g));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::StartFetch, (uint8_t)table.request(0, kUrlB, g));
}

void test_empty_url_fails_without_fetch()
{
    AssetTable table;
    uint32_t g = 0;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Failed, (uint8_t)table.request(0, "", g));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Failed, (uint8_t)table.request(ASSET_TABLE_MAX, kUrlA, g));
    TEST_ASSERT_EQUAL_UINT32(0, table.fetchCount(0));
}

void test_invalidate_forces_refetch()
{
    AssetTable table;
    uint32_t g = 0;
    table.request(0, kUrlA, g);
    table.complete(0, g, true);
    table.invalidate(0);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetState::Absent, (uint8_t)table.state(0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::StartFetch, (uint8_t)table.request(0, kUrlA, g));
}

void test_oversized_url_fails_without_fetch()
{
    AssetTable table;
    char longUrl[Limits::Audio::UrlBuf + 8];
    memset(longUrl, 'a', sizeof(longUrl) - 1);
    longUrl[sizeof(longUrl) - 1] = '\0';
    memcpy(longUrl, "http://", 7);

    uint32_t g = 0;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Failed, (uint8_t)table.request(0, longUrl, g));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetRequest::Failed, (uint8_t)table.request(0, longUrl, g));
    TEST_ASSERT_EQUAL_UINT32(0, table.fetchCount(0));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AssetState::Absent, (uint8_t)table.state(0));
}

void test_stalled_transfer_without_length_is_rejected()
{
    TEST_ASSERT_FALSE(downloadAcceptable(DownloadEnd::Stalled, 40000, -1));
    TEST_ASSERT_TRUE(downloadAcceptable(DownloadEnd::Closed, 40000, -1));
}

void test_transfer_must_match_announced_length()
{
    TEST_ASSERT_TRUE(downloadAcceptable(DownloadEnd::Complete, 5000, 5000));
    TEST_ASSERT_FALSE(downloadAcceptable(DownloadEnd::Closed, 4096, 5000));
    TEST_ASSERT_FALSE(downloadAcceptable(DownloadEnd::Stalled, 5000, 5000));
    TEST_ASSERT_FALSE(downloadAcceptable(DownloadEnd::WriteFailed, 2048, -1));
    TEST_ASSERT_FALSE(downloadAcceptable(DownloadEnd::Closed, 0, -1));
}

void test_only_payload_files_are_servable()
{
    TEST_ASSERT_TRUE(isPayloadFileName("primary.mp3"));
    TEST_ASSERT_TRUE(isPayloadFileName("fajr.mp3"));
    TEST_ASSERT_FALSE(isPayloadFileName(".primary.url"));
    TEST_ASSERT_FALSE(isPayloadFileName(".fajr.url"));
    TEST_ASSERT_FALSE(isPayloadFileName("primary.tmp"));
    TEST_ASSERT_FALSE(isPayloadFileName(".mp3"));
    TEST_ASSERT_FALSE(isPayloadFileName("../secret.mp3"));
    TEST_ASSERT_FALSE(isPayloadFileName(""));
    TEST_ASSERT_FALSE(isPayloadFileName(nullptr));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_concurrent_requests_share_one_fetch);
    RUN_TEST(test_failure_is_shared_and_not_retried_until_next_request);
    RUN_TEST(test_url_change_discards_and_stale_completion_is_ignored);
    RUN_TEST(test_seeded_marker_is_ready_until_url_changes);
    RUN_TEST(test_empty_url_fails_without_fetch);
    RUN_TEST(test_invalidate_forces_refetch);
    RUN_TEST(test_oversized_url_fails_without_fetch);
    RUN_TEST(test_stalled_transfer_without_length_is_rejected);
    RUN_TEST(test_transfer_must_match_announced_length);
    RUN_TEST(test_only_payload_files_are_servable);
    return UNITY_END();
}
