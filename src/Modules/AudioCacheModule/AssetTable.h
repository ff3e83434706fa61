#pragma once
/**
 * @file AssetTable.h
 * @brief Per-asset fetch state with single-flight bookkeeping.
 *
 * Not thread safe. The owner serializes access (AudioCacheModule holds a mutex).
 */

#include <stdint.h>

#include "Core/SystemLimits.h"

enum class AssetState : uint8_t {
    Absent = 0,
    Fetching,
    Ready,
    Failed
};

const char* assetStateStr(AssetState st);

/** @brief Outcome of a resolve request against the table. */
enum class AssetRequest : uint8_t {
    Ready = 0,   // cached file matches the url
    Joined,      // a fetch for this url is already in flight
    StartFetch,  // caller must start exactly one fetch for the returned generation
    Failed       // no usable source url
};

constexpr uint8_t ASSET_TABLE_MAX = 4;

/**
 * @brief True for a cached payload file name such as `primary.mp3`.
 *
 * Source markers (`.<id>.url`) and downloads in progress (`<id>.tmp`) are
 * not payloads and are never served.
 */
bool isPayloadFileName(const char* name);

/** @brief Why a body transfer loop stopped. */
enum class DownloadEnd : uint8_t {
    Complete = 0,  // announced length reached
    Closed,        // peer closed the connection
    Stalled,       // no byte within the stall timeout
    WriteFailed    // flash write short
};

/**
 * @brief Decides whether a finished transfer may replace the cached file.
 *
 * `contentLength` is negative when the server sent none; the body then ends
 * only when the peer closes the connection.
 */
bool downloadAcceptable(DownloadEnd end, uint32_t bytes, int32_t contentLength);

class AssetTable {
public:
    /** @brief Marks a cached file as Ready for `markerUrl` (read back from flash at boot). */
    bool seed(uint8_t idx, const char* markerUrl);

    /**
     * @brief Requests `url` for asset `idx`.
     *
     * A url different from the cached one discards the entry and bumps the
     * generation. A previous failure for the same url starts a new fetch.
     * A url that does not fit the entry buffer fails without a fetch.
     */
    AssetRequest request(uint8_t idx, const char* url, uint32_t& generation);

    /**
     * @brief Records the outcome of the fetch started for `generation`.
     * @return false when the completion is stale (the url changed meanwhile).
     */
    bool complete(uint8_t idx, uint32_t generation, bool ok);

    /** @brief Forgets the cached file. The next request refetches. */
    void invalidate(uint8_t idx);

    AssetState state(uint8_t idx) const;
    const char* url(uint8_t idx) const;
    uint32_t generation(uint8_t idx) const;
    uint32_t fetchCount(uint8_t idx) const;

private:
    struct Entry {
        AssetState state = AssetState::Absent;
        uint32_t generation = 0;
        uint32_t fetches = 0;
        char url[Limits::Audio::UrlBuf] = {0};
    };

    Entry entries_[ASSET_TABLE_MAX];
};
