/**
 * @file AssetTable.cpp
 * @brief Implementation file.
 */

#include "Modules/AudioCacheModule/AssetTable.h"

#include <stdio.h>
#include <string.h>

const char* assetStateStr(AssetState st)
{
    switch (st) {
    case AssetState::Absent: return "absent";
    case AssetState::Fetching: return "fetching";
    case AssetState::Ready: return "ready";
    case AssetState::Failed: return "failed";
    default: return "unknown";
    }
}

bool isPayloadFileName(const char* name)
{
    if (!name || name[0] == '\0' || name[0] == '.') return false;
    const size_t len = strlen(name);
    if (len <= 4 || strcmp(name + len - 4, ".mp3") != 0) return false;
    for (size_t i = 0; i < len - 4; ++i) {
        const char c = name[i];
        if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-')) return false;
    }
    return true;
}

bool downloadAcceptable(DownloadEnd end, uint32_t bytes, int32_t contentLength)
{
    if (end == DownloadEnd::Stalled || end == DownloadEnd::WriteFailed) return false;
    if (bytes == 0) return false;
    if (contentLength >= 0) return bytes == (uint32_t)contentLength;
    return end == DownloadEnd::Closed;
}

bool AssetTable::seed(uint8_t idx, const char* markerUrl)
{
    if (idx >= ASSET_TABLE_MAX || !markerUrl || markerUrl[0] == '\0') return false;
    Entry& e = entries_[idx];
    snprintf(e.url, sizeof(e.url), "%s", markerUrl);
    e.state = AssetState::Ready;
    return true;
}

AssetRequest AssetTable::request(uint8_t idx, const char* url, uint32_t& generation)
{
    if (idx >= ASSET_TABLE_MAX || !url || url[0] == '\0') return AssetRequest::Failed;
    Entry& e = entries_[idx];
    if (strlen(url) >= sizeof(e.url)) return AssetRequest::Failed;

    if (strcmp(e.url, url) != 0) {
        snprintf(e.url, sizeof(e.url), "%s", url);
        e.state = AssetState::Absent;
        ++e.generation;
    }

    switch (e.state) {
    case AssetState::Ready:
        generation = e.generation;
        return AssetRequest::Ready;
    case AssetState::Fetching:
        generation = e.generation;
        return AssetRequest::Joined;
    case AssetState::Failed:
        ++e.generation;
        break;
    case AssetState::Absent:
    default:
        break;
    }

    e.state = AssetState::Fetching;
    ++e.fetches;
    generation = e.generation;
    return AssetRequest::StartFetch;
}

bool AssetTable::complete(uint8_t idx, uint32_t generation, bool ok)
{
    if (idx >= ASSET_TABLE_MAX) return false;
    Entry& e = entries_[idx];
    if (e.generation != generation || e.state != AssetState::Fetching) return false;
    e.state = ok ? AssetState::Ready : AssetState::Failed;
    return true;
}

void AssetTable::invalidate(uint8_t idx)
{
    if (idx >= ASSET_TABLE_MAX) return;
    Entry& e = entries_[idx];
    e.state = AssetState::Absent;
    e.url[0] = '\0';
    ++e.generation;
}

AssetState AssetTable::state(uint8_t idx) const
{
    return (idx < ASSET_TABLE_MAX) ? entries_[idx].state : AssetState::Absent;
}

const char* AssetTable::url(uint8_t idx) const
{
    return (idx < ASSET_TABLE_MAX) ? entries_[idx].url : "";
}

uint32_t AssetTable::generation(uint8_t idx) const
{
    return (idx < ASSET_TABLE_MAX) ? entries_[idx].generation : 0;
}

uint32_t AssetTable::fetchCount(uint8_t idx) const
{
    return (idx < ASSET_TABLE_MAX) ? entries_[idx].fetches : 0;
}
