#pragma once
/**
 * @file WifiRuntime.h
 * @brief Wifi runtime helpers and keys.
 */
#include <stdio.h>
#include <string.h>

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

constexpr DataKey DATAKEY_WIFI_READY = DataKeys::WifiReady;
constexpr DataKey DATAKEY_WIFI_IP = DataKeys::WifiIp;

static inline bool ipEqual(const IpV4& a, const IpV4& b)
{
    return memcmp(a.b, b.b, 4) == 0;
}

static inline bool wifiReady(const DataStore& ds)
{
    return ds.data().wifi.ready;
}

static inline uint32_t wifiLinkUps(const DataStore& ds)
{
    return ds.data().wifi.linkUps;
}

static inline void setWifiReady(DataStore& ds, bool ready)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.wifi.ready == ready) return;
    rt.wifi.ready = ready;
    if (ready) ++rt.wifi.linkUps;
    ds.notifyChanged(DATAKEY_WIFI_READY, DIRTY_NETWORK);
}

/** @brief Format the current IPv4 address as dotted quad. */
static inline void formatWifiIp(const DataStore& ds, char* out, size_t len)
{
    if (!out || len == 0) return;
    const IpV4& ip = ds.data().wifi.ip;
    snprintf(out, len, "%u.%u.%u.%u", ip.b[0], ip.b[1], ip.b[2], ip.b[3]);
}

static inline void setWifiIp(DataStore& ds, const IpV4& ip)
{
    RuntimeData& rt = ds.dataMutable();
    if (ipEqual(rt.wifi.ip, ip)) return;
    rt.wifi.ip = ip;
    ds.notifyChanged(DATAKEY_WIFI_IP, DIRTY_NETWORK);
}
