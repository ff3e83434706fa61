/**
 * @file WifiModule.cpp
 * @brief Implementation file.
 */
#include "WifiModule.h"
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"
#include "Core/Runtime.h"
#include <ctype.h>
#include <string.h>

bool WifiModule::svcIsConnected_(void*)
{
    return WiFi.isConnected();
}

bool WifiModule::svcGetIP_(void*, char* out, size_t len)
{
    if (!out || len == 0) return false;
    if (!WiFi.isConnected()) {
        out[0] = '\0';
        return false;
    }
    const IPAddress ip = WiFi.localIP();
    snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return true;
}

void WifiModule::onEventStatic_(const Event& e, void* user)
{
    static_cast<WifiModule*>(user)->onEvent_(e);
}

void WifiModule::onEvent_(const Event& e)
{
    if (e.id != EventId::ConfigChanged || !e.payload) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strcmp(p->nvsKey, NvsKeys::Wifi::Enabled) == 0 ||
        strcmp(p->nvsKey, NvsKeys::Wifi::Ssid) == 0 ||
        strcmp(p->nvsKey, NvsKeys::Wifi::Pass) == 0) {
        reconnectRequested_ = true;
    }
    // Host name changes are picked up by syncMdns_() on the next connected tick.
}

void WifiModule::setState_(WifiState s)
{
    if (s == state_) return;
    state_ = s;
    stateTs_ = millis();

    if (state_ != WifiState::Connected) {
        stopMdns_();
        if (dataStore_) setWifiReady(*dataStore_, false);
        ipPublished_ = false;
    }
}

void WifiModule::startConnect_()
{
    if (cfgData.ssid[0] == '\0') {
        const uint32_t now = millis();
        if ((uint32_t)(now - lastEmptySsidLogMs_) >= EmptySsidLogMs) {
            lastEmptySsidLogMs_ = now;
            LOGW("SSID empty, skipping connection");
        }
        return;
    }

    LOGI("Connecting to '%s'", cfgData.ssid);
    WiFi.disconnect(false, false);
    vTaskDelay(pdMS_TO_TICKS(50));
    WiFi.mode(WIFI_MODE_STA);
    WiFi.setSleep(false);
    WiFi.setHostname(cfgData.hostname);
    WiFi.begin(cfgData.ssid, cfgData.pass);
    setState_(WifiState::Connecting);
}

void WifiModule::publishIp_()
{
    if (ipPublished_) return;
    const IPAddress ip = WiFi.localIP();
    if (ip[0] == 0 && ip[1] == 0 && ip[2] == 0 && ip[3] == 0) return;

    if (dataStore_) {
        IpV4 ip4{};
        for (uint8_t i = 0; i < 4; ++i) ip4.b[i] = ip[i];
        setWifiIp(*dataStore_, ip4);
        setWifiReady(*dataStore_, true);
    }
    ipPublished_ = true;
}

void WifiModule::stopMdns_()
{
    if (!mdnsStarted_) return;
    MDNS.end();
    mdnsStarted_ = false;
    mdnsApplied_[0] = '\0';
    LOGI("mDNS stopped");
}

void WifiModule::syncMdns_()
{
    // Normalize to an RFC 1123 label: lowercase alnum and '-'.
    char host[sizeof(cfgData.hostname)] = {0};
    size_t w = 0;
    for (size_t i = 0; cfgData.hostname[i] != '\0' && w < sizeof(host) - 1; ++i) {
        const char c = cfgData.hostname[i];
        if (isalnum((unsigned char)c)) {
            host[w++] = (char)tolower((unsigned char)c);
        } else if ((c == '-' || c == ' ' || c == '_' || c == '.') && w > 0 && host[w - 1] != '-') {
            host[w++] = '-';
        }
    }
    while (w > 0 && host[w - 1] == '-') host[--w] = '\0';

    if (host[0] == '\0') {
        stopMdns_();
        return;
    }
    if (mdnsStarted_ && strcmp(mdnsApplied_, host) == 0) return;

    stopMdns_();
    if (!MDNS.begin(host)) {
        LOGW("mDNS start failed host=%s", host);
        return;
    }
    MDNS.addService("http", "tcp", 80);
    mdnsStarted_ = true;
    snprintf(mdnsApplied_, sizeof(mdnsApplied_), "%s", host);
    LOGI("mDNS started host=%s.local", mdnsApplied_);
}

void WifiModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    cfg.registerVar(enabledVar);
    cfg.registerVar(ssidVar);
    cfg.registerVar(passVar);
    cfg.registerVar(hostnameVar);

    svc_.isConnected = &WifiModule::svcIsConnected_;
    svc_.getIP = &WifiModule::svcGetIP_;
    svc_.ctx = this;
    services.add("wifi", &svc_);

    if (eventBus_) eventBus_->subscribe(EventId::ConfigChanged, &WifiModule::onEventStatic_, this);

    // Credentials live in ConfigStore only.
    WiFi.persistent(false);
    LOGI("WifiService registered");
}

void WifiModule::loop()
{
    if (reconnectRequested_) {
        reconnectRequested_ = false;
        WiFi.disconnect(false, false);
        setState_(cfgData.enabled ? WifiState::Idle : WifiState::Disabled);
    }

    switch (state_) {
    case WifiState::Disabled:
        if (cfgData.enabled) setState_(WifiState::Idle);
        vTaskDelay(pdMS_TO_TICKS(2000));
        break;

    case WifiState::Idle:
        if (!cfgData.enabled) {
            setState_(WifiState::Disabled);
            break;
        }
        startConnect_();
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::Connecting:
        if (WiFi.isConnected()) {
            const IPAddress ip = WiFi.localIP();
            LOGI("Connected IP=%u.%u.%u.%u RSSI=%d", ip[0], ip[1], ip[2], ip[3], WiFi.RSSI());
            setState_(WifiState::Connected);
        } else if ((uint32_t)(millis() - stateTs_) > ConnectTimeoutMs) {
            LOGW("Connect timeout");
            WiFi.disconnect(false, false);
            setState_(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(200));
        break;

    case WifiState::Connected:
        if (!WiFi.isConnected()) {
            LOGW("Disconnected");
            setState_(WifiState::ErrorWait);
            break;
        }
        syncMdns_();
        publishIp_();
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::ErrorWait:
        if ((uint32_t)(millis() - stateTs_) > RetryDelayMs) setState_(WifiState::Idle);
        vTaskDelay(pdMS_TO_TICKS(500));
        break;
    }
}
