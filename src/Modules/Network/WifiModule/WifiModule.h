#pragma once
/**
 * @file WifiModule.h
 * @brief WiFi station connectivity module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/EventBus/EventBus.h"
#include "Core/Services/Services.h"
#include <WiFi.h>
#include <ESPmDNS.h>

/** @brief WiFi configuration values. */
struct WifiConfig {
    bool enabled = true;
    char ssid[32] = "";
    char pass[64] = "";
    char hostname[32] = "minaret";
};

/**
 * @brief Active module running the station connect state machine.
 *
 * Publishes `wifi.ready` and the IPv4 address in the DataStore and keeps the
 * mDNS responder aligned with the configured host name.
 */
class WifiModule : public Module {
public:
    const char* moduleId() const override { return "wifi"; }
    const char* taskName() const override { return "wifi"; }
    BaseType_t taskCore() const override { return 0; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "datastore";
        if (i == 2) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    static constexpr uint32_t ConnectTimeoutMs = 15000;
    static constexpr uint32_t RetryDelayMs = 5000;
    static constexpr uint32_t EmptySsidLogMs = 10000;

    WifiConfig cfgData;
    WifiState state_ = WifiState::Idle;
    uint32_t stateTs_ = 0;
    DataStore* dataStore_ = nullptr;
    EventBus* eventBus_ = nullptr;
    WifiService svc_{};
    bool ipPublished_ = false;
    bool mdnsStarted_ = false;
    volatile bool reconnectRequested_ = false;
    uint32_t lastEmptySsidLogMs_ = 0;
    char mdnsApplied_[sizeof(cfgData.hostname)] = {0};

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Wifi::Enabled),"enabled","wifi",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };

    ConfigVariable<char> ssidVar {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",
        ConfigType::CharArray,
        cfgData.ssid,
        ConfigPersistence::Persistent,
        sizeof(cfgData.ssid)
    };

    ConfigVariable<char> passVar {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",
        ConfigType::CharArray,
        cfgData.pass,
        ConfigPersistence::Persistent,
        sizeof(cfgData.pass)
    };

    ConfigVariable<char> hostnameVar {
        NVS_KEY(NvsKeys::Wifi::Hostname),"hostname","wifi",
        ConfigType::CharArray,
        cfgData.hostname,
        ConfigPersistence::Persistent,
        sizeof(cfgData.hostname)
    };

    static bool svcIsConnected_(void* ctx);
    static bool svcGetIP_(void* ctx, char* out, size_t len);
    static void onEventStatic_(const Event& e, void* user);

    void onEvent_(const Event& e);
    void setState_(WifiState s);
    void startConnect_();
    void publishIp_();
    void stopMdns_();
    void syncMdns_();
};
