/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"

#include "Core/ConfigMigrations.h"
#include "Core/ConfigStore.h"
#include "Core/DataStore/DataStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Network modules
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/TimeModule/TimeModule.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"
#include "Modules/Network/HAModule/HAModule.h"
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
#include "Modules/Stores/DataStoreModule/DataStoreModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
// Azan modules
#include "Modules/PrayerTimesModule/PrayerTimesModule.h"
#include "Modules/AudioCacheModule/AudioCacheModule.h"
#include "Modules/PlaybackModule/PlaybackModule.h"
#include "Modules/AzanModule/AzanModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"

#include "Core/MqttTopics.h"
#include "Core/Runtime.h"
#include "Core/SnprintfCheck.h"
#include "Core/SystemLimits.h"
#include <WiFi.h>
#include <time.h>
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    MINARET_SNPRINTF_CHECKED("Main", OUT, LEN, FMT, ##__VA_ARGS__)

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static WifiModule           wifiModule;
static TimeModule           timeModule;
static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static DataStoreModule      dataStoreModule;
static MQTTModule           mqttModule;
static HAModule             haModule;
static LogSerialSinkModule  logSerialSinkModule;
static LogDispatcherModule  logDispatcherModule;
static LogHubModule         logHubModule;
static EventBusModule       eventBusModule;
static PrayerTimesModule    prayerTimesModule;
static AudioCacheModule     audioCacheModule;
static PlaybackModule       playbackModule;
static AzanModule           azanModule;

static char topicAzanState[Limits::TopicBuf] = {0};
static char topicNetworkState[Limits::TopicBuf] = {0};
static char topicAudioState[Limits::TopicBuf] = {0};

struct BootOrchestratorState {
    bool active = false;
    bool mqttReleased = false;
    bool haReleased = false;
    bool audioReleased = false;
    uint32_t t0Ms = 0;
};
static BootOrchestratorState gBootOrchestrator{};

static bool buildAzanState(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt || !out || len == 0) return false;
    DataStore* ds = mqtt->dataStorePtr();
    if (!ds) return false;
    // Countdown is relative to the publish instant.
    return AzanModule::buildStateJson(azanSnapshot(*ds), (uint64_t)time(nullptr), out, len);
}

static bool buildNetworkSnapshot(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt || !out || len == 0) return false;
    DataStore* ds = mqtt->dataStorePtr();
    if (!ds) return false;

    char ip[16];
    formatWifiIp(*ds, ip, sizeof(ip));
    int rssi = (WiFi.isConnected()) ? WiFi.RSSI() : -127;

    int wrote = snprintf(out, len,
                         "{\"ready\":%s,\"ip\":\"%s\",\"rssi\":%d,\"link_ups\":%lu,"
                         "\"mqtt\":%s,\"rx_drop\":%lu,\"parse_fail\":%lu,"
                         "\"time\":%s,\"time_syncs\":%lu,"
                         "\"ha\":%s,\"ha_entities\":%u,\"ts\":%lu}",
                         wifiReady(*ds) ? "true" : "false",
                         ip,
                         rssi,
                         (unsigned long)wifiLinkUps(*ds),
                         mqttReady(*ds) ? "true" : "false",
                         (unsigned long)(mqttRxDrop(*ds) + mqttOversizeDrop(*ds)),
                         (unsigned long)mqttParseFail(*ds),
                         timeReady(*ds) ? "true" : "false",
                         (unsigned long)timeSyncCount(*ds),
                         haDiscoveryPublished(*ds) ? "true" : "false",
                         (unsigned)haEntityCount(*ds),
                         (unsigned long)millis());
    return (wrote > 0) && ((size_t)wrote < len);
}

static bool buildAudioState(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt || !out || len == 0) return false;
    DataStore* ds = mqtt->dataStorePtr();
    if (!ds) return false;

    int wrote = snprintf(out, len,
                         "{\"primary\":{\"state\":\"%s\",\"bytes\":%lu},"
                         "\"fajr\":{\"state\":\"%s\",\"bytes\":%lu},"
                         "\"fetches\":%lu,\"fetch_fail\":%lu,\"ts\":%lu}",
                         assetStateStr((AssetState)audioAssetState(*ds, 0)),
                         (unsigned long)audioAssetBytes(*ds, 0),
                         assetStateStr((AssetState)audioAssetState(*ds, 1)),
                         (unsigned long)audioAssetBytes(*ds, 1),
                         (unsigned long)audioFetchCount(*ds),
                         (unsigned long)audioFetchFailCount(*ds),
                         (unsigned long)millis());
    return (wrote > 0) && ((size_t)wrote < len);
}

static void startBootOrchestrator()
{
    gBootOrchestrator.active = true;
    gBootOrchestrator.mqttReleased = false;
    gBootOrchestrator.haReleased = false;
    gBootOrchestrator.audioReleased = false;
    gBootOrchestrator.t0Ms = millis();

    // Stage gates: scheduling runs immediately, network-heavy phases are delayed.
    mqttModule.setStartupReady(false);
    haModule.setStartupReady(false);
    audioCacheModule.setStartupReady(false);
    Serial.printf("[BOOT] staged startup armed (mqtt=%lums audio=%lums ha=%lums)\n",
                  (unsigned long)Limits::Boot::MqttStartDelayMs,
                  (unsigned long)Limits::Boot::AudioPrefetchDelayMs,
                  (unsigned long)Limits::Boot::HaStartDelayMs);
}

static void runBootOrchestrator()
{
    if (!gBootOrchestrator.active) return;

    const uint32_t now = millis();
    const uint32_t elapsed = now - gBootOrchestrator.t0Ms;

    if (!gBootOrchestrator.mqttReleased && elapsed >= Limits::Boot::MqttStartDelayMs) {
        mqttModule.setStartupReady(true);
        gBootOrchestrator.mqttReleased = true;
        Serial.printf("[BOOT] mqtt stage released at %lums\n", (unsigned long)elapsed);
    }

    if (!gBootOrchestrator.audioReleased && elapsed >= Limits::Boot::AudioPrefetchDelayMs) {
        audioCacheModule.setStartupReady(true);
        gBootOrchestrator.audioReleased = true;
        Serial.printf("[BOOT] audio prefetch stage released at %lums\n", (unsigned long)elapsed);
    }

    if (!gBootOrchestrator.haReleased && elapsed >= Limits::Boot::HaStartDelayMs) {
        haModule.setStartupReady(true);
        gBootOrchestrator.haReleased = true;
        Serial.printf("[BOOT] ha stage released at %lums\n", (unsigned long)elapsed);
    }

    if (gBootOrchestrator.mqttReleased && gBootOrchestrator.haReleased && gBootOrchestrator.audioReleased) {
        gBootOrchestrator.active = false;
        Serial.println("[BOOT] staged startup completed");
    }
}

void setup() {
    Serial.begin(115200);
    delay(50);
    preferences.begin(NvsKeys::StorageNamespace, false);
    registry.setPreferences(preferences);
    registry.runMigrations(CURRENT_CFG_VERSION, steps, MIGRATION_COUNT);
    mqttModule.setStartupReady(false);
    haModule.setStartupReady(false);
    audioCacheModule.setStartupReady(false);

    Module* const modules[] = {
        &logHubModule, &logDispatcherModule, &logSerialSinkModule, &eventBusModule,
        &configStoreModule, &dataStoreModule, &commandModule,
        &wifiModule, &timeModule, &mqttModule, &haModule,
        &prayerTimesModule, &audioCacheModule, &playbackModule, &azanModule,
    };
    bool ok = true;
    for (Module* m : modules) ok = moduleManager.add(m) && ok;

    ok = ok && moduleManager.initAll(registry, services);
    if (!ok) {
        Serial.println("Setup failure: module init");
        while (true) delay(1000);
    }

    mqttModule.formatTopic(topicAzanState, sizeof(topicAzanState), MqttTopics::SuffixAzanState);
    mqttModule.formatTopic(topicNetworkState, sizeof(topicNetworkState), MqttTopics::SuffixNetworkState);
    mqttModule.formatTopic(topicAudioState, sizeof(topicAudioState), MqttTopics::SuffixAudioState);
    // Azan state follows every change and refreshes its countdown every 30 s.
    mqttModule.addRuntimePublisher(topicAzanState, 30000, DIRTY_AZAN, 0, true, buildAzanState);
    mqttModule.addRuntimePublisher(topicNetworkState, 60000, DIRTY_NETWORK | DIRTY_MQTT | DIRTY_TIME, 0, false, buildNetworkSnapshot);
    mqttModule.addRuntimePublisher(topicAudioState, 300000, DIRTY_AUDIO, 0, true, buildAudioState);
    startBootOrchestrator();

    Serial.print(
        "\x1b[32m"
        " __  __ _                      _   \n"
        "|  \\/  (_)_ __   __ _ _ __ ___| |_ \n"
        "| |\\/| | | '_ \\ / _` | '__/ _ \\ __|\n"
        "| |  | | | | | | (_| | | |  __/ |_ \n"
        "|_|  |_|_|_| |_|\\__,_|_|  \\___|\\__|\n"
        "\x1b[0m"
        );
}

void loop() {
    runBootOrchestrator();
    delay(20);
}
