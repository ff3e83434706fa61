#pragma once
/**
 * @file HAModule.h
 * @brief Home Assistant auto-discovery publisher.
 */

#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/EventBus/EventBus.h"
#include "Core/Services/Services.h"
#include "Core/Runtime.h"
#include <ArduinoJson.h>
#include <stdint.h>
#include <stddef.h>

/**
 * @brief Active module that publishes Home Assistant MQTT discovery topics.
 *
 * Entities are registered by their owners through the `ha` service. The full
 * set is (re)published once MQTT is up, after any registration change and
 * after an `ha` config change, paced by `Limits::Ha::Timing::DiscoveryStepMs`.
 */
class HAModule : public Module {
public:
    const char* moduleId() const override { return "ha"; }
    const char* taskName() const override { return "ha"; }
    uint16_t taskStackSize() const override { return 5120; }
    void loop() override;
    void setStartupReady(bool ready);

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "eventbus";
        if (i == 1) return "config";
        if (i == 2) return "datastore";
        if (i == 3) return "mqtt";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static constexpr uint8_t MAX_HA_SENSORS = 20;
    static constexpr uint8_t MAX_HA_SWITCHES = 10;
    static constexpr uint8_t MAX_HA_NUMBERS = 4;
    static constexpr uint8_t MAX_HA_BUTTONS = 6;
    static constexpr size_t TOPIC_BUF_SIZE = 192;
    static constexpr size_t PAYLOAD_BUF_SIZE = 1536;
    static constexpr size_t JSON_DOC_SIZE = 1536;

    struct HAConfig {
        bool enabled = true;
        char vendor[32] = "Minaret";
        char deviceId[32] = "";
        char discoveryPrefix[32] = "homeassistant";
        char model[40] = "Azan Controller";
    };

    using DiscoveryDoc = StaticJsonDocument<JSON_DOC_SIZE>;

    const EventBusService* eventBusSvc = nullptr;
    const DataStoreService* dsSvc = nullptr;
    const MqttService* mqttSvc = nullptr;

    HAConfig cfgData{};
    volatile bool autoconfigPending = false;
    volatile bool refreshRequested = false;
    volatile bool startupReady_ = true;
    bool published = false;
    char deviceId[32] = {0};
    char deviceIdent[72] = {0};
    char nodeTopicId[32] = {0};
    uint16_t entityHash3_ = 0;

    char topicBuf[TOPIC_BUF_SIZE] = {0};
    char payloadBuf[PAYLOAD_BUF_SIZE] = {0};
    char availabilityTopic_[TOPIC_BUF_SIZE] = {0};
    char stateTopicBuf[TOPIC_BUF_SIZE] = {0};
    char commandTopicBuf[TOPIC_BUF_SIZE] = {0};
    char objectIdBuf[96] = {0};

    HASensorEntry sensors_[MAX_HA_SENSORS]{};
    uint8_t sensorCount_ = 0;
    HASwitchEntry switches_[MAX_HA_SWITCHES]{};
    uint8_t switchCount_ = 0;
    HANumberEntry numbers_[MAX_HA_NUMBERS]{};
    uint8_t numberCount_ = 0;
    HAButtonEntry buttons_[MAX_HA_BUTTONS]{};
    uint8_t buttonCount_ = 0;

    HAService haSvc{};

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Ha::Enabled),"enabled","ha",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> vendorVar {
        NVS_KEY(NvsKeys::Ha::Vendor),"vendor","ha",ConfigType::CharArray,
        (char*)cfgData.vendor,ConfigPersistence::Persistent,sizeof(cfgData.vendor)
    };
    ConfigVariable<char> deviceIdVar {
        NVS_KEY(NvsKeys::Ha::DeviceId),"device_id","ha",ConfigType::CharArray,
        (char*)cfgData.deviceId,ConfigPersistence::Persistent,sizeof(cfgData.deviceId)
    };
    ConfigVariable<char> prefixVar {
        NVS_KEY(NvsKeys::Ha::DiscoveryPrefix),"discovery_prefix","ha",ConfigType::CharArray,
        (char*)cfgData.discoveryPrefix,ConfigPersistence::Persistent,sizeof(cfgData.discoveryPrefix)
    };
    ConfigVariable<char> modelVar {
        NVS_KEY(NvsKeys::Ha::Model),"model","ha",ConfigType::CharArray,
        (char*)cfgData.model,ConfigPersistence::Persistent,sizeof(cfgData.model)
    };

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);
    void signalAutoconfigCheck();
    void requestAutoconfigRefresh();
    void refreshIdentityFromConfig();
    void tryPublishAutoconfig();
    bool publishRegisteredEntities();

    template <typename T, size_t N>
    bool upsertEntry(T (&table)[N], uint8_t& count, const T& entry);

    bool buildObjectId(const char* suffix, char* out, size_t outLen) const;
    void fillCommon(DiscoveryDoc& doc, const char* component, const char* objectId,
                    const char* name, const char* entityCategory, const char* icon);

    bool publishSensor(const HASensorEntry& e);
    bool publishSwitch(const HASwitchEntry& e);
    bool publishNumber(const HANumberEntry& e);
    bool publishButton(const HAButtonEntry& e);
    bool publishDiscovery(const char* component, const char* objectId, const DiscoveryDoc& doc);

    static void makeHexNodeId(char* out, size_t len);
    static void sanitizeId(const char* in, char* out, size_t outLen);
    static uint16_t hash3Digits(const char* in);

    static bool svcAddSensor(void* ctx, const HASensorEntry* entry);
    static bool svcAddSwitch(void* ctx, const HASwitchEntry* entry);
    static bool svcAddNumber(void* ctx, const HANumberEntry* entry);
    static bool svcAddButton(void* ctx, const HAButtonEntry* entry);
};
