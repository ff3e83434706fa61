#pragma once
/**
 * @file MQTTModule.h
 * @brief MQTT client module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/ErrorCodes.h"
#include "Core/Services/Services.h"
#include <AsyncMqttClient.h>

/** @brief MQTT configuration values. */
struct MQTTConfig {
    bool enabled = true;
    char host[Limits::Mqtt::Buffers::Host] = "";
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = "";
    char pass[Limits::Mqtt::Buffers::Pass] = "";
    char baseTopic[Limits::Mqtt::Buffers::BaseTopic] = "minaret";
};

/** @brief MQTT connection state. */
enum class MQTTState : uint8_t { Disabled, WaitingNetwork, Connecting, Connected, ErrorWait };

/**
 * @brief Active module that manages the MQTT client connection.
 *
 * Routes `cmd` and `cfg/set` to the command and config services, keeps the
 * retained `cfg/<module>` blocks current and runs runtime publishers, either
 * periodically or when the DataStore reports matching dirty flags.
 */
class MQTTModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "mqtt"; }
    /** @brief Task name. */
    const char* taskName() const override { return "mqtt"; }

    /** @brief MQTT depends on log hub, WiFi, command, config and datastore services. */
    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "wifi";
        if (i == 2) return "cmd";
        if (i == 3) return "config";
        if (i == 4) return "datastore";
        return nullptr;
    }

    /** @brief Initialize MQTT config/services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief MQTT task loop. */
    void loop() override;
    /** @brief Extra stack for MQTT processing (JSON + snprintf heavy path). */
    uint16_t taskStackSize() const override { return Limits::Mqtt::TaskStackSize; }

    using BuildFn = bool (*)(MQTTModule* self, char* out, size_t outLen);

    struct RuntimePublisher {
        const char* topic = nullptr;
        uint32_t periodMs = 0;
        uint32_t dirtyMask = 0;
        int qos = 0;
        bool retain = false;
        uint32_t lastMs = 0;
        volatile bool pending = false;
        BuildFn build = nullptr;
    };

    /**
     * @brief Register a runtime publisher.
     *
     * `periodMs == 0` disables periodic publication; `dirtyMask == 0` disables
     * change-driven publication. Both are rate-limited by
     * `Limits::Mqtt::Defaults::DirtyMinPublishMs`.
     */
    bool addRuntimePublisher(const char* topic, uint32_t periodMs, uint32_t dirtyMask,
                             int qos, bool retain, BuildFn build);
    bool publish(const char* topic, const char* payload, int qos = 0, bool retain = false);
    void formatTopic(char* out, size_t outLen, const char* suffix) const;
    bool isConnected() const { return state_ == MQTTState::Connected; }
    DataStore* dataStorePtr() const { return dataStore_; }
    void setStartupReady(bool ready) { startupReady_ = ready; }

private:
    struct RxMsg {
        char topic[Limits::Mqtt::Buffers::RxTopic];
        char payload[Limits::Mqtt::Buffers::RxPayload];
    };

    MQTTConfig cfgData;
    MQTTState state_ = MQTTState::WaitingNetwork;
    uint32_t stateTs_ = 0;

    AsyncMqttClient client_;

    const CommandService* cmdSvc_ = nullptr;
    const ConfigStoreService* cfgSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;

    char deviceId_[Limits::Mqtt::Buffers::DeviceId] = {0};
    char topicCmd_[Limits::Mqtt::Buffers::Topic] = {0};
    char topicAck_[Limits::Mqtt::Buffers::Topic] = {0};
    char topicStatus_[Limits::Mqtt::Buffers::Topic] = {0};
    char topicCfgSet_[Limits::Mqtt::Buffers::Topic] = {0};
    char topicCfgAck_[Limits::Mqtt::Buffers::Topic] = {0};

    RuntimePublisher publishers_[Limits::Mqtt::Capacity::MaxPublishers] = {};
    uint8_t publisherCount_ = 0;

    const char* cfgModules_[Limits::Mqtt::Capacity::CfgTopicMax] = {nullptr};
    uint8_t cfgModuleCount_ = 0;
    // Modules whose retained cfg block must be republished.
    portMUX_TYPE pendingCfgMux_ = portMUX_INITIALIZER_UNLOCKED;
    const char* pendingCfg_[Limits::Mqtt::Capacity::CfgTopicMax] = {nullptr};
    uint8_t pendingCfgCount_ = 0;
    bool cfgRampActive_ = false;
    uint8_t cfgRampIndex_ = 0;
    uint32_t cfgRampNextMs_ = 0;

    QueueHandle_t rxQ_ = nullptr;
    char ackBuf_[Limits::Mqtt::Buffers::Ack] = {0};
    char replyBuf_[Limits::Mqtt::Buffers::Reply] = {0};
    char stateCfgBuf_[Limits::Mqtt::Buffers::StateCfg] = {0};
    char publishBuf_[Limits::Mqtt::Buffers::Publish] = {0};
    MqttService mqttSvc_{ nullptr, nullptr, nullptr, nullptr };

    uint32_t rxDropCount_ = 0;
    uint32_t oversizeDropCount_ = 0;
    uint32_t parseFailCount_ = 0;
    uint32_t handlerFailCount_ = 0;

    ConfigVariable<char> hostVar {
        NVS_KEY(NvsKeys::Mqtt::Host),"host","mqtt",ConfigType::CharArray,
        (char*)cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t> portVar {
        NVS_KEY(NvsKeys::Mqtt::Port),"port","mqtt",ConfigType::Int32,
        &cfgData.port,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> userVar {
        NVS_KEY(NvsKeys::Mqtt::User),"user","mqtt",ConfigType::CharArray,
        (char*)cfgData.user,ConfigPersistence::Persistent,sizeof(cfgData.user)
    };
    ConfigVariable<char> passVar {
        NVS_KEY(NvsKeys::Mqtt::Pass),"pass","mqtt",ConfigType::CharArray,
        (char*)cfgData.pass,ConfigPersistence::Persistent,sizeof(cfgData.pass)
    };
    ConfigVariable<char> baseTopicVar {
        NVS_KEY(NvsKeys::Mqtt::BaseTopic),"baseTopic","mqtt",ConfigType::CharArray,
        (char*)cfgData.baseTopic,ConfigPersistence::Persistent,sizeof(cfgData.baseTopic)
    };
    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Mqtt::Enabled),"enabled","mqtt",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };

    void setState_(MQTTState s);
    void buildTopics_();
    void refreshConfigModules_();
    void connectMqtt_();

    void processRx_(const RxMsg& msg);
    void processRxCmd_(const RxMsg& msg);
    void processRxCfgSet_(const RxMsg& msg);
    void publishRxError_(const char* ackTopic, ErrorCode code, const char* where, bool parseFailure);

    bool publishConfigModule_(const char* module, bool retained);
    void enqueueCfgModule_(const char* module);
    void processPendingCfgModules_();
    void beginConfigRamp_(uint32_t nowMs);
    void runConfigRamp_(uint32_t nowMs);
    void runPublishers_(uint32_t nowMs);

    void syncRxMetrics_();
    void countRxDrop_();
    void countOversizeDrop_();

    void onConnect_(bool sessionPresent);
    void onDisconnect_(AsyncMqttClientDisconnectReason reason);
    void onMessage_(char* topic, char* payload, AsyncMqttClientMessageProperties properties,
                    size_t len, size_t index, size_t total);

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    static bool svcPublish_(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    static void svcFormatTopic_(void* ctx, const char* suffix, char* out, size_t outLen);
    static bool svcIsConnected_(void* ctx);

    // ---- network warmup ----
    bool netReady_ = false;
    uint32_t netReadyTs_ = 0;
    volatile bool startupReady_ = true;

    // ---- retry backoff ----
    uint32_t retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;
    volatile bool pendingPublish_ = false;
};
