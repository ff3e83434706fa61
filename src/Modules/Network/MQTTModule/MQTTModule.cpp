/**
 * @file MQTTModule.cpp
 * @brief Implementation file.
 */
#include "MQTTModule.h"
#include "Core/Runtime.h"
#include "Core/MqttTopics.h"
#include <ArduinoJson.h>
#include <WiFi.h>
#include <esp_system.h>
#include <initializer_list>
#include "Core/EventBus/EventPayloads.h"
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = esp_random();
    uint32_t delta = r % (2U * span + 1U);
    int32_t signedDelta = (int32_t)delta - (int32_t)span;
    int32_t out = (int32_t)baseMs + signedDelta;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

static bool isAnyOf(const char* key, std::initializer_list<const char*> keys)
{
    if (!key || key[0] == '\0') return false;
    for (const char* candidate : keys) {
        if (candidate && strcmp(key, candidate) == 0) return true;
    }
    return false;
}

static bool isMqttConnKey(const char* key)
{
    return isAnyOf(key, {
        NvsKeys::Mqtt::BaseTopic,
        NvsKeys::Mqtt::Host,
        NvsKeys::Mqtt::Port,
        NvsKeys::Mqtt::User,
        NvsKeys::Mqtt::Pass,
        NvsKeys::Mqtt::Enabled
    });
}

static void makeDeviceId(char* out, size_t len) {
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(out, len, "ESP32-%02X%02X%02X", mac[3], mac[4], mac[5]);
}

bool MQTTModule::svcPublish_(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->publish(topic, payload, qos, retain) : false;
}

void MQTTModule::svcFormatTopic_(void* ctx, const char* suffix, char* out, size_t outLen)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    if (!self) return;
    self->formatTopic(out, outLen, suffix);
}

bool MQTTModule::svcIsConnected_(void* ctx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->isConnected() : false;
}

void MQTTModule::setState_(MQTTState s)
{
    state_ = s;
    stateTs_ = millis();
    if (dataStore_) {
        setMqttReady(*dataStore_, s == MQTTState::Connected);
    }
}

void MQTTModule::buildTopics_()
{
    formatTopic(topicCmd_, sizeof(topicCmd_), MqttTopics::SuffixCmd);
    formatTopic(topicAck_, sizeof(topicAck_), MqttTopics::SuffixAck);
    formatTopic(topicStatus_, sizeof(topicStatus_), MqttTopics::SuffixStatus);
    formatTopic(topicCfgSet_, sizeof(topicCfgSet_), MqttTopics::SuffixCfgSet);
    formatTopic(topicCfgAck_, sizeof(topicCfgAck_), MqttTopics::SuffixCfgAck);
}

void MQTTModule::connectMqtt_()
{
    buildTopics_();
    client_.setServer(cfgData.host, (uint16_t)cfgData.port);
    if (cfgData.user[0] != '\0') client_.setCredentials(cfgData.user, cfgData.pass);
    client_.setWill(topicStatus_, 1, true, "{\"online\":false}");
    client_.connect();
    setState_(MQTTState::Connecting);
    LOGI("Connecting to %s:%ld", cfgData.host, (long)cfgData.port);
}

void MQTTModule::onConnect_(bool)
{
    LOGI("Connected subscribe %s", topicCmd_);
    client_.subscribe(topicCmd_, 0);
    client_.subscribe(topicCfgSet_, 1);

    retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;
    setState_(MQTTState::Connected);

    (void)publish(topicStatus_, "{\"online\":true}", 1, true);

    for (uint8_t i = 0; i < publisherCount_; ++i) {
        publishers_[i].pending = true;
    }
    // cfg/* is published from loop() at a paced rate.
    pendingPublish_ = true;
}

void MQTTModule::onDisconnect_(AsyncMqttClientDisconnectReason reason)
{
    LOGW("Disconnected (reason=%u)", (unsigned)reason);
    cfgRampActive_ = false;
    cfgRampIndex_ = 0;
    if (state_ != MQTTState::Disabled) setState_(MQTTState::ErrorWait);
}

void MQTTModule::onMessage_(char* topic, char* payload, AsyncMqttClientMessageProperties,
                            size_t len, size_t, size_t total)
{
    if (!rxQ_) return;
    if (!topic || !payload || len != total) {
        countRxDrop_();
        return;
    }

    const size_t topicLen = strlen(topic);
    if (topicLen >= sizeof(RxMsg{}.topic) || len >= sizeof(RxMsg{}.payload)) {
        countOversizeDrop_();
        return;
    }

    RxMsg m{};
    memcpy(m.topic, topic, topicLen);
    m.topic[topicLen] = '\0';
    memcpy(m.payload, payload, len);
    m.payload[len] = '\0';

    if (xQueueSend(rxQ_, &m, 0) != pdTRUE) {
        countRxDrop_();
    }
}

void MQTTModule::refreshConfigModules_()
{
    if (cfgSvc_ && cfgSvc_->listModules) {
        cfgModuleCount_ = cfgSvc_->listModules(cfgSvc_->ctx, cfgModules_, Limits::Mqtt::Capacity::CfgTopicMax);
        if (cfgModuleCount_ >= Limits::Mqtt::Capacity::CfgTopicMax) {
            LOGW("Config module list reached limit (%u), some cfg/* blocks may be omitted",
                 (unsigned)Limits::Mqtt::Capacity::CfgTopicMax);
        }
    } else {
        cfgModuleCount_ = 0;
    }
}

bool MQTTModule::publishConfigModule_(const char* module, bool retained)
{
    if (!module || module[0] == '\0') return false;
    if (!cfgSvc_ || !cfgSvc_->toJsonModule) return false;

    char moduleTopic[Limits::Mqtt::Buffers::DynamicTopic] = {0};
    const int tw = snprintf(moduleTopic, sizeof(moduleTopic), "%s/%s/cfg/%s", cfgData.baseTopic, deviceId_, module);
    if (!(tw > 0 && (size_t)tw < sizeof(moduleTopic))) {
        LOGW("cfg publish: topic truncated for module=%s", module);
        return false;
    }

    bool truncated = false;
    const bool any = cfgSvc_->toJsonModule(cfgSvc_->ctx, module, stateCfgBuf_, sizeof(stateCfgBuf_), &truncated);
    if (truncated) {
        LOGW("cfg/%s truncated (buffer=%u)", module, (unsigned)sizeof(stateCfgBuf_));
        // Never publish partial JSON.
        if (!writeErrorJson(stateCfgBuf_, sizeof(stateCfgBuf_), ErrorCode::CfgTruncated, "cfg")) {
            snprintf(stateCfgBuf_, sizeof(stateCfgBuf_), "{\"ok\":false}");
        }
    } else if (!any) {
        return false;
    }

    if (!publish(moduleTopic, stateCfgBuf_, 1, retained)) {
        LOGW("cfg/%s publish failed", module);
        return false;
    }
    return true;
}

void MQTTModule::enqueueCfgModule_(const char* module)
{
    if (!module || module[0] == '\0') {
        pendingPublish_ = true;
        return;
    }

    portENTER_CRITICAL(&pendingCfgMux_);
    bool known = false;
    for (uint8_t i = 0; i < pendingCfgCount_; ++i) {
        if (strcmp(pendingCfg_[i], module) == 0) { known = true; break; }
    }
    if (!known) {
        if (pendingCfgCount_ < Limits::Mqtt::Capacity::CfgTopicMax) {
            pendingCfg_[pendingCfgCount_++] = module;
        } else {
            pendingPublish_ = true;
        }
    }
    portEXIT_CRITICAL(&pendingCfgMux_);
}

void MQTTModule::processPendingCfgModules_()
{
    const char* modules[Limits::Mqtt::Capacity::CfgTopicMax] = {nullptr};
    uint8_t n = 0;

    portENTER_CRITICAL(&pendingCfgMux_);
    n = pendingCfgCount_;
    for (uint8_t i = 0; i < n; ++i) modules[i] = pendingCfg_[i];
    pendingCfgCount_ = 0;
    portEXIT_CRITICAL(&pendingCfgMux_);

    for (uint8_t i = 0; i < n; ++i) {
        if (!publishConfigModule_(modules[i], true)) pendingPublish_ = true;
    }
}

void MQTTModule::beginConfigRamp_(uint32_t nowMs)
{
    refreshConfigModules_();
    cfgRampIndex_ = 0;
    cfgRampNextMs_ = nowMs;
    cfgRampActive_ = (cfgModuleCount_ > 0);
}

void MQTTModule::runConfigRamp_(uint32_t nowMs)
{
    if (!cfgRampActive_) return;
    if ((int32_t)(nowMs - cfgRampNextMs_) < 0) return;
    if (cfgRampIndex_ >= cfgModuleCount_) {
        cfgRampActive_ = false;
        return;
    }

    (void)publishConfigModule_(cfgModules_[cfgRampIndex_], true);
    ++cfgRampIndex_;
    cfgRampNextMs_ = nowMs + Limits::Mqtt::Timing::CfgRampStepMs;
    if (cfgRampIndex_ >= cfgModuleCount_) cfgRampActive_ = false;
}

void MQTTModule::runPublishers_(uint32_t nowMs)
{
    for (uint8_t i = 0; i < publisherCount_; ++i) {
        RuntimePublisher& p = publishers_[i];
        if (!p.topic || !p.build) continue;

        const uint32_t elapsed = (uint32_t)(nowMs - p.lastMs);
        const bool periodic = (p.periodMs != 0) && (elapsed >= p.periodMs);
        const bool dirty = p.pending && (elapsed >= Limits::Mqtt::Defaults::DirtyMinPublishMs);
        if (!periodic && !dirty) continue;

        p.pending = false;
        p.lastMs = nowMs;
        if (!p.build(this, publishBuf_, sizeof(publishBuf_))) {
            LOGW("runtime snapshot build failed topic=%s (buffer=%u)", p.topic, (unsigned)sizeof(publishBuf_));
            continue;
        }
        (void)publish(p.topic, publishBuf_, p.qos, p.retain);
    }
}

bool MQTTModule::publish(const char* topic, const char* payload, int qos, bool retain)
{
    if (!topic || !payload) return false;
    if (state_ != MQTTState::Connected) return false;
    const uint16_t packetId = client_.publish(topic, qos, retain, payload);
    if (packetId == 0U) {
        LOGW("mqtt publish rejected topic=%s qos=%d retain=%d", topic, qos, retain ? 1 : 0);
        return false;
    }
    LOGD("MQTT TX t=%s r=%d %s", topic, retain ? 1 : 0, payload);
    return true;
}

void MQTTModule::formatTopic(char* out, size_t outLen, const char* suffix) const
{
    if (!out || outLen == 0 || !suffix) return;
    snprintf(out, outLen, "%s/%s/%s", cfgData.baseTopic, deviceId_, suffix);
}

bool MQTTModule::addRuntimePublisher(const char* topic, uint32_t periodMs, uint32_t dirtyMask,
                                     int qos, bool retain, BuildFn build)
{
    if (!topic || !build) return false;
    if (publisherCount_ >= Limits::Mqtt::Capacity::MaxPublishers) return false;
    RuntimePublisher& p = publishers_[publisherCount_++];
    p.topic = topic;
    p.periodMs = periodMs;
    p.dirtyMask = dirtyMask;
    p.qos = qos;
    p.retain = retain;
    p.build = build;
    p.lastMs = 0;
    p.pending = true;
    return true;
}

void MQTTModule::processRx_(const RxMsg& msg)
{
    if (strcmp(msg.topic, topicCmd_) == 0) return processRxCmd_(msg);
    if (strcmp(msg.topic, topicCfgSet_) == 0) return processRxCfgSet_(msg);
    publishRxError_(topicAck_, ErrorCode::UnknownTopic, "rx", false);
}

void MQTTModule::processRxCmd_(const RxMsg& msg)
{
    static StaticJsonDocument<Limits::JsonCmdBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, msg.payload);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGW("processRxCmd: bad cmd json (topic=%s)", msg.topic);
        publishRxError_(topicAck_, ErrorCode::BadCmdJson, "cmd", true);
        return;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonVariantConst cmdVar = root["cmd"];
    const char* cmdVal = cmdVar.is<const char*>() ? cmdVar.as<const char*>() : nullptr;
    if (!cmdVal || cmdVal[0] == '\0') {
        LOGW("processRxCmd: missing cmd field");
        publishRxError_(topicAck_, ErrorCode::MissingCmd, "cmd", true);
        return;
    }
    if (!cmdSvc_ || !cmdSvc_->execute) {
        LOGW("processRxCmd: command service unavailable (cmd=%s)", cmdVal);
        publishRxError_(topicAck_, ErrorCode::CmdServiceUnavailable, "cmd", false);
        return;
    }

    char cmd[Limits::Mqtt::Buffers::CmdName];
    size_t clen = strlen(cmdVal);
    if (clen >= sizeof(cmd)) clen = sizeof(cmd) - 1;
    memcpy(cmd, cmdVal, clen);
    cmd[clen] = '\0';

    const char* argsJson = nullptr;
    char argsBuf[Limits::Mqtt::Buffers::CmdArgs] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            LOGW("processRxCmd: args too large (cmd=%s)", cmd);
            publishRxError_(topicAck_, ErrorCode::ArgsTooLarge, "cmd", true);
            return;
        }
        argsJson = argsBuf;
    }

    replyBuf_[0] = '\0';
    const bool ok = cmdSvc_->execute(cmdSvc_->ctx, cmd, msg.payload, argsJson, replyBuf_, sizeof(replyBuf_));
    if (!ok) {
        LOGW("processRxCmd: command handler failed (cmd=%s)", cmd);
        // Handlers write a structured error reply; forward it when present.
        if (replyBuf_[0] == '{') {
            ++handlerFailCount_;
            syncRxMetrics_();
            if (!publish(topicAck_, replyBuf_, 0, false)) LOGW("cmd error ack publish failed cmd=%s", cmd);
            return;
        }
        publishRxError_(topicAck_, ErrorCode::CmdHandlerFailed, "cmd", false);
        return;
    }

    const int wrote = snprintf(ackBuf_, sizeof(ackBuf_), "{\"ok\":true,\"cmd\":\"%s\",\"reply\":%s}",
                               cmd, replyBuf_[0] ? replyBuf_ : "{}");
    if (!(wrote > 0 && (size_t)wrote < sizeof(ackBuf_))) {
        LOGW("processRxCmd: ack overflow (cmd=%s, wrote=%d)", cmd, wrote);
        publishRxError_(topicAck_, ErrorCode::InternalAckOverflow, "cmd", false);
        return;
    }
    if (!publish(topicAck_, ackBuf_, 0, false)) {
        LOGW("cmd ack publish failed cmd=%s", cmd);
    }
}

void MQTTModule::processRxCfgSet_(const RxMsg& msg)
{
    if (!cfgSvc_ || !cfgSvc_->applyJson) {
        publishRxError_(topicCfgAck_, ErrorCode::CfgServiceUnavailable, "cfg/set", false);
        return;
    }

    static StaticJsonDocument<Limits::JsonCfgBuf> cfgDoc;
    cfgDoc.clear();
    const DeserializationError cfgErr = deserializeJson(cfgDoc, msg.payload);
    if (cfgErr || !cfgDoc.is<JsonObjectConst>()) {
        publishRxError_(topicCfgAck_, ErrorCode::BadCfgJson, "cfg/set", true);
        return;
    }

    if (!cfgSvc_->applyJson(cfgSvc_->ctx, msg.payload)) {
        publishRxError_(topicCfgAck_, ErrorCode::CfgApplyFailed, "cfg/set", false);
        return;
    }
    // cfg/<module> blocks follow from the ConfigChanged events.

    if (!writeOkJson(ackBuf_, sizeof(ackBuf_), "cfg/set")) {
        snprintf(ackBuf_, sizeof(ackBuf_), "{\"ok\":true}");
    }
    if (!publish(topicCfgAck_, ackBuf_, 1, false)) {
        LOGW("cfg/set ack publish failed");
    }
}

void MQTTModule::publishRxError_(const char* ackTopic, ErrorCode code, const char* where, bool parseFailure)
{
    if (!ackTopic || ackTopic[0] == '\0') return;
    if (parseFailure) ++parseFailCount_;
    else ++handlerFailCount_;
    syncRxMetrics_();

    if (!writeErrorJson(ackBuf_, sizeof(ackBuf_), code, where)) {
        snprintf(ackBuf_, sizeof(ackBuf_), "{\"ok\":false}");
    }
    if (!publish(ackTopic, ackBuf_, 0, false)) {
        LOGW("rx error ack publish failed topic=%s", ackTopic);
    }
}

void MQTTModule::syncRxMetrics_()
{
    if (!dataStore_) return;
    setMqttRxDrop(*dataStore_, rxDropCount_);
    setMqttOversizeDrop(*dataStore_, oversizeDropCount_);
    setMqttParseFail(*dataStore_, parseFailCount_);
    setMqttHandlerFail(*dataStore_, handlerFailCount_);
}

void MQTTModule::countRxDrop_()
{
    ++rxDropCount_;
    syncRxMetrics_();
}

void MQTTModule::countOversizeDrop_()
{
    ++oversizeDropCount_;
    ++rxDropCount_;
    syncRxMetrics_();
}

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);
    cfg.registerVar(baseTopicVar);
    cfg.registerVar(enabledVar);

    cmdSvc_ = services.get<CommandService>("cmd");
    cfgSvc_ = services.get<ConfigStoreService>("config");

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;
    syncRxMetrics_();

    mqttSvc_.publish = MQTTModule::svcPublish_;
    mqttSvc_.formatTopic = MQTTModule::svcFormatTopic_;
    mqttSvc_.isConnected = MQTTModule::svcIsConnected_;
    mqttSvc_.ctx = this;
    services.add("mqtt", &mqttSvc_);

    if (eventBus_) {
        eventBus_->subscribe(EventId::DataChanged, &MQTTModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::DataSnapshotAvailable, &MQTTModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::ConfigChanged, &MQTTModule::onEventStatic_, this);
    }

    makeDeviceId(deviceId_, sizeof(deviceId_));
    buildTopics_();

    rxQ_ = xQueueCreate(Limits::Mqtt::Capacity::RxQueueLen, sizeof(RxMsg));
    if (!rxQ_) LOGE("RX queue allocation failed");

    client_.onConnect([this](bool sp){ this->onConnect_(sp); });
    client_.onDisconnect([this](AsyncMqttClientDisconnectReason r){ this->onDisconnect_(r); });
    client_.onMessage([this](char* t, char* p, AsyncMqttClientMessageProperties pr, size_t l, size_t i, size_t tot){
        this->onMessage_(t, p, pr, l, i, tot);
    });

    LOGI("Init id=%s topic=%s", deviceId_, topicCmd_);

    netReady_ = dataStore_ ? wifiReady(*dataStore_) : false;
    netReadyTs_ = millis();
    retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;

    setState_(cfgData.enabled ? MQTTState::WaitingNetwork : MQTTState::Disabled);
}

void MQTTModule::loop()
{
    if (!cfgData.enabled) {
        if (state_ != MQTTState::Disabled) {
            setState_(MQTTState::Disabled);
            client_.disconnect();
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::DisabledDelayMs));
        return;
    }

    switch (state_) {
    case MQTTState::Disabled:
        setState_(MQTTState::WaitingNetwork);
        break;
    case MQTTState::WaitingNetwork:
        if (!startupReady_ || !netReady_) break;
        if (cfgData.host[0] == '\0') break;
        if (millis() - netReadyTs_ >= Limits::Mqtt::Timing::NetWarmupMs) connectMqtt_();
        break;
    case MQTTState::Connecting:
        if (millis() - stateTs_ > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            client_.disconnect();
            setState_(MQTTState::ErrorWait);
        }
        break;
    case MQTTState::Connected: {
        RxMsg m;
        while (rxQ_ && xQueueReceive(rxQ_, &m, 0) == pdTRUE) processRx_(m);

        const uint32_t now = millis();
        if (pendingPublish_) {
            pendingPublish_ = false;
            beginConfigRamp_(now);
        }
        processPendingCfgModules_();
        runConfigRamp_(now);
        runPublishers_(now);
        break;
    }
    case MQTTState::ErrorWait:
        if (!netReady_) {
            setState_(MQTTState::WaitingNetwork);
            break;
        }
        if (millis() - stateTs_ >= retryDelayMs_) {
            uint32_t next = retryDelayMs_;
            if      (next < Limits::Mqtt::Backoff::Step1Ms)   next = Limits::Mqtt::Backoff::Step1Ms;
            else if (next < Limits::Mqtt::Backoff::Step2Ms)   next = Limits::Mqtt::Backoff::Step2Ms;
            else if (next < Limits::Mqtt::Backoff::Step3Ms)   next = Limits::Mqtt::Backoff::Step3Ms;
            else if (next < Limits::Mqtt::Backoff::Step4Ms)   next = Limits::Mqtt::Backoff::Step4Ms;
            else                                               next = Limits::Mqtt::Backoff::MaxMs;
            retryDelayMs_ = jitterMs(next, Limits::Mqtt::Backoff::JitterPct);
            if (retryDelayMs_ < Limits::Mqtt::Backoff::MinMs) retryDelayMs_ = Limits::Mqtt::Backoff::MinMs;
            netReadyTs_ = millis() - Limits::Mqtt::Timing::NetWarmupMs;
            setState_(MQTTState::WaitingNetwork);
        }
        break;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::LoopDelayMs));
}

void MQTTModule::onEventStatic_(const Event& e, void* user)
{
    static_cast<MQTTModule*>(user)->onEvent_(e);
}

void MQTTModule::onEvent_(const Event& e)
{
    if (e.id == EventId::DataChanged) {
        if (!e.payload || e.len < sizeof(DataChangedPayload)) return;
        const DataChangedPayload* p = (const DataChangedPayload*)e.payload;
        if (p->id != DATAKEY_WIFI_READY || !dataStore_) return;

        const bool ready = wifiReady(*dataStore_);
        if (ready == netReady_) return;
        netReady_ = ready;
        netReadyTs_ = millis();

        if (netReady_) {
            LOGI("Network ready -> warmup");
            if (state_ != MQTTState::Connected) setState_(MQTTState::WaitingNetwork);
        } else {
            LOGI("Network lost -> disconnect and wait");
            client_.disconnect();
            setState_(MQTTState::WaitingNetwork);
        }
        return;
    }

    if (e.id == EventId::DataSnapshotAvailable) {
        if (!e.payload || e.len < sizeof(DataSnapshotPayload)) return;
        const DataSnapshotPayload* p = (const DataSnapshotPayload*)e.payload;
        for (uint8_t i = 0; i < publisherCount_; ++i) {
            if ((publishers_[i].dirtyMask & p->dirtyFlags) != 0U) publishers_[i].pending = true;
        }
        return;
    }

    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        const char* key = p->nvsKey;
        if (key[0] == '\0') return;

        if (isMqttConnKey(key)) {
            LOGI("MQTT config changed (%s) -> reconnect", key);
            client_.disconnect();
            netReadyTs_ = millis();
            setState_(MQTTState::WaitingNetwork);
        }

        const char* module = (cfgSvc_ && cfgSvc_->moduleForKey) ? cfgSvc_->moduleForKey(cfgSvc_->ctx, key) : nullptr;
        enqueueCfgModule_(module);
    }
}
