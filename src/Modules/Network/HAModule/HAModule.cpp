/**
 * @file HAModule.cpp
 * @brief Implementation file.
 */

#include "HAModule.h"
#include "Modules/Network/HAModule/HARuntime.h"
#include "Core/MqttTopics.h"
#include "Core/SystemLimits.h"
#include <esp_system.h>
#include <ctype.h>
#include <string.h>

#define LOG_TAG "HAModule"
#include "Core/ModuleLog.h"

#ifndef FIRMW
#define FIRMW "unknown"
#endif

static bool startsWith(const char* s, const char* prefix)
{
    if (!s || !prefix) return false;
    return strncmp(s, prefix, strlen(prefix)) == 0;
}

void HAModule::makeHexNodeId(char* out, size_t len)
{
    if (!out || len == 0) return;
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(out, len, "0x%02x%02x%02x%02x%02x%02x",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
}

void HAModule::sanitizeId(const char* in, char* out, size_t outLen)
{
    if (!out || outLen == 0) return;
    out[0] = '\0';
    if (!in) return;

    size_t w = 0;
    for (size_t i = 0; in[i] != '\0' && w + 1 < outLen; ++i) {
        const unsigned char c = (unsigned char)in[i];
        out[w++] = isalnum(c) ? (char)tolower(c) : '_';
    }
    out[w] = '\0';
}

uint16_t HAModule::hash3Digits(const char* in)
{
    // FNV-1a folded to three decimal digits.
    uint32_t h = 2166136261u;
    const char* p = in ? in : "";
    while (*p) {
        h ^= (uint8_t)(*p++);
        h *= 16777619u;
    }
    return (uint16_t)(h % 1000u);
}

bool HAModule::svcAddSensor(void* ctx, const HASensorEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    if (!entry->stateTopicSuffix || !entry->valueTemplate) return false;
    return self->upsertEntry(self->sensors_, self->sensorCount_, *entry);
}

bool HAModule::svcAddSwitch(void* ctx, const HASwitchEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    if (!entry->stateTopicSuffix || !entry->valueTemplate || !entry->commandTopicSuffix ||
        !entry->payloadOn || !entry->payloadOff) {
        return false;
    }
    return self->upsertEntry(self->switches_, self->switchCount_, *entry);
}

bool HAModule::svcAddNumber(void* ctx, const HANumberEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    if (!entry->stateTopicSuffix || !entry->valueTemplate || !entry->commandTopicSuffix || !entry->commandTemplate) {
        return false;
    }
    return self->upsertEntry(self->numbers_, self->numberCount_, *entry);
}

bool HAModule::svcAddButton(void* ctx, const HAButtonEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    if (!entry->commandTopicSuffix || !entry->payloadPress) return false;
    return self->upsertEntry(self->buttons_, self->buttonCount_, *entry);
}

template <typename T, size_t N>
bool HAModule::upsertEntry(T (&table)[N], uint8_t& count, const T& entry)
{
    if (!entry.ownerId || !entry.objectSuffix || !entry.name) return false;

    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(table[i].ownerId, entry.ownerId) == 0 &&
            strcmp(table[i].objectSuffix, entry.objectSuffix) == 0) {
            table[i] = entry;
            requestAutoconfigRefresh();
            return true;
        }
    }

    if (count >= N) {
        LOGW("HA entity table full owner=%s object=%s", entry.ownerId, entry.objectSuffix);
        return false;
    }
    table[count++] = entry;
    requestAutoconfigRefresh();
    return true;
}

bool HAModule::buildObjectId(const char* suffix, char* out, size_t outLen) const
{
    if (!suffix || !out || outLen == 0) return false;
    char raw[96] = {0};
    snprintf(raw, sizeof(raw), "minaret%03u_%s", (unsigned)entityHash3_, suffix);
    sanitizeId(raw, out, outLen);
    return out[0] != '\0';
}

void HAModule::fillCommon(DiscoveryDoc& doc, const char* component, const char* objectId,
                          const char* name, const char* entityCategory, const char* icon)
{
    doc["name"] = name;
    doc["object_id"] = objectId;

    char defaultEntityId[128] = {0};
    snprintf(defaultEntityId, sizeof(defaultEntityId), "%s.%s", component, objectId);
    doc["default_entity_id"] = defaultEntityId;

    char uniqueId[128] = {0};
    snprintf(uniqueId, sizeof(uniqueId), "%s_%s", deviceId, objectId);
    doc["unique_id"] = uniqueId;

    if (entityCategory && entityCategory[0] != '\0') doc["entity_category"] = entityCategory;
    if (icon && icon[0] != '\0') doc["icon"] = icon;

    if (availabilityTopic_[0] != '\0') {
        JsonObject avail = doc.createNestedArray("availability").createNestedObject();
        avail["topic"] = (const char*)availabilityTopic_;
        avail["value_template"] = "{{ 'online' if value_json.online else 'offline' }}";
        doc["payload_available"] = "online";
        doc["payload_not_available"] = "offline";
    }

    doc["origin"]["name"] = "Minaret";

    JsonObject dev = doc.createNestedObject("device");
    dev.createNestedArray("identifiers").add((const char*)deviceIdent);
    dev["name"] = (const char*)cfgData.vendor;
    dev["manufacturer"] = (const char*)cfgData.vendor;
    dev["model"] = (const char*)cfgData.model;
    dev["sw_version"] = FIRMW;
}

bool HAModule::publishDiscovery(const char* component, const char* objectId, const DiscoveryDoc& doc)
{
    if (!component || !objectId || !mqttSvc || !mqttSvc->publish) return false;

    if (doc.overflowed()) {
        LOGW("HA %s payload overflow object=%s", component, objectId);
        return false;
    }
    const size_t n = serializeJson(doc, payloadBuf, sizeof(payloadBuf));
    if (n == 0 || n >= sizeof(payloadBuf)) {
        LOGW("HA %s payload truncated object=%s", component, objectId);
        return false;
    }

    const int t = snprintf(topicBuf, sizeof(topicBuf), "%s/%s/%s/%s/config",
                           cfgData.discoveryPrefix, component, nodeTopicId, objectId);
    if (t < 0 || (size_t)t >= sizeof(topicBuf)) {
        LOGW("HA discovery topic truncated component=%s object=%s", component, objectId);
        return false;
    }
    return mqttSvc->publish(mqttSvc->ctx, topicBuf, payloadBuf, 1, true);
}

bool HAModule::publishSensor(const HASensorEntry& e)
{
    if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) return false;
    mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));

    DiscoveryDoc doc;
    fillCommon(doc, "sensor", objectIdBuf, e.name, e.entityCategory, e.icon);
    doc["state_topic"] = (const char*)stateTopicBuf;
    doc["value_template"] = e.valueTemplate;
    if (e.deviceClass && e.deviceClass[0] != '\0') doc["device_class"] = e.deviceClass;
    if (e.unit && e.unit[0] != '\0') {
        doc["unit_of_measurement"] = e.unit;
        if (!e.deviceClass) doc["state_class"] = "measurement";
    }
    return publishDiscovery("sensor", objectIdBuf, doc);
}

bool HAModule::publishSwitch(const HASwitchEntry& e)
{
    if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) return false;
    mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));
    mqttSvc->formatTopic(mqttSvc->ctx, e.commandTopicSuffix, commandTopicBuf, sizeof(commandTopicBuf));

    DiscoveryDoc doc;
    fillCommon(doc, "switch", objectIdBuf, e.name, e.entityCategory, e.icon);
    doc["state_topic"] = (const char*)stateTopicBuf;
    doc["value_template"] = e.valueTemplate;
    doc["state_on"] = "ON";
    doc["state_off"] = "OFF";
    doc["command_topic"] = (const char*)commandTopicBuf;
    doc["payload_on"] = e.payloadOn;
    doc["payload_off"] = e.payloadOff;
    return publishDiscovery("switch", objectIdBuf, doc);
}

bool HAModule::publishNumber(const HANumberEntry& e)
{
    if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) return false;
    mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));
    mqttSvc->formatTopic(mqttSvc->ctx, e.commandTopicSuffix, commandTopicBuf, sizeof(commandTopicBuf));

    DiscoveryDoc doc;
    fillCommon(doc, "number", objectIdBuf, e.name, e.entityCategory, e.icon);
    doc["state_topic"] = (const char*)stateTopicBuf;
    doc["value_template"] = e.valueTemplate;
    doc["command_topic"] = (const char*)commandTopicBuf;
    doc["command_template"] = e.commandTemplate;
    doc["min"] = e.minValue;
    doc["max"] = e.maxValue;
    doc["step"] = e.step;
    doc["mode"] = (e.mode && e.mode[0] != '\0') ? e.mode : "box";
    if (e.unit && e.unit[0] != '\0') doc["unit_of_measurement"] = e.unit;
    return publishDiscovery("number", objectIdBuf, doc);
}

bool HAModule::publishButton(const HAButtonEntry& e)
{
    if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) return false;
    mqttSvc->formatTopic(mqttSvc->ctx, e.commandTopicSuffix, commandTopicBuf, sizeof(commandTopicBuf));

    DiscoveryDoc doc;
    fillCommon(doc, "button", objectIdBuf, e.name, e.entityCategory, e.icon);
    doc["command_topic"] = (const char*)commandTopicBuf;
    doc["payload_press"] = e.payloadPress;
    return publishDiscovery("button", objectIdBuf, doc);
}

void HAModule::setStartupReady(bool ready)
{
    startupReady_ = ready;
    if (ready) {
        signalAutoconfigCheck();
    }
}

bool HAModule::publishRegisteredEntities()
{
    if (!mqttSvc || !mqttSvc->formatTopic) return false;

    const TickType_t stepDelay = pdMS_TO_TICKS(Limits::Ha::Timing::DiscoveryStepMs);
    mqttSvc->formatTopic(mqttSvc->ctx, MqttTopics::SuffixStatus, availabilityTopic_, sizeof(availabilityTopic_));

    bool okAll = true;
    for (uint8_t i = 0; i < sensorCount_; ++i) {
        if (!publishSensor(sensors_[i])) okAll = false;
        vTaskDelay(stepDelay);
    }
    for (uint8_t i = 0; i < switchCount_; ++i) {
        if (!publishSwitch(switches_[i])) okAll = false;
        vTaskDelay(stepDelay);
    }
    for (uint8_t i = 0; i < numberCount_; ++i) {
        if (!publishNumber(numbers_[i])) okAll = false;
        vTaskDelay(stepDelay);
    }
    for (uint8_t i = 0; i < buttonCount_; ++i) {
        if (!publishButton(buttons_[i])) okAll = false;
        vTaskDelay(stepDelay);
    }
    return okAll;
}

void HAModule::refreshIdentityFromConfig()
{
    if (cfgData.deviceId[0] != '\0') {
        strncpy(deviceId, cfgData.deviceId, sizeof(deviceId) - 1);
        deviceId[sizeof(deviceId) - 1] = '\0';
    } else {
        makeHexNodeId(deviceId, sizeof(deviceId));
    }
    sanitizeId(deviceId, nodeTopicId, sizeof(nodeTopicId));
    if (nodeTopicId[0] == '\0') {
        snprintf(nodeTopicId, sizeof(nodeTopicId), "minaret");
    }
    snprintf(deviceIdent, sizeof(deviceIdent), "%s-%s", cfgData.vendor, deviceId);
    entityHash3_ = hash3Digits(deviceId);
}

void HAModule::tryPublishAutoconfig()
{
    if (published && !refreshRequested) return;
    if (!startupReady_) return;
    refreshIdentityFromConfig();
    if (!cfgData.enabled) return;
    if (!mqttSvc || !mqttSvc->isConnected || !dsSvc || !dsSvc->store) return;
    if (!mqttSvc->isConnected(mqttSvc->ctx)) return;
    if (!mqttReady(*dsSvc->store)) return;

    // Registrations arriving mid-publish set refreshRequested again and get another pass.
    refreshRequested = false;
    if (publishRegisteredEntities()) {
        published = true;
        setHaDiscovery(*dsSvc->store, true,
                       (uint8_t)(sensorCount_ + switchCount_ + numberCount_ + buttonCount_));
        LOGI("Home Assistant auto-discovery published (sensor=%u switch=%u number=%u button=%u)",
             (unsigned)sensorCount_, (unsigned)switchCount_, (unsigned)numberCount_, (unsigned)buttonCount_);
    } else {
        refreshRequested = true;
        setHaDiscovery(*dsSvc->store, false, 0);
        LOGW("Home Assistant auto-discovery publish failed");
    }
}

void HAModule::onEventStatic(const Event& e, void* user)
{
    HAModule* self = static_cast<HAModule*>(user);
    if (self) self->onEvent(e);
}

void HAModule::onEvent(const Event& e)
{
    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (startsWith(p->nvsKey, "ha_")) {
            requestAutoconfigRefresh();
        }
        return;
    }

    if (e.id != EventId::DataChanged) return;
    const DataChangedPayload* payload = static_cast<const DataChangedPayload*>(e.payload);
    if (!payload || !dsSvc || !dsSvc->store) return;

    if (payload->id == DATAKEY_MQTT_READY) {
        // A broker restart may have lost retained discovery topics.
        if (mqttReady(*dsSvc->store)) requestAutoconfigRefresh();
        return;
    }
    if (payload->id == DATAKEY_WIFI_READY && wifiReady(*dsSvc->store)) {
        signalAutoconfigCheck();
    }
}

void HAModule::signalAutoconfigCheck()
{
    autoconfigPending = true;
    TaskHandle_t th = getTaskHandle();
    if (th) {
        xTaskNotifyGive(th);
    }
}

void HAModule::requestAutoconfigRefresh()
{
    published = false;
    refreshRequested = true;
    if (dsSvc && dsSvc->store) {
        setHaDiscovery(*dsSvc->store, false, 0);
    }
    signalAutoconfigCheck();
}

void HAModule::loop()
{
    if (!autoconfigPending) {
        (void)ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(30000));
    }
    // Failed passes are retried on the next wake-up.
    if (!autoconfigPending && published) return;
    autoconfigPending = false;
    tryPublishAutoconfig();
}

void HAModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(vendorVar);
    cfg.registerVar(deviceIdVar);
    cfg.registerVar(prefixVar);
    cfg.registerVar(modelVar);

    eventBusSvc = services.get<EventBusService>("eventbus");
    dsSvc = services.get<DataStoreService>("datastore");
    mqttSvc = services.get<MqttService>("mqtt");

    haSvc.addSensor = HAModule::svcAddSensor;
    haSvc.addSwitch = HAModule::svcAddSwitch;
    haSvc.addNumber = HAModule::svcAddNumber;
    haSvc.addButton = HAModule::svcAddButton;
    haSvc.ctx = this;
    services.add("ha", &haSvc);

    if (dsSvc && dsSvc->store) {
        setHaDiscovery(*dsSvc->store, false, 0);
    }

    if (eventBusSvc && eventBusSvc->bus) {
        eventBusSvc->bus->subscribe(EventId::DataChanged, &HAModule::onEventStatic, this);
        eventBusSvc->bus->subscribe(EventId::ConfigChanged, &HAModule::onEventStatic, this);
    }
}
