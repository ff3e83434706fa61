/**
 * @file TimeModule.cpp
 * @brief Implementation file.
 */
#include "TimeModule.h"
#include "Core/Runtime.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <time.h>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <cctype>
#define LOG_TAG "TimeModl"
#include "Core/ModuleLog.h"

// Anything earlier means the RTC still runs from its power-on value.
static constexpr time_t SCHED_MIN_VALID_EPOCH = (time_t)1609459200; // 2021-01-01

static bool parseCmdArgsObject(const CommandRequest& req, StaticJsonDocument<Limits::JsonCmdTimeBuf>& doc)
{
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) return false;
    // Accept both a bare args object and a full command envelope.
    if (doc["args"].is<JsonObject>()) {
        StaticJsonDocument<Limits::JsonCmdTimeBuf> inner;
        inner.set(doc["args"]);
        doc.set(inner.as<JsonVariantConst>());
    }
    return true;
}

void TimeModule::setState_(TimeSyncState s)
{
    const TimeSyncState prev = state_;
    state_ = s;
    stateTs_ = millis();

    if (dataStore_) {
        setTimeReady(*dataStore_, s == TimeSyncState::Synced, (uint64_t)time(nullptr));
    }

    if (prev != TimeSyncState::Synced && s == TimeSyncState::Synced) {
        // First scan after (re)sync reports overdue one-shot slots as replayed.
        schedInitialized_ = false;
    } else if (prev == TimeSyncState::Synced && s != TimeSyncState::Synced) {
        portENTER_CRITICAL(&schedMux_);
        for (uint8_t i = 0; i < TIME_SCHED_MAX_SLOTS; ++i) {
            sched_[i].lastTriggerMinuteKey = INVALID_MINUTE_KEY;
        }
        schedInitialized_ = false;
        portEXIT_CRITICAL(&schedMux_);
    }
}

void TimeModule::applyTimeZone_()
{
    setenv("TZ", cfgData.tz, 1);
    tzset();
    lastDayKey_ = -1;
    LOGI("Time zone applied: %s", cfgData.tz);
}

bool TimeModule::svcIsSynced_(void* ctx)
{
    return static_cast<TimeModule*>(ctx)->state_ == TimeSyncState::Synced;
}

bool TimeModule::svcFormatLocalTime_(void*, char* out, size_t len)
{
    if (!out || len == 0) return false;
    time_t now = time(nullptr);
    struct tm t;
    if (!localtime_r(&now, &t)) return false;
    snprintf(out, len, "%04d-%02d-%02d %02d:%02d:%02d",
             t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
             t.tm_hour, t.tm_min, t.tm_sec);
    return true;
}

bool TimeModule::svcSchedSetSlot_(void* ctx, const TimeSchedulerSlot* slotDef)
{
    if (!ctx || !slotDef) return false;
    return static_cast<TimeModule*>(ctx)->setSlot_(*slotDef, false);
}

bool TimeModule::svcSchedGetSlot_(void* ctx, uint8_t slot, TimeSchedulerSlot* outDef)
{
    if (!ctx || !outDef) return false;
    return static_cast<TimeModule*>(ctx)->getSlot_(slot, *outDef);
}

bool TimeModule::svcSchedClearSlot_(void* ctx, uint8_t slot)
{
    if (!ctx) return false;
    return static_cast<TimeModule*>(ctx)->clearSlot_(slot);
}

uint8_t TimeModule::svcSchedUsedCount_(void* ctx)
{
    if (!ctx) return 0;
    return static_cast<TimeModule*>(ctx)->usedCount_();
}

void TimeModule::sanitizeLabel_(char* label)
{
    if (!label) return;
    label[TIME_SCHED_LABEL_MAX - 1] = '\0';
    for (size_t i = 0; i < TIME_SCHED_LABEL_MAX && label[i] != '\0'; ++i) {
        const unsigned char c = (unsigned char)label[i];
        if (!(isalnum(c) || c == '_' || c == '-' || c == '.')) {
            label[i] = '_';
        }
    }
}

void TimeModule::applySystemSlots_()
{
    TimeSchedulerSlot def{};
    def.slot = TIME_SLOT_SYS_DAY_START;
    def.eventId = TIME_EVENT_SYS_DAY_START;
    def.enabled = true;
    def.mode = TimeSchedulerMode::RecurringClock;
    def.weekdayMask = TIME_WEEKDAY_ALL;
    def.hour = 0;
    def.minute = 0;
    strncpy(def.label, "sys_day_start", sizeof(def.label) - 1);
    (void)setSlot_(def, true);
}

void TimeModule::resetScheduleRuntime_()
{
    portENTER_CRITICAL(&schedMux_);
    for (uint8_t i = 0; i < TIME_SCHED_MAX_SLOTS; ++i) {
        sched_[i] = SchedulerSlotRuntime{};
        sched_[i].def.slot = i;
    }
    schedInitialized_ = false;
    portEXIT_CRITICAL(&schedMux_);
}

bool TimeModule::setSlot_(const TimeSchedulerSlot& slotDef, bool system)
{
    if (slotDef.slot >= TIME_SCHED_MAX_SLOTS) return false;
    if (!system && slotDef.slot < TIME_SLOT_SYS_RESERVED_COUNT) return false;
    if (slotDef.mode == TimeSchedulerMode::RecurringClock) {
        if (slotDef.hour > 23 || slotDef.minute > 59) return false;
        if ((slotDef.weekdayMask & TIME_WEEKDAY_ALL) == 0) return false;
    } else if (slotDef.epochSec == 0) {
        return false;
    }

    TimeSchedulerSlot def = slotDef;
    sanitizeLabel_(def.label);
    def.weekdayMask &= TIME_WEEKDAY_ALL;

    portENTER_CRITICAL(&schedMux_);
    SchedulerSlotRuntime& s = sched_[def.slot];
    s.used = true;
    s.def = def;
    s.lastTriggerMinuteKey = INVALID_MINUTE_KEY;
    portEXIT_CRITICAL(&schedMux_);
    return true;
}

bool TimeModule::getSlot_(uint8_t slot, TimeSchedulerSlot& outDef) const
{
    if (slot >= TIME_SCHED_MAX_SLOTS) return false;
    bool used = false;
    portENTER_CRITICAL(&schedMux_);
    used = sched_[slot].used;
    if (used) outDef = sched_[slot].def;
    portEXIT_CRITICAL(&schedMux_);
    return used;
}

bool TimeModule::clearSlot_(uint8_t slot)
{
    if (slot >= TIME_SCHED_MAX_SLOTS || slot < TIME_SLOT_SYS_RESERVED_COUNT) return false;
    portENTER_CRITICAL(&schedMux_);
    sched_[slot] = SchedulerSlotRuntime{};
    sched_[slot].def.slot = slot;
    portEXIT_CRITICAL(&schedMux_);
    return true;
}

uint8_t TimeModule::usedCount_() const
{
    uint8_t n = 0;
    portENTER_CRITICAL(&schedMux_);
    for (uint8_t i = 0; i < TIME_SCHED_MAX_SLOTS; ++i) {
        if (sched_[i].used) ++n;
    }
    portEXIT_CRITICAL(&schedMux_);
    return n;
}

void TimeModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(server1Var);
    cfg.registerVar(server2Var);
    cfg.registerVar(tzVar);
    cfg.registerVar(enabledVar);

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;

    if (eventBus_) {
        eventBus_->subscribe(EventId::DataChanged, &TimeModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::ConfigChanged, &TimeModule::onEventStatic_, this);
    }

    cmdSvc_ = services.get<CommandService>("cmd");
    if (cmdSvc_) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "time.resync", cmdResync_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "time.scheduler.info", cmdSchedInfo_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "time.scheduler.get", cmdSchedGet_, this);
    }

    timeSvc_.isSynced = svcIsSynced_;
    timeSvc_.formatLocalTime = svcFormatLocalTime_;
    timeSvc_.ctx = this;
    services.add("time", &timeSvc_);

    schedSvc_.setSlot = svcSchedSetSlot_;
    schedSvc_.getSlot = svcSchedGetSlot_;
    schedSvc_.clearSlot = svcSchedClearSlot_;
    schedSvc_.usedCount = svcSchedUsedCount_;
    schedSvc_.ctx = this;
    services.add("time.scheduler", &schedSvc_);

    LOGI("Time services registered (time, time.scheduler)");

    netReady_ = false;
    netReadyTs_ = 0;
    retryDelayMs_ = RetryMinMs;

    resetScheduleRuntime_();
    applySystemSlots_();

    setState_(cfgData.enabled ? TimeSyncState::WaitingNetwork : TimeSyncState::Disabled);
}

void TimeModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    // Local time must follow the configured zone even before the first sync.
    applyTimeZone_();
}

void TimeModule::loop()
{
    if (tzDirty_) {
        tzDirty_ = false;
        applyTimeZone_();
    }

    if (resyncRequested_) {
        resyncRequested_ = false;
        forceResync();
    }

    if (!cfgData.enabled) {
        if (state_ != TimeSyncState::Disabled) setState_(TimeSyncState::Disabled);
        vTaskDelay(pdMS_TO_TICKS(2000));
        return;
    }

    switch (state_) {

    case TimeSyncState::WaitingNetwork:
        if (netReady_ && (millis() - netReadyTs_ >= WarmupMs)) {
            LOGI("Network warmup done -> start syncing");
            setState_(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Syncing: {
        LOGI("Syncing via NTP (%s, %s)", cfgData.server1, cfgData.server2);
        configTzTime(cfgData.tz, cfgData.server1, cfgData.server2);

        struct tm timeinfo;
        if (getLocalTime(&timeinfo, 4000)) {
            char buf[32];
            (void)svcFormatLocalTime_(this, buf, sizeof(buf));
            LOGI("Synced ok: %s", buf);
            retryDelayMs_ = RetryMinMs;
            setState_(TimeSyncState::Synced);
        } else {
            LOGW("Sync failed -> retry in %lu ms", (unsigned long)retryDelayMs_);
            setState_(TimeSyncState::ErrorWait);
        }
        break;
    }

    case TimeSyncState::ErrorWait:
        if (!netReady_) {
            setState_(TimeSyncState::WaitingNetwork);
            break;
        }
        if (millis() - stateTs_ >= retryDelayMs_) {
            uint32_t next = retryDelayMs_;
            if      (next < 5000)   next = 5000;
            else if (next < 10000)  next = 10000;
            else if (next < 30000)  next = 30000;
            else if (next < 60000)  next = 60000;
            else                    next = RetryMaxMs;
            retryDelayMs_ = next;
            setState_(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Synced:
        if (netReady_ && (millis() - stateTs_ > ResyncPeriodMs)) {
            setState_(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Disabled:
        setState_(TimeSyncState::WaitingNetwork);
        break;
    }

    tickScheduler_();
    vTaskDelay(pdMS_TO_TICKS(TickMs));
}

void TimeModule::forceResync()
{
    if (!cfgData.enabled) return;
    retryDelayMs_ = RetryMinMs;
    netReadyTs_ = millis();
    // Keep the clock usable for schedulers while the resync runs.
    if (state_ == TimeSyncState::Synced && netReady_) {
        setState_(TimeSyncState::Syncing);
        return;
    }
    setState_(TimeSyncState::WaitingNetwork);
}

bool TimeModule::cmdResync_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    TimeModule* self = static_cast<TimeModule*>(userCtx);
    if (!self || !self->cfgData.enabled) {
        writeErrorJson(reply, replyLen, ErrorCode::Disabled, "time.resync");
        return false;
    }
    self->resyncRequested_ = true;
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

bool TimeModule::cmdSchedInfo_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    TimeModule* self = static_cast<TimeModule*>(userCtx);
    if (!self) return false;
    return self->handleCmdSchedInfo_(reply, replyLen);
}

bool TimeModule::cmdSchedGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    TimeModule* self = static_cast<TimeModule*>(userCtx);
    if (!self) return false;
    return self->handleCmdSchedGet_(req, reply, replyLen);
}

bool TimeModule::handleCmdSchedInfo_(char* reply, size_t replyLen)
{
    char now[32] = {0};
    if (!svcFormatLocalTime_(this, now, sizeof(now))) {
        strncpy(now, "n/a", sizeof(now) - 1);
    }
    snprintf(reply, replyLen,
             "{\"ok\":true,\"state\":%u,\"synced\":%s,\"used\":%u,\"tz\":\"%s\",\"now\":\"%s\"}",
             (unsigned)state_,
             (state_ == TimeSyncState::Synced) ? "true" : "false",
             (unsigned)usedCount_(),
             cfgData.tz,
             now);
    return true;
}

bool TimeModule::handleCmdSchedGet_(const CommandRequest& req, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::JsonCmdTimeBuf> doc;
    if (!parseCmdArgsObject(req, doc)) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "time.scheduler.get");
        return false;
    }
    if (!doc["slot"].is<unsigned int>()) {
        writeErrorJson(reply, replyLen, ErrorCode::InvalidSlot, "time.scheduler.get");
        return false;
    }
    const unsigned int slot = doc["slot"].as<unsigned int>();
    if (slot >= TIME_SCHED_MAX_SLOTS) {
        writeErrorJsonWithSlot(reply, replyLen, ErrorCode::InvalidSlot, "time.scheduler.get", (uint8_t)slot);
        return false;
    }

    TimeSchedulerSlot def{};
    if (!getSlot_((uint8_t)slot, def)) {
        writeErrorJsonWithSlot(reply, replyLen, ErrorCode::UnusedSlot, "time.scheduler.get", (uint8_t)slot);
        return false;
    }

    const char* mode = (def.mode == TimeSchedulerMode::OneShotEpoch) ? "one_shot_epoch" : "recurring_clock";
    snprintf(reply, replyLen,
             "{\"ok\":true,\"slot\":%u,\"event_id\":%u,\"label\":\"%s\",\"enabled\":%s,"
             "\"mode\":\"%s\",\"weekday_mask\":%u,\"hour\":%u,\"minute\":%u,\"epoch\":%llu}",
             (unsigned)def.slot,
             (unsigned)def.eventId,
             def.label,
             def.enabled ? "true" : "false",
             mode,
             (unsigned)def.weekdayMask,
             (unsigned)def.hour,
             (unsigned)def.minute,
             (unsigned long long)def.epochSec);
    return true;
}

void TimeModule::onEventStatic_(const Event& e, void* user)
{
    static_cast<TimeModule*>(user)->onEvent_(e);
}

void TimeModule::onEvent_(const Event& e)
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
            if (state_ == TimeSyncState::Synced) return;
            setState_(TimeSyncState::WaitingNetwork);
        } else if (state_ != TimeSyncState::Synced) {
            // A synced clock keeps running without network.
            setState_(TimeSyncState::WaitingNetwork);
        }
        return;
    }

    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        if (strcmp(p->nvsKey, NvsKeys::Time::Tz) == 0) {
            tzDirty_ = true;
        } else if (strcmp(p->nvsKey, NvsKeys::Time::Server1) == 0 ||
                   strcmp(p->nvsKey, NvsKeys::Time::Server2) == 0 ||
                   strcmp(p->nvsKey, NvsKeys::Time::Enabled) == 0) {
            resyncRequested_ = true;
        }
    }
}

uint8_t TimeModule::weekBitFromTm_(const tm& localNow)
{
    // tm_wday: 0=Sunday; slot masks use bit0=Monday.
    return (localNow.tm_wday == 0) ? 6u : (uint8_t)(localNow.tm_wday - 1);
}

void TimeModule::tickScheduler_()
{
    if (!eventBus_) return;
    if (state_ != TimeSyncState::Synced) return;

    const time_t now = time(nullptr);
    if (now < SCHED_MIN_VALID_EPOCH) return;

    struct tm localNow;
    if (!localtime_r(&now, &localNow)) return;

    const uint32_t minuteKey = (uint32_t)(((uint64_t)now) / 60ULL);
    const uint8_t weekBit = weekBitFromTm_(localNow);
    const uint32_t dayMinute = (uint32_t)localNow.tm_hour * 60U + (uint32_t)localNow.tm_min;
    const int dayKey = (localNow.tm_year + 1900) * 1000 + localNow.tm_yday;
    // Day-start follows the local date so a clock step over midnight still fires it.
    const bool dayChanged = (lastDayKey_ >= 0) && (dayKey != lastDayKey_);
    lastDayKey_ = dayKey;

    struct PendingEvent {
        uint8_t slot;
        uint8_t replayed;
        uint16_t eventId;
        uint64_t epochSec;
    };

    PendingEvent pending[TIME_SCHED_MAX_SLOTS]{};
    uint8_t pendingCount = 0;

    portENTER_CRITICAL(&schedMux_);
    const uint8_t replayed = schedInitialized_ ? 0 : 1;

    for (uint8_t i = 0; i < TIME_SCHED_MAX_SLOTS; ++i) {
        SchedulerSlotRuntime& s = sched_[i];
        if (!s.used || !s.def.enabled) continue;

        if (s.def.mode == TimeSchedulerMode::OneShotEpoch) {
            if ((uint64_t)now >= s.def.epochSec) {
                pending[pendingCount++] = PendingEvent{i, replayed, s.def.eventId, s.def.epochSec};
                s = SchedulerSlotRuntime{};
                s.def.slot = i;
            }
            continue;
        }

        bool shouldTrigger;
        if (i == TIME_SLOT_SYS_DAY_START) {
            shouldTrigger = dayChanged;
        } else {
            shouldTrigger = ((s.def.weekdayMask & (1u << weekBit)) != 0) &&
                            (dayMinute == (uint32_t)s.def.hour * 60U + s.def.minute);
        }
        if (shouldTrigger && s.lastTriggerMinuteKey != minuteKey) {
            pending[pendingCount++] = PendingEvent{i, replayed, s.def.eventId, (uint64_t)now};
            s.lastTriggerMinuteKey = minuteKey;
        }
    }

    schedInitialized_ = true;
    portEXIT_CRITICAL(&schedMux_);

    for (uint8_t i = 0; i < pendingCount; ++i) {
        SchedulerEventTriggeredPayload payload{};
        payload.slot = pending[i].slot;
        payload.edge = (uint8_t)SchedulerEdge::Trigger;
        payload.replayed = pending[i].replayed;
        payload.eventId = pending[i].eventId;
        payload.epochSec = pending[i].epochSec;

        LOGI("Scheduler trigger slot=%u eventId=0x%04X replayed=%u epoch=%llu",
             (unsigned)payload.slot,
             (unsigned)payload.eventId,
             (unsigned)payload.replayed,
             (unsigned long long)payload.epochSec);

        if (!eventBus_->post(EventId::SchedulerEventTriggered, &payload, sizeof(payload))) {
            LOGW("Scheduler event dropped slot=%u (bus full)", (unsigned)payload.slot);
        }
    }
}
