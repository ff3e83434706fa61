/**
 * @file AzanModule.cpp
 * @brief Implementation file.
 */

#include "AzanModule.h"
#include "Core/CommandRegistry.h"
#include "Core/MqttTopics.h"
#include "Core/Runtime.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>
#include <time.h>

#define LOG_TAG "AzanModl"
#include "Core/ModuleLog.h"

static bool parseCmdArgsObject(const CommandRequest& req, StaticJsonDocument<Limits::JsonCmdAzanBuf>& doc)
{
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) return false;
    if (doc["args"].is<JsonObject>()) {
        StaticJsonDocument<Limits::JsonCmdAzanBuf> inner;
        inner.set(doc["args"]);
        doc.set(inner.as<JsonVariantConst>());
    }
    return true;
}

static ErrorCode errorFromTableStatus(TimeTableStatus st)
{
    switch (st) {
    case TimeTableStatus::SourceUnavailable: return ErrorCode::SourceUnavailable;
    case TimeTableStatus::ParseError: return ErrorCode::ParseError;
    case TimeTableStatus::DataQuality: return ErrorCode::DataQuality;
    default: return ErrorCode::Failed;
    }
}

static bool isAzanOrPrayerKey(const char* key)
{
    return strncmp(key, "az_", 3) == 0 || strncmp(key, "pt_", 3) == 0;
}

static bool isTimeoutKey(const char* key)
{
    return strcmp(key, NvsKeys::Azan::FetchWaitS) == 0 ||
           strcmp(key, NvsKeys::Azan::PreemptMs) == 0 ||
           strcmp(key, NvsKeys::Azan::PlayMaxS) == 0;
}

bool AzanModule::buildStateJson(const AzanRuntimeData& rt, uint64_t nowEpoch, char* out, size_t len)
{
    if (!out || len == 0) return false;

    StaticJsonDocument<768> doc;
    doc["status"] = azanStatusStr((AzanStatus)rt.status);
    if (rt.activeKind < PRAYER_KIND_COUNT) {
        doc["active"] = prayerKindName((PrayerKind)rt.activeKind);
    } else {
        doc["active"] = nullptr;
    }

    JsonObject next = doc.createNestedObject("next");
    if (rt.nextKind < PRAYER_SCHEDULED_COUNT && rt.nextEpoch > 0) {
        next["kind"] = prayerKindName((PrayerKind)rt.nextKind);
        next["epoch"] = (uint32_t)rt.nextEpoch;
        next["countdown_s"] = (rt.nextEpoch > nowEpoch) ? (uint32_t)(rt.nextEpoch - nowEpoch) : 0U;
    } else {
        next["kind"] = nullptr;
        next["epoch"] = nullptr;
        next["countdown_s"] = nullptr;
    }

    JsonObject times = doc.createNestedObject("times");
    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        const char* slug = prayerKindSlug((PrayerKind)k);
        if (rt.kindEpoch[k] > 0) {
            times[slug] = (uint32_t)rt.kindEpoch[k];
        } else {
            times[slug] = nullptr;
        }
    }

    char day[12] = {0};
    if (rt.tableValid && formatCivilDate(rt.tableDay, day, sizeof(day))) {
        doc["day"] = day;
    } else {
        doc["day"] = nullptr;
    }
    doc["source"] = rt.source;
    doc["hijri"] = rt.hijri;
    doc["last_error"] = errorCodeStr((ErrorCode)rt.lastError);
    doc["refresh_count"] = rt.refreshCount;
    doc["refresh_fail"] = rt.refreshFailCount;
    doc["ts"] = (uint32_t)nowEpoch;

    if (doc.overflowed()) return false;
    const size_t n = serializeJson(doc, out, len);
    return n > 0 && n < len;
}

PlannerConfig AzanModule::plannerConfig_() const
{
    PlannerConfig pc;
    pc.offsetMin = (int16_t)cfgData.offsetMin;
    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        pc.enabled[k] = cfgData.enabled && cfgData.kindEnabled[k];
    }
    return pc;
}

TableLoad AzanModule::loadTable_(const CivilDate& day, TimeTable& slot, bool force, TimeTableStatus& st)
{
    st = TimeTableStatus::Ok;
    if (!force && slot.valid && slot.day == day) return TableLoad::Loaded;
    if (!prayerSvc_ || !prayerSvc_->request) {
        st = TimeTableStatus::SourceUnavailable;
        return TableLoad::Failed;
    }

    TimeTable fresh;
    switch (prayerSvc_->request(prayerSvc_->ctx, &day, Limits::Prayer::ResultFreshMs, &fresh, &st)) {
    case TimeTableFetch::Ready:
        slot = fresh;
        return TableLoad::Loaded;
    case TimeTableFetch::Pending:
        return TableLoad::Pending;
    case TimeTableFetch::Failed:
    default:
        return TableLoad::Failed;
    }
}

void AzanModule::refreshFailed_(TimeTableStatus st, const CivilDate& day)
{
    char dayTxt[12] = {0};
    (void)formatCivilDate(day, dayTxt, sizeof(dayTxt));
    LOGW("refresh %s failed: %s, armed set kept, retry in %lus",
         dayTxt, timeTableStatusStr(st), (unsigned long)(refreshDelayMs_ / 1000UL));
    if (dataStore_) noteAzanRefreshFailure(*dataStore_);
    reportError_(errorFromTableStatus(st), "refresh");
}

void AzanModule::refresh_(bool force)
{
    if (!dataStore_ || !schedSvc_) return;

    const time_t now = time(nullptr);
    CivilDate day;
    if (!localDateOf((int64_t)now, day)) {
        LOGW("refresh skipped, local date unavailable");
        refreshDelayMs_ = Limits::Azan::RefreshRetryMs;
        return;
    }

    // Day rollover: yesterday stays around for entries spilled past midnight.
    if (today_.valid && today_.day != day) {
        previous_ = (civilDateAddDays(today_.day, 1) == day) ? today_ : TimeTable{};
        today_ = (tomorrow_.valid && tomorrow_.day == day) ? tomorrow_ : TimeTable{};
    }
    if (previous_.valid && civilDateAddDays(previous_.day, 1) != day) previous_ = TimeTable{};

    const PlannerConfig pc = plannerConfig_();
    const CivilDate next = civilDateAddDays(day, 1);
    TimeTableStatus st = TimeTableStatus::Ok;
    TimeTableStatus nextSt = TimeTableStatus::Ok;
    bool tomorrowNeeded = false;
    TableLoad nextLoad = TableLoad::Failed;

    const TableLoad todayLoad = loadTable_(day, today_, force, st);
    if (todayLoad == TableLoad::Loaded) {
        setAzanTable(*dataStore_, today_);

        // After a reboot shortly past midnight, a positive offset may still push
        // yesterday's late entries into today. Its completion re-runs the refresh.
        if (!previous_.valid && pc.offsetMin > 0) {
            struct tm local;
            if (localtime_r(&now, &local) && (local.tm_hour * 60 + local.tm_min) < pc.offsetMin) {
                TimeTableStatus prevSt = TimeTableStatus::Ok;
                if (loadTable_(civilDateAddDays(day, -1), previous_, false, prevSt) == TableLoad::Failed) {
                    LOGD("previous day table unavailable: %s", timeTableStatusStr(prevSt));
                }
            }
        }

        const bool future = prayerSvc_ && prayerSvc_->providesFutureDays &&
                            prayerSvc_->providesFutureDays(prayerSvc_->ctx);
        tomorrowNeeded = needsTomorrow(isDayComplete(today_, pc.offsetMin, (int64_t)now), future);
        if (tomorrowNeeded) nextLoad = loadTable_(next, tomorrow_, force, nextSt);
    }

    const RefreshDecision decision = decideRefresh(todayLoad, tomorrowNeeded, nextLoad);
    refreshDelayMs_ = decision.delayMs;
    switch (decision.action) {
    case RefreshAction::Wait:
        waitForce_ = force;
        LOGD("refresh waiting on time table fetch");
        return;
    case RefreshAction::Retry:
        waitForce_ = false;
        if (todayLoad == TableLoad::Failed) {
            refreshFailed_(st, day);
        } else {
            refreshFailed_(nextSt, next);
        }
        return;
    case RefreshAction::Plan:
        waitForce_ = false;
        break;
    }
    const TimeTable* tomorrow = decision.useTomorrow ? &tomorrow_ : nullptr;

    SchedulePlan plan;
    planSchedule(previous_.valid ? &previous_ : nullptr, today_, tomorrow, pc, (int64_t)now, plan);
    const bool changed = !samePlan(plan, armed_);
    arm_(plan);

    if (changed) {
        char dayTxt[12] = {0};
        (void)formatCivilDate(today_.day, dayTxt, sizeof(dayTxt));
        LOGI("schedule %s (%s): %u armed, offset=%ld, day complete=%d",
             dayTxt, today_.source, (unsigned)plan.count, (long)cfgData.offsetMin, plan.dayComplete ? 1 : 0);
        for (uint8_t i = 0; i < plan.count; ++i) {
            const ScheduleEntry& e = plan.entries[i];
            const time_t t = (time_t)e.instant;
            struct tm local;
            char hhmm[8] = "--:--";
            if (localtime_r(&t, &local)) strftime(hhmm, sizeof(hhmm), "%H:%M", &local);
            LOGI("  %-8s %s", prayerKindName(e.kind), hhmm);
        }
    }
}

void AzanModule::clearSlots_()
{
    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        (void)schedSvc_->clearSlot(schedSvc_->ctx, (uint8_t)(Limits::Azan::FirstSchedulerSlot + k));
    }
}

void AzanModule::arm_(const SchedulePlan& plan)
{
    clearSlots_();

    uint64_t epochs[PRAYER_SCHEDULED_COUNT] = {0, 0, 0, 0, 0, 0};
    for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
        if (plan.kindEpoch[k] <= 0) continue;

        TimeSchedulerSlot def{};
        def.slot = (uint8_t)(Limits::Azan::FirstSchedulerSlot + k);
        def.eventId = (uint16_t)(Limits::Azan::SchedulerEventIdBase + k);
        def.enabled = true;
        def.mode = TimeSchedulerMode::OneShotEpoch;
        def.epochSec = (uint64_t)plan.kindEpoch[k];
        snprintf(def.label, sizeof(def.label), "azan.%s", prayerKindSlug((PrayerKind)k));

        if (!schedSvc_->setSlot(schedSvc_->ctx, &def)) {
            LOGE("arm %s slot=%u failed", prayerKindName((PrayerKind)k), (unsigned)def.slot);
            continue;
        }
        epochs[k] = def.epochSec;
    }

    armed_ = plan;
    setAzanSchedule(*dataStore_, epochs);
}

void AzanModule::onFire_(const Request& req)
{
    if (req.slot == TIME_SLOT_SYS_DAY_START && req.eventId == TIME_EVENT_SYS_DAY_START) {
        LOGI("day start, refreshing");
        refreshPending_ = true;
        return;
    }

    const uint8_t k = (uint8_t)(req.eventId - Limits::Azan::SchedulerEventIdBase);
    if (k >= PRAYER_SCHEDULED_COUNT || req.slot != Limits::Azan::FirstSchedulerSlot + k) return;
    const PrayerKind kind = (PrayerKind)k;

    // The fired slot is released; re-arm what remains.
    refreshPending_ = true;
    if (armed_.kindEpoch[k] == (int64_t)req.epochSec) armed_.kindEpoch[k] = 0;

    const int64_t now = (int64_t)time(nullptr);
    const int64_t lateSec = now - (int64_t)req.epochSec;
    if (lateSec > (int64_t)Limits::Azan::MissedGraceSec) {
        LOGW("%s fire dropped, %llds late", prayerKindName(kind), (long long)lateSec);
        return;
    }
    if (playedEpoch_[k] == (int64_t)req.epochSec) {
        LOGD("%s already played for this instant", prayerKindName(kind));
        return;
    }
    if (!cfgData.enabled || !cfgData.kindEnabled[k]) {
        LOGI("%s fire ignored, disabled", prayerKindName(kind));
        return;
    }

    playedEpoch_[k] = (int64_t)req.epochSec;
    const uint32_t seq = arbiter_.request(kind, millis());
    LOGI("%s fired (seq=%lu%s)", prayerKindName(kind), (unsigned long)seq, req.ok ? ", replayed" : "");
}

void AzanModule::applyTimeouts_()
{
    ArbiterTimeouts t;
    t.fetchWaitMs = (cfgData.fetchWaitS > 0) ? (uint32_t)cfgData.fetchWaitS * 1000UL : 1000UL;
    t.preemptMs = (cfgData.preemptMs > 0) ? (uint32_t)cfgData.preemptMs : 1000UL;
    t.startMs = Limits::Azan::StartTimeoutMs;
    t.playMaxMs = (cfgData.playMaxS > 0) ? (uint32_t)cfgData.playMaxS * 1000UL : 0UL;
    arbiter_.setTimeouts(t);
}

void AzanModule::resolveAsset_(const ArbiterAction& a, AudioAssetId id)
{
    uint32_t generation = 0;
    char path[Limits::Audio::PathBuf] = {0};
    AudioResolve r = AudioResolve::Failed;
    if (audioSvc_ && audioSvc_->resolve) {
        r = audioSvc_->resolve(audioSvc_->ctx, id, &generation, path, sizeof(path));
    }

    switch (r) {
    case AudioResolve::Ready:
        wait_.active = false;
        snprintf(startPath_, sizeof(startPath_), "%s", path);
        arbiter_.onAssetReady(a.seq, millis());
        break;
    case AudioResolve::Fetching:
        wait_.active = true;
        wait_.seq = a.seq;
        wait_.assetIdx = (uint8_t)id;
        wait_.generation = generation;
        LOGI("%s waiting on asset %u (gen=%lu)", prayerKindName(a.kind), (unsigned)id, (unsigned long)generation);
        arbiter_.onAssetPending(a.seq);
        break;
    case AudioResolve::Failed:
    default:
        wait_.active = false;
        if (!wait_.fallbackTried) {
            wait_.fallbackTried = true;
            LOGW("fajr asset unavailable, falling back to primary");
            resolveAsset_(a, AudioAssetId::Primary);
            return;
        }
        {
            const bool configured = audioSvc_ && audioSvc_->hasSource &&
                                    audioSvc_->hasSource(audioSvc_->ctx, id);
            arbiter_.onAssetFailed(a.seq, configured ? ErrorCode::FetchFailed : ErrorCode::MissingUrl);
        }
        break;
    }
}

void AzanModule::onAssetResolved_(const Request& req)
{
    if (!wait_.active || req.op != wait_.assetIdx || req.seq != wait_.generation) return;
    wait_.active = false;
    if (arbiter_.phase() != ArbiterPhase::Resolving || arbiter_.activeSeq() != wait_.seq) return;

    ArbiterAction a;
    a.type = ArbiterActionType::ResolveAsset;
    a.seq = wait_.seq;
    a.kind = arbiter_.activeKind();

    if (req.ok) {
        // Ready now: the second resolve returns the cached path.
        resolveAsset_(a, (AudioAssetId)wait_.assetIdx);
        return;
    }

    LOGW("asset %u fetch failed: %s", (unsigned)wait_.assetIdx, errorCodeStr((ErrorCode)req.errorCode));
    if (!wait_.fallbackTried) {
        wait_.fallbackTried = true;
        resolveAsset_(a, AudioAssetId::Primary);
        return;
    }
    arbiter_.onAssetFailed(a.seq);
}

void AzanModule::onPlaybackCompleted_(const Request& req)
{
    const uint32_t nowMs = millis();
    if ((PlaybackOp)req.op == PlaybackOp::Start) {
        if (!req.ok) LOGW("start seq=%lu failed: %s", (unsigned long)req.seq, errorCodeStr((ErrorCode)req.errorCode));
        arbiter_.onStartCompleted(req.seq, req.ok != 0, req.handle, nowMs);
    } else {
        if (!req.ok) LOGW("stop seq=%lu failed: %s", (unsigned long)req.seq, errorCodeStr((ErrorCode)req.errorCode));
        arbiter_.onStopCompleted(req.seq, req.ok != 0, nowMs);
    }
}

void AzanModule::drainActions_()
{
    ArbiterAction a;
    while (arbiter_.popAction(a)) {
        switch (a.type) {
        case ArbiterActionType::ResolveAsset: {
            AudioAssetId id = AudioAssetId::Primary;
            if (a.kind == PrayerKind::Fajr && audioSvc_ && audioSvc_->hasSource &&
                audioSvc_->hasSource(audioSvc_->ctx, AudioAssetId::Fajr)) {
                id = AudioAssetId::Fajr;
            }
            wait_ = AssetWait{};
            wait_.fallbackTried = (id == AudioAssetId::Primary);
            resolveAsset_(a, id);
            break;
        }
        case ArbiterActionType::StartPlayback:
            if (!playbackSvc_ || !playbackSvc_->requestStart(playbackSvc_->ctx, a.seq, startPath_)) {
                LOGW("start seq=%lu not queued", (unsigned long)a.seq);
                arbiter_.onStartCompleted(a.seq, false, 0, millis());
            }
            break;
        case ArbiterActionType::StopPlayback:
            if (!playbackSvc_ || !playbackSvc_->requestStop(playbackSvc_->ctx, a.seq, a.handle)) {
                LOGW("stop seq=%lu not queued", (unsigned long)a.seq);
                if (a.seq != 0) arbiter_.onStopCompleted(a.seq, false, millis());
            }
            break;
        case ArbiterActionType::ReportError:
            reportError_(a.error, prayerKindName(a.kind));
            break;
        }
    }
    if (arbiter_.droppedActions() != 0) {
        LOGE("arbiter dropped %lu actions", (unsigned long)arbiter_.droppedActions());
    }
    publishStatus_();
}

void AzanModule::reportError_(ErrorCode err, const char* where)
{
    if (err == ErrorCode::PreemptionTimeout) {
        LOGW("%s: previous session did not stop in time, starting anyway", where);
    } else {
        LOGW("%s: %s", where, errorCodeStr(err));
    }
    if (dataStore_) setAzanLastError(*dataStore_, (uint16_t)err);
}

void AzanModule::publishStatus_()
{
    const AzanStatus st = arbiter_.status();
    const uint8_t kind = arbiter_.active() ? (uint8_t)arbiter_.activeKind() : AZAN_KIND_NONE;
    if (st == publishedStatus_ && kind == publishedKind_) return;

    publishedStatus_ = st;
    publishedKind_ = kind;
    LOGI("status %s (%s)", azanStatusStr(st), kind == AZAN_KIND_NONE ? "-" : prayerKindName((PrayerKind)kind));
    if (dataStore_) setAzanStatus(*dataStore_, (uint8_t)st, kind);

    AzanStatusChangedPayload p{};
    p.status = (uint8_t)st;
    p.kind = kind;
    if (eventBus_ && !eventBus_->post(EventId::AzanStatusChanged, &p, sizeof(p))) {
        LOGW("AzanStatusChanged not posted");
    }
}

void AzanModule::handle_(const Request& req)
{
    const uint32_t nowMs = millis();
    switch (req.type) {
    case RequestType::Trigger: {
        const uint32_t seq = arbiter_.request((PrayerKind)req.kind, nowMs);
        LOGI("trigger %s (seq=%lu)", prayerKindName((PrayerKind)req.kind), (unsigned long)seq);
        break;
    }
    case RequestType::Stop:
        LOGI("stop requested (%s)", arbiterPhaseStr(arbiter_.phase()));
        arbiter_.stop(nowMs);
        break;
    case RequestType::Refresh:
        refreshPending_ = true;
        if (req.force) refreshForce_ = true;
        break;
    case RequestType::TableFetched:
        refreshPending_ = true;
        if (waitForce_) refreshForce_ = true;
        break;
    case RequestType::SchedulerFire:
        onFire_(req);
        break;
    case RequestType::AssetResolved:
        onAssetResolved_(req);
        break;
    case RequestType::PlaybackCompleted:
        onPlaybackCompleted_(req);
        break;
    case RequestType::ConfigChanged:
        if (isTimeoutKey(req.nvsKey)) {
            applyTimeouts_();
        } else {
            refreshPending_ = true;
            // A new source or location needs fresh tables, schedule flags only re-plan.
            if (strncmp(req.nvsKey, "pt_", 3) == 0) refreshForce_ = true;
        }
        break;
    }
    drainActions_();
}

void AzanModule::loop()
{
    Request req;
    if (reqQ_ && xQueueReceive(reqQ_, &req, pdMS_TO_TICKS(Limits::Azan::TickMs)) == pdTRUE) {
        handle_(req);
        while (xQueueReceive(reqQ_, &req, 0) == pdTRUE) handle_(req);
    }

    if (timeoutsDirty_) {
        timeoutsDirty_ = false;
        applyTimeouts_();
    }
    arbiter_.tick(millis());
    drainActions_();

    const uint32_t nowMs = millis();
    if (!refreshPending_ && (uint32_t)(nowMs - lastRefreshMs_) >= refreshDelayMs_) {
        refreshPending_ = true;
        refreshForce_ = true;
    }
    if (refreshPending_ && dataStore_ && timeReady(*dataStore_)) {
        const bool force = refreshForce_;
        refreshPending_ = false;
        refreshForce_ = false;
        lastRefreshMs_ = nowMs;
        refresh_(force);
    }
}

bool AzanModule::enqueue_(const Request& req)
{
    if (!reqQ_) return false;
    if (xQueueSendToBack(reqQ_, &req, 0) != pdTRUE) {
        LOGW("request queue full, type=%u dropped", (unsigned)req.type);
        return false;
    }
    return true;
}

void AzanModule::onEventStatic_(const Event& e, void* user)
{
    AzanModule* self = static_cast<AzanModule*>(user);
    if (self) self->onEvent_(e);
}

void AzanModule::onEvent_(const Event& e)
{
    Request req;
    switch (e.id) {
    case EventId::SchedulerEventTriggered: {
        if (!e.payload || e.len < sizeof(SchedulerEventTriggeredPayload)) return;
        const SchedulerEventTriggeredPayload* p = static_cast<const SchedulerEventTriggeredPayload*>(e.payload);
        const bool dayStart = p->slot == TIME_SLOT_SYS_DAY_START && p->eventId == TIME_EVENT_SYS_DAY_START;
        const bool ours = p->eventId >= Limits::Azan::SchedulerEventIdBase &&
                          p->eventId < Limits::Azan::SchedulerEventIdBase + PRAYER_SCHEDULED_COUNT;
        if (!dayStart && !ours) return;
        req.type = RequestType::SchedulerFire;
        req.slot = p->slot;
        req.eventId = p->eventId;
        req.epochSec = p->epochSec;
        req.ok = p->replayed;
        break;
    }
    case EventId::TimeTableFetched:
        if (!e.payload || e.len < sizeof(TimeTableFetchedPayload)) return;
        req.type = RequestType::TableFetched;
        req.errorCode = static_cast<const TimeTableFetchedPayload*>(e.payload)->status;
        break;
    case EventId::AssetResolved: {
        if (!e.payload || e.len < sizeof(AssetResolvedPayload)) return;
        const AssetResolvedPayload* p = static_cast<const AssetResolvedPayload*>(e.payload);
        req.type = RequestType::AssetResolved;
        req.op = p->assetIdx;
        req.ok = p->ok;
        req.errorCode = p->errorCode;
        req.seq = p->generation;
        break;
    }
    case EventId::PlaybackCompleted: {
        if (!e.payload || e.len < sizeof(PlaybackCompletedPayload)) return;
        const PlaybackCompletedPayload* p = static_cast<const PlaybackCompletedPayload*>(e.payload);
        req.type = RequestType::PlaybackCompleted;
        req.seq = p->seq;
        req.op = p->op;
        req.ok = p->ok;
        req.errorCode = p->errorCode;
        req.handle = p->handle;
        break;
    }
    case EventId::ConfigChanged: {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (!isAzanOrPrayerKey(p->nvsKey)) return;
        req.type = RequestType::ConfigChanged;
        snprintf(req.nvsKey, sizeof(req.nvsKey), "%s", p->nvsKey);
        break;
    }
    case EventId::DataChanged: {
        if (!e.payload || e.len < sizeof(DataChangedPayload)) return;
        const DataChangedPayload* p = static_cast<const DataChangedPayload*>(e.payload);
        if (p->id != DataKeys::TimeReady || !dataStore_ || !timeReady(*dataStore_)) return;
        LOGI("time synchronized, refreshing");
        req.type = RequestType::Refresh;
        break;
    }
    default:
        return;
    }
    (void)enqueue_(req);
}

bool AzanModule::cmdTrigger_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AzanModule* self = static_cast<AzanModule*>(userCtx);
    if (!self) return false;

    StaticJsonDocument<Limits::JsonCmdAzanBuf> doc;
    if (!parseCmdArgsObject(req, doc)) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "azan.trigger");
        return false;
    }
    PrayerKind kind;
    if (!parsePrayerKind(doc["kind"].as<const char*>(), kind)) {
        writeErrorJson(reply, replyLen, ErrorCode::InvalidKind, "azan.trigger");
        return false;
    }

    Request r;
    r.type = RequestType::Trigger;
    r.kind = (uint8_t)kind;
    if (!self->enqueue_(r)) {
        writeErrorJson(reply, replyLen, ErrorCode::Busy, "azan.trigger");
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"where\":\"azan.trigger\",\"kind\":\"%s\"}", prayerKindName(kind));
    return true;
}

bool AzanModule::cmdStop_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    AzanModule* self = static_cast<AzanModule*>(userCtx);
    if (!self) return false;
    Request r;
    r.type = RequestType::Stop;
    if (!self->enqueue_(r)) {
        writeErrorJson(reply, replyLen, ErrorCode::Busy, "azan.stop");
        return false;
    }
    writeOkJson(reply, replyLen, "azan.stop");
    return true;
}

bool AzanModule::cmdRefresh_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    AzanModule* self = static_cast<AzanModule*>(userCtx);
    if (!self) return false;
    Request r;
    r.type = RequestType::Refresh;
    r.force = 1;
    if (!self->enqueue_(r)) {
        writeErrorJson(reply, replyLen, ErrorCode::Busy, "azan.refresh");
        return false;
    }
    writeOkJson(reply, replyLen, "azan.refresh");
    return true;
}

bool AzanModule::cmdStatus_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    AzanModule* self = static_cast<AzanModule*>(userCtx);
    if (!self || !self->dataStore_) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "azan.status");
        return false;
    }

    char state[Limits::JsonCmdBuf] = {0};
    if (!buildStateJson(azanSnapshot(*self->dataStore_), (uint64_t)time(nullptr), state, sizeof(state))) {
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "azan.status");
        return false;
    }
    const char* backend = (self->playbackSvc_ && self->playbackSvc_->backendName)
                              ? self->playbackSvc_->backendName(self->playbackSvc_->ctx) : "";
    const char* source = (self->prayerSvc_ && self->prayerSvc_->sourceName)
                             ? self->prayerSvc_->sourceName(self->prayerSvc_->ctx) : "";
    const int n = snprintf(reply, replyLen, "{\"ok\":true,\"backend\":\"%s\",\"provider\":\"%s\",\"state\":%s}",
                           backend, source, state);
    if (n < 0 || (size_t)n >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "azan.status");
        return false;
    }
    return true;
}

void AzanModule::registerHaEntities_()
{
    if (!haSvc_) return;

    if (haSvc_->addSensor) {
        const HASensorEntry times[PRAYER_SCHEDULED_COUNT] = {
            {"azan", "fajr_time", "Fajr",
             MqttTopics::SuffixAzanState,
             "{{ (value_json.times.fajr | int(0)) | timestamp_custom('%Y-%m-%dT%H:%M:%S%z', false) if (value_json.times.fajr | int(0)) > 0 else None }}",
             nullptr, "mdi:weather-night", nullptr, "timestamp"},
            {"azan", "sunrise_time", "Sunrise",
             MqttTopics::SuffixAzanState,
             "{{ (value_json.times.sunrise | int(0)) | timestamp_custom('%Y-%m-%dT%H:%M:%S%z', false) if (value_json.times.sunrise | int(0)) > 0 else None }}",
             nullptr, "mdi:weather-sunset-up", nullptr, "timestamp"},
            {"azan", "dhuhr_time", "Dhuhr",
             MqttTopics::SuffixAzanState,
             "{{ (value_json.times.dhuhr | int(0)) | timestamp_custom('%Y-%m-%dT%H:%M:%S%z', false) if (value_json.times.dhuhr | int(0)) > 0 else None }}",
             nullptr, "mdi:weather-sunny", nullptr, "timestamp"},
            {"azan", "asr_time", "Asr",
             MqttTopics::SuffixAzanState,
             "{{ (value_json.times.asr | int(0)) | timestamp_custom('%Y-%m-%dT%H:%M:%S%z', false) if (value_json.times.asr | int(0)) > 0 else None }}",
             nullptr, "mdi:weather-partly-cloudy", nullptr, "timestamp"},
            {"azan", "maghrib_time", "Maghrib",
             MqttTopics::SuffixAzanState,
             "{{ (value_json.times.maghrib | int(0)) | timestamp_custom('%Y-%m-%dT%H:%M:%S%z', false) if (value_json.times.maghrib | int(0)) > 0 else None }}",
             nullptr, "mdi:weather-sunset-down", nullptr, "timestamp"},
            {"azan", "isha_time", "Isha",
             MqttTopics::SuffixAzanState,
             "{{ (value_json.times.isha | int(0)) | timestamp_custom('%Y-%m-%dT%H:%M:%S%z', false) if (value_json.times.isha | int(0)) > 0 else None }}",
             nullptr, "mdi:weather-night", nullptr, "timestamp"},
        };
        for (uint8_t k = 0; k < PRAYER_SCHEDULED_COUNT; ++k) {
            (void)haSvc_->addSensor(haSvc_->ctx, &times[k]);
        }

        const HASensorEntry next{
            "azan", "next_prayer", "Next prayer",
            MqttTopics::SuffixAzanState, "{{ value_json.next.kind if value_json.next.kind else 'none' }}",
            nullptr, "mdi:mosque", nullptr, nullptr
        };
        (void)haSvc_->addSensor(haSvc_->ctx, &next);
        const HASensorEntry countdown{
            "azan", "next_countdown", "Next prayer in",
            MqttTopics::SuffixAzanState, "{{ value_json.next.countdown_s | int(0) }}",
            nullptr, "mdi:timer-sand", "s", "duration"
        };
        (void)haSvc_->addSensor(haSvc_->ctx, &countdown);
        const HASensorEntry hijri{
            "azan", "hijri_date", "Hijri date",
            MqttTopics::SuffixAzanState, "{{ value_json.hijri }}",
            nullptr, "mdi:calendar-star", nullptr, nullptr
        };
        (void)haSvc_->addSensor(haSvc_->ctx, &hijri);
        const HASensorEntry status{
            "azan", "status", "Azan status",
            MqttTopics::SuffixAzanState, "{{ value_json.status }}",
            nullptr, "mdi:speaker", nullptr, nullptr
        };
        (void)haSvc_->addSensor(haSvc_->ctx, &status);
        const HASensorEntry lastError{
            "azan", "last_error", "Azan last error",
            MqttTopics::SuffixAzanState, "{{ value_json.last_error }}",
            "diagnostic", "mdi:alert-circle-outline", nullptr, nullptr
        };
        (void)haSvc_->addSensor(haSvc_->ctx, &lastError);
    }

    if (haSvc_->addSwitch) {
        const HASwitchEntry switches[] = {
            {"azan", "enabled", "Azan",
             "cfg/azan", "{{ 'ON' if value_json.enabled else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"enabled\":true}}", "{\"azan\":{\"enabled\":false}}",
             "mdi:bullhorn", "config"},
            {"azan", "en_fajr", "Azan Fajr",
             "cfg/azan", "{{ 'ON' if value_json.en_fajr else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"en_fajr\":true}}", "{\"azan\":{\"en_fajr\":false}}",
             "mdi:weather-night", "config"},
            {"azan", "en_sunrise", "Azan Sunrise",
             "cfg/azan", "{{ 'ON' if value_json.en_sunrise else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"en_sunrise\":true}}", "{\"azan\":{\"en_sunrise\":false}}",
             "mdi:weather-sunset-up", "config"},
            {"azan", "en_dhuhr", "Azan Dhuhr",
             "cfg/azan", "{{ 'ON' if value_json.en_dhuhr else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"en_dhuhr\":true}}", "{\"azan\":{\"en_dhuhr\":false}}",
             "mdi:weather-sunny", "config"},
            {"azan", "en_asr", "Azan Asr",
             "cfg/azan", "{{ 'ON' if value_json.en_asr else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"en_asr\":true}}", "{\"azan\":{\"en_asr\":false}}",
             "mdi:weather-partly-cloudy", "config"},
            {"azan", "en_maghrib", "Azan Maghrib",
             "cfg/azan", "{{ 'ON' if value_json.en_maghrib else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"en_maghrib\":true}}", "{\"azan\":{\"en_maghrib\":false}}",
             "mdi:weather-sunset-down", "config"},
            {"azan", "en_isha", "Azan Isha",
             "cfg/azan", "{{ 'ON' if value_json.en_isha else 'OFF' }}",
             MqttTopics::SuffixCfgSet, "{\"azan\":{\"en_isha\":true}}", "{\"azan\":{\"en_isha\":false}}",
             "mdi:weather-night", "config"},
        };
        for (const HASwitchEntry& s : switches) {
            (void)haSvc_->addSwitch(haSvc_->ctx, &s);
        }
    }

    if (haSvc_->addNumber) {
        const HANumberEntry offset{
            "azan", "offset_min", "Azan offset",
            "cfg/azan", "{{ value_json.offset_min }}",
            MqttTopics::SuffixCfgSet, "{\"azan\":{\"offset_min\":{{ value | int(0) }}}}",
            -60.0f, 60.0f, 1.0f, "box", "config", "mdi:timer-cog-outline", "min"
        };
        (void)haSvc_->addNumber(haSvc_->ctx, &offset);
    }

    if (haSvc_->addButton) {
        const HAButtonEntry test{
            "azan", "test", "Azan test",
            MqttTopics::SuffixCmd, "{\"cmd\":\"azan.trigger\",\"args\":{\"kind\":\"Test\"}}",
            nullptr, "mdi:play-circle-outline"
        };
        (void)haSvc_->addButton(haSvc_->ctx, &test);
        const HAButtonEntry stop{
            "azan", "stop", "Azan stop",
            MqttTopics::SuffixCmd, "{\"cmd\":\"azan.stop\"}",
            nullptr, "mdi:stop-circle-outline"
        };
        (void)haSvc_->addButton(haSvc_->ctx, &stop);
        const HAButtonEntry refresh{
            "azan", "refresh", "Refresh prayer times",
            MqttTopics::SuffixCmd, "{\"cmd\":\"azan.refresh\"}",
            "diagnostic", "mdi:refresh"
        };
        (void)haSvc_->addButton(haSvc_->ctx, &refresh);
    }
}

void AzanModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(offsetVar);
    cfg.registerVar(enFajrVar);
    cfg.registerVar(enSunriseVar);
    cfg.registerVar(enDhuhrVar);
    cfg.registerVar(enAsrVar);
    cfg.registerVar(enMaghribVar);
    cfg.registerVar(enIshaVar);
    cfg.registerVar(fetchWaitVar);
    cfg.registerVar(preemptVar);
    cfg.registerVar(playMaxVar);

    reqQ_ = xQueueCreate(Limits::Azan::RequestQueueLen, sizeof(Request));
    if (!reqQ_) LOGE("azan queue allocation failed");

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    auto* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;
    cmdSvc_ = services.get<CommandService>("cmd");
    schedSvc_ = services.get<TimeSchedulerService>("time.scheduler");
    prayerSvc_ = services.get<PrayerTimesService>("prayertimes");
    audioSvc_ = services.get<AudioCacheService>("audiocache");
    playbackSvc_ = services.get<PlaybackService>("playback");
    haSvc_ = services.get<HAService>("ha");

    if (!schedSvc_) LOGE("time.scheduler service missing, prayers will not be armed");

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "azan.trigger", &AzanModule::cmdTrigger_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "azan.stop", &AzanModule::cmdStop_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "azan.refresh", &AzanModule::cmdRefresh_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "azan.status", &AzanModule::cmdStatus_, this);
    }

    if (eventBus_) {
        eventBus_->subscribe(EventId::SchedulerEventTriggered, &AzanModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::TimeTableFetched, &AzanModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::AssetResolved, &AzanModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::PlaybackCompleted, &AzanModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::ConfigChanged, &AzanModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::DataChanged, &AzanModule::onEventStatic_, this);
    }

    registerHaEntities_();
}

void AzanModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    timeoutsDirty_ = true;
    refreshPending_ = true;
    refreshForce_ = true;
    if (dataStore_) setAzanStatus(*dataStore_, (uint8_t)AzanStatus::Idle, AZAN_KIND_NONE);
    LOGI("azan %s, offset=%ld min", cfgData.enabled ? "enabled" : "disabled", (long)cfgData.offsetMin);
}
