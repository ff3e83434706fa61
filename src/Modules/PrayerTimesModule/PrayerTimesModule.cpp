/**
 * @file PrayerTimesModule.cpp
 * @brief Implementation file.
 */

#include "PrayerTimesModule.h"
#include "Modules/PrayerTimesModule/TimeTableParsers.h"
#include <Arduino.h>
#include <string.h>
#include <strings.h>

#define LOG_TAG "PrayerTM"
#include "Core/ModuleLog.h"

void PrayerTimesModule::selectSource_()
{
    TimeTableSource* next = &aladhan_;
    if (strcasecmp(cfgData.source, "portal") == 0) {
        next = &portal_;
    } else if (strcasecmp(cfgData.source, "aladhan") != 0) {
        LOGW("unknown source '%s', using aladhan", cfgData.source);
    }
    if (next != active_) {
        LOGI("time table source: %s", next->name());
    }
    active_ = next;
}

TimeTableStatus PrayerTimesModule::fetch_(const CivilDate& day, TimeTable& out)
{
    char d[12] = {0};
    (void)formatCivilDate(day, d, sizeof(d));

    if (wifiSvc_ && wifiSvc_->isConnected && !wifiSvc_->isConnected(wifiSvc_->ctx)) {
        LOGW("fetch %s skipped: network down", d);
        return TimeTableStatus::SourceUnavailable;
    }
    TimeTableSource* src = active_;
    TimeTableStatus st = src->fetch(day, out);
    if (st == TimeTableStatus::Ok) {
        fillHijriIfMissing(out);
        char f[6] = {0};
        char i[6] = {0};
        (void)formatHhMm(out.minuteOfDay[(uint8_t)PrayerKind::Fajr], f, sizeof(f));
        (void)formatHhMm(out.minuteOfDay[(uint8_t)PrayerKind::Isha], i, sizeof(i));
        LOGI("table %s from %s fajr=%s isha=%s hijri=%s", d, src->name(), f, i, out.hijri);
    } else {
        LOGW("table %s from %s failed: %s", d, src->name(), timeTableStatusStr(st));
    }
    return st;
}

PrayerTimesModule::ResultSlot* PrayerTimesModule::claimSlot_(const CivilDate& day)
{
    ResultSlot* oldest = nullptr;
    for (uint8_t i = 0; i < Limits::Prayer::ResultSlots; ++i) {
        ResultSlot& r = slots_[i];
        if (r.state != SlotState::Empty && r.day == day) return &r;
    }
    for (uint8_t i = 0; i < Limits::Prayer::ResultSlots; ++i) {
        ResultSlot& r = slots_[i];
        if (r.state == SlotState::Empty) return &r;
        if (r.state == SlotState::Done && (!oldest || (int32_t)(r.doneMs - oldest->doneMs) < 0)) oldest = &r;
    }
    return oldest;
}

TimeTableFetch PrayerTimesModule::request_(const CivilDate& day, uint32_t maxAgeMs,
                                           TimeTable& out, TimeTableStatus& st)
{
    st = TimeTableStatus::SourceUnavailable;
    if (!slotMutex_ || !jobQ_) return TimeTableFetch::Failed;

    TimeTableFetch res = TimeTableFetch::Failed;
    bool queueFull = false;
    xSemaphoreTake(slotMutex_, portMAX_DELAY);
    ResultSlot* r = claimSlot_(day);
    if (!r) {
        // Every slot is in flight for another day.
        queueFull = true;
    } else if (r->state == SlotState::InFlight && r->day == day) {
        res = TimeTableFetch::Pending;
    } else if (r->state == SlotState::Done && r->day == day && r->configGen == configGen_ &&
               (uint32_t)(millis() - r->doneMs) <= maxAgeMs) {
        st = r->status;
        if (st == TimeTableStatus::Ok) {
            out = r->table;
            res = TimeTableFetch::Ready;
        } else {
            r->state = SlotState::Empty;
        }
    } else {
        FetchJob job;
        job.day = day;
        job.configGen = configGen_;
        if (xQueueSendToBack(jobQ_, &job, 0) == pdTRUE) {
            r->state = SlotState::InFlight;
            r->day = day;
            r->configGen = configGen_;
            res = TimeTableFetch::Pending;
        } else {
            r->state = SlotState::Empty;
            queueFull = true;
        }
    }
    xSemaphoreGive(slotMutex_);

    if (queueFull) {
        char d[12] = {0};
        (void)formatCivilDate(day, d, sizeof(d));
        LOGW("fetch %s not queued", d);
    }
    return res;
}

void PrayerTimesModule::runJob_(const FetchJob& job)
{
    TimeTable fresh;
    const TimeTableStatus st = fetch_(job.day, fresh);

    xSemaphoreTake(slotMutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < Limits::Prayer::ResultSlots; ++i) {
        ResultSlot& r = slots_[i];
        if (r.state != SlotState::InFlight || r.day != job.day) continue;
        r.state = SlotState::Done;
        r.configGen = job.configGen;
        r.doneMs = millis();
        r.status = st;
        r.table = fresh;
        break;
    }
    xSemaphoreGive(slotMutex_);

    TimeTableFetchedPayload p{};
    p.year = job.day.year;
    p.month = job.day.month;
    p.day = job.day.day;
    p.status = (uint8_t)st;
    if (!eventBus_ || !eventBus_->post(EventId::TimeTableFetched, &p, sizeof(p))) {
        LOGW("TimeTableFetched not posted");
    }
}

void PrayerTimesModule::loop()
{
    FetchJob job;
    if (jobQ_ && xQueueReceive(jobQ_, &job, pdMS_TO_TICKS(1000)) == pdTRUE) {
        runJob_(job);
    }
}

TimeTableFetch PrayerTimesModule::svcRequest_(void* ctx, const CivilDate* day, uint32_t maxAgeMs,
                                              TimeTable* out, TimeTableStatus* st)
{
    PrayerTimesModule* self = static_cast<PrayerTimesModule*>(ctx);
    if (!self || !day || !out || !st) return TimeTableFetch::Failed;
    return self->request_(*day, maxAgeMs, *out, *st);
}

bool PrayerTimesModule::svcProvidesFutureDays_(void* ctx)
{
    PrayerTimesModule* self = static_cast<PrayerTimesModule*>(ctx);
    if (!self) return false;
    return self->active_->providesFutureDays();
}

const char* PrayerTimesModule::svcSourceName_(void* ctx)
{
    PrayerTimesModule* self = static_cast<PrayerTimesModule*>(ctx);
    if (!self) return "";
    return self->active_->name();
}

void PrayerTimesModule::onEventStatic_(const Event& e, void* user)
{
    PrayerTimesModule* self = static_cast<PrayerTimesModule*>(user);
    if (self) self->onEvent_(e);
}

void PrayerTimesModule::onEvent_(const Event& e)
{
    if (e.id != EventId::ConfigChanged) return;
    if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strncmp(p->nvsKey, "pt_", 3) != 0) return;
    if (strcmp(p->nvsKey, NvsKeys::Prayer::Source) == 0) {
        selectSource_();
    }
    if (slotMutex_) {
        xSemaphoreTake(slotMutex_, portMAX_DELAY);
        ++configGen_;
        xSemaphoreGive(slotMutex_);
    }
}

void PrayerTimesModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(sourceVar);
    cfg.registerVar(apiBaseVar);
    cfg.registerVar(latitudeVar);
    cfg.registerVar(longitudeVar);
    cfg.registerVar(methodVar);
    cfg.registerVar(schoolVar);
    cfg.registerVar(portalUrlVar);

    slotMutex_ = xSemaphoreCreateMutex();
    jobQ_ = xQueueCreate(Limits::Prayer::FetchQueueLen, sizeof(FetchJob));
    if (!slotMutex_ || !jobQ_) {
        LOGE("prayer times primitives allocation failed");
    }
    wifiSvc_ = services.get<WifiService>("wifi");

    svc_.request = &PrayerTimesModule::svcRequest_;
    svc_.providesFutureDays = &PrayerTimesModule::svcProvidesFutureDays_;
    svc_.sourceName = &PrayerTimesModule::svcSourceName_;
    svc_.ctx = this;
    services.add("prayertimes", &svc_);

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus_) {
        eventBus_->subscribe(EventId::ConfigChanged, &PrayerTimesModule::onEventStatic_, this);
    }
}

void PrayerTimesModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    selectSource_();
}
