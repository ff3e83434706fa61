#pragma once
/**
 * @file PrayerTimesModule.h
 * @brief Prayer time table provider.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Modules/PrayerTimesModule/TimeTableSource.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>

/**
 * @brief Active module exposing the `prayertimes` service.
 *
 * The active source follows `prayer.source` and is switched when that key
 * changes. Requests are queued to the module task, which fetches one day at
 * a time into a shared body buffer and keeps the last results for
 * collection. Any `prayer.*` change drops the kept results.
 */
class PrayerTimesModule : public Module {
public:
    const char* moduleId() const override { return "prayertimes"; }
    const char* taskName() const override { return "prayertimes"; }
    uint16_t taskStackSize() const override { return Limits::Prayer::TaskStackSize; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "wifi";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    enum class SlotState : uint8_t { Empty = 0, InFlight, Done };

    struct ResultSlot {
        SlotState state = SlotState::Empty;
        CivilDate day{};
        uint32_t configGen = 0;
        uint32_t doneMs = 0;
        TimeTableStatus status = TimeTableStatus::SourceUnavailable;
        TimeTable table{};
    };

    struct FetchJob {
        CivilDate day{};
        uint32_t configGen = 0;
    };

    PrayerConfig cfgData{};
    char body_[Limits::Prayer::MaxBodyBytes] = {0};
    AladhanSource aladhan_{cfgData, SourceBuffer{body_, sizeof(body_)}};
    PortalSource portal_{cfgData, SourceBuffer{body_, sizeof(body_)}};
    TimeTableSource* volatile active_ = &aladhan_;

    ResultSlot slots_[Limits::Prayer::ResultSlots]{};
    uint32_t configGen_ = 0;
    SemaphoreHandle_t slotMutex_ = nullptr;
    QueueHandle_t jobQ_ = nullptr;

    EventBus* eventBus_ = nullptr;
    const WifiService* wifiSvc_ = nullptr;
    PrayerTimesService svc_{};

    ConfigVariable<char> sourceVar {
        NVS_KEY(NvsKeys::Prayer::Source),"source","prayer",ConfigType::CharArray,
        (char*)cfgData.source,ConfigPersistence::Persistent,sizeof(cfgData.source)
    };
    ConfigVariable<char> apiBaseVar {
        NVS_KEY(NvsKeys::Prayer::ApiBase),"api_base","prayer",ConfigType::CharArray,
        (char*)cfgData.apiBase,ConfigPersistence::Persistent,sizeof(cfgData.apiBase)
    };
    ConfigVariable<float> latitudeVar {
        NVS_KEY(NvsKeys::Prayer::Latitude),"latitude","prayer",ConfigType::Float,
        &cfgData.latitude,ConfigPersistence::Persistent,0
    };
    ConfigVariable<float> longitudeVar {
        NVS_KEY(NvsKeys::Prayer::Longitude),"longitude","prayer",ConfigType::Float,
        &cfgData.longitude,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> methodVar {
        NVS_KEY(NvsKeys::Prayer::Method),"method","prayer",ConfigType::Int32,
        &cfgData.method,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> schoolVar {
        NVS_KEY(NvsKeys::Prayer::School),"school","prayer",ConfigType::Int32,
        &cfgData.school,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> portalUrlVar {
        NVS_KEY(NvsKeys::Prayer::PortalUrl),"portal_url","prayer",ConfigType::CharArray,
        (char*)cfgData.portalUrl,ConfigPersistence::Persistent,sizeof(cfgData.portalUrl)
    };

    void selectSource_();
    TimeTableStatus fetch_(const CivilDate& day, TimeTable& out);
    TimeTableFetch request_(const CivilDate& day, uint32_t maxAgeMs, TimeTable& out, TimeTableStatus& st);
    ResultSlot* claimSlot_(const CivilDate& day);
    void runJob_(const FetchJob& job);

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    static TimeTableFetch svcRequest_(void* ctx, const CivilDate* day, uint32_t maxAgeMs,
                                      TimeTable* out, TimeTableStatus* st);
    static bool svcProvidesFutureDays_(void* ctx);
    static const char* svcSourceName_(void* ctx);
};
