#pragma once
/**
 * @file TimeModule.h
 * @brief Time synchronization and scheduling module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include <time.h>
#include <WiFi.h>
#include <freertos/FreeRTOS.h>

/** @brief Time sync configuration values. */
struct TimeConfig {
    char server1[40] = "pool.ntp.org";
    char server2[40] = "time.nist.gov";
    char tz[64]      = "CET-1CEST,M3.5.0,M10.5.0/3";
    bool enabled = true;
};

/**
 * @brief Active module that synchronizes time and drives scheduler events.
 *
 * Slots live in RAM only. Owners re-arm them after boot; slot 0 is the
 * system day-start trigger used by consumers to refresh daily data.
 */
class TimeModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "time"; }
    /** @brief Task name. */
    const char* taskName() const override { return "time"; }

    /** @brief Depends on log hub, datastore, command and event bus. */
    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "datastore";
        if (i == 2) return "cmd";
        if (i == 3) return "eventbus";
        return nullptr;
    }

    /** @brief Initialize time config and services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply the persisted time zone once config is loaded. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Time task loop. */
    void loop() override;

    /** @brief Force a resync attempt. */
    void forceResync();

private:
    static constexpr uint32_t INVALID_MINUTE_KEY = 0xFFFFFFFFUL;
    static constexpr uint32_t WarmupMs = 2000;
    static constexpr uint32_t ResyncPeriodMs = 6UL * 3600UL * 1000UL;
    static constexpr uint32_t RetryMinMs = 2000;
    static constexpr uint32_t RetryMaxMs = 300000;
    static constexpr uint32_t TickMs = 250;

    struct SchedulerSlotRuntime {
        bool used = false;
        TimeSchedulerSlot def{};
        uint32_t lastTriggerMinuteKey = INVALID_MINUTE_KEY;
    };

    TimeConfig cfgData{};

    const CommandService* cmdSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    TimeService timeSvc_{};
    TimeSchedulerService schedSvc_{};

    TimeSyncState state_ = TimeSyncState::WaitingNetwork;
    uint32_t stateTs_ = 0;

    ConfigVariable<char> server1Var {
        NVS_KEY(NvsKeys::Time::Server1),"server1","time",ConfigType::CharArray,
        (char*)cfgData.server1,ConfigPersistence::Persistent,sizeof(cfgData.server1)
    };
    ConfigVariable<char> server2Var {
        NVS_KEY(NvsKeys::Time::Server2),"server2","time",ConfigType::CharArray,
        (char*)cfgData.server2,ConfigPersistence::Persistent,sizeof(cfgData.server2)
    };
    ConfigVariable<char> tzVar {
        NVS_KEY(NvsKeys::Time::Tz),"tz","time",ConfigType::CharArray,
        (char*)cfgData.tz,ConfigPersistence::Persistent,sizeof(cfgData.tz)
    };
    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Time::Enabled),"enabled","time",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    static bool cmdResync_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSchedInfo_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSchedGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    bool handleCmdSchedInfo_(char* reply, size_t replyLen);
    bool handleCmdSchedGet_(const CommandRequest& req, char* reply, size_t replyLen);

    void setState_(TimeSyncState s);
    void applyTimeZone_();

    static bool svcIsSynced_(void* ctx);
    static bool svcFormatLocalTime_(void* ctx, char* out, size_t len);

    static bool svcSchedSetSlot_(void* ctx, const TimeSchedulerSlot* slotDef);
    static bool svcSchedGetSlot_(void* ctx, uint8_t slot, TimeSchedulerSlot* outDef);
    static bool svcSchedClearSlot_(void* ctx, uint8_t slot);
    static uint8_t svcSchedUsedCount_(void* ctx);

    bool setSlot_(const TimeSchedulerSlot& slotDef, bool system);
    bool getSlot_(uint8_t slot, TimeSchedulerSlot& outDef) const;
    bool clearSlot_(uint8_t slot);
    uint8_t usedCount_() const;

    static void sanitizeLabel_(char* label);
    void applySystemSlots_();
    void resetScheduleRuntime_();
    void tickScheduler_();

    static uint8_t weekBitFromTm_(const tm& localNow);

    // ---- network warmup ----
    bool netReady_ = false;
    uint32_t netReadyTs_ = 0;

    // ---- retry backoff ----
    uint32_t retryDelayMs_ = RetryMinMs;
    volatile bool resyncRequested_ = false;
    volatile bool tzDirty_ = false;

    // ---- time scheduler ----
    mutable portMUX_TYPE schedMux_ = portMUX_INITIALIZER_UNLOCKED;
    SchedulerSlotRuntime sched_[TIME_SCHED_MAX_SLOTS]{};
    bool schedInitialized_ = false;
    int lastDayKey_ = -1;
};
