#pragma once
/**
 * @file AzanModule.h
 * @brief Azan event scheduler and playback orchestration.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/ErrorCodes.h"
#include "Core/Services/Services.h"
#include "Modules/AzanModule/AzanModuleDataModel.h"
#include "Modules/AzanModule/PlaybackArbiter.h"
#include "Modules/AzanModule/SchedulePlanner.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/** @brief Scheduler configuration values. */
struct AzanConfig {
    bool enabled = true;
    int32_t offsetMin = 0;
    bool kindEnabled[PRAYER_SCHEDULED_COUNT] = {true, false, true, true, true, true};
    int32_t fetchWaitS = 180;
    int32_t preemptMs = 5000;
    int32_t playMaxS = 300;
};

/**
 * @brief Active module owning the daily schedule and the playback session.
 *
 * Everything that mutates the schedule or the session (commands, scheduler
 * fires, asset and backend completions, config changes) is funneled through
 * one FreeRTOS queue and applied on the module task. Table fetches, asset
 * fetches and backend calls run on the `prayertimes`, `audiocache` and
 * `playback` tasks.
 *
 * Prayer instants are armed as `time.scheduler` one-shot slots starting at
 * `Limits::Azan::FirstSchedulerSlot`, one slot per kind.
 */
class AzanModule : public Module {
public:
    const char* moduleId() const override { return "azan"; }
    const char* taskName() const override { return "azan"; }
    uint16_t taskStackSize() const override { return Limits::Azan::TaskStackSize; }

    uint8_t dependencyCount() const override { return 9; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "cmd";
        if (i == 4) return "time";
        if (i == 5) return "prayertimes";
        if (i == 6) return "audiocache";
        if (i == 7) return "playback";
        if (i == 8) return "ha";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /**
     * @brief Serializes the runtime projection for `rt/azan/state` and `azan.status`.
     *
     * `countdown_s` is computed against `nowEpoch`; it is null when nothing is armed.
     */
    static bool buildStateJson(const AzanRuntimeData& rt, uint64_t nowEpoch, char* out, size_t len);

private:
    enum class RequestType : uint8_t {
        Trigger = 0,
        Stop,
        Refresh,
        SchedulerFire,
        AssetResolved,
        PlaybackCompleted,
        ConfigChanged,
        TableFetched
    };

    struct Request {
        RequestType type = RequestType::Refresh;
        uint8_t kind = 0;
        uint8_t slot = 0;
        uint8_t op = 0;
        uint8_t ok = 0;
        uint8_t force = 0;
        uint16_t eventId = 0;
        uint16_t errorCode = 0;
        uint32_t seq = 0;
        uint32_t handle = 0;
        uint64_t epochSec = 0;
        char nvsKey[16] = {0};
    };

    /** @brief Asset wait of the session being resolved. */
    struct AssetWait {
        bool active = false;
        uint32_t seq = 0;
        uint8_t assetIdx = 0;
        uint32_t generation = 0;
        bool fallbackTried = false;
    };

    AzanConfig cfgData{};
    PlaybackArbiter arbiter_{};
    AssetWait wait_{};
    char startPath_[Limits::Audio::PathBuf] = {0};

    TimeTable previous_{};
    TimeTable today_{};
    TimeTable tomorrow_{};
    SchedulePlan armed_{};
    int64_t playedEpoch_[PRAYER_SCHEDULED_COUNT] = {0, 0, 0, 0, 0, 0};

    bool refreshPending_ = true;
    bool refreshForce_ = true;
    bool waitForce_ = false;
    uint32_t lastRefreshMs_ = 0;
    uint32_t refreshDelayMs_ = 0;
    volatile bool timeoutsDirty_ = true;

    AzanStatus publishedStatus_ = AzanStatus::Idle;
    uint8_t publishedKind_ = AZAN_KIND_NONE;

    QueueHandle_t reqQ_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    const TimeSchedulerService* schedSvc_ = nullptr;
    const PrayerTimesService* prayerSvc_ = nullptr;
    const AudioCacheService* audioSvc_ = nullptr;
    const PlaybackService* playbackSvc_ = nullptr;
    const HAService* haSvc_ = nullptr;

    ConfigVariable<bool> enabledVar {
        NVS_KEY(NvsKeys::Azan::Enabled),"enabled","azan",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> offsetVar {
        NVS_KEY(NvsKeys::Azan::OffsetMin),"offset_min","azan",ConfigType::Int32,
        &cfgData.offsetMin,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enFajrVar {
        NVS_KEY(NvsKeys::Azan::EnFajr),"en_fajr","azan",ConfigType::Bool,
        &cfgData.kindEnabled[0],ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enSunriseVar {
        NVS_KEY(NvsKeys::Azan::EnSunrise),"en_sunrise","azan",ConfigType::Bool,
        &cfgData.kindEnabled[1],ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enDhuhrVar {
        NVS_KEY(NvsKeys::Azan::EnDhuhr),"en_dhuhr","azan",ConfigType::Bool,
        &cfgData.kindEnabled[2],ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enAsrVar {
        NVS_KEY(NvsKeys::Azan::EnAsr),"en_asr","azan",ConfigType::Bool,
        &cfgData.kindEnabled[3],ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enMaghribVar {
        NVS_KEY(NvsKeys::Azan::EnMaghrib),"en_maghrib","azan",ConfigType::Bool,
        &cfgData.kindEnabled[4],ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enIshaVar {
        NVS_KEY(NvsKeys::Azan::EnIsha),"en_isha","azan",ConfigType::Bool,
        &cfgData.kindEnabled[5],ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> fetchWaitVar {
        NVS_KEY(NvsKeys::Azan::FetchWaitS),"fetch_wait_s","azan",ConfigType::Int32,
        &cfgData.fetchWaitS,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> preemptVar {
        NVS_KEY(NvsKeys::Azan::PreemptMs),"preempt_ms","azan",ConfigType::Int32,
        &cfgData.preemptMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> playMaxVar {
        NVS_KEY(NvsKeys::Azan::PlayMaxS),"play_max_s","azan",ConfigType::Int32,
        &cfgData.playMaxS,ConfigPersistence::Persistent,0
    };

    // ---- request queue ----
    bool enqueue_(const Request& req);
    void handle_(const Request& req);

    // ---- schedule ----
    void refresh_(bool force);
    TableLoad loadTable_(const CivilDate& day, TimeTable& slot, bool force, TimeTableStatus& st);
    void refreshFailed_(TimeTableStatus st, const CivilDate& day);
    void arm_(const SchedulePlan& plan);
    void clearSlots_();
    void onFire_(const Request& req);
    PlannerConfig plannerConfig_() const;

    // ---- session ----
    void applyTimeouts_();
    void drainActions_();
    void resolveAsset_(const ArbiterAction& a, AudioAssetId id);
    void onAssetResolved_(const Request& req);
    void onPlaybackCompleted_(const Request& req);
    void reportError_(ErrorCode err, const char* where);
    void publishStatus_();

    void registerHaEntities_();

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    static bool cmdTrigger_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStop_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdRefresh_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
