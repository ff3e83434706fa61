#pragma once
/**
 * @file PlaybackModule.h
 * @brief Playback driver and media server.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Modules/PlaybackModule/PlaybackTarget.h"
#include <ESPAsyncWebServer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Active module running backend start/stop calls off the scheduler task.
 *
 * Requests are queued by the `playback` service and executed in order. Each
 * one ends with a `PlaybackCompleted` event carrying the request `seq`.
 * Cached assets are served to the backend from `/local/azan/`.
 */
class PlaybackModule : public Module {
public:
    const char* moduleId() const override { return "playback"; }
    const char* taskName() const override { return "playback"; }
    uint16_t taskStackSize() const override { return Limits::Playback::TaskStackSize; }

    /** @brief Needs the LittleFS mount done by `audiocache` before serving media. */
    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "wifi";
        if (i == 4) return "audiocache";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief Builds `<media_base>/local/azan/<file>` for a cached path. */
    static bool buildMediaUrl(const char* mediaBase, const char* ip, const char* localPath,
                              char* out, size_t len);

private:
    struct Request {
        uint8_t op = 0; // PlaybackOp
        uint32_t seq = 0;
        uint32_t handle = 0;
        char path[Limits::Audio::PathBuf] = {0};
    };

    PlaybackConfig cfgData{};
    HaRestClient rest_{cfgData.haUrl, cfgData.haToken};
    CastTarget cast_{cfgData, rest_};
    WakeAndLaunchTarget wakeLaunch_{cfgData, rest_};
    PlaybackTarget* volatile target_ = &cast_;
    volatile bool backendDirty_ = false;
    uint32_t nextHandle_ = 0;

    QueueHandle_t reqQ_ = nullptr;
    AsyncWebServer server_{Limits::Playback::MediaServerPort};
    bool serverStarted_ = false;

    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    const WifiService* wifiSvc_ = nullptr;
    PlaybackService svc_{};

    ConfigVariable<char> backendVar {
        NVS_KEY(NvsKeys::Playback::Backend),"backend","playback",ConfigType::CharArray,
        (char*)cfgData.backend,ConfigPersistence::Persistent,sizeof(cfgData.backend)
    };
    ConfigVariable<char> haUrlVar {
        NVS_KEY(NvsKeys::Playback::HaUrl),"ha_url","playback",ConfigType::CharArray,
        (char*)cfgData.haUrl,ConfigPersistence::Persistent,sizeof(cfgData.haUrl)
    };
    ConfigVariable<char> haTokenVar {
        NVS_KEY(NvsKeys::Playback::HaToken),"ha_token","playback",ConfigType::CharArray,
        (char*)cfgData.haToken,ConfigPersistence::Persistent,sizeof(cfgData.haToken)
    };
    ConfigVariable<char> entityVar {
        NVS_KEY(NvsKeys::Playback::Entity),"entity","playback",ConfigType::CharArray,
        (char*)cfgData.entity,ConfigPersistence::Persistent,sizeof(cfgData.entity)
    };
    ConfigVariable<char> notifyVar {
        NVS_KEY(NvsKeys::Playback::NotifyService),"notify_service","playback",ConfigType::CharArray,
        (char*)cfgData.notifyService,ConfigPersistence::Persistent,sizeof(cfgData.notifyService)
    };
    ConfigVariable<bool> wakeAckVar {
        NVS_KEY(NvsKeys::Playback::WakeAck),"wake_ack","playback",ConfigType::Bool,
        &cfgData.wakeAck,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> wakeGraceVar {
        NVS_KEY(NvsKeys::Playback::WakeGraceMs),"wake_grace_ms","playback",ConfigType::Int32,
        &cfgData.wakeGraceMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> mediaBaseVar {
        NVS_KEY(NvsKeys::Playback::MediaBase),"media_base","playback",ConfigType::CharArray,
        (char*)cfgData.mediaBase,ConfigPersistence::Persistent,sizeof(cfgData.mediaBase)
    };

    void selectBackend_();
    void startServer_();
    void run_(const Request& req);
    void complete_(const Request& req, bool ok, ErrorCode err, uint32_t handle);

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    bool enqueue_(const Request& req);
    static bool svcRequestStart_(void* ctx, uint32_t seq, const char* localPath);
    static bool svcRequestStop_(void* ctx, uint32_t seq, uint32_t handle);
    static const char* svcBackendName_(void* ctx);
};
