#pragma once
/**
 * @file AudioCacheModule.h
 * @brief Azan audio cache on LittleFS.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/ErrorCodes.h"
#include "Core/Services/Services.h"
#include "Modules/AudioCacheModule/AssetTable.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>

/** @brief Asset source configuration. Either a http(s) URL or an absolute LittleFS path. */
struct AudioCacheConfig {
    char primaryUrl[Limits::Audio::UrlBuf] = "";
    char fajrUrl[Limits::Audio::UrlBuf] = "";
};

/**
 * @brief Active module that keeps azan assets cached on flash.
 *
 * Layout per asset id: `/azan/<id>.mp3` (payload), `/azan/.<id>.url`
 * (source marker) and `/azan/<id>.tmp` (download in progress). A cached file
 * is only valid while its marker equals the configured source.
 *
 * resolve() never blocks on I/O. Misses are queued to the module task and
 * completions are announced with `EventId::AssetResolved`.
 */
class AudioCacheModule : public Module {
public:
    const char* moduleId() const override { return "audiocache"; }
    const char* taskName() const override { return "audiocache"; }
    uint16_t taskStackSize() const override { return Limits::Audio::TaskStackSize; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "cmd";
        if (i == 4) return "wifi";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief Enables the background prefetch of configured assets. */
    void setStartupReady(bool ready) { startupReady_ = ready; }

    static const char* assetName(AudioAssetId id);
    static bool parseAssetName(const char* text, AudioAssetId& out);
    /** @brief Rejects sources that would need transcoding (video hosting pages). */
    static bool sourceSupported(const char* url);

private:
    enum class JobOp : uint8_t { Fetch = 0, Discard };

    struct FetchJob {
        JobOp op = JobOp::Fetch;
        uint8_t idx = 0;
        uint32_t generation = 0;
        char url[Limits::Audio::UrlBuf] = {0};
    };

    AudioCacheConfig cfgData{};
    AssetTable table_{};
    SemaphoreHandle_t tableMutex_ = nullptr;
    QueueHandle_t jobQ_ = nullptr;
    bool fsReady_ = false;
    volatile bool startupReady_ = false;
    bool prefetchDone_ = false;

    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    AudioCacheService svc_{};

    uint8_t ioBuf_[Limits::Audio::ChunkBytes] = {0};

    ConfigVariable<char> primaryUrlVar {
        NVS_KEY(NvsKeys::Audio::PrimaryUrl),"primary_url","audio",ConfigType::CharArray,
        (char*)cfgData.primaryUrl,ConfigPersistence::Persistent,sizeof(cfgData.primaryUrl)
    };
    ConfigVariable<char> fajrUrlVar {
        NVS_KEY(NvsKeys::Audio::FajrUrl),"fajr_url","audio",ConfigType::CharArray,
        (char*)cfgData.fajrUrl,ConfigPersistence::Persistent,sizeof(cfgData.fajrUrl)
    };

    const char* configuredUrl_(uint8_t idx) const;
    static void buildPath_(uint8_t idx, const char* suffix, bool hidden, char* out, size_t len);

    AudioResolve resolve_(uint8_t idx, uint32_t* generation, char* path, size_t pathLen);
    bool enqueue_(JobOp op, uint8_t idx, uint32_t generation, const char* url);
    void discard_(uint8_t idx);
    void seedFromFlash_();
    void prefetch_();

    void runJob_(const FetchJob& job);
    bool download_(const char* url, const char* tmpPath, uint32_t& bytes, ErrorCode& err);
    bool copyLocal_(const char* srcPath, const char* tmpPath, uint32_t& bytes, ErrorCode& err);
    bool install_(uint8_t idx, const char* url, const char* tmpPath);
    bool readMarker_(uint8_t idx, char* out, size_t len);
    uint32_t fileSize_(const char* path);
    void publishState_(uint8_t idx);

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdInvalidate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    static AudioResolve svcResolve_(void* ctx, AudioAssetId id, uint32_t* generation, char* path, size_t pathLen);
    static bool svcHasSource_(void* ctx, AudioAssetId id);
    static bool svcInvalidate_(void* ctx, AudioAssetId id);
};
