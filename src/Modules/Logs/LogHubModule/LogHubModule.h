#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that owns the log queue and the sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"

/**
 * @brief Passive module exposing `loghub` and `logsinks` services.
 *
 * Must be the first registered module: `Log::` calls made before init()
 * are dropped. The `log/min_level` config (0 debug .. 3 error) is applied
 * once persistent values are loaded.
 */
class LogHubModule : public ModulePassive {
public:
    const char* moduleId() const override { return "loghub"; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static bool svcEnqueue_(void* ctx, const LogEntry& e);
    static bool svcAddSink_(void* ctx, LogSinkService sink);
    static int svcSinkCount_(void* ctx);
    static LogSinkService svcSinkAt_(void* ctx, int idx);

    LogHub hub_;
    LogHubService hubSvc_{};

    LogSinkRegistry sinks_;
    LogSinkRegistryService sinksSvc_{};

    int32_t minLevel_ = (int32_t)LogLevel::Info;
    ConfigVariable<int32_t> minLevelVar {
        NVS_KEY(NvsKeys::Log::MinLevel),"min_level","log",ConfigType::Int32,
        &minLevel_,ConfigPersistence::Persistent,0
    };
};
