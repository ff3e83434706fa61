/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"
#include <Arduino.h>

bool LogHubModule::svcEnqueue_(void* ctx, const LogEntry& e)
{
    return static_cast<LogHub*>(ctx)->enqueue(e);
}

bool LogHubModule::svcAddSink_(void* ctx, LogSinkService sink)
{
    return static_cast<LogSinkRegistry*>(ctx)->add(sink);
}

int LogHubModule::svcSinkCount_(void* ctx)
{
    return static_cast<LogSinkRegistry*>(ctx)->count();
}

LogSinkService LogHubModule::svcSinkAt_(void* ctx, int idx)
{
    return static_cast<LogSinkRegistry*>(ctx)->get(idx);
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    if (!hub_.init(Limits::LogQueueLen)) {
        Serial.println("[LOG][ERR] log queue allocation failed");
    }
    cfg.registerVar(minLevelVar);

    hubSvc_.enqueue = &LogHubModule::svcEnqueue_;
    hubSvc_.ctx = &hub_;

    sinksSvc_.add = &LogHubModule::svcAddSink_;
    sinksSvc_.count = &LogHubModule::svcSinkCount_;
    sinksSvc_.get = &LogHubModule::svcSinkAt_;
    sinksSvc_.ctx = &sinks_;

    services.add("loghub", &hubSvc_);
    services.add("logsinks", &sinksSvc_);

    Log::setHub(&hubSvc_);
}

void LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (minLevel_ < (int32_t)LogLevel::Debug) minLevel_ = (int32_t)LogLevel::Debug;
    if (minLevel_ > (int32_t)LogLevel::Error) minLevel_ = (int32_t)LogLevel::Error;
    Log::setMinLevel((LogLevel)minLevel_);
}
