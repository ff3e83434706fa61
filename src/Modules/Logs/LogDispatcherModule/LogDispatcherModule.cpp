/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <stdio.h>
#include <string.h>

void LogDispatcherModule::init(ConfigStore&, ServiceRegistry& services)
{
    const LogHubService* hubSvc = services.get<LogHubService>("loghub");
    sinks_ = services.get<LogSinkRegistryService>("logsinks");
    if (!hubSvc || !hubSvc->ctx) return;

    // The hub service context is the LogHub instance owned by LogHubModule.
    hub_ = static_cast<LogHub*>(hubSvc->ctx);
}

void LogDispatcherModule::loop()
{
    if (!hub_ || !sinks_) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    LogEntry e;
    if (!hub_->dequeue(e, portMAX_DELAY)) return;

    if (e.dropped > 0) {
        LogEntry lost{};
        lost.ts_ms = e.ts_ms;
        lost.lvl = LogLevel::Warn;
        strncpy(lost.tag, "LogDisp", LOG_TAG_MAX - 1);
        snprintf(lost.msg, LOG_MSG_MAX, "%u log line(s) lost, queue full (total=%lu)",
                 (unsigned)e.dropped, (unsigned long)hub_->droppedTotal());
        writeAll_(lost);
    }
    writeAll_(e);
}

void LogDispatcherModule::writeAll_(const LogEntry& e)
{
    const int n = sinks_->count(sinks_->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = sinks_->get(sinks_->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }
}
