/**
 * @file LogSerialSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogSerialSinkModule.h"
#include "Core/SystemLimits.h"
#include <Arduino.h>
#include <time.h>

static const char* levelLetter(LogLevel lvl)
{
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info:  return "I";
        case LogLevel::Warn:  return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static const char* levelColor(LogLevel lvl)
{
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

void LogSerialSinkModule::formatStamp_(const LogEntry& e, char* out, size_t len)
{
    const unsigned ms = e.ts_ms % 1000;

    if (!timeSvc_ && services_) timeSvc_ = services_->get<TimeService>("time");
    if (timeSvc_ && timeSvc_->isSynced && timeSvc_->formatLocalTime &&
        timeSvc_->isSynced(timeSvc_->ctx)) {
        char local[32] = {0};
        if (timeSvc_->formatLocalTime(timeSvc_->ctx, local, sizeof(local))) {
            snprintf(out, len, "%s.%03u", local, ms);
            return;
        }
    }

    const uint32_t s = e.ts_ms / 1000U;
    snprintf(out, len, "+%02lu:%02lu:%02lu.%03u",
             (unsigned long)((s / 3600U) % 100U),
             (unsigned long)((s / 60U) % 60U),
             (unsigned long)(s % 60U),
             ms);
}

void LogSerialSinkModule::write_(void* ctx, const LogEntry& e)
{
    LogSerialSinkModule* self = static_cast<LogSerialSinkModule*>(ctx);
    if (!self) return;

    char ts[48];
    self->formatStamp_(e, ts, sizeof(ts));
    Serial.printf("[%s][%s][%s] %s%s\x1b[0m\n", ts, levelLetter(e.lvl), e.tag, levelColor(e.lvl), e.msg);
}

void LogSerialSinkModule::init(ConfigStore&, ServiceRegistry& services)
{
    Serial.begin(Limits::LogSerialBaud);

    const LogSinkRegistryService* sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks || !sinks->add) return;

    services_ = &services;
    timeSvc_ = nullptr;

    LogSinkService sink{};
    sink.write = &LogSerialSinkModule::write_;
    sink.ctx = this;
    (void)sinks->add(sinks->ctx, sink);
}
