#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that drains the log queue into every registered sink.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"
#include "Core/SystemLimits.h"

/**
 * @brief Active module: one low priority task blocking on the log queue.
 */
class LogDispatcherModule : public Module {
public:
    const char* moduleId() const override { return "log.dispatcher"; }
    const char* taskName() const override { return "LogDispatch"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    uint16_t taskStackSize() const override { return Limits::LogDispatchStack; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    void writeAll_(const LogEntry& e);

    LogHub* hub_ = nullptr;
    const LogSinkRegistryService* sinks_ = nullptr;
};
