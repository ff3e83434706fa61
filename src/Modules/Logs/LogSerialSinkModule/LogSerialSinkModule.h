#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/Services/ITime.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to Serial.
 *
 * Lines carry the local wall time once the `time` service reports a sync,
 * the uptime before that.
 */
class LogSerialSinkModule : public ModulePassive {
public:
    const char* moduleId() const override { return "log.sink.serial"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static void write_(void* ctx, const LogEntry& e);
    void formatStamp_(const LogEntry& e, char* out, size_t len);

    ServiceRegistry* services_ = nullptr;
    const TimeService* timeSvc_ = nullptr;
};
