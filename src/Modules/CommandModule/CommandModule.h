#pragma once
/**
 * @file CommandModule.h
 * @brief Module that exposes the command registry service.
 */
#include "Core/ModulePassive.h"
#include "Core/CommandRegistry.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module wiring command registration and execution.
 *
 * Also answers `cmd.list` with the names registered so far.
 */
class CommandModule : public ModulePassive {
public:
    const char* moduleId() const override { return "cmd"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "loghub" : nullptr; }

    void init(ConfigStore&, ServiceRegistry& services) override;

private:
    CommandRegistry registry_;
    CommandService svc_{};

    static bool svcRegister_(void* ctx, const char* cmd, CommandHandler fn, void* userCtx);
    static bool svcExecute_(void* ctx, const char* cmd, const char* json, const char* args,
                            char* reply, size_t replyLen);
    static bool cmdList_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
