/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#include "Core/ErrorCodes.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"

bool CommandModule::svcRegister_(void* ctx, const char* cmd, CommandHandler fn, void* userCtx)
{
    CommandRegistry* reg = static_cast<CommandRegistry*>(ctx);
    if (!reg->registerHandler(cmd, fn, userCtx)) {
        LOGE("register failed cmd=%s", cmd ? cmd : "(null)");
        return false;
    }
    return true;
}

bool CommandModule::svcExecute_(void* ctx, const char* cmd, const char* json, const char* args,
                                char* reply, size_t replyLen)
{
    return static_cast<CommandRegistry*>(ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    const CommandRegistry* reg = static_cast<const CommandRegistry*>(userCtx);
    int pos = snprintf(reply, replyLen, "{\"ok\":true,\"cmds\":[");
    if (pos <= 0 || (size_t)pos >= replyLen) return false;

    for (uint8_t i = 0; i < reg->count(); ++i) {
        const char* name = reg->nameAt(i);
        const int n = snprintf(reply + pos, replyLen - (size_t)pos, "%s\"%s\"", (i == 0) ? "" : ",", name);
        if (n <= 0 || (size_t)(pos + n) >= replyLen) {
            (void)writeErrorJson(reply, replyLen, ErrorCode::InternalAckOverflow, "cmd.list");
            return false;
        }
        pos += n;
    }

    const int n = snprintf(reply + pos, replyLen - (size_t)pos, "]}");
    if (n <= 0 || (size_t)(pos + n) >= replyLen) {
        (void)writeErrorJson(reply, replyLen, ErrorCode::InternalAckOverflow, "cmd.list");
        return false;
    }
    return true;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services)
{
    svc_.registerHandler = &CommandModule::svcRegister_;
    svc_.execute = &CommandModule::svcExecute_;
    svc_.ctx = &registry_;
    services.add("cmd", &svc_);
    (void)registry_.registerHandler("cmd.list", &CommandModule::cmdList_, &registry_);
    LOGI("Command service registered");
}
