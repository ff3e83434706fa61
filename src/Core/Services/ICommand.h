#pragma once
/**
 * @file ICommand.h
 * @brief Command service interface.
 */
#include <stddef.h>

struct CommandRequest;
typedef bool (*CommandHandler)(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

/**
 * @brief Registration and dispatch of `<module>.<verb>` commands.
 *
 * Handlers run on the caller's task (the MQTT task for the `cmd` topic) and
 * must not block; long work is queued to the owning module.
 */
struct CommandService {
    bool (*registerHandler)(void* ctx, const char* cmd, CommandHandler fn, void* userCtx);
    bool (*execute)(void* ctx, const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    void* ctx;
};
