#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

/**
 * @brief One command invocation.
 *
 * `json` is the full inbound payload, `args` the serialized `args` object
 * (or nullptr when the payload has none).
 */
struct CommandRequest {
    const char* cmd;
    const char* json;
    const char* args;
};

/**
 * @brief Handler writing a JSON object reply.
 *
 * A reply that is not a JSON object is replaced by a `CmdHandlerFailed` error.
 */
using CommandHandler = bool (*)(void* userCtx,
                                const CommandRequest& req,
                                char* reply,
                                size_t replyLen);

/**
 * @brief Fixed table of named handlers (`azan.trigger`, `audio.status`...).
 *
 * Registration happens during module init only; execution runs on the
 * MQTT task.
 */
class CommandRegistry {
public:
    /** @brief False on a duplicate name or a full table. */
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);

    uint8_t count() const { return count_; }
    /** @brief Registered name at `idx`, nullptr past the end. */
    const char* nameAt(uint8_t idx) const;

private:
    struct Entry {
        const char* cmd;
        CommandHandler fn;
        void* userCtx;
    };

    Entry entries_[Limits::MaxCommands]{};
    uint8_t count_ = 0;
};
