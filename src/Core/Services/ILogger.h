#pragma once
/**
 * @file ILogger.h
 * @brief Log entry layout and the service tables shared by producers, hub and sinks.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Log severity levels, ordered from most to least verbose. */
enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

constexpr int LOG_TAG_MAX = 10;
/** @brief Message room; fits a full asset or timetable URL plus context. */
constexpr int LOG_MSG_MAX = 160;

/**
 * @brief Fixed-size log entry copied by value through the log queue.
 *
 * `dropped` counts the entries lost to a full queue right before this one.
 */
struct LogEntry {
    uint32_t ts_ms;
    LogLevel lvl;
    uint16_t dropped;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Log sink interface. */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Log hub interface (producer side). Never blocks the caller. */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Registry interface for log sinks. */
struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    void* ctx;
};
