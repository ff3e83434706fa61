/**
 * @file Log.h
 * @brief Process-wide log front end used by `Core/ModuleLog.h` macros.
 */
#pragma once

#include "Core/Services/ILogger.h"

namespace Log {
    /**
     * @brief Installs the hub every `Log::` call enqueues into.
     *
     * Calls made before a hub is installed are discarded.
     */
    void setHub(const LogHubService* hub);

    /** @brief Entries below `lvl` are discarded before formatting. */
    void setMinLevel(LogLevel lvl);
    LogLevel minLevel();

    void debug(const char* tag, const char* fmt, ...);
    void info(const char* tag, const char* fmt, ...);
    void warn(const char* tag, const char* fmt, ...);
    void error(const char* tag, const char* fmt, ...);
}
