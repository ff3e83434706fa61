/**
 * @file Log.cpp
 * @brief Implementation file.
 */
#include "Core/Log.h"
#include <Arduino.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

namespace {
    const LogHubService* g_hub = nullptr;
    volatile uint8_t g_minLevel = (uint8_t)LogLevel::Debug;

    void logVa(LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        if ((uint8_t)lvl < g_minLevel) return;
        const LogHubService* hub = g_hub;
        if (!hub || !hub->enqueue || !fmt) return;

        LogEntry e{};
        e.ts_ms = millis();
        e.lvl = lvl;
        strncpy(e.tag, (tag && tag[0]) ? tag : "-", LOG_TAG_MAX - 1);

        const int n = vsnprintf(e.msg, LOG_MSG_MAX, fmt, ap);
        if (n >= LOG_MSG_MAX) {
            // Mark truncation on the last visible characters.
            e.msg[LOG_MSG_MAX - 2] = '~';
        }
        (void)hub->enqueue(hub->ctx, e);
    }
}

void Log::setHub(const LogHubService* hub) {
    g_hub = hub;
}

void Log::setMinLevel(LogLevel lvl) {
    if ((uint8_t)lvl > (uint8_t)LogLevel::Error) lvl = LogLevel::Error;
    g_minLevel = (uint8_t)lvl;
}

LogLevel Log::minLevel() {
    return (LogLevel)g_minLevel;
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}
