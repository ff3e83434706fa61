#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed table of log sinks fed by the dispatcher.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

class LogSinkRegistry {
public:
    /** @brief Rejects sinks without a write callback and a full table. */
    bool add(LogSinkService sink);
    int count() const { return n_; }
    /** @brief Returns an empty sink for an out-of-range index. */
    LogSinkService get(int idx) const;

private:
    LogSinkService sinks_[Limits::LogMaxSinks]{};
    int n_ = 0;
};
