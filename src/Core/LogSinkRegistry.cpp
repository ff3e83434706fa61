/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink)
{
    if (!sink.write) return false;
    if (n_ >= (int)Limits::LogMaxSinks) return false;
    for (int i = 0; i < n_; ++i) {
        if (sinks_[i].write == sink.write && sinks_[i].ctx == sink.ctx) return true;
    }
    sinks_[n_++] = sink;
    return true;
}

LogSinkService LogSinkRegistry::get(int idx) const
{
    if (idx < 0 || idx >= n_) return LogSinkService{};
    return sinks_[idx];
}
