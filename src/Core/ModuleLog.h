/**
 * @file ModuleLog.h
 * @brief LOGD/LOGI/LOGW/LOGE for module sources.
 *
 * Define LOG_TAG (8 characters) before including. Including this header also
 * routes snprintf through MINARET_SNPRINTF_CHECKED so that truncated topics
 * and payloads show up in the log with their source line.
 */
#pragma once

#include "Core/Log.h"
#include "Core/SnprintfCheck.h"

#ifndef LOG_TAG
#define LOG_TAG "Minaret"
#endif

#undef LOGD
#undef LOGI
#undef LOGW
#undef LOGE

#define LOGD(...) ::Log::debug(LOG_TAG, __VA_ARGS__)
#define LOGI(...) ::Log::info(LOG_TAG, __VA_ARGS__)
#define LOGW(...) ::Log::warn(LOG_TAG, __VA_ARGS__)
#define LOGE(...) ::Log::error(LOG_TAG, __VA_ARGS__)

#ifndef MINARET_SNPRINTF_WRAP_ACTIVE
#define MINARET_SNPRINTF_WRAP_ACTIVE 1
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    MINARET_SNPRINTF_CHECKED(LOG_TAG, OUT, LEN, FMT, ##__VA_ARGS__)
#endif
