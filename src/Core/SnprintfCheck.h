#pragma once
/**
 * @file SnprintfCheck.h
 * @brief snprintf that reports truncation through the log.
 */

#include "Core/Log.h"
#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>

/**
 * @brief vsnprintf plus a Warn line when the output did not fit.
 *
 * Returns vsnprintf's result unchanged, so callers keep their own
 * `n < 0 || n >= len` checks. Encoding errors (negative results) are
 * reported the same way as truncation.
 */
static inline int minaretSnprintfChecked_(const char* tag,
                                          const char* file,
                                          int line,
                                          char* out,
                                          size_t outLen,
                                          const char* fmt,
                                          ...)
{
    va_list ap;
    va_start(ap, fmt);
    const int wrote = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);

    if (wrote >= 0 && outLen > 0 && (size_t)wrote < outLen) return wrote;

    // Strip the directory so the line stays inside LOG_MSG_MAX.
    const char* base = file ? file : "?";
    for (const char* p = base; *p; ++p) {
        if (*p == '/' || *p == '\\') base = p + 1;
    }
    Log::warn(tag ? tag : "FmtChk", "truncated output at %s:%d (cap=%u need=%d)",
              base, line, (unsigned)outLen, wrote < 0 ? wrote : wrote + 1);
    return wrote;
}

#define MINARET_SNPRINTF_CHECKED(TAG, OUT, LEN, FMT, ...) \
    minaretSnprintfChecked_((TAG), __FILE__, __LINE__, (OUT), (LEN), (FMT), ##__VA_ARGS__)
