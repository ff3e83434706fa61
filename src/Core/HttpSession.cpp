/**
 * @file HttpSession.cpp
 * @brief Implementation file.
 */

#include "Core/HttpSession.h"
#include <Arduino.h>
#include <string.h>

bool HttpSession::begin(const char* url, uint16_t timeoutMs)
{
    end();
    if (!url || url[0] == '\0') return false;

    if (strncmp(url, "https://", 8) == 0) {
        secure_.setInsecure();
        begun_ = http_.begin(secure_, url);
    } else {
        begun_ = http_.begin(plain_, url);
    }
    if (!begun_) return false;

    http_.setReuse(false);
    http_.useHTTP10(true);
    http_.setFollowRedirects(HTTPC_STRICT_FOLLOW_REDIRECTS);
    http_.setTimeout(timeoutMs);
    http_.setConnectTimeout(timeoutMs);
    http_.setUserAgent("Minaret/1.0");
    http_.addHeader("Connection", "close");
    return true;
}

void HttpSession::end()
{
    if (!begun_) return;
    http_.end();
    begun_ = false;
}

bool HttpSession::readBody(char* out, size_t cap, size_t& len, bool& truncated, uint32_t stallMs)
{
    len = 0;
    truncated = false;
    if (!out || cap == 0) return false;
    out[0] = '\0';

    WiFiClient* stream = http_.getStreamPtr();
    if (!stream) return false;

    const int total = http_.getSize();
    uint32_t lastRx = millis();
    while (true) {
        if (len + 1 >= cap) {
            truncated = true;
            break;
        }
        const int avail = stream->available();
        if (avail > 0) {
            size_t want = cap - 1 - len;
            if ((size_t)avail < want) want = (size_t)avail;
            const int n = stream->readBytes(out + len, want);
            if (n > 0) {
                len += (size_t)n;
                lastRx = millis();
            }
            continue;
        }
        if (total >= 0 && len >= (size_t)total) break;
        if (!http_.connected()) break;
        if ((uint32_t)(millis() - lastRx) > stallMs) {
            out[len] = '\0';
            return false;
        }
        delay(10);
    }
    out[len] = '\0';
    return len > 0;
}
