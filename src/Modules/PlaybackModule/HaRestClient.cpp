/**
 * @file HaRestClient.cpp
 * @brief Implementation file.
 */

#include "Modules/PlaybackModule/HaRestClient.h"
#include "Core/HttpSession.h"
#include "Core/SystemLimits.h"
#include <string.h>

#define LOG_TAG "HaRestCl"
#include "Core/ModuleLog.h"

bool HaRestClient::configured() const
{
    return baseUrl_ && baseUrl_[0] != '\0' && token_ && token_[0] != '\0';
}

bool HaRestClient::buildServiceUrl(const char* baseUrl, const char* domain, const char* service,
                                   char* out, size_t len)
{
    if (!baseUrl || !domain || !service || !out || len == 0) return false;
    if (baseUrl[0] == '\0' || domain[0] == '\0' || service[0] == '\0') return false;
    size_t baseLen = strlen(baseUrl);
    while (baseLen > 0 && baseUrl[baseLen - 1] == '/') --baseLen;
    const int n = snprintf(out, len, "%.*s/api/services/%s/%s", (int)baseLen, baseUrl, domain, service);
    return n > 0 && (size_t)n < len;
}

bool HaRestClient::callService(const char* domain, const char* service, const JsonDocument& body, int& httpCode)
{
    httpCode = 0;
    if (!configured()) {
        LOGW("Home Assistant url or token not configured");
        return false;
    }

    char url[192] = {0};
    if (!buildServiceUrl(baseUrl_, domain, service, url, sizeof(url))) {
        LOGW("service url invalid %s.%s", domain ? domain : "?", service ? service : "?");
        return false;
    }

    char payload[Limits::Playback::BodyBuf] = {0};
    const size_t n = serializeJson(body, payload, sizeof(payload));
    if (n == 0 || n >= sizeof(payload)) {
        LOGW("service body truncated %s.%s", domain, service);
        return false;
    }

    char auth[200] = {0};
    snprintf(auth, sizeof(auth), "Bearer %s", token_);

    HttpSession session;
    if (!session.begin(url, Limits::Playback::HttpTimeoutMs)) {
        LOGW("http begin failed %s", url);
        return false;
    }
    session.client().addHeader("Authorization", auth);
    session.client().addHeader("Content-Type", "application/json");
    httpCode = session.client().POST((uint8_t*)payload, n);

    const bool ok = httpCode >= 200 && httpCode < 300;
    if (ok) {
        LOGD("%s.%s -> %d", domain, service, httpCode);
    } else {
        LOGW("%s.%s -> %d", domain, service, httpCode);
    }
    return ok;
}
