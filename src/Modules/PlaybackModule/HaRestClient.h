#pragma once
/**
 * @file HaRestClient.h
 * @brief Home Assistant REST service calls.
 */

#include <ArduinoJson.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @brief Posts `/api/services/<domain>/<service>` with a long-lived token.
 *
 * The base URL and token are read at call time so config changes apply to
 * the next call.
 */
class HaRestClient {
public:
    HaRestClient(const char* baseUrl, const char* token) : baseUrl_(baseUrl), token_(token) {}

    bool configured() const;

    /**
     * @brief Calls one service.
     * @param httpCode HTTP status, or a negative HTTPClient transport error.
     * @return true on a 2xx answer.
     */
    bool callService(const char* domain, const char* service, const JsonDocument& body, int& httpCode);

    static bool buildServiceUrl(const char* baseUrl, const char* domain, const char* service,
                                char* out, size_t len);

private:
    const char* baseUrl_;
    const char* token_;
};
