#pragma once
/**
 * @file HttpSession.h
 * @brief Single HTTP(S) exchange over HTTPClient.
 */

#include <HTTPClient.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @brief One request/response pair, closed on destruction.
 *
 * `https://` URLs go through WiFiClientSecure without certificate pinning.
 * Connections are never reused.
 */
class HttpSession {
public:
    HttpSession() = default;
    ~HttpSession() { end(); }
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    bool begin(const char* url, uint16_t timeoutMs);
    void end();

    HTTPClient& client() { return http_; }

    /**
     * @brief Reads the response body into `out` (NUL-terminated).
     *
     * Stops at Content-Length, at connection close, when `out` is full or
     * after `stallMs` without data. `truncated` reports a full buffer.
     */
    bool readBody(char* out, size_t cap, size_t& len, bool& truncated, uint32_t stallMs);

private:
    HTTPClient http_;
    WiFiClient plain_;
    WiFiClientSecure secure_;
    bool begun_ = false;
};
