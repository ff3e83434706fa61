#pragma once
/**
 * @file PlaybackTarget.h
 * @brief Remote playback backends.
 */

#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Modules/PlaybackModule/HaRestClient.h"

/** @brief Playback backend configuration values. */
struct PlaybackConfig {
    char backend[12] = "cast";
    char haUrl[96] = "http://homeassistant.local:8123";
    char haToken[192] = "";
    char entity[64] = "";
    char notifyService[64] = "";
    bool wakeAck = true;
    int32_t wakeGraceMs = 3000;
    char mediaBase[64] = "";
};

/**
 * @brief A device able to play a media URL.
 *
 * Calls block the caller (the playback task) for the duration of the
 * backend exchange.
 */
class PlaybackTarget {
public:
    virtual ~PlaybackTarget() = default;
    virtual const char* name() const = 0;
    /** @brief Starts `mediaUrl`. `handle` identifies the session for stop(). */
    virtual bool start(const char* mediaUrl, uint32_t handle, ErrorCode& err) = 0;
    /** @brief Stops `handle`. Handle 0 (nothing started) is a no-op success. */
    virtual bool stop(uint32_t handle, ErrorCode& err) = 0;
};

/** @brief Cast-capable `media_player` entity. */
class CastTarget : public PlaybackTarget {
public:
    CastTarget(const PlaybackConfig& cfg, HaRestClient& rest) : cfg_(cfg), rest_(rest) {}
    const char* name() const override { return "cast"; }
    bool start(const char* mediaUrl, uint32_t handle, ErrorCode& err) override;
    bool stop(uint32_t handle, ErrorCode& err) override;

private:
    const PlaybackConfig& cfg_;
    HaRestClient& rest_;
};

/** @brief Android device woken and driven through companion-app notify commands. */
class WakeAndLaunchTarget : public PlaybackTarget {
public:
    WakeAndLaunchTarget(const PlaybackConfig& cfg, HaRestClient& rest) : cfg_(cfg), rest_(rest) {}
    const char* name() const override { return "wake_launch"; }
    bool start(const char* mediaUrl, uint32_t handle, ErrorCode& err) override;
    bool stop(uint32_t handle, ErrorCode& err) override;

private:
    bool notify_(const char* message, const char* what, JsonDocument& doc);

    const PlaybackConfig& cfg_;
    HaRestClient& rest_;
};
