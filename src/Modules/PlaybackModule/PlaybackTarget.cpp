/**
 * @file PlaybackTarget.cpp
 * @brief Implementation file.
 */

#include "Modules/PlaybackModule/PlaybackTarget.h"
#include "Core/SystemLimits.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#define LOG_TAG "PlayTrgt"
#include "Core/ModuleLog.h"

static constexpr char VlcPackage[] = "org.videolan.vlc";

bool CastTarget::start(const char* mediaUrl, uint32_t handle, ErrorCode& err)
{
    err = ErrorCode::PlaybackFailed;
    if (cfg_.entity[0] == '\0') {
        LOGW("cast: no media_player entity configured");
        return false;
    }

    StaticJsonDocument<384> doc;
    doc["entity_id"] = (const char*)cfg_.entity;
    doc["media_content_id"] = mediaUrl;
    doc["media_content_type"] = "music";

    int code = 0;
    if (!rest_.callService("media_player", "play_media", doc, code)) return false;
    LOGI("cast: %s playing %s (handle=%lu)", cfg_.entity, mediaUrl, (unsigned long)handle);
    err = ErrorCode::None;
    return true;
}

bool CastTarget::stop(uint32_t handle, ErrorCode& err)
{
    err = ErrorCode::None;
    if (handle == 0 || cfg_.entity[0] == '\0') return true;

    StaticJsonDocument<128> doc;
    doc["entity_id"] = (const char*)cfg_.entity;
    int code = 0;
    if (!rest_.callService("media_player", "media_stop", doc, code)) {
        err = ErrorCode::PlaybackFailed;
        return false;
    }
    return true;
}

bool WakeAndLaunchTarget::notify_(const char* message, const char* what, JsonDocument& doc)
{
    doc["message"] = message;
    JsonObject data = doc["data"].is<JsonObject>() ? doc["data"].as<JsonObject>() : doc.createNestedObject("data");
    data["ttl"] = 0;
    data["priority"] = "high";

    int code = 0;
    const bool ok = rest_.callService("notify", cfg_.notifyService, doc, code);
    if (!ok) LOGW("wake_launch: %s failed (%d)", what, code);
    return ok;
}

bool WakeAndLaunchTarget::start(const char* mediaUrl, uint32_t handle, ErrorCode& err)
{
    err = ErrorCode::PlaybackFailed;
    if (cfg_.notifyService[0] == '\0') {
        LOGW("wake_launch: no notify service configured");
        return false;
    }

    StaticJsonDocument<128> wake;
    const bool woke = notify_("command_screen_on", "wake", wake);
    if (cfg_.wakeAck) {
        if (!woke) return false;
    } else {
        const uint32_t graceMs = (cfg_.wakeGraceMs > 0) ? (uint32_t)cfg_.wakeGraceMs : 0U;
        vTaskDelay(pdMS_TO_TICKS(graceMs));
    }

    StaticJsonDocument<448> launch;
    JsonObject data = launch.createNestedObject("data");
    data["intent_action"] = "android.intent.action.VIEW";
    data["intent_uri"] = mediaUrl;
    data["intent_type"] = "audio/mpeg";
    data["intent_package_name"] = VlcPackage;
    if (!notify_("command_activity", "launch", launch)) return false;

    LOGI("wake_launch: %s launched %s (handle=%lu)", cfg_.notifyService, mediaUrl, (unsigned long)handle);
    err = ErrorCode::None;
    return true;
}

bool WakeAndLaunchTarget::stop(uint32_t handle, ErrorCode& err)
{
    err = ErrorCode::None;
    if (handle == 0 || cfg_.notifyService[0] == '\0') return true;

    StaticJsonDocument<256> doc;
    JsonObject data = doc.createNestedObject("data");
    data["media_command"] = "stop";
    data["media_package_name"] = VlcPackage;
    if (!notify_("command_media", "stop", doc)) {
        err = ErrorCode::PlaybackFailed;
        return false;
    }
    return true;
}
