/**
 * @file EventBus.cpp
 * @brief Implementation file.
 */
#include "EventBus.h"
#include "EventPayloads.h"
#include <Arduino.h>
#include "Core/Log.h"

#define LOG_TAG_CORE "EventBus"

static_assert(sizeof(ConfigChangedPayload) <= EventBus::MAX_PAYLOAD_SIZE, "ConfigChangedPayload too large");
static_assert(sizeof(SchedulerEventTriggeredPayload) <= EventBus::MAX_PAYLOAD_SIZE, "SchedulerEventTriggeredPayload too large");
static_assert(sizeof(AssetResolvedPayload) <= EventBus::MAX_PAYLOAD_SIZE, "AssetResolvedPayload too large");
static_assert(sizeof(PlaybackCompletedPayload) <= EventBus::MAX_PAYLOAD_SIZE, "PlaybackCompletedPayload too large");
static_assert(sizeof(AzanStatusChangedPayload) <= EventBus::MAX_PAYLOAD_SIZE, "AzanStatusChangedPayload too large");

static uint32_t g_lastWarnMs = 0;
static bool canWarnNow() {
    uint32_t now = millis();
    if ((uint32_t)(now - g_lastWarnMs) < EVENTBUS_WARN_MIN_INTERVAL_MS) return false;
    g_lastWarnMs = now;
    return true;
}

EventBus::EventBus() {
    _queue = xQueueCreate(QUEUE_LENGTH, sizeof(QueuedEvent));
}

bool EventBus::subscribe(EventId id, EventCallback cb, void* user) {
    if (cb == nullptr) return false;
    if (_count >= MAX_SUBSCRIBERS) {
        Log::error(LOG_TAG_CORE, "subscriber table full, event=%u not wired", (unsigned)id);
        return false;
    }

    _subs[_count].id = id;
    _subs[_count].cb = cb;
    _subs[_count].user = user;
    _count++;
    return true;
}

bool EventBus::post(EventId id, const void* payload, size_t len) {
    if (_queue == nullptr) return false;
    if (len > MAX_PAYLOAD_SIZE) {
        Log::error(LOG_TAG_CORE, "payload too large: event=%u len=%u", (unsigned)id, (unsigned)len);
        return false;
    }

    QueuedEvent qe;
    qe.id = id;
    qe.len = static_cast<uint8_t>(len);
    if (len > 0 && payload != nullptr) {
        memcpy(qe.data, payload, len);
    }

    if (xQueueSend(_queue, &qe, 0) == pdTRUE) return true;
    _dropped = _dropped + 1;
    return false;
}

void EventBus::dispatch(uint16_t maxEvents) {
    if (_queue == nullptr) return;

    const uint32_t dropped = _dropped;
    if (dropped != _droppedReported && canWarnNow()) {
        Log::warn(LOG_TAG_CORE, "queue full: %lu post(s) dropped (total=%lu)",
                  (unsigned long)(dropped - _droppedReported), (unsigned long)dropped);
        _droppedReported = dropped;
    }

#if EVENTBUS_PROFILE
    const uint32_t tDispatch0 = micros();
    uint16_t dispatched = 0;
#endif

    for (uint16_t i = 0; i < maxEvents; i++) {
        QueuedEvent qe;
        if (xQueueReceive(_queue, &qe, 0) != pdTRUE) break;

        dispatchOne(qe);

#if EVENTBUS_PROFILE
        dispatched++;
#endif
    }

#if EVENTBUS_PROFILE
    const uint32_t dt = (uint32_t)(micros() - tDispatch0);
    if (dispatched > 0 && dt > EVENTBUS_DISPATCH_WARN_US && canWarnNow()) {
        Log::warn(LOG_TAG_CORE, "dispatch slow: %u events dt=%lu us", (unsigned)dispatched, (unsigned long)dt);
    }
#endif
}

void EventBus::dispatchOne(const QueuedEvent& qe) {
    Event e;
    e.id = qe.id;
    e.payload = (qe.len > 0) ? qe.data : nullptr;
    e.len = qe.len;

    for (uint16_t i = 0; i < _count; i++) {
        if (_subs[i].id != qe.id || _subs[i].cb == nullptr) continue;

#if EVENTBUS_PROFILE
        const uint32_t t0 = micros();
#endif
        _subs[i].cb(e, _subs[i].user);
#if EVENTBUS_PROFILE
        const uint32_t dt = (uint32_t)(micros() - t0);
        if (dt > EVENTBUS_HANDLER_WARN_US && canWarnNow()) {
            Log::warn(LOG_TAG_CORE, "slow handler: event=%u user=%p dt=%lu us",
                      (unsigned)qe.id, _subs[i].user, (unsigned long)dt);
        }
#endif
    }
}
