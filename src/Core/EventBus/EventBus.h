#pragma once
/**
 * @file EventBus.h
 * @brief Queued event bus with fixed-size payloads.
 */
#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "EventId.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#ifndef EVENTBUS_PROFILE
#define EVENTBUS_PROFILE 1
#endif

#ifndef EVENTBUS_HANDLER_WARN_US
#define EVENTBUS_HANDLER_WARN_US 5000
#endif

#ifndef EVENTBUS_DISPATCH_WARN_US
#define EVENTBUS_DISPATCH_WARN_US 20000
#endif

#ifndef EVENTBUS_WARN_MIN_INTERVAL_MS
#define EVENTBUS_WARN_MIN_INTERVAL_MS 2000
#endif

/** @brief Event delivered to subscribers during dispatch(). `payload` is only valid inside the callback. */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

using EventCallback = void(*)(const Event& e, void* user);

/**
 * @brief Multi-producer queue drained by the `eventbus` task.
 *
 * Subscribers run on the dispatch task and are expected to copy what they
 * need into their own module queue (`AzanModule`, `PlaybackModule`) instead
 * of doing work in the callback. A full queue drops the post; the loss is
 * counted and logged so a missed completion can be traced.
 */
class EventBus {
public:
    static constexpr uint16_t MAX_SUBSCRIBERS = 24;
    static constexpr uint8_t MAX_PAYLOAD_SIZE = 48;
    static constexpr uint8_t QUEUE_LENGTH = Limits::EventQueueLen;

    EventBus();
    ~EventBus() = default;

    /** @brief Init-time only; not thread-safe. */
    bool subscribe(EventId id, EventCallback cb, void* user);

    /** @brief Copies the payload; never blocks. False when the queue is full or the payload too large. */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);

    void dispatch(uint16_t maxEvents = 8);

    uint32_t droppedPosts() const { return _dropped; }

private:
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct QueuedEvent {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD_SIZE];
    };

    Subscriber _subs[MAX_SUBSCRIBERS];
    uint16_t _count = 0;

    QueueHandle_t _queue = nullptr;
    volatile uint32_t _dropped = 0;
    uint32_t _droppedReported = 0;

    void dispatchOne(const QueuedEvent& qe);
};
