#pragma once
/**
 * @file IEventBus.h
 * @brief "eventbus" service.
 */

class EventBus;

/**
 * @brief Registered under "eventbus" by EventBusModule.
 *
 * Modules fetch it in init() and subscribe there; posts made before the
 * EventBus task runs stay queued.
 */
struct EventBusService {
    EventBus* bus;
};
