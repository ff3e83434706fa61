/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

void EventBusModule::init(ConfigStore&, ServiceRegistry& services)
{
    services.add("eventbus", &svc_);
    LOGI("EventBus service registered (queue=%u subscribers=%u)",
         (unsigned)EventBus::QUEUE_LENGTH, (unsigned)EventBus::MAX_SUBSCRIBERS);
}

void EventBusModule::loop()
{
    bus_.dispatch(DispatchBatch);
    vTaskDelay(pdMS_TO_TICKS(5));
}
