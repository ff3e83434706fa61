#pragma once
/**
 * @file Module.h
 * @brief Module contract shared by every Minaret subsystem.
 */
#include "ConfigStore.h"
#include "Runtime.h"
#include "ServiceRegistry.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

/**
 * @brief A unit of firmware brought up by ModuleManager.
 *
 * A module declares the ids it depends on, registers its config variables
 * and services in init(), reads its settings in onConfigLoaded() and then
 * runs loop() from its own pinned task. Modules that only wire services
 * derive from ModulePassive instead.
 */
class Module {
public:
    virtual ~Module() = default;

    /** @brief Stable id, referenced by other modules' dependency lists. */
    virtual const char* moduleId() const = 0;
    virtual const char* taskName() const = 0;

    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, nullptr entries are skipped. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Register config variables and services. Other modules' services may not be wired yet. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Runs after NVS values are applied, in init order. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief One iteration of the task body; the task yields 10 ms between calls. */
    virtual void loop() = 0;

    virtual uint16_t taskStackSize() const { return 3072; }
    virtual UBaseType_t taskPriority() const { return 1; }
    /** @brief Core 1 by default, the network stack lives on core 0. */
    virtual BaseType_t taskCore() const { return 1; }
    virtual bool hasTask() const { return true; }

    /** @brief False when FreeRTOS could not allocate the task. */
    bool startTask() {
        if (taskHandle) return true;
        const BaseType_t ok = xTaskCreatePinnedToCore(
            taskEntry, taskName(), taskStackSize(),
            this, taskPriority(), &taskHandle, taskCore()
        );
        if (ok != pdPASS) taskHandle = nullptr;
        return ok == pdPASS;
    }

    TaskHandle_t getTaskHandle() const { return taskHandle; }

protected:
    TaskHandle_t taskHandle = nullptr;

private:
    static void taskEntry(void* arg) {
        Module* self = static_cast<Module*>(arg);
        for (;;) {
            self->loop();
            vTaskDelay(pdMS_TO_TICKS(10));
        }
    }
};
