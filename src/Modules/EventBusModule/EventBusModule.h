#pragma once
/**
 * @file EventBusModule.h
 * @brief Active module hosting the EventBus dispatch loop.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Owns the EventBus instance and drains its queue on a dedicated task.
 */
class EventBusModule : public Module {
public:
    const char* moduleId() const override { return "eventbus"; }
    const char* taskName() const override { return "EventBus"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 4096; }
    /** @brief Above the feature modules so subscribers see events promptly. */
    UBaseType_t taskPriority() const override { return 2; }

private:
    static constexpr uint8_t DispatchBatch = 8;

    EventBus bus_;
    EventBusService svc_{ &bus_ };
};
