#pragma once
/**
 * @file ModulePassive.h
 * @brief Modules without a task of their own.
 */
#include "Core/Module.h"

/**
 * @brief Base for modules whose whole job happens in init()/onConfigLoaded(),
 * such as the EventBus, DataStore and ConfigStore wiring modules.
 */
class ModulePassive : public Module {
public:
    bool hasTask() const override { return false; }
    const char* taskName() const override { return ""; }
    void loop() override {}
};
