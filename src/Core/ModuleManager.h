#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"
#include "Core/SystemLimits.h"

/**
 * @brief Orders modules by their declared dependencies and brings them up.
 *
 * Boot sequence of initAll():
 * 1. topological sort on `dependency()` ids, failing on a missing id or a cycle;
 * 2. `init()` in that order (config variables and services get registered);
 * 3. `ConfigStore::loadPersistent()` then `onConfigLoaded()` in the same order;
 * 4. one FreeRTOS task per active module;
 * 5. ConfigStore is attached to the EventBus, so the NVS load of step 3 posts
 *    no ConfigChanged events.
 */
class ModuleManager {
public:
    /** @brief False on a null module, a duplicate id or a full table. */
    bool add(Module* m);
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

private:
    Module* modules_[Limits::MaxModules] = {};
    uint8_t count_ = 0;

    Module* ordered_[Limits::MaxModules] = {};
    uint8_t orderedCount_ = 0;

    Module* findById_(const char* id) const;
    int indexOf_(const Module* m) const;
    bool buildInitOrder_();
    void wireCoreServices_(ServiceRegistry& services, ConfigStore& config);
};
