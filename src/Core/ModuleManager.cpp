/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m)
{
    if (!m) return false;
    if (findById_(m->moduleId())) {
        Serial.printf("[MOD][ERR] Duplicate module id '%s'\n", m->moduleId());
        return false;
    }
    if (count_ >= Limits::MaxModules) {
        Serial.printf("[MOD][ERR] Module table full, dropping '%s'\n", m->moduleId());
        return false;
    }
    modules_[count_++] = m;
    return true;
}

Module* ModuleManager::findById_(const char* id) const
{
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count_; ++i)
        if (strcmp(modules_[i]->moduleId(), id) == 0) return modules_[i];
    return nullptr;
}

int ModuleManager::indexOf_(const Module* m) const
{
    for (uint8_t i = 0; i < count_; ++i)
        if (modules_[i] == m) return i;
    return -1;
}

bool ModuleManager::buildInitOrder_()
{
    bool placed[Limits::MaxModules] = {false};
    orderedCount_ = 0;

    // Missing ids are reported up front, before any ordering.
    for (uint8_t i = 0; i < count_; ++i) {
        Module* m = modules_[i];
        for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
            const char* depId = m->dependency(d);
            if (!depId || findById_(depId)) continue;
            Serial.printf("[MOD][ERR] Missing dependency: module='%s' requires='%s'\n",
                          m->moduleId(), depId);
            Serial.flush();
            Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s", m->moduleId(), depId);
            return false;
        }
    }

    while (orderedCount_ < count_) {
        bool progress = false;

        for (uint8_t i = 0; i < count_; ++i) {
            if (placed[i]) continue;
            Module* m = modules_[i];

            bool depsOk = true;
            for (uint8_t d = 0; d < m->dependencyCount() && depsOk; ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;
                const int j = indexOf_(findById_(depId));
                depsOk = (j >= 0) && placed[j];
            }
            if (!depsOk) continue;

            ordered_[orderedCount_++] = m;
            placed[i] = true;
            progress = true;
        }

        if (!progress) {
            Serial.println("[MOD][ERR] Cyclic dependencies between:");
            for (uint8_t i = 0; i < count_; ++i) {
                if (!placed[i]) Serial.printf("   * %s\n", modules_[i]->moduleId());
            }
            Serial.flush();
            Log::error(LOG_TAG_CORE, "cyclic dependencies, %u module(s) unplaced",
                       (unsigned)(count_ - orderedCount_));
            return false;
        }
    }
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services)
{
    if (!buildInitOrder_()) return false;

    for (uint8_t i = 0; i < orderedCount_; ++i) {
        Log::debug(LOG_TAG_CORE, "init %u/%u: %s", (unsigned)(i + 1), (unsigned)orderedCount_,
                   ordered_[i]->moduleId());
        ordered_[i]->init(cfg, services);
    }

    cfg.loadPersistent();

    for (uint8_t i = 0; i < orderedCount_; ++i) {
        ordered_[i]->onConfigLoaded(cfg, services);
    }

    uint8_t tasks = 0;
    for (uint8_t i = 0; i < orderedCount_; ++i) {
        Module* m = ordered_[i];
        if (!m->hasTask()) continue;
        if (!m->startTask()) {
            Log::error(LOG_TAG_CORE, "startTask failed: %s (stack=%u)", m->moduleId(), (unsigned)m->taskStackSize());
            return false;
        }
        ++tasks;
    }

    wireCoreServices_(services, cfg);
    Log::info(LOG_TAG_CORE, "%u modules up, %u tasks, %u services, %u config vars",
              (unsigned)orderedCount_, (unsigned)tasks, (unsigned)services.count(), (unsigned)cfg.varCount());
    return true;
}

void ModuleManager::wireCoreServices_(ServiceRegistry& services, ConfigStore& config)
{
    const EventBusService* eb = services.get<EventBusService>("eventbus");
    if (eb && eb->bus) {
        config.setEventBus(eb->bus);
    } else {
        Log::warn(LOG_TAG_CORE, "no eventbus: config changes will not be announced");
    }
}
