#pragma once
/**
 * @file ConfigStore.h
 * @brief Registry of config variables backed by NVS, patched through JSON.
 */

#include <Preferences.h>
#include <cstdint>
#include <cstring>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

/** @brief One NVS layout upgrade, applied when the stored version equals `fromVersion`. */
struct MigrationStep {
    uint32_t fromVersion;
    uint32_t toVersion;
    bool (*apply)(Preferences& prefs, bool clearOnFail);
};

/**
 * @brief Owns the metadata of every registered ConfigVariable.
 *
 * Values stay in the owning modules; the store only keeps typed pointers.
 * Every value changed by applyJson() is written to NVS (when Persistent)
 * and announced with EventId::ConfigChanged carrying its NVS key. Nothing
 * here allocates after boot.
 */
class ConfigStore {
public:
    /** @brief Attached by ModuleManager once tasks run; earlier changes are not announced. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    template<typename T>
    void registerVar(ConfigVariable<T>& var);

    /** @brief Overwrites registered Persistent values with what NVS holds; missing keys keep defaults. */
    void loadPersistent();

    /**
     * @brief Applies `{"<module>":{"<name>":value,...},...}`.
     *
     * Unknown modules and names are ignored. A value of the wrong type is
     * skipped and makes the call return false, the other values still apply.
     */
    bool applyJson(const char* json);

    /** @brief Flat `{"name":value}` object for one module, secrets masked. */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    uint8_t listModules(const char** out, uint8_t max) const;
    const char* moduleForKey(const char* nvsKey) const;
    uint16_t varCount() const { return _metaCount; }

    /**
     * @brief Brings the NVS layout to `currentVersion`.
     *
     * A stored version newer than the firmware is refused. A failed or
     * missing step clears the namespace when `clearOnFail` is set.
     */
    bool runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                       const char* versionKey = "cfg_ver", bool clearOnFail = true);

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[Limits::MaxConfigVars];
    uint16_t _metaCount = 0;

    void notifyChanged_(const char* nvsKey);
    bool writePersistent_(const ConfigMeta& m);
    int writeValueJson_(const ConfigMeta& m, char* out, size_t outLen, bool mask) const;
    void logRejected_(const char* what, const char* nvsKey) const;
};

template<typename T>
void ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (_metaCount >= Limits::MaxConfigVars) {
        logRejected_("table full", var.nvsKey);
        return;
    }
    if (!var.value || !var.moduleName || !var.jsonName) {
        logRejected_("incomplete", var.nvsKey);
        return;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        logRejected_("key too long", var.nvsKey);
        return;
    }
    if (var.type == ConfigType::CharArray && var.size == 0) {
        logRejected_("zero-size string", var.nvsKey);
        return;
    }

    ConfigMeta& m = _meta[_metaCount++];
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
}
