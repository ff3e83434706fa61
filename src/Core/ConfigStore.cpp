/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

void ConfigStore::notifyChanged_(const char* nvsKey)
{
    if (!_eventBus || !nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);
    _eventBus->post(EventId::ConfigChanged, &p, sizeof(p));
}

void ConfigStore::logRejected_(const char* what, const char* nvsKey) const
{
    Log::warn(LOG_TAG_CORE, "registerVar rejected (%s): %s", what, nvsKey ? nvsKey : "-");
}

bool ConfigStore::writePersistent_(const ConfigMeta& m)
{
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!_prefs || !m.nvsKey) return false;

    size_t wrote = 0;
    switch (m.type) {
        case ConfigType::Int32:
            wrote = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr);
            break;
        case ConfigType::Bool:
            wrote = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr);
            break;
        case ConfigType::Float:
            wrote = _prefs->putFloat(m.nvsKey, *(float*)m.valuePtr);
            break;
        case ConfigType::CharArray:
            wrote = _prefs->putString(m.nvsKey, (const char*)m.valuePtr);
            // putString reports the string length, so an empty value writes 0.
            if (wrote == 0 && ((const char*)m.valuePtr)[0] == '\0') return true;
            break;
    }
    if (wrote == 0) {
        Log::warn(LOG_TAG_CORE, "NVS write failed: %s", m.nvsKey);
        return false;
    }
    return true;
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::Float:
                *(float*)m.valuePtr = _prefs->getFloat(m.nvsKey, *(float*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
            default:
                break;
        }
    }
}

const char* ConfigStore::moduleForKey(const char* nvsKey) const
{
    if (!nvsKey || nvsKey[0] == '\0') return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].nvsKey, nvsKey)) return _meta[i].module;
    }
    return nullptr;
}

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

int ConfigStore::writeValueJson_(const ConfigMeta& m, char* out, size_t outLen, bool mask) const
{
    switch (m.type) {
        case ConfigType::Int32:
            return snprintf(out, outLen, "%ld", (long)*(int32_t*)m.valuePtr);
        case ConfigType::Bool:
            return snprintf(out, outLen, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
        case ConfigType::Float:
            // Coordinates need five decimals (about one meter).
            return snprintf(out, outLen, "%.5f", (double)*(float*)m.valuePtr);
        case ConfigType::CharArray:
            if (mask && isMaskedKey(m.name)) return snprintf(out, outLen, "\"***\"");
            return snprintf(out, outLen, "\"%s\"", (const char*)m.valuePtr);
        default:
            return snprintf(out, outLen, "null");
    }
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen == 0) return false;
    if (!module || module[0] == '\0') {
        out[0] = '\0';
        return false;
    }

    size_t pos = 0;
    out[pos++] = '{';

    bool any = false;
    bool truncatedLocal = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;

        if (any) {
            if (pos + 1 >= outLen) { truncatedLocal = true; break; }
            out[pos++] = ',';
        }

        int n = snprintf(out + pos, outLen - pos, "\"%s\":", m.name ? m.name : "");
        if (n <= 0) break;
        pos += (size_t)n;
        if (pos >= outLen) { truncatedLocal = true; break; }

        n = writeValueJson_(m, out + pos, outLen - pos, true);
        if (n <= 0) break;
        pos += (size_t)n;
        if (pos >= outLen) { truncatedLocal = true; break; }

        any = true;
    }

    if (pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        truncatedLocal = true;
        out[outLen - 1] = '\0';
    }

    if (truncated) *truncated = truncatedLocal;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

static bool readJsonValue(const ConfigMeta& m, JsonVariantConst v, bool& changed)
{
    changed = false;
    switch (m.type) {
    case ConfigType::Int32: {
        if (!v.is<int32_t>()) return false;
        const int32_t x = v.as<int32_t>();
        if (*(int32_t*)m.valuePtr != x) { *(int32_t*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::Bool: {
        bool x = false;
        if (v.is<bool>()) x = v.as<bool>();
        else if (v.is<int>()) x = v.as<int>() != 0;
        else return false;
        if (*(bool*)m.valuePtr != x) { *(bool*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::Float: {
        if (!v.is<float>()) return false;
        const float x = v.as<float>();
        if (*(float*)m.valuePtr != x) { *(float*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::CharArray: {
        if (!v.is<const char*>() || m.size == 0) return false;
        const char* s = v.as<const char*>();
        const size_t len = strlen(s);
        if (len >= m.size) return false;
        char* dst = (char*)m.valuePtr;
        // compare before writing to avoid unnecessary events
        if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
            memcpy(dst, s, len);
            dst[len] = '\0';
            changed = true;
        }
        return true;
    }
    }
    return false;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    bool okAll = true;
    uint16_t changedCount = 0;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonObjectConst modObj = root[m.module];
        if (modObj.isNull()) continue;
        JsonVariantConst v = modObj[m.name];
        if (v.isNull()) continue;

        bool changed = false;
        if (!readJsonValue(m, v, changed)) {
            Log::warn(LOG_TAG_CORE, "applyJson: rejected %s.%s (type or length)", m.module, m.name);
            okAll = false;
            continue;
        }
        if (!changed) continue;

        ++changedCount;
        Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
        // RAM keeps the new value even when NVS refuses it.
        if (!writePersistent_(m)) okAll = false;
        if (m.nvsKey) notifyChanged_(m.nvsKey);
    }
    Log::debug(LOG_TAG_CORE, "applyJson: done changed=%u", (unsigned)changedCount);
    return okAll;
}

bool ConfigStore::runMigrations(uint32_t currentVersion,
                                const MigrationStep* steps,
                                size_t count,
                                const char* versionKey,
                                bool clearOnFail)
{
    if (!_prefs || !steps || count == 0) return false;
    if (!versionKey) versionKey = "cfg_ver";

    uint32_t storedVersion = _prefs->getUInt(versionKey, 0);
    Log::debug(LOG_TAG_CORE, "migrations: stored=%lu current=%lu",
               (unsigned long)storedVersion, (unsigned long)currentVersion);

    if (storedVersion == currentVersion) return true;

    // Stored layout is newer than this firmware (downgrade): refuse.
    if (storedVersion > currentVersion) {
        Log::warn(LOG_TAG_CORE, "migrations: stored=%lu newer than firmware=%lu",
                  (unsigned long)storedVersion, (unsigned long)currentVersion);
        return false;
    }

    while (storedVersion < currentVersion) {
        bool stepFound = false;

        for (size_t i = 0; i < count; ++i) {
            const MigrationStep& s = steps[i];
            if (s.fromVersion == storedVersion) {
                stepFound = true;

                if (!s.apply) return false;

                bool ok = s.apply(*_prefs, clearOnFail);
                if (!ok) {
                    Log::warn(LOG_TAG_CORE, "migration failed: %lu -> %lu",
                              (unsigned long)s.fromVersion, (unsigned long)s.toVersion);
                    if (clearOnFail) {
                        _prefs->clear();
                        _prefs->putUInt(versionKey, 0);
                    }
                    return false;
                }

                storedVersion = s.toVersion;
                _prefs->putUInt(versionKey, storedVersion);
                Log::debug(LOG_TAG_CORE, "migration applied: now=%lu", (unsigned long)storedVersion);
                break;
            }
        }

        if (!stepFound) {
            if (clearOnFail) {
                _prefs->clear();
                _prefs->putUInt(versionKey, 0);
            }
            return false;
        }
    }

    _prefs->putUInt(versionKey, currentVersion);
    Log::debug(LOG_TAG_CORE, "migrations: completed at %lu", (unsigned long)currentVersion);
    return true;
}
