#pragma once
/**
 * @file IHA.h
 * @brief "ha" service: Home Assistant MQTT discovery entries.
 *
 * Entries are copied by HAModule and published once MQTT is up, then again
 * after every reconnect. Topic suffixes are relative to `<base>/<device>/`;
 * `valueTemplate` is a Jinja expression applied to the JSON state topic.
 * `ownerId` and `objectSuffix` form the unique id, so re-adding the same pair
 * replaces the previous entry.
 */

/** @brief Read-only value (next prayer, countdown, Hijri date, status). */
struct HASensorEntry {
    const char* ownerId;
    const char* objectSuffix;
    const char* name;
    const char* stateTopicSuffix;
    const char* valueTemplate;
    const char* entityCategory;
    const char* icon;
    const char* unit;
    const char* deviceClass;
};

/** @brief Boolean config field; `commandTopicSuffix` is usually `cfg/set`. */
struct HASwitchEntry {
    const char* ownerId;
    const char* objectSuffix;
    const char* name;
    const char* stateTopicSuffix;
    const char* valueTemplate;
    const char* commandTopicSuffix;
    const char* payloadOn;
    const char* payloadOff;
    const char* icon;
    const char* entityCategory;
};

/** @brief Numeric config field with bounds, such as the minute offset. */
struct HANumberEntry {
    const char* ownerId;
    const char* objectSuffix;
    const char* name;
    const char* stateTopicSuffix;
    const char* valueTemplate;
    const char* commandTopicSuffix;
    const char* commandTemplate;
    float minValue;
    float maxValue;
    float step;
    const char* mode;
    const char* entityCategory;
    const char* icon;
    const char* unit;
};

/** @brief Stateless action that publishes `payloadPress` to `commandTopicSuffix`. */
struct HAButtonEntry {
    const char* ownerId;
    const char* objectSuffix;
    const char* name;
    const char* commandTopicSuffix;
    const char* payloadPress;
    const char* entityCategory;
    const char* icon;
};

/** @brief add* return false when the matching table is full. */
struct HAService {
    bool (*addSensor)(void* ctx, const HASensorEntry* entry);
    bool (*addSwitch)(void* ctx, const HASwitchEntry* entry);
    bool (*addNumber)(void* ctx, const HANumberEntry* entry);
    bool (*addButton)(void* ctx, const HAButtonEntry* entry);
    void* ctx;
};
