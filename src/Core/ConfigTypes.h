#pragma once
/**
 * @file ConfigTypes.h
 * @brief Typed config variable declarations and the metadata kept by `ConfigStore`.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

/**
 * @brief Compile-time checked NVS key.
 *
 * Preferences rejects keys longer than 15 characters at runtime; wrapping
 * every key with NVS_KEY("...") turns that into a build error.
 */
template <size_t N>
constexpr const char* NVS_KEY(const char (&s)[N]) {
    static_assert(N > 1, "NVS key cannot be empty");
    static_assert((N - 1) <= Limits::MaxNvsKeyLen, "NVS key too long");
    return s;
}

/** @brief Runtime values live in RAM only; Persistent values are mirrored to NVS. */
enum class ConfigPersistence : uint8_t { Runtime, Persistent };

/**
 * @brief Storage type of a config value.
 *
 * Int32 for minutes, seconds and ids, Float for coordinates, CharArray for
 * URLs, tokens and entity ids.
 */
enum class ConfigType : uint8_t {
    Int32,
    Bool,
    Float,
    CharArray
};

/**
 * @brief Config variable bound to a module field.
 *
 * `moduleName` is the `cfg/<module>` block and the top-level key of JSON
 * patches; `jsonName` is the field inside it. `size` is only used by
 * CharArray values and includes the terminator. Owners learn about changes
 * through EventId::ConfigChanged, matched on `nvsKey`.
 */
template<typename T>
struct ConfigVariable {
    const char* nvsKey;
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    ConfigPersistence persistence;
    uint16_t size;
};

/** @brief Type-erased copy of a registered variable, one row per `registerVar`. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* nvsKey;
    ConfigType type;
    ConfigPersistence persistence;
    void* valuePtr;
    uint16_t size;
};
