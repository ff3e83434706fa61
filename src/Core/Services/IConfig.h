#pragma once
/**
 * @file IConfig.h
 * @brief Config store service.
 */
#include <stdint.h>
#include <stddef.h>

/**
 * @brief JSON view of `ConfigStore` used by the MQTT `cfg/*` topics.
 *
 * Patches look like `{"azan":{"offset_min":-5}}`; module blocks are flat
 * objects with secrets masked.
 */
struct ConfigStoreService {
    bool (*applyJson)(void* ctx, const char* json);
    bool (*toJsonModule)(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    uint8_t (*listModules)(void* ctx, const char** out, uint8_t max);
    /** @brief Owning module of a NVS key, used to republish the matching `cfg/<module>` block. */
    const char* (*moduleForKey)(void* ctx, const char* nvsKey);
    void* ctx;
};
