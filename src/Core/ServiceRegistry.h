#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Named service tables shared between modules during init.
 */
#include <stdint.h>
#include "Core/SystemLimits.h"

/**
 * @brief Maps a string id (`"playback"`, `"time.scheduler"`...) to a service table.
 *
 * Filled by `Module::init` in registration order, so a module can only look up
 * services of the modules it declares as dependencies. Ids are not copied and
 * must be string literals.
 */
class ServiceRegistry {
public:
    /** @brief False on a null id/pointer, a duplicate id or a full table. */
    bool add(const char* id, const void* service);
    const void* getRaw(const char* id) const;

    template<typename T>
    const T* get(const char* id) const {
        return reinterpret_cast<const T*>(getRaw(id));
    }

    uint8_t count() const { return count_; }

private:
    struct Entry {
        const char* id;
        const void* ptr;
    };

    Entry entries_[Limits::MaxServices]{};
    uint8_t count_ = 0;
};
