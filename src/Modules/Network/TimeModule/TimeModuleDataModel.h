#pragma once
/**
 * @file TimeModuleDataModel.h
 * @brief Time module runtime data model contribution.
 */
#include <stdint.h>

/** @brief Wall clock state; prayer instants are only armed while `timeReady`. */
struct TimeRuntimeData {
    bool timeReady = false;
    uint32_t syncCount = 0;
    uint64_t lastSyncEpoch = 0;
};
