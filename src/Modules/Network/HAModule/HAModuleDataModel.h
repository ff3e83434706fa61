#pragma once
/**
 * @file HAModuleDataModel.h
 * @brief Home Assistant runtime data model contribution.
 */
#include <stdint.h>

/** @brief Discovery state; `entityCount` is the number of configs in the last full publish. */
struct HARuntimeData {
    bool discoveryPublished = false;
    uint8_t entityCount = 0;
};
