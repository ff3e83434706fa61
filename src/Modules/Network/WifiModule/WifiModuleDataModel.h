#pragma once
/**
 * @file WifiModuleDataModel.h
 * @brief Wifi runtime data model contribution.
 */
#include <stdint.h>

struct IpV4 {
    uint8_t b[4];
};

/**
 * @brief Station link state.
 *
 * `linkUps` counts transitions to ready since boot; a value growing on a
 * quiet network points at an unstable access point.
 */
struct WifiRuntimeData {
    bool ready = false;
    IpV4 ip {{0,0,0,0}};
    uint32_t linkUps = 0;
};
