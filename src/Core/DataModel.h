#pragma once
/**
 * @file DataModel.h
 * @brief Runtime data model types for the DataStore.
 */
#include <stdbool.h>

// Each module contributes one struct through its <Module>DataModel.h.
#include "Modules/Network/WifiModule/WifiModuleDataModel.h"
#include "Modules/Network/TimeModule/TimeModuleDataModel.h"
#include "Modules/Network/MQTTModule/MQTTModuleDataModel.h"
#include "Modules/Network/HAModule/HAModuleDataModel.h"
#include "Modules/AudioCacheModule/AudioCacheModuleDataModel.h"
#include "Modules/AzanModule/AzanModuleDataModel.h"

/** @brief Root runtime data model. */
struct RuntimeData {
    WifiRuntimeData wifi;
    TimeRuntimeData time;
    MQTTRuntimeData mqtt;
    HARuntimeData ha;
    AudioCacheRuntimeData audio;
    AzanRuntimeData azan;
};
