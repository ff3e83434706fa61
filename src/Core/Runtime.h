#pragma once
/**
 * @file Runtime.h
 * @brief Aggregated runtime helpers for modules.
 */

#include "Modules/Network/WifiModule/WifiRuntime.h"
#include "Modules/Network/TimeModule/TimeRuntime.h"
#include "Modules/Network/MQTTModule/MQTTRuntime.h"
#include "Modules/Network/HAModule/HARuntime.h"
#include "Modules/AudioCacheModule/AudioCacheRuntime.h"
#include "Modules/AzanModule/AzanRuntime.h"
