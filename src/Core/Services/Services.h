#pragma once
/**
 * @file Services.h
 * @brief Every service struct, for modules that look up several of them.
 */

// Core plumbing
#include "ICommand.h"
#include "IConfig.h"
#include "IDataStore.h"
#include "IEventBus.h"
#include "ILogger.h"

// Connectivity
#include "IWifi.h"
#include "ITime.h"
#include "ITimeScheduler.h"
#include "IMqtt.h"
#include "IHA.h"

// Azan engine
#include "IPrayerTimes.h"
#include "IAudioCache.h"
#include "IPlayback.h"
