#pragma once
/**
 * @file DataKeys.h
 * @brief Central registry and reserved ranges for DataStore keys.
 */

#include <stdint.h>

#include "Core/EventBus/EventPayloads.h"

namespace DataKeys {

/** @brief WiFi runtime key: connectivity ready state (`WifiRuntime`). */
constexpr DataKey WifiReady = 1;
/** @brief WiFi runtime key: IPv4 address (`WifiRuntime`). */
constexpr DataKey WifiIp = 2;
/** @brief Time runtime key: synchronized state (`TimeRuntime`). */
constexpr DataKey TimeReady = 3;
/** @brief MQTT runtime key: broker connected state (`MQTTRuntime`). */
constexpr DataKey MqttReady = 4;
/** @brief MQTT runtime key: dropped RX messages counter (`MQTTRuntime`). */
constexpr DataKey MqttRxDrop = 5;
/** @brief MQTT runtime key: RX JSON parse failures counter (`MQTTRuntime`). */
constexpr DataKey MqttParseFail = 6;
/** @brief MQTT runtime key: RX handler failures counter (`MQTTRuntime`). */
constexpr DataKey MqttHandlerFail = 7;
/** @brief MQTT runtime key: dropped RX messages due to oversize topic/payload (`MQTTRuntime`). */
constexpr DataKey MqttOversizeDrop = 8;

/** @brief Home Assistant runtime key: discovery publish state (`HARuntime`). */
constexpr DataKey HaPublished = 10;
/** @brief Home Assistant runtime key: published entity count (`HARuntime`). */
constexpr DataKey HaEntities = 11;

/** @brief Azan runtime key: playback status (`AzanRuntime`). */
constexpr DataKey AzanStatus = 20;
/** @brief Azan runtime key: next armed entry (`AzanRuntime`). */
constexpr DataKey AzanNext = 21;
/** @brief Azan runtime key: armed instants per kind (`AzanRuntime`). */
constexpr DataKey AzanSchedule = 22;
/** @brief Azan runtime key: active table day and hijri date (`AzanRuntime`). */
constexpr DataKey AzanTable = 23;
/** @brief Azan runtime key: last reported error (`AzanRuntime`). */
constexpr DataKey AzanLastError = 24;

/** @brief Audio cache runtime key: asset states (`AudioCacheRuntime`). */
constexpr DataKey AudioAssets = 30;

/** @brief Upper bound for currently reserved keys. */
constexpr DataKey ReservedMax = 127;

static_assert(WifiReady < TimeReady, "DataKey ordering invariant broken");
static_assert(TimeReady < MqttReady, "DataKey ordering invariant broken");
static_assert(MqttOversizeDrop < HaPublished, "DataKey ranges overlap");
static_assert(HaEntities < AzanStatus, "HA fixed keys overlap azan key range");
static_assert(AzanLastError < AudioAssets, "Azan and audio key ranges overlap");
static_assert(AudioAssets <= ReservedMax, "Audio key exceeds reserved max");

}  // namespace DataKeys
