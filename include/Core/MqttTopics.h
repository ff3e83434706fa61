#pragma once
/**
 * @file MqttTopics.h
 * @brief Standard MQTT topic suffixes shared across modules.
 */

namespace MqttTopics {

/** @brief Command ingress suffix (`<base>/<device>/cmd`). */
constexpr char SuffixCmd[] = "cmd";
/** @brief Command/config acknowledgment suffix (`<base>/<device>/ack`). */
constexpr char SuffixAck[] = "ack";
/** @brief Device availability suffix, also the Last Will topic (`<base>/<device>/status`). */
constexpr char SuffixStatus[] = "status";
/** @brief Config patch ingress suffix (`<base>/<device>/cfg/set`). */
constexpr char SuffixCfgSet[] = "cfg/set";
/** @brief Config acknowledgment suffix (`<base>/<device>/cfg/ack`). */
constexpr char SuffixCfgAck[] = "cfg/ack";
/** @brief Azan runtime state (`<base>/<device>/rt/azan/state`). */
constexpr char SuffixAzanState[] = "rt/azan/state";
/** @brief Network runtime state (`<base>/<device>/rt/network/state`). */
constexpr char SuffixNetworkState[] = "rt/network/state";
/** @brief Audio cache runtime state (`<base>/<device>/rt/audio/state`). */
constexpr char SuffixAudioState[] = "rt/audio/state";

}  // namespace MqttTopics
