#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "minaret"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Config schema version key read/written by `ConfigStore::runMigrations`. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker used to select and run config migrations.

namespace Log {
constexpr char MinLevel[] = "log_lvl"; // Lowest severity forwarded to the log queue (0 debug .. 3 error).
}  // namespace Log

namespace Wifi {
constexpr char Enabled[] = "wifi_en"; // WiFi module persisted key for field `wifi_en`.
constexpr char Ssid[] = "wifi_ssid"; // WiFi module persisted key for field `wifi_ssid`.
constexpr char Pass[] = "wifi_pass"; // WiFi module persisted key for field `wifi_pass`.
constexpr char Hostname[] = "wifi_host"; // WiFi module persisted key for field `hostname` (mDNS).
}  // namespace Wifi

namespace Mqtt {
constexpr char Host[] = "mq_host"; // MQTT module persisted key for field `mq_host`.
constexpr char Port[] = "mq_port"; // MQTT module persisted key for field `mq_port`.
constexpr char User[] = "mq_user"; // MQTT module persisted key for field `mq_user`.
constexpr char Pass[] = "mq_pass"; // MQTT module persisted key for field `mq_pass`.
constexpr char BaseTopic[] = "mq_base"; // MQTT module persisted key for field `mq_base`.
constexpr char Enabled[] = "mq_en"; // MQTT module persisted key for field `mq_en`.
}  // namespace Mqtt

namespace Ha {
constexpr char Enabled[] = "ha_en"; // Home Assistant module persisted key for field `ha_en`.
constexpr char Vendor[] = "ha_vend"; // Home Assistant module persisted key for field `ha_vend`.
constexpr char DeviceId[] = "ha_devid"; // Home Assistant module persisted key for field `ha_devid`.
constexpr char DiscoveryPrefix[] = "ha_pref"; // Home Assistant module persisted key for field `ha_pref`.
constexpr char Model[] = "ha_model"; // Home Assistant module persisted key for field `ha_model`.
}  // namespace Ha

namespace Time {
constexpr char Server1[] = "ntp_s1"; // Time module persisted key for field `ntp_s1`.
constexpr char Server2[] = "ntp_s2"; // Time module persisted key for field `ntp_s2`.
constexpr char Tz[] = "ntp_tz"; // Time module persisted key for field `ntp_tz`.
constexpr char Enabled[] = "ntp_en"; // Time module persisted key for field `ntp_en`.
}  // namespace Time

namespace Prayer {
constexpr char Source[] = "pt_src"; // Timetable source selector (`aladhan` or `portal`).
constexpr char ApiBase[] = "pt_api"; // Calculation API base URL.
constexpr char Latitude[] = "pt_lat"; // Calculation API latitude in degrees.
constexpr char Longitude[] = "pt_lon"; // Calculation API longitude in degrees.
constexpr char Method[] = "pt_meth"; // Calculation API method id.
constexpr char School[] = "pt_school"; // Calculation API juristic school (0 standard, 1 hanafi).
constexpr char PortalUrl[] = "pt_portal"; // Mosque portal page URL.
}  // namespace Prayer

namespace Azan {
constexpr char Enabled[] = "az_en"; // Master switch for automatic prayer callbacks.
constexpr char OffsetMin[] = "az_off"; // Signed minute offset applied to every scheduled instant.
constexpr char EnFajr[] = "az_en_fajr"; // Per-kind enable flag for Fajr.
constexpr char EnSunrise[] = "az_en_sunr"; // Per-kind enable flag for Sunrise.
constexpr char EnDhuhr[] = "az_en_dhuhr"; // Per-kind enable flag for Dhuhr.
constexpr char EnAsr[] = "az_en_asr"; // Per-kind enable flag for Asr.
constexpr char EnMaghrib[] = "az_en_magh"; // Per-kind enable flag for Maghrib.
constexpr char EnIsha[] = "az_en_isha"; // Per-kind enable flag for Isha.
constexpr char FetchWaitS[] = "az_fwait"; // Upper bound in seconds for waiting on an asset download.
constexpr char PreemptMs[] = "az_pre_ms"; // Upper bound in ms for stopping a session being preempted.
constexpr char PlayMaxS[] = "az_pmax"; // Playing status auto-reset in seconds.
}  // namespace Azan

namespace Audio {
constexpr char PrimaryUrl[] = "au_prim"; // Source URL (or flash path) of the default azan asset.
constexpr char FajrUrl[] = "au_fajr"; // Source URL (or flash path) of the Fajr azan asset.
}  // namespace Audio

namespace Playback {
constexpr char Backend[] = "pb_backend"; // Playback backend (`cast` or `wake_launch`).
constexpr char HaUrl[] = "pb_haurl"; // Home Assistant base URL used for REST service calls.
constexpr char HaToken[] = "pb_token"; // Home Assistant long-lived access token.
constexpr char Entity[] = "pb_entity"; // media_player entity id for the cast backend.
constexpr char NotifyService[] = "pb_notify"; // notify service name for the wake-and-launch backend.
constexpr char WakeAck[] = "pb_wack"; // Wait for the wake acknowledgment before launching.
constexpr char WakeGraceMs[] = "pb_wgrace"; // Grace delay in ms between wake and launch without ack.
constexpr char MediaBase[] = "pb_mbase"; // Base URL used to build media URLs served by the device.
}  // namespace Playback

}  // namespace NvsKeys
