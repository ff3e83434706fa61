#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief MQTT topic buffer length used by runtime publishers wired in `main.cpp`. */
constexpr size_t TopicBuf = 128;
/** @brief JSON capacity for MQTT cfg patch parsing in `MQTTModule::publishConfigBlocksFromPatch`. */
constexpr size_t JsonPatchBuf = 1024;
/** @brief JSON capacity for MQTT `cmd` payload parsing in `MQTTModule::processRxCmd_`. */
constexpr size_t JsonCmdBuf = 1024;
/** @brief JSON capacity for MQTT `cfg/set` payload parsing in `MQTTModule::processRxCfgSet_`. */
constexpr size_t JsonCfgBuf = 1024;
/** @brief JSON capacity for command args parsing in `TimeModule::parseCmdArgsObject_`. */
constexpr size_t JsonCmdTimeBuf = 384;
/** @brief JSON capacity for command args parsing in `AzanModule` command handlers. */
constexpr size_t JsonCmdAzanBuf = 256;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = JsonCfgBuf * 4;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 96;
/** @brief Capacity of `ModuleManager`. */
constexpr uint8_t MaxModules = 20;
/** @brief Capacity of `ServiceRegistry` (one entry per `services.add`). */
constexpr uint8_t MaxServices = 20;
/** @brief Capacity of `CommandRegistry`. */
constexpr uint8_t MaxCommands = 16;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief Maximum number of sinks accepted by `LogSinkRegistry`. */
constexpr uint8_t LogMaxSinks = 4;
/** @brief Stack size of the log dispatcher task (`LogDispatcherModule`). */
constexpr uint16_t LogDispatchStack = 4096;
/** @brief Serial sink baud rate (`LogSerialSinkModule`). */
constexpr uint32_t LogSerialBaud = 115200;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 16;
/** @brief MQTT-specific limits grouped by concern to keep `SystemLimits` readable. */
namespace Mqtt {

/** @brief MQTT module task stack size returned by `MQTTModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 6144;

/** @brief MQTT static capacities (queues, tables). */
namespace Capacity {
/** @brief FreeRTOS RX queue length for inbound MQTT messages in `MQTTModule`. */
constexpr uint8_t RxQueueLen = 8;
/** @brief Maximum number of runtime publishers stored in `MQTTModule::publishers`. */
constexpr uint8_t MaxPublishers = 8;
/** @brief Maximum number of `cfg/<module>` blocks tracked by `MQTTModule::cfgModules/topicCfgBlocks`. */
constexpr uint8_t CfgTopicMax = 16;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
/** @brief Default MQTT broker port used by `MQTTConfig::port` in `MQTTModule`. */
constexpr int32_t Port = 1883;
/** @brief Minimum delay in ms between two dirty-driven runtime publishes (`MQTTModule`). */
constexpr uint32_t DirtyMinPublishMs = 1000;
}  // namespace Defaults

/** @brief MQTT string/payload buffer sizes. */
namespace Buffers {
/** @brief MQTT config buffer length for `MQTTConfig::host` in `MQTTModule`. */
constexpr size_t Host = 64;
/** @brief MQTT config buffer length for `MQTTConfig::user` in `MQTTModule`. */
constexpr size_t User = 32;
/** @brief MQTT config buffer length for `MQTTConfig::pass` in `MQTTModule`. */
constexpr size_t Pass = 32;
/** @brief MQTT config buffer length for `MQTTConfig::baseTopic` in `MQTTModule`. */
constexpr size_t BaseTopic = 64;
/** @brief MQTT device identifier buffer length used by `MQTTModule::deviceId` (e.g. `ESP32-XXXXXX`). */
constexpr size_t DeviceId = 24;
/** @brief MQTT topic buffer length used by `MQTTModule` fixed topics (`cmd`, `ack`, `status`, `cfg/*`). */
constexpr size_t Topic = 128;
/** @brief MQTT temporary topic buffer length for dynamic subtopics in `MQTTModule` (`cfg/<module>`, scheduler slots). */
constexpr size_t DynamicTopic = 160;
/** @brief RX command topic buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxTopic = 128;
/** @brief RX command payload buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxPayload = 384;
/** @brief ACK JSON buffer length used by `MQTTModule` (`ackBuf`). */
constexpr size_t Ack = 1536;
/** @brief Command handler reply buffer length used by `MQTTModule` (`replyBuf`).
 *  Must accommodate larger structured replies (e.g. `azan.status` snapshots). */
constexpr size_t Reply = 1024;
/** @brief Config JSON serialization buffer length used by `MQTTModule` (`stateCfgBuf`). */
constexpr size_t StateCfg = 1536;
/** @brief Runtime publish payload buffer length used by `MQTTModule` (`publishBuf`). */
constexpr size_t Publish = 1536;
/** @brief Parsed command name buffer length in `MQTTModule::processRxCmd_`. */
constexpr size_t CmdName = 64;
/** @brief Serialized command args JSON buffer length in `MQTTModule::processRxCmd_`. */
constexpr size_t CmdArgs = 320;
/** @brief Command module token buffer length in `MQTTModule::processRxCmd_`. */
constexpr size_t CmdModule = 32;
}  // namespace Buffers

/** @brief MQTT timing constants (runtime behavior). */
namespace Timing {
/** @brief Delay in ms between each retained `cfg/<module>` publish during startup ramp in `MQTTModule`. */
constexpr uint32_t CfgRampStepMs = 100;
/** @brief Delay in ms while MQTT is disabled in `MQTTModule::loop`. */
constexpr uint32_t DisabledDelayMs = 2000;
/** @brief Network warmup delay in ms before first MQTT connect attempt in `MQTTModule::loop`. */
constexpr uint32_t NetWarmupMs = 2000;
/** @brief MQTT connection timeout in ms before forcing reconnect in `MQTTModule::loop`. */
constexpr uint32_t ConnectTimeoutMs = 10000;
/** @brief Main MQTT task loop delay in ms (`MQTTModule::loop`). */
constexpr uint32_t LoopDelayMs = 50;
}  // namespace Timing

/** @brief MQTT reconnect backoff profile. */
namespace Backoff {
/** @brief Minimum MQTT reconnect backoff in ms (`MQTTModule` error-wait state). */
constexpr uint32_t MinMs = 2000;
/** @brief MQTT reconnect backoff step #1 threshold in ms. */
constexpr uint32_t Step1Ms = 5000;
/** @brief MQTT reconnect backoff step #2 threshold in ms. */
constexpr uint32_t Step2Ms = 10000;
/** @brief MQTT reconnect backoff step #3 threshold in ms. */
constexpr uint32_t Step3Ms = 30000;
/** @brief MQTT reconnect backoff step #4 threshold in ms. */
constexpr uint32_t Step4Ms = 60000;
/** @brief Maximum MQTT reconnect backoff in ms. */
constexpr uint32_t MaxMs = 300000;
/** @brief Random jitter percentage applied to MQTT reconnect backoff delay. */
constexpr uint8_t JitterPct = 15;
}  // namespace Backoff

}  // namespace Mqtt
/** @brief Azan engine capacities, bounds and timings. */
namespace Azan {
/** @brief Task stack size of `AzanModule`. */
constexpr uint16_t TaskStackSize = 6144;
/** @brief Request queue length of `AzanModule` (commands, fires, completions). */
constexpr uint8_t RequestQueueLen = 12;
/** @brief Scheduled fire later than this many seconds after its instant is dropped. */
constexpr uint32_t MissedGraceSec = 120;
/** @brief Upper bound in ms for a backend start call before the request is abandoned. */
constexpr uint32_t StartTimeoutMs = 20000;
/** @brief Periodic table refresh interval in ms. */
constexpr uint32_t RefreshPeriodMs = 6UL * 3600UL * 1000UL;
/** @brief Retry delay in ms after a failed refresh. */
constexpr uint32_t RefreshRetryMs = 5UL * 60UL * 1000UL;
/** @brief Refresh re-run in ms while a table fetch is in flight, if its completion event is lost. */
constexpr uint32_t RefreshWaitMs = 60UL * 1000UL;
/** @brief Arbiter tick period in ms when the request queue is idle. */
constexpr uint32_t TickMs = 250;
/** @brief Pending arbiter actions buffered between two drains. */
constexpr uint8_t MaxPendingActions = 8;
/** @brief First `time.scheduler` slot used for prayer instants (one slot per kind). */
constexpr uint8_t FirstSchedulerSlot = 1;
/** @brief Scheduler event id base; event id is `EventIdBase + kind`. */
constexpr uint16_t SchedulerEventIdBase = 0xA000;
}  // namespace Azan

/** @brief Timetable provider buffers. */
namespace Prayer {
/** @brief Maximum HTTP body kept from a timetable source. */
constexpr size_t MaxBodyBytes = 24576;
/** @brief JSON capacity for the calculation API response. */
constexpr size_t JsonTimingsBuf = 3072;
/** @brief HTTP timeout in ms for timetable sources. */
constexpr uint16_t HttpTimeoutMs = 10000;
/** @brief Task stack size of `PrayerTimesModule` (TLS handshake and JSON parsing). */
constexpr uint16_t TaskStackSize = 8192;
/** @brief Pending table fetches; one per day a refresh may need. */
constexpr uint8_t FetchQueueLen = 3;
/** @brief Completed tables kept for collection by the scheduler. */
constexpr uint8_t ResultSlots = 3;
/** @brief Age in ms under which a completed table is handed out without refetch. */
constexpr uint32_t ResultFreshMs = 120000;
}  // namespace Prayer

/** @brief Audio asset cache limits. */
namespace Audio {
/** @brief Task stack size of `AudioCacheModule`. */
constexpr uint16_t TaskStackSize = 8192;
/** @brief Fetch request queue length. */
constexpr uint8_t FetchQueueLen = 4;
/** @brief Download chunk size in bytes. */
constexpr size_t ChunkBytes = 2048;
/** @brief HTTP timeout in ms for asset downloads. */
constexpr uint16_t HttpTimeoutMs = 15000;
/** @brief Abort a download when no byte arrived for this long. */
constexpr uint32_t StallTimeoutMs = 20000;
/** @brief Buffer length for asset URLs. */
constexpr size_t UrlBuf = 160;
/** @brief Buffer length for LittleFS asset paths. */
constexpr size_t PathBuf = 48;
}  // namespace Audio

/** @brief Playback driver limits. */
namespace Playback {
/** @brief Task stack size of `PlaybackModule`. */
constexpr uint16_t TaskStackSize = 6144;
/** @brief Request queue length of `PlaybackModule`. */
constexpr uint8_t RequestQueueLen = 4;
/** @brief HTTP timeout in ms for Home Assistant REST calls. */
constexpr uint16_t HttpTimeoutMs = 8000;
/** @brief JSON body buffer for Home Assistant service calls. */
constexpr size_t BodyBuf = 512;
/** @brief Port of the media HTTP server. */
constexpr uint16_t MediaServerPort = 80;
}  // namespace Playback

/** @brief Home Assistant auto-discovery publication pacing limits. */
namespace Ha {
namespace Timing {
/** @brief Delay in ms between each HA discovery entity publish in `HAModule`. */
constexpr uint32_t DiscoveryStepMs = 40;
}  // namespace Timing
}  // namespace Ha

/** @brief Boot orchestration timings used in `main.cpp` staged startup. */
namespace Boot {
/** @brief Delay in ms before allowing MQTT connection attempts (`MQTTModule::setStartupReady`). */
constexpr uint32_t MqttStartDelayMs = 1500;
/** @brief Delay in ms before enabling HA auto-discovery publishing (`HAModule::setStartupReady`). */
constexpr uint32_t HaStartDelayMs = 9000;
/** @brief Delay in ms before the first asset prefetch (`AudioCacheModule::setStartupReady`). */
constexpr uint32_t AudioPrefetchDelayMs = 4000;
}  // namespace Boot

}  // namespace Limits
