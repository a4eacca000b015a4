#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief MQTT topic buffer length used by runtime snapshot routing in `main.cpp`. */
constexpr size_t TopicBuf = 128;
/** @brief JSON capacity for MQTT `cmd` payload parsing in `MQTTModule::processRxCmd_`. */
constexpr size_t JsonCmdBuf = 1024;
/** @brief JSON capacity for MQTT `cfg/set` payload parsing in `MQTTModule::processRxCfgSet_`. */
constexpr size_t JsonCfgBuf = 1024;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = JsonCfgBuf * 2;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 192;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
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
constexpr uint8_t CfgTopicMax = 48;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
/** @brief Default MQTT broker port used by `MQTTConfig::port` in `MQTTModule`. */
constexpr int32_t Port = 1883;
/** @brief Default minimum runtime publish period in ms for `mqtt.sensor_min_publish_ms`. */
constexpr uint32_t SensorMinPublishMs = 20000;
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
/** @brief MQTT temporary topic buffer length for dynamic subtopics in `MQTTModule` (`cfg/<module>`, `weather/<kind>`). */
constexpr size_t DynamicTopic = 160;
/** @brief RX command topic buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxTopic = 128;
/** @brief RX command payload buffer length inside `MQTTModule::RxMsg`. */
constexpr size_t RxPayload = 384;
/** @brief ACK JSON buffer length used by `MQTTModule` (`ackBuf`). */
constexpr size_t Ack = 1536;
/** @brief Command handler reply buffer length used by `MQTTModule` (`replyBuf`).
 *  Must accommodate `irrigation.status` for all zones. */
constexpr size_t Reply = 1024;
/** @brief Config JSON serialization buffer length used by `MQTTModule` (`stateCfgBuf`). */
constexpr size_t StateCfg = 1536;
/** @brief Runtime publish payload buffer length used by `MQTTModule` (`publishBuf`). */
constexpr size_t Publish = 1536;
/** @brief Parsed command name buffer length in `MQTTModule::processRxCmd_`. */
constexpr size_t CmdName = 64;
/** @brief Serialized command args JSON buffer length in `MQTTModule::processRxCmd_`. */
constexpr size_t CmdArgs = 320;
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
/** @brief EventBus task tuning (`EventBusModule`). */
namespace Bus {
constexpr uint16_t TaskStackSize = 4096;
/** @brief Events dispatched per loop iteration. */
constexpr uint16_t DispatchBatch = 8;
constexpr uint32_t IdleDelayMs = 5;
/** @brief Minimum spacing between queue overflow warnings. */
constexpr uint32_t DropWarnMinMs = 10000;
}  // namespace Bus

/** @brief Maximum number of runtime MQTT routes held by `RuntimeSnapshotRouter`. */
constexpr uint8_t MaxRuntimeRoutes = 32;

/** @brief Irrigation engine capacities and timings. */
namespace Irrigation {
/** @brief Maximum number of zones handled by `IrrigationModule` and `ValveModule`. */
constexpr uint8_t MaxZones = 8;
/** @brief Zone name buffer length (`ZoneConfig::name`). */
constexpr size_t ZoneNameLen = 24;
/** @brief Persisted zone ledger blob length (`IrrigationModule` runtime var). */
constexpr size_t LedgerBlobLen = 96;
/** @brief JSON capacity for irrigation/valve command args parsing. */
constexpr size_t JsonCmdBuf = 256;
/** @brief Irrigation module task stack (daily ET job buffers live in the module object). */
constexpr uint16_t TaskStackSize = 4096;
/** @brief Irrigation task loop delay in ms. */
constexpr uint32_t LoopDelayMs = 200;
/** @brief Valve edges held for retry when the event queue is full. */
constexpr uint8_t ValveEdgeQueueLen = 8;
/** @brief Minimum delay in ms between two runtime blob writes for the same zone. */
constexpr uint32_t PersistMinIntervalMs = 2000;
}  // namespace Irrigation

/** @brief Weather sample history (in-RAM 24h window per kind). */
namespace Weather {
/** @brief Samples kept per kind (24h at 5 min spacing with margin). */
constexpr uint16_t HistoryPerKind = 300;
/** @brief Default minimum spacing in seconds between two recorded samples of one kind. */
constexpr uint32_t DefaultMinSpacingS = 300;
/** @brief Smallest spacing that still lets `HistoryPerKind` samples span 24h. */
constexpr uint32_t MinSpacingFloorS = (86400U + HistoryPerKind - 1U) / HistoryPerKind;
/** @brief JSON capacity for weather command args parsing. */
constexpr size_t JsonCmdBuf = 192;
}  // namespace Weather

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
/** @brief Delay in ms before the irrigation engine reacts to the day-start trigger (`IrrigationModule::setStartupReady`). */
constexpr uint32_t IrrigationStartDelayMs = 4000;
}  // namespace Boot

}  // namespace Limits
