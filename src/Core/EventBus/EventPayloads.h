#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[32];
};

/** @brief Payload carrying network readiness information. */
struct WifiNetReadyPayload {
  uint8_t ip[4];
  uint8_t gw[4];
  uint8_t mask[4];
};

/** @brief Payload for WeatherSampleRecorded (validated sample stored in history). */
struct WeatherSampleRecordedPayload {
    uint8_t kind;     // WeatherKind
    float value;
    uint32_t epochSec;
};

/** @brief Payload for RainfallMeasured (positive precipitation counter increase). */
struct RainfallMeasuredPayload {
    float mm;
    uint32_t epochSec;
};

/** @brief Payload for valve transitions. */
struct ValveChangedPayload {
    uint8_t zone;
    uint8_t on;        // 0/1
    uint8_t forced;    // 1 when the safety cutoff closed the valve
    uint32_t tsMs;     // millis() at the transition
    uint32_t epochSec; // 0 when time is not synced
};

/** @brief Payload for IrrigationEtApplied (daily job result for one zone). */
struct IrrigationEtAppliedPayload {
    uint8_t zone;
    uint8_t result;   // EtApplyResult
    uint32_t dateKey; // YYYYMMDD
    float etcMm;
};

/** @brief Scheduler edge carried by SchedulerEventTriggered. */
enum class SchedulerEdge : uint8_t {
    Trigger = 0,
    Start = 1,
    Stop = 2
};

/** @brief Payload for SchedulerEventTriggered. */
struct SchedulerEventTriggeredPayload {
    uint8_t slot;
    uint8_t edge;     // SchedulerEdge
    uint8_t replayed; // 1 when emitted at boot for a missed trigger
    uint16_t eventId;
    uint32_t epochSec;
};

/** @brief Identifiers for DataStore values. */
using DataKey = uint16_t;

/** @brief Payload for data change events. */
struct DataChangedPayload {
    DataKey id;
};

/** @brief Dirty flags for snapshot payloads. */
enum DirtyFlags : uint32_t {
    DIRTY_NONE       = 0,
    DIRTY_NETWORK    = 1 << 0,
    DIRTY_TIME       = 1 << 1,
    DIRTY_MQTT       = 1 << 2,
    DIRTY_WEATHER    = 1 << 3,
    DIRTY_IRRIGATION = 1 << 4,
    DIRTY_ACTUATORS  = 1 << 5,
};

/** @brief Payload indicating a new data snapshot. */
struct DataSnapshotPayload {
    uint32_t dirtyFlags;
};
