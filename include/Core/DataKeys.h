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

/** @brief Home Assistant runtime key: autoconfig publish state (`HARuntime`). */
constexpr DataKey HaPublished = 10;

/** @brief Reserved base for weather runtime keys, one per `WeatherKind` (`WeatherRuntime`). */
constexpr DataKey WeatherBase = 20;
/** @brief Reserved weather key count. */
constexpr uint8_t WeatherReservedCount = 8;
constexpr DataKey WeatherEndExclusive = WeatherBase + WeatherReservedCount;

/** @brief Irrigation runtime key: forecast rain and daily ET summary (`IrrigationRuntime`). */
constexpr DataKey IrrigationDaily = 30;

/** @brief Reserved base for per-zone runtime keys (`IrrigationRuntime`). */
constexpr DataKey ZoneBase = 40;
/** @brief Reserved zone key count: supports zones `[0..7]`. */
constexpr uint8_t ZoneReservedCount = 8;
constexpr DataKey ZoneEndExclusive = ZoneBase + ZoneReservedCount;

/** @brief Reserved base for valve state keys (`ValveRuntime`). */
constexpr DataKey ValveBase = 60;
constexpr uint8_t ValveReservedCount = 8;
constexpr DataKey ValveEndExclusive = ValveBase + ValveReservedCount;

/** @brief Upper bound for currently reserved keys. */
constexpr DataKey ReservedMax = 127;

static_assert(WifiReady < TimeReady, "DataKey ordering invariant broken");
static_assert(TimeReady < MqttReady, "DataKey ordering invariant broken");
static_assert(MqttOversizeDrop < HaPublished, "DataKey ranges overlap");
static_assert(HaPublished < WeatherBase, "HA fixed keys overlap weather key range");
static_assert(WeatherEndExclusive <= IrrigationDaily, "Weather and irrigation keys overlap");
static_assert(IrrigationDaily < ZoneBase, "Irrigation daily key overlaps zone range");
static_assert(ZoneEndExclusive <= ValveBase, "Zone and valve key ranges overlap");
static_assert(ValveEndExclusive <= ReservedMax, "Valve key range exceeds reserved max");

}  // namespace DataKeys
