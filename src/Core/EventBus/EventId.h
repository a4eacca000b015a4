#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // DataStore (runtime model changes)
    DataChanged = 50,
    DataSnapshotAvailable = 51,

    // Configuration
    ConfigChanged = 100,

    // Weather input
    WeatherSampleRecorded = 200,
    RainfallMeasured = 201,

    // Actuators
    ValveChanged = 300,

    // Domain events
    IrrigationEtApplied = 400,
    SchedulerEventTriggered = 420,
};
