#pragma once
/**
 * @file WeatherModuleDataModel.h
 * @brief Weather runtime data model contribution.
 */

#include <stdint.h>
#include "Modules/WeatherModule/WeatherTypes.h"

/** @brief Latest validated reading of one kind. */
struct WeatherLatestEntry {
    bool valid = false;
    float value = 0.0f;
    uint32_t epochSec = 0;
    uint32_t tsMs = 0;
};

struct WeatherRuntimeData {
    WeatherLatestEntry latest[WEATHER_KIND_COUNT];
    uint32_t rejectedCount = 0;
    uint32_t anomalyCount = 0;
};

// MODULE_DATA_MODEL: WeatherRuntimeData weather
