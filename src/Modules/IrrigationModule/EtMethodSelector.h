#pragma once
/**
 * @file EtMethodSelector.h
 * @brief ET formula selection from the fields present in a daily aggregate.
 */

#include <stdint.h>
#include "Modules/WeatherModule/WeatherAggregator.h"

enum class EtMethod : uint8_t {
    None = 0,
    PenmanMonteith = 1,
    PriestleyTaylor = 2,
    Hargreaves = 3
};

/**
 * Wind and solar: Penman-Monteith. Solar only, or wind only: Priestley-Taylor.
 * Neither: Hargreaves. Missing temperature or humidity: None (day skipped).
 */
EtMethod selectEtMethod(const DailyWeatherAggregate& agg);
EtMethod selectEtMethod(bool hasTemperature, bool hasHumidity, bool hasWind, bool hasSolar);
const char* etMethodStr(EtMethod method);
