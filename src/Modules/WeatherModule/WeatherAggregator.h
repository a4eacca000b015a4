#pragma once
/**
 * @file WeatherAggregator.h
 * @brief Daily statistics over a window of weather samples.
 */

#include <stddef.h>
#include <stdint.h>
#include "Modules/WeatherModule/WeatherTypes.h"

struct WeatherFieldStat {
    bool present = false;
    float mean = 0.0f;
    uint16_t count = 0;
};

/**
 * One summary per window, zone independent.
 * For Precipitation, `fields[Precipitation].mean` is unused and the day total
 * is `precipMm` (sum of counter increases).
 */
struct DailyWeatherAggregate {
    uint32_t windowStart = 0;
    uint32_t windowEnd = 0;
    WeatherFieldStat fields[WEATHER_KIND_COUNT]{};
    float tempMin = 0.0f;
    float tempMax = 0.0f;
    float precipMm = 0.0f;
    uint16_t rejectedCount = 0;
    uint16_t anomalyCount = 0;

    bool has(WeatherKind kind) const { return fields[(uint8_t)kind].present; }
    float mean(WeatherKind kind) const { return fields[(uint8_t)kind].mean; }
    uint16_t count(WeatherKind kind) const { return fields[(uint8_t)kind].count; }

    /** Temperature and humidity are required for any ET method. */
    bool valid() const { return has(WeatherKind::Temperature) && has(WeatherKind::Humidity); }
};

/**
 * Aggregate samples with `windowStart <= ts <= windowEnd`.
 * Samples are re-validated and out-of-range values skipped. Samples of one
 * kind must be in chronological order; kinds may be interleaved.
 * Returns aggregate validity (temperature and humidity present).
 */
bool aggregateDailyWeather(const WeatherSample* samples,
                           size_t count,
                           uint32_t windowStart,
                           uint32_t windowEnd,
                           DailyWeatherAggregate& out);
