#pragma once
/**
 * @file WeatherTypes.h
 * @brief Weather sample kinds shared by the validator, aggregator and history.
 */

#include <stdint.h>

enum class WeatherKind : uint8_t {
    Temperature = 0,
    Humidity = 1,
    Precipitation = 2,
    Wind = 3,
    Solar = 4,
    Pressure = 5,
    Count = 6
};

constexpr uint8_t WEATHER_KIND_COUNT = (uint8_t)WeatherKind::Count;

/** One reading. `ts` is epoch seconds (UTC). */
struct WeatherSample {
    WeatherKind kind = WeatherKind::Temperature;
    float value = 0.0f;
    uint32_t ts = 0;
};

/**
 * Spacing actually enforced between two recorded samples of one kind.
 * Never below Limits::Weather::MinSpacingFloorS so the history covers a day.
 */
uint32_t historySpacingS(int32_t configuredS);

const char* weatherKindStr(WeatherKind kind);
bool weatherKindFromStr(const char* name, WeatherKind& out);
