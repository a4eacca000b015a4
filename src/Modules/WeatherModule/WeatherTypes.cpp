/**
 * @file WeatherTypes.cpp
 * @brief Weather kind name mapping.
 */

#include "Modules/WeatherModule/WeatherTypes.h"
#include "Core/SystemLimits.h"
#include <string.h>

static const char* const kKindNames[WEATHER_KIND_COUNT] = {
    "temperature",
    "humidity",
    "precipitation",
    "wind",
    "solar",
    "pressure"
};

const char* weatherKindStr(WeatherKind kind)
{
    uint8_t idx = (uint8_t)kind;
    if (idx >= WEATHER_KIND_COUNT) return "unknown";
    return kKindNames[idx];
}

bool weatherKindFromStr(const char* name, WeatherKind& out)
{
    if (!name || name[0] == '\0') return false;
    for (uint8_t i = 0; i < WEATHER_KIND_COUNT; ++i) {
        if (strcmp(name, kKindNames[i]) == 0) {
            out = (WeatherKind)i;
            return true;
        }
    }
    return false;
}

uint32_t historySpacingS(int32_t configuredS)
{
    if (configuredS < (int32_t)Limits::Weather::MinSpacingFloorS) return Limits::Weather::MinSpacingFloorS;
    return (uint32_t)configuredS;
}
