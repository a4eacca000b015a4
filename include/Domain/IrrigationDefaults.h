#pragma once

#include <stdint.h>

namespace IrrigationDefaults {

constexpr float TempMinC = -50.0f;
constexpr float TempMaxC = 60.0f;
constexpr float HumidityMinPct = 0.0f;
constexpr float HumidityMaxPct = 100.0f;
constexpr float PrecipMinMm = 0.0f;
constexpr float PrecipMaxMm = 500.0f;
constexpr float WindMinKmh = 0.0f;
constexpr float WindMaxKmh = 200.0f;
constexpr float SolarMinWm2 = 0.0f;
constexpr float SolarMaxWm2 = 1500.0f;
constexpr float PressureMinHpa = 800.0f;
constexpr float PressureMaxHpa = 1100.0f;

// Counter increase above this is a sensor fault, not rain.
constexpr float PrecipAnomalyMm = 200.0f;

constexpr uint8_t ZoneCountDefault = 4;
// Valve safety cutoff, independent of the zone max runtime.
constexpr int32_t ValveMaxOnDefaultS = 7200;

constexpr float KcMin = 0.4f;
constexpr float KcMax = 2.0f;
constexpr float KcDefault = 1.0f;
constexpr float PrecipRateDefaultMmH = 10.0f;
constexpr int32_t MinRuntimeDefaultS = 60;
constexpr int32_t MaxRuntimeDefaultS = 3600;
constexpr int32_t MinIntervalDefaultS = 3600;

constexpr float BalanceUiMin = -200.0f;
constexpr float BalanceUiMax = 200.0f;
constexpr float BalanceUiStep = 0.1f;

constexpr float LatitudeDefault = 45.0f;
constexpr float LongitudeDefault = 0.0f;
constexpr float ElevationDefaultM = 100.0f;

// Hargreaves fallback when the day has a single temperature reading.
constexpr float DefaultTempRangeC = 10.0f;

constexpr uint32_t DaySeconds = 86400U;

}  // namespace IrrigationDefaults
