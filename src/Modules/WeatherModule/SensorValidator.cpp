/**
 * @file SensorValidator.cpp
 * @brief Physical range validation for raw weather readings.
 */

#include "Modules/WeatherModule/SensorValidator.h"
#include "Domain/IrrigationDefaults.h"
#include <math.h>

bool weatherKindRange(WeatherKind kind, float& minOut, float& maxOut)
{
    switch (kind) {
        case WeatherKind::Temperature:
            minOut = IrrigationDefaults::TempMinC;
            maxOut = IrrigationDefaults::TempMaxC;
            return true;
        case WeatherKind::Humidity:
            minOut = IrrigationDefaults::HumidityMinPct;
            maxOut = IrrigationDefaults::HumidityMaxPct;
            return true;
        case WeatherKind::Precipitation:
            minOut = IrrigationDefaults::PrecipMinMm;
            maxOut = IrrigationDefaults::PrecipMaxMm;
            return true;
        case WeatherKind::Wind:
            minOut = IrrigationDefaults::WindMinKmh;
            maxOut = IrrigationDefaults::WindMaxKmh;
            return true;
        case WeatherKind::Solar:
            minOut = IrrigationDefaults::SolarMinWm2;
            maxOut = IrrigationDefaults::SolarMaxWm2;
            return true;
        case WeatherKind::Pressure:
            minOut = IrrigationDefaults::PressureMinHpa;
            maxOut = IrrigationDefaults::PressureMaxHpa;
            return true;
        default:
            return false;
    }
}

SampleValidation validateWeatherSample(WeatherKind kind, float value)
{
    SampleValidation out{};
    out.value = value;

    float minV = 0.0f;
    float maxV = 0.0f;
    if (!weatherKindRange(kind, minV, maxV)) {
        out.verdict = SampleVerdict::UnknownKind;
        return out;
    }
    if (!isfinite(value)) {
        out.verdict = SampleVerdict::NotFinite;
        return out;
    }
    if (value < minV) {
        out.verdict = SampleVerdict::BelowRange;
        out.bound = minV;
        return out;
    }
    if (value > maxV) {
        out.verdict = SampleVerdict::AboveRange;
        out.bound = maxV;
        return out;
    }
    out.verdict = SampleVerdict::Valid;
    return out;
}

const char* sampleVerdictStr(SampleVerdict verdict)
{
    switch (verdict) {
        case SampleVerdict::Valid: return "valid";
        case SampleVerdict::NotFinite: return "not_finite";
        case SampleVerdict::BelowRange: return "below_range";
        case SampleVerdict::AboveRange: return "above_range";
        case SampleVerdict::UnknownKind: return "unknown_kind";
        default: return "unknown";
    }
}
