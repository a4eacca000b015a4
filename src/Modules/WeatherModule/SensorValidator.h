#pragma once
/**
 * @file SensorValidator.h
 * @brief Physical range validation for raw weather readings.
 *
 * Pure function: used by the live ingest path and by the daily history
 * aggregation path alike.
 */

#include "Modules/WeatherModule/WeatherTypes.h"

enum class SampleVerdict : uint8_t {
    Valid = 0,
    NotFinite,
    BelowRange,
    AboveRange,
    UnknownKind
};

struct SampleValidation {
    SampleVerdict verdict = SampleVerdict::UnknownKind;
    float value = 0.0f;
    /** Violated bound when verdict is BelowRange/AboveRange. */
    float bound = 0.0f;

    bool valid() const { return verdict == SampleVerdict::Valid; }
};

bool weatherKindRange(WeatherKind kind, float& minOut, float& maxOut);
SampleValidation validateWeatherSample(WeatherKind kind, float value);
const char* sampleVerdictStr(SampleVerdict verdict);
