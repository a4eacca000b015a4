#pragma once
/**
 * @file EtCalculator.h
 * @brief Reference evapotranspiration (FAO-56) from a daily weather aggregate.
 *
 * Units of the aggregate: temperature degC, humidity %, wind km/h (taken as
 * 2 m height), solar mean W/m2, pressure hPa. Output is ET0 in mm/day.
 */

#include <stdint.h>
#include "Modules/IrrigationModule/EtMethodSelector.h"
#include "Modules/WeatherModule/WeatherAggregator.h"

struct EtLocation {
    float latitudeDeg = 0.0f;
    float longitudeDeg = 0.0f;
    float elevationM = 0.0f;
};

struct EtResult {
    EtMethod method = EtMethod::None;
    float et0Mm = 0.0f;
    float etcMm = 0.0f;
};

/** Standard atmosphere pressure estimate, kPa. */
double etStandardPressureKpa(double elevationM);

/** Extraterrestrial radiation Ra, MJ/m2/day. */
double etExtraterrestrialRadiation(double latitudeDeg, uint16_t dayOfYear);

/**
 * Compute ET0 for `method`. Fails only when temperature or humidity is absent,
 * the method is None, or the result is not finite. Output is clamped to >= 0.
 */
bool computeEt0(const DailyWeatherAggregate& agg,
                const EtLocation& location,
                EtMethod method,
                uint16_t dayOfYear,
                float& et0Out);

/**
 * Daily pipeline for one window: method selection then ET0 for `dateKey`.
 * `out.etcMm` is left at 0, the per-zone Kc is applied by the caller.
 * Returns false when the day must be skipped.
 */
bool computeDailyEt0(const DailyWeatherAggregate& agg,
                     const EtLocation& location,
                     uint32_t dateKey,
                     EtResult& out);

/** Day of year (1..366) from a YYYYMMDD date key, 0 when malformed. */
uint16_t etDayOfYear(uint32_t dateKey);

/** Kc is clamped to the supported crop coefficient range. */
float etcFromEt0(float et0Mm, float kc);
float clampCropCoefficient(float kc);
