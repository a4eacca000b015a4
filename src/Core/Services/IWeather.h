#pragma once
/**
 * @file IWeather.h
 * @brief Weather history and location service interface.
 */
#include <stddef.h>
#include <stdint.h>

#include "Modules/WeatherModule/WeatherTypes.h"

/** @brief Static site location used by the ET calculator. */
struct WeatherLocation {
    float latitudeDeg;
    float longitudeDeg;
    float elevationM;
};

/**
 * @brief Read side of the weather module.
 *
 * `query` copies validated samples of one kind with `startSec <= ts <= endSec`
 * in chronological order and returns the number written (at most `max`).
 */
struct WeatherService {
    uint16_t (*query)(void* ctx, WeatherKind kind, uint32_t startSec, uint32_t endSec,
                      WeatherSample* out, uint16_t max);
    bool (*location)(void* ctx, WeatherLocation* out);
    void* ctx;
};
