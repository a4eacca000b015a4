/**
 * @file WeatherAggregator.cpp
 * @brief Daily statistics over a window of weather samples.
 */

#include "Modules/WeatherModule/WeatherAggregator.h"
#include "Modules/WeatherModule/PrecipitationCounter.h"
#include "Modules/WeatherModule/SensorValidator.h"

bool aggregateDailyWeather(const WeatherSample* samples,
                           size_t count,
                           uint32_t windowStart,
                           uint32_t windowEnd,
                           DailyWeatherAggregate& out)
{
    out = DailyWeatherAggregate{};
    out.windowStart = windowStart;
    out.windowEnd = windowEnd;
    if (windowEnd < windowStart) return false;
    if (!samples && count > 0) return false;

    double sums[WEATHER_KIND_COUNT] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    uint32_t counts[WEATHER_KIND_COUNT] = {0, 0, 0, 0, 0, 0};
    PrecipitationCounter precip;
    double precipTotal = 0.0;

    for (size_t i = 0; i < count; ++i) {
        const WeatherSample& s = samples[i];
        if (s.ts < windowStart || s.ts > windowEnd) continue;

        SampleValidation v = validateWeatherSample(s.kind, s.value);
        if (!v.valid()) {
            if (out.rejectedCount < UINT16_MAX) ++out.rejectedCount;
            continue;
        }

        uint8_t k = (uint8_t)s.kind;
        if (s.kind == WeatherKind::Precipitation) {
            PrecipStep step = precip.update(s.value);
            if (step.kind == PrecipStepKind::Increase) {
                precipTotal += step.rainMm;
            } else if (step.kind == PrecipStepKind::Anomaly) {
                if (out.anomalyCount < UINT16_MAX) ++out.anomalyCount;
            }
            ++counts[k];
            continue;
        }

        if (s.kind == WeatherKind::Temperature) {
            if (counts[k] == 0 || s.value < out.tempMin) out.tempMin = s.value;
            if (counts[k] == 0 || s.value > out.tempMax) out.tempMax = s.value;
        }
        sums[k] += (double)s.value;
        ++counts[k];
    }

    for (uint8_t k = 0; k < WEATHER_KIND_COUNT; ++k) {
        WeatherFieldStat& f = out.fields[k];
        f.count = (counts[k] > UINT16_MAX) ? UINT16_MAX : (uint16_t)counts[k];
        f.present = counts[k] > 0;
        if (f.present && k != (uint8_t)WeatherKind::Precipitation) {
            f.mean = (float)(sums[k] / (double)counts[k]);
        }
    }
    out.precipMm = (float)precipTotal;

    return out.valid();
}
