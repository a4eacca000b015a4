#pragma once
/**
 * @file WeatherRuntime.h
 * @brief Weather runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/WeatherModule/WeatherTypes.h"

// RUNTIME_PUBLIC

static inline bool weatherLatest(const DataStore& ds, WeatherKind kind, WeatherLatestEntry& out)
{
    const uint8_t idx = (uint8_t)kind;
    if (idx >= WEATHER_KIND_COUNT) return false;
    out = ds.data().weather.latest[idx];
    return out.valid;
}

static inline void setWeatherLatest(DataStore& ds, WeatherKind kind, float value, uint32_t epochSec, uint32_t tsMs)
{
    const uint8_t idx = (uint8_t)kind;
    if (idx >= WEATHER_KIND_COUNT) return;
    WeatherLatestEntry& e = ds.dataMutable().weather.latest[idx];
    e.valid = true;
    e.value = value;
    e.epochSec = epochSec;
    e.tsMs = tsMs;
    ds.notifyChanged((DataKey)(DataKeys::WeatherBase + idx), DIRTY_WEATHER);
}

static inline uint32_t weatherRejectedCount(const DataStore& ds)
{
    return ds.data().weather.rejectedCount;
}

static inline uint32_t weatherAnomalyCount(const DataStore& ds)
{
    return ds.data().weather.anomalyCount;
}

static inline void setWeatherCounters(DataStore& ds, uint32_t rejected, uint32_t anomalies)
{
    RuntimeData& rt = ds.dataMutable();
    rt.weather.rejectedCount = rejected;
    rt.weather.anomalyCount = anomalies;
}
