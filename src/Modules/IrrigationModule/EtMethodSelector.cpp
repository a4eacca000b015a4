/**
 * @file EtMethodSelector.cpp
 * @brief ET formula selection decision table.
 */

#include "Modules/IrrigationModule/EtMethodSelector.h"

EtMethod selectEtMethod(bool hasTemperature, bool hasHumidity, bool hasWind, bool hasSolar)
{
    if (!hasTemperature || !hasHumidity) return EtMethod::None;
    if (hasWind && hasSolar) return EtMethod::PenmanMonteith;
    if (hasSolar || hasWind) return EtMethod::PriestleyTaylor;
    return EtMethod::Hargreaves;
}

EtMethod selectEtMethod(const DailyWeatherAggregate& agg)
{
    return selectEtMethod(agg.has(WeatherKind::Temperature),
                          agg.has(WeatherKind::Humidity),
                          agg.has(WeatherKind::Wind),
                          agg.has(WeatherKind::Solar));
}

const char* etMethodStr(EtMethod method)
{
    switch (method) {
        case EtMethod::PenmanMonteith: return "penman_monteith";
        case EtMethod::PriestleyTaylor: return "priestley_taylor";
        case EtMethod::Hargreaves: return "hargreaves";
        case EtMethod::None:
        default: return "none";
    }
}
