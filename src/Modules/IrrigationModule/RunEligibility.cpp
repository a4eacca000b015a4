/**
 * @file RunEligibility.cpp
 * @brief Recommended runtime and run/no-run decision for one zone.
 */

#include "Modules/IrrigationModule/RunEligibility.h"
#include "Modules/IrrigationModule/ZoneLedger.h"
#include <math.h>

bool evaluateRunEligibility(const RunEligibilityInput& in, RunEligibilityOutput& out)
{
    out = RunEligibilityOutput{};
    if (!isfinite(in.balanceMm) || !isfinite(in.forecastRainMm)) return false;

    float forecast = (in.forecastRainMm > 0.0f) ? in.forecastRainMm : 0.0f;
    if (in.balanceMm < 0.0f) {
        float deficit = -in.balanceMm - forecast;
        out.effectiveDeficitMm = (deficit > 0.0f) ? deficit : 0.0f;
    }

    out.requiredRuntimeS = runtimeSecondsForDeficit(out.effectiveDeficitMm, in.rateMmH);
    if (out.requiredRuntimeS > 0.0f) {
        float r = out.requiredRuntimeS;
        if (in.maxRuntimeS > 0 && r > (float)in.maxRuntimeS) r = (float)in.maxRuntimeS;
        if (r < (float)in.minRuntimeS) r = (float)in.minRuntimeS;
        out.recommendedRuntimeS = (r > 0.0f) ? r : 0.0f;
    }

    if (in.hasLastOff && in.minIntervalS > 0 && in.secondsSinceLastOff < (uint32_t)in.minIntervalS) {
        out.reason = RunBlockReason::MinInterval;
    } else if (in.balanceMm >= 0.0f) {
        out.reason = RunBlockReason::NoDeficit;
    } else if (out.effectiveDeficitMm <= 0.0f) {
        out.reason = RunBlockReason::RainForecast;
    } else if (out.requiredRuntimeS < (float)in.minRuntimeS) {
        out.reason = RunBlockReason::TooShort;
    } else {
        out.reason = RunBlockReason::Ready;
    }
    out.canRun = (out.reason == RunBlockReason::Ready);
    return true;
}

const char* runBlockReasonStr(RunBlockReason reason)
{
    switch (reason) {
        case RunBlockReason::Ready: return "ready";
        case RunBlockReason::MinInterval: return "min_interval";
        case RunBlockReason::NoDeficit: return "no_deficit";
        case RunBlockReason::RainForecast: return "rain_forecast";
        case RunBlockReason::TooShort: return "too_short";
        default: return "unknown";
    }
}
