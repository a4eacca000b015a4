#pragma once
/**
 * @file RunEligibility.h
 * @brief Recommended runtime and run/no-run decision for one zone.
 */

#include <stdint.h>

enum class RunBlockReason : uint8_t {
    Ready = 0,
    MinInterval,
    NoDeficit,
    RainForecast,
    TooShort
};

struct RunEligibilityInput {
    float balanceMm = 0.0f;
    float rateMmH = 0.0f;
    float forecastRainMm = 0.0f;
    int32_t minRuntimeS = 0;
    int32_t maxRuntimeS = 0;
    int32_t minIntervalS = 0;
    bool hasLastOff = false;
    uint32_t secondsSinceLastOff = 0;
};

struct RunEligibilityOutput {
    bool canRun = false;
    RunBlockReason reason = RunBlockReason::NoDeficit;
    float effectiveDeficitMm = 0.0f;
    /** Runtime for the effective deficit, unclamped. */
    float requiredRuntimeS = 0.0f;
    /** requiredRuntimeS clamped to [min, max], 0 when nothing is required. */
    float recommendedRuntimeS = 0.0f;
};

bool evaluateRunEligibility(const RunEligibilityInput& in, RunEligibilityOutput& out);
const char* runBlockReasonStr(RunBlockReason reason);
