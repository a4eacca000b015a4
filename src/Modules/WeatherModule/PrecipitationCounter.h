#pragma once
/**
 * @file PrecipitationCounter.h
 * @brief Cumulative rain counter delta tracking.
 *
 * Turns consecutive readings of a cumulative precipitation counter into rain
 * increments. An increase above IrrigationDefaults::PrecipAnomalyMm is a
 * sensor fault and a decrease is a counter rollover; neither yields rain.
 * The latest reading always becomes the new baseline.
 */

#include <stdint.h>

enum class PrecipStepKind : uint8_t {
    First = 0,
    Increase,
    NoChange,
    Rollover,
    Anomaly
};

struct PrecipStep {
    PrecipStepKind kind = PrecipStepKind::First;
    /** Rain to credit, only non-zero for Increase. */
    float rainMm = 0.0f;
    float previous = 0.0f;
};

class PrecipitationCounter {
public:
    PrecipStep update(float reading);

private:
    bool hasLast_ = false;
    float last_ = 0.0f;
};

const char* precipStepStr(PrecipStepKind kind);
