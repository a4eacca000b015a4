/**
 * @file PrecipitationCounter.cpp
 * @brief Cumulative rain counter delta tracking.
 */

#include "Modules/WeatherModule/PrecipitationCounter.h"
#include "Domain/IrrigationDefaults.h"

PrecipStep PrecipitationCounter::update(float reading)
{
    PrecipStep step{};
    step.previous = last_;

    if (!hasLast_) {
        step.kind = PrecipStepKind::First;
    } else if (reading < last_) {
        step.kind = PrecipStepKind::Rollover;
    } else {
        float delta = reading - last_;
        if (delta > IrrigationDefaults::PrecipAnomalyMm) {
            step.kind = PrecipStepKind::Anomaly;
        } else if (delta > 0.0f) {
            step.kind = PrecipStepKind::Increase;
            step.rainMm = delta;
        } else {
            step.kind = PrecipStepKind::NoChange;
        }
    }

    hasLast_ = true;
    last_ = reading;
    return step;
}

const char* precipStepStr(PrecipStepKind kind)
{
    switch (kind) {
        case PrecipStepKind::First: return "first";
        case PrecipStepKind::Increase: return "increase";
        case PrecipStepKind::NoChange: return "no_change";
        case PrecipStepKind::Rollover: return "rollover";
        case PrecipStepKind::Anomaly: return "anomaly";
        default: return "unknown";
    }
}
