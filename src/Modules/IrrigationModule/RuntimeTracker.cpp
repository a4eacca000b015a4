/**
 * @file RuntimeTracker.cpp
 * @brief Valve on/off intervals to applied water depth.
 */

#include "Modules/IrrigationModule/RuntimeTracker.h"

float irrigationWaterMm(float durationSec, float rateMmH)
{
    if (!(durationSec > 0.0f) || !(rateMmH > 0.0f)) return 0.0f;
    return (durationSec / 3600.0f) * rateMmH;
}

RunEdgeResult RuntimeTracker::valveOn(uint32_t nowMs)
{
    if (open_) return RunEdgeResult::Extended;
    open_ = true;
    startMs_ = nowMs;
    return RunEdgeResult::Opened;
}

RunEdgeResult RuntimeTracker::valveOff(uint32_t nowMs, float rateMmH, IrrigationRun& runOut)
{
    if (!open_) return RunEdgeResult::IgnoredOff;

    runOut.startMs = startMs_;
    runOut.endMs = nowMs;
    runOut.durationSec = (float)(uint32_t)(nowMs - startMs_) / 1000.0f;
    runOut.waterMm = irrigationWaterMm(runOut.durationSec, rateMmH);

    open_ = false;
    startMs_ = 0;
    return RunEdgeResult::Closed;
}

float RuntimeTracker::openDurationSec(uint32_t nowMs) const
{
    if (!open_) return 0.0f;
    return (float)(uint32_t)(nowMs - startMs_) / 1000.0f;
}
