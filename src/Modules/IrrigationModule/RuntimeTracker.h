#pragma once
/**
 * @file RuntimeTracker.h
 * @brief Valve on/off intervals to applied water depth.
 *
 * Timestamps are monotonic milliseconds (wrap-safe subtraction). One open run
 * per zone: a second rising edge keeps the open run and its start time.
 */

#include <stdint.h>

enum class RunEdgeResult : uint8_t {
    Opened = 0,
    Extended,
    Closed,
    IgnoredOff
};

struct IrrigationRun {
    uint32_t startMs = 0;
    uint32_t endMs = 0;
    float durationSec = 0.0f;
    float waterMm = 0.0f;
};

/** Water depth in mm for `durationSec` at `rateMmH`. */
float irrigationWaterMm(float durationSec, float rateMmH);

class RuntimeTracker {
public:
    RunEdgeResult valveOn(uint32_t nowMs);

    /** Closes the open run into `runOut`; `rateMmH` converts duration to water. */
    RunEdgeResult valveOff(uint32_t nowMs, float rateMmH, IrrigationRun& runOut);

    bool isOpen() const { return open_; }
    uint32_t openSinceMs() const { return startMs_; }
    float openDurationSec(uint32_t nowMs) const;

private:
    bool open_ = false;
    uint32_t startMs_ = 0;
};
