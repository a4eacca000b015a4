#pragma once
/**
 * @file ZoneConfig.h
 * @brief Per-zone irrigation settings and their validation.
 */

#include <stdint.h>

#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"

struct ZoneConfig {
    char name[Limits::Irrigation::ZoneNameLen] = {0};
    float rateMmH = IrrigationDefaults::PrecipRateDefaultMmH;
    float kc = IrrigationDefaults::KcDefault;
    int32_t minRuntimeS = IrrigationDefaults::MinRuntimeDefaultS;
    int32_t maxRuntimeS = IrrigationDefaults::MaxRuntimeDefaultS;
    int32_t minIntervalS = IrrigationDefaults::MinIntervalDefaultS;
};

enum ZoneConfigFix : uint8_t {
    ZONE_CFG_FIX_NONE = 0,
    ZONE_CFG_FIX_RATE = 1u << 0,
    ZONE_CFG_FIX_KC = 1u << 1,
    ZONE_CFG_FIX_MIN_RUNTIME = 1u << 2,
    ZONE_CFG_FIX_MAX_RUNTIME = 1u << 3,
    ZONE_CFG_FIX_MIN_INTERVAL = 1u << 4,
    ZONE_CFG_FIX_NAME = 1u << 5
};

/**
 * Brings `c` into range in place and returns the ZoneConfigFix bits of the
 * corrected fields. A non-positive or non-finite rate falls back to the
 * default rate, Kc is clamped, negative durations become 0, the minimum
 * runtime never exceeds a non-zero maximum, an empty name becomes "Zone N".
 */
uint8_t sanitizeZoneConfig(ZoneConfig& c, uint8_t zone);
