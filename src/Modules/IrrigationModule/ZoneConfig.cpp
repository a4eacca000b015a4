/**
 * @file ZoneConfig.cpp
 * @brief Per-zone irrigation settings and their validation.
 */

#include "Modules/IrrigationModule/ZoneConfig.h"
#include "Modules/IrrigationModule/EtCalculator.h"
#include <math.h>
#include <stdio.h>

uint8_t sanitizeZoneConfig(ZoneConfig& c, uint8_t zone)
{
    uint8_t fixed = ZONE_CFG_FIX_NONE;

    if (!isfinite(c.rateMmH) || c.rateMmH <= 0.0f) {
        c.rateMmH = IrrigationDefaults::PrecipRateDefaultMmH;
        fixed |= ZONE_CFG_FIX_RATE;
    }
    const float kc = clampCropCoefficient(c.kc);
    if (kc != c.kc) {
        c.kc = kc;
        fixed |= ZONE_CFG_FIX_KC;
    }
    if (c.minRuntimeS < 0) {
        c.minRuntimeS = 0;
        fixed |= ZONE_CFG_FIX_MIN_RUNTIME;
    }
    if (c.maxRuntimeS < 0) {
        c.maxRuntimeS = 0;
        fixed |= ZONE_CFG_FIX_MAX_RUNTIME;
    }
    if (c.maxRuntimeS > 0 && c.minRuntimeS > c.maxRuntimeS) {
        c.minRuntimeS = c.maxRuntimeS;
        fixed |= ZONE_CFG_FIX_MIN_RUNTIME;
    }
    if (c.minIntervalS < 0) {
        c.minIntervalS = 0;
        fixed |= ZONE_CFG_FIX_MIN_INTERVAL;
    }
    c.name[sizeof(c.name) - 1] = '\0';
    if (c.name[0] == '\0') {
        snprintf(c.name, sizeof(c.name), "Zone %u", (unsigned)zone);
        fixed |= ZONE_CFG_FIX_NAME;
    }
    return fixed;
}
