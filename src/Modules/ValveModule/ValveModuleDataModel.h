#pragma once
/**
 * @file ValveModuleDataModel.h
 * @brief Valve runtime data model contribution.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

struct ValveRuntimeEntry {
    bool configured = false;
    bool on = false;
    bool forced = false;     // last close came from the max-on cutoff
    uint32_t onSinceMs = 0;
    uint32_t tsMs = 0;
};

struct ValveRuntimeData {
    ValveRuntimeEntry valves[Limits::Irrigation::MaxZones];
};

// MODULE_DATA_MODEL: ValveRuntimeData valves
