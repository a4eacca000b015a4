#pragma once
/**
 * @file IrrigationModuleDataModel.h
 * @brief Irrigation runtime data model contribution.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

struct IrrigationZoneRuntimeEntry {
    bool valid = false;
    float balanceMm = 0.0f;
    float requiredRuntimeS = 0.0f;
    float recommendedRuntimeS = 0.0f;
    bool canRun = false;
    uint8_t blockReason = 0;      // RunBlockReason
    uint32_t lastEtDate = 0;      // YYYYMMDD, 0 = never
    float lastEtMm = 0.0f;
    uint8_t lastMethod = 0;       // EtMethod
    float lastEt0Mm = 0.0f;
    uint32_t runtimeTodaySec = 0;
    float lastIrrigationMm = 0.0f;
    uint32_t lastOffEpoch = 0;
    float lastRainMm = 0.0f;
    uint32_t lastRainEpoch = 0;
    bool valveOpen = false;
    uint32_t tsMs = 0;
};

enum IrrigationJobOutcome : uint8_t {
    IRRIGATION_JOB_NONE = 0,
    IRRIGATION_JOB_APPLIED = 1,
    IRRIGATION_JOB_SKIPPED = 2
};

struct IrrigationDailyEntry {
    bool enabled = false;
    uint8_t zoneCount = 0;
    float forecastRainMm = 0.0f;
    uint32_t lastJobDate = 0;
    uint8_t lastJobOutcome = IRRIGATION_JOB_NONE;
    uint8_t lastJobMethod = 0;    // EtMethod
    float lastJobEt0Mm = 0.0f;
    uint32_t tsMs = 0;
};

struct IrrigationRuntimeData {
    IrrigationZoneRuntimeEntry zones[Limits::Irrigation::MaxZones];
    IrrigationDailyEntry daily;
};

// MODULE_DATA_MODEL: IrrigationRuntimeData irrigation
