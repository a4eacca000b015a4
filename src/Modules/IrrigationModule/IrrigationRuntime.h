#pragma once
/**
 * @file IrrigationRuntime.h
 * @brief Irrigation runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

// RUNTIME_PUBLIC

static inline bool irrigationZone(const DataStore& ds, uint8_t zone, IrrigationZoneRuntimeEntry& out)
{
    if (zone >= Limits::Irrigation::MaxZones) return false;
    out = ds.data().irrigation.zones[zone];
    return out.valid;
}

static inline bool sameIrrigationZone_(const IrrigationZoneRuntimeEntry& a, const IrrigationZoneRuntimeEntry& b)
{
    return a.valid == b.valid &&
           a.balanceMm == b.balanceMm &&
           a.requiredRuntimeS == b.requiredRuntimeS &&
           a.recommendedRuntimeS == b.recommendedRuntimeS &&
           a.canRun == b.canRun &&
           a.blockReason == b.blockReason &&
           a.lastEtDate == b.lastEtDate &&
           a.lastEtMm == b.lastEtMm &&
           a.lastMethod == b.lastMethod &&
           a.lastEt0Mm == b.lastEt0Mm &&
           a.runtimeTodaySec == b.runtimeTodaySec &&
           a.lastIrrigationMm == b.lastIrrigationMm &&
           a.lastOffEpoch == b.lastOffEpoch &&
           a.lastRainMm == b.lastRainMm &&
           a.lastRainEpoch == b.lastRainEpoch &&
           a.valveOpen == b.valveOpen;
}

/** Stores the entry and notifies when anything but `tsMs` differs. */
static inline bool setIrrigationZone(DataStore& ds, uint8_t zone, const IrrigationZoneRuntimeEntry& v)
{
    if (zone >= Limits::Irrigation::MaxZones) return false;
    IrrigationZoneRuntimeEntry& cur = ds.dataMutable().irrigation.zones[zone];
    if (sameIrrigationZone_(cur, v)) return false;
    cur = v;
    ds.notifyChanged((DataKey)(DataKeys::ZoneBase + zone), DIRTY_IRRIGATION);
    return true;
}

static inline IrrigationDailyEntry irrigationDaily(const DataStore& ds)
{
    return ds.data().irrigation.daily;
}

static inline void setIrrigationDaily(DataStore& ds, const IrrigationDailyEntry& v)
{
    ds.dataMutable().irrigation.daily = v;
    ds.notifyChanged(DataKeys::IrrigationDaily, DIRTY_IRRIGATION);
}
