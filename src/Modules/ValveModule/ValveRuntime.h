#pragma once
/**
 * @file ValveRuntime.h
 * @brief Valve runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

// RUNTIME_PUBLIC

static inline bool valveState(const DataStore& ds, uint8_t zone, ValveRuntimeEntry& out)
{
    if (zone >= Limits::Irrigation::MaxZones) return false;
    out = ds.data().valves.valves[zone];
    return out.configured;
}

static inline bool valveIsOpen(const DataStore& ds, uint8_t zone)
{
    if (zone >= Limits::Irrigation::MaxZones) return false;
    return ds.data().valves.valves[zone].on;
}

static inline void setValveState(DataStore& ds, uint8_t zone, const ValveRuntimeEntry& v)
{
    if (zone >= Limits::Irrigation::MaxZones) return;
    ValveRuntimeEntry& cur = ds.dataMutable().valves.valves[zone];
    if (cur.configured == v.configured &&
        cur.on == v.on &&
        cur.forced == v.forced &&
        cur.onSinceMs == v.onSinceMs) {
        return;
    }
    cur = v;
    ds.notifyChanged((DataKey)(DataKeys::ValveBase + zone), DIRTY_ACTUATORS);
}
