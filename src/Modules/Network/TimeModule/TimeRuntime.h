#pragma once
/**
 * @file TimeRuntime.h
 * @brief Time runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

// RUNTIME_PUBLIC

static inline bool timeReady(const DataStore& ds)
{
    return ds.data().time.timeReady;
}

static inline void setTimeReady(DataStore& ds, bool ready)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.time.timeReady == ready) return;
    rt.time.timeReady = ready;
    ds.notifyChanged(DataKeys::TimeReady, DIRTY_TIME);
}
