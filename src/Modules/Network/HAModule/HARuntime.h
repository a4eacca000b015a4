#pragma once
/**
 * @file HARuntime.h
 * @brief Home Assistant runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

// RUNTIME_PUBLIC

static inline bool haAutoconfigPublished(const DataStore& ds)
{
    return ds.data().ha.autoconfigPublished;
}

static inline void setHaAutoconfigPublished(DataStore& ds, bool published)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.ha.autoconfigPublished == published) return;
    rt.ha.autoconfigPublished = published;
    ds.notifyChanged(DataKeys::HaPublished, DIRTY_MQTT);
}
