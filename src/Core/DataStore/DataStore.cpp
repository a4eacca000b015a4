/**
 * @file DataStore.cpp
 * @brief Implementation file.
 */
#include "Core/DataStore/DataStore.h"
#define LOG_TAG_CORE "DataStor"

uint32_t DataStore::markDirty(uint32_t mask)
{
    portENTER_CRITICAL(&_mux);
    _dirtyFlags |= mask;
    const uint32_t flags = _dirtyFlags;
    portEXIT_CRITICAL(&_mux);
    return flags;
}

uint32_t DataStore::dirtyFlags() const
{
    portENTER_CRITICAL(&_mux);
    const uint32_t flags = _dirtyFlags;
    portEXIT_CRITICAL(&_mux);
    return flags;
}

uint32_t DataStore::consumeDirtyFlags()
{
    portENTER_CRITICAL(&_mux);
    const uint32_t f = _dirtyFlags;
    _dirtyFlags = DIRTY_NONE;
    portEXIT_CRITICAL(&_mux);
    return f;
}

void DataStore::publishChanged(DataKey key)
{
    if (!_bus) return;
    DataChangedPayload p{ key };
    _bus->post(EventId::DataChanged, &p, sizeof(p));
}

void DataStore::publishSnapshot(uint32_t flags)
{
    if (!_bus) return;
    DataSnapshotPayload p{ flags };
    _bus->post(EventId::DataSnapshotAvailable, &p, sizeof(p));
}

void DataStore::notifyChanged(DataKey key, uint32_t dirtyMask)
{
    const uint32_t flags = markDirty(dirtyMask);
    publishChanged(key);
    publishSnapshot(flags);
}
