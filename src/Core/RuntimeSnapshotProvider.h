#pragma once
/**
 * @file RuntimeSnapshotProvider.h
 * @brief Interface for modules exposing `rt/...` JSON snapshots.
 */
#include <stddef.h>
#include <stdint.h>

/**
 * @brief Source of runtime snapshots routed to MQTT by `main.cpp`.
 *
 * Each index maps to one topic suffix. `maxTsOut` receives the newest change
 * timestamp covered by the snapshot; the router skips unchanged snapshots.
 */
class IRuntimeSnapshotProvider {
public:
    virtual ~IRuntimeSnapshotProvider() = default;

    virtual uint8_t runtimeSnapshotCount() const = 0;
    virtual const char* runtimeSnapshotSuffix(uint8_t idx) const = 0;
    virtual bool buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const = 0;
};
