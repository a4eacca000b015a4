#pragma once
/**
 * @file RuntimeSnapshotRouter.h
 * @brief Routes `IRuntimeSnapshotProvider` snapshots to MQTT topics by dirty flag.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/RuntimeSnapshotProvider.h"
#include "Core/Services/IMqtt.h"
#include "Core/SystemLimits.h"

/** @brief Suffix prefix to dirty flag binding. The first matching prefix wins. */
struct RuntimeRoutePolicy {
    const char* prefix;
    uint32_t dirtyMask;
    bool publishOnBoot;   // publish once after boot even if the snapshot did not change
};

/**
 * @brief Fixed table of snapshot routes.
 *
 * Called from the MQTT task only (snapshot publisher callback), no locking.
 */
class RuntimeSnapshotRouter {
public:
    struct Stats {
        uint32_t seq = 0;
        uint32_t tsMs = 0;
        uint8_t routes = 0;
        uint8_t published = 0;
        uint8_t unchanged = 0;
        uint8_t masked = 0;
        uint8_t buildErrors = 0;
        uint8_t publishErrors = 0;
        uint32_t dirtyMask = 0;
    };

    RuntimeSnapshotRouter(const RuntimeRoutePolicy* policies, uint8_t policyCount, uint32_t fallbackMask)
        : policies_(policies), policyCount_(policyCount), fallbackMask_(fallbackMask) {}

    /** Adds one route per provider snapshot. Returns the number of routes added. */
    uint8_t addProvider(const IRuntimeSnapshotProvider* provider, const MqttService& mqtt);

    /** Publishes routes whose flag is in `dirtyMask` and whose snapshot changed. */
    void publish(const MqttService& mqtt, uint32_t dirtyMask, char* buf, size_t len);

    bool buildStatsJson(char* out, size_t len) const;
    uint8_t routeCount() const { return routeCount_; }

private:
    struct Route {
        const IRuntimeSnapshotProvider* provider = nullptr;
        uint8_t idx = 0;
        uint32_t dirtyMask = 0;
        bool publishOnBoot = false;
        bool bootDone = false;
        uint32_t lastTs = 0;
        char topic[Limits::TopicBuf] = {0};
    };

    const RuntimeRoutePolicy* policyFor_(const char* suffix) const;

    const RuntimeRoutePolicy* policies_ = nullptr;
    uint8_t policyCount_ = 0;
    uint32_t fallbackMask_ = 0;

    Route routes_[Limits::MaxRuntimeRoutes]{};
    uint8_t routeCount_ = 0;
    Stats stats_{};
};
