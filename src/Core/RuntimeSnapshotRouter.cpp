/**
 * @file RuntimeSnapshotRouter.cpp
 * @brief Implementation file.
 */

#include "Core/RuntimeSnapshotRouter.h"
#define LOG_TAG "RtRouter"
#include "Core/ModuleLog.h"
#include <Arduino.h>
#include <string.h>

const RuntimeRoutePolicy* RuntimeSnapshotRouter::policyFor_(const char* suffix) const
{
    for (uint8_t i = 0; i < policyCount_; ++i) {
        const RuntimeRoutePolicy& p = policies_[i];
        if (p.prefix && strncmp(suffix, p.prefix, strlen(p.prefix)) == 0) return &p;
    }
    return nullptr;
}

uint8_t RuntimeSnapshotRouter::addProvider(const IRuntimeSnapshotProvider* provider, const MqttService& mqtt)
{
    if (!provider || !mqtt.formatTopic) return 0;

    uint8_t added = 0;
    const uint8_t count = provider->runtimeSnapshotCount();
    for (uint8_t idx = 0; idx < count; ++idx) {
        if (routeCount_ >= Limits::MaxRuntimeRoutes) {
            LOGW("Route table full (%u), provider truncated", (unsigned)Limits::MaxRuntimeRoutes);
            break;
        }
        const char* suffix = provider->runtimeSnapshotSuffix(idx);
        if (!suffix || suffix[0] == '\0') continue;

        Route& r = routes_[routeCount_++];
        r.provider = provider;
        r.idx = idx;
        const RuntimeRoutePolicy* p = policyFor_(suffix);
        r.dirtyMask = p ? p->dirtyMask : fallbackMask_;
        r.publishOnBoot = p ? p->publishOnBoot : false;
        r.bootDone = false;
        r.lastTs = 0;
        // Suffix may live in a provider static buffer: format right away.
        mqtt.formatTopic(mqtt.ctx, suffix, r.topic, sizeof(r.topic));
        ++added;
    }
    return added;
}

void RuntimeSnapshotRouter::publish(const MqttService& mqtt, uint32_t dirtyMask, char* buf, size_t len)
{
    if (!mqtt.publish || !buf || len == 0) return;

    Stats st{};
    st.seq = stats_.seq + 1;
    st.tsMs = millis();
    st.routes = routeCount_;
    st.dirtyMask = dirtyMask;

    for (uint8_t i = 0; i < routeCount_; ++i) {
        Route& r = routes_[i];
        const bool bootPending = r.publishOnBoot && !r.bootDone;
        if (!bootPending && (r.dirtyMask & dirtyMask) == 0U) {
            ++st.masked;
            continue;
        }

        uint32_t ts = 0;
        if (!r.provider->buildRuntimeSnapshot(r.idx, buf, len, ts)) {
            ++st.buildErrors;
            continue;
        }
        if (!bootPending && ts <= r.lastTs) {
            ++st.unchanged;
            continue;
        }
        if (!mqtt.publish(mqtt.ctx, r.topic, buf, 0, false)) {
            ++st.publishErrors;
            continue;
        }
        r.lastTs = ts;
        r.bootDone = true;
        ++st.published;
    }

    stats_ = st;
}

bool RuntimeSnapshotRouter::buildStatsJson(char* out, size_t len) const
{
    if (!out || len == 0) return false;
    const int wrote = snprintf(out, len,
                               "{\"v\":1,\"ts\":%lu,\"seq\":%lu,\"routes_total\":%u,\"routes_pub\":%u,"
                               "\"routes_skip_nc\":%u,\"routes_skip_m\":%u,"
                               "\"build_errors\":%u,\"publish_errors\":%u,\"dirty_act_m\":%lu}",
                               (unsigned long)millis(),
                               (unsigned long)stats_.seq,
                               (unsigned)stats_.routes,
                               (unsigned)stats_.published,
                               (unsigned)stats_.unchanged,
                               (unsigned)stats_.masked,
                               (unsigned)stats_.buildErrors,
                               (unsigned)stats_.publishErrors,
                               (unsigned long)stats_.dirtyMask);
    return wrote > 0 && (size_t)wrote < len;
}
