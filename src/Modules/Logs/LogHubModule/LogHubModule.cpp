/**
 * @file LogHubModule.cpp
 * @brief Log hub, sink registry and level filter wiring.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"
#include "Core/Services/IEventBus.h"
#include <string.h>

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(minLevelVar);

    if (!hub.init(Limits::LogQueueLen)) return;

    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.dropped = [](void* ctx) -> uint32_t {
        return static_cast<LogHub*>(ctx)->dropped();
    };
    hubSvc.ctx = &hub;

    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc.get = [](void* ctx, int idx) -> LogSinkService {
        return static_cast<LogSinkRegistry*>(ctx)->get(idx);
    };
    sinksSvc.ctx = &sinks;

    services.add("loghub", &hubSvc);
    services.add("logsinks", &sinksSvc);

    Log::setHub(&hubSvc);
}

void LogHubModule::applyMinLevel_()
{
    if (minLevel_ > (uint8_t)LogLevel::Error) minLevel_ = (uint8_t)LogLevel::Error;
    Log::setMinLevel((LogLevel)minLevel_);
}

void LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services)
{
    applyMinLevel_();

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    if (ebSvc && ebSvc->bus) {
        ebSvc->bus->subscribe(EventId::ConfigChanged, &LogHubModule::onEventStatic, this);
    }
}

void LogHubModule::onEventStatic(const Event& e, void* user)
{
    LogHubModule* self = static_cast<LogHubModule*>(user);
    if (!self || !e.payload || e.len < sizeof(ConfigChangedPayload)) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strcmp(p->nvsKey, NvsKeys::Log::MinLevel) != 0) return;
    self->applyMinLevel_();
}
