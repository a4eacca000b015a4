/**
 * @file LogDispatcherModule.cpp
 * @brief Log queue consumer task.
 */
#include "LogDispatcherModule.h"
#include <Arduino.h>
#include <stdio.h>

void LogDispatcherModule::init(ConfigStore&, ServiceRegistry& services) {
    _hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    // The hub object travels as the service ctx.
    if (!_hubSvc || !_hubSvc->ctx || !_sinkReg) return;
    _hub = static_cast<LogHub*>(_hubSvc->ctx);
}

void LogDispatcherModule::loop() {
    if (!_hub || !_sinkReg) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    LogEntry e;
    if (!_hub->dequeue(e, pdMS_TO_TICKS(1000))) return;

    const int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }

    // Drops are reported through the sinks directly, the hub is what overflowed.
    const uint32_t drops = _hub->dropped();
    if (drops != _reportedDrops) {
        LogEntry d{};
        d.ts_ms = millis();
        d.lvl = LogLevel::Warn;
        snprintf(d.tag, sizeof(d.tag), "LogDisp");
        snprintf(d.msg, sizeof(d.msg), "%lu log entries dropped", (unsigned long)(drops - _reportedDrops));
        _reportedDrops = drops;
        for (int i = 0; i < n; ++i) {
            LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
            if (sink.write) sink.write(sink.ctx, d);
        }
    }
}
