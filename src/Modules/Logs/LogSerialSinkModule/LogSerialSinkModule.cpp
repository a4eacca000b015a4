/**
 * @file LogSerialSinkModule.cpp
 * @brief Colored serial output for log entries.
 */
#include "LogSerialSinkModule.h"
#include <Arduino.h>

static const char* lvlStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info:  return "I";
        case LogLevel::Warn:  return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static void formatUptime(char* out, size_t outSize, uint32_t ms)
{
    const uint32_t s = ms / 1000;
    snprintf(out, outSize, "+%02lu:%02lu:%02lu.%03lu",
             (unsigned long)((s / 3600) % 24),
             (unsigned long)((s / 60) % 60),
             (unsigned long)(s % 60),
             (unsigned long)(ms % 1000));
}

void LogSerialSinkModule::write(void* ctx, const LogEntry& e) {
    const LogSerialSinkModule* self = static_cast<const LogSerialSinkModule*>(ctx);
    const TimeService* ts = self ? self->timeSvc_ : nullptr;

    char stamp[48];
    char local[32] = {0};
    if (ts && ts->isSynced && ts->formatLocalTime &&
        ts->isSynced(ts->ctx) &&
        ts->formatLocalTime(ts->ctx, local, sizeof(local))) {
        snprintf(stamp, sizeof(stamp), "%s.%03u", local, (unsigned)(e.ts_ms % 1000));
    } else {
        formatUptime(stamp, sizeof(stamp), e.ts_ms);
    }

    Serial.printf("[%s][%s][%s] %s%s\x1b[0m\n",
                  stamp, lvlStr(e.lvl), e.tag, lvlColor(e.lvl), e.msg);
}

void LogSerialSinkModule::init(ConfigStore&, ServiceRegistry& services) {
    Serial.begin(115200);

    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = &LogSerialSinkModule::write;
    sink.ctx = this;
    if (!sinks->add(sinks->ctx, sink)) {
        Serial.println("log sink registry full, serial sink not added");
    }
}

void LogSerialSinkModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services) {
    timeSvc_ = services.get<TimeService>("time");
}
