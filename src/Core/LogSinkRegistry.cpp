/**
 * @file LogSinkRegistry.cpp
 * @brief Fixed table of log sinks.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    if (n >= MAX_SINKS) return false;
    sinks[n++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    return n;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}
