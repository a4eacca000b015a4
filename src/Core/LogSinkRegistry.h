#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"

/**
 * @brief Stores and enumerates registered log sinks.
 */
class LogSinkRegistry {
public:
    bool add(LogSinkService sink);
    int count() const;
    /** @brief Sink at index, or an empty sink when out of range. */
    LogSinkService get(int idx) const;

private:
    static constexpr int MAX_SINKS = 4;
    LogSinkService sinks[MAX_SINKS]{};
    int n = 0;
};
