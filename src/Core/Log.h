/**
 * @file Log.h
 * @brief Global log helper for core and modules.
 */
#pragma once

#include "Core/Services/ILogger.h"

namespace Log {
    /** @brief Set the global log hub service. */
    void setHub(const LogHubService* hub);
    const LogHubService* hub();

    /** @brief Entries below this level are dropped before formatting. */
    void setMinLevel(LogLevel lvl);
    LogLevel minLevel();

    /** @brief Log a formatted message with a given level. */
    void logf(LogLevel lvl, const char* tag, const char* fmt, ...);

    void debug(const char* tag, const char* fmt, ...);
    void info(const char* tag, const char* fmt, ...);
    void warn(const char* tag, const char* fmt, ...);
    void error(const char* tag, const char* fmt, ...);
}

// Macros are provided by Core/ModuleLog.h to keep Module.h neutral.
