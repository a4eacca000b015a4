#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/Services/ITime.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to Serial.
 *
 * Lines carry local wall-clock time once the time service reports a sync,
 * uptime before that.
 */
class LogSerialSinkModule : public ModulePassive {
public:
    const char* moduleId() const override { return "log.sink.serial"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Time service is registered after the sink; resolve it here. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    const TimeService* timeSvc_ = nullptr;

    static void write(void* ctx, const LogEntry& e);
};
