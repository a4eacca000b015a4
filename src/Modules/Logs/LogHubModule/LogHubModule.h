#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 *
 * `log.min_level` (0=debug .. 3=error) filters entries before they are
 * formatted. It is applied once config is loaded and on every change.
 */
class LogHubModule : public ModulePassive {
public:
    const char* moduleId() const override { return "loghub"; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    LogHub hub;
    LogHubService hubSvc{};

    LogSinkRegistry sinks;
    LogSinkRegistryService sinksSvc{};

    uint8_t minLevel_ = (uint8_t)LogLevel::Info;
    ConfigVariable<uint8_t,0> minLevelVar {
        NVS_KEY(NvsKeys::Log::MinLevel),"min_level","log",ConfigType::UInt8,
        &minLevel_,ConfigPersistence::Persistent,0
    };

    void applyMinLevel_();
    static void onEventStatic(const Event& e, void* user);
};
