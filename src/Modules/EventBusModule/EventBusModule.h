#pragma once
/**
 * @file EventBusModule.h
 * @brief Active module hosting the EventBus task/dispatch loop.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"
#include "Core/SystemLimits.h"

/**
 * @brief Active module that owns the EventBus instance.
 *
 * Rain tips, valve edges and day-start triggers all travel through this queue;
 * overflow is reported as a warning with the cumulative drop count.
 */
class EventBusModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "eventbus"; }
    /** @brief Task name. */
    const char* taskName() const override { return "EventBus"; }

    /** @brief EventBus depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }
    /** @brief Initialize and register EventBus service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Dispatch events from the queue. */
    void loop() override;

    uint16_t taskStackSize() const override { return Limits::Bus::TaskStackSize; }
    /** @brief Task priority override. */
    UBaseType_t taskPriority() const override { return 1; }

private:
    EventBus _bus;
    EventBusService _svc { &_bus };

    const LogHubService* logHub = nullptr;

    uint32_t lastDropped_ = 0;
    uint32_t lastDropWarnMs_ = 0;

    void reportDrops_();
};
