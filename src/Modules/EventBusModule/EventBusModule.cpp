/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"
#include <Arduino.h>

void EventBusModule::init(ConfigStore&, ServiceRegistry& services) {
    logHub = services.get<LogHubService>("loghub");

    services.add("eventbus", &_svc);

    LOGI("EventBusService registered");
    _bus.post(EventId::SystemStarted, nullptr, 0);
}

void EventBusModule::reportDrops_() {
    const uint32_t dropped = _bus.droppedCount();
    if (dropped == lastDropped_) return;

    const uint32_t now = millis();
    if (lastDropWarnMs_ != 0 && (uint32_t)(now - lastDropWarnMs_) < Limits::Bus::DropWarnMinMs) return;
    LOGW("event queue overflow: %lu new drop(s), total=%lu",
         (unsigned long)(dropped - lastDropped_),
         (unsigned long)dropped);
    lastDropped_ = dropped;
    lastDropWarnMs_ = now;
}

void EventBusModule::loop() {
    _bus.dispatch(Limits::Bus::DispatchBatch);
    reportDrops_();
    vTaskDelay(pdMS_TO_TICKS(Limits::Bus::IdleDelayMs));
}
