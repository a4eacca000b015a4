#pragma once
/**
 * @file ValveModule.h
 * @brief One GPIO driven irrigation valve per zone.
 */

#include "Core/Module.h"
#include "Core/ErrorCodes.h"
#include "Core/RuntimeSnapshotProvider.h"
#include "Core/Services/Services.h"
#include "Core/CommandRegistry.h"
#include "Core/ConfigTypes.h"
#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"
#include "Modules/ValveModule/ValveEdgeQueue.h"
#include "Modules/ValveModule/ValveModuleDataModel.h"
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

enum ValveSetStatus : uint8_t {
    VALVE_SET_OK = 0,
    VALVE_SET_ERR_UNKNOWN_ZONE = 1,
    VALVE_SET_ERR_NOT_READY = 2,
    VALVE_SET_ERR_UNASSIGNED = 3
};

struct ValveConfig {
    int32_t pin = -1;          // -1 means "no valve wired for this zone"
    bool activeHigh = true;
    int32_t maxOnS = IrrigationDefaults::ValveMaxOnDefaultS;  // 0 means "no cutoff"
};

/**
 * @brief Drives zone valves and reports every transition on the EventBus.
 *
 * `ValveChanged` is the only input of the irrigation runtime tracker, so every
 * open/close goes through `setValve_`, including the max-on safety cutoff.
 * An edge the event queue refuses is kept and re-posted in order by `loop`.
 */
class ValveModule : public Module, public IRuntimeSnapshotProvider {
public:
    const char* moduleId() const override { return "valves"; }
    const char* taskName() const override { return "valves"; }
    BaseType_t taskCore() const override { return 1; }

    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "cmd";
        if (i == 4) return "time";
        if (i == 5) return "ha";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint8_t runtimeSnapshotCount() const override { return snapshotCount_; }
    const char* runtimeSnapshotSuffix(uint8_t idx) const override;
    bool buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const override;

private:
    struct ValveSlot {
        ValveConfig cfg{};
        int32_t appliedPin = -1;
        bool appliedActiveHigh = true;
        bool on = false;
        bool forced = false;
        uint32_t onSinceMs = 0;
        uint32_t tsMs = 0;
    };

    static bool cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    bool handleSet_(const CommandRequest& req, char* reply, size_t replyLen);

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);

    ValveSetStatus setValve_(uint8_t zone, bool on, bool forced);
    bool applyPin_(uint8_t zone);
    void writeLevel_(const ValveSlot& s, bool on) const;
    void publishState_(uint8_t zone, const ValveSlot& s);
    void enforceMaxOn_(uint32_t nowMs);
    void postEdgeLocked_(const ValveChangedPayload& p);
    void flushPendingEdges_();
    void applyPendingReconfig_();
    uint32_t nowEpoch_() const;
    void registerHaEntities_();

    const LogHubService* logHub_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    const TimeService* timeSvc_ = nullptr;
    const HAService* haSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;

    SemaphoreHandle_t valveMutex_ = nullptr;
    ValveEdgeQueue pendingEdges_{};  // guarded by valveMutex_
    portMUX_TYPE reconfigMux_ = portMUX_INITIALIZER_UNLOCKED;
    uint8_t reconfigPendingMask_ = 0;

    ValveSlot slots_[Limits::Irrigation::MaxZones]{};
    uint8_t snapshotZones_[Limits::Irrigation::MaxZones]{};
    uint8_t snapshotCount_ = 0;

    char cfgModuleName_[Limits::Irrigation::MaxZones][16]{};
    char nvsPinKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsActiveHighKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsMaxOnKey_[Limits::Irrigation::MaxZones][16]{};
    ConfigVariable<int32_t,0> cfgPinVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<bool,0> cfgActiveHighVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<int32_t,0> cfgMaxOnVar_[Limits::Irrigation::MaxZones]{};

    // HA keeps the entry pointers, so the strings live here.
    char haObjectId_[Limits::Irrigation::MaxZones][16]{};
    char haName_[Limits::Irrigation::MaxZones][24]{};
    char haStateTopic_[Limits::Irrigation::MaxZones][20]{};
    char haPayloadOn_[Limits::Irrigation::MaxZones][72]{};
    char haPayloadOff_[Limits::Irrigation::MaxZones][72]{};
};
