#pragma once
/**
 * @file IrrigationModule.h
 * @brief Per-zone water balance: rain, irrigation runs and daily ET.
 */

#include "Core/Module.h"
#include "Core/ErrorCodes.h"
#include "Core/RuntimeSnapshotProvider.h"
#include "Core/Services/Services.h"
#include "Core/CommandRegistry.h"
#include "Core/ConfigTypes.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"
#include "Modules/IrrigationModule/DateKey.h"
#include "Modules/IrrigationModule/EtCalculator.h"
#include "Modules/IrrigationModule/IrrigationModuleDataModel.h"
#include "Modules/IrrigationModule/RunEligibility.h"
#include "Modules/IrrigationModule/RuntimeTracker.h"
#include "Modules/IrrigationModule/ZoneConfig.h"
#include "Modules/IrrigationModule/ZoneLedger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

    float rateMmH = IrrigationDefaults::PrecipRateDefaultMmH;
    float kc = IrrigationDefaults::KcDefault;
    int32_t minRuntimeS = IrrigationDefaults::MinRuntimeDefaultS;
    int32_t maxRuntimeS = IrrigationDefaults::MaxRuntimeDefaultS;
    int32_t minIntervalS = IrrigationDefaults::MinIntervalDefaultS;
};

struct IrrigationConfig {
    bool enabled = true;
    uint8_t zoneCount = IrrigationDefaults::ZoneCountDefault;
};

/** @brief Outcome of one run of the daily ET pipeline. */
struct EtJobSummary {
    bool computed = false;
    uint32_t dateKey = 0;
    EtResult et{};
    uint16_t samples = 0;
    uint8_t applied = 0;
    uint8_t alreadyApplied = 0;
    uint8_t ignored = 0;
};

/**
 * @brief Owns the zone ledgers and the daily ET job.
 *
 * Rain and valve events mutate a zone under its own critical section. The ET
 * pipeline (history query, aggregation, formulas) runs outside any zone lock;
 * only `ZoneLedger::applyEt` is called under it. Each zone persists a small
 * blob so balance and the ET date guard survive restarts.
 */
class IrrigationModule : public Module, public IRuntimeSnapshotProvider {
public:
    const char* moduleId() const override { return "irrigation"; }
    const char* taskName() const override { return "irrigation"; }
    BaseType_t taskCore() const override { return 1; }
    uint16_t taskStackSize() const override { return Limits::Irrigation::TaskStackSize; }

    uint8_t dependencyCount() const override { return 8; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "cmd";
        if (i == 4) return "time";
        if (i == 5) return "weather";
        if (i == 6) return "ha";
        if (i == 7) return "valves";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** Day-start jobs wait for this (boot orchestrator in `main.cpp`). */
    void setStartupReady(bool ready) { startupReady_ = ready; }

    uint8_t runtimeSnapshotCount() const override { return (uint8_t)(zoneCount_ + 1U); }
    const char* runtimeSnapshotSuffix(uint8_t idx) const override;
    bool buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const override;

private:
    static constexpr uint8_t ALL_ZONES = 0xFF;
    static constexpr uint32_t ELIGIBILITY_REFRESH_MS = 30000U;

    struct ZoneState {
        ZoneConfig cfg{};
        ZoneLedger ledger{};
        RuntimeTracker tracker{};
        mutable portMUX_TYPE mux = portMUX_INITIALIZER_UNLOCKED;

        uint32_t runtimeTodaySec = 0;
        float lastIrrigationMm = 0.0f;
        uint32_t lastOffEpoch = 0;
        float lastRainMm = 0.0f;
        uint32_t lastRainEpoch = 0;
        uint8_t lastMethod = 0;
        float lastEt0Mm = 0.0f;

        bool persistDirty = false;
        bool persistImmediate = false;
        uint32_t lastPersistMs = 0;
    };

    /** Copy of the mutable zone fields taken under the zone lock. */
    struct ZoneView {
        float balanceMm = 0.0f;
        uint32_t lastEtDate = 0;
        float lastEtMm = 0.0f;
        uint32_t runtimeTodaySec = 0;
        float lastIrrigationMm = 0.0f;
        uint32_t lastOffEpoch = 0;
        float lastRainMm = 0.0f;
        uint32_t lastRainEpoch = 0;
        uint8_t lastMethod = 0;
        float lastEt0Mm = 0.0f;
        bool runOpen = false;
        ZoneConfig cfg{};
    };

    static bool cmdCalculateEt_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSetBalance_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdForecast_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    bool handleCalculateEt_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleSetBalance_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleForecast_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleStatus_(const CommandRequest& req, char* reply, size_t replyLen);
    bool writeZoneStatus_(uint8_t zone, char* reply, size_t replyLen) const;

    static void onEventStatic_(const Event& e, void* user);
    void onEvent_(const Event& e);
    void onRainfall_(const RainfallMeasuredPayload& p);
    void onValveChanged_(const ValveChangedPayload& p);

    bool runEtJob_(uint32_t nowEpoch, uint8_t zoneFilter, bool force, EtJobSummary& out, ErrorCode& errOut);
    void recordJob_(bool computed, const EtJobSummary& s);
    void runPendingDayStart_();
    void resetRuntimeToday_(bool replayed, uint32_t nowEpoch);

    ZoneView viewZone_(uint8_t zone) const;
    void evaluateZone_(uint8_t zone, const ZoneView& v, uint32_t nowEpoch, float forecastMm,
                       RunEligibilityOutput& out) const;
    void markZoneDirty_(uint8_t zone);
    void markAllZonesDirty_();
    void refreshZones_(uint32_t nowMs);
    void publishDaily_();
    void applyZoneConfig_(uint8_t zone);
    void persistZoneConfigFixes_(uint8_t zone, const ZoneConfig& c, uint8_t fixed);

    bool loadLedger_(uint8_t zone);
    void clearRemovedZones_();
    bool persistLedger_(uint8_t zone, uint32_t nowMs);
    void persistDirtyZones_(uint32_t nowMs);

    uint32_t nowEpoch_() const;
    uint32_t dateKeyOf_(uint32_t epochSec) const;
    void registerHaEntities_();

    IrrigationConfig cfgData_{};
    uint8_t zoneCount_ = 0;

    const LogHubService* logHub_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    const TimeService* timeSvc_ = nullptr;
    const WeatherService* weatherSvc_ = nullptr;
    const HAService* haSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    ConfigStore* cfgStore_ = nullptr;

    volatile bool startupReady_ = false;
    mutable portMUX_TYPE stateMux_ = portMUX_INITIALIZER_UNLOCKED;
    uint8_t zoneDirtyMask_ = 0;
    bool dayStartPending_ = false;
    bool dayStartReplayed_ = false;
    bool zoneConfigDirty_ = false;
    float forecastRainMm_ = 0.0f;
    IrrigationDailyEntry daily_{};
    bool dailyDirty_ = true;
    uint32_t lastRefreshMs_ = 0;

    // History copy for the ET job, guarded by jobMutex_.
    SemaphoreHandle_t jobMutex_ = nullptr;
    WeatherSample sampleBuf_[Limits::Weather::HistoryPerKind * WEATHER_KIND_COUNT]{};

    ZoneState zones_[Limits::Irrigation::MaxZones]{};

    ConfigVariable<bool,0> enabledVar_ {
        NVS_KEY(NvsKeys::Irrigation::Enabled),"enabled","irrigation",ConfigType::Bool,
        &cfgData_.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t,0> zoneCountVar_ {
        NVS_KEY(NvsKeys::Irrigation::ZoneCount),"zone_count","irrigation",ConfigType::UInt8,
        &cfgData_.zoneCount,ConfigPersistence::Persistent,0
    };

    char cfgModuleName_[Limits::Irrigation::MaxZones][16]{};
    char cfgLedgerModuleName_[Limits::Irrigation::MaxZones][16]{};
    char nvsNameKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsRateKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsKcKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsMinRuntimeKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsMaxRuntimeKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsMinIntervalKey_[Limits::Irrigation::MaxZones][16]{};
    char nvsLedgerKey_[Limits::Irrigation::MaxZones][16]{};
    char ledgerBlob_[Limits::Irrigation::MaxZones][Limits::Irrigation::LedgerBlobLen]{};
    // ConfigStore writes land here; the live copy in ZoneState is replaced
    // under the zone lock once validated.
    ZoneConfig cfgStage_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<char,0> cfgNameVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<float,0> cfgRateVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<float,0> cfgKcVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<int32_t,0> cfgMinRuntimeVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<int32_t,0> cfgMaxRuntimeVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<int32_t,0> cfgMinIntervalVar_[Limits::Irrigation::MaxZones]{};
    ConfigVariable<char,0> cfgLedgerVar_[Limits::Irrigation::MaxZones]{};

    // HA keeps the entry pointers, so the strings live here.
    struct HaZoneStrings {
        char stateTopic[24];
        char balanceId[24];
        char requiredId[24];
        char recommendedId[28];
        char lastEtId[24];
        char canRunId[24];
        char balanceName[40];
        char requiredName[48];
        char recommendedName[48];
        char lastEtName[40];
        char canRunName[40];
        char balanceCmdTpl[128];
    };
    HaZoneStrings haStrings_[Limits::Irrigation::MaxZones]{};
};
