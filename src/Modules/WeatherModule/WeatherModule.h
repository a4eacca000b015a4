#pragma once
/**
 * @file WeatherModule.h
 * @brief Weather sample ingest, 24h history and location.
 */

#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/ErrorCodes.h"
#include "Core/RuntimeSnapshotProvider.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"
#include "Modules/WeatherModule/PrecipitationCounter.h"
#include "Modules/WeatherModule/WeatherTypes.h"
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

struct WeatherConfig {
    bool enabled = true;
    int32_t minSpacingS = (int32_t)Limits::Weather::DefaultMinSpacingS;
    float latitudeDeg = IrrigationDefaults::LatitudeDefault;
    float longitudeDeg = IrrigationDefaults::LongitudeDefault;
    float elevationM = IrrigationDefaults::ElevationDefaultM;
};

/**
 * @brief Passive module owning the weather input path.
 *
 * Samples arrive through `weather.sample` (MQTT `cmd` or `weather/<kind>`).
 * Each one is range checked, fed to the precipitation counter, and kept in a
 * per-kind ring when it is at least `min_spacing_s` newer than the previous
 * recorded sample of that kind. Precipitation readings that change the
 * counter are always recorded. The `weather` service reads the rings back.
 */
class WeatherModule : public ModulePassive, public IRuntimeSnapshotProvider {
public:
    const char* moduleId() const override { return "weather"; }

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

    uint8_t runtimeSnapshotCount() const override { return 1; }
    const char* runtimeSnapshotSuffix(uint8_t idx) const override;
    bool buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const override;

private:
    struct HistoryEntry {
        float value;
        uint32_t ts;
    };

    struct HistoryRing {
        HistoryEntry entries[Limits::Weather::HistoryPerKind];
        uint16_t head = 0;
        uint16_t count = 0;
    };

    /** @brief Outcome of one ingest call, reported by `weather.sample`. */
    struct IngestResult {
        bool accepted = false;
        bool recorded = false;
        ErrorCode error = ErrorCode::Failed;
        PrecipStepKind precip = PrecipStepKind::First;
        float rainMm = 0.0f;
    };

    bool ingest_(WeatherKind kind, float value, uint32_t epochSec, IngestResult& out);
    bool recordLocked_(WeatherKind kind, float value, uint32_t epochSec);
    uint16_t queryLocked_(WeatherKind kind, uint32_t startSec, uint32_t endSec,
                          WeatherSample* out, uint16_t max) const;
    uint32_t nowEpoch_() const;

    static bool cmdSample_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    bool handleSample_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleStatus_(char* reply, size_t replyLen);

    static uint16_t svcQuery_(void* ctx, WeatherKind kind, uint32_t startSec, uint32_t endSec,
                              WeatherSample* out, uint16_t max);
    static bool svcLocation_(void* ctx, WeatherLocation* out);

    void registerHaEntities_();

    WeatherConfig cfgData_{};

    const LogHubService* logHub_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    const TimeService* timeSvc_ = nullptr;
    const HAService* haSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;

    WeatherService weatherSvc_{ svcQuery_, svcLocation_, this };

    SemaphoreHandle_t historyMutex_ = nullptr;
    HistoryRing history_[WEATHER_KIND_COUNT]{};
    WeatherSample latest_[WEATHER_KIND_COUNT]{};
    bool hasLatest_[WEATHER_KIND_COUNT]{};
    PrecipitationCounter precip_{};
    uint32_t rejectedCount_ = 0;
    uint32_t anomalyCount_ = 0;

    ConfigVariable<bool,0> enabledVar_ {
        NVS_KEY(NvsKeys::Weather::Enabled),"enabled","weather",ConfigType::Bool,
        &cfgData_.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t,0> minSpacingVar_ {
        NVS_KEY(NvsKeys::Weather::MinSpacingS),"min_spacing_s","weather",ConfigType::Int32,
        &cfgData_.minSpacingS,ConfigPersistence::Persistent,0
    };
    ConfigVariable<float,0> latitudeVar_ {
        NVS_KEY(NvsKeys::Weather::Latitude),"latitude","weather",ConfigType::Float,
        &cfgData_.latitudeDeg,ConfigPersistence::Persistent,0
    };
    ConfigVariable<float,0> longitudeVar_ {
        NVS_KEY(NvsKeys::Weather::Longitude),"longitude","weather",ConfigType::Float,
        &cfgData_.longitudeDeg,ConfigPersistence::Persistent,0
    };
    ConfigVariable<float,0> elevationVar_ {
        NVS_KEY(NvsKeys::Weather::Elevation),"elevation_m","weather",ConfigType::Float,
        &cfgData_.elevationM,ConfigPersistence::Persistent,0
    };
};
