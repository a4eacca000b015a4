#pragma once
/**
 * @file TimeModule.h
 * @brief Time synchronization and day-boundary scheduling module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include <time.h>
#include <freertos/FreeRTOS.h>

/** @brief Time sync configuration values. */
struct TimeConfig {
    char server1[40] = "pool.ntp.org";
    char server2[40] = "time.nist.gov";
    char tz[64]      = "CET-1CEST,M3.5.0/2,M10.5.0/3";
    bool enabled = true;
};

/**
 * @brief Active module that synchronizes time over NTP and fires the
 *        system day-start scheduler slot at local midnight.
 *
 * The first evaluation after a successful sync always emits a replayed
 * day-start trigger so a boot that straddled midnight still runs the
 * daily jobs. Consumers are expected to be idempotent per calendar day.
 */
class TimeModule : public Module {
public:
    const char* moduleId() const override { return "time"; }
    const char* taskName() const override { return "time"; }

    /** @brief Depends on log hub, datastore, command and event bus. */
    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "datastore";
        if (i == 2) return "cmd";
        if (i == 3) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief Force a resync attempt. */
    void forceResync();

    /** @brief Local calendar day of an epoch as YYYYMMDD (0 if not convertible). */
    static uint32_t localDateKey(time_t epochSec);

private:
    TimeConfig cfgData{};

    EventBus* eventBus = nullptr;
    DataStore* dataStore = nullptr;

    TimeSyncState state = TimeSyncState::WaitingNetwork;
    uint32_t stateTs = 0;

    ConfigVariable<char,0> server1Var {
        NVS_KEY(NvsKeys::Time::Server1),"server1","time",ConfigType::CharArray,
        (char*)cfgData.server1,ConfigPersistence::Persistent,sizeof(cfgData.server1)
    };
    ConfigVariable<char,0> server2Var {
        NVS_KEY(NvsKeys::Time::Server2),"server2","time",ConfigType::CharArray,
        (char*)cfgData.server2,ConfigPersistence::Persistent,sizeof(cfgData.server2)
    };
    ConfigVariable<char,0> tzVar {
        NVS_KEY(NvsKeys::Time::Tz),"tz","time",ConfigType::CharArray,
        (char*)cfgData.tz,ConfigPersistence::Persistent,sizeof(cfgData.tz)
    };
    ConfigVariable<bool,0> enabledVar {
        NVS_KEY(NvsKeys::Time::Enabled),"enabled","time",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };

    void setState(TimeSyncState s);

    static TimeSyncState svcState(void* ctx);
    static bool svcIsSynced(void* ctx);
    static uint64_t svcEpoch(void* ctx);
    static bool svcFormatLocalTime(void* ctx, char* out, size_t len);
    static uint32_t svcLocalDateKey(void* ctx, uint64_t epochSec);

    static bool cmdResync(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    void tickDayStart_();
    bool postDayStart_(time_t now, bool replayed);

    // ---- network warmup ----
    volatile bool _netReady = false;
    volatile uint32_t _netReadyTs = 0;
    volatile bool _resyncRequested = false;
    volatile bool _tzDirty = false;

    // ---- retry backoff ----
    uint8_t _retryCount = 0;
    uint32_t _retryDelayMs = 2000;

    // ---- day-start slot ----
    uint32_t lastDayKey_ = 0;
    bool dayStartPrimed_ = false;
};
