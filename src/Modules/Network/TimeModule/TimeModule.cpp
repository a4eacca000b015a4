/**
 * @file TimeModule.cpp
 * @brief NTP synchronization state machine and day-start trigger.
 */
#include "TimeModule.h"
#include "Core/Runtime.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include <Arduino.h>
#include <time.h>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#define LOG_TAG "TimeModl"
#include "Core/ModuleLog.h"

// Anything earlier means the RTC was never set.
static constexpr time_t MIN_VALID_EPOCH = (time_t)1609459200; // 2021-01-01

static uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV) {
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

static const char* timeSyncStateStr(TimeSyncState s)
{
    switch (s) {
    case TimeSyncState::Disabled: return "disabled";
    case TimeSyncState::WaitingNetwork: return "waiting_network";
    case TimeSyncState::Syncing: return "syncing";
    case TimeSyncState::Synced: return "synced";
    case TimeSyncState::ErrorWait: return "error_wait";
    default: return "unknown";
    }
}

uint32_t TimeModule::localDateKey(time_t epochSec)
{
    if (epochSec < MIN_VALID_EPOCH) return 0;
    struct tm t;
    if (!localtime_r(&epochSec, &t)) return 0;
    return (uint32_t)(t.tm_year + 1900) * 10000UL +
           (uint32_t)(t.tm_mon + 1) * 100UL +
           (uint32_t)t.tm_mday;
}

void TimeModule::setState(TimeSyncState s) {
    const TimeSyncState prev = state;
    state = s;
    stateTs = millis();

    if (dataStore) {
        setTimeReady(*dataStore, s == TimeSyncState::Synced);
    }

    if (prev != TimeSyncState::Synced && s == TimeSyncState::Synced) {
        // Re-evaluate the day boundary against the freshly synced clock.
        dayStartPrimed_ = false;
    }
}

TimeSyncState TimeModule::svcState(void* ctx) {
    return static_cast<TimeModule*>(ctx)->state;
}

bool TimeModule::svcIsSynced(void* ctx) {
    auto self = static_cast<TimeModule*>(ctx);
    return self->state == TimeSyncState::Synced;
}

uint64_t TimeModule::svcEpoch(void*) {
    time_t now;
    time(&now);
    return (uint64_t)now;
}

bool TimeModule::svcFormatLocalTime(void*, char* out, size_t len) {
    if (!out || len == 0) return false;
    time_t now;
    time(&now);
    if (now < MIN_VALID_EPOCH) return false;
    struct tm t;
    if (!localtime_r(&now, &t)) return false;
    snprintf(out, len, "%04d-%02d-%02d %02d:%02d:%02d",
             t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
             t.tm_hour, t.tm_min, t.tm_sec);
    return true;
}

uint32_t TimeModule::svcLocalDateKey(void*, uint64_t epochSec)
{
    return localDateKey((time_t)epochSec);
}

void TimeModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(server1Var);
    cfg.registerVar(server2Var);
    cfg.registerVar(tzVar);
    cfg.registerVar(enabledVar);

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;

    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore = dsSvc ? dsSvc->store : nullptr;

    if (eventBus) {
        eventBus->subscribe(EventId::DataChanged, &TimeModule::onEventStatic, this);
        eventBus->subscribe(EventId::ConfigChanged, &TimeModule::onEventStatic, this);
    }

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc) {
        cmdSvc->registerHandler(cmdSvc->ctx, "time.resync", cmdResync, this);
        cmdSvc->registerHandler(cmdSvc->ctx, "time.status", cmdStatus, this);
    }

    static TimeService timeSvc{
        svcState,
        svcIsSynced,
        svcEpoch,
        svcFormatLocalTime,
        svcLocalDateKey,
        nullptr
    };
    timeSvc.ctx = this;
    services.add("time", &timeSvc);

    LOGI("Time service registered");

    _netReady = false;
    _netReadyTs = 0;
    _retryCount = 0;
    _retryDelayMs = 2000;
    state = TimeSyncState::WaitingNetwork;
}

void TimeModule::loop() {
    if (!cfgData.enabled) {
        if (state != TimeSyncState::Disabled) setState(TimeSyncState::Disabled);
        vTaskDelay(pdMS_TO_TICKS(2000));
        return;
    }

    if (_resyncRequested) {
        _resyncRequested = false;
        _retryCount = 0;
        _retryDelayMs = 2000;
        setState(_netReady ? TimeSyncState::Syncing : TimeSyncState::WaitingNetwork);
    }

    if (_tzDirty) {
        _tzDirty = false;
        setenv("TZ", cfgData.tz, 1);
        tzset();
        LOGI("TZ applied: %s", cfgData.tz);
    }

    switch (state) {

    case TimeSyncState::WaitingNetwork:
        if (_netReady) {
            constexpr uint32_t WARMUP_MS = 2000;
            if (millis() - _netReadyTs >= WARMUP_MS) {
                LOGI("Network warmup done -> start syncing");
                setState(TimeSyncState::Syncing);
            }
        }
        break;

    case TimeSyncState::Syncing: {
        LOGI("Syncing via NTP...");

        configTzTime(cfgData.tz, cfgData.server1, cfgData.server2);

        struct tm timeinfo;
        if (getLocalTime(&timeinfo, 4000)) {
            char buf[32];
            if (svcFormatLocalTime(this, buf, sizeof(buf))) {
                LOGI("Synced ok: %s", buf);
            }

            _retryCount = 0;
            _retryDelayMs = 2000;

            setState(TimeSyncState::Synced);
        } else {
            LOGW("Sync failed -> retry in %lu ms", (unsigned long)_retryDelayMs);
            setState(TimeSyncState::ErrorWait);
        }
        break;
    }

    case TimeSyncState::ErrorWait:
        if (!_netReady) {
            setState(TimeSyncState::WaitingNetwork);
            break;
        }

        if (millis() - stateTs >= _retryDelayMs) {
            _retryCount++;
            uint32_t next = _retryDelayMs;

            if      (next < 5000)   next = 5000;
            else if (next < 10000)  next = 10000;
            else if (next < 30000)  next = 30000;
            else if (next < 60000)  next = 60000;
            else                    next = 300000;

            _retryDelayMs = clampU32(next, 2000, 300000);
            setState(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Synced:
        if (_netReady && (millis() - stateTs > 6UL * 3600UL * 1000UL)) {
            setState(TimeSyncState::Syncing);
        }
        break;

    case TimeSyncState::Disabled:
        setState(TimeSyncState::WaitingNetwork);
        break;
    }

    tickDayStart_();
    vTaskDelay(pdMS_TO_TICKS(250));
}

void TimeModule::forceResync() {
    if (!cfgData.enabled) return;
    _resyncRequested = true;
}

bool TimeModule::cmdResync(void* userCtx,
                           const CommandRequest&,
                           char* reply,
                           size_t replyLen)
{
    TimeModule* self = (TimeModule*)userCtx;
    if (!self->cfgData.enabled) {
        writeErrorJson(reply, replyLen, ErrorCode::Disabled, "time.resync");
        return false;
    }
    self->forceResync();
    writeOkJson(reply, replyLen, "time.resync");
    return true;
}

bool TimeModule::cmdStatus(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    TimeModule* self = (TimeModule*)userCtx;
    char now[32] = {0};
    if (!svcFormatLocalTime(self, now, sizeof(now))) {
        snprintf(now, sizeof(now), "n/a");
    }
    time_t epoch;
    time(&epoch);
    const int wrote = snprintf(reply, replyLen,
             "{\"ok\":true,\"state\":\"%s\",\"synced\":%s,\"now\":\"%s\",\"date\":%lu,\"tz\":\"%s\"}",
             timeSyncStateStr(self->state),
             (self->state == TimeSyncState::Synced) ? "true" : "false",
             now,
             (unsigned long)localDateKey(epoch),
             self->cfgData.tz);
    return wrote > 0 && (size_t)wrote < replyLen;
}

void TimeModule::onEventStatic(const Event& e, void* user)
{
    static_cast<TimeModule*>(user)->onEvent(e);
}

void TimeModule::onEvent(const Event& e)
{
    if (e.id == EventId::DataChanged) {
        if (!e.payload || e.len < sizeof(DataChangedPayload)) return;
        const DataChangedPayload* p = (const DataChangedPayload*)e.payload;
        if (p->id != DataKeys::WifiReady) return;
        if (!dataStore) return;

        const bool ready = wifiReady(*dataStore);
        if (ready == _netReady) return;

        _netReady = ready;
        _netReadyTs = millis();
        LOGI("networkReady=%s", ready ? "true" : "false");
        return;
    }

    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;

        if (strcmp(p->nvsKey, tzVar.nvsKey) == 0) {
            _tzDirty = true;
        } else if (strcmp(p->nvsKey, server1Var.nvsKey) == 0 ||
                   strcmp(p->nvsKey, server2Var.nvsKey) == 0) {
            forceResync();
        }
        return;
    }
}

bool TimeModule::postDayStart_(time_t now, bool replayed)
{
    if (!eventBus) return false;

    SchedulerEventTriggeredPayload p{};
    p.slot = TIME_SLOT_SYS_DAY_START;
    p.edge = (uint8_t)SchedulerEdge::Trigger;
    p.replayed = replayed ? 1 : 0;
    p.eventId = TIME_EVENT_SYS_DAY_START;
    p.epochSec = (uint32_t)now;

    if (!eventBus->post(EventId::SchedulerEventTriggered, &p, sizeof(p))) {
        LOGW("day-start post failed (queue full), retrying");
        return false;
    }
    LOGI("day-start %s date=%lu", replayed ? "replayed" : "triggered", (unsigned long)localDateKey(now));
    return true;
}

void TimeModule::tickDayStart_()
{
    if (state != TimeSyncState::Synced) return;

    time_t now;
    time(&now);
    const uint32_t dayKey = localDateKey(now);
    if (dayKey == 0) return;

    if (!dayStartPrimed_) {
        if (!postDayStart_(now, true)) return;
        dayStartPrimed_ = true;
        lastDayKey_ = dayKey;
        return;
    }

    if (dayKey < lastDayKey_) {
        // Clock stepped backwards across midnight: follow it without firing.
        lastDayKey_ = dayKey;
        return;
    }
    if (dayKey == lastDayKey_) return;

    if (postDayStart_(now, false)) {
        lastDayKey_ = dayKey;
    }
}
