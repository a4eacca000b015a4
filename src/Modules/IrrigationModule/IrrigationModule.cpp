/**
 * @file IrrigationModule.cpp
 * @brief Implementation file.
 */

#include "IrrigationModule.h"
#include "Core/DataStore/DataStore.h"
#include "Core/MqttTopics.h"
#define LOG_TAG "IrrigMod"
#include "Core/ModuleLog.h"
#include "Modules/IrrigationModule/IrrigationRuntime.h"
#include "Modules/IrrigationModule/RunEligibility.h"
#include "Modules/ValveModule/ValveRuntime.h"
#include "Modules/WeatherModule/WeatherAggregator.h"
#include <ArduinoJson.h>
#include <Arduino.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

static bool parseCmdArgsObject_(const CommandRequest& req, JsonObjectConst& outObj)
{
    static StaticJsonDocument<Limits::Irrigation::JsonCmdBuf> doc;

    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        outObj = doc.as<JsonObjectConst>();
        return true;
    }

    if (req.json && req.json[0] != '\0' && req.args != req.json) {
        doc.clear();
        const DeserializationError rootErr = deserializeJson(doc, req.json);
        if (rootErr || !doc.is<JsonObjectConst>()) return false;
        JsonVariantConst argsVar = doc["args"];
        if (argsVar.is<JsonObjectConst>()) {
            outObj = argsVar.as<JsonObjectConst>();
            return true;
        }
    }

    return false;
}

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

static void writeCmdErrorZone_(char* reply, size_t replyLen, const char* where, ErrorCode code, uint8_t zone)
{
    if (!writeErrorJsonWithZone(reply, replyLen, code, where, zone)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

static bool readFloatArg_(JsonVariantConst v, float& out)
{
    if (v.is<float>() || v.is<double>() || v.is<int32_t>() || v.is<uint32_t>()) {
        out = v.as<float>();
        return isfinite(out);
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (!s || s[0] == '\0') return false;
        char* end = nullptr;
        out = strtof(s, &end);
        return end && *end == '\0' && isfinite(out);
    }
    return false;
}

static const char* jobOutcomeStr_(uint8_t outcome)
{
    switch (outcome) {
        case IRRIGATION_JOB_APPLIED: return "applied";
        case IRRIGATION_JOB_SKIPPED: return "skipped";
        default: return "none";
    }
}

uint32_t IrrigationModule::nowEpoch_() const
{
    if (!timeSvc_ || !timeSvc_->isSynced || !timeSvc_->epoch) return 0;
    if (!timeSvc_->isSynced(timeSvc_->ctx)) return 0;
    return (uint32_t)timeSvc_->epoch(timeSvc_->ctx);
}

uint32_t IrrigationModule::dateKeyOf_(uint32_t epochSec) const
{
    if (epochSec == 0 || !timeSvc_ || !timeSvc_->localDateKey) return 0;
    return timeSvc_->localDateKey(timeSvc_->ctx, (uint64_t)epochSec);
}

IrrigationModule::ZoneView IrrigationModule::viewZone_(uint8_t zone) const
{
    ZoneView v{};
    if (zone >= Limits::Irrigation::MaxZones) return v;
    const ZoneState& z = zones_[zone];
    portENTER_CRITICAL(&z.mux);
    v.balanceMm = z.ledger.balanceMm();
    v.lastEtDate = z.ledger.lastEtDate();
    v.lastEtMm = z.ledger.lastEtMm();
    v.runtimeTodaySec = z.runtimeTodaySec;
    v.lastIrrigationMm = z.lastIrrigationMm;
    v.lastOffEpoch = z.lastOffEpoch;
    v.lastRainMm = z.lastRainMm;
    v.lastRainEpoch = z.lastRainEpoch;
    v.lastMethod = z.lastMethod;
    v.lastEt0Mm = z.lastEt0Mm;
    v.runOpen = z.tracker.isOpen();
    v.cfg = z.cfg;
    portEXIT_CRITICAL(&z.mux);
    return v;
}

void IrrigationModule::markZoneDirty_(uint8_t zone)
{
    if (zone >= Limits::Irrigation::MaxZones) return;
    portENTER_CRITICAL(&stateMux_);
    zoneDirtyMask_ |= (uint8_t)(1u << zone);
    portEXIT_CRITICAL(&stateMux_);
}

void IrrigationModule::markAllZonesDirty_()
{
    portENTER_CRITICAL(&stateMux_);
    zoneDirtyMask_ = 0xFF;
    portEXIT_CRITICAL(&stateMux_);
}

void IrrigationModule::persistZoneConfigFixes_(uint8_t zone, const ZoneConfig& c, uint8_t fixed)
{
    if (!cfgStore_) return;
    bool ok = true;
    if (fixed & ZONE_CFG_FIX_RATE) ok = cfgStore_->set(cfgRateVar_[zone], c.rateMmH) && ok;
    if (fixed & ZONE_CFG_FIX_KC) ok = cfgStore_->set(cfgKcVar_[zone], c.kc) && ok;
    if (fixed & ZONE_CFG_FIX_MIN_RUNTIME) ok = cfgStore_->set(cfgMinRuntimeVar_[zone], c.minRuntimeS) && ok;
    if (fixed & ZONE_CFG_FIX_MAX_RUNTIME) ok = cfgStore_->set(cfgMaxRuntimeVar_[zone], c.maxRuntimeS) && ok;
    if (fixed & ZONE_CFG_FIX_MIN_INTERVAL) ok = cfgStore_->set(cfgMinIntervalVar_[zone], c.minIntervalS) && ok;
    if (fixed & ZONE_CFG_FIX_NAME) ok = cfgStore_->set(cfgNameVar_[zone], c.name) && ok;
    if (!ok) LOGW("Zone %u corrected config not persisted", (unsigned)zone);
}

void IrrigationModule::applyZoneConfig_(uint8_t zone)
{
    if (zone >= Limits::Irrigation::MaxZones) return;
    ZoneConfig c = cfgStage_[zone];
    const uint8_t fixed = sanitizeZoneConfig(c, zone);
    if (fixed != ZONE_CFG_FIX_NONE) {
        LOGW("Zone %u config corrected (fix=0x%02x) rate=%.2fmm/h kc=%.2f min=%lds max=%lds interval=%lds",
             (unsigned)zone, (unsigned)fixed, (double)c.rateMmH, (double)c.kc,
             (long)c.minRuntimeS, (long)c.maxRuntimeS, (long)c.minIntervalS);
        persistZoneConfigFixes_(zone, c, fixed);
    }

    ZoneState& z = zones_[zone];
    portENTER_CRITICAL(&z.mux);
    z.cfg = c;
    portEXIT_CRITICAL(&z.mux);
}

bool IrrigationModule::loadLedger_(uint8_t zone)
{
    if (zone >= zoneCount_) return false;
    ZoneState& z = zones_[zone];

    ZoneLedgerRecord rec{};
    const LedgerDecodeResult res = decodeLedgerRecord(ledgerBlob_[zone], rec);
    if (res == LedgerDecodeResult::Empty) return false;
    if (res != LedgerDecodeResult::Ok) {
        LOGW("Zone %u ledger blob rejected (%s)", (unsigned)zone, ledgerDecodeResultStr(res));
        return false;
    }

    // The tracker starts closed: a run open at restart is not credited.
    portENTER_CRITICAL(&z.mux);
    z.ledger.restore(rec.balanceMm, rec.lastEtDate, rec.lastEtMm);
    z.runtimeTodaySec = rec.runtimeTodaySec;
    z.lastOffEpoch = rec.lastOffEpoch;
    if (rec.runOpen) {
        z.persistDirty = true;
        z.persistImmediate = true;
    }
    portEXIT_CRITICAL(&z.mux);

    if (rec.runOpen) {
        LOGW("Zone %u valve was open at restart, incomplete run discarded", (unsigned)zone);
    }
    LOGI("Zone %u restored balance=%.2fmm last_et=%lu",
         (unsigned)zone, (double)rec.balanceMm, (unsigned long)rec.lastEtDate);
    return true;
}

void IrrigationModule::clearRemovedZones_()
{
    if (!cfgStore_) return;
    const uint8_t mask = removedZoneMask(zoneCount_, Limits::Irrigation::MaxZones);
    for (uint8_t i = 0; i < Limits::Irrigation::MaxZones; ++i) {
        if ((mask & (uint8_t)(1u << i)) == 0) continue;
        if (ledgerBlob_[i][0] == '\0') continue;
        if (cfgStore_->set(cfgLedgerVar_[i], "")) {
            LOGI("Zone %u removed, saved ledger cleared", (unsigned)i);
        } else {
            LOGW("Zone %u removed, ledger clear failed", (unsigned)i);
        }
    }
}

bool IrrigationModule::persistLedger_(uint8_t zone, uint32_t nowMs)
{
    if (zone >= zoneCount_ || !cfgStore_) return false;
    ZoneState& z = zones_[zone];

    portENTER_CRITICAL(&z.mux);
    z.persistDirty = false;
    z.persistImmediate = false;
    portEXIT_CRITICAL(&z.mux);
    z.lastPersistMs = nowMs;

    const ZoneView v = viewZone_(zone);
    ZoneLedgerRecord rec{};
    rec.balanceMm = v.balanceMm;
    rec.lastEtDate = v.lastEtDate;
    rec.lastEtMm = v.lastEtMm;
    rec.runtimeTodaySec = v.runtimeTodaySec;
    rec.lastOffEpoch = v.lastOffEpoch;
    rec.runOpen = v.runOpen;
    char encoded[sizeof(ledgerBlob_[0])] = {0};
    if (!encodeLedgerRecord(rec, encoded, sizeof(encoded))) {
        LOGW("Zone %u ledger persist failed", (unsigned)zone);
        return false;
    }
    if (strcmp(encoded, ledgerBlob_[zone]) == 0) return true;
    if (!cfgStore_->set(cfgLedgerVar_[zone], encoded)) {
        LOGW("Zone %u ledger write failed", (unsigned)zone);
        portENTER_CRITICAL(&z.mux);
        z.persistDirty = true;
        portEXIT_CRITICAL(&z.mux);
        return false;
    }
    return true;
}

void IrrigationModule::persistDirtyZones_(uint32_t nowMs)
{
    for (uint8_t i = 0; i < zoneCount_; ++i) {
        ZoneState& z = zones_[i];
        bool dirty = false;
        bool immediate = false;
        portENTER_CRITICAL(&z.mux);
        dirty = z.persistDirty;
        immediate = z.persistImmediate;
        portEXIT_CRITICAL(&z.mux);
        if (!dirty) continue;
        if (!immediate && (uint32_t)(nowMs - z.lastPersistMs) < Limits::Irrigation::PersistMinIntervalMs) continue;
        (void)persistLedger_(i, nowMs);
    }
}

void IrrigationModule::onEventStatic_(const Event& e, void* user)
{
    if (!user) return;
    static_cast<IrrigationModule*>(user)->onEvent_(e);
}

void IrrigationModule::onEvent_(const Event& e)
{
    if (e.id == EventId::RainfallMeasured) {
        if (!e.payload || e.len < sizeof(RainfallMeasuredPayload)) return;
        onRainfall_(*(const RainfallMeasuredPayload*)e.payload);
        return;
    }

    if (e.id == EventId::ValveChanged) {
        if (!e.payload || e.len < sizeof(ValveChangedPayload)) return;
        onValveChanged_(*(const ValveChangedPayload*)e.payload);
        return;
    }

    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        if (strcmp(p->nvsKey, NvsKeys::Irrigation::ZoneCount) == 0) {
            LOGI("zone_count change applies after reboot");
            return;
        }
        unsigned zone = 0;
        char tail[6] = {0};
        if (sscanf(p->nvsKey, "zn%u%5s", &zone, tail) != 2) return;
        if (strcmp(tail, "lg") == 0) return;
        portENTER_CRITICAL(&stateMux_);
        zoneConfigDirty_ = true;
        portEXIT_CRITICAL(&stateMux_);
        return;
    }

    if (e.id != EventId::SchedulerEventTriggered) return;
    if (!e.payload || e.len < sizeof(SchedulerEventTriggeredPayload)) return;
    const SchedulerEventTriggeredPayload* p = (const SchedulerEventTriggeredPayload*)e.payload;
    if ((SchedulerEdge)p->edge != SchedulerEdge::Trigger) return;
    if (p->eventId != TIME_EVENT_SYS_DAY_START) return;

    portENTER_CRITICAL(&stateMux_);
    dayStartPending_ = true;
    dayStartReplayed_ = (p->replayed != 0);
    portEXIT_CRITICAL(&stateMux_);
}

void IrrigationModule::onRainfall_(const RainfallMeasuredPayload& p)
{
    if (!isfinite(p.mm) || p.mm <= 0.0f) return;
    for (uint8_t i = 0; i < zoneCount_; ++i) {
        ZoneState& z = zones_[i];
        portENTER_CRITICAL(&z.mux);
        (void)z.ledger.addRain(p.mm);
        z.lastRainMm = p.mm;
        z.lastRainEpoch = p.epochSec;
        z.persistDirty = true;
        portEXIT_CRITICAL(&z.mux);
        markZoneDirty_(i);
    }
    LOGI("Rain %.2fmm added to %u zones", (double)p.mm, (unsigned)zoneCount_);
}

void IrrigationModule::onValveChanged_(const ValveChangedPayload& p)
{
    if (p.zone >= zoneCount_) return;
    ZoneState& z = zones_[p.zone];

    RunEdgeResult edge = RunEdgeResult::IgnoredOff;
    IrrigationRun run{};
    portENTER_CRITICAL(&z.mux);
    if (p.on) {
        edge = z.tracker.valveOn(p.tsMs);
    } else {
        edge = z.tracker.valveOff(p.tsMs, z.cfg.rateMmH, run);
        if (edge == RunEdgeResult::Closed) {
            (void)z.ledger.addIrrigation(run.waterMm);
            z.runtimeTodaySec += (uint32_t)lroundf(run.durationSec);
            z.lastIrrigationMm = run.waterMm;
            if (p.epochSec != 0) z.lastOffEpoch = p.epochSec;
        }
    }
    z.persistDirty = true;
    z.persistImmediate = true;
    portEXIT_CRITICAL(&z.mux);
    markZoneDirty_(p.zone);

    if (edge == RunEdgeResult::Closed) {
        LOGI("Zone %u run %.0fs -> +%.2fmm%s",
             (unsigned)p.zone, (double)run.durationSec, (double)run.waterMm, p.forced ? " (cutoff)" : "");
    } else if (edge == RunEdgeResult::Extended) {
        LOGW("Zone %u duplicate valve open, run extended", (unsigned)p.zone);
    } else if (edge == RunEdgeResult::Opened) {
        LOGI("Zone %u run started", (unsigned)p.zone);
    }
}

bool IrrigationModule::runEtJob_(uint32_t nowEpoch, uint8_t zoneFilter, bool force, EtJobSummary& out, ErrorCode& errOut)
{
    out = EtJobSummary{};
    errOut = ErrorCode::NotReady;
    if (nowEpoch < IrrigationDefaults::DaySeconds) return false;
    if (!weatherSvc_ || !weatherSvc_->query) return false;
    if (!jobMutex_ || xSemaphoreTake(jobMutex_, pdMS_TO_TICKS(1000)) != pdTRUE) return false;

    const uint32_t windowStart = nowEpoch - IrrigationDefaults::DaySeconds;
    const uint32_t windowEnd = nowEpoch;
    out.dateKey = previousDateKey(dateKeyOf_(nowEpoch));
    if (out.dateKey == 0) {
        xSemaphoreGive(jobMutex_);
        return false;
    }

    size_t total = 0;
    for (uint8_t k = 0; k < WEATHER_KIND_COUNT; ++k) {
        const size_t room = (sizeof(sampleBuf_) / sizeof(sampleBuf_[0])) - total;
        const uint16_t max = (room > Limits::Weather::HistoryPerKind) ? Limits::Weather::HistoryPerKind : (uint16_t)room;
        total += weatherSvc_->query(weatherSvc_->ctx, (WeatherKind)k, windowStart, windowEnd, &sampleBuf_[total], max);
    }
    out.samples = (uint16_t)total;

    DailyWeatherAggregate agg{};
    (void)aggregateDailyWeather(sampleBuf_, total, windowStart, windowEnd, agg);

    EtLocation loc{};
    WeatherLocation wl{};
    if (weatherSvc_->location && weatherSvc_->location(weatherSvc_->ctx, &wl)) {
        loc.latitudeDeg = wl.latitudeDeg;
        loc.longitudeDeg = wl.longitudeDeg;
        loc.elevationM = wl.elevationM;
    } else {
        LOGW("Location invalid, using defaults");
        loc.latitudeDeg = IrrigationDefaults::LatitudeDefault;
        loc.longitudeDeg = IrrigationDefaults::LongitudeDefault;
        loc.elevationM = IrrigationDefaults::ElevationDefaultM;
    }

    out.computed = computeDailyEt0(agg, loc, out.dateKey, out.et);
    xSemaphoreGive(jobMutex_);

    if (!out.computed) {
        for (uint8_t i = 0; i < zoneCount_; ++i) {
            if (zoneFilter != ALL_ZONES && zoneFilter != i) continue;
            LOGW("ET skipped zone=%u date=%lu (temp=%u hum=%u samples)",
                 (unsigned)i, (unsigned long)out.dateKey,
                 (unsigned)agg.count(WeatherKind::Temperature),
                 (unsigned)agg.count(WeatherKind::Humidity));
        }
        errOut = ErrorCode::InsufficientData;
        return false;
    }

    LOGI("ET0 %.2fmm date=%lu method=%s samples=%u",
         (double)out.et.et0Mm, (unsigned long)out.dateKey, etMethodStr(out.et.method), (unsigned)total);

    for (uint8_t i = 0; i < zoneCount_; ++i) {
        if (zoneFilter != ALL_ZONES && zoneFilter != i) continue;
        ZoneState& z = zones_[i];
        portENTER_CRITICAL(&z.mux);
        const float etc = etcFromEt0(out.et.et0Mm, z.cfg.kc);
        const EtApplyResult res = z.ledger.applyEt(out.dateKey, etc, force);
        if (res == EtApplyResult::Applied || res == EtApplyResult::Reapplied) {
            z.lastMethod = (uint8_t)out.et.method;
            z.lastEt0Mm = out.et.et0Mm;
            z.persistDirty = true;
            z.persistImmediate = true;
        }
        const float balance = z.ledger.balanceMm();
        portEXIT_CRITICAL(&z.mux);
        markZoneDirty_(i);

        if (res == EtApplyResult::Applied || res == EtApplyResult::Reapplied) {
            ++out.applied;
            LOGI("Zone %u ETc %.2fmm %s balance=%.2fmm", (unsigned)i, (double)etc, etApplyResultStr(res), (double)balance);
        } else if (res == EtApplyResult::AlreadyApplied) {
            ++out.alreadyApplied;
        } else {
            ++out.ignored;
            LOGW("Zone %u ET not applied (%s)", (unsigned)i, etApplyResultStr(res));
        }

        IrrigationEtAppliedPayload p{};
        p.zone = i;
        p.result = (uint8_t)res;
        p.dateKey = out.dateKey;
        p.etcMm = etc;
        if (eventBus_) (void)eventBus_->post(EventId::IrrigationEtApplied, &p, sizeof(p));
    }
    return true;
}

void IrrigationModule::recordJob_(bool computed, const EtJobSummary& s)
{
    portENTER_CRITICAL(&stateMux_);
    daily_.lastJobDate = s.dateKey;
    daily_.lastJobOutcome = computed ? IRRIGATION_JOB_APPLIED : IRRIGATION_JOB_SKIPPED;
    daily_.lastJobMethod = computed ? (uint8_t)s.et.method : (uint8_t)EtMethod::None;
    daily_.lastJobEt0Mm = computed ? s.et.et0Mm : 0.0f;
    dailyDirty_ = true;
    portEXIT_CRITICAL(&stateMux_);
}

void IrrigationModule::resetRuntimeToday_(bool replayed, uint32_t nowEpoch)
{
    const uint32_t today = dateKeyOf_(nowEpoch);
    for (uint8_t i = 0; i < zoneCount_; ++i) {
        ZoneState& z = zones_[i];
        const ZoneView v = viewZone_(i);
        // A replayed day start after a reboot keeps today's counter.
        const uint32_t lastOffDate = dateKeyOf_(v.lastOffEpoch);
        if (replayed && lastOffDate != 0 && lastOffDate == today) continue;
        if (v.runtimeTodaySec == 0) continue;

        portENTER_CRITICAL(&z.mux);
        z.runtimeTodaySec = 0;
        z.persistDirty = true;
        portEXIT_CRITICAL(&z.mux);
        markZoneDirty_(i);
    }
}

void IrrigationModule::runPendingDayStart_()
{
    if (!startupReady_) return;

    bool pending = false;
    bool replayed = false;
    portENTER_CRITICAL(&stateMux_);
    pending = dayStartPending_;
    replayed = dayStartReplayed_;
    dayStartPending_ = false;
    portEXIT_CRITICAL(&stateMux_);
    if (!pending) return;

    const uint32_t now = nowEpoch_();
    if (now == 0) {
        LOGW("Day start without time sync, ET job skipped");
        return;
    }

    resetRuntimeToday_(replayed, now);

    if (!cfgData_.enabled) {
        LOGI("Day start: irrigation disabled, ET job skipped");
        return;
    }

    EtJobSummary s{};
    ErrorCode err = ErrorCode::Failed;
    const bool ok = runEtJob_(now, ALL_ZONES, false, s, err);
    if (!ok && err == ErrorCode::NotReady) {
        LOGW("Day start ET job not ready");
        return;
    }
    recordJob_(ok, s);
    LOGI("Day start%s: date=%lu applied=%u already=%u",
         replayed ? " (replayed)" : "",
         (unsigned long)s.dateKey, (unsigned)s.applied, (unsigned)s.alreadyApplied);
}

void IrrigationModule::evaluateZone_(uint8_t zone, const ZoneView& v, uint32_t nowEpoch, float forecastMm,
                                     RunEligibilityOutput& out) const
{
    const ZoneConfig& c = v.cfg;
    RunEligibilityInput in{};
    in.balanceMm = v.balanceMm;
    in.rateMmH = c.rateMmH;
    in.forecastRainMm = forecastMm;
    in.minRuntimeS = c.minRuntimeS;
    in.maxRuntimeS = c.maxRuntimeS;
    in.minIntervalS = c.minIntervalS;
    in.hasLastOff = (v.lastOffEpoch != 0 && nowEpoch >= v.lastOffEpoch);
    in.secondsSinceLastOff = in.hasLastOff ? (nowEpoch - v.lastOffEpoch) : 0U;
    if (!evaluateRunEligibility(in, out)) {
        out = RunEligibilityOutput{};
    }
}

void IrrigationModule::refreshZones_(uint32_t nowMs)
{
    uint8_t mask = 0;
    bool cfgDirty = false;
    float forecast = 0.0f;
    portENTER_CRITICAL(&stateMux_);
    mask = zoneDirtyMask_;
    cfgDirty = zoneConfigDirty_;
    forecast = forecastRainMm_;
    zoneDirtyMask_ = 0;
    zoneConfigDirty_ = false;
    portEXIT_CRITICAL(&stateMux_);

    if (cfgDirty) {
        for (uint8_t i = 0; i < zoneCount_; ++i) applyZoneConfig_(i);
        mask = 0xFF;
        LOGI("Zone config reloaded");
    }
    // Min interval elapses with time alone.
    if ((uint32_t)(nowMs - lastRefreshMs_) >= ELIGIBILITY_REFRESH_MS) {
        mask = 0xFF;
    }
    if (mask == 0 || !dataStore_) return;
    lastRefreshMs_ = nowMs;

    const uint32_t now = nowEpoch_();
    for (uint8_t i = 0; i < zoneCount_; ++i) {
        if ((mask & (uint8_t)(1u << i)) == 0) continue;
        const ZoneView v = viewZone_(i);
        RunEligibilityOutput elig{};
        evaluateZone_(i, v, now, forecast, elig);

        IrrigationZoneRuntimeEntry e{};
        e.valid = true;
        e.balanceMm = v.balanceMm;
        e.requiredRuntimeS = runtimeSecondsForDeficit(v.balanceMm < 0.0f ? -v.balanceMm : 0.0f, v.cfg.rateMmH);
        e.recommendedRuntimeS = elig.recommendedRuntimeS;
        e.canRun = elig.canRun;
        e.blockReason = (uint8_t)elig.reason;
        e.lastEtDate = v.lastEtDate;
        e.lastEtMm = v.lastEtMm;
        e.lastMethod = v.lastMethod;
        e.lastEt0Mm = v.lastEt0Mm;
        e.runtimeTodaySec = v.runtimeTodaySec;
        e.lastIrrigationMm = v.lastIrrigationMm;
        e.lastOffEpoch = v.lastOffEpoch;
        e.lastRainMm = v.lastRainMm;
        e.lastRainEpoch = v.lastRainEpoch;
        e.valveOpen = v.runOpen;
        e.tsMs = nowMs;
        (void)setIrrigationZone(*dataStore_, i, e);
    }
}

void IrrigationModule::publishDaily_()
{
    if (!dataStore_) return;
    IrrigationDailyEntry d{};
    portENTER_CRITICAL(&stateMux_);
    d = daily_;
    d.forecastRainMm = forecastRainMm_;
    dailyDirty_ = false;
    portEXIT_CRITICAL(&stateMux_);

    d.enabled = cfgData_.enabled;
    d.zoneCount = zoneCount_;
    d.tsMs = millis();
    setIrrigationDaily(*dataStore_, d);
}

const char* IrrigationModule::runtimeSnapshotSuffix(uint8_t idx) const
{
    if (idx == 0) return "rt/irrigation/state";
    if (idx > zoneCount_) return nullptr;
    static char suffix[24];
    snprintf(suffix, sizeof(suffix), "rt/irrigation/z%u", (unsigned)(idx - 1U));
    return suffix;
}

bool IrrigationModule::buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const
{
    if (!out || len == 0 || !dataStore_ || idx > zoneCount_) return false;

    if (idx == 0) {
        const IrrigationDailyEntry d = irrigationDaily(*dataStore_);
        const int wrote = snprintf(out, len,
                                   "{\"enabled\":%s,\"zones\":%u,\"forecast_mm\":%.2f,"
                                   "\"last_job\":\"%s\",\"last_job_date\":%lu,\"method\":\"%s\",\"et0_mm\":%.2f,\"ts\":%lu}",
                                   d.enabled ? "true" : "false",
                                   (unsigned)d.zoneCount,
                                   (double)d.forecastRainMm,
                                   jobOutcomeStr_(d.lastJobOutcome),
                                   (unsigned long)d.lastJobDate,
                                   etMethodStr((EtMethod)d.lastJobMethod),
                                   (double)d.lastJobEt0Mm,
                                   (unsigned long)d.tsMs);
        if (wrote < 0 || (size_t)wrote >= len) return false;
        maxTsOut = (d.tsMs == 0U) ? 1U : d.tsMs;
        return true;
    }

    const uint8_t zone = (uint8_t)(idx - 1U);
    IrrigationZoneRuntimeEntry e{};
    if (!irrigationZone(*dataStore_, zone, e) || !e.valid) return false;

    const int wrote = snprintf(out, len,
                               "{\"zone\":%u,\"name\":\"%s\",\"balance_mm\":%.2f,\"required_s\":%.0f,"
                               "\"recommended_s\":%.0f,\"can_run\":%s,\"reason\":\"%s\","
                               "\"last_et_date\":%lu,\"last_et_mm\":%.2f,\"method\":\"%s\",\"et0_mm\":%.2f,"
                               "\"runtime_today_s\":%lu,\"last_irrigation_mm\":%.2f,\"last_off\":%lu,"
                               "\"last_rain_mm\":%.2f,\"valve_open\":%s,\"ts\":%lu}",
                               (unsigned)zone,
                               zones_[zone].cfg.name,
                               (double)e.balanceMm,
                               (double)e.requiredRuntimeS,
                               (double)e.recommendedRuntimeS,
                               e.canRun ? "true" : "false",
                               runBlockReasonStr((RunBlockReason)e.blockReason),
                               (unsigned long)e.lastEtDate,
                               (double)e.lastEtMm,
                               etMethodStr((EtMethod)e.lastMethod),
                               (double)e.lastEt0Mm,
                               (unsigned long)e.runtimeTodaySec,
                               (double)e.lastIrrigationMm,
                               (unsigned long)e.lastOffEpoch,
                               (double)e.lastRainMm,
                               e.valveOpen ? "true" : "false",
                               (unsigned long)e.tsMs);
    if (wrote < 0 || (size_t)wrote >= len) return false;

    maxTsOut = (e.tsMs == 0U) ? 1U : e.tsMs;
    return true;
}

bool IrrigationModule::cmdCalculateEt_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleCalculateEt_(req, reply, replyLen);
}

bool IrrigationModule::cmdSetBalance_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleSetBalance_(req, reply, replyLen);
}

bool IrrigationModule::cmdForecast_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleForecast_(req, reply, replyLen);
}

bool IrrigationModule::cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleStatus_(req, reply, replyLen);
}

bool IrrigationModule::handleCalculateEt_(const CommandRequest& req, char* reply, size_t replyLen)
{
    uint8_t zone = ALL_ZONES;
    bool force = false;

    // Args are optional for this command.
    JsonObjectConst args;
    if (parseCmdArgsObject_(req, args)) {
        if (args.containsKey("zone")) {
            if (!args["zone"].is<uint8_t>()) {
                writeCmdError_(reply, replyLen, "irrigation.calculate_et", ErrorCode::BadZone);
                return false;
            }
            zone = args["zone"].as<uint8_t>();
            if (zone >= zoneCount_) {
                writeCmdErrorZone_(reply, replyLen, "irrigation.calculate_et", ErrorCode::UnknownZone, zone);
                return false;
            }
        }
        if (args.containsKey("force")) {
            if (!args["force"].is<bool>()) {
                writeCmdError_(reply, replyLen, "irrigation.calculate_et", ErrorCode::InvalidValue);
                return false;
            }
            force = args["force"].as<bool>();
        }
    }
    if (force && zone == ALL_ZONES) {
        writeCmdError_(reply, replyLen, "irrigation.calculate_et", ErrorCode::MissingZone);
        return false;
    }
    if (!cfgData_.enabled) {
        writeCmdError_(reply, replyLen, "irrigation.calculate_et", ErrorCode::Disabled);
        return false;
    }

    const uint32_t now = nowEpoch_();
    if (now == 0) {
        writeCmdError_(reply, replyLen, "irrigation.calculate_et", ErrorCode::NotReady);
        return false;
    }

    EtJobSummary s{};
    ErrorCode err = ErrorCode::Failed;
    const bool ok = runEtJob_(now, zone, force, s, err);
    if (err != ErrorCode::NotReady) recordJob_(ok, s);
    if (!ok) {
        writeCmdError_(reply, replyLen, "irrigation.calculate_et", err);
        return false;
    }

    const int wrote = snprintf(reply, replyLen,
                               "{\"ok\":true,\"date\":%lu,\"method\":\"%s\",\"et0_mm\":%.2f,"
                               "\"applied\":%u,\"already\":%u,\"ignored\":%u}",
                               (unsigned long)s.dateKey,
                               etMethodStr(s.et.method),
                               (double)s.et.et0Mm,
                               (unsigned)s.applied,
                               (unsigned)s.alreadyApplied,
                               (unsigned)s.ignored);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "irrigation.calculate_et", ErrorCode::InternalAckOverflow);
        return false;
    }
    return true;
}

bool IrrigationModule::handleSetBalance_(const CommandRequest& req, char* reply, size_t replyLen)
{
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, "irrigation.set_balance", ErrorCode::MissingArgs);
        return false;
    }
    if (!args.containsKey("zone")) {
        writeCmdError_(reply, replyLen, "irrigation.set_balance", ErrorCode::MissingZone);
        return false;
    }
    if (!args["zone"].is<uint8_t>()) {
        writeCmdError_(reply, replyLen, "irrigation.set_balance", ErrorCode::BadZone);
        return false;
    }
    const uint8_t zone = args["zone"].as<uint8_t>();
    if (zone >= zoneCount_) {
        writeCmdErrorZone_(reply, replyLen, "irrigation.set_balance", ErrorCode::UnknownZone, zone);
        return false;
    }
    if (!args.containsKey("value")) {
        writeCmdErrorZone_(reply, replyLen, "irrigation.set_balance", ErrorCode::MissingValue, zone);
        return false;
    }
    float value = 0.0f;
    if (!readFloatArg_(args["value"], value)) {
        writeCmdErrorZone_(reply, replyLen, "irrigation.set_balance", ErrorCode::InvalidValue, zone);
        return false;
    }
    const bool resetEt = args["reset_et"] | false;

    ZoneState& z = zones_[zone];
    portENTER_CRITICAL(&z.mux);
    const bool ok = z.ledger.setBalance(value, resetEt);
    if (ok) {
        z.persistDirty = true;
        z.persistImmediate = true;
    }
    portEXIT_CRITICAL(&z.mux);
    if (!ok) {
        writeCmdErrorZone_(reply, replyLen, "irrigation.set_balance", ErrorCode::InvalidValue, zone);
        return false;
    }
    markZoneDirty_(zone);
    LOGI("Zone %u balance set to %.2fmm%s", (unsigned)zone, (double)value, resetEt ? " (ET guard reset)" : "");

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"balance_mm\":%.2f}",
                               (unsigned)zone, (double)value);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "irrigation.set_balance", ErrorCode::InternalAckOverflow);
        return false;
    }
    return true;
}

bool IrrigationModule::handleForecast_(const CommandRequest& req, char* reply, size_t replyLen)
{
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, "irrigation.forecast", ErrorCode::MissingArgs);
        return false;
    }
    if (!args.containsKey("mm")) {
        writeCmdError_(reply, replyLen, "irrigation.forecast", ErrorCode::MissingValue);
        return false;
    }
    float mm = 0.0f;
    if (!readFloatArg_(args["mm"], mm)) {
        writeCmdError_(reply, replyLen, "irrigation.forecast", ErrorCode::InvalidValue);
        return false;
    }
    if (mm < IrrigationDefaults::PrecipMinMm || mm > IrrigationDefaults::PrecipMaxMm) {
        writeCmdError_(reply, replyLen, "irrigation.forecast", ErrorCode::OutOfRange);
        return false;
    }

    portENTER_CRITICAL(&stateMux_);
    forecastRainMm_ = mm;
    dailyDirty_ = true;
    zoneDirtyMask_ = 0xFF;
    portEXIT_CRITICAL(&stateMux_);
    LOGI("Rain forecast set to %.2fmm", (double)mm);

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"forecast_mm\":%.2f}", (double)mm);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "irrigation.forecast", ErrorCode::InternalAckOverflow);
        return false;
    }
    return true;
}

bool IrrigationModule::writeZoneStatus_(uint8_t zone, char* reply, size_t replyLen) const
{
    const ZoneView v = viewZone_(zone);
    float forecast = 0.0f;
    portENTER_CRITICAL(&stateMux_);
    forecast = forecastRainMm_;
    portEXIT_CRITICAL(&stateMux_);

    RunEligibilityOutput elig{};
    const uint32_t now = nowEpoch_();
    evaluateZone_(zone, v, now, forecast, elig);
    const ZoneConfig& c = v.cfg;
    const float required = runtimeSecondsForDeficit(v.balanceMm < 0.0f ? -v.balanceMm : 0.0f, c.rateMmH);

    const int wrote = snprintf(reply, replyLen,
                               "{\"ok\":true,\"zone\":%u,\"name\":\"%s\",\"rate_mm_h\":%.2f,\"kc\":%.2f,"
                               "\"balance_mm\":%.2f,\"required_s\":%.0f,\"recommended_s\":%.0f,"
                               "\"can_run\":%s,\"reason\":\"%s\",\"deficit_mm\":%.2f,"
                               "\"last_et_date\":%lu,\"last_et_mm\":%.2f,\"method\":\"%s\",\"et0_mm\":%.2f,"
                               "\"runtime_today_s\":%lu,\"last_irrigation_mm\":%.2f,\"last_off\":%lu,"
                               "\"last_rain_mm\":%.2f,\"last_rain\":%lu,\"valve_open\":%s}",
                               (unsigned)zone,
                               c.name,
                               (double)c.rateMmH,
                               (double)c.kc,
                               (double)v.balanceMm,
                               (double)required,
                               (double)elig.recommendedRuntimeS,
                               elig.canRun ? "true" : "false",
                               runBlockReasonStr(elig.reason),
                               (double)elig.effectiveDeficitMm,
                               (unsigned long)v.lastEtDate,
                               (double)v.lastEtMm,
                               etMethodStr((EtMethod)v.lastMethod),
                               (double)v.lastEt0Mm,
                               (unsigned long)v.runtimeTodaySec,
                               (double)v.lastIrrigationMm,
                               (unsigned long)v.lastOffEpoch,
                               (double)v.lastRainMm,
                               (unsigned long)v.lastRainEpoch,
                               v.runOpen ? "true" : "false");
    return wrote >= 0 && (size_t)wrote < replyLen;
}

bool IrrigationModule::handleStatus_(const CommandRequest& req, char* reply, size_t replyLen)
{
    JsonObjectConst args;
    if (parseCmdArgsObject_(req, args) && args.containsKey("zone")) {
        if (!args["zone"].is<uint8_t>()) {
            writeCmdError_(reply, replyLen, "irrigation.status", ErrorCode::BadZone);
            return false;
        }
        const uint8_t zone = args["zone"].as<uint8_t>();
        if (zone >= zoneCount_) {
            writeCmdErrorZone_(reply, replyLen, "irrigation.status", ErrorCode::UnknownZone, zone);
            return false;
        }
        if (!writeZoneStatus_(zone, reply, replyLen)) {
            writeCmdErrorZone_(reply, replyLen, "irrigation.status", ErrorCode::InternalAckOverflow, zone);
            return false;
        }
        return true;
    }

    float forecast = 0.0f;
    portENTER_CRITICAL(&stateMux_);
    forecast = forecastRainMm_;
    portEXIT_CRITICAL(&stateMux_);
    const uint32_t now = nowEpoch_();

    size_t pos = 0;
    int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"enabled\":%s,\"forecast_mm\":%.2f,\"zones\":[",
                         cfgData_.enabled ? "true" : "false", (double)forecast);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "irrigation.status", ErrorCode::InternalAckOverflow);
        return false;
    }
    pos = (size_t)wrote;

    for (uint8_t i = 0; i < zoneCount_; ++i) {
        const ZoneView v = viewZone_(i);
        RunEligibilityOutput elig{};
        evaluateZone_(i, v, now, forecast, elig);
        const float required = runtimeSecondsForDeficit(v.balanceMm < 0.0f ? -v.balanceMm : 0.0f, v.cfg.rateMmH);
        wrote = snprintf(reply + pos, replyLen - pos,
                         "%s{\"zone\":%u,\"name\":\"%s\",\"balance_mm\":%.2f,\"required_s\":%.0f,\"can_run\":%s}",
                         (i == 0) ? "" : ",",
                         (unsigned)i,
                         v.cfg.name,
                         (double)v.balanceMm,
                         (double)required,
                         elig.canRun ? "true" : "false");
        if (wrote < 0 || (size_t)wrote >= (replyLen - pos)) {
            writeCmdError_(reply, replyLen, "irrigation.status", ErrorCode::InternalAckOverflow);
            return false;
        }
        pos += (size_t)wrote;
    }

    wrote = snprintf(reply + pos, replyLen - pos, "]}");
    if (wrote < 0 || (size_t)wrote >= (replyLen - pos)) {
        writeCmdError_(reply, replyLen, "irrigation.status", ErrorCode::InternalAckOverflow);
        return false;
    }
    return true;
}

void IrrigationModule::registerHaEntities_()
{
    if (!haSvc_) return;

    for (uint8_t z = 0; z < zoneCount_; ++z) {
        HaZoneStrings& s = haStrings_[z];
        const char* name = zones_[z].cfg.name;

        snprintf(s.stateTopic, sizeof(s.stateTopic), "rt/irrigation/z%u", (unsigned)z);
        snprintf(s.balanceId, sizeof(s.balanceId), "zone%u_balance", (unsigned)z);
        snprintf(s.requiredId, sizeof(s.requiredId), "zone%u_required", (unsigned)z);
        snprintf(s.recommendedId, sizeof(s.recommendedId), "zone%u_recommended", (unsigned)z);
        snprintf(s.lastEtId, sizeof(s.lastEtId), "zone%u_last_et", (unsigned)z);
        snprintf(s.canRunId, sizeof(s.canRunId), "zone%u_can_run", (unsigned)z);
        snprintf(s.balanceName, sizeof(s.balanceName), "%s balance", name);
        snprintf(s.requiredName, sizeof(s.requiredName), "%s required runtime", name);
        snprintf(s.recommendedName, sizeof(s.recommendedName), "%s recommended runtime", name);
        snprintf(s.lastEtName, sizeof(s.lastEtName), "%s last ETc", name);
        snprintf(s.canRunName, sizeof(s.canRunName), "%s can run", name);
        snprintf(s.balanceCmdTpl, sizeof(s.balanceCmdTpl),
                 "{\\\"cmd\\\":\\\"irrigation.set_balance\\\",\\\"args\\\":{\\\"zone\\\":%u,"
                 "\\\"value\\\":{{ value | float(0) }}}}",
                 (unsigned)z);

        if (haSvc_->addNumber) {
            const HANumberEntry n{
                "irrigation", s.balanceId, s.balanceName,
                s.stateTopic, "{{ value_json.balance_mm }}",
                MqttTopics::SuffixCmd, s.balanceCmdTpl,
                IrrigationDefaults::BalanceUiMin, IrrigationDefaults::BalanceUiMax, IrrigationDefaults::BalanceUiStep,
                "box", nullptr, "mdi:water-percent", "mm"
            };
            if (!haSvc_->addNumber(haSvc_->ctx, &n)) LOGW("HA balance number zone=%u not registered", (unsigned)z);
        }
        if (haSvc_->addSensor) {
            const HASensorEntry required{
                "irrigation", s.requiredId, s.requiredName,
                s.stateTopic, "{{ value_json.required_s }}",
                nullptr, "mdi:timer-sand", "s", "duration", nullptr
            };
            const HASensorEntry recommended{
                "irrigation", s.recommendedId, s.recommendedName,
                s.stateTopic, "{{ value_json.recommended_s }}",
                nullptr, "mdi:timer-outline", "s", "duration", nullptr
            };
            const HASensorEntry lastEt{
                "irrigation", s.lastEtId, s.lastEtName,
                s.stateTopic, "{{ value_json.last_et_mm }}",
                "diagnostic", "mdi:weather-sunny", "mm", nullptr, nullptr
            };
            if (!haSvc_->addSensor(haSvc_->ctx, &required) ||
                !haSvc_->addSensor(haSvc_->ctx, &recommended) ||
                !haSvc_->addSensor(haSvc_->ctx, &lastEt)) {
                LOGW("HA sensors zone=%u not registered", (unsigned)z);
            }
        }
        if (haSvc_->addBinarySensor) {
            const HABinarySensorEntry canRun{
                "irrigation", s.canRunId, s.canRunName,
                s.stateTopic, "{{ 'True' if value_json.can_run else 'False' }}",
                nullptr, nullptr, "mdi:sprinkler"
            };
            if (!haSvc_->addBinarySensor(haSvc_->ctx, &canRun)) LOGW("HA can_run zone=%u not registered", (unsigned)z);
        }
    }
}

void IrrigationModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore_ = &cfg;
    logHub_ = services.get<LogHubService>("loghub");
    cmdSvc_ = services.get<CommandService>("cmd");
    timeSvc_ = services.get<TimeService>("time");
    weatherSvc_ = services.get<WeatherService>("weather");
    haSvc_ = services.get<HAService>("ha");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;

    cfg.registerVar(enabledVar_);
    cfg.registerVar(zoneCountVar_);

    for (uint8_t i = 0; i < Limits::Irrigation::MaxZones; ++i) {
        ZoneState& z = zones_[i];

        snprintf(cfgModuleName_[i], sizeof(cfgModuleName_[i]), "zone/z%u", (unsigned)i);
        snprintf(cfgLedgerModuleName_[i], sizeof(cfgLedgerModuleName_[i]), "zrt/z%u", (unsigned)i);
        snprintf(nvsNameKey_[i], sizeof(nvsNameKey_[i]), NvsKeys::Zone::NameFmt, (unsigned)i);
        snprintf(nvsRateKey_[i], sizeof(nvsRateKey_[i]), NvsKeys::Zone::RateFmt, (unsigned)i);
        snprintf(nvsKcKey_[i], sizeof(nvsKcKey_[i]), NvsKeys::Zone::KcFmt, (unsigned)i);
        snprintf(nvsMinRuntimeKey_[i], sizeof(nvsMinRuntimeKey_[i]), NvsKeys::Zone::MinRuntimeFmt, (unsigned)i);
        snprintf(nvsMaxRuntimeKey_[i], sizeof(nvsMaxRuntimeKey_[i]), NvsKeys::Zone::MaxRuntimeFmt, (unsigned)i);
        snprintf(nvsMinIntervalKey_[i], sizeof(nvsMinIntervalKey_[i]), NvsKeys::Zone::MinIntervalFmt, (unsigned)i);
        snprintf(nvsLedgerKey_[i], sizeof(nvsLedgerKey_[i]), NvsKeys::Zone::LedgerFmt, (unsigned)i);
        ZoneConfig& zc = cfgStage_[i];
        snprintf(zc.name, sizeof(zc.name), "Zone %u", (unsigned)i);
        z.cfg = zc;

        cfgNameVar_[i].nvsKey = nvsNameKey_[i];
        cfgNameVar_[i].jsonName = "name";
        cfgNameVar_[i].moduleName = cfgModuleName_[i];
        cfgNameVar_[i].type = ConfigType::CharArray;
        cfgNameVar_[i].value = zc.name;
        cfgNameVar_[i].persistence = ConfigPersistence::Persistent;
        cfgNameVar_[i].size = sizeof(zc.name);
        cfg.registerVar(cfgNameVar_[i]);

        cfgRateVar_[i].nvsKey = nvsRateKey_[i];
        cfgRateVar_[i].jsonName = "rate_mm_h";
        cfgRateVar_[i].moduleName = cfgModuleName_[i];
        cfgRateVar_[i].type = ConfigType::Float;
        cfgRateVar_[i].value = &zc.rateMmH;
        cfgRateVar_[i].persistence = ConfigPersistence::Persistent;
        cfgRateVar_[i].size = 0;
        cfg.registerVar(cfgRateVar_[i]);

        cfgKcVar_[i].nvsKey = nvsKcKey_[i];
        cfgKcVar_[i].jsonName = "kc";
        cfgKcVar_[i].moduleName = cfgModuleName_[i];
        cfgKcVar_[i].type = ConfigType::Float;
        cfgKcVar_[i].value = &zc.kc;
        cfgKcVar_[i].persistence = ConfigPersistence::Persistent;
        cfgKcVar_[i].size = 0;
        cfg.registerVar(cfgKcVar_[i]);

        cfgMinRuntimeVar_[i].nvsKey = nvsMinRuntimeKey_[i];
        cfgMinRuntimeVar_[i].jsonName = "min_runtime_s";
        cfgMinRuntimeVar_[i].moduleName = cfgModuleName_[i];
        cfgMinRuntimeVar_[i].type = ConfigType::Int32;
        cfgMinRuntimeVar_[i].value = &zc.minRuntimeS;
        cfgMinRuntimeVar_[i].persistence = ConfigPersistence::Persistent;
        cfgMinRuntimeVar_[i].size = 0;
        cfg.registerVar(cfgMinRuntimeVar_[i]);

        cfgMaxRuntimeVar_[i].nvsKey = nvsMaxRuntimeKey_[i];
        cfgMaxRuntimeVar_[i].jsonName = "max_runtime_s";
        cfgMaxRuntimeVar_[i].moduleName = cfgModuleName_[i];
        cfgMaxRuntimeVar_[i].type = ConfigType::Int32;
        cfgMaxRuntimeVar_[i].value = &zc.maxRuntimeS;
        cfgMaxRuntimeVar_[i].persistence = ConfigPersistence::Persistent;
        cfgMaxRuntimeVar_[i].size = 0;
        cfg.registerVar(cfgMaxRuntimeVar_[i]);

        cfgMinIntervalVar_[i].nvsKey = nvsMinIntervalKey_[i];
        cfgMinIntervalVar_[i].jsonName = "min_interval_s";
        cfgMinIntervalVar_[i].moduleName = cfgModuleName_[i];
        cfgMinIntervalVar_[i].type = ConfigType::Int32;
        cfgMinIntervalVar_[i].value = &zc.minIntervalS;
        cfgMinIntervalVar_[i].persistence = ConfigPersistence::Persistent;
        cfgMinIntervalVar_[i].size = 0;
        cfg.registerVar(cfgMinIntervalVar_[i]);

        cfgLedgerVar_[i].nvsKey = nvsLedgerKey_[i];
        cfgLedgerVar_[i].jsonName = "ledger";
        cfgLedgerVar_[i].moduleName = cfgLedgerModuleName_[i];
        cfgLedgerVar_[i].type = ConfigType::CharArray;
        cfgLedgerVar_[i].value = ledgerBlob_[i];
        cfgLedgerVar_[i].persistence = ConfigPersistence::Persistent;
        cfgLedgerVar_[i].size = sizeof(ledgerBlob_[i]);
        cfg.registerVar(cfgLedgerVar_[i]);
    }

    jobMutex_ = xSemaphoreCreateMutex();
    if (!jobMutex_) {
        LOGE("ET job mutex allocation failed");
    }

    if (eventBus_) {
        eventBus_->subscribe(EventId::RainfallMeasured, &IrrigationModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::ValveChanged, &IrrigationModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::ConfigChanged, &IrrigationModule::onEventStatic_, this);
        eventBus_->subscribe(EventId::SchedulerEventTriggered, &IrrigationModule::onEventStatic_, this);
    }

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.calculate_et", cmdCalculateEt_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.set_balance", cmdSetBalance_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.forecast", cmdForecast_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.status", cmdStatus_, this);
    }
    (void)logHub_;
}

void IrrigationModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    uint8_t count = cfgData_.zoneCount;
    if (count == 0) count = 1;
    if (count > Limits::Irrigation::MaxZones) count = Limits::Irrigation::MaxZones;
    if (count != cfgData_.zoneCount) {
        LOGW("zone_count %u out of range, using %u", (unsigned)cfgData_.zoneCount, (unsigned)count);
    }
    zoneCount_ = count;

    uint8_t restored = 0;
    for (uint8_t i = 0; i < zoneCount_; ++i) {
        applyZoneConfig_(i);
        if (loadLedger_(i)) ++restored;
    }
    clearRemovedZones_();

    registerHaEntities_();
    markAllZonesDirty_();
    portENTER_CRITICAL(&stateMux_);
    dailyDirty_ = true;
    portEXIT_CRITICAL(&stateMux_);

    LOGI("Irrigation ready (zones=%u restored=%u enabled=%s)",
         (unsigned)zoneCount_, (unsigned)restored, cfgData_.enabled ? "true" : "false");
}

void IrrigationModule::loop()
{
    const uint32_t nowMs = millis();
    refreshZones_(nowMs);
    runPendingDayStart_();

    bool dailyDirty = false;
    portENTER_CRITICAL(&stateMux_);
    dailyDirty = dailyDirty_;
    portEXIT_CRITICAL(&stateMux_);
    if (dailyDirty) publishDaily_();

    persistDirtyZones_(nowMs);
    vTaskDelay(pdMS_TO_TICKS(Limits::Irrigation::LoopDelayMs));
}
