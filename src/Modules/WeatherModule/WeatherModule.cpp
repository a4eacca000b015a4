/**
 * @file WeatherModule.cpp
 * @brief Implementation file.
 */

#include "WeatherModule.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventBus.h"
#define LOG_TAG "WeatherM"
#include "Core/ModuleLog.h"
#include "Modules/WeatherModule/SensorValidator.h"
#include "Modules/WeatherModule/WeatherRuntime.h"
#include <ArduinoJson.h>
#include <Arduino.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

static bool parseCmdArgsObject_(const CommandRequest& req, JsonObjectConst& outObj)
{
    static StaticJsonDocument<Limits::Weather::JsonCmdBuf> doc;

    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        outObj = doc.as<JsonObjectConst>();
        return true;
    }
    return false;
}

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

static bool readFloatArg_(JsonVariantConst v, float& out)
{
    if (v.is<float>() || v.is<double>() || v.is<int32_t>() || v.is<uint32_t>()) {
        out = v.as<float>();
        return true;
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (!s || s[0] == '\0') return false;
        char* end = nullptr;
        out = strtof(s, &end);
        return end && *end == '\0';
    }
    return false;
}

uint32_t WeatherModule::nowEpoch_() const
{
    if (!timeSvc_ || !timeSvc_->isSynced || !timeSvc_->epoch) return 0;
    if (!timeSvc_->isSynced(timeSvc_->ctx)) return 0;
    return (uint32_t)timeSvc_->epoch(timeSvc_->ctx);
}

bool WeatherModule::recordLocked_(WeatherKind kind, float value, uint32_t epochSec)
{
    HistoryRing& ring = history_[(uint8_t)kind];
    if (ring.count > 0) {
        const uint16_t lastIdx = (uint16_t)((ring.head + Limits::Weather::HistoryPerKind - 1) % Limits::Weather::HistoryPerKind);
        const HistoryEntry& last = ring.entries[lastIdx];
        if (epochSec < last.ts) return false;

        const bool counterMoved = (kind == WeatherKind::Precipitation) && (value != last.value);
        if (!counterMoved && (epochSec - last.ts) < historySpacingS(cfgData_.minSpacingS)) return false;
    }

    ring.entries[ring.head].value = value;
    ring.entries[ring.head].ts = epochSec;
    ring.head = (uint16_t)((ring.head + 1) % Limits::Weather::HistoryPerKind);
    if (ring.count < Limits::Weather::HistoryPerKind) ++ring.count;
    return true;
}

uint16_t WeatherModule::queryLocked_(WeatherKind kind, uint32_t startSec, uint32_t endSec,
                                     WeatherSample* out, uint16_t max) const
{
    const HistoryRing& ring = history_[(uint8_t)kind];
    const uint16_t n = Limits::Weather::HistoryPerKind;
    const uint16_t oldest = (uint16_t)((ring.head + n - ring.count) % n);
    if (ring.count == n && ring.entries[oldest].ts > startSec) {
        LOGW("%s history starts %lus after window start, aggregate is partial",
             weatherKindStr(kind), (unsigned long)(ring.entries[oldest].ts - startSec));
    }

    uint16_t written = 0;
    for (uint16_t i = 0; i < ring.count && written < max; ++i) {
        const HistoryEntry& e = ring.entries[(oldest + i) % n];
        if (e.ts < startSec || e.ts > endSec) continue;
        out[written].kind = kind;
        out[written].value = e.value;
        out[written].ts = e.ts;
        ++written;
    }
    return written;
}

bool WeatherModule::ingest_(WeatherKind kind, float value, uint32_t epochSec, IngestResult& out)
{
    out = IngestResult{};
    if (!cfgData_.enabled) {
        out.error = ErrorCode::Disabled;
        return false;
    }

    const SampleValidation v = validateWeatherSample(kind, value);
    if (!v.valid()) {
        ++rejectedCount_;
        if (v.verdict == SampleVerdict::NotFinite) {
            LOGW("Rejected %s: not finite", weatherKindStr(kind));
        } else {
            LOGW("Rejected %s=%.2f (%s bound %.1f)",
                 weatherKindStr(kind), (double)value, sampleVerdictStr(v.verdict), (double)v.bound);
        }
        if (dataStore_) setWeatherCounters(*dataStore_, rejectedCount_, anomalyCount_);
        out.error = ErrorCode::OutOfRange;
        return false;
    }

    if (!historyMutex_ || xSemaphoreTake(historyMutex_, pdMS_TO_TICKS(100)) != pdTRUE) {
        out.error = ErrorCode::NotReady;
        return false;
    }

    PrecipStep step{};
    if (kind == WeatherKind::Precipitation) {
        step = precip_.update(v.value);
    }
    if (epochSec != 0) {
        out.recorded = recordLocked_(kind, v.value, epochSec);
    }
    latest_[(uint8_t)kind].kind = kind;
    latest_[(uint8_t)kind].value = v.value;
    latest_[(uint8_t)kind].ts = epochSec;
    hasLatest_[(uint8_t)kind] = true;
    if (step.kind == PrecipStepKind::Anomaly) ++anomalyCount_;
    xSemaphoreGive(historyMutex_);

    out.accepted = true;
    out.precip = step.kind;
    if (kind == WeatherKind::Precipitation) {
        if (step.kind == PrecipStepKind::Anomaly) {
            LOGW("Precipitation jump %.1f -> %.1f mm discarded", (double)step.previous, (double)v.value);
        } else if (step.kind == PrecipStepKind::Rollover) {
            LOGI("Precipitation counter reset %.1f -> %.1f mm", (double)step.previous, (double)v.value);
        } else if (step.kind == PrecipStepKind::Increase) {
            out.rainMm = step.rainMm;
            RainfallMeasuredPayload p{};
            p.mm = step.rainMm;
            p.epochSec = epochSec;
            if (!eventBus_ || !eventBus_->post(EventId::RainfallMeasured, &p, sizeof(p))) {
                LOGE("RainfallMeasured post failed (%.2f mm)", (double)step.rainMm);
            }
        }
    }

    if (out.recorded && eventBus_) {
        WeatherSampleRecordedPayload p{};
        p.kind = (uint8_t)kind;
        p.value = v.value;
        p.epochSec = epochSec;
        (void)eventBus_->post(EventId::WeatherSampleRecorded, &p, sizeof(p));
    }

    if (dataStore_) {
        setWeatherCounters(*dataStore_, rejectedCount_, anomalyCount_);
        setWeatherLatest(*dataStore_, kind, v.value, epochSec, millis());
    }
    return true;
}

bool WeatherModule::cmdSample_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    WeatherModule* self = static_cast<WeatherModule*>(userCtx);
    if (!self) return false;
    return self->handleSample_(req, reply, replyLen);
}

bool WeatherModule::cmdStatus_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    WeatherModule* self = static_cast<WeatherModule*>(userCtx);
    if (!self) return false;
    return self->handleStatus_(reply, replyLen);
}

bool WeatherModule::handleSample_(const CommandRequest& req, char* reply, size_t replyLen)
{
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, "weather.sample", ErrorCode::MissingArgs);
        return false;
    }

    const char* kindStr = args["kind"] | (const char*)nullptr;
    if (!kindStr) {
        writeCmdError_(reply, replyLen, "weather.sample", ErrorCode::MissingKind);
        return false;
    }
    WeatherKind kind = WeatherKind::Temperature;
    if (!weatherKindFromStr(kindStr, kind)) {
        writeCmdError_(reply, replyLen, "weather.sample", ErrorCode::UnknownKind);
        return false;
    }

    if (!args.containsKey("value")) {
        writeCmdError_(reply, replyLen, "weather.sample", ErrorCode::MissingValue);
        return false;
    }
    float value = 0.0f;
    if (!readFloatArg_(args["value"], value)) {
        writeCmdError_(reply, replyLen, "weather.sample", ErrorCode::InvalidValue);
        return false;
    }

    uint32_t epochSec = 0;
    if (args.containsKey("ts")) {
        if (!args["ts"].is<uint32_t>()) {
            writeCmdError_(reply, replyLen, "weather.sample", ErrorCode::InvalidValue);
            return false;
        }
        epochSec = args["ts"].as<uint32_t>();
    } else {
        epochSec = nowEpoch_();
    }

    IngestResult res{};
    if (!ingest_(kind, value, epochSec, res)) {
        writeCmdError_(reply, replyLen, "weather.sample", res.error);
        return false;
    }

    if (kind == WeatherKind::Precipitation) {
        snprintf(reply, replyLen,
                 "{\"ok\":true,\"kind\":\"%s\",\"recorded\":%s,\"precip\":\"%s\",\"rain_mm\":%.2f}",
                 weatherKindStr(kind),
                 res.recorded ? "true" : "false",
                 precipStepStr(res.precip),
                 (double)res.rainMm);
    } else {
        snprintf(reply, replyLen, "{\"ok\":true,\"kind\":\"%s\",\"recorded\":%s}",
                 weatherKindStr(kind), res.recorded ? "true" : "false");
    }
    return true;
}

bool WeatherModule::handleStatus_(char* reply, size_t replyLen)
{
    uint16_t counts[WEATHER_KIND_COUNT] = {0};
    WeatherSample latest[WEATHER_KIND_COUNT]{};
    bool has[WEATHER_KIND_COUNT] = {false};
    uint32_t rejected = 0;
    uint32_t anomalies = 0;

    if (!historyMutex_ || xSemaphoreTake(historyMutex_, pdMS_TO_TICKS(100)) != pdTRUE) {
        writeCmdError_(reply, replyLen, "weather.status", ErrorCode::NotReady);
        return false;
    }
    for (uint8_t k = 0; k < WEATHER_KIND_COUNT; ++k) {
        counts[k] = history_[k].count;
        latest[k] = latest_[k];
        has[k] = hasLatest_[k];
    }
    rejected = rejectedCount_;
    anomalies = anomalyCount_;
    xSemaphoreGive(historyMutex_);

    int wrote = snprintf(reply, replyLen,
                         "{\"ok\":true,\"enabled\":%s,\"rejected\":%lu,\"anomalies\":%lu,\"kinds\":{",
                         cfgData_.enabled ? "true" : "false",
                         (unsigned long)rejected,
                         (unsigned long)anomalies);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, "weather.status", ErrorCode::Failed);
        return false;
    }
    size_t pos = (size_t)wrote;

    for (uint8_t k = 0; k < WEATHER_KIND_COUNT; ++k) {
        if (has[k]) {
            wrote = snprintf(reply + pos, replyLen - pos,
                             "%s\"%s\":{\"history\":%u,\"last\":%.2f,\"last_ts\":%lu}",
                             (k == 0) ? "" : ",",
                             weatherKindStr((WeatherKind)k),
                             (unsigned)counts[k],
                             (double)latest[k].value,
                             (unsigned long)latest[k].ts);
        } else {
            wrote = snprintf(reply + pos, replyLen - pos,
                             "%s\"%s\":{\"history\":%u,\"last\":null}",
                             (k == 0) ? "" : ",",
                             weatherKindStr((WeatherKind)k),
                             (unsigned)counts[k]);
        }
        if (wrote < 0 || (size_t)wrote >= (replyLen - pos)) {
            writeCmdError_(reply, replyLen, "weather.status", ErrorCode::Failed);
            return false;
        }
        pos += (size_t)wrote;
    }

    wrote = snprintf(reply + pos, replyLen - pos, "}}");
    if (wrote < 0 || (size_t)wrote >= (replyLen - pos)) {
        writeCmdError_(reply, replyLen, "weather.status", ErrorCode::Failed);
        return false;
    }
    return true;
}

uint16_t WeatherModule::svcQuery_(void* ctx, WeatherKind kind, uint32_t startSec, uint32_t endSec,
                                  WeatherSample* out, uint16_t max)
{
    WeatherModule* self = static_cast<WeatherModule*>(ctx);
    if (!self || !out || max == 0) return 0;
    if ((uint8_t)kind >= WEATHER_KIND_COUNT) return 0;
    if (!self->historyMutex_ || xSemaphoreTake(self->historyMutex_, pdMS_TO_TICKS(500)) != pdTRUE) return 0;
    const uint16_t n = self->queryLocked_(kind, startSec, endSec, out, max);
    xSemaphoreGive(self->historyMutex_);
    return n;
}

bool WeatherModule::svcLocation_(void* ctx, WeatherLocation* out)
{
    WeatherModule* self = static_cast<WeatherModule*>(ctx);
    if (!self || !out) return false;
    out->latitudeDeg = self->cfgData_.latitudeDeg;
    out->longitudeDeg = self->cfgData_.longitudeDeg;
    out->elevationM = self->cfgData_.elevationM;
    return isfinite(out->latitudeDeg) && out->latitudeDeg >= -90.0f && out->latitudeDeg <= 90.0f;
}

const char* WeatherModule::runtimeSnapshotSuffix(uint8_t idx) const
{
    return (idx == 0) ? "rt/weather/state" : nullptr;
}

bool WeatherModule::buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const
{
    if (idx != 0 || !out || len == 0 || !dataStore_) return false;

    int wrote = snprintf(out, len, "{");
    if (wrote < 0 || (size_t)wrote >= len) return false;
    size_t pos = (size_t)wrote;

    uint32_t maxTs = 0;
    for (uint8_t k = 0; k < WEATHER_KIND_COUNT; ++k) {
        WeatherLatestEntry e{};
        const bool valid = weatherLatest(*dataStore_, (WeatherKind)k, e);
        if (valid) {
            wrote = snprintf(out + pos, len - pos, "\"%s\":%.2f,", weatherKindStr((WeatherKind)k), (double)e.value);
            if (e.tsMs > maxTs) maxTs = e.tsMs;
        } else {
            wrote = snprintf(out + pos, len - pos, "\"%s\":null,", weatherKindStr((WeatherKind)k));
        }
        if (wrote < 0 || (size_t)wrote >= (len - pos)) return false;
        pos += (size_t)wrote;
    }

    wrote = snprintf(out + pos, len - pos, "\"rejected\":%lu,\"anomalies\":%lu,\"ts\":%lu}",
                     (unsigned long)weatherRejectedCount(*dataStore_),
                     (unsigned long)weatherAnomalyCount(*dataStore_),
                     (unsigned long)maxTs);
    if (wrote < 0 || (size_t)wrote >= (len - pos)) return false;

    maxTsOut = (maxTs == 0U) ? 1U : maxTs;
    return true;
}

void WeatherModule::registerHaEntities_()
{
    if (!haSvc_ || !haSvc_->addSensor) return;

    const HASensorEntry temp{
        "weather", "weather_temperature", "Temperature",
        "rt/weather/state", "{{ value_json.temperature }}",
        nullptr, "mdi:thermometer", "\xC2\xB0""C", "temperature", nullptr
    };
    const HASensorEntry hum{
        "weather", "weather_humidity", "Humidity",
        "rt/weather/state", "{{ value_json.humidity }}",
        nullptr, "mdi:water-percent", "%", "humidity", nullptr
    };
    const HASensorEntry rain{
        "weather", "weather_precipitation", "Precipitation counter",
        "rt/weather/state", "{{ value_json.precipitation }}",
        nullptr, "mdi:weather-rainy", "mm", "precipitation", "total_increasing"
    };
    (void)haSvc_->addSensor(haSvc_->ctx, &temp);
    (void)haSvc_->addSensor(haSvc_->ctx, &hum);
    (void)haSvc_->addSensor(haSvc_->ctx, &rain);
}

void WeatherModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar_);
    cfg.registerVar(minSpacingVar_);
    cfg.registerVar(latitudeVar_);
    cfg.registerVar(longitudeVar_);
    cfg.registerVar(elevationVar_);

    logHub_ = services.get<LogHubService>("loghub");
    cmdSvc_ = services.get<CommandService>("cmd");
    timeSvc_ = services.get<TimeService>("time");
    haSvc_ = services.get<HAService>("ha");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;

    historyMutex_ = xSemaphoreCreateMutex();
    if (!historyMutex_) {
        LOGE("History mutex allocation failed");
    }

    (void)services.add("weather", &weatherSvc_);

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "weather.sample", cmdSample_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "weather.status", cmdStatus_, this);
    }
    registerHaEntities_();
    (void)logHub_;
}

void WeatherModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry&)
{
    const int32_t spacing = (int32_t)historySpacingS(cfgData_.minSpacingS);
    if (spacing != cfgData_.minSpacingS) {
        LOGW("min_spacing_s %ld below %lds floor, using %ld",
             (long)cfgData_.minSpacingS, (long)Limits::Weather::MinSpacingFloorS, (long)spacing);
        if (!cfg.set(minSpacingVar_, spacing)) LOGW("min_spacing_s write failed");
    }
    LOGI("Weather ready enabled=%d spacing=%lds lat=%.4f lon=%.4f elev=%.0fm",
         (int)cfgData_.enabled,
         (long)cfgData_.minSpacingS,
         (double)cfgData_.latitudeDeg,
         (double)cfgData_.longitudeDeg,
         (double)cfgData_.elevationM);
}
