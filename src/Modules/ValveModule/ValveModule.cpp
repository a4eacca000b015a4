/**
 * @file ValveModule.cpp
 * @brief Implementation file.
 */

#include "ValveModule.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventBus.h"
#include "Core/MqttTopics.h"
#include "Core/NvsKeys.h"
#define LOG_TAG "ValveMod"
#include "Core/ModuleLog.h"
#include "Modules/ValveModule/ValveRuntime.h"
#include <ArduinoJson.h>
#include <Arduino.h>
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

uint32_t ValveModule::nowEpoch_() const
{
    if (!timeSvc_ || !timeSvc_->isSynced || !timeSvc_->epoch) return 0;
    if (!timeSvc_->isSynced(timeSvc_->ctx)) return 0;
    return (uint32_t)timeSvc_->epoch(timeSvc_->ctx);
}

void ValveModule::writeLevel_(const ValveSlot& s, bool on) const
{
    if (s.appliedPin < 0) return;
    const bool level = on ? s.appliedActiveHigh : !s.appliedActiveHigh;
    digitalWrite((uint8_t)s.appliedPin, level ? HIGH : LOW);
}

bool ValveModule::applyPin_(uint8_t zone)
{
    if (zone >= Limits::Irrigation::MaxZones) return false;
    ValveSlot& s = slots_[zone];

    if (s.appliedPin >= 0 && s.appliedPin != s.cfg.pin) {
        // Leave the old pin closed before moving.
        writeLevel_(s, false);
    }

    s.appliedPin = s.cfg.pin;
    s.appliedActiveHigh = s.cfg.activeHigh;
    if (s.appliedPin < 0) return false;

    pinMode((uint8_t)s.appliedPin, OUTPUT);
    writeLevel_(s, false);
    return true;
}

void ValveModule::publishState_(uint8_t zone, const ValveSlot& s)
{
    if (!dataStore_) return;
    ValveRuntimeEntry e{};
    e.configured = (s.appliedPin >= 0);
    e.on = s.on;
    e.forced = s.forced;
    e.onSinceMs = s.onSinceMs;
    e.tsMs = s.tsMs;
    setValveState(*dataStore_, zone, e);
}

ValveSetStatus ValveModule::setValve_(uint8_t zone, bool on, bool forced)
{
    if (zone >= Limits::Irrigation::MaxZones) return VALVE_SET_ERR_UNKNOWN_ZONE;
    if (!valveMutex_ || xSemaphoreTake(valveMutex_, pdMS_TO_TICKS(200)) != pdTRUE) return VALVE_SET_ERR_NOT_READY;

    ValveSlot& s = slots_[zone];
    if (s.appliedPin < 0) {
        xSemaphoreGive(valveMutex_);
        return VALVE_SET_ERR_UNASSIGNED;
    }
    if (s.on == on) {
        xSemaphoreGive(valveMutex_);
        return VALVE_SET_OK;
    }

    const uint32_t nowMs = millis();
    writeLevel_(s, on);
    s.on = on;
    s.forced = (!on && forced);
    s.onSinceMs = on ? nowMs : 0;
    s.tsMs = nowMs;
    publishState_(zone, s);

    ValveChangedPayload p{};
    p.zone = zone;
    p.on = on ? 1 : 0;
    p.forced = forced ? 1 : 0;
    p.tsMs = nowMs;
    p.epochSec = nowEpoch_();
    postEdgeLocked_(p);
    xSemaphoreGive(valveMutex_);
    return VALVE_SET_OK;
}

void ValveModule::postEdgeLocked_(const ValveChangedPayload& p)
{
    // Older edges go first, the tracker needs them in order.
    if (pendingEdges_.empty() && eventBus_ && eventBus_->post(EventId::ValveChanged, &p, sizeof(p))) return;

    if (!pendingEdges_.push(p)) {
        LOGE("Valve edge queue full, oldest edge dropped (total=%lu)", (unsigned long)pendingEdges_.droppedCount());
    }
    LOGW("ValveChanged deferred zone=%u on=%u pending=%u",
         (unsigned)p.zone, (unsigned)p.on, (unsigned)pendingEdges_.size());
}

void ValveModule::flushPendingEdges_()
{
    if (!eventBus_ || !valveMutex_) return;
    if (xSemaphoreTake(valveMutex_, pdMS_TO_TICKS(50)) != pdTRUE) return;
    if (!pendingEdges_.empty()) {
        EventBus* bus = eventBus_;
        const uint8_t sent = pendingEdges_.drain([bus](const ValveChangedPayload& e) {
            return bus->post(EventId::ValveChanged, &e, sizeof(e));
        });
        if (sent > 0) {
            LOGI("Delivered %u deferred valve edge(s), pending=%u", (unsigned)sent, (unsigned)pendingEdges_.size());
        }
    }
    xSemaphoreGive(valveMutex_);
}

const char* ValveModule::runtimeSnapshotSuffix(uint8_t idx) const
{
    if (idx >= snapshotCount_) return nullptr;
    static char suffix[24];
    snprintf(suffix, sizeof(suffix), "rt/valves/v%u", (unsigned)snapshotZones_[idx]);
    return suffix;
}

bool ValveModule::buildRuntimeSnapshot(uint8_t idx, char* out, size_t len, uint32_t& maxTsOut) const
{
    if (idx >= snapshotCount_ || !out || len == 0 || !dataStore_) return false;
    const uint8_t zone = snapshotZones_[idx];

    ValveRuntimeEntry e{};
    if (!valveState(*dataStore_, zone, e)) return false;

    const uint32_t onS = e.on ? (uint32_t)((millis() - e.onSinceMs) / 1000U) : 0U;
    const int wrote = snprintf(out, len,
                               "{\"zone\":%u,\"on\":%s,\"forced_off\":%s,\"on_s\":%lu,\"ts\":%lu}",
                               (unsigned)zone,
                               e.on ? "true" : "false",
                               e.forced ? "true" : "false",
                               (unsigned long)onS,
                               (unsigned long)e.tsMs);
    if (wrote < 0 || (size_t)wrote >= len) return false;

    maxTsOut = (e.tsMs == 0U) ? 1U : e.tsMs;
    return true;
}

bool ValveModule::cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ValveModule* self = static_cast<ValveModule*>(userCtx);
    if (!self) return false;
    return self->handleSet_(req, reply, replyLen);
}

bool ValveModule::handleSet_(const CommandRequest& req, char* reply, size_t replyLen)
{
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, "valves.set", ErrorCode::MissingArgs);
        return false;
    }

    if (!args.containsKey("zone")) {
        writeCmdError_(reply, replyLen, "valves.set", ErrorCode::MissingZone);
        return false;
    }
    if (!args["zone"].is<uint8_t>()) {
        writeCmdError_(reply, replyLen, "valves.set", ErrorCode::BadZone);
        return false;
    }
    const uint8_t zone = args["zone"].as<uint8_t>();
    if (zone >= Limits::Irrigation::MaxZones) {
        writeCmdErrorZone_(reply, replyLen, "valves.set", ErrorCode::UnknownZone, zone);
        return false;
    }

    if (!args.containsKey("on")) {
        writeCmdErrorZone_(reply, replyLen, "valves.set", ErrorCode::MissingValue, zone);
        return false;
    }
    JsonVariantConst value = args["on"];
    bool requested = false;
    if (value.is<bool>()) {
        requested = value.as<bool>();
    } else if (value.is<int32_t>() || value.is<uint32_t>()) {
        requested = (value.as<int32_t>() != 0);
    } else if (value.is<const char*>()) {
        const char* s = value.as<const char*>();
        if (!s) s = "";
        if (strcmp(s, "true") == 0 || strcmp(s, "ON") == 0) requested = true;
        else if (strcmp(s, "false") == 0 || strcmp(s, "OFF") == 0) requested = false;
        else {
            writeCmdErrorZone_(reply, replyLen, "valves.set", ErrorCode::InvalidValue, zone);
            return false;
        }
    } else {
        writeCmdErrorZone_(reply, replyLen, "valves.set", ErrorCode::InvalidValue, zone);
        return false;
    }

    const ValveSetStatus st = setValve_(zone, requested, false);
    if (st != VALVE_SET_OK) {
        ErrorCode code = ErrorCode::Failed;
        if (st == VALVE_SET_ERR_UNKNOWN_ZONE) code = ErrorCode::UnknownZone;
        else if (st == VALVE_SET_ERR_NOT_READY) code = ErrorCode::NotReady;
        else if (st == VALVE_SET_ERR_UNASSIGNED) code = ErrorCode::Disabled;
        writeCmdErrorZone_(reply, replyLen, "valves.set", code, zone);
        return false;
    }

    LOGI("Manual %s zone=%u", requested ? "open" : "close", (unsigned)zone);
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"on\":%s}",
             (unsigned)zone, requested ? "true" : "false");
    return true;
}

void ValveModule::onEventStatic_(const Event& e, void* user)
{
    if (!user) return;
    static_cast<ValveModule*>(user)->onEvent_(e);
}

void ValveModule::onEvent_(const Event& e)
{
    if (e.id != EventId::ConfigChanged) return;
    if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
    const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;

    unsigned zone = 0;
    char tail[6] = {0};
    if (sscanf(p->nvsKey, "vl%u%5s", &zone, tail) != 2) return;
    if (zone >= Limits::Irrigation::MaxZones) return;

    portENTER_CRITICAL(&reconfigMux_);
    reconfigPendingMask_ |= (uint8_t)(1u << zone);
    portEXIT_CRITICAL(&reconfigMux_);
}

void ValveModule::applyPendingReconfig_()
{
    uint8_t pending = 0;
    portENTER_CRITICAL(&reconfigMux_);
    pending = reconfigPendingMask_;
    reconfigPendingMask_ = 0;
    portEXIT_CRITICAL(&reconfigMux_);
    if (pending == 0) return;

    for (uint8_t z = 0; z < Limits::Irrigation::MaxZones; ++z) {
        if ((pending & (1u << z)) == 0) continue;
        ValveSlot& s = slots_[z];
        if (s.appliedPin == s.cfg.pin && s.appliedActiveHigh == s.cfg.activeHigh) continue;

        if (s.on) (void)setValve_(z, false, true);
        if (!valveMutex_ || xSemaphoreTake(valveMutex_, pdMS_TO_TICKS(200)) != pdTRUE) {
            portENTER_CRITICAL(&reconfigMux_);
            reconfigPendingMask_ |= (uint8_t)(1u << z);
            portEXIT_CRITICAL(&reconfigMux_);
            continue;
        }
        const bool wired = applyPin_(z);
        s.tsMs = millis();
        publishState_(z, s);
        xSemaphoreGive(valveMutex_);
        LOGI("Valve zone=%u pin=%ld active_%s", (unsigned)z, (long)s.cfg.pin, s.cfg.activeHigh ? "high" : "low");
        if (!wired) {
            LOGW("Valve zone=%u unassigned", (unsigned)z);
        }
    }
}

void ValveModule::enforceMaxOn_(uint32_t nowMs)
{
    for (uint8_t z = 0; z < Limits::Irrigation::MaxZones; ++z) {
        const ValveSlot& s = slots_[z];
        if (!s.on || s.cfg.maxOnS <= 0) continue;
        const uint32_t elapsedMs = nowMs - s.onSinceMs;
        if (elapsedMs < (uint32_t)s.cfg.maxOnS * 1000U) continue;

        LOGW("Valve zone=%u open for %lus, forcing close", (unsigned)z, (unsigned long)(elapsedMs / 1000U));
        const ValveSetStatus st = setValve_(z, false, true);
        if (st != VALVE_SET_OK) {
            LOGE("Valve zone=%u cutoff failed (status=%u)", (unsigned)z, (unsigned)st);
        }
    }
}

void ValveModule::registerHaEntities_()
{
    if (!haSvc_ || !haSvc_->addSwitch) return;

    for (uint8_t z = 0; z < Limits::Irrigation::MaxZones; ++z) {
        if (slots_[z].cfg.pin < 0) continue;

        snprintf(haObjectId_[z], sizeof(haObjectId_[z]), "valve_z%u", (unsigned)z);
        snprintf(haName_[z], sizeof(haName_[z]), "Valve zone %u", (unsigned)z);
        snprintf(haStateTopic_[z], sizeof(haStateTopic_[z]), "rt/valves/v%u", (unsigned)z);
        snprintf(haPayloadOn_[z], sizeof(haPayloadOn_[z]),
                 "{\\\"cmd\\\":\\\"valves.set\\\",\\\"args\\\":{\\\"zone\\\":%u,\\\"on\\\":true}}", (unsigned)z);
        snprintf(haPayloadOff_[z], sizeof(haPayloadOff_[z]),
                 "{\\\"cmd\\\":\\\"valves.set\\\",\\\"args\\\":{\\\"zone\\\":%u,\\\"on\\\":false}}", (unsigned)z);

        const HASwitchEntry sw{
            "valves", haObjectId_[z], haName_[z],
            haStateTopic_[z], "{% if value_json.on %}ON{% else %}OFF{% endif %}",
            MqttTopics::SuffixCmd, haPayloadOn_[z], haPayloadOff_[z],
            "mdi:sprinkler-variant", nullptr
        };
        if (!haSvc_->addSwitch(haSvc_->ctx, &sw)) {
            LOGW("HA switch zone=%u not registered", (unsigned)z);
        }
    }
}

void ValveModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    logHub_ = services.get<LogHubService>("loghub");
    cmdSvc_ = services.get<CommandService>("cmd");
    timeSvc_ = services.get<TimeService>("time");
    haSvc_ = services.get<HAService>("ha");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;

    valveMutex_ = xSemaphoreCreateMutex();
    if (!valveMutex_) {
        LOGE("Valve mutex allocation failed");
    }

    if (eventBus_) {
        eventBus_->subscribe(EventId::ConfigChanged, &ValveModule::onEventStatic_, this);
    }

    for (uint8_t i = 0; i < Limits::Irrigation::MaxZones; ++i) {
        ValveSlot& s = slots_[i];

        snprintf(cfgModuleName_[i], sizeof(cfgModuleName_[i]), "valves/v%u", (unsigned)i);
        snprintf(nvsPinKey_[i], sizeof(nvsPinKey_[i]), NvsKeys::Valve::PinFmt, (unsigned)i);
        snprintf(nvsActiveHighKey_[i], sizeof(nvsActiveHighKey_[i]), NvsKeys::Valve::ActiveHighFmt, (unsigned)i);
        snprintf(nvsMaxOnKey_[i], sizeof(nvsMaxOnKey_[i]), NvsKeys::Valve::MaxOnFmt, (unsigned)i);

        cfgPinVar_[i].nvsKey = nvsPinKey_[i];
        cfgPinVar_[i].jsonName = "pin";
        cfgPinVar_[i].moduleName = cfgModuleName_[i];
        cfgPinVar_[i].type = ConfigType::Int32;
        cfgPinVar_[i].value = &s.cfg.pin;
        cfgPinVar_[i].persistence = ConfigPersistence::Persistent;
        cfgPinVar_[i].size = 0;
        cfg.registerVar(cfgPinVar_[i]);

        cfgActiveHighVar_[i].nvsKey = nvsActiveHighKey_[i];
        cfgActiveHighVar_[i].jsonName = "active_high";
        cfgActiveHighVar_[i].moduleName = cfgModuleName_[i];
        cfgActiveHighVar_[i].type = ConfigType::Bool;
        cfgActiveHighVar_[i].value = &s.cfg.activeHigh;
        cfgActiveHighVar_[i].persistence = ConfigPersistence::Persistent;
        cfgActiveHighVar_[i].size = 0;
        cfg.registerVar(cfgActiveHighVar_[i]);

        cfgMaxOnVar_[i].nvsKey = nvsMaxOnKey_[i];
        cfgMaxOnVar_[i].jsonName = "max_on_s";
        cfgMaxOnVar_[i].moduleName = cfgModuleName_[i];
        cfgMaxOnVar_[i].type = ConfigType::Int32;
        cfgMaxOnVar_[i].value = &s.cfg.maxOnS;
        cfgMaxOnVar_[i].persistence = ConfigPersistence::Persistent;
        cfgMaxOnVar_[i].size = 0;
        cfg.registerVar(cfgMaxOnVar_[i]);
    }

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "valves.set", cmdSet_, this);
    }
    (void)logHub_;
}

void ValveModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    snapshotCount_ = 0;
    for (uint8_t z = 0; z < Limits::Irrigation::MaxZones; ++z) {
        ValveSlot& s = slots_[z];
        if (s.cfg.maxOnS < 0) s.cfg.maxOnS = 0;
        if (applyPin_(z)) {
            snapshotZones_[snapshotCount_++] = z;
        }
        s.on = false;
        s.tsMs = millis();
        publishState_(z, s);
    }
    registerHaEntities_();
    LOGI("Valve module ready (wired=%u)", (unsigned)snapshotCount_);
}

void ValveModule::loop()
{
    applyPendingReconfig_();
    flushPendingEdges_();
    enforceMaxOn_(millis());
    vTaskDelay(pdMS_TO_TICKS(Limits::Irrigation::LoopDelayMs));
}
