/**
 * @file MQTTModule.cpp
 * @brief MQTT connection, inbound routing and retained config publication.
 */
#include "MQTTModule.h"
#include "Core/Runtime.h"
#include "Core/MqttTopics.h"
#include <ArduinoJson.h>
#include <esp_system.h>
#include <initializer_list>
#include "Core/EventBus/EventPayloads.h"
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

static uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV) {
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = esp_random();
    uint32_t delta = r % (2U * span + 1U);
    int32_t signedDelta = (int32_t)delta - (int32_t)span;
    int32_t out = (int32_t)baseMs + signedDelta;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

static bool isAnyOf(const char* key, std::initializer_list<const char*> keys)
{
    if (!key || key[0] == '\0') return false;
    for (const char* candidate : keys) {
        if (candidate && strcmp(key, candidate) == 0) return true;
    }
    return false;
}

static bool isMqttConnKey(const char* key)
{
    return isAnyOf(key, {
        NvsKeys::Mqtt::BaseTopic,
        NvsKeys::Mqtt::Host,
        NvsKeys::Mqtt::Port,
        NvsKeys::Mqtt::User,
        NvsKeys::Mqtt::Pass
    });
}

// Zone ledger blobs are rewritten after every flux; they are published on rt/irrigation.
static bool isZoneLedgerKey(const char* key)
{
    unsigned zone = 0;
    char tail[4] = {0};
    return sscanf(key, "zn%u%3s", &zone, tail) == 2 && strcmp(tail, "lg") == 0;
}

bool MQTTModule::svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->publish(topic, payload, qos, retain) : false;
}

void MQTTModule::svcFormatTopic(void* ctx, const char* suffix, char* out, size_t outLen)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    if (!self) return;
    self->formatTopic(out, outLen, suffix);
}

bool MQTTModule::svcIsConnected(void* ctx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->isConnected() : false;
}

void MQTTModule::setState(MQTTState s) {
    state = s;
    stateTs = millis();
    if (dataStore) {
        setMqttReady(*dataStore, s == MQTTState::Connected);
    }
}

static void makeDeviceId(char* out, size_t len) {
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(out, len, "ESP32-%02X%02X%02X", mac[3], mac[4], mac[5]);
}

void MQTTModule::buildTopics() {
    formatTopic(topicCmd, sizeof(topicCmd), MqttTopics::SuffixCmd);
    formatTopic(topicAck, sizeof(topicAck), MqttTopics::SuffixAck);
    formatTopic(topicStatus, sizeof(topicStatus), MqttTopics::SuffixStatus);
    formatTopic(topicCfgSet, sizeof(topicCfgSet), MqttTopics::SuffixCfgSet);
    formatTopic(topicCfgAck, sizeof(topicCfgAck), MqttTopics::SuffixCfgAck);
    formatTopic(topicWeatherPrefix, sizeof(topicWeatherPrefix), MqttTopics::SuffixWeatherIn);
    snprintf(topicWeatherSub, sizeof(topicWeatherSub), "%s+", topicWeatherPrefix);
}

void MQTTModule::connectMqtt() {
    buildTopics();
    client.setServer(cfgData.host, (uint16_t)cfgData.port);
    if (cfgData.user[0] != '\0') client.setCredentials(cfgData.user, cfgData.pass);
    client.setWill(topicStatus, 1, true, "{\"online\":false}");
    client.connect();
    setState(MQTTState::Connecting);
    LOGI("Connecting to %s:%ld", cfgData.host, (long)cfgData.port);
}

void MQTTModule::onConnect(bool) {
    LOGI("Connected subscribe %s", topicCmd);
    client.subscribe(topicCmd, 0);
    client.subscribe(topicCfgSet, 1);
    client.subscribe(topicWeatherSub, 0);

    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
    setState(MQTTState::Connected);

    publishStatus_(true);

    if (snapshotBuild) {
        snapshotPending = true;
        snapshotPendingDirtyMask = SnapshotRelevantMask;
        lastSnapshotPublishMs = 0;
    }

    // cfg/* goes out from loop() after the first snapshot flush.
    _pendingPublish = true;
}

void MQTTModule::onDisconnect(AsyncMqttClientDisconnectReason reason) {
    LOGW("Disconnected reason=%u", (unsigned)reason);
    cfgRampActive_ = false;
    cfgRampRestartRequested_ = false;
    cfgRampIndex_ = 0;
    setState(MQTTState::ErrorWait);
}

void MQTTModule::onMessage(char* topic, char* payload, AsyncMqttClientMessageProperties,
                           size_t len, size_t, size_t total) {
    if (!rxQ) return;
    if (!topic || !payload) {
        countRxDrop_();
        return;
    }
    if (len != total) {
        countRxDrop_();
        return;
    }

    const size_t topicCap = sizeof(RxMsg{}.topic);
    const size_t payloadCap = sizeof(RxMsg{}.payload);
    const size_t topicLen = strlen(topic);
    if (topicLen >= topicCap || len >= payloadCap) {
        countOversizeDrop_();
        return;
    }

    RxMsg m{};
    memcpy(m.topic, topic, topicLen);
    m.topic[topicLen] = '\0';
    memcpy(m.payload, payload, len);
    m.payload[len] = '\0';

    if (xQueueSend(rxQ, &m, 0) != pdTRUE) {
        countRxDrop_();
    }
}

void MQTTModule::refreshConfigModules()
{
    if (cfgSvc && cfgSvc->listModules) {
        cfgModuleCount = cfgSvc->listModules(cfgSvc->ctx, cfgModules, Limits::Mqtt::Capacity::CfgTopicMax);
        if (cfgModuleCount >= Limits::Mqtt::Capacity::CfgTopicMax) {
            LOGW("Config module list reached limit (%u), some cfg/* blocks may be omitted",
                 (unsigned)Limits::Mqtt::Capacity::CfgTopicMax);
        }
    } else {
        cfgModuleCount = 0;
    }
}

void MQTTModule::beginConfigRamp_(uint32_t nowMs)
{
    if (!cfgSvc || !cfgSvc->toJsonModule) {
        cfgRampActive_ = false;
        cfgRampRestartRequested_ = false;
        cfgRampIndex_ = 0;
        return;
    }

    refreshConfigModules();
    cfgRampIndex_ = 0;
    cfgRampNextMs_ = nowMs;
    cfgRampRestartRequested_ = false;
    cfgRampActive_ = (cfgModuleCount > 0);
}

void MQTTModule::runConfigRamp_(uint32_t nowMs)
{
    if (!cfgRampActive_) return;
    if (state != MQTTState::Connected) {
        cfgRampActive_ = false;
        cfgRampRestartRequested_ = false;
        cfgRampIndex_ = 0;
        return;
    }

    if (cfgRampRestartRequested_) {
        beginConfigRamp_(nowMs);
    }

    if ((int32_t)(nowMs - cfgRampNextMs_) < 0) return;
    if (cfgRampIndex_ >= cfgModuleCount) {
        cfgRampActive_ = false;
        return;
    }

    (void)publishConfigModuleAt(cfgRampIndex_, true);
    ++cfgRampIndex_;
    cfgRampNextMs_ = nowMs + Limits::Mqtt::Timing::CfgRampStepMs;

    if (cfgRampIndex_ >= cfgModuleCount) {
        cfgRampActive_ = false;
    }
}

bool MQTTModule::publishConfigModuleAt(size_t idx, bool retained)
{
    if (!cfgSvc || !cfgSvc->toJsonModule) return false;
    if (idx >= cfgModuleCount) return false;
    const char* module = cfgModules[idx];
    if (!module || module[0] == '\0') return false;

    char moduleTopic[Limits::Mqtt::Buffers::DynamicTopic] = {0};
    const int tw = snprintf(moduleTopic, sizeof(moduleTopic), "%s/%s/cfg/%s", cfgData.baseTopic, deviceId, module);
    if (!(tw > 0 && (size_t)tw < sizeof(moduleTopic))) {
        LOGW("cfg publish: topic truncated for module=%s", module);
        return false;
    }

    bool truncated = false;
    const bool any = cfgSvc->toJsonModule(cfgSvc->ctx, module, stateCfgBuf, sizeof(stateCfgBuf), &truncated);
    if (truncated) {
        LOGW("cfg/%s truncated (buffer=%u)", module, (unsigned)sizeof(stateCfgBuf));
        // A partial JSON block is never published.
        if (!writeErrorJson(stateCfgBuf, sizeof(stateCfgBuf), ErrorCode::CfgTruncated, "cfg")) {
            snprintf(stateCfgBuf, sizeof(stateCfgBuf), "{\"ok\":false}");
        }
    } else if (!any) {
        return false;
    }

    if (!publish(moduleTopic, stateCfgBuf, 1, retained)) {
        LOGW("cfg/%s publish failed", module);
        return false;
    }
    return true;
}

void MQTTModule::publishStatus_(bool online)
{
    char ip[16] = {0};
    const bool hasIp = wifiSvc && wifiSvc->getIP && wifiSvc->getIP(wifiSvc->ctx, ip, sizeof(ip));
    char payload[96];
    if (hasIp) {
        snprintf(payload, sizeof(payload), "{\"online\":%s,\"ip\":\"%s\"}", online ? "true" : "false", ip);
    } else {
        snprintf(payload, sizeof(payload), "{\"online\":%s}", online ? "true" : "false");
    }
    if (!publish(topicStatus, payload, 1, true)) {
        LOGW("status publish failed");
    }
}

bool MQTTModule::publish(const char* topic, const char* payload, int qos, bool retain)
{
    if (!topic || !payload) return false;
    if (state != MQTTState::Connected) return false;
    const uint16_t packetId = client.publish(topic, qos, retain, payload);
    if (packetId == 0U && qos > 0) {
        LOGW("mqtt publish rejected topic=%s qos=%d retain=%d", topic, qos, retain ? 1 : 0);
        return false;
    }
    LOGD("MQTT TX t=%s r=%d %s", topic, retain ? 1 : 0, payload);
    return true;
}

void MQTTModule::formatTopic(char* out, size_t outLen, const char* suffix) const
{
    if (!out || outLen == 0 || !suffix) return;
    snprintf(out, outLen, "%s/%s/%s", cfgData.baseTopic, deviceId, suffix);
}

bool MQTTModule::addRuntimePublisher(const char* topic, uint32_t periodMs, int qos, bool retain,
                                     bool (*build)(MQTTModule* self, char* out, size_t outLen))
{
    if (!topic || !build) return false;
    if (publisherCount >= Limits::Mqtt::Capacity::MaxPublishers) return false;
    RuntimePublisher& p = publishers[publisherCount++];
    p.topic = topic;
    p.periodMs = periodMs;
    p.qos = qos;
    p.retain = retain;
    p.build = build;
    p.lastMs = 0;
    return true;
}

void MQTTModule::processRx(const RxMsg& msg) {
    if (strcmp(msg.topic, topicCmd) == 0) return processRxCmd_(msg);
    if (strcmp(msg.topic, topicCfgSet) == 0) return processRxCfgSet_(msg);

    const size_t wxLen = strlen(topicWeatherPrefix);
    if (wxLen > 0 && strncmp(msg.topic, topicWeatherPrefix, wxLen) == 0) {
        return processRxWeather_(msg, msg.topic + wxLen);
    }
    publishRxError_(topicAck, ErrorCode::UnknownTopic, "rx", false);
}

void MQTTModule::processRxCmd_(const RxMsg& msg)
{
    static constexpr size_t CMD_DOC_CAPACITY = Limits::JsonCmdBuf;
    static StaticJsonDocument<CMD_DOC_CAPACITY> doc;
    doc.clear();
    DeserializationError err = deserializeJson(doc, msg.payload);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGW("processRxCmd: bad cmd json (topic=%s)", msg.topic);
        publishRxError_(topicAck, ErrorCode::BadCmdJson, "cmd", true);
        return;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonVariantConst cmdVar = root["cmd"];
    const char* cmdVal = cmdVar.is<const char*>() ? cmdVar.as<const char*>() : nullptr;
    if (!cmdVal || cmdVal[0] == '\0') {
        LOGW("processRxCmd: missing cmd field");
        publishRxError_(topicAck, ErrorCode::MissingCmd, "cmd", true);
        return;
    }
    if (!cmdSvc || !cmdSvc->execute) {
        LOGW("processRxCmd: command service unavailable (cmd=%s)", cmdVal);
        publishRxError_(topicAck, ErrorCode::CmdServiceUnavailable, "cmd", false);
        return;
    }

    char cmd[Limits::Mqtt::Buffers::CmdName];
    snprintf(cmd, sizeof(cmd), "%s", cmdVal);

    const char* argsJson = nullptr;
    char argsBuf[Limits::Mqtt::Buffers::CmdArgs] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            LOGW("processRxCmd: args too large (cmd=%s)", cmd);
            publishRxError_(topicAck, ErrorCode::ArgsTooLarge, "cmd", true);
            return;
        }
        argsJson = argsBuf;
    }

    replyBuf[0] = '\0';
    const bool ok = cmdSvc->execute(cmdSvc->ctx, cmd, msg.payload, argsJson, replyBuf, sizeof(replyBuf));
    if (!ok) {
        LOGW("processRxCmd: command failed (cmd=%s)", cmd);
        // Handlers write their own error object; forward it when present.
        if (replyBuf[0] != '{') {
            publishRxError_(topicAck, ErrorCode::CmdHandlerFailed, "cmd", false);
            return;
        }
        ++handlerFailCount_;
        syncRxMetrics_();
        if (!publish(topicAck, replyBuf, 0, false)) {
            LOGW("cmd error ack publish failed cmd=%s", cmd);
        }
        return;
    }

    int wrote = snprintf(ackBuf, sizeof(ackBuf), "{\"ok\":true,\"cmd\":\"%s\",\"reply\":%s}",
                         cmd, replyBuf[0] ? replyBuf : "{}");
    if (!(wrote > 0 && (size_t)wrote < sizeof(ackBuf))) {
        LOGW("processRxCmd: ack overflow (cmd=%s, wrote=%d)", cmd, wrote);
        publishRxError_(topicAck, ErrorCode::InternalAckOverflow, "cmd", false);
        return;
    }
    if (!publish(topicAck, ackBuf, 0, false)) {
        LOGW("cmd ack publish failed cmd=%s", cmd);
    }
}

void MQTTModule::processRxCfgSet_(const RxMsg& msg)
{
    if (!cfgSvc || !cfgSvc->applyJson) {
        publishRxError_(topicCfgAck, ErrorCode::CfgServiceUnavailable, "cfg/set", false);
        return;
    }

    static constexpr size_t CFG_DOC_CAPACITY = Limits::JsonCfgBuf;
    static StaticJsonDocument<CFG_DOC_CAPACITY> cfgDoc;
    cfgDoc.clear();
    const DeserializationError cfgErr = deserializeJson(cfgDoc, msg.payload);
    if (cfgErr || !cfgDoc.is<JsonObjectConst>()) {
        publishRxError_(topicCfgAck, ErrorCode::BadCfgJson, "cfg/set", true);
        return;
    }

    if (!cfgSvc->applyJson(cfgSvc->ctx, msg.payload)) {
        publishRxError_(topicCfgAck, ErrorCode::CfgApplyFailed, "cfg/set", false);
        return;
    }
    // cfg/<module> republication follows the ConfigChanged events.

    if (!writeOkJson(ackBuf, sizeof(ackBuf), "cfg/set")) {
        snprintf(ackBuf, sizeof(ackBuf), "{\"ok\":true}");
    }
    if (!publish(topicCfgAck, ackBuf, 1, false)) {
        LOGW("cfg/set ack publish failed");
    }
}

void MQTTModule::processRxWeather_(const RxMsg& msg, const char* kind)
{
    if (!kind || kind[0] == '\0' || strchr(kind, '/') != nullptr) {
        ++parseFailCount_;
        syncRxMetrics_();
        LOGW("weather rx: bad topic %s", msg.topic);
        return;
    }
    if (!cmdSvc || !cmdSvc->execute) {
        ++handlerFailCount_;
        syncRxMetrics_();
        return;
    }

    static StaticJsonDocument<Limits::Weather::JsonCmdBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, msg.payload);
    if (err) {
        ++parseFailCount_;
        syncRxMetrics_();
        LOGW("weather rx: bad payload kind=%s", kind);
        return;
    }

    // Plain numbers are wrapped; objects carry value/ts themselves.
    char argsBuf[Limits::Mqtt::Buffers::CmdArgs] = {0};
    int wrote = 0;
    if (doc.is<float>()) {
        wrote = snprintf(argsBuf, sizeof(argsBuf), "{\"kind\":\"%s\",\"value\":%s}", kind, msg.payload);
    } else if (doc.is<JsonObject>()) {
        JsonObject obj = doc.as<JsonObject>();
        obj["kind"] = kind;
        wrote = (int)serializeJson(doc, argsBuf, sizeof(argsBuf));
    } else {
        ++parseFailCount_;
        syncRxMetrics_();
        LOGW("weather rx: unsupported payload kind=%s", kind);
        return;
    }
    if (!(wrote > 0 && (size_t)wrote < sizeof(argsBuf))) {
        ++parseFailCount_;
        syncRxMetrics_();
        LOGW("weather rx: args too large kind=%s", kind);
        return;
    }

    if (!cmdSvc->execute(cmdSvc->ctx, "weather.sample", msg.payload, argsBuf, replyBuf, sizeof(replyBuf))) {
        ++handlerFailCount_;
        syncRxMetrics_();
        LOGW("weather rx: rejected kind=%s reply=%s", kind, replyBuf);
    }
}

void MQTTModule::publishRxError_(const char* ackTopic, ErrorCode code, const char* where, bool parseFailure)
{
    if (!ackTopic || ackTopic[0] == '\0') return;
    if (parseFailure) ++parseFailCount_;
    else ++handlerFailCount_;
    syncRxMetrics_();

    if (!writeErrorJson(ackBuf, sizeof(ackBuf), code, where)) {
        snprintf(ackBuf, sizeof(ackBuf), "{\"ok\":false}");
    }
    if (!publish(ackTopic, ackBuf, 0, false)) {
        LOGW("rx error ack publish failed topic=%s", ackTopic);
    }
}

void MQTTModule::syncRxMetrics_()
{
    if (!dataStore) return;
    setMqttRxDrop(*dataStore, rxDropCount_);
    setMqttOversizeDrop(*dataStore, oversizeDropCount_);
    setMqttParseFail(*dataStore, parseFailCount_);
    setMqttHandlerFail(*dataStore, handlerFailCount_);
}

void MQTTModule::countRxDrop_()
{
    ++rxDropCount_;
    syncRxMetrics_();
}

void MQTTModule::countOversizeDrop_()
{
    ++oversizeDropCount_;
    ++rxDropCount_;
    syncRxMetrics_();
}

void MQTTModule::flushSnapshots_(uint32_t now)
{
    if (!snapshotPending || !snapshotBuild) return;

    uint32_t pendingMask = snapshotPendingDirtyMask & SnapshotRelevantMask;
    if (pendingMask == 0U) pendingMask = SnapshotRelevantMask;

    const uint32_t minMs = cfgData.snapshotMinPublishMs;
    const bool withinThrottle = (minMs != 0U) && ((uint32_t)(now - lastSnapshotPublishMs) < minMs);

    if (withinThrottle) {
        // Valve changes bypass the throttle; the rest waits for the window.
        if ((pendingMask & DIRTY_ACTUATORS) == 0U) return;
        snapshotActiveDirtyMask = DIRTY_ACTUATORS;
        (void)snapshotBuild(this, publishBuf, sizeof(publishBuf));
        snapshotActiveDirtyMask = 0;
        snapshotPendingDirtyMask &= ~(uint32_t)DIRTY_ACTUATORS;
        if ((snapshotPendingDirtyMask & SnapshotRelevantMask) == 0U) snapshotPending = false;
        return;
    }

    snapshotActiveDirtyMask = pendingMask;
    (void)snapshotBuild(this, publishBuf, sizeof(publishBuf));
    snapshotActiveDirtyMask = 0;
    lastSnapshotPublishMs = now;
    snapshotPending = false;
    snapshotPendingDirtyMask = 0;
}

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);
    cfg.registerVar(baseTopicVar);
    cfg.registerVar(enabledVar);
    cfg.registerVar(snapshotMinVar);

    wifiSvc = services.get<WifiService>("wifi");
    cmdSvc = services.get<CommandService>("cmd");
    cfgSvc = services.get<ConfigStoreService>("config");

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;

    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore = dsSvc ? dsSvc->store : nullptr;
    rxDropCount_ = 0;
    oversizeDropCount_ = 0;
    parseFailCount_ = 0;
    handlerFailCount_ = 0;
    syncRxMetrics_();

    mqttSvc.publish = MQTTModule::svcPublish;
    mqttSvc.formatTopic = MQTTModule::svcFormatTopic;
    mqttSvc.isConnected = MQTTModule::svcIsConnected;
    mqttSvc.ctx = this;
    services.add("mqtt", &mqttSvc);

    if (eventBus) {
        eventBus->subscribe(EventId::DataChanged, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::DataSnapshotAvailable, &MQTTModule::onEventStatic, this);
        eventBus->subscribe(EventId::ConfigChanged, &MQTTModule::onEventStatic, this);
    }

    makeDeviceId(deviceId, sizeof(deviceId));
    buildTopics();

    rxQ = xQueueCreate(Limits::Mqtt::Capacity::RxQueueLen, sizeof(RxMsg));
    if (!rxQ) {
        LOGE("RX queue allocation failed");
    }

    client.onConnect([this](bool sp){ this->onConnect(sp); });
    client.onDisconnect([this](AsyncMqttClientDisconnectReason r){ this->onDisconnect(r); });
    client.onMessage([this](char* t, char* p, AsyncMqttClientMessageProperties pr, size_t l, size_t i, size_t tot){
        this->onMessage(t, p, pr, l, i, tot);
    });

    refreshConfigModules();

    LOGI("Init id=%s topic=%s cfgModules=%u", deviceId, topicCmd, (unsigned)cfgModuleCount);

    _netReady = dataStore ? wifiReady(*dataStore) : false;
    _netReadyTs = millis();
    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;

    setState(cfgData.enabled ? MQTTState::WaitingNetwork : MQTTState::Disabled);
}

void MQTTModule::loop() {
    if (!cfgData.enabled) {
        if (state != MQTTState::Disabled) {
            client.disconnect();
            setState(MQTTState::Disabled);
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::DisabledDelayMs));
        return;
    }

    switch (state) {
    case MQTTState::Disabled: setState(MQTTState::WaitingNetwork); break;
    case MQTTState::WaitingNetwork:
        if (!_startupReady) break;
        if (!_netReady) break;
        if (millis() - _netReadyTs >= Limits::Mqtt::Timing::NetWarmupMs) connectMqtt();
        break;
    case MQTTState::Connecting:
        if (millis() - stateTs > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            client.disconnect();
            setState(MQTTState::ErrorWait);
        }
        break;
    case MQTTState::Connected: {
        RxMsg m;
        while (rxQ && xQueueReceive(rxQ, &m, 0) == pdTRUE) processRx(m);
        const uint32_t now = millis();

        flushSnapshots_(now);

        if (_pendingPublish) {
            _pendingPublish = false;
            if (cfgRampActive_) cfgRampRestartRequested_ = true;
            else beginConfigRamp_(now);
        }
        runConfigRamp_(now);

        for (uint8_t i = 0; i < publisherCount; ++i) {
            RuntimePublisher& p = publishers[i];
            if (!p.topic || !p.build) continue;
            if (p.periodMs == 0) continue;
            if ((uint32_t)(now - p.lastMs) < p.periodMs) continue;
            if (p.build(this, publishBuf, sizeof(publishBuf))) {
                publish(p.topic, publishBuf, p.qos, p.retain);
            } else {
                LOGW("runtime snapshot build failed topic=%s (buffer=%u)", p.topic, (unsigned)sizeof(publishBuf));
            }
            p.lastMs = now;
        }
        break;
    }
    case MQTTState::ErrorWait:
        if (!_netReady) {
            setState(MQTTState::WaitingNetwork);
            break;
        }
        if (millis() - stateTs >= _retryDelayMs) {
            _retryCount++;
            uint32_t next = _retryDelayMs;

            if      (next < Limits::Mqtt::Backoff::Step1Ms)   next = Limits::Mqtt::Backoff::Step1Ms;
            else if (next < Limits::Mqtt::Backoff::Step2Ms)   next = Limits::Mqtt::Backoff::Step2Ms;
            else if (next < Limits::Mqtt::Backoff::Step3Ms)   next = Limits::Mqtt::Backoff::Step3Ms;
            else if (next < Limits::Mqtt::Backoff::Step4Ms)   next = Limits::Mqtt::Backoff::Step4Ms;
            else                                               next = Limits::Mqtt::Backoff::MaxMs;

            next = clampU32(next, Limits::Mqtt::Backoff::MinMs, Limits::Mqtt::Backoff::MaxMs);
            _retryDelayMs = jitterMs(next, Limits::Mqtt::Backoff::JitterPct);
            setState(MQTTState::WaitingNetwork);
        }
        break;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::LoopDelayMs));
}

void MQTTModule::onEventStatic(const Event& e, void* user)
{
    static_cast<MQTTModule*>(user)->onEvent(e);
}

void MQTTModule::onEvent(const Event& e)
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

        if (_netReady) {
            LOGI("networkReady=true -> warmup");
            if (state != MQTTState::Connected) setState(MQTTState::WaitingNetwork);
        } else {
            LOGI("networkReady=false -> disconnect and wait");
            client.disconnect();
            setState(MQTTState::WaitingNetwork);
        }
        return;
    }

    if (e.id == EventId::DataSnapshotAvailable) {
        if (!e.payload || e.len < sizeof(DataSnapshotPayload)) return;
        const DataSnapshotPayload* p = (const DataSnapshotPayload*)e.payload;
        const uint32_t relevant = p->dirtyFlags & SnapshotRelevantMask;
        if (relevant == 0U) return;
        snapshotPendingDirtyMask |= relevant;
        snapshotPending = true;
        return;
    }

    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        const char* key = p->nvsKey;
        if (key[0] == '\0') return;
        if (isZoneLedgerKey(key)) return;

        if (isMqttConnKey(key)) {
            LOGI("MQTT config changed (%s) -> reconnect", key);
            client.disconnect();
            _netReadyTs = millis();
            setState(MQTTState::WaitingNetwork);
        }
        _pendingPublish = true;
        return;
    }
}
