/**
 * @file HAModule.cpp
 * @brief Home Assistant discovery documents for the registered entities.
 */

#include "HAModule.h"
#include "Modules/Network/HAModule/HARuntime.h"
#include "Core/MqttTopics.h"
#include "Core/SystemLimits.h"
#include <esp_system.h>
#include <ctype.h>
#include <stdarg.h>
#include <string.h>

#define LOG_TAG "HAModule"
#include "Core/ModuleLog.h"

#ifndef IRRIGO_FIRMWARE_VERSION
#define IRRIGO_FIRMWARE_VERSION "unknown"
#endif

static bool formatChecked(char* out, size_t outLen, const char* fmt, ...)
{
    if (!out || outLen == 0 || !fmt) return false;
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);
    return (n >= 0) && ((size_t)n < outLen);
}

// Appends `,"key":"value"` when value is set.
static bool appendField(char* out, size_t outLen, const char* key, const char* value)
{
    if (!value || value[0] == '\0') return true;
    const size_t used = strlen(out);
    if (used >= outLen) return false;
    return formatChecked(out + used, outLen - used, ",\"%s\":\"%s\"", key, value);
}

void HAModule::makeHexNodeId(char* out, size_t len)
{
    if (!out || len == 0) return;
    uint8_t mac[6];
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(out, len, "0x%02x%02x%02x%02x%02x%02x",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
}

void HAModule::sanitizeId(const char* in, char* out, size_t outLen)
{
    if (!out || outLen == 0) return;
    out[0] = '\0';
    if (!in) return;

    size_t w = 0;
    for (size_t i = 0; in[i] != '\0' && w + 1 < outLen; ++i) {
        char c = in[i];
        if (isalnum((unsigned char)c)) {
            out[w++] = (char)tolower((unsigned char)c);
        } else {
            out[w++] = '_';
        }
    }
    out[w] = '\0';
}

uint16_t HAModule::hash3Digits(const char* in)
{
    // 32-bit FNV-1a reduced to 3 decimal digits for short per-device entity prefixes.
    uint32_t h = 2166136261u;
    const char* p = in ? in : "";
    while (*p) {
        h ^= (uint8_t)(*p++);
        h *= 16777619u;
    }
    return (uint16_t)(h % 1000u);
}

bool HAModule::svcAddSensor(void* ctx, const HASensorEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    return self->addSensorEntry(*entry);
}

bool HAModule::svcAddBinarySensor(void* ctx, const HABinarySensorEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    return self->addBinarySensorEntry(*entry);
}

bool HAModule::svcAddSwitch(void* ctx, const HASwitchEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    return self->addSwitchEntry(*entry);
}

bool HAModule::svcAddNumber(void* ctx, const HANumberEntry* entry)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self || !entry) return false;
    return self->addNumberEntry(*entry);
}

bool HAModule::svcRequestRefresh(void* ctx)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    if (!self) return false;
    self->requestAutoconfigRefresh();
    return true;
}

// Replace-or-append keyed by (ownerId, objectSuffix).
template<typename Entry, size_t N>
static bool upsertEntry(Entry (&table)[N], uint8_t& count, const Entry& entry)
{
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(table[i].ownerId, entry.ownerId) == 0 &&
            strcmp(table[i].objectSuffix, entry.objectSuffix) == 0) {
            table[i] = entry;
            return true;
        }
    }
    if (count >= N) return false;
    table[count++] = entry;
    return true;
}

bool HAModule::addSensorEntry(const HASensorEntry& entry)
{
    if (!entry.ownerId || !entry.objectSuffix || !entry.name || !entry.stateTopicSuffix || !entry.valueTemplate) {
        return false;
    }
    if (!upsertEntry(sensors_, sensorCount_, entry)) {
        LOGW("sensor table full, dropped %s/%s", entry.ownerId, entry.objectSuffix);
        return false;
    }
    requestAutoconfigRefresh();
    return true;
}

bool HAModule::addBinarySensorEntry(const HABinarySensorEntry& entry)
{
    if (!entry.ownerId || !entry.objectSuffix || !entry.name || !entry.stateTopicSuffix || !entry.valueTemplate) {
        return false;
    }
    if (!upsertEntry(binarySensors_, binarySensorCount_, entry)) {
        LOGW("binary_sensor table full, dropped %s/%s", entry.ownerId, entry.objectSuffix);
        return false;
    }
    requestAutoconfigRefresh();
    return true;
}

bool HAModule::addSwitchEntry(const HASwitchEntry& entry)
{
    if (!entry.ownerId || !entry.objectSuffix || !entry.name || !entry.stateTopicSuffix ||
        !entry.valueTemplate || !entry.commandTopicSuffix || !entry.payloadOn || !entry.payloadOff) {
        return false;
    }
    if (!upsertEntry(switches_, switchCount_, entry)) {
        LOGW("switch table full, dropped %s/%s", entry.ownerId, entry.objectSuffix);
        return false;
    }
    requestAutoconfigRefresh();
    return true;
}

bool HAModule::addNumberEntry(const HANumberEntry& entry)
{
    if (!entry.ownerId || !entry.objectSuffix || !entry.name || !entry.stateTopicSuffix ||
        !entry.valueTemplate || !entry.commandTopicSuffix || !entry.commandTemplate) {
        return false;
    }
    if (!upsertEntry(numbers_, numberCount_, entry)) {
        LOGW("number table full, dropped %s/%s", entry.ownerId, entry.objectSuffix);
        return false;
    }
    requestAutoconfigRefresh();
    return true;
}

bool HAModule::buildObjectId(const char* suffix, char* out, size_t outLen) const
{
    if (!suffix || !out || outLen == 0) return false;
    char raw[256] = {0};
    snprintf(raw, sizeof(raw), "irrigo%03u_%s", (unsigned)entityHash3_, suffix);
    sanitizeId(raw, out, outLen);
    return out[0] != '\0';
}

bool HAModule::buildUniqueId(const char* objectId, const char* name, char* out, size_t outLen) const
{
    if (!objectId || !out || outLen == 0) return false;
    char cleanName[96] = {0};
    sanitizeId(name ? name : "", cleanName, sizeof(cleanName));
    if (cleanName[0] != '\0') {
        snprintf(out, outLen, "%s_%s_%s", deviceId, objectId, cleanName);
    } else {
        snprintf(out, outLen, "%s_%s", deviceId, objectId);
    }
    return out[0] != '\0';
}

bool HAModule::publishEntity(const char* component, const char* objectId, const char* name,
                             const char* specific, const char* entityCategory, const char* icon)
{
    if (!component || !objectId || !name || !specific || !mqttSvc || !mqttSvc->publish) return false;

    char uniqueId[256] = {0};
    if (!buildUniqueId(objectId, name, uniqueId, sizeof(uniqueId))) return false;

    char extra[160] = {0};
    if (!appendField(extra, sizeof(extra), "entity_category", entityCategory) ||
        !appendField(extra, sizeof(extra), "icon", icon)) {
        return false;
    }

    char availabilityTopic[192] = {0};
    if (mqttSvc->formatTopic) {
        mqttSvc->formatTopic(mqttSvc->ctx, MqttTopics::SuffixStatus, availabilityTopic, sizeof(availabilityTopic));
    }

    if (!formatChecked(payloadBuf, sizeof(payloadBuf),
             "{\"name\":\"%s\",\"object_id\":\"%s\",\"default_entity_id\":\"%s.%s\",\"unique_id\":\"%s\"%s%s,"
             "\"availability\":[{\"topic\":\"%s\","
             "\"value_template\":\"{{ 'online' if value_json.online else 'offline' }}\"}],"
             "\"origin\":{\"name\":\"Irrigo.io\"},"
             "\"device\":{\"identifiers\":[\"%s\"],\"name\":\"%s\","
             "\"manufacturer\":\"%s\",\"model\":\"%s\",\"sw_version\":\"%s\"}}",
             name, objectId, component, objectId, uniqueId, specific, extra,
             availabilityTopic,
             deviceIdent, cfgData.vendor, cfgData.vendor, cfgData.model, IRRIGO_FIRMWARE_VERSION)) {
        LOGW("HA %s payload truncated object=%s", component, objectId);
        return false;
    }

    if (!formatChecked(topicBuf, sizeof(topicBuf), "%s/%s/%s/%s/config",
                       cfgData.discoveryPrefix, component, nodeTopicId, objectId)) {
        LOGW("HA discovery topic truncated component=%s object=%s", component, objectId);
        return false;
    }
    return mqttSvc->publish(mqttSvc->ctx, topicBuf, payloadBuf, 1, true);
}

void HAModule::setStartupReady(bool ready)
{
    startupReady_ = ready;
    if (ready) {
        signalAutoconfigCheck();
    }
}

bool HAModule::publishRegisteredEntities()
{
    if (!mqttSvc || !mqttSvc->formatTopic) return false;

    bool okAll = true;
    const TickType_t stepDelay = pdMS_TO_TICKS(Limits::Ha::Timing::DiscoveryStepMs);

    for (uint8_t i = 0; i < sensorCount_; ++i) {
        const HASensorEntry& e = sensors_[i];
        if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) {
            okAll = false;
            continue;
        }
        mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));
        const bool built =
            formatChecked(specificBuf, sizeof(specificBuf),
                          ",\"state_topic\":\"%s\",\"value_template\":\"%s\",\"state_class\":\"%s\"",
                          stateTopicBuf, e.valueTemplate, e.stateClass ? e.stateClass : "measurement") &&
            appendField(specificBuf, sizeof(specificBuf), "unit_of_measurement", e.unit) &&
            appendField(specificBuf, sizeof(specificBuf), "device_class", e.deviceClass);
        if (!built || !publishEntity("sensor", objectIdBuf, e.name, specificBuf, e.entityCategory, e.icon)) {
            okAll = false;
        }
        if (stepDelay > 0) vTaskDelay(stepDelay);
    }

    for (uint8_t i = 0; i < binarySensorCount_; ++i) {
        const HABinarySensorEntry& e = binarySensors_[i];
        if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) {
            okAll = false;
            continue;
        }
        mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));
        const bool built =
            formatChecked(specificBuf, sizeof(specificBuf),
                          ",\"state_topic\":\"%s\",\"value_template\":\"%s\","
                          "\"payload_on\":\"True\",\"payload_off\":\"False\"",
                          stateTopicBuf, e.valueTemplate) &&
            appendField(specificBuf, sizeof(specificBuf), "device_class", e.deviceClass);
        if (!built || !publishEntity("binary_sensor", objectIdBuf, e.name, specificBuf, e.entityCategory, e.icon)) {
            okAll = false;
        }
        if (stepDelay > 0) vTaskDelay(stepDelay);
    }

    for (uint8_t i = 0; i < switchCount_; ++i) {
        const HASwitchEntry& e = switches_[i];
        if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) {
            okAll = false;
            continue;
        }
        mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));
        mqttSvc->formatTopic(mqttSvc->ctx, e.commandTopicSuffix, commandTopicBuf, sizeof(commandTopicBuf));
        const bool built =
            formatChecked(specificBuf, sizeof(specificBuf),
                          ",\"state_topic\":\"%s\",\"value_template\":\"%s\",\"state_on\":\"ON\",\"state_off\":\"OFF\","
                          "\"command_topic\":\"%s\",\"payload_on\":\"%s\",\"payload_off\":\"%s\"",
                          stateTopicBuf, e.valueTemplate, commandTopicBuf, e.payloadOn, e.payloadOff);
        if (!built || !publishEntity("switch", objectIdBuf, e.name, specificBuf, e.entityCategory, e.icon)) {
            okAll = false;
        }
        if (stepDelay > 0) vTaskDelay(stepDelay);
    }

    for (uint8_t i = 0; i < numberCount_; ++i) {
        const HANumberEntry& e = numbers_[i];
        if (!buildObjectId(e.objectSuffix, objectIdBuf, sizeof(objectIdBuf))) {
            okAll = false;
            continue;
        }
        mqttSvc->formatTopic(mqttSvc->ctx, e.stateTopicSuffix, stateTopicBuf, sizeof(stateTopicBuf));
        mqttSvc->formatTopic(mqttSvc->ctx, e.commandTopicSuffix, commandTopicBuf, sizeof(commandTopicBuf));
        const bool built =
            formatChecked(specificBuf, sizeof(specificBuf),
                          ",\"state_topic\":\"%s\",\"value_template\":\"%s\",\"command_topic\":\"%s\","
                          "\"command_template\":\"%s\",\"min\":%.3f,\"max\":%.3f,\"step\":%.3f,\"mode\":\"%s\"",
                          stateTopicBuf, e.valueTemplate, commandTopicBuf, e.commandTemplate,
                          (double)e.minValue, (double)e.maxValue, (double)e.step,
                          e.mode ? e.mode : "box") &&
            appendField(specificBuf, sizeof(specificBuf), "unit_of_measurement", e.unit);
        if (!built || !publishEntity("number", objectIdBuf, e.name, specificBuf, e.entityCategory, e.icon)) {
            okAll = false;
        }
        if (stepDelay > 0) vTaskDelay(stepDelay);
    }

    return okAll;
}

void HAModule::refreshIdentityFromConfig()
{
    if (cfgData.deviceId[0] != '\0') {
        snprintf(deviceId, sizeof(deviceId), "%s", cfgData.deviceId);
    } else {
        makeHexNodeId(deviceId, sizeof(deviceId));
    }
    sanitizeId(deviceId, nodeTopicId, sizeof(nodeTopicId));
    if (nodeTopicId[0] == '\0') {
        snprintf(nodeTopicId, sizeof(nodeTopicId), "irrigo");
    }
    snprintf(deviceIdent, sizeof(deviceIdent), "%s-%s", cfgData.vendor, deviceId);
    entityHash3_ = hash3Digits(deviceId);
}

void HAModule::tryPublishAutoconfig()
{
    if (published && !refreshRequested) return;
    if (!startupReady_) return;
    refreshIdentityFromConfig();
    if (!cfgData.enabled) return;
    if (!mqttSvc || !mqttSvc->isConnected || !dsSvc || !dsSvc->store) return;
    if (!mqttSvc->isConnected(mqttSvc->ctx)) return;
    if (!mqttReady(*dsSvc->store)) return;

    if (publishRegisteredEntities()) {
        published = true;
        refreshRequested = false;
        setHaAutoconfigPublished(*dsSvc->store, true);
        LOGI("Home Assistant auto-discovery published (sensor=%u binary=%u switch=%u number=%u)",
             (unsigned)sensorCount_, (unsigned)binarySensorCount_,
             (unsigned)switchCount_, (unsigned)numberCount_);
    } else {
        setHaAutoconfigPublished(*dsSvc->store, false);
        LOGW("Home Assistant auto-discovery publish failed");
    }
}

void HAModule::onEventStatic(const Event& e, void* user)
{
    HAModule* self = static_cast<HAModule*>(user);
    if (self) self->onEvent(e);
}

void HAModule::onEvent(const Event& e)
{
    if (e.id == EventId::ConfigChanged) {
        if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (strncmp(p->nvsKey, "ha_", 3) == 0 || strcmp(p->nvsKey, NvsKeys::Mqtt::BaseTopic) == 0) {
            requestAutoconfigRefresh();
        }
        return;
    }

    if (e.id != EventId::DataChanged) return;
    if (!e.payload || e.len < sizeof(DataChangedPayload)) return;
    const DataChangedPayload* payload = static_cast<const DataChangedPayload*>(e.payload);
    if (!dsSvc || !dsSvc->store) return;

    if (payload->id == DataKeys::MqttReady) {
        if (mqttReady(*dsSvc->store)) {
            // Broker restarts drop retained discovery when it runs without persistence.
            requestAutoconfigRefresh();
        }
        return;
    }
}

void HAModule::signalAutoconfigCheck()
{
    autoconfigPending = true;
    TaskHandle_t th = getTaskHandle();
    if (th) {
        xTaskNotifyGive(th);
    }
}

void HAModule::requestAutoconfigRefresh()
{
    published = false;
    refreshRequested = true;
    if (dsSvc && dsSvc->store) {
        setHaAutoconfigPublished(*dsSvc->store, false);
    }
    signalAutoconfigCheck();
}

void HAModule::loop()
{
    if (!autoconfigPending) {
        ulTaskNotifyTake(pdTRUE, portMAX_DELAY);
    }
    if (!autoconfigPending) return;
    autoconfigPending = false;
    tryPublishAutoconfig();
}

void HAModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(vendorVar);
    cfg.registerVar(deviceIdVar);
    cfg.registerVar(prefixVar);
    cfg.registerVar(modelVar);

    eventBusSvc = services.get<EventBusService>("eventbus");
    dsSvc = services.get<DataStoreService>("datastore");
    mqttSvc = services.get<MqttService>("mqtt");

    haSvc.addSensor = HAModule::svcAddSensor;
    haSvc.addBinarySensor = HAModule::svcAddBinarySensor;
    haSvc.addSwitch = HAModule::svcAddSwitch;
    haSvc.addNumber = HAModule::svcAddNumber;
    haSvc.requestRefresh = HAModule::svcRequestRefresh;
    haSvc.ctx = this;
    services.add("ha", &haSvc);

    const HASensorEntry wifiRssi{
        "network",
        "wifi_rssi",
        "WiFi RSSI",
        "rt/network/state",
        "{{ value_json.rssi | int(-127) }}",
        "diagnostic",
        "mdi:wifi",
        "dBm",
        "signal_strength",
        nullptr
    };
    (void)addSensorEntry(wifiRssi);

    const HABinarySensorEntry mqttLink{
        "network",
        "mqtt_link",
        "MQTT Link",
        "rt/network/state",
        "{{ value_json.mqtt }}",
        "connectivity",
        "diagnostic",
        nullptr
    };
    (void)addBinarySensorEntry(mqttLink);

    if (dsSvc && dsSvc->store) {
        setHaAutoconfigPublished(*dsSvc->store, false);
    }

    if (eventBusSvc && eventBusSvc->bus) {
        eventBusSvc->bus->subscribe(EventId::DataChanged, &HAModule::onEventStatic, this);
        eventBusSvc->bus->subscribe(EventId::ConfigChanged, &HAModule::onEventStatic, this);
    }
}
