/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"

#include "Core/ConfigMigrations.h"
#include "Core/ConfigStore.h"
#include "Core/DataStore/DataStore.h"
#include "Core/ModuleManager.h"
#include "Core/RuntimeSnapshotProvider.h"
#include "Core/RuntimeSnapshotRouter.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Network modules
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/TimeModule/TimeModule.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"
#include "Modules/Network/HAModule/HAModule.h"
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
#include "Modules/Stores/DataStoreModule/DataStoreModule.h"
// System Modules
#include "Modules/System/SystemModule/SystemModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
// Irrigation modules
#include "Modules/WeatherModule/WeatherModule.h"
#include "Modules/ValveModule/ValveModule.h"
#include "Modules/IrrigationModule/IrrigationModule.h"

#include "Core/Runtime.h"
#include "Core/SystemStats.h"
#include "Core/SnprintfCheck.h"
#include "Core/SystemLimits.h"
#include <WiFi.h>
#include <string.h>
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    IRRIGO_SNPRINTF_CHECKED("Main", OUT, LEN, FMT, ##__VA_ARGS__)

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static WifiModule           wifiModule;
static TimeModule           timeModule;
static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static DataStoreModule      dataStoreModule;
static MQTTModule           mqttModule;
static HAModule             haModule;
static SystemModule         systemModule;
static LogSerialSinkModule  logSerialSinkModule;
static LogDispatcherModule  logDispatcherModule;
static LogHubModule         logHubModule;
static EventBusModule       eventBusModule;
static WeatherModule        weatherModule;
static ValveModule          valveModule;
static IrrigationModule     irrigationModule;

static char topicRuntimeState[Limits::TopicBuf] = {0};
static char topicNetworkState[Limits::TopicBuf] = {0};
static char topicSystemState[Limits::TopicBuf] = {0};

struct BootOrchestratorState {
    bool active = false;
    bool mqttReleased = false;
    bool haReleased = false;
    bool irrigationReleased = false;
    uint32_t t0Ms = 0;
};
static BootOrchestratorState gBootOrchestrator{};

static const RuntimeRoutePolicy kRoutePolicies[] = {
    {"rt/valves/", DIRTY_ACTUATORS, true},
    {"rt/weather/", DIRTY_WEATHER, false},
    {"rt/irrigation/", DIRTY_IRRIGATION, true},
};
static RuntimeSnapshotRouter gRuntimeRouter(kRoutePolicies,
                                            (uint8_t)(sizeof(kRoutePolicies) / sizeof(kRoutePolicies[0])),
                                            DIRTY_IRRIGATION);
static const MqttService* gMqttSvc = nullptr;
// weather state + valves + irrigation state + zones
static_assert(Limits::MaxRuntimeRoutes >= (1U + (2U * Limits::Irrigation::MaxZones) + 1U),
              "MaxRuntimeRoutes too small for weather + valves + irrigation providers");

static bool publishRuntimeStates(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt || !gMqttSvc) return false;
    uint32_t dirtyMask = mqtt->activeSnapshotDirtyMask();
    if (dirtyMask == 0U) dirtyMask = (DIRTY_WEATHER | DIRTY_IRRIGATION | DIRTY_ACTUATORS);
    gRuntimeRouter.publish(*gMqttSvc, dirtyMask, out, len);
    return false;
}

static bool buildRuntimeRouterState(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt) return false;
    return gRuntimeRouter.buildStatsJson(out, len);
}

static bool buildNetworkSnapshot(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt || !out || len == 0) return false;
    DataStore* ds = mqtt->dataStorePtr();
    if (!ds) return false;

    IpV4 ip4 = wifiIp(*ds);
    char ip[16];
    snprintf(ip, sizeof(ip), "%u.%u.%u.%u", ip4.b[0], ip4.b[1], ip4.b[2], ip4.b[3]);
    bool netReady = wifiReady(*ds);
    bool mqttOk = mqttReady(*ds);
    int rssi = (WiFi.isConnected()) ? WiFi.RSSI() : -127;

    int wrote = snprintf(out, len,
                         "{\"ready\":%s,\"ip\":\"%s\",\"rssi\":%d,\"mqtt\":%s,\"ts\":%lu}",
                         netReady ? "true" : "false",
                         ip,
                         rssi,
                         mqttOk ? "true" : "false",
                         (unsigned long)millis());
    return (wrote > 0) && ((size_t)wrote < len);
}

static bool buildSystemSnapshot(MQTTModule* mqtt, char* out, size_t len) {
    if (!mqtt || !out || len == 0) return false;

    SystemStatsSnapshot snap{};
    SystemStats::collect(snap);
    DataStore* ds = mqtt->dataStorePtr();
    const uint32_t rxDrop = ds ? mqttRxDrop(*ds) : 0U;
    const uint32_t parseFail = ds ? mqttParseFail(*ds) : 0U;
    const uint32_t handlerFail = ds ? mqttHandlerFail(*ds) : 0U;
    const uint32_t oversizeDrop = ds ? mqttOversizeDrop(*ds) : 0U;

    int wrote = snprintf(
        out, len,
        "{\"upt_ms\":%llu,\"upt_s\":%llu,\"heap\":{\"free\":%lu,\"min\":%lu,\"largest\":%lu,\"frag\":%u},"
        "\"mqtt_rx\":{\"rx_drop\":%lu,\"oversize_drop\":%lu,\"parse_fail\":%lu,\"handler_fail\":%lu},\"ts\":%lu}",
        (unsigned long long)snap.uptimeMs64,
        (unsigned long long)(snap.uptimeMs64 / 1000ULL),
        (unsigned long)snap.heap.freeBytes,
        (unsigned long)snap.heap.minFreeBytes,
        (unsigned long)snap.heap.largestFreeBlock,
        (unsigned int)snap.heap.fragPercent,
        (unsigned long)rxDrop,
        (unsigned long)oversizeDrop,
        (unsigned long)parseFail,
        (unsigned long)handlerFail,
        (unsigned long)millis()
    );
    return (wrote > 0) && ((size_t)wrote < len);
}

static void startBootOrchestrator()
{
    gBootOrchestrator.active = true;
    gBootOrchestrator.mqttReleased = false;
    gBootOrchestrator.haReleased = false;
    gBootOrchestrator.irrigationReleased = false;
    gBootOrchestrator.t0Ms = millis();

    // Stage gates: rain and valve tracking run immediately, delay network-heavy phases.
    mqttModule.setStartupReady(false);
    haModule.setStartupReady(false);
    irrigationModule.setStartupReady(false);
    Serial.printf("[BOOT] staged startup armed (mqtt=%lums ha=%lums irrigation=%lums)\n",
                  (unsigned long)Limits::Boot::MqttStartDelayMs,
                  (unsigned long)Limits::Boot::HaStartDelayMs,
                  (unsigned long)Limits::Boot::IrrigationStartDelayMs);
}

static void runBootOrchestrator()
{
    if (!gBootOrchestrator.active) return;

    const uint32_t now = millis();
    const uint32_t elapsed = now - gBootOrchestrator.t0Ms;

    if (!gBootOrchestrator.mqttReleased && elapsed >= Limits::Boot::MqttStartDelayMs) {
        mqttModule.setStartupReady(true);
        gBootOrchestrator.mqttReleased = true;
        Serial.printf("[BOOT] mqtt stage released at %lums\n", (unsigned long)elapsed);
    }

    if (!gBootOrchestrator.haReleased && elapsed >= Limits::Boot::HaStartDelayMs) {
        haModule.setStartupReady(true);
        gBootOrchestrator.haReleased = true;
        Serial.printf("[BOOT] ha stage released at %lums\n", (unsigned long)elapsed);
    }

    if (!gBootOrchestrator.irrigationReleased && elapsed >= Limits::Boot::IrrigationStartDelayMs) {
        irrigationModule.setStartupReady(true);
        gBootOrchestrator.irrigationReleased = true;
        Serial.printf("[BOOT] irrigation stage released at %lums\n", (unsigned long)elapsed);
    }

    if (gBootOrchestrator.mqttReleased && gBootOrchestrator.haReleased && gBootOrchestrator.irrigationReleased) {
        gBootOrchestrator.active = false;
        Serial.println("[BOOT] staged startup completed");
    }
}

void setup() {
    Serial.begin(115200);
    delay(50);
    preferences.begin(NvsKeys::StorageNamespace, false);
    registry.setPreferences(preferences);
    registry.runMigrations(CURRENT_CFG_VERSION, steps, MIGRATION_COUNT);
    mqttModule.setStartupReady(false);
    haModule.setStartupReady(false);
    irrigationModule.setStartupReady(false);

    moduleManager.add(&logHubModule);
    moduleManager.add(&logDispatcherModule);
    moduleManager.add(&logSerialSinkModule);
    moduleManager.add(&eventBusModule);

    moduleManager.add(&configStoreModule);
    moduleManager.add(&dataStoreModule);
    moduleManager.add(&commandModule);
    moduleManager.add(&wifiModule);
    moduleManager.add(&timeModule);
    moduleManager.add(&mqttModule);
    moduleManager.add(&haModule);
    moduleManager.add(&systemModule);
    moduleManager.add(&weatherModule);
    moduleManager.add(&valveModule);
    moduleManager.add(&irrigationModule);

    bool ok = moduleManager.initAll(registry, services);
    if (!ok) {
        while (true) delay(1000);
    }

    gMqttSvc = services.get<MqttService>("mqtt");
    if (gMqttSvc) {
        (void)gRuntimeRouter.addProvider(&weatherModule, *gMqttSvc);
        (void)gRuntimeRouter.addProvider(&valveModule, *gMqttSvc);
        (void)gRuntimeRouter.addProvider(&irrigationModule, *gMqttSvc);
    }
    Serial.printf("Runtime routes: %u\n", (unsigned)gRuntimeRouter.routeCount());

    mqttModule.formatTopic(topicRuntimeState, sizeof(topicRuntimeState), "rt/runtime/state");
    mqttModule.formatTopic(topicNetworkState, sizeof(topicNetworkState), "rt/network/state");
    mqttModule.formatTopic(topicSystemState, sizeof(topicSystemState), "rt/system/state");
    mqttModule.setSnapshotPublisher(publishRuntimeStates);
    mqttModule.addRuntimePublisher(topicRuntimeState, 30000, 0, false, buildRuntimeRouterState);
    mqttModule.addRuntimePublisher(topicNetworkState, 60000, 0, false, buildNetworkSnapshot);
    mqttModule.addRuntimePublisher(topicSystemState, 60000, 0, false, buildSystemSnapshot);
    startBootOrchestrator();

    Serial.print(
        "\x1b[32m"
        " ___          _                  _       \n"
        "|_ _|_ _ _ _ (_)__ _ ___        (_)___   \n"
        " | || '_| '_|| / _` / _ \\   _   | / _ \\  \n"
        "|___|_| |_|  |_\\__, \\___/  (_)  |_\\___/  \n"
        "               |___/                     \n"
        "\x1b[0m"
        );
}

void loop() {
    runBootOrchestrator();
    delay(20);
}
