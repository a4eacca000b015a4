/**
 * @file WifiModule.cpp
 * @brief WiFi station state machine and mDNS announcement.
 */
#include "WifiModule.h"
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/Runtime.h"
#include <ctype.h>
#include <string.h>

WifiState WifiModule::svcState(void* ctx) {
    WifiModule* self = (WifiModule*)ctx;
    return self->state;
}

bool WifiModule::svcIsConnected(void* ctx) {
    (void)ctx;
    return WiFi.isConnected();
}

bool WifiModule::svcGetIP(void* ctx, char* out, size_t len) {
    (void)ctx;
    if (!out || len == 0) return false;

    if (!WiFi.isConnected()) {
        out[0] = '\0';
        return false;
    }

    IPAddress ip = WiFi.localIP();
    snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return true;
}

bool WifiModule::svcRequestReconnect(void* ctx)
{
    WifiModule* self = static_cast<WifiModule*>(ctx);
    if (!self) return false;
    if (!self->cfgData.enabled) return false;
    // Applied from the wifi task to keep WiFi calls on one core.
    self->reconnectRequested_ = true;
    return true;
}

bool WifiModule::cmdReconnect(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    WifiModule* self = static_cast<WifiModule*>(userCtx);
    if (!self->cfgData.enabled) {
        writeErrorJson(reply, replyLen, ErrorCode::Disabled, "wifi.reconnect");
        return false;
    }
    svcRequestReconnect(self);
    writeOkJson(reply, replyLen, "wifi.reconnect");
    return true;
}

void WifiModule::setState(WifiState s) {
    if (s == state) return;
    state = s;
    stateTs = millis();

    if (state == WifiState::Idle || state == WifiState::ErrorWait || state == WifiState::Disabled) {
        stopMdns_();
        if (dataStore) {
            setWifiReady(*dataStore, false);
        }
        gotIpSent = false;
    }
}

void WifiModule::dropConnection_()
{
    stopMdns_();
    gotIpSent = false;
    if (dataStore) {
        setWifiReady(*dataStore, false);
    }
    WiFi.disconnect(false, false);
    setState(WifiState::Idle);
}

void WifiModule::startConnect() {
    if (cfgData.ssid[0] == '\0') {
        const uint32_t now = millis();
        if ((now - lastEmptySsidLogMs) >= 10000U) {
            lastEmptySsidLogMs = now;
            LOGW("SSID empty, skipping connection");
        }
        setState(WifiState::Idle);
        return;
    }

    LOGI("Connecting to '%s'", cfgData.ssid);

    WiFi.disconnect(false, false);
    delay(50);

    WiFi.mode(WIFI_MODE_STA);
    WiFi.setSleep(false);
    WiFi.begin(cfgData.ssid, cfgData.pass);

    setState(WifiState::Connecting);
}

void WifiModule::init(ConfigStore& cfg,
                      ServiceRegistry& services)
{
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore = dsSvc ? dsSvc->store : nullptr;

    cfg.registerVar(enabledVar);
    cfg.registerVar(ssidVar);
    cfg.registerVar(passVar);
    cfg.registerVar(mdnsVar);

    static WifiService svc {
        WifiModule::svcState,
        WifiModule::svcIsConnected,
        WifiModule::svcGetIP,
        WifiModule::svcRequestReconnect,
        nullptr
    };
    svc.ctx = this;
    services.add("wifi", &svc);

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc) {
        cmdSvc->registerHandler(cmdSvc->ctx, "wifi.reconnect", cmdReconnect, this);
    }

    // Credentials live in ConfigStore only.
    WiFi.persistent(false);

    LOGI("WifiService registered");
}

void WifiModule::stopMdns_()
{
    if (!mdnsStarted) return;
    MDNS.end();
    mdnsStarted = false;
    mdnsApplied[0] = '\0';
    LOGI("mDNS stopped");
}

void WifiModule::syncMdns_()
{
    if (!WiFi.isConnected()) {
        stopMdns_();
        return;
    }

    char host[sizeof(cfgData.mdns)] = {0};
    size_t w = 0;
    for (size_t i = 0; cfgData.mdns[i] != '\0' && w < (sizeof(host) - 1); ++i) {
        char c = cfgData.mdns[i];
        if (isalnum((unsigned char)c) || c == '-') {
            host[w++] = (char)tolower((unsigned char)c);
        } else if (c == ' ' || c == '_' || c == '.') {
            host[w++] = '-';
        }
    }
    host[w] = '\0';

    while (w > 0 && host[0] == '-') {
        memmove(host, host + 1, w);
        --w;
    }
    while (w > 0 && host[w - 1] == '-') {
        host[w - 1] = '\0';
        --w;
    }

    if (host[0] == '\0') {
        stopMdns_();
        return;
    }

    if (mdnsStarted && strcmp(mdnsApplied, host) == 0) return;

    if (mdnsStarted) {
        MDNS.end();
        mdnsStarted = false;
        mdnsApplied[0] = '\0';
    }

    if (!MDNS.begin(host)) {
        LOGW("mDNS start failed host=%s", host);
        return;
    }

    mdnsStarted = true;
    snprintf(mdnsApplied, sizeof(mdnsApplied), "%s", host);
    LOGI("mDNS started host=%s.local", mdnsApplied);
}

void WifiModule::loop() {
    if (!cfgData.enabled) {
        if (state != WifiState::Disabled) {
            WiFi.disconnect(false, false);
            setState(WifiState::Disabled);
            LOGI("WiFi disabled");
        }
        vTaskDelay(pdMS_TO_TICKS(2000));
        return;
    }

    if (reconnectRequested_) {
        reconnectRequested_ = false;
        LOGI("Reconnect requested");
        dropConnection_();
    }

    switch (state) {

    case WifiState::Disabled:
        setState(WifiState::Idle);
        break;

    case WifiState::Idle:
        startConnect();
        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::Connecting:
        if (WiFi.isConnected()) {
            IPAddress ip = WiFi.localIP();
            LOGI("Connected IP=%u.%u.%u.%u RSSI=%d",
                 ip[0], ip[1], ip[2], ip[3],
                 WiFi.RSSI());
            setState(WifiState::Connected);
        }
        else if (millis() - stateTs > 15000) {
            LOGW("Connect timeout");
            WiFi.disconnect(false, false);
            setState(WifiState::ErrorWait);
        }
        vTaskDelay(pdMS_TO_TICKS(200));
        break;

    case WifiState::Connected:
        if (!WiFi.isConnected()) {
            LOGW("Disconnected");
            setState(WifiState::ErrorWait);
        }
        if (state == WifiState::Connected) {
            syncMdns_();
        }
        if (state == WifiState::Connected && !gotIpSent) {
            IPAddress ip = WiFi.localIP();
            if (ip[0] != 0 || ip[1] != 0 || ip[2] != 0 || ip[3] != 0) {
                if (dataStore) {
                    IpV4 ip4{};
                    ip4.b[0] = ip[0];
                    ip4.b[1] = ip[1];
                    ip4.b[2] = ip[2];
                    ip4.b[3] = ip[3];

                    setWifiIp(*dataStore, ip4);
                    setWifiReady(*dataStore, true);
                }
                gotIpSent = true;
            }
        }

        vTaskDelay(pdMS_TO_TICKS(1000));
        break;

    case WifiState::ErrorWait:
        if (millis() - stateTs > 5000) {
            setState(WifiState::Idle);
        }
        vTaskDelay(pdMS_TO_TICKS(500));
        break;
    }
}
