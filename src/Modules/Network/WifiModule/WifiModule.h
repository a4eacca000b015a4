#pragma once
/**
 * @file WifiModule.h
 * @brief WiFi station connectivity module.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include <WiFi.h>
#include <ESPmDNS.h>

/** @brief WiFi configuration values. */
struct WifiConfig {
    bool enabled = true;
    char ssid[32] = "";
    char pass[64] = "";
    char mdns[32] = "irrigo";
};

/**
 * @brief Active module that keeps the station connected and publishes readiness.
 */
class WifiModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "wifi"; }
    /** @brief Task name. */
    const char* taskName() const override { return "wifi"; }
    /** @brief Pin network module on core 0. */
    BaseType_t taskCore() const override { return 0; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "datastore";
        if (i == 2) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    WifiConfig cfgData;
    WifiState state = WifiState::Idle;
    uint32_t stateTs = 0;
    DataStore* dataStore = nullptr;
    bool gotIpSent = false;
    bool mdnsStarted = false;
    volatile bool reconnectRequested_ = false;
    uint32_t lastEmptySsidLogMs = 0;
    char mdnsApplied[sizeof(cfgData.mdns)] = {0};

    ConfigVariable<bool,0> enabledVar {
        NVS_KEY(NvsKeys::Wifi::Enabled),"enabled","wifi",
        ConfigType::Bool,
        &cfgData.enabled,
        ConfigPersistence::Persistent,
        0
    };

    ConfigVariable<char,0> ssidVar {
        NVS_KEY(NvsKeys::Wifi::Ssid),"ssid","wifi",
        ConfigType::CharArray,
        cfgData.ssid,
        ConfigPersistence::Persistent,
        sizeof(cfgData.ssid)
    };

    ConfigVariable<char,0> passVar {
        NVS_KEY(NvsKeys::Wifi::Pass),"pass","wifi",
        ConfigType::CharArray,
        cfgData.pass,
        ConfigPersistence::Persistent,
        sizeof(cfgData.pass)
    };

    ConfigVariable<char,0> mdnsVar {
        NVS_KEY(NvsKeys::Wifi::Mdns),"mdns","wifi",
        ConfigType::CharArray,
        cfgData.mdns,
        ConfigPersistence::Persistent,
        sizeof(cfgData.mdns)
    };

    static WifiState svcState(void* ctx);
    static bool svcIsConnected(void* ctx);
    static bool svcGetIP(void* ctx, char* out, size_t len);
    static bool svcRequestReconnect(void* ctx);

    static bool cmdReconnect(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    void setState(WifiState s);
    void startConnect();
    void dropConnection_();
    void stopMdns_();
    void syncMdns_();
};
