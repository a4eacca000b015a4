#pragma once
/**
 * @file SystemModule.h
 * @brief Device-level commands (ping, info, reboot, factory reset).
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module that registers the `system.*` commands.
 *
 * `system.factory_reset` erases the `irrigo` NVS namespace (config and zone
 * ledgers) plus the WiFi driver credentials, then restarts.
 */
class SystemModule : public ModulePassive {
public:
    const char* moduleId() const override { return "system"; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        if (i == 2) return "config";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    const CommandService* cmdSvc = nullptr;
    const ConfigStoreService* cfgSvc = nullptr;
    const LogHubService* logHub = nullptr;

    static bool cmdPing(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdInfo(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdReboot(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFactoryReset(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
