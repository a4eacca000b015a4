/**
 * @file SystemModule.cpp
 * @brief Implementation file.
 */
#include "SystemModule.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemStats.h"
#include <WiFi.h>
#include <esp_system.h>
#include <esp_wifi.h>
#define LOG_TAG "SysModul"
#include "Core/ModuleLog.h"

#ifndef IRRIGO_FIRMWARE_VERSION
#define IRRIGO_FIRMWARE_VERSION "unknown"
#endif

static constexpr uint32_t kRestartAckDelayMs = 250;

static bool wipeWifiCredentials_(esp_err_t* outErr)
{
    WiFi.mode(WIFI_MODE_STA);
    delay(20);
    (void)WiFi.disconnect(false, true);

    esp_err_t err = esp_wifi_restore();
    if (err == ESP_ERR_WIFI_NOT_INIT) {
        WiFi.mode(WIFI_MODE_STA);
        delay(20);
        err = esp_wifi_restore();
    }
    (void)WiFi.disconnect(true, true);

    if (outErr) *outErr = err;
    return (err == ESP_OK || err == ESP_ERR_WIFI_NOT_INIT);
}

static bool writeReply_(char* reply, size_t replyLen, const char* json, const char* where)
{
    if (!reply || replyLen == 0 || !json) return false;
    const int wrote = snprintf(reply, replyLen, "%s", json);
    if (wrote > 0 && (size_t)wrote < replyLen) return true;
    if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
    return false;
}

bool SystemModule::cmdPing(void*, const CommandRequest&, char* reply, size_t replyLen) {
    return writeReply_(reply, replyLen, "{\"ok\":true,\"pong\":true}", "system.ping");
}

bool SystemModule::cmdInfo(void*, const CommandRequest&, char* reply, size_t replyLen) {
    SystemStatsSnapshot snap{};
    SystemStats::collect(snap);

    const int wrote = snprintf(reply, replyLen,
                               "{\"ok\":true,\"fw\":\"%s\",\"uptime_s\":%lu,\"reset\":\"%s\","
                               "\"heap\":{\"free\":%lu,\"min\":%lu,\"largest\":%lu,\"frag\":%u}}",
                               IRRIGO_FIRMWARE_VERSION,
                               (unsigned long)(snap.uptimeMs / 1000U),
                               SystemStats::resetReasonStr(),
                               (unsigned long)snap.heap.freeBytes,
                               (unsigned long)snap.heap.minFreeBytes,
                               (unsigned long)snap.heap.largestFreeBlock,
                               (unsigned)snap.heap.fragPercent);
    if (wrote > 0 && (size_t)wrote < replyLen) return true;
    if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.info")) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
    return false;
}

bool SystemModule::cmdReboot(void*, const CommandRequest&, char* reply, size_t replyLen) {
    if (!writeReply_(reply, replyLen, "{\"ok\":true,\"msg\":\"rebooting\"}", "system.reboot")) {
        return false;
    }
    LOGI("Reboot requested");
    delay(kRestartAckDelayMs);
    esp_restart();
    return true;
}

bool SystemModule::cmdFactoryReset(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    SystemModule* self = static_cast<SystemModule*>(userCtx);
    if (!self || !self->cfgSvc || !self->cfgSvc->erase) {
        if (!writeErrorJson(reply, replyLen, ErrorCode::NotReady, "system.factory_reset")) {
            snprintf(reply, replyLen, "{\"ok\":false}");
        }
        return false;
    }

    const bool nvsCleared = self->cfgSvc->erase(self->cfgSvc->ctx);

    esp_err_t wifiErr = ESP_OK;
    const bool wifiCleared = wipeWifiCredentials_(&wifiErr);
    if (wifiErr == ESP_ERR_WIFI_NOT_INIT) {
        LOGW("WiFi driver not initialized during factory reset; restore skipped");
    }

    if (!nvsCleared || !wifiCleared) {
        LOGE("Factory reset failed nvs=%d wifi=%d wifi_err=%d",
             (int)nvsCleared, (int)wifiCleared, (int)wifiErr);
        if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.factory_reset")) {
            snprintf(reply, replyLen, "{\"ok\":false}");
        }
        return false;
    }

    if (!writeReply_(reply, replyLen, "{\"ok\":true,\"msg\":\"factory_reset\"}", "system.factory_reset")) {
        return false;
    }
    LOGI("Factory reset done, restarting");
    delay(kRestartAckDelayMs);
    esp_restart();
    return true;
}

void SystemModule::init(ConfigStore&, ServiceRegistry& services) {
    logHub = services.get<LogHubService>("loghub");
    cmdSvc = services.get<CommandService>("cmd");
    cfgSvc = services.get<ConfigStoreService>("config");

    cmdSvc->registerHandler(cmdSvc->ctx, "system.ping", cmdPing, this);
    cmdSvc->registerHandler(cmdSvc->ctx, "system.info", cmdInfo, this);
    cmdSvc->registerHandler(cmdSvc->ctx, "system.reboot", cmdReboot, this);
    cmdSvc->registerHandler(cmdSvc->ctx, "system.factory_reset", cmdFactoryReset, this);

    LOGI("Boot reset=%s cpu=%luMHz fw=%s",
         SystemStats::resetReasonStr(),
         (unsigned long)ESP.getCpuFreqMHz(),
         IRRIGO_FIRMWARE_VERSION);
}
