/**
 * @file ModuleManager.cpp
 * @brief Module dependency ordering and startup.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m) return false;
    if (count >= MAX_MODULES) {
        Serial.printf("[MOD][ERR] module table full, dropping '%s'\n", m->moduleId());
        return false;
    }
    modules[count++] = m;
    return true;
}

Module* ModuleManager::findById(const char* id) {
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

int ModuleManager::indexOf(const Module* m) const {
    for (uint8_t i = 0; i < count; ++i)
        if (modules[i] == m) return i;
    return -1;
}

bool ModuleManager::buildInitOrder() {
    /// Kahn topo-sort
    bool placed[MAX_MODULES] = {0};
    orderedCount = 0;

    for (uint8_t pass = 0; pass < count; ++pass) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (!m || placed[i]) continue;

            bool depsOk = true;
            for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById(depId);
                if (!dep) {
                    /// Log hub may not be draining yet: print directly too.
                    Serial.printf("[MOD][ERR] Missing dependency: module='%s' requires='%s'\n",
                                  m->moduleId(), depId);
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }

                int depIdx = indexOf(dep);
                if (depIdx < 0 || !placed[depIdx]) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (orderedCount == count) break;

        if (!progress) {
            Serial.println("[MOD][ERR] Cyclic or unresolved dependencies, not placed:");
            for (uint8_t i = 0; i < count; ++i) {
                if (modules[i] && !placed[i]) {
                    Serial.printf("   * %s\n", modules[i]->moduleId());
                }
            }
            Serial.flush();
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "init order resolved (%u modules)", (unsigned)orderedCount);
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    /// All variables are registered now.
    cfg.loadPersistent();

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->hasTask()) continue;
        Log::debug(LOG_TAG_CORE, "startTask: %s", ordered[i]->moduleId());
        if (!ordered[i]->startTask()) {
            Log::error(LOG_TAG_CORE, "task start failed: %s", ordered[i]->moduleId());
            return false;
        }
    }

    wireCoreServices(services, cfg);
    return true;
}

void ModuleManager::wireCoreServices(ServiceRegistry& services, ConfigStore& config) {
    auto* ebService = services.get<EventBusService>("eventbus");
    if (ebService && ebService->bus) {
        config.setEventBus(ebService->bus);
        Log::debug(LOG_TAG_CORE, "eventbus wired into config store");
    }
}
