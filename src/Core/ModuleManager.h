#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"

/** @brief Maximum number of modules supported at runtime. */
constexpr size_t MAX_MODULES = 16;

/**
 * @brief Registers modules, resolves dependencies, and starts tasks.
 */
class ModuleManager {
public:
    /** @brief Add a module. Returns false when the table is full. */
    bool add(Module* m);
    /**
     * @brief Initialize all modules in dependency order.
     *
     * Calls `init()`, loads persistent config, calls `onConfigLoaded()`,
     * then starts module tasks.
     */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);
    /** @brief Wire core services into the config store. */
    void wireCoreServices(ServiceRegistry& services, ConfigStore& config);

    uint8_t getCount() const { return count; }
    Module* getModule(uint8_t idx) const {
        if (idx >= count) return nullptr;
        return modules[idx];
    }

private:
    Module* modules[MAX_MODULES] = {};
    uint8_t count = 0;

    Module* ordered[MAX_MODULES] = {};
    uint8_t orderedCount = 0;

    Module* findById(const char* id);
    int indexOf(const Module* m) const;
    bool buildInitOrder();
};
