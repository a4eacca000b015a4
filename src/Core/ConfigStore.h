#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// ConfigStore keeps the typed config variables of every module.
//
// - Persistent variables are mirrored in NVS through Preferences.
// - Any change (set() or applyJson()) posts EventId::ConfigChanged with the
//   NVS key of the variable.
// - No heap allocation on the set() path; applyJson() parses into a
//   temporary ArduinoJson document.

#include <Preferences.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/** @brief Defines a configuration migration step between versions. */
struct MigrationStep {
    uint32_t fromVersion;
    uint32_t toVersion;
    bool (*apply)(Preferences& prefs, bool clearOnFail);
};

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    /** @brief Inject EventBus dependency for change notifications. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /**
     * @brief Register a config variable definition.
     * @return false when the table is full, the NVS key is too long,
     *         or the key / module field pair is already registered.
     */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();
    /** @brief Save persistent values from registered variables into NVS. */
    void savePersistent();
    /** @brief Erase the whole NVS namespace. RAM values are left untouched. */
    bool erasePersistent();

    /** @brief Serialize all registered config to JSON, one object per module. */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply a `{"module":{"field":value}}` patch.
     * @return false when the JSON is invalid or a field had the wrong type.
     */
    bool applyJson(const char* json);

    /** @brief Run config migrations using a version key in NVS. */
    bool runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                       const char* versionKey = "cfg_ver", bool clearOnFail = true);
    /** @brief Log NVS write summary when the configured period elapsed. */
    void logNvsWriteSummaryIfDue(uint32_t nowMs, uint32_t periodMs = 60000U);

    uint16_t size() const { return _metaCount; }

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS];
    uint16_t _metaCount = 0;

    bool registerMeta_(const ConfigMeta& m);
    void notifyChanged(const char* nvsKey);
    bool writePersistent(const ConfigMeta& m);
    void recordNvsWrite_(size_t bytesWritten);
    void putInt_(const char* key, int32_t value);
    void putUChar_(const char* key, uint8_t value);
    void putBool_(const char* key, bool value);
    void putFloat_(const char* key, float value);
    void putBytes_(const char* key, const void* value, size_t len);
    void putString_(const char* key, const char* value);
    void putUInt_(const char* key, uint32_t value);

    bool writeModuleBody_(const char* module, char* out, size_t outLen, size_t& pos, bool& any) const;

    std::atomic<uint32_t> _nvsWriteTotal{0};
    std::atomic<uint32_t> _nvsWriteWindow{0};
    std::atomic<uint32_t> _nvsLastSummaryMs{0};
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    ConfigMeta m{};
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    return registerMeta_(m);
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for char arrays");
    if (!var.value) return false;
    if (*(var.value) == value) return true;

    *(var.value) = value;
    var.notify();

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        switch (var.type) {
        case ConfigType::Int32:  putInt_(var.nvsKey, *(int32_t*)var.value); break;
        case ConfigType::UInt8:  putUChar_(var.nvsKey, *(uint8_t*)var.value); break;
        case ConfigType::Bool:   putBool_(var.nvsKey, *(bool*)var.value); break;
        case ConfigType::Float:  putFloat_(var.nvsKey, *(float*)var.value); break;
        case ConfigType::Double: putBytes_(var.nvsKey, var.value, sizeof(double)); break;
        default: break;
        }
    }

    notifyChanged(var.nvsKey);
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;

    memcpy(var.value, str, len);
    var.value[len] = '\0';
    var.notify();

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        putString_(var.nvsKey, var.value);
    }

    notifyChanged(var.nvsKey);
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
