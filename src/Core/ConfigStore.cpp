/**
 * @file ConfigStore.cpp
 * @brief Implementation of ConfigStore persistence and JSON import/export.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

void ConfigStore::notifyChanged(const char* nvsKey)
{
    if (!_eventBus || !nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);
    p.nvsKey[sizeof(p.nvsKey) - 1] = '\0';

    _eventBus->post(EventId::ConfigChanged, &p, sizeof(p));
}

void ConfigStore::recordNvsWrite_(size_t bytesWritten)
{
    if (bytesWritten == 0) return;
    _nvsWriteTotal.fetch_add(1U, std::memory_order_relaxed);
    _nvsWriteWindow.fetch_add(1U, std::memory_order_relaxed);
}

void ConfigStore::putInt_(const char* key, int32_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putInt(key, value));
}

void ConfigStore::putUChar_(const char* key, uint8_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putUChar(key, value));
}

void ConfigStore::putBool_(const char* key, bool value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putBool(key, value));
}

void ConfigStore::putFloat_(const char* key, float value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putFloat(key, value));
}

void ConfigStore::putBytes_(const char* key, const void* value, size_t len)
{
    if (!_prefs || !key || !value || len == 0) return;
    recordNvsWrite_(_prefs->putBytes(key, value, len));
}

void ConfigStore::putString_(const char* key, const char* value)
{
    if (!_prefs || !key || !value) return;
    recordNvsWrite_(_prefs->putString(key, value));
}

void ConfigStore::putUInt_(const char* key, uint32_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putUInt(key, value));
}

void ConfigStore::logNvsWriteSummaryIfDue(uint32_t nowMs, uint32_t periodMs)
{
    if (periodMs == 0U) return;

    const uint32_t last = _nvsLastSummaryMs.load(std::memory_order_relaxed);
    if (last == 0U) {
        _nvsLastSummaryMs.store(nowMs, std::memory_order_relaxed);
        return;
    }
    if ((uint32_t)(nowMs - last) < periodMs) return;

    _nvsLastSummaryMs.store(nowMs, std::memory_order_relaxed);
    const uint32_t windowWrites = _nvsWriteWindow.exchange(0U, std::memory_order_relaxed);
    const uint32_t totalWrites = _nvsWriteTotal.load(std::memory_order_relaxed);

    Log::info(LOG_TAG_CORE, "NVS writes: last_%lus=%lu total=%lu",
              (unsigned long)(periodMs / 1000U),
              (unsigned long)windowWrites,
              (unsigned long)totalWrites);
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    switch (m.type) {
        case ConfigType::Int32:
            putInt_(m.nvsKey, *(int32_t*)m.valuePtr);
            return true;
        case ConfigType::UInt8:
            putUChar_(m.nvsKey, *(uint8_t*)m.valuePtr);
            return true;
        case ConfigType::Bool:
            putBool_(m.nvsKey, *(bool*)m.valuePtr);
            return true;
        case ConfigType::Float:
            putFloat_(m.nvsKey, *(float*)m.valuePtr);
            return true;
        case ConfigType::Double:
            putBytes_(m.nvsKey, m.valuePtr, sizeof(double));
            return true;
        case ConfigType::CharArray:
            putString_(m.nvsKey, (const char*)m.valuePtr);
            return true;
        default:
            return false;
    }
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::Float:
                *(float*)m.valuePtr = _prefs->getFloat(m.nvsKey, *(float*)m.valuePtr);
                break;
            case ConfigType::Double: {
                double tmp = *(double*)m.valuePtr;
                _prefs->getBytes(m.nvsKey, &tmp, sizeof(double));
                *(double*)m.valuePtr = tmp;
                break;
            }
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
            default:
                break;
        }
    }
}

void ConfigStore::savePersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "savePersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        writePersistent(_meta[i]);
    }
}

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

static int writeValueJson(const ConfigMeta& m, char* out, size_t outLen)
{
    switch (m.type) {
        case ConfigType::Int32:
            return snprintf(out, outLen, "%ld", (long)*(int32_t*)m.valuePtr);
        case ConfigType::UInt8:
            return snprintf(out, outLen, "%u", (unsigned)*(uint8_t*)m.valuePtr);
        case ConfigType::Bool:
            return snprintf(out, outLen, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
        case ConfigType::Float:
            return snprintf(out, outLen, "%.3f", (double)*(float*)m.valuePtr);
        case ConfigType::Double:
            return snprintf(out, outLen, "%.6f", *(double*)m.valuePtr);
        case ConfigType::CharArray:
            if (isMaskedKey(m.name)) return snprintf(out, outLen, "\"***\"");
            return snprintf(out, outLen, "\"%s\"", (const char*)m.valuePtr);
        default:
            return snprintf(out, outLen, "null");
    }
}

bool ConfigStore::registerMeta_(const ConfigMeta& m)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::error(LOG_TAG_CORE, "config table full, dropping %s.%s",
                   m.module ? m.module : "-", m.name ? m.name : "-");
        return false;
    }
    if (!m.valuePtr || !m.name || !m.module) {
        Log::error(LOG_TAG_CORE, "invalid config var");
        return false;
    }
    if (m.nvsKey && strlen(m.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::error(LOG_TAG_CORE, "NVS key too long (%s)", m.nvsKey);
        return false;
    }
    if (m.type == ConfigType::CharArray && m.size == 0) {
        Log::error(LOG_TAG_CORE, "char var without size (%s.%s)", m.module, m.name);
        return false;
    }

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& e = _meta[i];
        const bool sameKey = m.nvsKey && strEquals(e.nvsKey, m.nvsKey);
        const bool sameField = strEquals(e.module, m.module) && strEquals(e.name, m.name);
        if (sameKey || sameField) {
            Log::error(LOG_TAG_CORE, "duplicate config var %s.%s (%s)",
                       m.module, m.name, m.nvsKey ? m.nvsKey : "-");
            return false;
        }
    }

    _meta[_metaCount++] = m;
    return true;
}

bool ConfigStore::erasePersistent()
{
    if (!_prefs) return false;
    const bool ok = _prefs->clear();
    Log::warn(LOG_TAG_CORE, "NVS namespace erased (%s)", ok ? "ok" : "failed");
    return ok;
}

bool ConfigStore::writeModuleBody_(const char* module, char* out, size_t outLen, size_t& pos, bool& any) const
{
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!strEquals(m.module, module)) continue;

        if (any) {
            if (pos + 1 >= outLen) return false;
            out[pos++] = ',';
        }

        int n = snprintf(out + pos, outLen - pos, "\"%s\":", m.name);
        if (n < 0 || (size_t)n >= outLen - pos) return false;
        pos += (size_t)n;

        n = writeValueJson(m, out + pos, outLen - pos);
        if (n < 0 || (size_t)n >= outLen - pos) return false;
        pos += (size_t)n;

        any = true;
    }
    return true;
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen < 3) return false;

    static_assert(MAX_CONFIG_VARS <= 255, "module list index is 8-bit");
    const char* modules[MAX_CONFIG_VARS];
    const uint8_t moduleCount = listModules(modules, (uint8_t)MAX_CONFIG_VARS);

    size_t pos = 0;
    out[pos++] = '{';
    bool ok = true;

    for (uint8_t i = 0; i < moduleCount && ok; ++i) {
        const int n = snprintf(out + pos, outLen - pos, "%s\"%s\":{", (i > 0) ? "," : "", modules[i]);
        if (n < 0 || (size_t)n >= outLen - pos) { ok = false; break; }
        pos += (size_t)n;

        bool any = false;
        ok = writeModuleBody_(modules[i], out, outLen, pos, any);
        if (!ok || pos + 1 >= outLen) { ok = false; break; }
        out[pos++] = '}';
    }

    if (ok && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
        return true;
    }

    // Keep the output parseable rather than returning a cut object.
    snprintf(out, outLen, "{}");
    Log::warn(LOG_TAG_CORE, "toJson truncated (buf=%u vars=%u)", (unsigned)outLen, (unsigned)_metaCount);
    return false;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen < 3) return false;
    if (!module || module[0] == '\0') {
        out[0] = '\0';
        return false;
    }

    size_t pos = 0;
    out[pos++] = '{';
    bool any = false;
    bool ok = writeModuleBody_(module, out, outLen, pos, any);

    if (ok && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        ok = false;
        snprintf(out, outLen, "{}");
    }

    if (truncated) *truncated = !ok;
    return any && ok;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count >= max) break;
        out[count++] = m.module;
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    DynamicJsonDocument doc(Limits::JsonConfigApplyBuf);
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: invalid json (%s)", err ? err.c_str() : "not an object");
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    bool allTyped = true;
    uint16_t changedCount = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        JsonVariantConst moduleObj = root[m.module];
        if (!moduleObj.is<JsonObjectConst>()) continue;
        JsonVariantConst v = moduleObj[m.name];
        if (v.isNull()) continue;

        bool changed = false;
        bool typed = true;

        switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) { typed = false; break; }
            const int32_t nv = v.as<int32_t>();
            if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) { typed = false; break; }
            const uint8_t nv = v.as<uint8_t>();
            if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) { typed = false; break; }
            const bool nv = v.as<bool>();
            if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Float: {
            if (!v.is<float>()) { typed = false; break; }
            const float nv = v.as<float>();
            if (*(float*)m.valuePtr != nv) { *(float*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::Double: {
            if (!v.is<double>()) { typed = false; break; }
            const double nv = v.as<double>();
            if (*(double*)m.valuePtr != nv) { *(double*)m.valuePtr = nv; changed = true; }
            break;
        }
        case ConfigType::CharArray: {
            if (!v.is<const char*>()) { typed = false; break; }
            const char* s = v.as<const char*>();
            size_t len = strlen(s);
            if (len >= m.size) len = m.size - 1;
            char* dst = (char*)m.valuePtr;
            if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                memcpy(dst, s, len);
                dst[len] = '\0';
                changed = true;
            }
            break;
        }
        }

        if (!typed) {
            allTyped = false;
            Log::warn(LOG_TAG_CORE, "applyJson: type mismatch for %s.%s", m.module, m.name);
            continue;
        }
        if (!changed) continue;

        ++changedCount;
        Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
        if (!writePersistent(m)) {
            Log::warn(LOG_TAG_CORE, "applyJson: persist failed for %s.%s", m.module, m.name);
        }
        notifyChanged(m.nvsKey);
    }

    Log::debug(LOG_TAG_CORE, "applyJson: done changed=%u", (unsigned)changedCount);
    return allTyped;
}

bool ConfigStore::runMigrations(uint32_t currentVersion,
                                const MigrationStep* steps,
                                size_t count,
                                const char* versionKey,
                                bool clearOnFail)
{
    if (!_prefs || !steps || count == 0) return false;
    if (!versionKey) versionKey = "cfg_ver";

    uint32_t storedVersion = _prefs->getUInt(versionKey, 0);
    Log::debug(LOG_TAG_CORE, "migrations: stored=%lu current=%lu",
               (unsigned long)storedVersion, (unsigned long)currentVersion);

    if (storedVersion == currentVersion) return true;

    // Stored schema is newer than this firmware (downgrade): leave NVS untouched.
    if (storedVersion > currentVersion) {
        Log::error(LOG_TAG_CORE, "config schema %lu newer than firmware %lu",
                   (unsigned long)storedVersion, (unsigned long)currentVersion);
        return false;
    }

    while (storedVersion < currentVersion) {
        bool stepFound = false;

        for (size_t i = 0; i < count; ++i) {
            const MigrationStep& s = steps[i];
            if (s.fromVersion == storedVersion) {
                stepFound = true;

                if (!s.apply) return false;

                bool ok = s.apply(*_prefs, clearOnFail);
                if (!ok) {
                    Log::warn(LOG_TAG_CORE, "migration failed: %lu -> %lu",
                              (unsigned long)s.fromVersion, (unsigned long)s.toVersion);
                    if (clearOnFail) {
                        _prefs->clear();
                        putUInt_(versionKey, 0);
                    }
                    return false;
                }

                storedVersion = s.toVersion;
                putUInt_(versionKey, storedVersion);
                Log::debug(LOG_TAG_CORE, "migration applied: now=%lu", (unsigned long)storedVersion);
                break;
            }
        }

        if (!stepFound) {
            Log::warn(LOG_TAG_CORE, "no migration from %lu", (unsigned long)storedVersion);
            if (clearOnFail) {
                _prefs->clear();
                putUInt_(versionKey, 0);
            }
            return false;
        }
    }

    putUInt_(versionKey, currentVersion);
    Log::debug(LOG_TAG_CORE, "migrations: completed at %lu", (unsigned long)currentVersion);
    return true;
}
