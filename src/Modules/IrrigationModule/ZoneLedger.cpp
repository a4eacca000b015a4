/**
 * @file ZoneLedger.cpp
 * @brief Per-zone soil moisture balance.
 */

#include "Modules/IrrigationModule/ZoneLedger.h"
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

float runtimeSecondsForDeficit(float deficitMm, float rateMmH)
{
    if (!(deficitMm > 0.0f) || !(rateMmH > 0.0f)) return 0.0f;
    return deficitMm / rateMmH * 3600.0f;
}

bool ZoneLedger::addRain(float mm)
{
    if (!isfinite(mm) || mm < 0.0f) return false;
    balanceMm_ += mm;
    return true;
}

bool ZoneLedger::addIrrigation(float mm)
{
    if (!isfinite(mm) || mm < 0.0f) return false;
    balanceMm_ += mm;
    return true;
}

EtApplyResult ZoneLedger::applyEt(uint32_t date, float etcMm, bool force)
{
    if (date == 0 || !isfinite(etcMm) || etcMm < 0.0f) return EtApplyResult::InvalidValue;
    if (lastEtDate_ != 0 && date < lastEtDate_) return EtApplyResult::StaleDate;

    if (lastEtDate_ == date) {
        if (!force) return EtApplyResult::AlreadyApplied;
        balanceMm_ += lastEtMm_;
        balanceMm_ -= etcMm;
        lastEtMm_ = etcMm;
        return EtApplyResult::Reapplied;
    }

    balanceMm_ -= etcMm;
    lastEtDate_ = date;
    lastEtMm_ = etcMm;
    return EtApplyResult::Applied;
}

bool ZoneLedger::setBalance(float mm, bool resetEtGuard)
{
    if (!isfinite(mm)) return false;
    balanceMm_ = mm;
    if (resetEtGuard) {
        lastEtDate_ = 0;
        lastEtMm_ = 0.0f;
    }
    return true;
}

float ZoneLedger::requiredRuntimeSeconds(float rateMmH) const
{
    float deficit = (balanceMm_ < 0.0f) ? -balanceMm_ : 0.0f;
    return runtimeSecondsForDeficit(deficit, rateMmH);
}

void ZoneLedger::restore(float balanceMm, uint32_t lastEtDate, float lastEtMm)
{
    balanceMm_ = isfinite(balanceMm) ? balanceMm : 0.0f;
    if (lastEtDate == 0 || !isfinite(lastEtMm) || lastEtMm < 0.0f) {
        lastEtDate_ = 0;
        lastEtMm_ = 0.0f;
        return;
    }
    lastEtDate_ = lastEtDate;
    lastEtMm_ = lastEtMm;
}

const char* etApplyResultStr(EtApplyResult r)
{
    switch (r) {
        case EtApplyResult::Applied: return "applied";
        case EtApplyResult::AlreadyApplied: return "already_applied";
        case EtApplyResult::Reapplied: return "reapplied";
        case EtApplyResult::StaleDate: return "stale_date";
        case EtApplyResult::InvalidValue: return "invalid_value";
        default: return "unknown";
    }
}

LedgerDecodeResult decodeLedgerRecord(const char* blob, ZoneLedgerRecord& out)
{
    out = ZoneLedgerRecord{};
    if (!blob || blob[0] == '\0') return LedgerDecodeResult::Empty;

    char buf[128] = {0};
    strncpy(buf, blob, sizeof(buf) - 1);

    char* save = nullptr;
    char* tok = strtok_r(buf, ",", &save);
    if (!tok || strcmp(tok, "v1") != 0) return LedgerDecodeResult::BadHeader;

    auto nextU32 = [&save](uint32_t& v) -> bool {
        char* t = strtok_r(nullptr, ",", &save);
        if (!t) return false;
        char* end = nullptr;
        v = (uint32_t)strtoul(t, &end, 10);
        return end != t && *end == '\0';
    };
    auto nextF32 = [&save](float& v) -> bool {
        char* t = strtok_r(nullptr, ",", &save);
        if (!t) return false;
        char* end = nullptr;
        v = strtof(t, &end);
        return end != t && *end == '\0' && isfinite(v);
    };

    ZoneLedgerRecord r{};
    uint32_t runOpen = 0;
    if (!nextF32(r.balanceMm) ||
        !nextU32(r.lastEtDate) ||
        !nextF32(r.lastEtMm) ||
        !nextU32(r.runtimeTodaySec) ||
        !nextU32(r.lastOffEpoch) ||
        !nextU32(runOpen)) {
        return LedgerDecodeResult::BadField;
    }
    if (strtok_r(nullptr, ",", &save) != nullptr) return LedgerDecodeResult::TrailingFields;

    r.runOpen = (runOpen != 0);
    out = r;
    return LedgerDecodeResult::Ok;
}

bool encodeLedgerRecord(const ZoneLedgerRecord& rec, char* out, size_t len)
{
    if (!out || len == 0) return false;
    const int wrote = snprintf(out, len, "v1,%.3f,%lu,%.3f,%lu,%lu,%u",
                               (double)rec.balanceMm,
                               (unsigned long)rec.lastEtDate,
                               (double)rec.lastEtMm,
                               (unsigned long)rec.runtimeTodaySec,
                               (unsigned long)rec.lastOffEpoch,
                               rec.runOpen ? 1U : 0U);
    return wrote > 0 && (size_t)wrote < len;
}

const char* ledgerDecodeResultStr(LedgerDecodeResult r)
{
    switch (r) {
        case LedgerDecodeResult::Ok: return "ok";
        case LedgerDecodeResult::Empty: return "empty";
        case LedgerDecodeResult::BadHeader: return "bad_header";
        case LedgerDecodeResult::BadField: return "bad_field";
        case LedgerDecodeResult::TrailingFields: return "trailing_fields";
        default: return "unknown";
    }
}

uint8_t removedZoneMask(uint8_t zoneCount, uint8_t maxZones)
{
    if (maxZones > 8) maxZones = 8;
    uint8_t mask = 0;
    for (uint8_t i = zoneCount; i < maxZones; ++i) mask |= (uint8_t)(1u << i);
    return mask;
}
