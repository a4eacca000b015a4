#pragma once
/**
 * @file ZoneLedger.h
 * @brief Per-zone soil moisture balance.
 *
 * Single point of mutation for a zone balance (mm, negative = deficit).
 * Not thread safe: the owner serializes calls per zone.
 */

#include <stddef.h>
#include <stdint.h>

enum class EtApplyResult : uint8_t {
    Applied = 0,
    AlreadyApplied,
    Reapplied,
    StaleDate,
    InvalidValue
};

class ZoneLedger {
public:
    bool addRain(float mm);
    bool addIrrigation(float mm);

    /**
     * Subtract `etcMm` for `date` (YYYYMMDD) once. Same date again is a no-op,
     * unless `force`: the previous ET of that date is added back first.
     * Dates older than the last applied one are ignored.
     */
    EtApplyResult applyEt(uint32_t date, float etcMm, bool force = false);

    /** User override. `resetEtGuard` allows the day's ET to be applied again. */
    bool setBalance(float mm, bool resetEtGuard = false);

    float requiredRuntimeSeconds(float rateMmH) const;

    /** Restores persisted state; last ET fields are ignored when date is 0. */
    void restore(float balanceMm, uint32_t lastEtDate, float lastEtMm);

    float balanceMm() const { return balanceMm_; }
    uint32_t lastEtDate() const { return lastEtDate_; }
    float lastEtMm() const { return lastEtMm_; }

private:
    float balanceMm_ = 0.0f;
    uint32_t lastEtDate_ = 0;
    float lastEtMm_ = 0.0f;
};

/** Runtime in seconds to deliver `deficitMm` at `rateMmH`, 0 when nothing is missing. */
float runtimeSecondsForDeficit(float deficitMm, float rateMmH);

const char* etApplyResultStr(EtApplyResult r);

/**
 * Persisted zone state. Text form:
 * `v1,<balance_mm>,<last_et_date>,<last_et_mm>,<runtime_today_s>,<last_off>,<run_open>`.
 * An empty blob means the zone has no saved state.
 */
struct ZoneLedgerRecord {
    float balanceMm = 0.0f;
    uint32_t lastEtDate = 0;
    float lastEtMm = 0.0f;
    uint32_t runtimeTodaySec = 0;
    uint32_t lastOffEpoch = 0;
    bool runOpen = false;
};

enum class LedgerDecodeResult : uint8_t {
    Ok = 0,
    Empty,
    BadHeader,
    BadField,
    TrailingFields
};

LedgerDecodeResult decodeLedgerRecord(const char* blob, ZoneLedgerRecord& out);
bool encodeLedgerRecord(const ZoneLedgerRecord& rec, char* out, size_t len);
const char* ledgerDecodeResultStr(LedgerDecodeResult r);

/** Bits of zone slots at or beyond `zoneCount`, whose saved state is dropped. */
uint8_t removedZoneMask(uint8_t zoneCount, uint8_t maxZones);
