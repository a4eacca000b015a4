#include <unity.h>

#include "Modules/IrrigationModule/EtCalculator.h"
#include "Modules/IrrigationModule/ZoneLedger.h"

void test_required_runtime_for_deficit()
{
    ZoneLedger ledger;
    ledger.setBalance(-25.0f);
    TEST_ASSERT_EQUAL_FLOAT(9000.0f, ledger.requiredRuntimeSeconds(10.0f));
}

void test_required_runtime_zero_when_not_in_deficit()
{
    ZoneLedger ledger;
    TEST_ASSERT_EQUAL_FLOAT(0.0f, ledger.requiredRuntimeSeconds(10.0f));
    ledger.setBalance(3.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, ledger.requiredRuntimeSeconds(10.0f));
    ledger.setBalance(-3.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, ledger.requiredRuntimeSeconds(0.0f));
}

void test_required_runtime_non_increasing_with_balance()
{
    ZoneLedger ledger;
    float prev = 1e30f;
    for (int i = -100; i <= 20; ++i) {
        ledger.setBalance((float)i * 0.5f);
        float r = ledger.requiredRuntimeSeconds(8.0f);
        TEST_ASSERT_TRUE(r <= prev);
        if (ledger.balanceMm() >= 0.0f) TEST_ASSERT_EQUAL_FLOAT(0.0f, r);
        prev = r;
    }
}

void test_rain_and_irrigation_add_without_bound()
{
    ZoneLedger ledger;
    TEST_ASSERT_TRUE(ledger.addRain(150.0f));
    TEST_ASSERT_TRUE(ledger.addRain(150.0f));
    TEST_ASSERT_TRUE(ledger.addIrrigation(2.5f));
    TEST_ASSERT_EQUAL_FLOAT(302.5f, ledger.balanceMm());

    TEST_ASSERT_FALSE(ledger.addRain(-1.0f));
    TEST_ASSERT_EQUAL_FLOAT(302.5f, ledger.balanceMm());
}

void test_apply_et_once_per_date()
{
    ZoneLedger ledger;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::Applied, (uint8_t)ledger.applyEt(20240601, 4.0f));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::AlreadyApplied, (uint8_t)ledger.applyEt(20240601, 4.0f));
    TEST_ASSERT_EQUAL_FLOAT(-4.0f, ledger.balanceMm());
    TEST_ASSERT_EQUAL_UINT32(20240601, ledger.lastEtDate());

    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::Applied, (uint8_t)ledger.applyEt(20240602, 3.0f));
    TEST_ASSERT_EQUAL_FLOAT(-7.0f, ledger.balanceMm());
}

void test_forced_recompute_replaces_prior_et()
{
    ZoneLedger ledger;
    ledger.applyEt(20240601, 4.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::Reapplied, (uint8_t)ledger.applyEt(20240601, 5.0f, true));
    TEST_ASSERT_EQUAL_FLOAT(-5.0f, ledger.balanceMm());
    TEST_ASSERT_EQUAL_FLOAT(5.0f, ledger.lastEtMm());
}

void test_force_on_new_date_applies_normally()
{
    ZoneLedger ledger;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::Applied, (uint8_t)ledger.applyEt(20240601, 4.0f, true));
    TEST_ASSERT_EQUAL_FLOAT(-4.0f, ledger.balanceMm());
}

void test_older_date_is_ignored()
{
    ZoneLedger ledger;
    ledger.applyEt(20240602, 4.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::StaleDate, (uint8_t)ledger.applyEt(20240601, 2.0f));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::StaleDate, (uint8_t)ledger.applyEt(20240601, 2.0f, true));
    TEST_ASSERT_EQUAL_FLOAT(-4.0f, ledger.balanceMm());
    TEST_ASSERT_EQUAL_UINT32(20240602, ledger.lastEtDate());
}

void test_set_balance_keeps_et_guard_by_default()
{
    ZoneLedger ledger;
    ledger.applyEt(20240601, 4.0f);
    TEST_ASSERT_TRUE(ledger.setBalance(10.0f));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::AlreadyApplied, (uint8_t)ledger.applyEt(20240601, 4.0f));
    TEST_ASSERT_EQUAL_FLOAT(10.0f, ledger.balanceMm());
}

void test_set_balance_with_guard_reset_allows_et_again()
{
    ZoneLedger ledger;
    ledger.applyEt(20240601, 4.0f);
    TEST_ASSERT_TRUE(ledger.setBalance(10.0f, true));
    TEST_ASSERT_EQUAL_UINT32(0, ledger.lastEtDate());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::Applied, (uint8_t)ledger.applyEt(20240601, 4.0f));
    TEST_ASSERT_EQUAL_FLOAT(6.0f, ledger.balanceMm());
}

void test_skipped_day_leaves_ledger_untouched()
{
    ZoneLedger ledger;
    ledger.applyEt(20240531, 3.0f);

    DailyWeatherAggregate agg{};
    agg.fields[(uint8_t)WeatherKind::Temperature].present = true;
    agg.fields[(uint8_t)WeatherKind::Temperature].mean = 25.0f;
    agg.fields[(uint8_t)WeatherKind::Temperature].count = 10;

    EtLocation loc{};
    loc.latitudeDeg = 45.0f;
    EtResult r{};
    if (computeDailyEt0(agg, loc, 20240601, r)) {
        ledger.applyEt(20240601, etcFromEt0(r.et0Mm, 1.0f));
    }
    TEST_ASSERT_EQUAL_UINT32(20240531, ledger.lastEtDate());
    TEST_ASSERT_EQUAL_FLOAT(-3.0f, ledger.balanceMm());
}

void test_restore_rejects_inconsistent_guard()
{
    ZoneLedger ledger;
    ledger.restore(-8.0f, 20240601, 2.0f);
    TEST_ASSERT_EQUAL_FLOAT(-8.0f, ledger.balanceMm());
    TEST_ASSERT_EQUAL_UINT32(20240601, ledger.lastEtDate());
    TEST_ASSERT_EQUAL_FLOAT(2.0f, ledger.lastEtMm());

    ledger.restore(-8.0f, 20240601, -2.0f);
    TEST_ASSERT_EQUAL_UINT32(0, ledger.lastEtDate());
}

void test_saved_blob_restores_ledger()
{
    ZoneLedgerRecord rec{};
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LedgerDecodeResult::Ok,
                            (uint8_t)decodeLedgerRecord("v1,-12.500,20260412,3.250,900,1776000000,1", rec));
    TEST_ASSERT_EQUAL_FLOAT(-12.5f, rec.balanceMm);
    TEST_ASSERT_EQUAL_UINT32(20260412, rec.lastEtDate);
    TEST_ASSERT_EQUAL_UINT32(900, rec.runtimeTodaySec);
    TEST_ASSERT_TRUE(rec.runOpen);

    ZoneLedger ledger;
    ledger.restore(rec.balanceMm, rec.lastEtDate, rec.lastEtMm);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::AlreadyApplied, (uint8_t)ledger.applyEt(20260412, 3.25f));

    char blob[96] = {0};
    TEST_ASSERT_TRUE(encodeLedgerRecord(rec, blob, sizeof(blob)));
    TEST_ASSERT_EQUAL_STRING("v1,-12.500,20260412,3.250,900,1776000000,1", blob);
}

void test_cleared_or_corrupt_blob_restores_nothing()
{
    ZoneLedgerRecord rec{};
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LedgerDecodeResult::Empty, (uint8_t)decodeLedgerRecord("", rec));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LedgerDecodeResult::BadHeader,
                            (uint8_t)decodeLedgerRecord("v2,1.0,0,0.0,0,0,0", rec));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LedgerDecodeResult::BadField,
                            (uint8_t)decodeLedgerRecord("v1,nan,0,0.0,0,0,0", rec));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LedgerDecodeResult::BadField,
                            (uint8_t)decodeLedgerRecord("v1,1.0,0,0.0", rec));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LedgerDecodeResult::TrailingFields,
                            (uint8_t)decodeLedgerRecord("v1,1.0,0,0.0,0,0,0,7", rec));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, rec.balanceMm);
    TEST_ASSERT_FALSE(rec.runOpen);
}

void test_removed_zones_follow_zone_count()
{
    TEST_ASSERT_EQUAL_HEX8(0xF8, removedZoneMask(3, 8));
    TEST_ASSERT_EQUAL_HEX8(0x00, removedZoneMask(8, 8));
    TEST_ASSERT_EQUAL_HEX8(0xFE, removedZoneMask(1, 8));
    TEST_ASSERT_EQUAL_HEX8(0x0C, removedZoneMask(2, 4));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_required_runtime_for_deficit);
    RUN_TEST(test_required_runtime_zero_when_not_in_deficit);
    RUN_TEST(test_required_runtime_non_increasing_with_balance);
    RUN_TEST(test_rain_and_irrigation_add_without_bound);
    RUN_TEST(test_apply_et_once_per_date);
    RUN_TEST(test_forced_recompute_replaces_prior_et);
    RUN_TEST(test_force_on_new_date_applies_normally);
    RUN_TEST(test_older_date_is_ignored);
    RUN_TEST(test_set_balance_keeps_et_guard_by_default);
    RUN_TEST(test_set_balance_with_guard_reset_allows_et_again);
    RUN_TEST(test_skipped_day_leaves_ledger_untouched);
    RUN_TEST(test_restore_rejects_inconsistent_guard);
    RUN_TEST(test_saved_blob_restores_ledger);
    RUN_TEST(test_cleared_or_corrupt_blob_restores_nothing);
    RUN_TEST(test_removed_zones_follow_zone_count);
    return UNITY_END();
}
