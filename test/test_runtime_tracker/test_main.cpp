#include <unity.h>

#include "Modules/IrrigationModule/RuntimeTracker.h"
#include "Modules/IrrigationModule/ZoneLedger.h"

void test_closed_run_converts_duration_to_water()
{
    RuntimeTracker t;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunEdgeResult::Opened, (uint8_t)t.valveOn(1000));
    TEST_ASSERT_TRUE(t.isOpen());

    IrrigationRun run{};
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunEdgeResult::Closed, (uint8_t)t.valveOff(901000, 10.0f, run));
    TEST_ASSERT_FALSE(t.isOpen());
    TEST_ASSERT_EQUAL_UINT32(1000, run.startMs);
    TEST_ASSERT_EQUAL_UINT32(901000, run.endMs);
    TEST_ASSERT_EQUAL_FLOAT(900.0f, run.durationSec);
    TEST_ASSERT_EQUAL_FLOAT(2.5f, run.waterMm);
}

void test_duplicate_rising_edge_extends_open_run()
{
    RuntimeTracker t;
    t.valveOn(0);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunEdgeResult::Extended, (uint8_t)t.valveOn(5000));
    TEST_ASSERT_EQUAL_UINT32(0, t.openSinceMs());

    IrrigationRun run{};
    t.valveOff(60000, 12.0f, run);
    TEST_ASSERT_EQUAL_FLOAT(60.0f, run.durationSec);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.2f, run.waterMm);
}

void test_falling_edge_without_run_is_ignored()
{
    RuntimeTracker t;
    IrrigationRun run{};
    run.waterMm = -1.0f;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunEdgeResult::IgnoredOff, (uint8_t)t.valveOff(1000, 10.0f, run));
    TEST_ASSERT_EQUAL_FLOAT(-1.0f, run.waterMm);
}

void test_duration_survives_millis_wrap()
{
    RuntimeTracker t;
    t.valveOn(0xFFFFF000UL);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 4.096f, t.openDurationSec(0x00000000UL));

    IrrigationRun run{};
    t.valveOff(0x00000FA0UL, 36.0f, run);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 8.096f, run.durationSec);
}

void test_irrigation_round_trip_is_exact()
{
    const float rate = 17.5f;
    RuntimeTracker t;
    ZoneLedger ledger;
    ledger.setBalance(-12.0f);

    t.valveOn(0);
    IrrigationRun run{};
    t.valveOff(1234000, rate, run);
    TEST_ASSERT_TRUE(ledger.addIrrigation(run.waterMm));

    const float expected = -12.0f + (1234.0f / 3600.0f) * rate;
    TEST_ASSERT_EQUAL_FLOAT(expected, ledger.balanceMm());
}

void test_invalid_rate_yields_no_water()
{
    TEST_ASSERT_EQUAL_FLOAT(0.0f, irrigationWaterMm(600.0f, 0.0f));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, irrigationWaterMm(0.0f, 10.0f));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_closed_run_converts_duration_to_water);
    RUN_TEST(test_duplicate_rising_edge_extends_open_run);
    RUN_TEST(test_falling_edge_without_run_is_ignored);
    RUN_TEST(test_duration_survives_millis_wrap);
    RUN_TEST(test_irrigation_round_trip_is_exact);
    RUN_TEST(test_invalid_rate_yields_no_water);
    return UNITY_END();
}
