#include <unity.h>

#include "Modules/IrrigationModule/RunEligibility.h"

static RunEligibilityInput baseInput()
{
    RunEligibilityInput in{};
    in.balanceMm = -10.0f;
    in.rateMmH = 10.0f;
    in.forecastRainMm = 0.0f;
    in.minRuntimeS = 60;
    in.maxRuntimeS = 3600;
    in.minIntervalS = 3600;
    return in;
}

void test_deficit_is_ready_with_clamped_runtime()
{
    RunEligibilityInput in = baseInput();
    in.balanceMm = -25.0f;

    RunEligibilityOutput out{};
    TEST_ASSERT_TRUE(evaluateRunEligibility(in, out));
    TEST_ASSERT_TRUE(out.canRun);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunBlockReason::Ready, (uint8_t)out.reason);
    TEST_ASSERT_EQUAL_FLOAT(9000.0f, out.requiredRuntimeS);
    TEST_ASSERT_EQUAL_FLOAT(3600.0f, out.recommendedRuntimeS);
}

void test_min_interval_checked_first()
{
    RunEligibilityInput in = baseInput();
    in.hasLastOff = true;
    in.secondsSinceLastOff = 120;

    RunEligibilityOutput out{};
    evaluateRunEligibility(in, out);
    TEST_ASSERT_FALSE(out.canRun);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunBlockReason::MinInterval, (uint8_t)out.reason);

    in.secondsSinceLastOff = 3600;
    evaluateRunEligibility(in, out);
    TEST_ASSERT_TRUE(out.canRun);
}

void test_no_deficit()
{
    RunEligibilityInput in = baseInput();
    in.balanceMm = 0.0f;

    RunEligibilityOutput out{};
    evaluateRunEligibility(in, out);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunBlockReason::NoDeficit, (uint8_t)out.reason);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, out.recommendedRuntimeS);
}

void test_forecast_rain_covers_deficit()
{
    RunEligibilityInput in = baseInput();
    in.forecastRainMm = 12.0f;

    RunEligibilityOutput out{};
    evaluateRunEligibility(in, out);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunBlockReason::RainForecast, (uint8_t)out.reason);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, out.effectiveDeficitMm);

    in.forecastRainMm = 4.0f;
    evaluateRunEligibility(in, out);
    TEST_ASSERT_EQUAL_FLOAT(6.0f, out.effectiveDeficitMm);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 2160.0f, out.requiredRuntimeS);
}

void test_runtime_too_short()
{
    RunEligibilityInput in = baseInput();
    in.balanceMm = -0.1f;

    RunEligibilityOutput out{};
    evaluateRunEligibility(in, out);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)RunBlockReason::TooShort, (uint8_t)out.reason);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 36.0f, out.requiredRuntimeS);
    TEST_ASSERT_EQUAL_FLOAT(60.0f, out.recommendedRuntimeS);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_deficit_is_ready_with_clamped_runtime);
    RUN_TEST(test_min_interval_checked_first);
    RUN_TEST(test_no_deficit);
    RUN_TEST(test_forecast_rain_covers_deficit);
    RUN_TEST(test_runtime_too_short);
    return UNITY_END();
}
