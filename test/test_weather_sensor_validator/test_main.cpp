#include <unity.h>
#include <math.h>

#include "Modules/WeatherModule/SensorValidator.h"
#include "Modules/WeatherModule/WeatherTypes.h"
#include "Core/SystemLimits.h"

static void assertValidIdentity(WeatherKind kind, float value)
{
    SampleValidation v = validateWeatherSample(kind, value);
    TEST_ASSERT_TRUE(v.valid());
    TEST_ASSERT_EQUAL_FLOAT(value, v.value);
}

void test_inclusive_bounds_are_valid_and_identity()
{
    assertValidIdentity(WeatherKind::Temperature, -50.0f);
    assertValidIdentity(WeatherKind::Temperature, 60.0f);
    assertValidIdentity(WeatherKind::Humidity, 0.0f);
    assertValidIdentity(WeatherKind::Humidity, 100.0f);
    assertValidIdentity(WeatherKind::Precipitation, 0.0f);
    assertValidIdentity(WeatherKind::Precipitation, 500.0f);
    assertValidIdentity(WeatherKind::Wind, 200.0f);
    assertValidIdentity(WeatherKind::Solar, 1500.0f);
    assertValidIdentity(WeatherKind::Pressure, 800.0f);
    assertValidIdentity(WeatherKind::Pressure, 1100.0f);
    assertValidIdentity(WeatherKind::Temperature, 21.37f);
}

void test_above_range_reports_upper_bound()
{
    SampleValidation v = validateWeatherSample(WeatherKind::Temperature, 60.1f);
    TEST_ASSERT_FALSE(v.valid());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::AboveRange, (uint8_t)v.verdict);
    TEST_ASSERT_EQUAL_FLOAT(60.0f, v.bound);

    v = validateWeatherSample(WeatherKind::Humidity, 100.5f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::AboveRange, (uint8_t)v.verdict);

    v = validateWeatherSample(WeatherKind::Solar, 1600.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::AboveRange, (uint8_t)v.verdict);
}

void test_below_range_reports_lower_bound()
{
    SampleValidation v = validateWeatherSample(WeatherKind::Pressure, 799.9f);
    TEST_ASSERT_FALSE(v.valid());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::BelowRange, (uint8_t)v.verdict);
    TEST_ASSERT_EQUAL_FLOAT(800.0f, v.bound);

    v = validateWeatherSample(WeatherKind::Wind, -0.1f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::BelowRange, (uint8_t)v.verdict);

    v = validateWeatherSample(WeatherKind::Precipitation, -1.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::BelowRange, (uint8_t)v.verdict);
}

void test_non_finite_values_are_rejected()
{
    TEST_ASSERT_FALSE(validateWeatherSample(WeatherKind::Temperature, NAN).valid());
    TEST_ASSERT_FALSE(validateWeatherSample(WeatherKind::Humidity, INFINITY).valid());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::NotFinite,
                            (uint8_t)validateWeatherSample(WeatherKind::Solar, NAN).verdict);
}

void test_unknown_kind_is_rejected()
{
    SampleValidation v = validateWeatherSample(WeatherKind::Count, 10.0f);
    TEST_ASSERT_FALSE(v.valid());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)SampleVerdict::UnknownKind, (uint8_t)v.verdict);
}

void test_kind_names_round_trip()
{
    WeatherKind k = WeatherKind::Temperature;
    TEST_ASSERT_TRUE(weatherKindFromStr("pressure", k));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)WeatherKind::Pressure, (uint8_t)k);
    TEST_ASSERT_EQUAL_STRING("precipitation", weatherKindStr(WeatherKind::Precipitation));
    TEST_ASSERT_FALSE(weatherKindFromStr("rain", k));
    TEST_ASSERT_FALSE(weatherKindFromStr(nullptr, k));
}

void test_history_spacing_never_below_day_coverage()
{
    TEST_ASSERT_EQUAL_UINT32(Limits::Weather::MinSpacingFloorS, historySpacingS(0));
    TEST_ASSERT_EQUAL_UINT32(Limits::Weather::MinSpacingFloorS, historySpacingS(-5));
    TEST_ASSERT_EQUAL_UINT32(Limits::Weather::MinSpacingFloorS, historySpacingS(30));
    TEST_ASSERT_EQUAL_UINT32(300, historySpacingS(300));
    TEST_ASSERT_EQUAL_UINT32(900, historySpacingS(900));

    // A full ring at the enforced spacing reaches back at least 24h.
    const uint32_t span = (uint32_t)Limits::Weather::HistoryPerKind * historySpacingS(0);
    TEST_ASSERT_TRUE(span >= 86400U);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_inclusive_bounds_are_valid_and_identity);
    RUN_TEST(test_above_range_reports_upper_bound);
    RUN_TEST(test_below_range_reports_lower_bound);
    RUN_TEST(test_non_finite_values_are_rejected);
    RUN_TEST(test_unknown_kind_is_rejected);
    RUN_TEST(test_kind_names_round_trip);
    RUN_TEST(test_history_spacing_never_below_day_coverage);
    return UNITY_END();
}
