#include <unity.h>

#include "Modules/WeatherModule/PrecipitationCounter.h"
#include "Modules/WeatherModule/WeatherAggregator.h"

static WeatherSample sample(WeatherKind kind, float value, uint32_t ts)
{
    WeatherSample s{};
    s.kind = kind;
    s.value = value;
    s.ts = ts;
    return s;
}

void test_means_and_temperature_extremes()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 10.0f, 1000),
        sample(WeatherKind::Humidity, 50.0f, 1000),
        sample(WeatherKind::Temperature, 20.0f, 2000),
        sample(WeatherKind::Temperature, 30.0f, 3000),
        sample(WeatherKind::Humidity, 70.0f, 3000),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_TRUE(aggregateDailyWeather(samples, 5, 0, 86400, agg));
    TEST_ASSERT_EQUAL_FLOAT(20.0f, agg.mean(WeatherKind::Temperature));
    TEST_ASSERT_EQUAL_FLOAT(60.0f, agg.mean(WeatherKind::Humidity));
    TEST_ASSERT_EQUAL_UINT16(3, agg.count(WeatherKind::Temperature));
    TEST_ASSERT_EQUAL_FLOAT(10.0f, agg.tempMin);
    TEST_ASSERT_EQUAL_FLOAT(30.0f, agg.tempMax);
}

void test_samples_outside_window_are_ignored()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 40.0f, 99),
        sample(WeatherKind::Temperature, 12.0f, 100),
        sample(WeatherKind::Humidity, 80.0f, 200),
        sample(WeatherKind::Temperature, 14.0f, 200),
        sample(WeatherKind::Temperature, -30.0f, 201),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_TRUE(aggregateDailyWeather(samples, 5, 100, 200, agg));
    TEST_ASSERT_EQUAL_FLOAT(13.0f, agg.mean(WeatherKind::Temperature));
    TEST_ASSERT_EQUAL_UINT16(2, agg.count(WeatherKind::Temperature));
    TEST_ASSERT_EQUAL_UINT32(100, agg.windowStart);
    TEST_ASSERT_EQUAL_UINT32(200, agg.windowEnd);
}

void test_out_of_range_samples_never_reach_aggregate()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 20.0f, 10),
        sample(WeatherKind::Temperature, 99.0f, 20),
        sample(WeatherKind::Humidity, 40.0f, 30),
        sample(WeatherKind::Humidity, 140.0f, 40),
        sample(WeatherKind::Solar, 2000.0f, 50),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_TRUE(aggregateDailyWeather(samples, 5, 0, 100, agg));
    TEST_ASSERT_EQUAL_FLOAT(20.0f, agg.mean(WeatherKind::Temperature));
    TEST_ASSERT_EQUAL_FLOAT(40.0f, agg.mean(WeatherKind::Humidity));
    TEST_ASSERT_EQUAL_FLOAT(20.0f, agg.tempMax);
    TEST_ASSERT_FALSE(agg.has(WeatherKind::Solar));
    TEST_ASSERT_EQUAL_UINT16(3, agg.rejectedCount);
}

void test_precipitation_sums_increases_and_skips_rollover()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 18.0f, 0),
        sample(WeatherKind::Humidity, 60.0f, 0),
        sample(WeatherKind::Precipitation, 1.0f, 100),
        sample(WeatherKind::Precipitation, 3.5f, 200),
        sample(WeatherKind::Precipitation, 3.5f, 300),
        sample(WeatherKind::Precipitation, 0.25f, 400),
        sample(WeatherKind::Precipitation, 1.25f, 500),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_TRUE(aggregateDailyWeather(samples, 7, 0, 1000, agg));
    TEST_ASSERT_TRUE(agg.has(WeatherKind::Precipitation));
    TEST_ASSERT_EQUAL_UINT16(5, agg.count(WeatherKind::Precipitation));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 3.5f, agg.precipMm);
}

void test_precipitation_jump_over_limit_is_anomalous()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 18.0f, 0),
        sample(WeatherKind::Humidity, 60.0f, 0),
        sample(WeatherKind::Precipitation, 120.0f, 100),
        sample(WeatherKind::Precipitation, 340.0f, 200),
        sample(WeatherKind::Precipitation, 341.0f, 300),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_TRUE(aggregateDailyWeather(samples, 5, 0, 1000, agg));
    TEST_ASSERT_EQUAL_UINT16(1, agg.anomalyCount);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, agg.precipMm);
}

void test_optional_fields_absent_and_irregular_sampling()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 10.0f, 0),
        sample(WeatherKind::Temperature, 11.0f, 7),
        sample(WeatherKind::Temperature, 15.0f, 80000),
        sample(WeatherKind::Humidity, 55.0f, 43000),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_TRUE(aggregateDailyWeather(samples, 4, 0, 86400, agg));
    TEST_ASSERT_EQUAL_FLOAT(12.0f, agg.mean(WeatherKind::Temperature));
    TEST_ASSERT_FALSE(agg.has(WeatherKind::Wind));
    TEST_ASSERT_FALSE(agg.has(WeatherKind::Solar));
    TEST_ASSERT_FALSE(agg.has(WeatherKind::Pressure));
    TEST_ASSERT_FALSE(agg.has(WeatherKind::Precipitation));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, agg.precipMm);
}

void test_missing_humidity_makes_aggregate_invalid()
{
    const WeatherSample samples[] = {
        sample(WeatherKind::Temperature, 22.0f, 10),
        sample(WeatherKind::Wind, 12.0f, 10),
    };

    DailyWeatherAggregate agg{};
    TEST_ASSERT_FALSE(aggregateDailyWeather(samples, 2, 0, 100, agg));
    TEST_ASSERT_FALSE(agg.valid());
    TEST_ASSERT_TRUE(agg.has(WeatherKind::Wind));
}

void test_empty_input_is_invalid_not_error()
{
    DailyWeatherAggregate agg{};
    TEST_ASSERT_FALSE(aggregateDailyWeather(nullptr, 0, 0, 100, agg));
    TEST_ASSERT_FALSE(agg.has(WeatherKind::Temperature));
}

void test_live_counter_tracks_baseline_after_faults()
{
    PrecipitationCounter c;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrecipStepKind::First, (uint8_t)c.update(120.0f).kind);

    PrecipStep step = c.update(340.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrecipStepKind::Anomaly, (uint8_t)step.kind);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, step.rainMm);
    TEST_ASSERT_EQUAL_FLOAT(120.0f, step.previous);

    step = c.update(342.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrecipStepKind::Increase, (uint8_t)step.kind);
    TEST_ASSERT_EQUAL_FLOAT(2.0f, step.rainMm);

    step = c.update(0.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrecipStepKind::Rollover, (uint8_t)step.kind);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, step.rainMm);

    step = c.update(0.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrecipStepKind::NoChange, (uint8_t)step.kind);

    step = c.update(200.0f);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)PrecipStepKind::Increase, (uint8_t)step.kind);
    TEST_ASSERT_EQUAL_FLOAT(200.0f, step.rainMm);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_means_and_temperature_extremes);
    RUN_TEST(test_samples_outside_window_are_ignored);
    RUN_TEST(test_out_of_range_samples_never_reach_aggregate);
    RUN_TEST(test_precipitation_sums_increases_and_skips_rollover);
    RUN_TEST(test_precipitation_jump_over_limit_is_anomalous);
    RUN_TEST(test_optional_fields_absent_and_irregular_sampling);
    RUN_TEST(test_missing_humidity_makes_aggregate_invalid);
    RUN_TEST(test_empty_input_is_invalid_not_error);
    RUN_TEST(test_live_counter_tracks_baseline_after_faults);
    return UNITY_END();
}
