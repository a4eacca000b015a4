#include <unity.h>
#include <math.h>

#include "Modules/IrrigationModule/EtCalculator.h"

static void setField(DailyWeatherAggregate& agg, WeatherKind kind, float mean, uint16_t count = 24)
{
    WeatherFieldStat& f = agg.fields[(uint8_t)kind];
    f.present = true;
    f.mean = mean;
    f.count = count;
}

static DailyWeatherAggregate summerDay()
{
    DailyWeatherAggregate agg{};
    setField(agg, WeatherKind::Temperature, 22.0f);
    setField(agg, WeatherKind::Humidity, 55.0f);
    agg.tempMin = 14.0f;
    agg.tempMax = 30.0f;
    return agg;
}

static EtLocation location()
{
    EtLocation loc{};
    loc.latitudeDeg = 45.0f;
    loc.longitudeDeg = 5.0f;
    loc.elevationM = 100.0f;
    return loc;
}

void test_standard_pressure_from_elevation()
{
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 101.3f, (float)etStandardPressureKpa(0.0));
    TEST_ASSERT_FLOAT_WITHIN(0.1f, 81.8f, (float)etStandardPressureKpa(1800.0));
}

void test_extraterrestrial_radiation_reference_value()
{
    // 20 deg S, 3 September.
    TEST_ASSERT_FLOAT_WITHIN(0.2f, 32.2f, (float)etExtraterrestrialRadiation(-20.0, 246));
    // Polar night.
    TEST_ASSERT_EQUAL_FLOAT(0.0f, (float)etExtraterrestrialRadiation(80.0, 355));
}

void test_day_of_year_from_date_key()
{
    TEST_ASSERT_EQUAL_UINT16(1, etDayOfYear(20230101));
    TEST_ASSERT_EQUAL_UINT16(60, etDayOfYear(20230301));
    TEST_ASSERT_EQUAL_UINT16(61, etDayOfYear(20240301));
    TEST_ASSERT_EQUAL_UINT16(365, etDayOfYear(20231231));
    TEST_ASSERT_EQUAL_UINT16(366, etDayOfYear(20241231));
    TEST_ASSERT_EQUAL_UINT16(0, etDayOfYear(20230229));
    TEST_ASSERT_EQUAL_UINT16(0, etDayOfYear(20231301));
    TEST_ASSERT_EQUAL_UINT16(0, etDayOfYear(0));
}

void test_temperature_and_humidity_only_uses_hargreaves()
{
    EtResult r{};
    TEST_ASSERT_TRUE(computeDailyEt0(summerDay(), location(), 20240620, r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::Hargreaves, (uint8_t)r.method);
    TEST_ASSERT_TRUE(r.et0Mm > 3.0f);
    TEST_ASSERT_TRUE(r.et0Mm < 9.0f);
}

void test_missing_humidity_skips_the_day()
{
    DailyWeatherAggregate agg = summerDay();
    agg.fields[(uint8_t)WeatherKind::Humidity].present = false;

    EtResult r{};
    TEST_ASSERT_FALSE(computeDailyEt0(agg, location(), 20240620, r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::None, (uint8_t)r.method);

    float et0 = -1.0f;
    TEST_ASSERT_FALSE(computeEt0(agg, location(), EtMethod::Hargreaves, 172, et0));
    TEST_ASSERT_EQUAL_FLOAT(-1.0f, et0);
}

void test_penman_monteith_full_inputs_is_plausible()
{
    DailyWeatherAggregate agg = summerDay();
    setField(agg, WeatherKind::Wind, 7.2f);
    setField(agg, WeatherKind::Solar, 260.0f);
    setField(agg, WeatherKind::Pressure, 1005.0f);

    EtResult r{};
    TEST_ASSERT_TRUE(computeDailyEt0(agg, location(), 20240620, r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::PenmanMonteith, (uint8_t)r.method);
    TEST_ASSERT_TRUE(r.et0Mm > 2.0f);
    TEST_ASSERT_TRUE(r.et0Mm < 9.0f);
}

void test_missing_pressure_uses_standard_atmosphere()
{
    DailyWeatherAggregate withoutPressure = summerDay();
    setField(withoutPressure, WeatherKind::Wind, 10.0f);
    setField(withoutPressure, WeatherKind::Solar, 220.0f);

    DailyWeatherAggregate withPressure = withoutPressure;
    setField(withPressure, WeatherKind::Pressure, (float)(etStandardPressureKpa(100.0) * 10.0));

    float a = 0.0f;
    float b = 0.0f;
    TEST_ASSERT_TRUE(computeEt0(withoutPressure, location(), EtMethod::PenmanMonteith, 172, a));
    TEST_ASSERT_TRUE(computeEt0(withPressure, location(), EtMethod::PenmanMonteith, 172, b));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, a, b);
}

void test_priestley_taylor_increases_with_solar()
{
    DailyWeatherAggregate dim = summerDay();
    setField(dim, WeatherKind::Solar, 120.0f);
    DailyWeatherAggregate bright = summerDay();
    setField(bright, WeatherKind::Solar, 300.0f);

    float low = 0.0f;
    float high = 0.0f;
    TEST_ASSERT_TRUE(computeEt0(dim, location(), EtMethod::PriestleyTaylor, 172, low));
    TEST_ASSERT_TRUE(computeEt0(bright, location(), EtMethod::PriestleyTaylor, 172, high));
    TEST_ASSERT_TRUE(high > low);
}

void test_wind_only_priestley_taylor_estimates_radiation()
{
    DailyWeatherAggregate agg = summerDay();
    setField(agg, WeatherKind::Wind, 15.0f);

    EtResult r{};
    TEST_ASSERT_TRUE(computeDailyEt0(agg, location(), 20240620, r));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::PriestleyTaylor, (uint8_t)r.method);
    TEST_ASSERT_TRUE(r.et0Mm > 0.0f);
}

void test_cold_dark_day_never_negative()
{
    DailyWeatherAggregate agg{};
    setField(agg, WeatherKind::Temperature, -10.0f, 1);
    setField(agg, WeatherKind::Humidity, 95.0f);
    setField(agg, WeatherKind::Solar, 0.0f);
    agg.tempMin = -10.0f;
    agg.tempMax = -10.0f;

    EtLocation loc = location();
    loc.latitudeDeg = 65.0f;

    float et0 = -1.0f;
    TEST_ASSERT_TRUE(computeEt0(agg, loc, EtMethod::PriestleyTaylor, 355, et0));
    TEST_ASSERT_TRUE(et0 >= 0.0f);
    TEST_ASSERT_TRUE(computeEt0(agg, loc, EtMethod::Hargreaves, 355, et0));
    TEST_ASSERT_TRUE(et0 >= 0.0f);
}

void test_crop_coefficient_is_bounded()
{
    TEST_ASSERT_EQUAL_FLOAT(4.0f, etcFromEt0(4.0f, 1.0f));
    TEST_ASSERT_EQUAL_FLOAT(8.0f, etcFromEt0(4.0f, 3.0f));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.6f, etcFromEt0(4.0f, 0.1f));
    TEST_ASSERT_EQUAL_FLOAT(1.0f, clampCropCoefficient(NAN));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_standard_pressure_from_elevation);
    RUN_TEST(test_extraterrestrial_radiation_reference_value);
    RUN_TEST(test_day_of_year_from_date_key);
    RUN_TEST(test_temperature_and_humidity_only_uses_hargreaves);
    RUN_TEST(test_missing_humidity_skips_the_day);
    RUN_TEST(test_penman_monteith_full_inputs_is_plausible);
    RUN_TEST(test_missing_pressure_uses_standard_atmosphere);
    RUN_TEST(test_priestley_taylor_increases_with_solar);
    RUN_TEST(test_wind_only_priestley_taylor_estimates_radiation);
    RUN_TEST(test_cold_dark_day_never_negative);
    RUN_TEST(test_crop_coefficient_is_bounded);
    return UNITY_END();
}
