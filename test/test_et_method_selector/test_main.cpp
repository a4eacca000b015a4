#include <unity.h>

#include "Modules/IrrigationModule/EtMethodSelector.h"

static DailyWeatherAggregate makeAggregate(bool wind, bool solar)
{
    DailyWeatherAggregate agg{};
    agg.fields[(uint8_t)WeatherKind::Temperature].present = true;
    agg.fields[(uint8_t)WeatherKind::Temperature].mean = 21.0f;
    agg.fields[(uint8_t)WeatherKind::Temperature].count = 24;
    agg.fields[(uint8_t)WeatherKind::Humidity].present = true;
    agg.fields[(uint8_t)WeatherKind::Humidity].mean = 55.0f;
    agg.fields[(uint8_t)WeatherKind::Humidity].count = 24;
    agg.fields[(uint8_t)WeatherKind::Wind].present = wind;
    agg.fields[(uint8_t)WeatherKind::Solar].present = solar;
    return agg;
}

void test_decision_table()
{
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::PenmanMonteith, (uint8_t)selectEtMethod(makeAggregate(true, true)));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::PriestleyTaylor, (uint8_t)selectEtMethod(makeAggregate(false, true)));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::Hargreaves, (uint8_t)selectEtMethod(makeAggregate(false, false)));
}

void test_wind_alone_does_not_unlock_penman_monteith()
{
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::PriestleyTaylor, (uint8_t)selectEtMethod(makeAggregate(true, false)));
}

void test_missing_temperature_or_humidity_selects_none()
{
    DailyWeatherAggregate agg = makeAggregate(true, true);
    agg.fields[(uint8_t)WeatherKind::Humidity].present = false;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::None, (uint8_t)selectEtMethod(agg));

    agg = makeAggregate(false, false);
    agg.fields[(uint8_t)WeatherKind::Temperature].present = false;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::None, (uint8_t)selectEtMethod(agg));

    TEST_ASSERT_EQUAL_UINT8((uint8_t)EtMethod::None, (uint8_t)selectEtMethod(false, true, true, true));
}

void test_selection_ignores_numeric_values()
{
    DailyWeatherAggregate a = makeAggregate(true, true);
    DailyWeatherAggregate b = makeAggregate(true, true);
    b.fields[(uint8_t)WeatherKind::Temperature].mean = -40.0f;
    b.fields[(uint8_t)WeatherKind::Wind].mean = 0.0f;
    b.fields[(uint8_t)WeatherKind::Solar].mean = 0.0f;
    TEST_ASSERT_EQUAL_UINT8((uint8_t)selectEtMethod(a), (uint8_t)selectEtMethod(b));
}

void test_method_names()
{
    TEST_ASSERT_EQUAL_STRING("penman_monteith", etMethodStr(EtMethod::PenmanMonteith));
    TEST_ASSERT_EQUAL_STRING("hargreaves", etMethodStr(EtMethod::Hargreaves));
    TEST_ASSERT_EQUAL_STRING("none", etMethodStr(EtMethod::None));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_decision_table);
    RUN_TEST(test_wind_alone_does_not_unlock_penman_monteith);
    RUN_TEST(test_missing_temperature_or_humidity_selects_none);
    RUN_TEST(test_selection_ignores_numeric_values);
    RUN_TEST(test_method_names);
    return UNITY_END();
}
