#include <unity.h>
#include <math.h>
#include <string.h>

#include "Modules/IrrigationModule/RuntimeTracker.h"
#include "Modules/IrrigationModule/ZoneConfig.h"

static ZoneConfig namedZone()
{
    ZoneConfig c{};
    strcpy(c.name, "Lawn");
    return c;
}

void test_valid_config_is_untouched()
{
    ZoneConfig c = namedZone();
    c.rateMmH = 12.5f;
    c.kc = 0.8f;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_NONE, sanitizeZoneConfig(c, 0));
    TEST_ASSERT_EQUAL_FLOAT(12.5f, c.rateMmH);
    TEST_ASSERT_EQUAL_FLOAT(0.8f, c.kc);
    TEST_ASSERT_EQUAL_STRING("Lawn", c.name);
}

void test_zero_rate_falls_back_to_default()
{
    ZoneConfig c = namedZone();
    c.rateMmH = 0.0f;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_RATE, sanitizeZoneConfig(c, 0));
    TEST_ASSERT_EQUAL_FLOAT(IrrigationDefaults::PrecipRateDefaultMmH, c.rateMmH);

    // A run closed with the corrected rate still credits water.
    RuntimeTracker t;
    IrrigationRun run{};
    t.valveOn(0);
    t.valveOff(3600000, c.rateMmH, run);
    TEST_ASSERT_EQUAL_FLOAT(IrrigationDefaults::PrecipRateDefaultMmH, run.waterMm);
}

void test_negative_and_nan_rate_fall_back_to_default()
{
    ZoneConfig c = namedZone();
    c.rateMmH = -4.0f;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_RATE, sanitizeZoneConfig(c, 1));
    TEST_ASSERT_EQUAL_FLOAT(IrrigationDefaults::PrecipRateDefaultMmH, c.rateMmH);

    c.rateMmH = NAN;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_RATE, sanitizeZoneConfig(c, 1));
    TEST_ASSERT_EQUAL_FLOAT(IrrigationDefaults::PrecipRateDefaultMmH, c.rateMmH);
}

void test_kc_clamped_to_range()
{
    ZoneConfig c = namedZone();
    c.kc = 5.0f;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_KC, sanitizeZoneConfig(c, 0));
    TEST_ASSERT_EQUAL_FLOAT(IrrigationDefaults::KcMax, c.kc);

    c.kc = 0.1f;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_KC, sanitizeZoneConfig(c, 0));
    TEST_ASSERT_EQUAL_FLOAT(IrrigationDefaults::KcMin, c.kc);
}

void test_durations_made_consistent()
{
    ZoneConfig c = namedZone();
    c.minRuntimeS = 900;
    c.maxRuntimeS = 600;
    c.minIntervalS = -1;
    const uint8_t fixed = sanitizeZoneConfig(c, 0);
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_MIN_RUNTIME | ZONE_CFG_FIX_MIN_INTERVAL, fixed);
    TEST_ASSERT_EQUAL_INT32(600, c.minRuntimeS);
    TEST_ASSERT_EQUAL_INT32(0, c.minIntervalS);

    c.maxRuntimeS = -10;
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_MAX_RUNTIME, sanitizeZoneConfig(c, 0));
    TEST_ASSERT_EQUAL_INT32(0, c.maxRuntimeS);
    TEST_ASSERT_EQUAL_INT32(600, c.minRuntimeS);
}

void test_empty_name_gets_zone_label()
{
    ZoneConfig c{};
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_NAME, sanitizeZoneConfig(c, 3));
    TEST_ASSERT_EQUAL_STRING("Zone 3", c.name);
}

void test_sanitized_config_is_stable()
{
    ZoneConfig c = namedZone();
    c.rateMmH = 0.0f;
    c.kc = 9.0f;
    c.minRuntimeS = -5;
    TEST_ASSERT_NOT_EQUAL(ZONE_CFG_FIX_NONE, sanitizeZoneConfig(c, 0));
    TEST_ASSERT_EQUAL_UINT8(ZONE_CFG_FIX_NONE, sanitizeZoneConfig(c, 0));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_valid_config_is_untouched);
    RUN_TEST(test_zero_rate_falls_back_to_default);
    RUN_TEST(test_negative_and_nan_rate_fall_back_to_default);
    RUN_TEST(test_kc_clamped_to_range);
    RUN_TEST(test_durations_made_consistent);
    RUN_TEST(test_empty_name_gets_zone_label);
    RUN_TEST(test_sanitized_config_is_stable);
    return UNITY_END();
}
