#include <unity.h>
#include <stdlib.h>
#include <time.h>

#include "Modules/IrrigationModule/DateKey.h"
#include "Modules/IrrigationModule/ZoneLedger.h"

// Same derivation as TimeModule::localDateKey.
static uint32_t localKey(time_t epoch)
{
    struct tm t;
    if (!localtime_r(&epoch, &t)) return 0;
    return (uint32_t)(t.tm_year + 1900) * 10000U + (uint32_t)(t.tm_mon + 1) * 100U + (uint32_t)t.tm_mday;
}

static time_t localMidnight(int year, int month, int day)
{
    struct tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_isdst = -1;
    return mktime(&t);
}

void test_previous_day_within_month()
{
    TEST_ASSERT_EQUAL_UINT32(20260329, previousDateKey(20260330));
    TEST_ASSERT_EQUAL_UINT32(20261025, previousDateKey(20261026));
}

void test_previous_day_across_month_and_year()
{
    TEST_ASSERT_EQUAL_UINT32(20260331, previousDateKey(20260401));
    TEST_ASSERT_EQUAL_UINT32(20260430, previousDateKey(20260501));
    TEST_ASSERT_EQUAL_UINT32(20251231, previousDateKey(20260101));
}

void test_previous_day_february_leap_rules()
{
    TEST_ASSERT_EQUAL_UINT32(20240229, previousDateKey(20240301));
    TEST_ASSERT_EQUAL_UINT32(20250228, previousDateKey(20250301));
    TEST_ASSERT_EQUAL_UINT32(21000228, previousDateKey(21000301));
    TEST_ASSERT_EQUAL_UINT32(20000229, previousDateKey(20000301));
}

void test_invalid_keys_yield_zero()
{
    TEST_ASSERT_EQUAL_UINT32(0, previousDateKey(0));
    TEST_ASSERT_EQUAL_UINT32(0, previousDateKey(20260230));
    TEST_ASSERT_EQUAL_UINT32(0, previousDateKey(20261301));
    TEST_ASSERT_EQUAL_UINT32(0, previousDateKey(20260100));
    TEST_ASSERT_EQUAL_UINT32(0, previousDateKey(19700101));
    TEST_ASSERT_FALSE(isValidDateKey(20250229));
    TEST_ASSERT_TRUE(isValidDateKey(20240229));
}

static void runDailyJobs(const int (*days)[3], int count, const uint32_t* expected)
{
    ZoneLedger ledger;
    for (int i = 0; i < count; ++i) {
        // Day-start fires shortly after local midnight.
        const time_t fire = localMidnight(days[i][0], days[i][1], days[i][2]) + 5;
        const uint32_t processed = previousDateKey(localKey(fire));
        TEST_ASSERT_EQUAL_UINT32(expected[i], processed);
        TEST_ASSERT_EQUAL_UINT8((uint8_t)EtApplyResult::Applied, (uint8_t)ledger.applyEt(processed, 2.0f));
    }
    TEST_ASSERT_EQUAL_FLOAT(-2.0f * (float)count, ledger.balanceMm());
}

void test_daily_job_applies_every_day_across_spring_forward()
{
    setenv("TZ", "CET-1CEST,M3.5.0,M10.5.0/3", 1);
    tzset();
    const int days[][3] = {{2026, 3, 28}, {2026, 3, 29}, {2026, 3, 30}, {2026, 3, 31}};
    const uint32_t expected[] = {20260327, 20260328, 20260329, 20260330};
    runDailyJobs(days, 4, expected);
}

void test_daily_job_applies_every_day_across_fall_back()
{
    setenv("TZ", "CET-1CEST,M3.5.0,M10.5.0/3", 1);
    tzset();
    const int days[][3] = {{2026, 10, 24}, {2026, 10, 25}, {2026, 10, 26}, {2026, 10, 27}};
    const uint32_t expected[] = {20261023, 20261024, 20261025, 20261026};
    runDailyJobs(days, 4, expected);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_previous_day_within_month);
    RUN_TEST(test_previous_day_across_month_and_year);
    RUN_TEST(test_previous_day_february_leap_rules);
    RUN_TEST(test_invalid_keys_yield_zero);
    RUN_TEST(test_daily_job_applies_every_day_across_spring_forward);
    RUN_TEST(test_daily_job_applies_every_day_across_fall_back);
    return UNITY_END();
}
