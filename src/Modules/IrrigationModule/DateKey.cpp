/**
 * @file DateKey.cpp
 * @brief Calendar arithmetic on YYYYMMDD date keys.
 */

#include "Modules/IrrigationModule/DateKey.h"

static bool isLeapYear(uint32_t y)
{
    return (y % 4U == 0U && y % 100U != 0U) || (y % 400U == 0U);
}

static uint32_t daysInMonth(uint32_t y, uint32_t m)
{
    static const uint8_t kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2U && isLeapYear(y)) return 29U;
    return kDays[m - 1U];
}

bool isValidDateKey(uint32_t dateKey)
{
    const uint32_t y = dateKey / 10000U;
    const uint32_t m = (dateKey / 100U) % 100U;
    const uint32_t d = dateKey % 100U;
    if (y < 1970U || y > 9999U) return false;
    if (m < 1U || m > 12U) return false;
    return d >= 1U && d <= daysInMonth(y, m);
}

uint32_t previousDateKey(uint32_t dateKey)
{
    if (!isValidDateKey(dateKey)) return 0;
    uint32_t y = dateKey / 10000U;
    uint32_t m = (dateKey / 100U) % 100U;
    uint32_t d = dateKey % 100U;

    if (d > 1U) {
        --d;
    } else if (m > 1U) {
        --m;
        d = daysInMonth(y, m);
    } else {
        if (y == 1970U) return 0;
        --y;
        m = 12U;
        d = 31U;
    }
    return y * 10000U + m * 100U + d;
}
