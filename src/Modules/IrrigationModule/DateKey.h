#pragma once
/**
 * @file DateKey.h
 * @brief Calendar arithmetic on YYYYMMDD date keys.
 *
 * The daily ET job names the day it processes by local calendar date, not by
 * subtracting 86400 s: local days are 23 or 25 hours long around DST changes.
 */

#include <stdint.h>

bool isValidDateKey(uint32_t dateKey);

/** Calendar day before `dateKey`, 0 when `dateKey` is not a valid date. */
uint32_t previousDateKey(uint32_t dateKey);
