#pragma once
/**
 * @file ITime.h
 * @brief Time synchronization service interface and scheduler constants.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Time synchronization state. */
enum class TimeSyncState : uint8_t { Disabled, WaitingNetwork, Syncing, Synced, ErrorWait };

/** @brief System scheduler slot fired at local midnight. */
constexpr uint8_t TIME_SLOT_SYS_DAY_START = 0;
/** @brief Event id carried by SchedulerEventTriggered for the day-start slot. */
constexpr uint16_t TIME_EVENT_SYS_DAY_START = 0xF001;

/** @brief Service interface for time synchronization and formatting. */
struct TimeService {
    TimeSyncState (*state)(void* ctx);
    bool (*isSynced)(void* ctx);
    uint64_t (*epoch)(void* ctx);
    bool (*formatLocalTime)(void* ctx, char* out, size_t len);
    /** Local calendar day of `epochSec` as YYYYMMDD, 0 when not convertible. */
    uint32_t (*localDateKey)(void* ctx, uint64_t epochSec);
    void* ctx;
};
