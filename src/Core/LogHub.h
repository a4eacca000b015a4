#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Queue-based log hub. Producers never block; a full queue drops.
 */
class LogHub {
public:
    bool init(int queueLen = 32);

    /** @brief Enqueue a log entry (non-blocking). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    uint32_t dropped() const { return dropped_; }

private:
    QueueHandle_t q = nullptr;
    volatile uint32_t dropped_ = 0;
};
