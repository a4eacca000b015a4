/**
 * @file LogHub.cpp
 * @brief Log entry queue.
 */
#include "Core/LogHub.h"

bool LogHub::init(int queueLen) {
    if (q) return true;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    if (xQueueSend(q, &e, 0) == pdTRUE) return true;
    ++dropped_;
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}
