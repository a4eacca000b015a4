/**
 * @file SystemStats.cpp
 * @brief Implementation file.
 */
#include "SystemStats.h"

#include <Arduino.h>
#include <esp_system.h>
#include <esp_heap_caps.h>

void SystemStats::collect(SystemStatsSnapshot& out) {
    out.uptimeMs = millis();

    const uint32_t free8 = heap_caps_get_free_size(MALLOC_CAP_8BIT);
    const uint32_t largest = heap_caps_get_largest_free_block(MALLOC_CAP_8BIT);

    out.heap.freeBytes = free8;
    out.heap.minFreeBytes = ESP.getMinFreeHeap();
    out.heap.largestFreeBlock = largest;

    /// Fragmentation: 1 - largest/free.
    if (free8 == 0) {
        out.heap.fragPercent = 100;
    } else {
        float frag = 1.0f - (float)largest / (float)free8;
        if (frag < 0.0f) frag = 0.0f;
        if (frag > 1.0f) frag = 1.0f;
        out.heap.fragPercent = (uint8_t)(frag * 100.0f);
    }
}

const char* SystemStats::resetReasonStr() {
    switch (esp_reset_reason()) {
    case ESP_RST_POWERON:   return "POWERON";
    case ESP_RST_EXT:       return "EXT";
    case ESP_RST_SW:        return "SW";
    case ESP_RST_PANIC:     return "PANIC";
    case ESP_RST_INT_WDT:   return "INT_WDT";
    case ESP_RST_TASK_WDT:  return "TASK_WDT";
    case ESP_RST_WDT:       return "WDT";
    case ESP_RST_DEEPSLEEP: return "DEEPSLEEP";
    case ESP_RST_BROWNOUT:  return "BROWNOUT";
    case ESP_RST_SDIO:      return "SDIO";
    default:                return "UNKNOWN";
    }
}
