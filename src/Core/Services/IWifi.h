#pragma once
/**
 * @file IWifi.h
 * @brief WiFi service interface.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief WiFi connection state. */
enum class WifiState : uint8_t {
    Disabled,
    Idle,
    Connecting,
    Connected,
    ErrorWait
};

/** @brief Service interface for WiFi status. */
struct WifiService {
    WifiState (*state)(void* ctx);
    bool (*isConnected)(void* ctx);
    bool (*getIP)(void* ctx, char* out, size_t len);
    bool (*requestReconnect)(void* ctx);
    void* ctx;
};
