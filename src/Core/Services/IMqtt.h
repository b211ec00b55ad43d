#pragma once
/**
 * @file IMqtt.h
 * @brief Broker client service interface.
 */

/**
 * @brief Service wrapper for the external broker client.
 *
 * `publish` queues one message (qos 0..2) and returns false when the client
 * refused it. `isConnected` may be null; the gateway then assumes a session.
 */
struct MqttService {
    bool (*publish)(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    bool (*isConnected)(void* ctx);
    void* ctx;
};
