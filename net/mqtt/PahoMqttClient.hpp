/**
 * @file PahoMqttClient.hpp
 * @brief IMqttClient over the Eclipse Paho MQTT C asynchronous library
 * 
 * @note Reconnection is owned by the caller (RealtimeChannel); the library's
 *       automatic reconnect stays disabled
 * @note A fresh library handle is created for every connect() so a reconnect
 *       never reuses a handle in an unknown state
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <mutex>
#include <string>

namespace deebot {

class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient() = default;
    ~PahoMqttClient() override;
    
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    
    bool connect(const BrokerLogin& login) override;
    void disconnect() override;
    bool isConnected() const override;
    
    bool publish(const std::string& topic, const std::string& payload, int qos = 0) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    
    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;
    
private:
    static constexpr int kKeepAliveSeconds = 60;
    static constexpr int kDisconnectTimeoutMs = 2000;
    
    MQTTAsync client_ = nullptr;
    std::atomic<bool> connected_{false};
    mutable std::mutex clientMutex_;              ///< Guards client_ and login_
    BrokerLogin login_;                           ///< Owns the strings the connect options point into
    
    std::mutex callbackMutex_;
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    
    // Paho C callbacks; context is the PahoMqttClient
    static int onMessage(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnectSuccess(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void onConnectionLost(void* context, char* cause);
    
    void notify(const MqttConnectionStatus& status);
    void destroyHandle();
};

} // namespace deebot
