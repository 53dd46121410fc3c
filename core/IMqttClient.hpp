/**
 * @file IMqttClient.hpp
 * @brief Broker connection used by the realtime channel
 * 
 * The vendor broker authenticates with "{userId}@ecouser.net" and the
 * short-lived IoT access token, over TLS on port 8883. Connection outcomes
 * arrive asynchronously through the connection callback.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace deebot {

struct MqttMessage {
    std::string topic;      ///< e.g. "iot/atr/onBattery/{did}/{class}/{res}/j"
    std::string payload;
    int qos = 0;
};

/**
 * @brief Outcome of a connect attempt, or loss of an established connection
 */
struct MqttConnectionStatus {
    bool connected = false;
    bool wasConnected = false;     ///< Set when an established connection dropped
    int returnCode = 0;            ///< CONNACK return code or library error code
    std::string reason;
};

/**
 * @brief Everything needed to log in to one broker
 */
struct BrokerLogin {
    std::string host;
    std::uint16_t port = 8883;
    std::string clientId;          ///< "{userId}@ecouser/{clientResource}"
    std::string username;
    std::string password;          ///< IoT access token
    bool verifyServer = false;
    std::chrono::milliseconds connectTimeout{30000};
};

class IMqttClient {
public:
    virtual ~IMqttClient() = default;
    
    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(const MqttConnectionStatus&)>;
    
    /// CONNACK: bad user name or password
    static constexpr int kConnackBadCredentials = 4;
    /// CONNACK: not authorized
    static constexpr int kConnackNotAuthorized = 5;
    
    /**
     * @brief Start an asynchronous connect
     * @return false when the attempt could not be started; otherwise the
     *         connection callback reports the outcome exactly once
     */
    virtual bool connect(const BrokerLogin& login) = 0;
    
    /// Graceful disconnect; raises no connection callback
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    
    virtual bool publish(const std::string& topic, const std::string& payload, int qos = 0) = 0;
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    
    /// Callbacks run on the library thread
    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;
};

} // namespace deebot
