#pragma once

#include "../ports/ITransport.hpp"
#include "../IMqttClient.hpp"
#include <memory>
#include <mutex>

namespace deebot::adapters {

/**
 * @brief ITransport over an IMqttClient
 * 
 * Broker refusals with CONNACK 4 or 5 are reported as AuthRejected so the
 * channel can tell a revoked token from an unreachable broker.
 */
class MqttTransportAdapter : public ports::ITransport {
public:
    /// @throws std::invalid_argument if mqttClient is null
    explicit MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient);
    ~MqttTransportAdapter() override;

    bool connect(const ports::ConnectParams& params) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(std::string_view topic, std::string_view payload, int qos = 0) override;
    bool subscribe(std::string_view topic, int qos = 0) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    static ports::LinkStatus classify(const MqttConnectionStatus& status);
    static BrokerLogin toBrokerLogin(const ports::ConnectParams& params);

private:
    std::shared_ptr<IMqttClient> mqttClient_;
    std::mutex handlerMutex_;
    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    void deliver(const MqttMessage& message);
    void report(const MqttConnectionStatus& status);
};

} // namespace deebot::adapters
