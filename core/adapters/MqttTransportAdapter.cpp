#include "MqttTransportAdapter.hpp"
#include <stdexcept>

namespace deebot::adapters {

MqttTransportAdapter::MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient)
    : mqttClient_(std::move(mqttClient)) {
    if (!mqttClient_) {
        throw std::invalid_argument("MQTT client cannot be null");
    }
    
    mqttClient_->setMessageCallback([this](const MqttMessage& message) { deliver(message); });
    mqttClient_->setConnectionCallback([this](const MqttConnectionStatus& status) { report(status); });
}

MqttTransportAdapter::~MqttTransportAdapter() {
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

bool MqttTransportAdapter::connect(const ports::ConnectParams& params) {
    return mqttClient_->connect(toBrokerLogin(params));
}

void MqttTransportAdapter::disconnect() {
    mqttClient_->disconnect();
}

bool MqttTransportAdapter::isConnected() const {
    return mqttClient_->isConnected();
}

bool MqttTransportAdapter::publish(std::string_view topic, std::string_view payload, int qos) {
    return mqttClient_->publish(std::string(topic), std::string(payload), qos);
}

bool MqttTransportAdapter::subscribe(std::string_view topic, int qos) {
    return mqttClient_->subscribe(std::string(topic), qos);
}

void MqttTransportAdapter::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    messageHandler_ = std::move(handler);
}

void MqttTransportAdapter::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    connectionHandler_ = std::move(handler);
}

ports::LinkStatus MqttTransportAdapter::classify(const MqttConnectionStatus& status) {
    if (status.connected) {
        return ports::LinkStatus::Connected;
    }
    if (status.returnCode == IMqttClient::kConnackBadCredentials ||
        status.returnCode == IMqttClient::kConnackNotAuthorized) {
        return ports::LinkStatus::AuthRejected;
    }
    return status.wasConnected ? ports::LinkStatus::Lost : ports::LinkStatus::Refused;
}

BrokerLogin MqttTransportAdapter::toBrokerLogin(const ports::ConnectParams& params) {
    BrokerLogin login;
    login.host = params.host;
    login.port = params.port;
    login.clientId = params.clientId;
    login.username = params.username;
    login.password = params.password;
    login.verifyServer = params.verifyServer;
    login.connectTimeout = params.connectTimeout;
    return login;
}

void MqttTransportAdapter::deliver(const MqttMessage& message) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = messageHandler_;
    }
    if (handler) {
        handler(message.topic, message.payload);
    }
}

void MqttTransportAdapter::report(const MqttConnectionStatus& status) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = connectionHandler_;
    }
    if (handler) {
        handler(classify(status), status.reason);
    }
}

} // namespace deebot::adapters
