#include "PahoMqttClient.hpp"
#include <iostream>

namespace deebot {

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    std::lock_guard<std::mutex> lock(clientMutex_);
    destroyHandle();
}

bool PahoMqttClient::connect(const BrokerLogin& login) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    destroyHandle();
    login_ = login;
    
    const std::string serverUri = "ssl://" + login_.host + ":" + std::to_string(login_.port);
    std::cout << "[MQTT] Connecting to " << serverUri << " as " << login_.clientId << std::endl;
    
    int rc = MQTTAsync_create(&client_, serverUri.c_str(), login_.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }
    
    rc = MQTTAsync_setCallbacks(client_, this, onConnectionLost, onMessage, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to install callbacks, error code: " << rc << std::endl;
        destroyHandle();
        return false;
    }
    
    MQTTAsync_SSLOptions sslOptions = MQTTAsync_SSLOptions_initializer;
    // The vendor broker's certificate does not match its host name
    sslOptions.enableServerCertAuth = login_.verifyServer ? 1 : 0;
    sslOptions.verify = login_.verifyServer ? 1 : 0;
    sslOptions.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
    
    auto timeoutSeconds = std::chrono::duration_cast<std::chrono::seconds>(login_.connectTimeout).count();
    
    MQTTAsync_connectOptions options = MQTTAsync_connectOptions_initializer;
    options.keepAliveInterval = kKeepAliveSeconds;
    options.cleansession = 1;
    options.connectTimeout = static_cast<int>(timeoutSeconds > 0 ? timeoutSeconds : 1);
    options.automaticReconnect = 0;
    options.username = login_.username.c_str();
    options.password = login_.password.c_str();
    options.ssl = &sslOptions;
    options.onSuccess = onConnectSuccess;
    options.onFailure = onConnectFailure;
    options.context = this;
    
    rc = MQTTAsync_connect(client_, &options);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connect could not be started, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    std::lock_guard<std::mutex> lock(clientMutex_);
    if (client_ && MQTTAsync_isConnected(client_)) {
        MQTTAsync_disconnectOptions options = MQTTAsync_disconnectOptions_initializer;
        options.timeout = kDisconnectTimeoutMs;
        
        int rc = MQTTAsync_disconnect(client_, &options);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
    }
    connected_ = false;
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload, int qos) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    if (!connected_ || !client_) {
        return false;
    }
    
    MQTTAsync_message message = MQTTAsync_message_initializer;
    message.payload = const_cast<char*>(payload.data());
    message.payloadlen = static_cast<int>(payload.size());
    message.qos = qos;
    
    MQTTAsync_responseOptions response = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &message, &response);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    if (!connected_ || !client_) {
        return false;
    }
    
    MQTTAsync_responseOptions response = MQTTAsync_responseOptions_initializer;
    return MQTTAsync_subscribe(client_, topic.c_str(), qos, &response) == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

int PahoMqttClient::onMessage(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* self = static_cast<PahoMqttClient*>(context);
    
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(self->callbackMutex_);
        callback = self->messageCallback_;
    }
    
    if (callback) {
        MqttMessage received;
        // topicLen is 0 when the topic is null-terminated
        received.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
        received.payload.assign(static_cast<const char*>(message->payload), message->payloadlen);
        received.qos = message->qos;
        callback(received);
    }
    
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnectSuccess(void* context, MQTTAsync_successData*) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = true;
    
    MqttConnectionStatus status;
    status.connected = true;
    status.reason = "connected";
    self->notify(status);
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = false;
    
    MqttConnectionStatus status;
    status.reason = "connect failed";
    if (response) {
        status.returnCode = response->code;
        status.reason = "connect failed, code " + std::to_string(response->code);
        if (response->message) {
            status.reason += ": " + std::string(response->message);
        }
    }
    self->notify(status);
}

void PahoMqttClient::onConnectionLost(void* context, char* cause) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = false;
    
    MqttConnectionStatus status;
    status.wasConnected = true;
    status.reason = cause ? std::string(cause) : "connection lost";
    self->notify(status);
}

void PahoMqttClient::notify(const MqttConnectionStatus& status) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(status);
    }
}

void PahoMqttClient::destroyHandle() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
    connected_ = false;
}

} // namespace deebot
