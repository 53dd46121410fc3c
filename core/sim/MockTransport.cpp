#include "MockTransport.hpp"
#include <algorithm>

namespace deebot::sim {

MockTransport::MockTransport() = default;

bool MockTransport::connect(const ports::ConnectParams& params) {
    ConnectionHandler handler;
    ports::LinkStatus outcome = ports::LinkStatus::Connected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connectAttempts_.push_back(params);
        if (!connectInitiates_) {
            return false;
        }
        if (!scriptedOutcomes_.empty()) {
            outcome = scriptedOutcomes_.front();
            scriptedOutcomes_.pop_front();
        }
        if (silentConnect_) {
            return true;
        }
        connected_ = outcome == ports::LinkStatus::Connected;
        handler = connectionHandler_;
    }
    
    if (handler) {
        handler(outcome, outcome == ports::LinkStatus::Connected ? "Mock connection established"
                                                                  : "Mock connection " + ports::toString(outcome));
    }
    return true;
}

void MockTransport::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    ++disconnects_;
}

bool MockTransport::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockTransport::publish(std::string_view topic, std::string_view payload, int qos) {
    MockMessage msg;
    PublishHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || failPublish_) {
            return false;
        }
        
        msg.topic = std::string(topic);
        msg.payload = std::string(payload);
        msg.qos = qos;
        msg.timestamp = std::chrono::steady_clock::now();
        
        publishedMessages_.push_back(msg);
        hook = publishHook_;
    }
    
    if (hook) {
        hook(msg);
    }
    return true;
}

bool MockTransport::subscribe(std::string_view topic, int qos) {
    (void)qos;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return false;
    
    auto topicStr = std::string(topic);
    if (std::find(subscriptions_.begin(), subscriptions_.end(), topicStr) == subscriptions_.end()) {
        subscriptions_.push_back(topicStr);
    }
    return true;
}

void MockTransport::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageHandler_ = std::move(handler);
}

void MockTransport::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionHandler_ = std::move(handler);
}

void MockTransport::scriptConnect(ports::LinkStatus outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    scriptedOutcomes_.push_back(outcome);
}

void MockTransport::setSilentConnect(bool silent) {
    std::lock_guard<std::mutex> lock(mutex_);
    silentConnect_ = silent;
}

void MockTransport::setConnectInitiates(bool initiates) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectInitiates_ = initiates;
}

void MockTransport::setFailPublish(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

void MockTransport::setPublishHook(PublishHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    publishHook_ = std::move(hook);
}

void MockTransport::completeConnect(ports::LinkStatus outcome, const std::string& reason) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = outcome == ports::LinkStatus::Connected;
        handler = connectionHandler_;
    }
    if (handler) {
        handler(outcome, reason.empty() ? "Mock connection " + ports::toString(outcome) : reason);
    }
}

void MockTransport::simulateConnectionLoss(const std::string& reason) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
        handler = connectionHandler_;
    }
    if (handler) {
        handler(ports::LinkStatus::Lost, reason);
    }
}

void MockTransport::injectMessage(std::string_view topic, std::string_view payload) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = messageHandler_;
    }
    if (handler) {
        handler(topic, payload);
    }
}

std::vector<MockMessage> MockTransport::getPublishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishedMessages_;
}

std::vector<std::string> MockTransport::getSubscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

std::vector<ports::ConnectParams> MockTransport::getConnectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectAttempts_;
}

int MockTransport::disconnectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnects_;
}

void MockTransport::clearPublishedMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    publishedMessages_.clear();
}

} // namespace deebot::sim
