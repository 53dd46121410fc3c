#pragma once

#include "../ports/ITransport.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deebot::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos;
    std::chrono::steady_clock::time_point timestamp;
};

// Scriptable transport. connect() reports the next scripted outcome
// synchronously (Connected when nothing is scripted); injected messages are
// delivered synchronously on the calling thread.
class MockTransport : public ports::ITransport {
public:
    using PublishHook = std::function<void(const MockMessage&)>;

    MockTransport();
    ~MockTransport() override = default;

    // ITransport interface
    bool connect(const ports::ConnectParams& params) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(std::string_view topic, std::string_view payload, int qos = 0) override;
    bool subscribe(std::string_view topic, int qos = 0) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    // Mock-specific methods for testing
    void scriptConnect(ports::LinkStatus outcome);
    void setSilentConnect(bool silent);
    void setConnectInitiates(bool initiates);
    void setFailPublish(bool fail);
    void setPublishHook(PublishHook hook);

    /// Report the outcome of a connect() issued while silent
    void completeConnect(ports::LinkStatus outcome, const std::string& reason = "");
    void simulateConnectionLoss(const std::string& reason = "Connection lost");
    void injectMessage(std::string_view topic, std::string_view payload);

    std::vector<MockMessage> getPublishedMessages() const;
    std::vector<std::string> getSubscriptions() const;
    std::vector<ports::ConnectParams> getConnectAttempts() const;
    int disconnectCount() const;
    void clearPublishedMessages();

private:
    mutable std::mutex mutex_;
    bool connected_ = false;
    bool failPublish_ = false;
    bool silentConnect_ = false;
    bool connectInitiates_ = true;
    int disconnects_ = 0;
    
    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;
    PublishHook publishHook_;
    
    std::deque<ports::LinkStatus> scriptedOutcomes_;
    std::vector<MockMessage> publishedMessages_;
    std::vector<std::string> subscriptions_;
    std::vector<ports::ConnectParams> connectAttempts_;
};

} // namespace deebot::sim
