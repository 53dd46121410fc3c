#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/RealtimeChannel.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/JsonMessageCodec.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace deebot;

class RealtimeChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        transport_ = std::make_shared<sim::MockTransport>();
        codec_ = std::make_shared<adapters::JsonMessageCodec>(clock_);
        credentials_ = testsupport::sampleCredentials(clock_->now());
        session_ = std::make_shared<testsupport::FakeSession>(credentials_);
        device_ = testsupport::sampleDevice();
        
        options_.clientResource = "01234567";
        options_.connectTimeout = std::chrono::milliseconds(500);
    }
    
    void TearDown() override {
        if (channel_) {
            channel_->close();
        }
    }
    
    void createChannel(int maxAttempts = 0) {
        auto policy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
            std::chrono::milliseconds(20), 2.0, std::chrono::milliseconds(100), maxAttempts);
        channel_ = std::make_shared<RealtimeChannel>(transport_, codec_, session_, policy, options_);
    }
    
    void openChannel(int maxAttempts = 0) {
        createChannel(maxAttempts);
        channel_->open(device_, credentials_);
    }
    
    bool waitForState(ChannelState state, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        return testsupport::waitFor([&]() { return channel_->state() == state; }, timeout);
    }
    
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<adapters::JsonMessageCodec> codec_;
    std::shared_ptr<testsupport::FakeSession> session_;
    Credentials credentials_;
    DeviceDescriptor device_;
    ChannelOptions options_;
    std::shared_ptr<RealtimeChannel> channel_;
};

TEST_F(RealtimeChannelTest, OpenConnectsAndSubscribes) {
    openChannel();
    
    EXPECT_EQ(channel_->state(), ChannelState::Connected);
    
    auto attempts = transport_->getConnectAttempts();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].host, "mq-eu.ecouser.net");
    EXPECT_EQ(attempts[0].port, 8883);
    EXPECT_EQ(attempts[0].clientId, "u0001@ecouser/01234567");
    EXPECT_EQ(attempts[0].username, "u0001@ecouser.net");
    EXPECT_EQ(attempts[0].password, "iot-token-1");
    
    auto subscriptions = transport_->getSubscriptions();
    ASSERT_EQ(subscriptions.size(), 2u);
    EXPECT_EQ(subscriptions[0], "iot/atr/+/E0001234567890/ls1ok3/Bx3r/j");
    EXPECT_EQ(subscriptions[1], "iot/p2p/+/E0001234567890/ls1ok3/Bx3r/u0001/ecouser/01234567/p/+/j");
}

TEST_F(RealtimeChannelTest, OpenTwiceIsALogicError) {
    openChannel();
    EXPECT_THROW(channel_->open(device_, credentials_), std::logic_error);
}

TEST_F(RealtimeChannelTest, RefusedConnectionIsUnreachable) {
    transport_->scriptConnect(ports::LinkStatus::Refused);
    createChannel();
    
    try {
        channel_->open(device_, credentials_);
        FAIL() << "Expected ChannelError";
    } catch (const ChannelError& e) {
        EXPECT_EQ(e.code(), ChannelError::Code::Unreachable);
        EXPECT_EQ(e.context().deviceId, device_.deviceId);
    }
    EXPECT_EQ(channel_->state(), ChannelState::Disconnected);
    EXPECT_EQ(session_->invalidations(), 0);
}

TEST_F(RealtimeChannelTest, BrokerCredentialRejectionInvalidatesSession) {
    transport_->scriptConnect(ports::LinkStatus::AuthRejected);
    createChannel();
    
    try {
        channel_->open(device_, credentials_);
        FAIL() << "Expected ChannelError";
    } catch (const ChannelError& e) {
        EXPECT_EQ(e.code(), ChannelError::Code::AuthRejected);
    }
    EXPECT_EQ(session_->invalidations(), 1);
    EXPECT_EQ(channel_->lastError(), ChannelError::Code::AuthRejected);
}

TEST_F(RealtimeChannelTest, SilentBrokerTimesOut) {
    transport_->setSilentConnect(true);
    options_.connectTimeout = std::chrono::milliseconds(100);
    createChannel();
    
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel_->open(device_, credentials_), ChannelError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(channel_->state(), ChannelState::Disconnected);
    
    // A connection that completes after the timeout is dropped
    transport_->completeConnect(ports::LinkStatus::Connected);
    EXPECT_TRUE(testsupport::waitFor([&]() { return !transport_->isConnected(); }));
}

TEST_F(RealtimeChannelTest, ReconnectsWithFreshCredentialsAfterLoss) {
    openChannel();
    std::vector<ChannelState> states;
    std::mutex statesMutex;
    auto handle = channel_->addStateListener([&](ChannelState state) {
        std::lock_guard<std::mutex> lock(statesMutex);
        states.push_back(state);
    });
    int ensureCallsBefore = session_->ensureCalls();
    
    transport_->simulateConnectionLoss("keepalive timeout");
    
    ASSERT_TRUE(testsupport::waitFor([&]() { return transport_->getConnectAttempts().size() == 2; }));
    ASSERT_TRUE(waitForState(ChannelState::Connected));
    EXPECT_GT(session_->ensureCalls(), ensureCallsBefore);
    
    std::lock_guard<std::mutex> lock(statesMutex);
    ASSERT_GE(states.size(), 2u);
    EXPECT_EQ(states[0], ChannelState::Reconnecting);
    EXPECT_EQ(states.back(), ChannelState::Connected);
}

TEST_F(RealtimeChannelTest, SendsDuringReconnectAreHeldAndFlushedInOrder) {
    options_.connectTimeout = std::chrono::seconds(5);
    openChannel();
    transport_->setSilentConnect(true);
    
    transport_->simulateConnectionLoss();
    ASSERT_TRUE(testsupport::waitFor([&]() { return transport_->getConnectAttempts().size() == 2; }));
    EXPECT_EQ(channel_->state(), ChannelState::Reconnecting);
    
    EXPECT_TRUE(channel_->send({"clean_V2", "r1", "{}"}));
    EXPECT_TRUE(channel_->send({"charge", "r2", "{}"}));
    EXPECT_TRUE(channel_->send({"getBattery", "r3", "{}"}));
    EXPECT_EQ(channel_->heldCount(), 3u);
    EXPECT_TRUE(transport_->getPublishedMessages().empty());
    
    transport_->completeConnect(ports::LinkStatus::Connected);
    ASSERT_TRUE(waitForState(ChannelState::Connected));
    
    auto published = transport_->getPublishedMessages();
    ASSERT_EQ(published.size(), 3u);
    EXPECT_EQ(testsupport::parseCommandTopic(published[0].topic)->requestId, "r1");
    EXPECT_EQ(testsupport::parseCommandTopic(published[1].topic)->requestId, "r2");
    EXPECT_EQ(testsupport::parseCommandTopic(published[2].topic)->requestId, "r3");
    EXPECT_EQ(channel_->heldCount(), 0u);
}

TEST_F(RealtimeChannelTest, HeldQueueDropsOldestBeyondBound) {
    options_.maxHeldMessages = 2;
    openChannel();
    transport_->setSilentConnect(true);
    transport_->simulateConnectionLoss();
    ASSERT_TRUE(waitForState(ChannelState::Reconnecting));
    
    channel_->send({"a", "r1", "{}"});
    channel_->send({"b", "r2", "{}"});
    channel_->send({"c", "r3", "{}"});
    EXPECT_EQ(channel_->heldCount(), 2u);
}

TEST_F(RealtimeChannelTest, FailedPublishIsHeldUntilReconnect) {
    openChannel();
    transport_->setFailPublish(true);
    
    EXPECT_TRUE(channel_->send({"getBattery", "r1", "{}"}));
    EXPECT_EQ(channel_->heldCount(), 1u);
    
    transport_->setFailPublish(false);
    transport_->simulateConnectionLoss();
    ASSERT_TRUE(testsupport::waitFor([&]() { return transport_->getPublishedMessages().size() == 1; }));
    EXPECT_EQ(testsupport::parseCommandTopic(transport_->getPublishedMessages()[0].topic)->command, "getBattery");
}

TEST_F(RealtimeChannelTest, SendsAfterFailedPublishQueueBehindHeldMessage) {
    openChannel();
    transport_->setFailPublish(true);
    EXPECT_TRUE(channel_->send({"clean_V2", "r1", "{}"}));
    
    transport_->setFailPublish(false);
    EXPECT_TRUE(channel_->send({"charge", "r2", "{}"}));
    
    auto published = transport_->getPublishedMessages();
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(testsupport::parseCommandTopic(published[0].topic)->requestId, "r1");
    EXPECT_EQ(testsupport::parseCommandTopic(published[1].topic)->requestId, "r2");
    EXPECT_EQ(channel_->heldCount(), 0u);
}

TEST_F(RealtimeChannelTest, GivesUpAfterRetryBudget) {
    openChannel(2);
    transport_->scriptConnect(ports::LinkStatus::Refused);
    transport_->scriptConnect(ports::LinkStatus::Refused);
    
    transport_->simulateConnectionLoss();
    
    ASSERT_TRUE(waitForState(ChannelState::Disconnected));
    EXPECT_EQ(channel_->lastError(), ChannelError::Code::Unreachable);
    EXPECT_EQ(transport_->getConnectAttempts().size(), 3u);
    EXPECT_FALSE(channel_->send({"getBattery", "r1", "{}"}));
}

TEST_F(RealtimeChannelTest, RevokedSessionDuringReconnectIsAuthRejected) {
    openChannel();
    session_->failWith(AuthError(AuthError::Code::RenewalFailed, "revoked", ErrorContext{},
                                 AuthError::Code::TokenRejected));
    
    transport_->simulateConnectionLoss();
    
    ASSERT_TRUE(waitForState(ChannelState::Disconnected));
    EXPECT_EQ(channel_->lastError(), ChannelError::Code::AuthRejected);
    EXPECT_EQ(transport_->getConnectAttempts().size(), 1u);
}

TEST_F(RealtimeChannelTest, TransientRenewalFailureIsRetried) {
    openChannel(0);
    session_->failWith(AuthError(AuthError::Code::NetworkError, "offline"));
    
    transport_->simulateConnectionLoss();
    ASSERT_TRUE(testsupport::waitFor([&]() { return session_->ensureCalls() >= 3; }));
    EXPECT_EQ(channel_->state(), ChannelState::Reconnecting);
}

TEST_F(RealtimeChannelTest, DeliversDecodedMessagesInOrder) {
    openChannel();
    std::vector<std::string> kinds;
    std::mutex kindsMutex;
    auto handle = channel_->addMessageListener([&](const ports::DecodedMessage& message) {
        std::lock_guard<std::mutex> lock(kindsMutex);
        kinds.push_back(message.kind);
    });
    
    transport_->injectMessage(testsupport::eventTopic(device_, "onBattery"), testsupport::eventPayload({{"value", 80}}, 1));
    transport_->injectMessage(testsupport::eventTopic(device_, "onBattery"), "{garbage");
    transport_->injectMessage(testsupport::eventTopic(device_, "onChargeState"),
                              testsupport::eventPayload({{"isCharging", 1}}, 2));
    
    ASSERT_TRUE(testsupport::waitFor([&]() {
        std::lock_guard<std::mutex> lock(kindsMutex);
        return kinds.size() == 2;
    }));
    std::lock_guard<std::mutex> lock(kindsMutex);
    EXPECT_EQ(kinds[0], "onBattery");
    EXPECT_EQ(kinds[1], "onChargeState");
}

TEST_F(RealtimeChannelTest, ReleasedListenerIsNotCalled) {
    openChannel();
    std::atomic<int> calls{0};
    {
        auto handle = channel_->addMessageListener([&](const ports::DecodedMessage&) { ++calls; });
    }
    transport_->injectMessage(testsupport::eventTopic(device_, "onBattery"), testsupport::eventPayload({{"value", 80}}, 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(RealtimeChannelTest, CloseEndsChannel) {
    openChannel();
    channel_->close();
    
    EXPECT_EQ(channel_->state(), ChannelState::Disconnected);
    EXPECT_FALSE(channel_->send({"getBattery", "r1", "{}"}));
    EXPECT_THROW(channel_->open(device_, credentials_), ChannelError);
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    adapters::ExponentialBackoffRetryPolicy policy(std::chrono::milliseconds(1000), 2.0,
                                                   std::chrono::milliseconds(5000), 4);
    EXPECT_EQ(policy.getBackoffDelay(1), std::chrono::milliseconds(1000));
    EXPECT_EQ(policy.getBackoffDelay(2), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.getBackoffDelay(3), std::chrono::milliseconds(4000));
    EXPECT_EQ(policy.getBackoffDelay(4), std::chrono::milliseconds(5000));
    EXPECT_TRUE(policy.shouldRetry(3));
    EXPECT_FALSE(policy.shouldRetry(4));
    
    adapters::ExponentialBackoffRetryPolicy unbounded;
    EXPECT_TRUE(unbounded.shouldRetry(1000));
}

TEST_F(RealtimeChannelTest, OpenReturnsAfterListenersSeeConnected) {
    createChannel();
    std::vector<ChannelState> states;
    std::mutex statesMutex;
    auto handle = channel_->addStateListener([&](ChannelState state) {
        std::lock_guard<std::mutex> lock(statesMutex);
        states.push_back(state);
    });
    
    channel_->open(device_, credentials_);
    
    std::lock_guard<std::mutex> lock(statesMutex);
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[0], ChannelState::Connecting);
    EXPECT_EQ(states[1], ChannelState::Connected);
}

TEST_F(RealtimeChannelTest, FailedOpenNotifiesListenersOnWorkerThread) {
    transport_->setSilentConnect(true);
    options_.connectTimeout = std::chrono::milliseconds(50);
    createChannel();
    std::vector<std::pair<ChannelState, std::thread::id>> seen;
    std::mutex seenMutex;
    auto handle = channel_->addStateListener([&](ChannelState state) {
        std::lock_guard<std::mutex> lock(seenMutex);
        seen.emplace_back(state, std::this_thread::get_id());
    });
    
    EXPECT_THROW(channel_->open(device_, credentials_), ChannelError);
    
    std::lock_guard<std::mutex> lock(seenMutex);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, ChannelState::Connecting);
    EXPECT_EQ(seen[1].first, ChannelState::Disconnected);
    for (const auto& entry : seen) {
        EXPECT_NE(entry.second, std::this_thread::get_id());
    }
}

TEST_F(RealtimeChannelTest, CloseNotifiesDisconnectedOnClosingThread) {
    openChannel();
    std::vector<std::thread::id> seen;
    std::mutex seenMutex;
    auto handle = channel_->addStateListener([&](ChannelState state) {
        if (state == ChannelState::Disconnected) {
            std::lock_guard<std::mutex> lock(seenMutex);
            seen.push_back(std::this_thread::get_id());
        }
    });
    
    channel_->close();
    
    std::lock_guard<std::mutex> lock(seenMutex);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], std::this_thread::get_id());
}
