#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/CommandDispatcher.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/JsonMessageCodec.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <thread>
#include <vector>

using namespace deebot;

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        transport_ = std::make_shared<sim::MockTransport>();
        codec_ = std::make_shared<adapters::JsonMessageCodec>(clock_);
        auto credentials = testsupport::sampleCredentials(clock_->now());
        session_ = std::make_shared<testsupport::FakeSession>(credentials);
        
        ChannelOptions options;
        options.clientResource = "01234567";
        options.connectTimeout = std::chrono::milliseconds(500);
        auto policy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
            std::chrono::milliseconds(50), 2.0, std::chrono::milliseconds(200), 0);
        channel_ = std::make_shared<RealtimeChannel>(transport_, codec_, session_, policy, options);
        channel_->open(testsupport::sampleDevice(), credentials);
        
        dispatcher_ = std::make_shared<CommandDispatcher>(channel_, codec_, std::make_shared<StandardRng>(),
                                                          testsupport::sampleDevice().deviceId);
    }
    
    void TearDown() override {
        transport_->setPublishHook(nullptr);
        for (auto& worker : workers_) {
            worker.join();
        }
        dispatcher_.reset();
        channel_->close();
    }
    
    /// Answer every command after a delay
    void replyAfter(std::chrono::milliseconds delay, nlohmann::json data, int code = 0) {
        transport_->setPublishHook([this, delay, data, code](const sim::MockMessage& message) {
            auto command = testsupport::parseCommandTopic(message.topic);
            if (!command) {
                return;
            }
            std::lock_guard<std::mutex> lock(workersMutex_);
            workers_.emplace_back([this, delay, data, code, command]() {
                std::this_thread::sleep_for(delay);
                transport_->injectMessage(testsupport::replyTopic(*command), testsupport::replyPayload(data, code));
            });
        });
    }
    
    std::string lastRequestId() const {
        auto published = transport_->getPublishedMessages();
        return published.empty() ? "" : testsupport::parseCommandTopic(published.back().topic)->requestId;
    }
    
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<adapters::JsonMessageCodec> codec_;
    std::shared_ptr<testsupport::FakeSession> session_;
    std::shared_ptr<RealtimeChannel> channel_;
    std::shared_ptr<CommandDispatcher> dispatcher_;
    
    std::mutex workersMutex_;
    std::vector<std::thread> workers_;
};

TEST_F(CommandDispatcherTest, BatteryReplyAfter200ms) {
    replyAfter(std::chrono::milliseconds(200), {{"value", 100}, {"isLow", 0}});
    
    auto start = std::chrono::steady_clock::now();
    auto reply = dispatcher_->invoke("getBattery", nlohmann::json::object(), std::chrono::seconds(5));
    auto elapsed = std::chrono::steady_clock::now() - start;
    
    EXPECT_EQ(reply.fields["value"], 100);
    EXPECT_EQ(reply.kind, "getBattery");
    EXPECT_GE(elapsed, std::chrono::milliseconds(190));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
    
    auto published = transport_->getPublishedMessages();
    ASSERT_EQ(published.size(), 1u);
    auto topic = testsupport::parseCommandTopic(published[0].topic);
    ASSERT_TRUE(topic.has_value());
    EXPECT_EQ(topic->command, "getBattery");
    EXPECT_EQ(topic->userId, "u0001");
    EXPECT_EQ(topic->deviceId, "E0001234567890");
    EXPECT_EQ(nlohmann::json::parse(published[0].payload)["header"]["reqId"], topic->requestId);
}

TEST_F(CommandDispatcherTest, RequestIdsAreUnique) {
    replyAfter(std::chrono::milliseconds(0), nlohmann::json::object());
    
    dispatcher_->invoke("getBattery", {}, std::chrono::seconds(2));
    std::string first = lastRequestId();
    dispatcher_->invoke("getBattery", {}, std::chrono::seconds(2));
    
    EXPECT_FALSE(first.empty());
    EXPECT_NE(first, lastRequestId());
}

TEST_F(CommandDispatcherTest, TimeoutRemovesPendingAndLateReplyIsDiscarded) {
    try {
        dispatcher_->invoke("getBattery", {}, std::chrono::milliseconds(100));
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.code(), CommandError::Code::Timeout);
        EXPECT_EQ(e.context().deviceId, "E0001234567890");
        EXPECT_EQ(e.context().requestId, lastRequestId());
    }
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
    
    // Late reply for the timed-out request
    auto command = testsupport::parseCommandTopic(transport_->getPublishedMessages().back().topic);
    transport_->injectMessage(testsupport::replyTopic(*command), testsupport::replyPayload({{"value", 1}}));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
    EXPECT_EQ(channel_->state(), ChannelState::Connected);
}

TEST_F(CommandDispatcherTest, UnknownReplyIsIgnored) {
    auto device = testsupport::sampleDevice();
    testsupport::CommandTopic stray{"getBattery", "u0001", "01234567", device.deviceId,
                                device.deviceClass, device.resource, "nobody-asked"};
    transport_->injectMessage(testsupport::replyTopic(stray), testsupport::replyPayload({{"value", 5}}));
    
    replyAfter(std::chrono::milliseconds(10), {{"value", 42}});
    auto reply = dispatcher_->invoke("getBattery", {}, std::chrono::seconds(2));
    EXPECT_EQ(reply.fields["value"], 42);
}

TEST_F(CommandDispatcherTest, NonZeroReplyCodeIsDeviceRejected) {
    replyAfter(std::chrono::milliseconds(10), nlohmann::json::object(), 500);
    
    try {
        dispatcher_->invoke("clean_V2", {{"act", "start"}}, std::chrono::seconds(2));
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.code(), CommandError::Code::DeviceRejected);
        EXPECT_EQ(e.deviceCode(), 500);
    }
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
}

TEST_F(CommandDispatcherTest, DisconnectFailsOutstandingInvokesQuickly) {
    transport_->setPublishHook([this](const sim::MockMessage&) {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.emplace_back([this]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            transport_->simulateConnectionLoss("broker went away");
        });
    });
    
    auto start = std::chrono::steady_clock::now();
    try {
        dispatcher_->invoke("getBattery", {}, std::chrono::seconds(5));
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.code(), CommandError::Code::ChannelDown);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
}

TEST_F(CommandDispatcherTest, ClosedChannelFailsImmediately) {
    channel_->close();
    
    try {
        dispatcher_->invoke("getBattery", {}, std::chrono::seconds(5));
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.code(), CommandError::Code::ChannelDown);
    }
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
}

TEST_F(CommandDispatcherTest, ConcurrentInvokesGetTheirOwnReplies) {
    // Echo the request's "n" back as the reply value
    transport_->setPublishHook([this](const sim::MockMessage& message) {
        auto command = testsupport::parseCommandTopic(message.topic);
        int n = nlohmann::json::parse(message.payload)["body"]["data"].value("n", -1);
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.emplace_back([this, command, n]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20 * (5 - n)));
            transport_->injectMessage(testsupport::replyTopic(*command), testsupport::replyPayload({{"value", n}}));
        });
    });
    
    constexpr int kCallers = 5;
    std::vector<int> results(kCallers, -1);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([this, &results, i]() {
            auto reply = dispatcher_->invoke("getBattery", {{"n", i}}, std::chrono::seconds(3));
            results[i] = reply.fields.value("value", -2);
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    
    for (int i = 0; i < kCallers; ++i) {
        EXPECT_EQ(results[i], i);
    }
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
}

TEST_F(CommandDispatcherTest, FailAllResolvesEveryPendingRequest) {
    std::thread caller([this]() {
        EXPECT_THROW(dispatcher_->invoke("getBattery", {}, std::chrono::seconds(5)), CommandError);
    });
    ASSERT_TRUE(testsupport::waitFor([this]() { return dispatcher_->pendingCount() == 1; }));
    
    dispatcher_->failAll("shutting down");
    caller.join();
    EXPECT_EQ(dispatcher_->pendingCount(), 0u);
}
