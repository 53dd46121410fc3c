#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/DeviceSession.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/JsonMessageCodec.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <map>
#include <memory>
#include <thread>
#include <vector>

using namespace deebot;

class DeviceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        transport_ = std::make_shared<sim::MockTransport>();
        codec_ = std::make_shared<adapters::JsonMessageCodec>(clock_);
        credentials_ = testsupport::sampleCredentials(clock_->now());
        session_ = std::make_shared<testsupport::FakeSession>(credentials_);
        
        ChannelOptions options;
        options.clientResource = "01234567";
        options.connectTimeout = std::chrono::milliseconds(500);
        auto policy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
            std::chrono::milliseconds(20), 2.0, std::chrono::milliseconds(100), 2);
        auto channel = std::make_shared<RealtimeChannel>(transport_, codec_, session_, policy, options);
        
        device_ = std::make_shared<DeviceSession>(testsupport::sampleDevice(), channel, codec_,
                                                  std::make_shared<StandardRng>(), clock_,
                                                  std::chrono::seconds(2), std::chrono::seconds(0));
        
        // Reply to each command with its canned data, or {} when none is set
        transport_->setPublishHook([this](const sim::MockMessage& message) {
            auto command = testsupport::parseCommandTopic(message.topic);
            if (!command) {
                return;
            }
            std::lock_guard<std::mutex> lock(workersMutex_);
            nlohmann::json data = nlohmann::json::object();
            auto it = replies_.find(command->command);
            if (it != replies_.end()) {
                data = it->second;
            }
            workers_.emplace_back([this, command, data]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                transport_->injectMessage(testsupport::replyTopic(*command), testsupport::replyPayload(data));
            });
        });
    }
    
    void TearDown() override {
        transport_->setPublishHook(nullptr);
        for (auto& worker : workers_) {
            worker.join();
        }
        device_.reset();
    }
    
    void cannedReply(const std::string& command, nlohmann::json data) {
        std::lock_guard<std::mutex> lock(workersMutex_);
        replies_[command] = std::move(data);
    }
    
    nlohmann::json lastCommandBody() const {
        auto published = transport_->getPublishedMessages();
        EXPECT_FALSE(published.empty());
        return published.empty() ? nlohmann::json() : nlohmann::json::parse(published.back().payload)["body"]["data"];
    }
    
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<adapters::JsonMessageCodec> codec_;
    std::shared_ptr<testsupport::FakeSession> session_;
    Credentials credentials_;
    std::shared_ptr<DeviceSession> device_;
    
    std::mutex workersMutex_;
    std::vector<std::thread> workers_;
    std::map<std::string, nlohmann::json> replies_;
};

TEST_F(DeviceSessionTest, OpenConnectsAndSubscribes) {
    device_->open(credentials_);
    
    EXPECT_TRUE(device_->isLive());
    EXPECT_EQ(device_->channel().state(), ChannelState::Connected);
    EXPECT_FALSE(transport_->getSubscriptions().empty());
    
    auto attempts = transport_->getConnectAttempts();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].host, "mq-eu.ecouser.net");
    EXPECT_EQ(attempts[0].username, "u0001@ecouser.net");
    EXPECT_EQ(attempts[0].password, "iot-token-1");
}

TEST_F(DeviceSessionTest, EventsFoldIntoState) {
    device_->open(credentials_);
    auto device = testsupport::sampleDevice();
    
    transport_->injectMessage(testsupport::eventTopic(device, "onBattery"),
                              testsupport::eventPayload({{"value", 55}, {"isLow", 0}}, 1700000000100ULL));
    transport_->injectMessage(testsupport::eventTopic(device, "onCleanInfo_V2"),
                              testsupport::eventPayload({{"state", "goCharging"}}, 1700000000200ULL));
    
    ASSERT_TRUE(testsupport::waitFor([this]() { return device_->state().get("robotState").has_value(); }));
    EXPECT_EQ(device_->state().get("battery")->value, 55);
    EXPECT_EQ(device_->state().get("robotState")->value, "returning");
}

TEST_F(DeviceSessionTest, RefreshQueriesInfoAndLifespan) {
    cannedReply("getInfo", {
        {"getBattery", {{"data", {{"value", 91}}}}},
        {"getSpeed", {{"data", {{"speed", 1}}}}},
        {"getWaterInfo", {{"data", {{"enable", 0}, {"amount", 2}}}}}
    });
    cannedReply("getLifeSpan", nlohmann::json::array({{{"type", "sideBrush"}, {"left", 100}, {"total", 200}}}));
    device_->open(credentials_);
    
    device_->controller().refresh();
    
    auto published = transport_->getPublishedMessages();
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(testsupport::parseCommandTopic(published[0].topic)->command, "getInfo");
    auto queries = nlohmann::json::parse(published[0].payload)["body"]["data"];
    ASSERT_TRUE(queries.is_array());
    EXPECT_EQ(queries.size(), 11u);
    EXPECT_EQ(testsupport::parseCommandTopic(published[1].topic)->command, "getLifeSpan");
    
    auto state = device_->state().snapshot();
    EXPECT_EQ(state.at("battery").value, 91);
    EXPECT_EQ(state.at("vacuumSpeed").value, "max");
    EXPECT_EQ(state.at("mopAttached").value, false);
    EXPECT_EQ(state.at("waterLevel").value, "medium");
    EXPECT_EQ(state.at("lifespan.sideBrush").value["left"], 100);
}

TEST_F(DeviceSessionTest, CleaningCommandsCarryDevicePayloads) {
    device_->open(credentials_);
    auto& controller = device_->controller();
    
    controller.clean();
    auto body = lastCommandBody();
    EXPECT_EQ(body["act"], "start");
    EXPECT_EQ(body["content"]["type"], "auto");
    
    controller.cleanAreas({1, 4});
    body = lastCommandBody();
    EXPECT_EQ(body["content"]["type"], "spotArea");
    EXPECT_EQ(body["content"]["value"], "1,4");
    
    controller.pause();
    EXPECT_EQ(lastCommandBody()["act"], "pause");
    
    controller.returnToCharge();
    EXPECT_EQ(testsupport::parseCommandTopic(transport_->getPublishedMessages().back().topic)->command, "charge");
    EXPECT_EQ(lastCommandBody()["act"], "go");
    
    controller.setVacuumSpeed(VacuumSpeed::Quiet);
    EXPECT_EQ(lastCommandBody()["speed"], 1000);
    
    controller.setWaterLevel(WaterLevel::UltraHigh);
    EXPECT_EQ(lastCommandBody()["amount"], 4);
    
    EXPECT_THROW(controller.cleanAreas({}), std::invalid_argument);
    EXPECT_THROW(controller.cleanCustom(""), std::invalid_argument);
}

TEST_F(DeviceSessionTest, SettingTogglesSendEnableFlag) {
    device_->open(credentials_);
    auto& controller = device_->controller();
    
    controller.setTrueDetect(true);
    EXPECT_EQ(testsupport::parseCommandTopic(transport_->getPublishedMessages().back().topic)->command, "setTrueDetect");
    EXPECT_EQ(lastCommandBody()["enable"], 1);
    
    controller.setCleanPreference(false);
    EXPECT_EQ(testsupport::parseCommandTopic(transport_->getPublishedMessages().back().topic)->command, "setCleanPreference");
    EXPECT_EQ(lastCommandBody()["enable"], 0);
}

TEST_F(DeviceSessionTest, DeviceRejectionSurfacesUnchanged) {
    device_->open(credentials_);
    transport_->setPublishHook([this](const sim::MockMessage& message) {
        auto command = testsupport::parseCommandTopic(message.topic);
        if (!command) {
            return;
        }
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.emplace_back([this, command]() {
            transport_->injectMessage(testsupport::replyTopic(*command),
                                      testsupport::replyPayload(nlohmann::json::object(), 30007));
        });
    });
    
    try {
        device_->controller().relocate();
        FAIL() << "Expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.code(), CommandError::Code::DeviceRejected);
        EXPECT_EQ(e.deviceCode(), 30007);
    }
    EXPECT_EQ(transport_->getPublishedMessages().size(), 1u);
}

TEST_F(DeviceSessionTest, CloseEndsStateWatches) {
    device_->open(credentials_);
    auto watch = device_->state().subscribe("battery");
    
    device_->close();
    
    EXPECT_FALSE(device_->isLive());
    EXPECT_TRUE(watch->ended());
    EXPECT_FALSE(watch->next(std::chrono::milliseconds(10)).has_value());
}

TEST_F(DeviceSessionTest, ChannelGivingUpClosesState) {
    device_->open(credentials_);
    transport_->scriptConnect(ports::LinkStatus::Refused);
    transport_->scriptConnect(ports::LinkStatus::Refused);
    
    transport_->simulateConnectionLoss();
    
    ASSERT_TRUE(testsupport::waitFor([this]() { return !device_->isLive(); }));
    EXPECT_TRUE(testsupport::waitFor([this]() { return device_->state().closed(); }));
}
