#include "DeviceSession.hpp"
#include "VacuumEvents.hpp"

namespace deebot {

DeviceSession::DeviceSession(DeviceDescriptor device,
                             std::shared_ptr<RealtimeChannel> channel,
                             std::shared_ptr<ports::IMessageCodec> codec,
                             std::shared_ptr<IRng> rng,
                             std::shared_ptr<IClock> clock,
                             std::chrono::milliseconds commandTimeout,
                             std::chrono::seconds staleness)
    : device_(std::move(device))
    , commandTimeout_(commandTimeout)
    , channel_(std::move(channel))
    , state_(std::make_shared<DeviceStateAggregator>(std::move(clock), staleness))
    , dispatcher_(std::make_shared<CommandDispatcher>(channel_, std::move(codec), std::move(rng),
                                                      device_.deviceId))
    , controller_(std::make_shared<VacuumController>(dispatcher_, state_, commandTimeout)) {
    std::shared_ptr<DeviceStateAggregator> state = state_;
    eventHandle_ = channel_->addMessageListener([state](const ports::DecodedMessage& message) {
        if (message.code != 0) {
            return;
        }
        for (const auto& update : VacuumEvents::translate(message)) {
            state->apply(update);
        }
    });
    stateHandle_ = channel_->addStateListener([state](ChannelState channelState) {
        if (channelState == ChannelState::Disconnected) {
            state->close();
        }
    });
}

DeviceSession::~DeviceSession() {
    close();
}

void DeviceSession::open(const Credentials& credentials) {
    channel_->open(device_, credentials);
}

void DeviceSession::close() {
    channel_->close();
    state_->close();
}

bool DeviceSession::isLive() const {
    return channel_->state() != ChannelState::Disconnected;
}

} // namespace deebot
