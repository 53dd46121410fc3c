#pragma once

#include "CommandDispatcher.hpp"
#include "DeviceStateAggregator.hpp"
#include "RealtimeChannel.hpp"
#include "VacuumController.hpp"
#include <memory>

namespace deebot {

/**
 * @brief Everything attached to one open device
 * 
 * Wires the channel to the dispatcher and to the state view: unsolicited
 * events and successful query replies are translated and applied, and the
 * state view closes when the channel ends for good.
 */
class DeviceSession {
public:
    DeviceSession(DeviceDescriptor device,
                  std::shared_ptr<RealtimeChannel> channel,
                  std::shared_ptr<ports::IMessageCodec> codec,
                  std::shared_ptr<IRng> rng,
                  std::shared_ptr<IClock> clock,
                  std::chrono::milliseconds commandTimeout,
                  std::chrono::seconds staleness);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /// @throws ChannelError when the channel cannot be opened
    void open(const Credentials& credentials);
    void close();

    /// False once the channel has ended (closed or gave up)
    bool isLive() const;

    const DeviceDescriptor& device() const { return device_; }
    std::chrono::milliseconds commandTimeout() const { return commandTimeout_; }

    RealtimeChannel& channel() { return *channel_; }
    CommandDispatcher& dispatcher() { return *dispatcher_; }
    DeviceStateAggregator& state() { return *state_; }
    VacuumController& controller() { return *controller_; }

private:
    DeviceDescriptor device_;
    std::chrono::milliseconds commandTimeout_;
    std::shared_ptr<RealtimeChannel> channel_;
    std::shared_ptr<DeviceStateAggregator> state_;
    std::shared_ptr<CommandDispatcher> dispatcher_;
    std::shared_ptr<VacuumController> controller_;

    ListenerHandle eventHandle_;
    ListenerHandle stateHandle_;
};

} // namespace deebot
