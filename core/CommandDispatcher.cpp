#include "CommandDispatcher.hpp"
#include <iostream>
#include <stdexcept>

namespace deebot {

CommandDispatcher::CommandDispatcher(std::shared_ptr<RealtimeChannel> channel,
                                     std::shared_ptr<ports::IMessageCodec> codec,
                                     std::shared_ptr<IRng> rng,
                                     std::string deviceId)
    : channel_(std::move(channel))
    , codec_(std::move(codec))
    , inflight_(std::make_shared<Inflight>()) {
    if (!channel_ || !codec_ || !rng) {
        throw std::invalid_argument("CommandDispatcher dependencies cannot be null");
    }
    inflight_->deviceId = std::move(deviceId);
    requestPrefix_ = rng->hexString(8);
    
    std::shared_ptr<Inflight> inflight = inflight_;
    messageHandle_ = channel_->addMessageListener([inflight](const ports::DecodedMessage& message) {
        if (message.isReply()) {
            resolve(*inflight, message);
        }
    });
    stateHandle_ = channel_->addStateListener([inflight](ChannelState state) {
        if (state != ChannelState::Connected) {
            failInflight(*inflight, "channel " + toString(state));
        }
    });
}

CommandDispatcher::~CommandDispatcher() {
    messageHandle_.reset();
    stateHandle_.reset();
    failInflight(*inflight_, "dispatcher destroyed");
}

ports::DecodedMessage CommandDispatcher::invoke(const std::string& command, const nlohmann::json& payload,
                                                std::chrono::milliseconds timeout) {
    if (command.empty()) {
        throw std::invalid_argument("Command name cannot be empty");
    }
    
    auto pending = std::make_shared<PendingRequest>();
    pending->requestId = nextRequestId();
    pending->command = command;
    pending->issuedAt = std::chrono::steady_clock::now();
    pending->timeoutDeadline = pending->issuedAt + timeout;
    std::future<ports::DecodedMessage> result = pending->resultSlot.get_future();
    
    const std::string requestId = pending->requestId;
    ErrorContext context{inflight_->deviceId, requestId, ""};
    
    {
        std::lock_guard<std::mutex> lock(inflight_->mutex);
        inflight_->pending.emplace(requestId, pending);
    }
    
    std::string encoded;
    try {
        encoded = codec_->encode(command, payload, requestId);
    } catch (const CodecError&) {
        remove(requestId);
        throw;
    }
    
    if (!channel_->send(OutboundMessage{command, requestId, encoded})) {
        remove(requestId);
        throw CommandError(CommandError::Code::ChannelDown, command + " not sent, channel closed", context);
    }
    
    if (result.wait_until(pending->timeoutDeadline) == std::future_status::timeout) {
        if (remove(requestId)) {
            std::cerr << "[Dispatcher] " << command << " (" << requestId << ") timed out after "
                      << timeout.count() << "ms" << std::endl;
            throw CommandError(CommandError::Code::Timeout, command + " timed out", context);
        }
        // Resolved between the deadline and the removal; the result is already set
    }
    
    ports::DecodedMessage reply = result.get();
    if (reply.code != 0) {
        context.cause = reply.message;
        throw CommandError(CommandError::Code::DeviceRejected, command + " rejected by device", context,
                           reply.code);
    }
    return reply;
}

std::size_t CommandDispatcher::pendingCount() const {
    std::lock_guard<std::mutex> lock(inflight_->mutex);
    return inflight_->pending.size();
}

void CommandDispatcher::failAll(const std::string& reason) {
    failInflight(*inflight_, reason);
}

std::string CommandDispatcher::nextRequestId() {
    return requestPrefix_ + std::to_string(nextSequence_.fetch_add(1));
}

bool CommandDispatcher::remove(const std::string& requestId) {
    std::lock_guard<std::mutex> lock(inflight_->mutex);
    return inflight_->pending.erase(requestId) > 0;
}

void CommandDispatcher::resolve(Inflight& inflight, const ports::DecodedMessage& reply) {
    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(inflight.mutex);
        auto it = inflight.pending.find(*reply.requestId);
        if (it != inflight.pending.end()) {
            pending = std::move(it->second);
            inflight.pending.erase(it);
        }
    }
    
    if (!pending) {
        std::cout << "[Dispatcher] Discarding " << reply.kind << " reply with unknown request id "
                  << *reply.requestId << std::endl;
        return;
    }
    pending->resultSlot.set_value(reply);
}

void CommandDispatcher::failInflight(Inflight& inflight, const std::string& reason) {
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> failed;
    {
        std::lock_guard<std::mutex> lock(inflight.mutex);
        failed.swap(inflight.pending);
    }
    if (failed.empty()) {
        return;
    }
    
    std::cerr << "[Dispatcher] Failing " << failed.size() << " pending request(s): " << reason << std::endl;
    for (auto& [requestId, pending] : failed) {
        pending->resultSlot.set_exception(std::make_exception_ptr(
            CommandError(CommandError::Code::ChannelDown, pending->command + " interrupted",
                         ErrorContext{inflight.deviceId, requestId, reason})));
    }
}

} // namespace deebot
