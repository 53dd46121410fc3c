#include "RealtimeChannel.hpp"
#include "DeviceTopics.hpp"
#include <iostream>
#include <stdexcept>

namespace deebot {

RealtimeChannel::RealtimeChannel(std::shared_ptr<ports::ITransport> transport,
                                 std::shared_ptr<ports::IMessageCodec> codec,
                                 std::shared_ptr<ports::ISessionProvider> session,
                                 std::shared_ptr<ports::RetryPolicy> retryPolicy,
                                 ChannelOptions options)
    : transport_(std::move(transport))
    , codec_(std::move(codec))
    , session_(std::move(session))
    , retryPolicy_(std::move(retryPolicy))
    , options_(std::move(options)) {
    if (!transport_ || !codec_ || !session_ || !retryPolicy_) {
        throw std::invalid_argument("RealtimeChannel dependencies cannot be null");
    }
    if (options_.clientResource.empty()) {
        throw std::invalid_argument("Client resource cannot be empty");
    }
    if (options_.maxHeldMessages == 0) {
        throw std::invalid_argument("Held message bound must be positive");
    }
    
    transport_->setMessageHandler([this](std::string_view topic, std::string_view payload) {
        TransportEvent event;
        event.topic = std::string(topic);
        event.payload = std::string(payload);
        enqueue(std::move(event));
    });
    
    transport_->setConnectionHandler([this](ports::LinkStatus status, std::string_view reason) {
        enqueue(linkEvent(status, std::string(reason)));
    });
}

RealtimeChannel::~RealtimeChannel() {
    close();
    transport_->setMessageHandler(nullptr);
    transport_->setConnectionHandler(nullptr);
}

void RealtimeChannel::open(const DeviceDescriptor& device, const Credentials& credentials) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ChannelError(ChannelError::Code::Closed, "channel already closed",
                               ErrorContext{device.deviceId, "", ""});
        }
        if (opened_) {
            throw std::logic_error("RealtimeChannel::open called twice");
        }
        opened_ = true;
        device_ = device;
        credentials_ = credentials;
        lastError_.reset();
        topics_ = {
            topics::eventSubscription(device_),
            topics::replySubscription(device_, credentials_.userId, options_.clientResource)
        };
        state_ = ChannelState::Connecting;
    }
    
    worker_ = std::thread(&RealtimeChannel::run, this);
    
    std::cout << "[Channel] Connecting to " << device.brokerHost << ":" << device.brokerPort
              << " for device " << device.deviceId << std::endl;
    
    // Failures detected here go through the worker so listeners stay on one thread
    if (!transport_->connect(connectParams(credentials))) {
        enqueue(linkEvent(ports::LinkStatus::Refused, "connect could not be initiated"));
    }
    
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = stateCv_.wait_for(lock, options_.connectTimeout, [this] {
        return openSettled_ || stopping_;
    });
    if (!settled) {
        lock.unlock();
        enqueue(linkEvent(ports::LinkStatus::Refused, "connect timed out"));
        lock.lock();
        stateCv_.wait(lock, [this] { return openSettled_ || stopping_; });
    }
    if (state_ == ChannelState::Connected && !stopping_) {
        return;
    }
    
    ErrorContext context{device.deviceId, "", device.brokerHost};
    context.cause = lastReason_;
    auto code = lastError_.value_or(stopping_ ? ChannelError::Code::Closed : ChannelError::Code::Unreachable);
    lock.unlock();
    
    const char* message = "broker unreachable";
    if (code == ChannelError::Code::AuthRejected) {
        message = "broker rejected the session credentials";
    } else if (code == ChannelError::Code::Closed) {
        message = "channel closed while connecting";
    }
    throw ChannelError(code, message, context);
}

bool RealtimeChannel::send(const OutboundMessage& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || !opened_ || state_ == ChannelState::Disconnected) {
            return false;
        }
        
        // Every send queues behind anything still held so issue order holds
        if (held_.size() >= options_.maxHeldMessages) {
            std::cerr << "[Channel] Held queue full, dropping " << held_.front().command
                      << " (" << held_.front().requestId << ")" << std::endl;
            held_.pop_front();
        }
        held_.push_back(message);
        if (state_ != ChannelState::Connected) {
            return true;
        }
    }
    flushHeld(false);
    return true;
}

ListenerHandle RealtimeChannel::addMessageListener(MessageListener listener) {
    return messageListeners_.add([listener = std::move(listener)](const ports::DecodedMessage& message) {
        try {
            listener(message);
        } catch (const std::exception& e) {
            std::cerr << "[Channel] Message listener failed on " << message.kind << ": " << e.what() << std::endl;
        }
    });
}

ListenerHandle RealtimeChannel::addStateListener(StateListener listener) {
    return stateListeners_.add([listener = std::move(listener)](ChannelState state) {
        try {
            listener(state);
        } catch (const std::exception& e) {
            std::cerr << "[Channel] State listener failed: " << e.what() << std::endl;
        }
    });
}

void RealtimeChannel::close() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        reconnectDeadline_.reset();
        attemptInFlight_ = false;
        dropped = held_.size();
        held_.clear();
        events_.clear();
    }
    workerCv_.notify_all();
    stateCv_.notify_all();
    
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    
    transport_->disconnect();
    if (dropped > 0) {
        std::cerr << "[Channel] Dropped " << dropped << " held message(s) on close" << std::endl;
    }
    
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = state_ != ChannelState::Disconnected;
        state_ = ChannelState::Disconnected;
    }
    stateCv_.notify_all();
    // The worker has stopped, so this is the one notification made on the caller's thread
    if (changed) {
        std::cout << "[Channel] Closed channel to " << device_.deviceId << std::endl;
        stateListeners_.notify(ChannelState::Disconnected);
    }
}

ChannelState RealtimeChannel::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<ChannelError::Code> RealtimeChannel::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::vector<std::string> RealtimeChannel::subscriptionTopics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return topics_;
}

std::size_t RealtimeChannel::heldCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void RealtimeChannel::enqueue(TransportEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    workerCv_.notify_one();
}

void RealtimeChannel::run() {
    stateListeners_.notify(ChannelState::Connecting);
    
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!events_.empty()) {
            TransportEvent event = std::move(events_.front());
            events_.pop_front();
            lock.unlock();
            if (event.isLink) {
                handleLink(event);
            } else {
                handleMessage(event);
            }
            lock.lock();
            continue;
        }
        
        if (reconnectDeadline_) {
            auto deadline = *reconnectDeadline_;
            if (std::chrono::steady_clock::now() >= deadline) {
                reconnectDeadline_.reset();
                bool timedOut = attemptInFlight_;
                lock.unlock();
                if (timedOut) {
                    attemptTimedOut();
                } else {
                    attemptReconnect();
                }
                lock.lock();
                continue;
            }
            workerCv_.wait_until(lock, deadline);
        } else {
            workerCv_.wait(lock);
        }
    }
}

void RealtimeChannel::handleMessage(const TransportEvent& event) {
    ports::DecodedMessage message;
    try {
        message = codec_->decode(event.topic, event.payload);
    } catch (const CodecError& e) {
        std::cerr << "[Channel] Dropping undecodable message on " << event.topic << ": " << e.what() << std::endl;
        return;
    }
    messageListeners_.notify(message);
}

void RealtimeChannel::handleLink(const TransportEvent& event) {
    ChannelState current = state();
    
    switch (event.status) {
        case ports::LinkStatus::Connected:
            if (current == ChannelState::Connecting || current == ChannelState::Reconnecting) {
                onConnected();
            } else {
                std::cerr << "[Channel] Ignoring stale connection in state " << toString(current) << std::endl;
                transport_->disconnect();
            }
            break;
            
        case ports::LinkStatus::Refused:
            if (current == ChannelState::Connecting) {
                fail(ChannelError::Code::Unreachable, event.reason);
            } else if (current == ChannelState::Reconnecting) {
                onAttemptFailed(event.reason);
            }
            break;
            
        case ports::LinkStatus::AuthRejected:
            if (current == ChannelState::Connecting || current == ChannelState::Reconnecting) {
                fail(ChannelError::Code::AuthRejected, event.reason, true);
            }
            break;
            
        case ports::LinkStatus::Lost:
            if (current == ChannelState::Connected) {
                std::chrono::milliseconds delay = retryPolicy_->getBackoffDelay(1);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    attempts_ = 0;
                    attemptInFlight_ = false;
                    lastReason_ = event.reason;
                    reconnectDeadline_ = std::chrono::steady_clock::now() + delay;
                }
                std::cerr << "[Channel] Connection to " << device_.deviceId << " lost (" << event.reason
                          << "), reconnecting in " << delay.count() << "ms" << std::endl;
                setState(ChannelState::Reconnecting);
            }
            break;
    }
}

void RealtimeChannel::onConnected() {
    for (const auto& topic : subscriptionTopics()) {
        if (!transport_->subscribe(topic, 1)) {
            std::cerr << "[Channel] Subscribe failed: " << topic << std::endl;
        }
    }
    
    bool reconnected;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (state_ != ChannelState::Connecting && state_ != ChannelState::Reconnecting) {
            // Open already gave up on this connection
            lock.unlock();
            transport_->disconnect();
            return;
        }
        reconnected = state_ == ChannelState::Reconnecting;
        attempts_ = 0;
        attemptInFlight_ = false;
        reconnectDeadline_.reset();
        lastError_.reset();
    }
    
    std::size_t flushed = flushHeld(true);
    if (state() != ChannelState::Connected) {
        return;
    }
    if (reconnected) {
        std::cout << "[Channel] Reconnected to " << device_.deviceId << ", flushed " << flushed
                  << " held message(s)" << std::endl;
    } else {
        std::cout << "[Channel] Connected to " << device_.deviceId << std::endl;
    }
    stateListeners_.notify(ChannelState::Connected);
    markSettled();
}

std::size_t RealtimeChannel::flushHeld(bool promote) {
    std::lock_guard<std::mutex> publishLock(publishMutex_);
    std::size_t flushed = 0;
    while (true) {
        OutboundMessage message;
        std::string topic;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool live = promote
                ? state_ == ChannelState::Connecting || state_ == ChannelState::Reconnecting
                : state_ == ChannelState::Connected;
            if (stopping_ || !live) {
                return flushed;
            }
            // Sends issued during the flush are appended to held_, so issue order holds
            if (held_.empty()) {
                if (promote) {
                    state_ = ChannelState::Connected;
                }
                return flushed;
            }
            message = std::move(held_.front());
            held_.pop_front();
            topic = commandTopic(message);
        }
        
        if (transport_->publish(topic, message.payload, 0)) {
            ++flushed;
            continue;
        }
        
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || state_ == ChannelState::Disconnected) {
            return flushed;
        }
        if (held_.size() >= options_.maxHeldMessages) {
            std::cerr << "[Channel] Held queue full, dropping " << message.command
                      << " (" << message.requestId << ")" << std::endl;
        } else {
            std::cerr << "[Channel] Publish of " << message.command << " failed, holding "
                      << held_.size() + 1 << " message(s)" << std::endl;
            held_.push_front(std::move(message));
        }
        if (promote) {
            state_ = ChannelState::Connected;
        }
        return flushed;
    }
}

void RealtimeChannel::onAttemptFailed(const std::string& reason) {
    bool retry;
    int attempts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!attemptInFlight_) {
            return;
        }
        attemptInFlight_ = false;
        lastReason_ = reason;
        attempts = attempts_;
        retry = scheduleRetryLocked();
    }
    
    if (!retry) {
        fail(ChannelError::Code::Unreachable, "reconnect attempts exhausted: " + reason);
        return;
    }
    std::cerr << "[Channel] Reconnect attempt " << attempts << " failed: " << reason << std::endl;
}

void RealtimeChannel::attemptReconnect() {
    int attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || state_ != ChannelState::Reconnecting) {
            return;
        }
        attempt = ++attempts_;
        attemptInFlight_ = true;
    }
    std::cout << "[Channel] Reconnect attempt " << attempt << " for " << device_.deviceId << std::endl;
    
    Credentials credentials;
    try {
        credentials = session_->ensureValid();
    } catch (const AuthError& e) {
        if (e.isTransient()) {
            onAttemptFailed(e.what());
            return;
        }
        fail(ChannelError::Code::AuthRejected, e.what());
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_ = credentials;
        reconnectDeadline_ = std::chrono::steady_clock::now() + options_.connectTimeout;
    }
    
    if (!transport_->connect(connectParams(credentials))) {
        onAttemptFailed("connect could not be initiated");
    }
}

void RealtimeChannel::attemptTimedOut() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!attemptInFlight_) {
            return;
        }
    }
    transport_->disconnect();
    onAttemptFailed("connect timed out");
}

void RealtimeChannel::fail(ChannelError::Code code, const std::string& reason, bool invalidateSession) {
    std::size_t dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Disconnected) {
            return;
        }
        lastError_ = code;
        lastReason_ = reason;
        reconnectDeadline_.reset();
        attemptInFlight_ = false;
        dropped = held_.size();
        held_.clear();
    }
    
    std::cerr << "[Channel] " << toString(code) << " for " << device_.deviceId << ": " << reason;
    if (dropped > 0) {
        std::cerr << " (dropped " << dropped << " held message(s))";
    }
    std::cerr << std::endl;
    
    if (invalidateSession) {
        session_->invalidate();
    }
    transport_->disconnect();
    setState(ChannelState::Disconnected);
    markSettled();
}

void RealtimeChannel::markSettled() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        openSettled_ = true;
    }
    stateCv_.notify_all();
}

RealtimeChannel::TransportEvent RealtimeChannel::linkEvent(ports::LinkStatus status, std::string reason) {
    TransportEvent event;
    event.isLink = true;
    event.status = status;
    event.reason = std::move(reason);
    return event;
}

bool RealtimeChannel::scheduleRetryLocked() {
    if (!retryPolicy_->shouldRetry(attempts_)) {
        return false;
    }
    reconnectDeadline_ = std::chrono::steady_clock::now() + retryPolicy_->getBackoffDelay(attempts_ + 1);
    return true;
}

ports::ConnectParams RealtimeChannel::connectParams(const Credentials& credentials) const {
    ports::ConnectParams params;
    params.host = device_.brokerHost;
    params.port = device_.brokerPort;
    params.clientId = topics::mqttClientId(credentials.userId, options_.clientResource);
    params.username = topics::mqttUsername(credentials.userId);
    params.password = credentials.accessToken;
    params.verifyServer = options_.verifyServer;
    params.connectTimeout = options_.connectTimeout;
    return params;
}

std::string RealtimeChannel::commandTopic(const OutboundMessage& message) const {
    return topics::commandTopic(device_, credentials_.userId, options_.clientResource,
                                message.command, message.requestId);
}

void RealtimeChannel::setState(ChannelState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }
    stateCv_.notify_all();
    stateListeners_.notify(state);
}

std::string toString(ChannelState state) {
    switch (state) {
        case ChannelState::Disconnected: return "disconnected";
        case ChannelState::Connecting: return "connecting";
        case ChannelState::Connected: return "connected";
        case ChannelState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

} // namespace deebot
