/**
 * @file RealtimeChannel.hpp
 * @brief Persistent MQTT channel to one device
 * 
 * Owns the broker connection for a single device and hides reconnection from
 * callers. A dedicated worker thread receives transport events, decodes
 * inbound payloads and delivers them to listeners in arrival order; listeners
 * never run concurrently with each other.
 * 
 * Connection Flow:
 * 1. open() connects with credentials from the session and subscribes to the
 *    device event and reply topics
 * 2. An unexpected loss moves to Reconnecting; attempts follow the retry policy
 *    and obtain fresh credentials through ensureValid()
 * 3. Sends issued while Reconnecting, or after a failed publish, are held and
 *    flushed in issue order once the connection is back
 * 4. A broker credential rejection invalidates the session and ends in
 *    Disconnected with AuthRejected
 * 
 * @note Held sends are best effort: they are dropped when the channel closes
 *       or gives up, the command timeout is the backstop
 */

#pragma once

#include "Credentials.hpp"
#include "DeviceDescriptor.hpp"
#include "Errors.hpp"
#include "ListenerRegistry.hpp"
#include "ports/IMessageCodec.hpp"
#include "ports/ISessionProvider.hpp"
#include "ports/ITransport.hpp"
#include "ports/RetryPolicy.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace deebot {

enum class ChannelState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

struct ChannelOptions {
    std::string clientResource;                          ///< Client resource used in client ID and topics
    std::chrono::milliseconds connectTimeout{30000};     ///< Bound on each connection attempt
    bool verifyServer = false;                           ///< Broker certificate validation
    std::size_t maxHeldMessages = 100;                   ///< Oldest held sends are dropped beyond this
};

struct OutboundMessage {
    std::string command;     ///< Command name (topic segment)
    std::string requestId;   ///< Correlation ID (topic segment)
    std::string payload;     ///< Encoded payload
};

class RealtimeChannel {
public:
    using MessageListener = std::function<void(const ports::DecodedMessage&)>;
    using StateListener = std::function<void(ChannelState)>;
    
    /**
     * @throws std::invalid_argument if a dependency is null or the client resource is empty
     */
    RealtimeChannel(std::shared_ptr<ports::ITransport> transport,
                    std::shared_ptr<ports::IMessageCodec> codec,
                    std::shared_ptr<ports::ISessionProvider> session,
                    std::shared_ptr<ports::RetryPolicy> retryPolicy,
                    ChannelOptions options);
    
    ~RealtimeChannel();
    
    RealtimeChannel(const RealtimeChannel&) = delete;
    RealtimeChannel& operator=(const RealtimeChannel&) = delete;
    
    /**
     * @brief Connect to the device's broker and subscribe to its topics
     * 
     * Blocks until the connection is established or has failed. State
     * listeners have seen the outcome by the time this returns.
     * 
     * @throws ChannelError AuthRejected (the session is invalidated) or Unreachable
     * @throws std::logic_error when called more than once
     */
    void open(const DeviceDescriptor& device, const Credentials& credentials);
    
    /**
     * @brief Publish a command to the device
     * @return false once the channel is closed or has given up
     * @note Does not wait for a reply; queues behind held sends
     */
    bool send(const OutboundMessage& message);
    
    ListenerHandle addMessageListener(MessageListener listener);
    ListenerHandle addStateListener(StateListener listener);
    
    /**
     * @brief Stop the worker, disconnect and drop held sends
     * 
     * Listeners observe the terminal Disconnected on the calling thread.
     */
    void close();
    
    ChannelState state() const;
    std::optional<ChannelError::Code> lastError() const;
    std::vector<std::string> subscriptionTopics() const;
    std::size_t heldCount() const;
    
    const std::string& clientResource() const { return options_.clientResource; }
    
private:
    struct TransportEvent {
        bool isLink = false;
        std::string topic;
        std::string payload;
        ports::LinkStatus status = ports::LinkStatus::Lost;
        std::string reason;
    };
    
    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<ports::IMessageCodec> codec_;
    std::shared_ptr<ports::ISessionProvider> session_;
    std::shared_ptr<ports::RetryPolicy> retryPolicy_;
    ChannelOptions options_;
    
    mutable std::mutex mutex_;
    std::mutex publishMutex_;   ///< Serializes flushes of held_; taken before mutex_
    std::condition_variable workerCv_;
    std::condition_variable stateCv_;
    
    ChannelState state_ = ChannelState::Disconnected;
    std::optional<ChannelError::Code> lastError_;
    std::string lastReason_;
    DeviceDescriptor device_;
    Credentials credentials_;
    std::vector<std::string> topics_;
    
    std::deque<TransportEvent> events_;
    std::deque<OutboundMessage> held_;
    std::optional<std::chrono::steady_clock::time_point> reconnectDeadline_;
    int attempts_ = 0;
    bool attemptInFlight_ = false;
    bool opened_ = false;
    bool openSettled_ = false;
    bool stopping_ = false;
    
    std::thread worker_;
    
    ListenerRegistry<const ports::DecodedMessage&> messageListeners_;
    ListenerRegistry<ChannelState> stateListeners_;
    
    void enqueue(TransportEvent event);
    void run();
    
    void handleMessage(const TransportEvent& event);
    void handleLink(const TransportEvent& event);
    void onConnected();
    void onAttemptFailed(const std::string& reason);
    void attemptReconnect();
    void attemptTimedOut();
    void fail(ChannelError::Code code, const std::string& reason, bool invalidateSession = false);
    void markSettled();
    
    /**
     * @brief Publish held sends in order until one fails
     * @param promote true while completing a connection: the state becomes
     *        Connected once the queue drains or a publish fails
     * @return Number of messages published
     */
    std::size_t flushHeld(bool promote);
    
    static TransportEvent linkEvent(ports::LinkStatus status, std::string reason);
    
    /// Schedule the next attempt or give up; caller holds mutex_
    bool scheduleRetryLocked();
    
    ports::ConnectParams connectParams(const Credentials& credentials) const;
    std::string commandTopic(const OutboundMessage& message) const;
    void setState(ChannelState state);
};

std::string toString(ChannelState state);

} // namespace deebot
