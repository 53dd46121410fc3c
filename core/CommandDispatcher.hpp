#pragma once

#include "Errors.hpp"
#include "IRng.hpp"
#include "ListenerRegistry.hpp"
#include "RealtimeChannel.hpp"
#include "ports/IMessageCodec.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace deebot {

/**
 * @brief Outstanding command awaiting its reply
 *
 * @invariant At most one entry per request ID; removed exactly once, by the
 *            matching reply, by the timeout or by a channel failure
 */
struct PendingRequest {
    std::string requestId;
    std::string command;
    std::chrono::steady_clock::time_point issuedAt;
    std::chrono::steady_clock::time_point timeoutDeadline;
    std::promise<ports::DecodedMessage> resultSlot;
};

/**
 * @brief Sends commands on a channel and correlates replies by request ID
 *
 * invoke() blocks the calling thread on the request's own future; it never
 * blocks the channel worker. Commands are never retried automatically.
 */
class CommandDispatcher {
public:
    CommandDispatcher(std::shared_ptr<RealtimeChannel> channel,
                      std::shared_ptr<ports::IMessageCodec> codec,
                      std::shared_ptr<IRng> rng,
                      std::string deviceId);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /**
     * @brief Send a command and wait for its reply
     * @return Decoded reply (code 0)
     * @throws CommandError Timeout, DeviceRejected (device code attached) or ChannelDown
     */
    ports::DecodedMessage invoke(const std::string& command, const nlohmann::json& payload,
                                 std::chrono::milliseconds timeout);

    std::size_t pendingCount() const;

    /// Fail every outstanding request with ChannelDown
    void failAll(const std::string& reason);

private:
    // Shared with the channel listeners so late callbacks never touch a destroyed dispatcher
    struct Inflight {
        std::string deviceId;
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending;
    };

    std::shared_ptr<RealtimeChannel> channel_;
    std::shared_ptr<ports::IMessageCodec> codec_;
    std::shared_ptr<Inflight> inflight_;
    std::string requestPrefix_;
    std::atomic<std::uint64_t> nextSequence_{1};

    ListenerHandle messageHandle_;
    ListenerHandle stateHandle_;

    std::string nextRequestId();
    bool remove(const std::string& requestId);

    static void resolve(Inflight& inflight, const ports::DecodedMessage& reply);
    static void failInflight(Inflight& inflight, const std::string& reason);
};

} // namespace deebot
