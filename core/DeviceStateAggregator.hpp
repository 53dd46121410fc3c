/**
 * @file DeviceStateAggregator.hpp
 * @brief Current-state view folded from device state updates
 * 
 * Each state component (battery, robotState, waterLevel, ...) keeps its last
 * known value and the time it was observed. Updates are last-write-wins per
 * component, ordered by the update's own sequence (sender timestamp) when it
 * carries one and by arrival order otherwise.
 * 
 * @note Re-delivery of an identical or older update leaves state unchanged
 * @note Entries are never deleted; readers may treat entries older than the
 *       staleness threshold as unknown
 */

#pragma once

#include "IClock.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace deebot {

/**
 * @brief Last known value of one state component
 */
struct StateEntry {
    nlohmann::json value;                               ///< Component value
    std::chrono::system_clock::time_point observedAt;   ///< Local receive time
    std::optional<std::uint64_t> sequence;              ///< Sender sequence, if the update had one
};

/**
 * @brief Decoded state update for one component
 */
struct StateUpdate {
    std::string component;
    nlohmann::json value;
    std::optional<std::uint64_t> sequence;
};

/// Immutable copy of the state view
using DeviceState = std::map<std::string, StateEntry>;

/**
 * @brief Successive values of one component
 * 
 * Starts with the current value (when known), then yields every change.
 * Ends when cancelled or when the aggregator closes. A consumer that falls
 * more than kMaxQueued values behind loses the oldest ones.
 */
class StateWatch {
public:
    static constexpr std::size_t kMaxQueued = 64;
    
    explicit StateWatch(std::string component) : component_(std::move(component)) {}
    
    /**
     * @brief Wait for the next value
     * @return Next value, or nullopt once the watch has ended
     */
    std::optional<nlohmann::json> next();
    
    /**
     * @brief Wait for the next value up to a timeout
     * @return Next value, or nullopt on timeout or once the watch has ended
     */
    std::optional<nlohmann::json> next(std::chrono::milliseconds timeout);
    
    void cancel();
    bool ended() const;
    
    const std::string& component() const { return component_; }
    
private:
    friend class DeviceStateAggregator;
    
    void push(const nlohmann::json& value);
    
    std::string component_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> values_;
    bool ended_ = false;
};

class DeviceStateAggregator {
public:
    /**
     * @param clock Time source for observation timestamps
     * @param staleness Entries older than this read as unknown through get(); zero disables
     * @throws std::invalid_argument if clock is null
     */
    explicit DeviceStateAggregator(std::shared_ptr<IClock> clock,
                                   std::chrono::seconds staleness = std::chrono::seconds(0));
    
    /**
     * @brief Merge an update
     * @return true when the component's value changed
     */
    bool apply(const StateUpdate& update);
    
    DeviceState snapshot() const;
    
    /// Current value of a component, nullopt when unknown or stale
    std::optional<StateEntry> get(const std::string& component) const;
    
    bool isStale(const StateEntry& entry) const;
    
    std::shared_ptr<StateWatch> subscribe(const std::string& component);
    
    /// End every watch; later updates are ignored
    void close();
    bool closed() const;
    
private:
    std::shared_ptr<IClock> clock_;
    std::chrono::seconds staleness_;
    
    mutable std::mutex mutex_;
    DeviceState state_;
    std::unordered_map<std::string, std::vector<std::weak_ptr<StateWatch>>> watches_;
    bool closed_ = false;
};

} // namespace deebot
