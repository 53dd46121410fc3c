#include "DeviceStateAggregator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace deebot {

std::optional<nlohmann::json> StateWatch::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return ended_ || !values_.empty(); });
    if (ended_) {
        return std::nullopt;
    }
    nlohmann::json value = std::move(values_.front());
    values_.pop_front();
    return value;
}

std::optional<nlohmann::json> StateWatch::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return ended_ || !values_.empty(); }) || ended_) {
        return std::nullopt;
    }
    nlohmann::json value = std::move(values_.front());
    values_.pop_front();
    return value;
}

void StateWatch::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ended_ = true;
        values_.clear();
    }
    cv_.notify_all();
}

bool StateWatch::ended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_;
}

void StateWatch::push(const nlohmann::json& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ended_) {
            return;
        }
        if (values_.size() >= kMaxQueued) {
            values_.pop_front();
        }
        values_.push_back(value);
    }
    cv_.notify_all();
}

DeviceStateAggregator::DeviceStateAggregator(std::shared_ptr<IClock> clock, std::chrono::seconds staleness)
    : clock_(std::move(clock)), staleness_(staleness) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }
}

bool DeviceStateAggregator::apply(const StateUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || update.component.empty()) {
        return false;
    }
    
    auto now = clock_->now();
    auto it = state_.find(update.component);
    if (it != state_.end()) {
        StateEntry& current = it->second;
        if (update.sequence && current.sequence && *update.sequence <= *current.sequence) {
            return false;
        }
        if (current.value == update.value) {
            current.observedAt = now;
            if (update.sequence) {
                current.sequence = update.sequence;
            }
            return false;
        }
    }
    
    state_[update.component] = StateEntry{update.value, now, update.sequence};
    
    auto watchIt = watches_.find(update.component);
    if (watchIt != watches_.end()) {
        auto& watches = watchIt->second;
        watches.erase(std::remove_if(watches.begin(), watches.end(),
                                     [](const std::weak_ptr<StateWatch>& weak) {
                                         auto watch = weak.lock();
                                         return !watch || watch->ended();
                                     }),
                      watches.end());
        for (const auto& weak : watches) {
            if (auto watch = weak.lock()) {
                watch->push(update.value);
            }
        }
    }
    return true;
}

DeviceState DeviceStateAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<StateEntry> DeviceStateAggregator::get(const std::string& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(component);
    if (it == state_.end() || isStale(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

bool DeviceStateAggregator::isStale(const StateEntry& entry) const {
    return staleness_.count() > 0 && clock_->now() - entry.observedAt > staleness_;
}

std::shared_ptr<StateWatch> DeviceStateAggregator::subscribe(const std::string& component) {
    auto watch = std::make_shared<StateWatch>(component);
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        watch->cancel();
        return watch;
    }
    auto it = state_.find(component);
    if (it != state_.end() && !isStale(it->second)) {
        watch->push(it->second.value);
    }
    watches_[component].push_back(watch);
    return watch;
}

void DeviceStateAggregator::close() {
    std::unordered_map<std::string, std::vector<std::weak_ptr<StateWatch>>> watches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        watches.swap(watches_);
    }
    
    std::size_t ended = 0;
    for (auto& [component, list] : watches) {
        for (auto& weak : list) {
            if (auto watch = weak.lock()) {
                watch->cancel();
                ++ended;
            }
        }
    }
    std::cout << "[State] Closed, ended " << ended << " watch(es)" << std::endl;
}

bool DeviceStateAggregator::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace deebot
