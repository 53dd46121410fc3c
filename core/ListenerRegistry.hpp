#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace deebot {

// Removes its listener when destroyed or reset. Safe to outlive the registry.
class ListenerHandle {
public:
    ListenerHandle() = default;
    explicit ListenerHandle(std::function<void()> remover) : remover_(std::move(remover)) {}
    ~ListenerHandle() { reset(); }

    ListenerHandle(const ListenerHandle&) = delete;
    ListenerHandle& operator=(const ListenerHandle&) = delete;

    ListenerHandle(ListenerHandle&& other) noexcept : remover_(std::move(other.remover_)) {
        other.remover_ = nullptr;
    }

    ListenerHandle& operator=(ListenerHandle&& other) noexcept {
        if (this != &other) {
            reset();
            remover_ = std::move(other.remover_);
            other.remover_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (remover_) {
            auto remover = std::move(remover_);
            remover_ = nullptr;
            remover();
        }
    }

    bool active() const { return static_cast<bool>(remover_); }

private:
    std::function<void()> remover_;
};

// Ordered set of listeners. notify() calls them in registration order outside
// the registry lock, so a listener may add or remove listeners.
template <typename... Args>
class ListenerRegistry {
public:
    using Listener = std::function<void(Args...)>;

    ListenerHandle add(Listener listener) {
        std::uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->nextId++;
            state_->listeners.emplace(id, std::move(listener));
        }
        std::weak_ptr<State> weak = state_;
        return ListenerHandle([weak, id]() {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->listeners.erase(id);
            }
        });
    }

    void notify(Args... args) const {
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            listeners.reserve(state_->listeners.size());
            for (const auto& [id, listener] : state_->listeners) {
                listeners.push_back(listener);
            }
        }
        for (const auto& listener : listeners) {
            listener(args...);
        }
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->listeners.size();
    }

private:
    struct State {
        std::mutex mutex;
        std::map<std::uint64_t, Listener> listeners;
        std::uint64_t nextId = 1;
    };

    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace deebot
