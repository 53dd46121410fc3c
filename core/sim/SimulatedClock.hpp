#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>

namespace deebot::sim {

/**
 * @brief Test clock that follows real time until frozen
 * 
 * Once frozen, time only moves through advance() and setCurrentTime(), which
 * lets expiry and staleness tests step over hours instantly.
 */
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point start = std::chrono::system_clock::now());

    std::chrono::system_clock::time_point now() const override;
    uint64_t epochMillis() const override;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::system_clock::time_point time);
    void freezeTime();

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point base_;
    std::chrono::steady_clock::time_point anchor_;   ///< Real time at which base_ was taken
    bool frozen_ = false;
    
    std::chrono::system_clock::time_point nowLocked() const;
    void rebase(std::chrono::system_clock::time_point time);
};

} // namespace deebot::sim
