#include "SimulatedClock.hpp"

namespace deebot::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point start)
    : base_(start), anchor_(std::chrono::steady_clock::now()) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nowLocked();
}

uint64_t SimulatedClock::epochMillis() const {
    return SystemClock::toEpochMillis(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    rebase(nowLocked() + duration);
}

void SimulatedClock::setCurrentTime(std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    rebase(time);
}

void SimulatedClock::freezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    rebase(nowLocked());
    frozen_ = true;
}

std::chrono::system_clock::time_point SimulatedClock::nowLocked() const {
    if (frozen_) {
        return base_;
    }
    auto elapsed = std::chrono::steady_clock::now() - anchor_;
    return base_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

void SimulatedClock::rebase(std::chrono::system_clock::time_point time) {
    base_ = time;
    anchor_ = std::chrono::steady_clock::now();
}

} // namespace deebot::sim
