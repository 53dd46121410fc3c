#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace deebot {

/**
 * @brief Wall-clock source for token expiry, observation times and message timestamps
 */
class IClock {
public:
    virtual ~IClock() = default;
    
    virtual std::chrono::system_clock::time_point now() const = 0;
    
    /// Milliseconds since the Unix epoch, as carried in request "ts" fields
    virtual uint64_t epochMillis() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
    
    uint64_t epochMillis() const override {
        return toEpochMillis(now());
    }
    
    static uint64_t toEpochMillis(std::chrono::system_clock::time_point time) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }
};

/// "YYYY-MM-DD HH:MM:SS UTC", for log lines
std::string formatUtc(std::chrono::system_clock::time_point time);

} // namespace deebot
