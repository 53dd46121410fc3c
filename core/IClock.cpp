#include "IClock.hpp"
#include <ctime>

namespace deebot {

std::string formatUtc(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return std::to_string(seconds);
    }
    
    char buffer[32];
    std::size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &utc);
    return std::string(buffer, length);
}

} // namespace deebot
