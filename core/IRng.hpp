#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <string>

namespace deebot {

class IRng {
public:
    virtual ~IRng() = default;
    
    virtual std::string hexString(std::size_t length) = 0;
};

class StandardRng : public IRng {
private:
    std::random_device rd_;
    std::mt19937 gen_;
    std::mutex mutex_;
    
public:
    StandardRng() : gen_(rd_()) {}
    
    std::string hexString(std::size_t length) override {
        static constexpr char kDigits[] = "0123456789abcdef";
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<int> dist(0, 15);
        std::string out;
        out.reserve(length);
        for (std::size_t i = 0; i < length; ++i) {
            out.push_back(kDigits[dist(gen_)]);
        }
        return out;
    }
};

} // namespace deebot
