#pragma once

#include "../core/Credentials.hpp"
#include "../core/DeviceDescriptor.hpp"
#include "../core/Errors.hpp"
#include "../core/ports/ISessionProvider.hpp"
#include "../core/sim/MockTransport.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace deebot::testsupport {

inline Credentials sampleCredentials(std::chrono::system_clock::time_point now) {
    Credentials credentials;
    credentials.userId = "u0001";
    credentials.accessToken = "iot-token-1";
    credentials.accessTokenExpiry = now + std::chrono::hours(48);
    credentials.authCode = "auth-code-1";
    credentials.region = Region{"de", "eu"};
    return credentials;
}

inline DeviceDescriptor sampleDevice() {
    DeviceDescriptor device;
    device.deviceId = "E0001234567890";
    device.name = "E0001234567890";
    device.nickname = "Kitchen";
    device.deviceClass = "ls1ok3";
    device.model = "DEEBOT OZMO 950";
    device.resource = "Bx3r";
    device.productCategory = "DEEBOT";
    device.status = 1;
    device.brokerHost = "mq-eu.ecouser.net";
    return device;
}

// Session provider returning fixed credentials, optionally failing
class FakeSession : public ports::ISessionProvider {
public:
    explicit FakeSession(Credentials credentials) : credentials_(std::move(credentials)) {}
    
    Credentials ensureValid() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++ensureCalls_;
        if (failure_) {
            throw *failure_;
        }
        return credentials_;
    }
    
    void invalidate() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++invalidations_;
    }
    
    void failWith(const AuthError& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = error;
    }
    
    int ensureCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ensureCalls_;
    }
    
    int invalidations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return invalidations_;
    }
    
private:
    mutable std::mutex mutex_;
    Credentials credentials_;
    std::optional<AuthError> failure_;
    int ensureCalls_ = 0;
    int invalidations_ = 0;
};

/// Poll a condition until it holds or the timeout passes
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Command topic: iot/p2p/{cmd}/{uid}/ecouser/{clientRes}/{did}/{class}/{res}/q/{reqId}/j
struct CommandTopic {
    std::string command;
    std::string userId;
    std::string clientResource;
    std::string deviceId;
    std::string deviceClass;
    std::string resource;
    std::string requestId;
};

inline std::optional<CommandTopic> parseCommandTopic(const std::string& topic) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto end = topic.find('/', start);
        parts.push_back(topic.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    if (parts.size() != 12 || parts[0] != "iot" || parts[1] != "p2p" || parts[9] != "q") {
        return std::nullopt;
    }
    return CommandTopic{parts[2], parts[3], parts[5], parts[6], parts[7], parts[8], parts[10]};
}

inline std::string replyTopic(const CommandTopic& command) {
    return "iot/p2p/" + command.command + "/" + command.deviceId + "/" + command.deviceClass + "/" +
           command.resource + "/" + command.userId + "/ecouser/" + command.clientResource + "/p/" +
           command.requestId + "/j";
}

inline std::string replyPayload(const nlohmann::json& data, int code = 0, std::uint64_t ts = 1700000000000ULL) {
    nlohmann::json j;
    j["header"]["pri"] = 1;
    j["header"]["ts"] = ts;
    j["body"]["code"] = code;
    j["body"]["msg"] = code == 0 ? "ok" : "fail";
    j["body"]["data"] = data;
    return j.dump();
}

inline std::string eventTopic(const DeviceDescriptor& device, const std::string& event) {
    return "iot/atr/" + event + "/" + device.deviceId + "/" + device.deviceClass + "/" + device.resource + "/j";
}

inline std::string eventPayload(const nlohmann::json& data, std::uint64_t ts) {
    nlohmann::json j;
    j["header"]["pri"] = 1;
    j["header"]["ts"] = std::to_string(ts);
    j["body"]["data"] = data;
    return j.dump();
}

// Canned vendor cloud responses
namespace cloud {

inline std::string loginOk(const std::string& uid = "u0001", const std::string& token = "account-token") {
    return nlohmann::json{{"code", "0000"}, {"msg", "success"},
                          {"data", {{"uid", uid}, {"accessToken", token}}}}.dump();
}

inline std::string loginFailed(const std::string& code) {
    return nlohmann::json{{"code", code}, {"msg", "login failed"}}.dump();
}

inline std::string authCodeOk(const std::string& authCode = "auth-code-1") {
    return nlohmann::json{{"code", "0000"}, {"data", {{"authCode", authCode}}}}.dump();
}

inline std::string tokenOk(const std::string& token, const std::string& uid = "u0001") {
    return nlohmann::json{{"result", "ok"}, {"userId", uid}, {"resource", "a1b2c3d4"}, {"token", token}}.dump();
}

inline std::string tokenRejected() {
    return nlohmann::json{{"result", "fail"}, {"errno", 3}, {"error", "token error"}}.dump();
}

// Takes a vector so a single entry stays an array
inline std::string deviceList(const std::vector<nlohmann::json>& devices) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& device : devices) {
        list.push_back(device);
    }
    return nlohmann::json{{"code", 0}, {"result", "ok"}, {"devices", list}}.dump();
}

inline nlohmann::json deviceEntry(const std::string& did, const std::string& nick) {
    return {{"did", did}, {"name", did}, {"nick", nick}, {"class", "ls1ok3"},
            {"resource", "Bx3r"}, {"company", "eco-ng"}, {"model", "DEEBOT OZMO 950"},
            {"product_category", "DEEBOT"}, {"status", 1}};
}

} // namespace cloud

} // namespace deebot::testsupport
