#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace deebot::ports {

struct ConnectParams {
    std::string host;
    std::uint16_t port = 8883;
    std::string clientId;
    std::string username;
    std::string password;
    bool verifyServer = false;
    std::chrono::milliseconds connectTimeout{30000};
};

enum class LinkStatus {
    Connected,      // connection established
    Refused,        // connect attempt failed (network, timeout, broker error)
    AuthRejected,   // broker refused the username/password
    Lost            // established connection dropped
};

// Publish/subscribe transport. After connect() returns true the connection
// handler reports exactly one of Connected, Refused or AuthRejected; Lost
// only follows Connected. Handlers may run on a transport-owned thread.
class ITransport {
public:
    virtual ~ITransport() = default;
    
    using MessageHandler = std::function<void(std::string_view topic, std::string_view payload)>;
    using ConnectionHandler = std::function<void(LinkStatus status, std::string_view reason)>;
    
    virtual bool connect(const ConnectParams& params) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    
    virtual bool publish(std::string_view topic, std::string_view payload, int qos = 0) = 0;
    virtual bool subscribe(std::string_view topic, int qos = 0) = 0;
    
    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;
};

inline std::string toString(LinkStatus status) {
    switch (status) {
        case LinkStatus::Connected: return "connected";
        case LinkStatus::Refused: return "refused";
        case LinkStatus::AuthRejected: return "auth-rejected";
        case LinkStatus::Lost: return "lost";
    }
    return "unknown";
}

} // namespace deebot::ports
