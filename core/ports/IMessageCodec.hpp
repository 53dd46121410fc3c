#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deebot::ports {

struct DecodedMessage {
    std::optional<std::string> requestId;   // present on command replies only
    std::string kind;                       // command or event name, e.g. "onBattery"
    int code = 0;                           // device result code, 0 = success
    std::string message;                    // device result message
    nlohmann::json fields;                  // decoded body data
    std::optional<std::uint64_t> sequence;  // sender timestamp (ms) when present
    
    bool isReply() const { return requestId.has_value(); }
};

// Device payload codec. decode() throws CodecError for payloads it cannot parse.
class IMessageCodec {
public:
    virtual ~IMessageCodec() = default;
    
    virtual std::string encode(const std::string& command, const nlohmann::json& payload,
                               const std::string& requestId) const = 0;
    virtual DecodedMessage decode(std::string_view topic, std::string_view payload) const = 0;
};

} // namespace deebot::ports
