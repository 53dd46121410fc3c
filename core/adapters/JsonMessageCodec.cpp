#include "JsonMessageCodec.hpp"
#include "../Errors.hpp"
#include <stdexcept>

namespace deebot::adapters {

namespace {
// iot/p2p/{cmd}/{did}/{class}/{res}/{uid}/ecouser/{clientRes}/p/{reqId}/j
constexpr std::size_t kP2pDirectionIndex = 9;
constexpr std::size_t kP2pRequestIdIndex = 10;
}

JsonMessageCodec::JsonMessageCodec(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }
}

std::string JsonMessageCodec::encode(const std::string& command, const nlohmann::json& payload,
                                     const std::string& requestId) const {
    if (command.empty()) {
        throw CodecError("command name is empty", ErrorContext{"", requestId, ""});
    }
    
    nlohmann::json j;
    j["header"]["pri"] = "2";
    j["header"]["ts"] = clock_->epochMillis();
    j["header"]["tmz"] = kTimeZoneMinutes;
    j["header"]["ver"] = kProtocolVersion;
    j["header"]["reqId"] = requestId;
    j["body"]["data"] = payload.is_null() ? nlohmann::json::object() : payload;
    return j.dump();
}

ports::DecodedMessage JsonMessageCodec::decode(std::string_view topic, std::string_view payload) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw CodecError("payload is not valid JSON", ErrorContext{"", "", e.what()});
    }
    if (!j.is_object()) {
        throw CodecError("payload is not a JSON object");
    }
    
    ports::DecodedMessage message;
    auto parts = splitTopic(topic);
    if (parts.size() > 2 && parts[0] == "iot") {
        message.kind = parts[2];
    } else if (j.contains("cmdName") && j["cmdName"].is_string()) {
        message.kind = j["cmdName"].get<std::string>();
    }
    if (message.kind.empty()) {
        throw CodecError("message carries no command name: " + std::string(topic));
    }
    
    const nlohmann::json header = j.value("header", nlohmann::json::object());
    if (header.contains("reqId") && header["reqId"].is_string()) {
        message.requestId = header["reqId"].get<std::string>();
    } else if (parts.size() > kP2pRequestIdIndex && parts[1] == "p2p" &&
               parts[kP2pDirectionIndex] == "p") {
        message.requestId = parts[kP2pRequestIdIndex];
    }
    if (header.contains("ts")) {
        message.sequence = parseSequence(header["ts"]);
    }
    
    const nlohmann::json body = j.value("body", nlohmann::json::object());
    if (!body.is_object()) {
        throw CodecError("message body is not an object", ErrorContext{"", message.requestId.value_or(""), ""});
    }
    if (body.contains("code")) {
        const auto& code = body["code"];
        if (code.is_number_integer()) {
            message.code = code.get<int>();
        } else if (code.is_string()) {
            try {
                message.code = std::stoi(code.get<std::string>());
            } catch (const std::exception&) {
                throw CodecError("reply code is not numeric", ErrorContext{"", message.requestId.value_or(""), ""});
            }
        }
    }
    message.message = body.contains("msg") && body["msg"].is_string() ? body["msg"].get<std::string>() : "";
    message.fields = body.contains("data") ? body["data"] : nlohmann::json::object();
    return message;
}

std::vector<std::string> JsonMessageCodec::splitTopic(std::string_view topic) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= topic.size()) {
        std::size_t end = topic.find('/', start);
        if (end == std::string_view::npos) {
            end = topic.size();
        }
        parts.emplace_back(topic.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::optional<std::uint64_t> JsonMessageCodec::parseSequence(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer()) {
        // Negative timestamps carry no ordering
        std::int64_t signedValue = value.get<std::int64_t>();
        if (signedValue < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(signedValue);
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
            try {
                return std::stoull(text);
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

} // namespace deebot::adapters
