#pragma once

#include "../ports/IMessageCodec.hpp"
#include "../IClock.hpp"
#include <memory>
#include <vector>

namespace deebot::adapters {

// Vendor JSON envelope: {"header":{...,"reqId":id},"body":{"code":..,"msg":..,"data":{..}}}
class JsonMessageCodec : public ports::IMessageCodec {
public:
    explicit JsonMessageCodec(std::shared_ptr<IClock> clock);

    std::string encode(const std::string& command, const nlohmann::json& payload,
                       const std::string& requestId) const override;
    ports::DecodedMessage decode(std::string_view topic, std::string_view payload) const override;

    static std::vector<std::string> splitTopic(std::string_view topic);

private:
    static constexpr int kTimeZoneMinutes = 480;
    static constexpr const char* kProtocolVersion = "0.0.22";

    static std::optional<std::uint64_t> parseSequence(const nlohmann::json& value);

    std::shared_ptr<IClock> clock_;
};

} // namespace deebot::adapters
