#include "Errors.hpp"
#include <sstream>

namespace deebot {

namespace {

std::string render(const std::string& category, const std::string& codeName,
                   const std::string& message, const ErrorContext& context) {
    std::ostringstream out;
    out << category << "(" << codeName << "): " << message;

    if (!context.deviceId.empty()) {
        out << " [device=" << context.deviceId << "]";
    }
    if (!context.requestId.empty()) {
        out << " [request=" << context.requestId << "]";
    }
    if (!context.cause.empty()) {
        out << " [cause=" << context.cause << "]";
    }
    return out.str();
}

} // namespace

ClientError::ClientError(const std::string& category, const std::string& codeName,
                         const std::string& message, ErrorContext context)
    : std::runtime_error(render(category, codeName, message, context))
    , category_(category)
    , codeName_(codeName)
    , message_(message)
    , context_(std::move(context)) {
}

AuthError::AuthError(Code code, const std::string& message, ErrorContext context)
    : AuthError(code, message, std::move(context), code) {
}

AuthError::AuthError(Code code, const std::string& message, ErrorContext context, Code rootCause)
    : ClientError("AuthError", toString(code), message, std::move(context))
    , code_(code)
    , rootCause_(rootCause) {
}

DirectoryError::DirectoryError(Code code, const std::string& message, ErrorContext context)
    : ClientError("DirectoryError", toString(code), message, std::move(context))
    , code_(code) {
}

ChannelError::ChannelError(Code code, const std::string& message, ErrorContext context)
    : ClientError("ChannelError", toString(code), message, std::move(context))
    , code_(code) {
}

CommandError::CommandError(Code code, const std::string& message, ErrorContext context,
                           int deviceCode)
    : ClientError("CommandError",
                  code == Code::DeviceRejected
                      ? toString(code) + "(" + std::to_string(deviceCode) + ")"
                      : toString(code),
                  message, std::move(context))
    , code_(code)
    , deviceCode_(deviceCode) {
}

TransportError::TransportError(int httpStatus, const std::string& message, ErrorContext context)
    : ClientError("TransportError",
                  httpStatus == 0 ? "NoResponse" : "HTTP " + std::to_string(httpStatus),
                  message, std::move(context))
    , httpStatus_(httpStatus) {
}

CodecError::CodecError(const std::string& message, ErrorContext context)
    : ClientError("CodecError", "Malformed", message, std::move(context)) {
}

std::string toString(AuthError::Code code) {
    switch (code) {
        case AuthError::Code::InvalidCredentials: return "InvalidCredentials";
        case AuthError::Code::RegionUnavailable: return "RegionUnavailable";
        case AuthError::Code::RenewalFailed: return "RenewalFailed";
        case AuthError::Code::NetworkError: return "NetworkError";
        case AuthError::Code::Unauthenticated: return "Unauthenticated";
        case AuthError::Code::TokenRejected: return "TokenRejected";
        case AuthError::Code::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

std::string toString(DirectoryError::Code code) {
    switch (code) {
        case DirectoryError::Code::Empty: return "Empty";
        case DirectoryError::Code::NotFound: return "NotFound";
        case DirectoryError::Code::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

std::string toString(ChannelError::Code code) {
    switch (code) {
        case ChannelError::Code::AuthRejected: return "AuthRejected";
        case ChannelError::Code::Unreachable: return "Unreachable";
        case ChannelError::Code::Closed: return "Closed";
    }
    return "Unknown";
}

std::string toString(CommandError::Code code) {
    switch (code) {
        case CommandError::Code::Timeout: return "Timeout";
        case CommandError::Code::DeviceRejected: return "DeviceRejected";
        case CommandError::Code::ChannelDown: return "ChannelDown";
    }
    return "Unknown";
}

} // namespace deebot
