/**
 * @file Errors.hpp
 * @brief Error taxonomy surfaced by the Deebot cloud client
 *
 * Every failure a caller must act on is thrown as a ClientError subclass.
 * Each error carries a category-specific code plus enough context (device ID,
 * request ID, underlying cause) to tell bad credentials apart from an offline
 * device or a network outage.
 *
 * @note what() renders the category, code, message and all non-empty context
 */

#pragma once

#include <stdexcept>
#include <string>

namespace deebot {

/**
 * @brief Context attached to every surfaced error
 */
struct ErrorContext {
    std::string deviceId;     ///< Device the operation targeted (may be empty)
    std::string requestId;    ///< Command request ID (commands only)
    std::string cause;        ///< Underlying cause reported by a lower layer
};

/**
 * @brief Base class for all client errors
 */
class ClientError : public std::runtime_error {
public:
    ClientError(const std::string& category, const std::string& codeName,
                const std::string& message, ErrorContext context);

    const std::string& category() const { return category_; }
    const std::string& codeName() const { return codeName_; }
    const std::string& message() const { return message_; }
    const ErrorContext& context() const { return context_; }

private:
    std::string category_;
    std::string codeName_;
    std::string message_;
    ErrorContext context_;
};

/**
 * @brief Authentication and session failures
 */
class AuthError : public ClientError {
public:
    enum class Code {
        InvalidCredentials,   ///< Account or password rejected by the vendor
        RegionUnavailable,    ///< Region unknown or its endpoints do not answer
        RenewalFailed,        ///< Renewal and the fallback login both failed
        NetworkError,         ///< HTTP transport failure
        Unauthenticated,      ///< No usable session
        TokenRejected,        ///< Cloud explicitly rejected a token (revoked)
        ProtocolError         ///< Unexpected response from the vendor
    };

    AuthError(Code code, const std::string& message, ErrorContext context = {});

    /// Wrap a lower-level failure, keeping its code as the root cause
    AuthError(Code code, const std::string& message, ErrorContext context, Code rootCause);

    Code code() const { return code_; }

    /// Code of the innermost failure (equals code() unless wrapped)
    Code rootCause() const { return rootCause_; }

    /// True when the root cause is a network failure worth retrying
    bool isTransient() const { return rootCause_ == Code::NetworkError; }

private:
    Code code_;
    Code rootCause_;
};

/**
 * @brief Device directory failures
 */
class DirectoryError : public ClientError {
public:
    enum class Code {
        Empty,        ///< Account has no registered devices
        NotFound,     ///< Requested device is not registered to the account
        Unavailable   ///< Directory lookup could not be performed
    };

    DirectoryError(Code code, const std::string& message, ErrorContext context = {});

    Code code() const { return code_; }

private:
    Code code_;
};

/**
 * @brief Realtime channel failures
 */
class ChannelError : public ClientError {
public:
    enum class Code {
        AuthRejected,   ///< Broker refused the session credentials
        Unreachable,    ///< Broker could not be reached
        Closed          ///< Channel was already closed
    };

    ChannelError(Code code, const std::string& message, ErrorContext context = {});

    Code code() const { return code_; }

private:
    Code code_;
};

/**
 * @brief Command invocation failures
 */
class CommandError : public ClientError {
public:
    enum class Code {
        Timeout,          ///< No reply before the deadline
        DeviceRejected,   ///< Device answered with a non-zero code
        ChannelDown       ///< Channel dropped or closed while waiting
    };

    CommandError(Code code, const std::string& message, ErrorContext context = {},
                 int deviceCode = 0);

    Code code() const { return code_; }

    /// Device-reported rejection code (DeviceRejected only)
    int deviceCode() const { return deviceCode_; }

private:
    Code code_;
    int deviceCode_;
};

/**
 * @brief HTTP or portal transport failure
 */
class TransportError : public ClientError {
public:
    TransportError(int httpStatus, const std::string& message, ErrorContext context = {});

    /// HTTP status, or 0 when no response was received
    int httpStatus() const { return httpStatus_; }

private:
    int httpStatus_;
};

/**
 * @brief Payload that could not be encoded or decoded
 */
class CodecError : public ClientError {
public:
    CodecError(const std::string& message, ErrorContext context = {});
};

std::string toString(AuthError::Code code);
std::string toString(DirectoryError::Code code);
std::string toString(ChannelError::Code code);
std::string toString(CommandError::Code code);

} // namespace deebot
