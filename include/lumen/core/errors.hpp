/**
 * @file errors.hpp
 * @brief Error kinds and exception types raised by the transport and
 *        device layers.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"

#include <stdexcept>
#include <string>

namespace lumen {
namespace core {

/**
 * @enum ErrorKind
 * @brief Why a transport operation failed.
 */
enum class ErrorKind {
    Timeout,            ///< Deadline elapsed with no matching reply
    TransientNetwork,   ///< Socket-level failure, retryable
    Cancelled,          ///< Caller fired the cancellation token
    Disposed,           ///< Operation attempted on or interrupted by shutdown
    MalformedReply      ///< Reply was empty or could not be decoded
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::TransientNetwork: return "transient-network";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Disposed: return "disposed";
        case ErrorKind::MalformedReply: return "malformed-reply";
        default: return "unknown";
    }
}

/**
 * @brief True for kinds the retry policy may retry.
 */
inline bool isTransient(ErrorKind kind) {
    return kind == ErrorKind::Timeout ||
           kind == ErrorKind::TransientNetwork ||
           kind == ErrorKind::MalformedReply;
}

/**
 * @class TransportError
 * @brief Failure of a unicast exchange or a discovery sweep.
 */
class LUMEN_CORE_API TransportError : public std::runtime_error {
public:
    TransportError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const { return kind_; }

    bool isTransient() const { return core::isTransient(kind_); }

private:
    ErrorKind kind_;
};

/**
 * @class RetryExhaustedError
 * @brief Every attempt of a retried exchange failed transiently.
 *
 * kind() is the kind of the last attempt's failure, so a target that
 * never answers surfaces as ErrorKind::Timeout.
 */
class LUMEN_CORE_API RetryExhaustedError : public TransportError {
public:
    RetryExhaustedError(const TransportError& lastCause, int attempts)
        : TransportError(lastCause.kind(),
                         "Failed after " + std::to_string(attempts) +
                         " attempt(s): " + lastCause.what())
        , lastCause_(lastCause.what())
        , attempts_(attempts)
    {}

    int attempts() const { return attempts_; }

    const std::string& lastCause() const { return lastCause_; }

private:
    std::string lastCause_;
    int attempts_;
};

/**
 * @class DeviceError
 * @brief The device answered with a protocol error object.
 */
class LUMEN_CORE_API DeviceError : public std::runtime_error {
public:
    DeviceError(int code, const std::string& message)
        : std::runtime_error("Device error " + std::to_string(code) + ": " + message)
        , code_(code)
    {}

    int code() const { return code_; }

private:
    int code_;
};

}  // namespace core
}  // namespace lumen
