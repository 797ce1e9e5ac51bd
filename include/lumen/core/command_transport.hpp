/**
 * @file command_transport.hpp
 * @brief Abstract command transport used by the device layer.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/cancellation.hpp"
#include "lumen/core/command_envelope.hpp"
#include "lumen/core/discovery_broadcaster.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace lumen {
namespace core {

/**
 * @class CommandTransport
 * @brief Unicast request/reply plus broadcast discovery.
 *
 * Implemented by UdpTransport; mocked in tests of the device layer.
 */
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    /**
     * @brief Prepare the endpoint. Idempotent.
     * @return False if setup failed; a later call may retry.
     */
    virtual bool initialize(const std::string& bindAddress) = 0;

    /**
     * @brief Send a command to one device and wait for its reply.
     * @return Raw reply text.
     */
    virtual std::string send(const CommandEnvelope& command,
                             const std::string& targetAddress,
                             uint16_t targetPort,
                             std::chrono::milliseconds timeout,
                             const CancellationToken& token) = 0;

    /**
     * @brief Broadcast a command for @p timeout, reporting every reply.
     */
    virtual void discover(const CommandEnvelope& command,
                          ReplyCallback onReply,
                          std::chrono::milliseconds timeout,
                          const CancellationToken& token) = 0;

    /**
     * @brief Release the endpoint. Idempotent.
     */
    virtual void shutdown() = 0;
};

}  // namespace core
}  // namespace lumen
