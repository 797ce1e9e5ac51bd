/**
 * @file datagram.hpp
 * @brief Inbound datagram after decoding, and the outbound send seam.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/command_envelope.hpp"
#include "lumen/core/export.hpp"
#include "lumen/net/udp_socket.hpp"

#include <chrono>
#include <string>

namespace lumen {
namespace core {

/**
 * @struct Datagram
 * @brief A decoded reply as handed from the receive loop to the router.
 */
struct Datagram {
    std::string payload;                ///< Text with trailing NULs removed
    CommandEnvelope envelope;           ///< Decoded payload
    net::SocketAddress source;          ///< Sender endpoint
    std::chrono::steady_clock::time_point received_at;
};

/**
 * @class DatagramSender
 * @brief Fire-and-forget datagram output.
 *
 * Implementations throw TransportError(TransientNetwork) when the
 * datagram cannot be handed to the network.
 */
class LUMEN_CORE_API DatagramSender {
public:
    virtual ~DatagramSender() = default;

    virtual void sendDatagram(const std::string& payload,
                              const net::SocketAddress& destination) = 0;
};

}  // namespace core
}  // namespace lumen
