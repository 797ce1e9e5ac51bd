/**
 * @file udp_transport.hpp
 * @brief Shared UDP endpoint multiplexing unicast exchanges and discovery.
 *
 * The UdpTransport handles:
 * - Owning the single bound socket (reuse-address, broadcast enabled)
 * - A background receive loop that decodes every inbound datagram
 * - Routing replies to the waiting request, else to running discoveries
 * - Retry with backoff around unicast exchanges
 * - Shutdown that releases every blocked caller with Disposed
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/cancellation.hpp"
#include "lumen/core/command_transport.hpp"
#include "lumen/core/datagram.hpp"
#include "lumen/core/discovery_broadcaster.hpp"
#include "lumen/core/export.hpp"
#include "lumen/core/request_correlator.hpp"
#include "lumen/core/retry_policy.hpp"
#include "lumen/net/udp_socket.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lumen {
namespace core {

/**
 * @struct TransportConfig
 * @brief Configuration for the UDP transport.
 */
struct LUMEN_CORE_API TransportConfig {
    std::string bind_address;       ///< Local address for initialize()
    uint16_t bind_port;             ///< Local port (0 = ephemeral)
    int receive_poll_ms;            ///< Receive timeout between running checks
    size_t receive_buffer_size;     ///< Largest datagram accepted
    DiscoveryConfig discovery;      ///< Broadcast sweeps
    RetryConfig retry;              ///< Unicast retry budget

    TransportConfig()
        : bind_address("0.0.0.0")
        , bind_port(kDevicePort)
        , receive_poll_ms(100)
        , receive_buffer_size(4096)
    {}
};

/**
 * @class UdpTransport
 * @brief CommandTransport over one UDP socket.
 *
 * One background thread runs the receive loop for the life of the
 * transport; every other call runs on the caller's thread. send() and
 * discover() initialize on first use.
 *
 * Usage:
 * @code
 * TransportConfig config;
 * auto transport = std::make_shared<UdpTransport>(config);
 * if (!transport->initialize()) {
 *     return 1;
 * }
 *
 * std::string reply = transport->send(CommandEnvelope(DeviceMethod::GetPilot),
 *                                     "192.168.1.20", kDevicePort,
 *                                     std::chrono::milliseconds(2000),
 *                                     CancellationToken());
 * transport->shutdown();
 * @endcode
 */
class LUMEN_CORE_API UdpTransport : public CommandTransport, public DatagramSender {
public:
    explicit UdpTransport(const TransportConfig& config = TransportConfig());

    /**
     * @brief Destructor - shuts the transport down.
     */
    ~UdpTransport() override;

    // Non-copyable
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /**
     * @brief Bind the socket and start the receive thread. Idempotent and
     *        safe to call concurrently.
     * @return False if socket setup failed; the error is logged.
     * @throws TransportError(Disposed) after shutdown().
     */
    bool initialize(const std::string& bindAddress) override;

    /**
     * @brief initialize() on the configured bind address.
     */
    bool initialize() { return initialize(config_.bind_address); }

    /**
     * @brief Send one datagram without waiting for a reply.
     * @throws TransportError(TransientNetwork) if the socket rejects it.
     */
    void sendDatagram(const std::string& payload,
                      const net::SocketAddress& destination) override;

    /**
     * @brief Unicast exchange with retry.
     * @throws std::invalid_argument on an empty address or non-positive timeout.
     * @throws RetryExhaustedError when every attempt failed transiently.
     * @throws TransportError(Cancelled) or TransportError(Disposed).
     */
    std::string send(const CommandEnvelope& command,
                     const std::string& targetAddress,
                     uint16_t targetPort,
                     std::chrono::milliseconds timeout,
                     const CancellationToken& token) override;

    /**
     * @brief Broadcast sweep; see DiscoveryBroadcaster::discover().
     * @throws std::invalid_argument on a null callback.
     */
    void discover(const CommandEnvelope& command,
                  ReplyCallback onReply,
                  std::chrono::milliseconds timeout,
                  const CancellationToken& token) override;

    /**
     * @brief Stop the receive loop, close the socket and fail every
     *        outstanding operation with Disposed. Idempotent.
     */
    void shutdown() override;

    /**
     * @brief Replace how replies are matched to pending requests.
     */
    void setReplyMatcher(ReplyMatcher matcher) { correlator_.setReplyMatcher(std::move(matcher)); }

    uint16_t boundPort() const { return boundPort_.load(); }
    size_t pendingRequestCount() const { return correlator_.pendingCount(); }
    size_t listenerCount() const { return broadcaster_.listenerCount(); }
    bool isInitialized() const { return initialized_.load(); }
    bool isDisposed() const { return disposed_.load(); }

    const TransportConfig& config() const { return config_; }

private:
    void ensureInitialized();
    void receiveLoop();
    void handleDatagram(const char* data, size_t length, const net::SocketAddress& source);

    TransportConfig config_;
    net::SocketInitializer socketInit_;

    std::mutex initMutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> disposed_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> boundPort_{0};

    // Guards socket_ and localAddr_ against concurrent sends and close
    std::mutex sendMutex_;
    std::unique_ptr<net::UdpSocket> socket_;
    std::string localAddr_;

    CancellationSource shutdownSource_;
    RequestCorrelator correlator_;
    DiscoveryBroadcaster broadcaster_;
    RetryPolicy retry_;

    std::thread receiveThread_;
};

}  // namespace core
}  // namespace lumen
