/**
 * @file udp_transport.cpp
 * @brief UdpTransport implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/udp_transport.hpp"
#include "lumen/utils/logger.hpp"
#include "lumen/utils/traffic_log.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

namespace lumen {
namespace core {

namespace {

// Rethrow cancellation caused by shutdown() as Disposed
[[noreturn]] void rethrowAfterShutdown(const TransportError& e, bool disposed) {
    if (disposed && (e.kind() == ErrorKind::Cancelled || e.kind() == ErrorKind::Disposed)) {
        throw TransportError(ErrorKind::Disposed, "Transport shut down");
    }
    throw;
}

}  // namespace

UdpTransport::UdpTransport(const TransportConfig& config)
    : config_(config)
    , correlator_(*this)
    , broadcaster_(*this, config.discovery)
    , retry_(config.retry)
{
    if (config_.receive_poll_ms <= 0) {
        config_.receive_poll_ms = 100;
    }
    if (config_.receive_buffer_size == 0) {
        config_.receive_buffer_size = 4096;
    }
    LOG_DEBUG("Transport", "Created transport for port {}", config_.bind_port);
}

UdpTransport::~UdpTransport() {
    shutdown();
}

bool UdpTransport::initialize(const std::string& bindAddress) {
    std::lock_guard<std::mutex> lock(initMutex_);

    if (disposed_.load()) {
        throw TransportError(ErrorKind::Disposed, "Transport has been shut down");
    }
    if (initialized_.load()) {
        return true;
    }

    if (!socketInit_.isInitialized()) {
        LOG_ERROR("Transport", "Socket subsystem not available");
        return false;
    }

    auto socket = std::make_unique<net::UdpSocket>();
    if (!socket->isValid()) {
        LOG_ERROR("Transport", "Socket not valid");
        return false;
    }

    if (!socket->setReuseAddress(true)) {
        LOG_WARN("Transport", "Failed to set SO_REUSEADDR: {}",
                 net::describeSocketError(socket->getLastError()));
    }

    if (!socket->setBroadcast(true)) {
        LOG_ERROR("Transport", "Failed to enable broadcast: {}",
                  net::describeSocketError(socket->getLastError()));
        return false;
    }

    if (!socket->bind(config_.bind_port, bindAddress)) {
        LOG_ERROR("Transport", "Failed to bind to {}:{}", bindAddress, config_.bind_port);
        return false;
    }

    {
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        socket_ = std::move(socket);
        localAddr_ = socket_->getLocalAddress().toString();
        boundPort_.store(socket_->getLocalPort());
    }

    running_.store(true);
    receiveThread_ = std::thread(&UdpTransport::receiveLoop, this);
    initialized_.store(true);

    LOG_INFO("Transport", "Listening on {}", localAddr_);
    return true;
}

void UdpTransport::ensureInitialized() {
    if (disposed_.load()) {
        throw TransportError(ErrorKind::Disposed, "Transport has been shut down");
    }
    if (!initialized_.load() && !initialize()) {
        throw TransportError(ErrorKind::TransientNetwork, "Transport could not be initialized");
    }
}

void UdpTransport::sendDatagram(const std::string& payload,
                                const net::SocketAddress& destination) {
    ensureInitialized();

    std::string local;
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        if (!socket_ || !socket_->isValid()) {
            throw TransportError(disposed_.load() ? ErrorKind::Disposed
                                                  : ErrorKind::TransientNetwork,
                                 "Socket is closed");
        }

        if (socket_->sendTo(destination, payload) < 0) {
            throw TransportError(ErrorKind::TransientNetwork,
                                 "Send to " + destination.toString() + " failed: " +
                                 net::describeSocketError(socket_->getLastError()));
        }
        local = localAddr_;
    }

    utils::logOutput(payload, local, destination.toString());
}

std::string UdpTransport::send(const CommandEnvelope& command,
                               const std::string& targetAddress,
                               uint16_t targetPort,
                               std::chrono::milliseconds timeout,
                               const CancellationToken& token) {
    if (targetAddress.empty()) {
        throw std::invalid_argument("Target address must not be empty");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }

    ensureInitialized();

    auto linked = CancellationSource::linked({token, shutdownSource_.token()});
    const auto operation = linked.token();
    const net::SocketAddress target(targetAddress, targetPort);
    const std::string description = command.method + " to " + target.toString();

    try {
        return retry_.execute([&](int attempt) {
            LOG_TRACE("Transport", "{} attempt {}", description, attempt);
            std::string reply = correlator_.send(command, target, timeout, operation);
            if (reply.empty()) {
                throw TransportError(ErrorKind::MalformedReply,
                                     "Empty reply from " + target.toString());
            }
            return reply;
        }, operation, description);
    } catch (const TransportError& e) {
        rethrowAfterShutdown(e, disposed_.load());
    }
}

void UdpTransport::discover(const CommandEnvelope& command,
                            ReplyCallback onReply,
                            std::chrono::milliseconds timeout,
                            const CancellationToken& token) {
    if (!onReply) {
        throw std::invalid_argument("Discovery callback must not be empty");
    }

    ensureInitialized();

    auto linked = CancellationSource::linked({token, shutdownSource_.token()});

    try {
        broadcaster_.discover(command, std::move(onReply), timeout, linked.token());
    } catch (const TransportError& e) {
        rethrowAfterShutdown(e, disposed_.load());
    }
}

void UdpTransport::shutdown() {
    std::lock_guard<std::mutex> lock(initMutex_);

    if (disposed_.exchange(true)) {
        return;
    }

    LOG_DEBUG("Transport", "Shutting down...");

    // Wakes every send() and discover() in progress
    shutdownSource_.cancel();

    running_.store(false);
    if (receiveThread_.joinable()) {
        receiveThread_.join();
    }

    {
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        if (socket_) {
            socket_->close();
            socket_.reset();
        }
    }

    correlator_.failAll(ErrorKind::Disposed);

    if (initialized_.load()) {
        LOG_INFO("Transport", "Transport stopped");
    }
}

void UdpTransport::receiveLoop() {
    LOG_DEBUG("Transport", "Receive thread started");

    std::vector<char> buffer(config_.receive_buffer_size);

    while (running_.load()) {
        net::SocketAddress sender;

        // Short timeout so the running flag is observed
        int received = socket_->receiveFrom(buffer.data(), buffer.size(),
                                            config_.receive_poll_ms, sender);

        if (received > 0) {
            try {
                handleDatagram(buffer.data(), static_cast<size_t>(received), sender);
            } catch (const std::exception& e) {
                LOG_ERROR("Transport", "Failed to handle datagram from {}: {}",
                          sender.toString(), e.what());
            }
        } else if (received < 0 && running_.load()) {
            int error = socket_->getLastError();
            if (net::isStaleReplyError(error)) {
                LOG_TRACE("Transport", "Ignoring stale ICMP error: {}",
                          net::describeSocketError(error));
            } else {
                LOG_ERROR("Transport", "Receive error: {}", net::describeSocketError(error));
                // A persistent error returns at once; pace the retries
                shutdownSource_.token().waitFor(
                    std::chrono::milliseconds(config_.receive_poll_ms));
            }
        }
    }

    LOG_DEBUG("Transport", "Receive thread stopped");
}

void UdpTransport::handleDatagram(const char* data, size_t length,
                                  const net::SocketAddress& source) {
    auto receivedAt = std::chrono::steady_clock::now();

    // Some firmware pads replies with NULs on either side
    std::string text(data, length);
    size_t first = text.find_first_not_of('\0');
    if (first == std::string::npos) {
        text.clear();
    } else {
        text = text.substr(first, text.find_last_not_of('\0') - first + 1);
    }

    utils::logInput(text, localAddr_, source.toString());

    auto envelope = CommandEnvelope::parse(text);
    if (!envelope) {
        LOG_DEBUG("Transport", "Dropping undecodable datagram from {}", source.toString());
        return;
    }
    if (!envelope->isReply()) {
        // Our own broadcasts come back to us; requests are not replies
        LOG_TRACE("Transport", "Dropping non-reply '{}' from {}",
                  envelope->method, source.toString());
        return;
    }

    Datagram datagram;
    datagram.payload = std::move(text);
    datagram.envelope = std::move(*envelope);
    datagram.source = source;
    datagram.received_at = receivedAt;

    if (correlator_.tryComplete(datagram)) {
        return;
    }

    if (broadcaster_.dispatch(datagram) == 0) {
        LOG_DEBUG("Transport", "Unsolicited reply from {} with no listener",
                  source.toString());
    }
}

}  // namespace core
}  // namespace lumen
