/**
 * @file udp_socket.hpp
 * @brief Cross-platform UDP socket with broadcast support.
 *
 * Provides a RAII wrapper around IPv4 UDP sockets with broadcast enable,
 * address reuse and timeout-based receive.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/net/export.hpp"
#include "lumen/net/platform.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lumen {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct LUMEN_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const SocketAddress& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Check whether a string is a dotted-quad IPv4 address.
 */
LUMEN_NET_API bool isValidIpv4(const std::string& address);

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * The socket is created by the constructor and closed by the destructor.
 * sendTo() and receiveFrom() may be called from different threads; close()
 * must not race with either.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.setBroadcast(true);
 * sock.bind(38899);
 *
 * std::vector<uint8_t> buffer(4096);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 1000, sender);
 *
 * sock.sendTo(SocketAddress("255.255.255.255", 38899), data.data(), data.size());
 * @endcode
 */
class LUMEN_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    /**
     * @brief Destructor - closes the socket.
     */
    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Check if the socket is valid/open.
     */
    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Get the underlying socket handle.
     */
    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Get the local address and port the socket is bound to.
     */
    SocketAddress getLocalAddress() const;

    /**
     * @brief Enable address reuse (SO_REUSEADDR, and SO_REUSEPORT where available).
     * Call before bind().
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Enable broadcast sending (SO_BROADCAST).
     */
    bool setBroadcast(bool enable);

    /**
     * @brief Send data to an address.
     * @param dest Destination address.
     * @param data Pointer to data buffer.
     * @param length Number of bytes to send.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Send a text payload to an address.
     */
    int sendTo(const SocketAddress& dest, const std::string& payload) {
        return sendTo(dest, payload.data(), payload.size());
    }

    /**
     * @brief Receive data with timeout.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = non-blocking, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout (or an empty datagram),
     *         -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    /**
     * @brief Close the socket.
     */
    void close();

    /**
     * @brief Get the last socket error code.
     */
    int getLastError() const { return lastError_.load(std::memory_order_relaxed); }

private:
    SocketHandle socket_;
    std::atomic<int> lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace lumen
