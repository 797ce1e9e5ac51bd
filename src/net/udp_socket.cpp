/**
 * @file udp_socket.cpp
 * @brief Cross-platform UDP socket implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/net/udp_socket.hpp"
#include "lumen/utils/logger.hpp"

#include <cstring>

namespace lumen {
namespace net {

namespace {

#ifdef _WIN32
using AddrLen = int;
using IoResult = int;
using OptionValue = const char*;
#else
using AddrLen = socklen_t;
using IoResult = ssize_t;
using OptionValue = const void*;
#endif

bool toSockaddr(const std::string& ip, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        out.sin_addr.s_addr = INADDR_ANY;
        return true;
    }
    return inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

SocketAddress fromSockaddr(const sockaddr_in& in) {
    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &in.sin_addr, text, sizeof(text));
    return SocketAddress(text, ntohs(in.sin_port));
}

bool setFlag(SocketHandle handle, int name, bool enable) {
    int value = enable ? 1 : 0;
    return setsockopt(handle, SOL_SOCKET, name,
                      reinterpret_cast<OptionValue>(&value), sizeof(value)) == 0;
}

// 1 when readable, 0 on timeout, -1 on error
int waitReadable(SocketHandle handle, int timeoutMs) {
    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(handle, &readSet);

    timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

#ifdef _WIN32
    int nfds = 0;  // ignored by Winsock
#else
    int nfds = handle + 1;
#endif
    int ready = ::select(nfds, &readSet, nullptr, nullptr, &tv);
    return ready > 0 ? 1 : ready;
}

}  // namespace

bool isValidIpv4(const std::string& address) {
    in_addr parsed{};
    return !address.empty() && inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

UdpSocket::UdpSocket()
    : socket_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    , lastError_(0)
{
    if (!isValid()) {
        setLastError();
        LOG_ERROR("UdpSocket", "socket() failed: {}", describeSocketError(getLastError()));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.getLastError())
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    close();
    socket_ = other.socket_;
    lastError_.store(other.getLastError());
    other.socket_ = INVALID_SOCKET_HANDLE;
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    sockaddr_in local{};
    if (!toSockaddr(address, port, local)) {
        LOG_ERROR("UdpSocket", "Cannot bind to '{}': not an IPv4 address", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "bind({}:{}) failed: {}",
                  address, port, describeSocketError(getLastError()));
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}", getLocalAddress().toString());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    return getLocalAddress().port;
}

SocketAddress UdpSocket::getLocalAddress() const {
    sockaddr_in local{};
    AddrLen length = sizeof(local);
    if (!isValid() ||
        getsockname(socket_, reinterpret_cast<sockaddr*>(&local), &length) != 0) {
        return SocketAddress();
    }
    return fromSockaddr(local);
}

bool UdpSocket::setReuseAddress(bool enable) {
    if (!isValid()) {
        return false;
    }
    if (!setFlag(socket_, SO_REUSEADDR, enable)) {
        setLastError();
        return false;
    }
#ifdef SO_REUSEPORT
    if (!setFlag(socket_, SO_REUSEPORT, enable)) {
        LOG_DEBUG("UdpSocket", "SO_REUSEPORT not applied: {}",
                  describeSocketError(getLastSocketError()));
    }
#endif
    return true;
}

bool UdpSocket::setBroadcast(bool enable) {
    if (!isValid()) {
        return false;
    }
    if (!setFlag(socket_, SO_BROADCAST, enable)) {
        setLastError();
        return false;
    }
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    sockaddr_in remote{};
    if (dest.ip.empty() || !toSockaddr(dest.ip, dest.port, remote)) {
        LOG_ERROR("UdpSocket", "Refusing to send to '{}'", dest.ip);
        return -1;
    }

#ifdef _WIN32
    IoResult sent = ::sendto(socket_, static_cast<const char*>(data), static_cast<int>(length),
                             0, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote));
#else
    IoResult sent = ::sendto(socket_, data, length,
                             0, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote));
#endif

    if (sent < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(sent);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        int ready = waitReadable(socket_, timeoutMs);
        if (ready < 0) {
            setLastError();
            return isInterruptedError(getLastError()) ? 0 : -1;
        }
        if (ready == 0) {
            return 0;
        }
    }

    sockaddr_in remote{};
    AddrLen length = sizeof(remote);

#ifdef _WIN32
    IoResult received = ::recvfrom(socket_, static_cast<char*>(buffer),
                                   static_cast<int>(bufferSize), 0,
                                   reinterpret_cast<sockaddr*>(&remote), &length);
#else
    IoResult received = ::recvfrom(socket_, buffer, bufferSize, 0,
                                   reinterpret_cast<sockaddr*>(&remote), &length);
#endif

    if (received < 0) {
        setLastError();
        return -1;
    }

    sender = fromSockaddr(remote);
    return static_cast<int>(received);
}

void UdpSocket::close() {
    if (!isValid()) {
        return;
    }
    closeSocket(socket_);
    socket_ = INVALID_SOCKET_HANDLE;
}

void UdpSocket::setLastError() {
    lastError_.store(getLastSocketError(), std::memory_order_relaxed);
}

}  // namespace net
}  // namespace lumen
