/**
 * @file platform.hpp
 * @brief Cross-platform socket type definitions and error helpers.
 *
 * Abstracts Windows Winsock2 and POSIX socket APIs into a common interface
 * used by UdpSocket and the transport layer.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include <string>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace lumen {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool isTimeoutError(int error) {
            return error == WSAETIMEDOUT || error == WSAEWOULDBLOCK;
        }
        inline bool isInterruptedError(int error) { return error == WSAEINTR; }

        // ICMP port-unreachable from a previous send surfaces on the next
        // recvfrom() as WSAECONNRESET; it says nothing about this socket.
        inline bool isStaleReplyError(int error) { return error == WSAECONNRESET; }

        inline std::string describeSocketError(int error) {
            return "winsock error " + std::to_string(error);
        }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }
        inline void cleanupSockets() { WSACleanup(); }
    }  // namespace net
    }  // namespace lumen

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    #include <cstring>

    namespace lumen {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool isTimeoutError(int error) {
            return error == EAGAIN || error == EWOULDBLOCK || error == ETIMEDOUT;
        }
        inline bool isInterruptedError(int error) { return error == EINTR; }

        // Linux reports a queued ICMP port-unreachable as ECONNREFUSED on
        // the next recvfrom().
        inline bool isStaleReplyError(int error) { return error == ECONNREFUSED; }

        inline std::string describeSocketError(int error) {
            return std::string(std::strerror(error)) + " (errno " + std::to_string(error) + ")";
        }

        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace lumen

#endif

namespace lumen {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Owned by every component that owns a socket, so Winsock is started
 * before the first socket is created and released after the last one.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace lumen
