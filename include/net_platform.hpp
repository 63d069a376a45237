/**
 * @file net_platform.hpp
 * @brief Socket portability layer for the HTTP server and its tests
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_NET_PLATFORM_HPP
#define MAILBEACON_NET_PLATFORM_HPP

// Windows: Must define WIN32_LEAN_AND_MEAN and include winsock2.h FIRST
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#ifdef _MSC_VER
#pragma comment(lib, "ws2_32.lib")
#endif
typedef SOCKET socket_t;
#define INVALID_SOCK INVALID_SOCKET
#else
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
typedef int socket_t;
#define INVALID_SOCK (-1)
#endif

#include <chrono>
#include <mutex>
#include <string>

namespace mailbeacon {
namespace net {

#if defined(MSG_NOSIGNAL)
inline constexpr int kSendFlags = MSG_NOSIGNAL;
#else
inline constexpr int kSendFlags = 0;
#endif

/**
 * @brief One-time process socket setup
 *
 * Starts Winsock on Windows; elsewhere ignores SIGPIPE so a peer that
 * closes early surfaces as a write error instead of killing the process.
 * @return false when the socket layer cannot be started
 */
inline bool initialize() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
#ifdef _WIN32
        WSADATA wsaData;
        ok = WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
#else
        std::signal(SIGPIPE, SIG_IGN);
        ok = true;
#endif
    });
    return ok;
}

inline void closeSocket(socket_t s) {
#ifdef _WIN32
    if (s != INVALID_SOCKET) closesocket(s);
#else
    if (s >= 0) close(s);
#endif
}

inline int lastError() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

inline bool isInterrupted(int err) {
#ifdef _WIN32
    return err == WSAEINTR;
#else
    return err == EINTR;
#endif
}

/**
 * @brief Wait until the socket is readable or writable
 * @return >0 ready, 0 timed out, <0 error
 */
inline int waitFor(socket_t s, bool forWrite, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = s;
    pfd.events = forWrite ? POLLWRNORM : POLLRDNORM;
    return WSAPoll(&pfd, 1, static_cast<INT>(timeout.count()));
#else
    pollfd pfd{};
    pfd.fd = s;
    pfd.events = forWrite ? POLLOUT : POLLIN;
    int rc;
    do {
        rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    return rc;
#endif
}

/// Bound blocking send and receive calls on the socket
inline void setIoTimeout(socket_t s, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD ms = static_cast<DWORD>(timeout.count());
    setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&ms), sizeof(ms));
    setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&ms), sizeof(ms));
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#endif
}

/// Numeric host text of an IPv4 or IPv6 socket address
inline std::string addressToString(const sockaddr* addr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
    } else if (addr->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

} // namespace net
} // namespace mailbeacon
#endif
