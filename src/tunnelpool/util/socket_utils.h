// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_UTIL_SOCKET_UTILS_H_
#define TUNNELPOOL_UTIL_SOCKET_UTILS_H_

#include <cstdint>
#include <string_view>

#include "tunnelpool/error.h"
#include "tunnelpool/util/platform.h"

namespace tunnelpool {
namespace util {

// Create a non-blocking TCP socket
// Returns socket on success, kInvalidSocket on error
socket_t CreateTcpSocket(bool ipv6);

// Configure socket options (TCP_NODELAY, SO_KEEPALIVE)
void ConfigureSocket(socket_t sock);

// Start non-blocking connect to the given IP and port
// Returns 0 if connect completed immediately, -1 on error, 1 if in progress
int ConnectNonBlocking(socket_t sock, std::string_view ip, uint16_t port,
                       bool ipv6);

// Check if a non-blocking connect has completed
// Call after socket becomes writable
// Returns true if connected, false if error (errno is set)
bool IsConnected(socket_t sock);

// Non-blocking send
// Returns bytes sent, -1 if would block, -2 on error
ssize_t SendNonBlocking(socket_t sock, const void* data, size_t len);

// Non-blocking receive
// Returns bytes received, 0 on EOF, -1 if would block, -2 on error
ssize_t RecvNonBlocking(socket_t sock, void* buf, size_t len);

// Local and peer endpoints of a connected socket. Fields stay empty for
// sockets without an inet address (e.g. socketpair ends).
SocketInfo GetSocketInfo(socket_t sock);

// True if ip is a dotted-quad IPv4 literal
bool IsIpv4Literal(std::string_view ip);

// True if ip is an IPv6 literal (brackets not included)
bool IsIpv6Literal(std::string_view ip);

}  // namespace util
}  // namespace tunnelpool

#endif  // TUNNELPOOL_UTIL_SOCKET_UTILS_H_
