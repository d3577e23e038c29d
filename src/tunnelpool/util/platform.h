// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// Platform abstraction for socket operations (POSIX).

#ifndef TUNNELPOOL_UTIL_PLATFORM_H_
#define TUNNELPOOL_UTIL_PLATFORM_H_

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <string>

// Error code macros
#define TUNNELPOOL_SOCKET_ERROR_CODE errno
#define TUNNELPOOL_WOULD_BLOCK_ERROR EWOULDBLOCK
#define TUNNELPOOL_IN_PROGRESS_ERROR EINPROGRESS

namespace tunnelpool {
namespace util {

using socket_t = int;
constexpr socket_t kInvalidSocket = -1;

// Get human-readable error string for a socket error code
std::string GetSocketErrorString(int error_code);

// Get error string for the last socket error
std::string GetLastSocketErrorString();

// Set socket to non-blocking mode
// Returns true on success
bool SetNonBlocking(socket_t sock);

// Set close-on-exec flag
// Returns true on success
bool SetCloseOnExec(socket_t sock);

// Close a socket
void CloseSocket(socket_t sock);

}  // namespace util
}  // namespace tunnelpool

#endif  // TUNNELPOOL_UTIL_PLATFORM_H_
