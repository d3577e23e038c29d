// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/util/platform.h"

#include <cstring>

namespace tunnelpool {
namespace util {

std::string GetSocketErrorString(int error_code) {
  return std::strerror(error_code);
}

std::string GetLastSocketErrorString() { return std::strerror(errno); }

bool SetNonBlocking(socket_t sock) {
  int flags = fcntl(sock, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return fcntl(sock, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetCloseOnExec(socket_t sock) {
  int flags = fcntl(sock, F_GETFD, 0);
  if (flags == -1) {
    return false;
  }
  return fcntl(sock, F_SETFD, flags | FD_CLOEXEC) != -1;
}

void CloseSocket(socket_t sock) {
  if (sock >= 0) {
    close(sock);
  }
}

}  // namespace util
}  // namespace tunnelpool
