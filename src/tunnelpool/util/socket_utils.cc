// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/util/socket_utils.h"

#include <cstring>
#include <string>

namespace tunnelpool {
namespace util {

namespace {

// inet_pton needs a null-terminated copy. Max IPv6 text length is 45.
bool CopyAddress(std::string_view ip, char (&buf)[46]) {
  if (ip.size() >= sizeof(buf)) {
    return false;
  }
  std::memcpy(buf, ip.data(), ip.size());
  buf[ip.size()] = '\0';
  return true;
}

void FillEndpoint(const sockaddr_storage& addr, std::string* address,
                  uint16_t* port) {
  char buf[INET6_ADDRSTRLEN] = {};
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
    *port = ntohs(in->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    *port = ntohs(in6->sin6_port);
  } else {
    return;
  }
  *address = buf;
}

}  // namespace

socket_t CreateTcpSocket(bool ipv6) {
  int domain = ipv6 ? AF_INET6 : AF_INET;
  socket_t sock = kInvalidSocket;

#if defined(SOCK_NONBLOCK) && defined(SOCK_CLOEXEC)
  sock = socket(domain, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (sock >= 0) {
    return sock;
  }
#endif
  sock = socket(domain, SOCK_STREAM, 0);
  if (sock < 0) {
    return kInvalidSocket;
  }

  if (!SetNonBlocking(sock) || !SetCloseOnExec(sock)) {
    CloseSocket(sock);
    return kInvalidSocket;
  }

  return sock;
}

void ConfigureSocket(socket_t sock) {
  // Disable Nagle's algorithm for lower latency
  int flag = 1;
  setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
  setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

int ConnectNonBlocking(socket_t sock, std::string_view ip, uint16_t port,
                       bool ipv6) {
  char ip_buf[46];
  if (!CopyAddress(ip, ip_buf)) {
    return -1;
  }

  int ret;

  if (ipv6) {
    sockaddr_in6 addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(port);
    if (inet_pton(AF_INET6, ip_buf, &addr.sin6_addr) != 1) {
      return -1;
    }
    ret = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  } else {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip_buf, &addr.sin_addr) != 1) {
      return -1;
    }
    ret = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  }

  if (ret == 0) {
    return 0;
  }

  int error = TUNNELPOOL_SOCKET_ERROR_CODE;
  if (error == TUNNELPOOL_IN_PROGRESS_ERROR ||
      error == TUNNELPOOL_WOULD_BLOCK_ERROR) {
    return 1;
  }

  return -1;
}

bool IsConnected(socket_t sock) {
  int error = 0;
  socklen_t len = sizeof(error);
  if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
    return false;
  }
  if (error != 0) {
    errno = error;
    return false;
  }
  return true;
}

ssize_t SendNonBlocking(socket_t sock, const void* data, size_t len) {
  ssize_t ret = send(sock, data, len, MSG_NOSIGNAL);
  if (ret < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return -1;
    }
    return -2;
  }
  return ret;
}

ssize_t RecvNonBlocking(socket_t sock, void* buf, size_t len) {
  ssize_t ret = recv(sock, buf, len, 0);
  if (ret < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return -1;
    }
    return -2;
  }
  return ret;
}

SocketInfo GetSocketInfo(socket_t sock) {
  SocketInfo info;
  sockaddr_storage addr;
  socklen_t len = sizeof(addr);

  std::memset(&addr, 0, sizeof(addr));
  if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    FillEndpoint(addr, &info.local_address, &info.local_port);
  }

  len = sizeof(addr);
  std::memset(&addr, 0, sizeof(addr));
  if (getpeername(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    FillEndpoint(addr, &info.remote_address, &info.remote_port);
  }

  return info;
}

bool IsIpv4Literal(std::string_view ip) {
  char buf[46];
  in_addr addr;
  return CopyAddress(ip, buf) && inet_pton(AF_INET, buf, &addr) == 1;
}

bool IsIpv6Literal(std::string_view ip) {
  char buf[46];
  in6_addr addr;
  return CopyAddress(ip, buf) && inet_pton(AF_INET6, buf, &addr) == 1;
}

}  // namespace util
}  // namespace tunnelpool
