// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// SOCKS wire constants: RFC 1928 and RFC 1929 for SOCKS5, SOCKS4 and the
// SOCKS4a hostname extension.

#ifndef TUNNELPOOL_PROXY_SOCKS_CONSTANTS_H_
#define TUNNELPOOL_PROXY_SOCKS_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

namespace tunnelpool {
namespace proxy {

constexpr uint8_t kSocks4Version = 0x04;
constexpr uint8_t kSocks5Version = 0x05;

// Ports travel big-endian in both versions
constexpr size_t kPortSize = 2;

namespace socks5 {

// Method selection: VER | NMETHODS | METHODS -> VER | METHOD
constexpr uint8_t kAuthNone = 0x00;
constexpr uint8_t kAuthPassword = 0x02;
constexpr uint8_t kAuthNoAcceptable = 0xFF;
constexpr size_t kMethodReplySize = 2;

// RFC 1929: VER | ULEN | UNAME | PLEN | PASSWD -> VER | STATUS
constexpr uint8_t kAuthPasswordVersion = 0x01;
constexpr uint8_t kAuthSuccess = 0x00;
constexpr size_t kAuthReplySize = 2;
constexpr size_t kMaxCredentialLength = 255;

// Request: VER | CMD | RSV | ATYP | DST.ADDR | DST.PORT
constexpr uint8_t kCmdConnect = 0x01;
constexpr uint8_t kReserved = 0x00;

constexpr uint8_t kAtypIpv4 = 0x01;
constexpr uint8_t kAtypDomain = 0x03;  // Length-prefixed name
constexpr uint8_t kAtypIpv6 = 0x04;
constexpr size_t kIpv4Size = 4;
constexpr size_t kIpv6Size = 16;
constexpr size_t kMaxDomainLength = 255;

// Reply: VER | REP | RSV | ATYP, then BND.ADDR | BND.PORT
constexpr size_t kReplyHeaderSize = 4;
constexpr uint8_t kRepSucceeded = 0x00;
constexpr uint8_t kRepConnectionRefused = 0x05;

inline const char* ReplyCodeToString(uint8_t code) {
  static constexpr const char* kMessages[] = {
      "succeeded",
      "general SOCKS server failure",
      "connection not allowed by ruleset",
      "network unreachable",
      "host unreachable",
      "connection refused",
      "TTL expired",
      "command not supported",
      "address type not supported",
  };
  if (code < sizeof(kMessages) / sizeof(kMessages[0])) {
    return kMessages[code];
  }
  return "unknown error";
}

}  // namespace socks5

namespace socks4 {

// Request: VN | CD | DSTPORT | DSTIP | USERID | NUL [| HOSTNAME | NUL]
constexpr uint8_t kCmdConnect = 0x01;

// DSTIP 0.0.0.x with x != 0 announces a SOCKS4a hostname
constexpr uint8_t kSocks4aPlaceholder[4] = {0x00, 0x00, 0x00, 0x01};

// Reply: VN | CD | DSTPORT | DSTIP
constexpr size_t kReplySize = 8;
constexpr uint8_t kRepGranted = 0x5A;
constexpr uint8_t kRepRejected = 0x5B;
constexpr uint8_t kRepNoIdentd = 0x5C;
constexpr uint8_t kRepIdentdMismatch = 0x5D;

inline const char* ReplyCodeToString(uint8_t code) {
  switch (code) {
    case kRepGranted:
      return "request granted";
    case kRepRejected:
      return "request rejected or failed";
    case kRepNoIdentd:
      return "cannot connect to client identd";
    case kRepIdentdMismatch:
      return "client identd user mismatch";
  }
  return "unknown error";
}

}  // namespace socks4

}  // namespace proxy
}  // namespace tunnelpool

#endif  // TUNNELPOOL_PROXY_SOCKS_CONSTANTS_H_
