// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_CONFIG_H_
#define TUNNELPOOL_CONFIG_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "tunnelpool/error.h"
#include "tunnelpool/types.h"

namespace tunnelpool {

// Intermediary protocol, selected by the proxy URI scheme
enum class ProxyType {
  kNone,
  kHttp,    // http://  - CONNECT over plain TCP
  kHttps,   // https:// - CONNECT over TLS to the proxy
  kSocks4,  // socks4:// - SOCKS4, or SOCKS4a for hostnames
  kSocks5,  // socks5://
};

const char* ProxyTypeName(ProxyType type);

// Proxy configuration
struct ProxyConfig {
  ProxyType type = ProxyType::kNone;
  std::string host;      // Proxy hostname or IP
  uint16_t port = 0;
  std::string username;  // Basic auth for HTTP proxies, RFC 1929 for SOCKS5
  std::string password;
  std::string token;     // Sent verbatim as proxy-authorization
  Headers headers;       // Merged into every CONNECT request

  bool IsEnabled() const {
    return type != ProxyType::kNone && port != 0 && !host.empty();
  }
  bool IsHttp() const {
    return type == ProxyType::kHttp || type == ProxyType::kHttps;
  }
  bool IsSocks() const {
    return type == ProxyType::kSocks4 || type == ProxyType::kSocks5;
  }

  // Rejects a token combined with basic credentials, and a token or
  // header that would break out of its CONNECT request line.
  Error Validate() const;
};

// Parse "scheme://[user[:pass]@]host[:port]" into config. Credentials are
// percent-decoded. Token and headers in config are left untouched.
Error ParseProxyUri(std::string_view uri, ProxyConfig* config);

// TLS configuration for target (and https proxy) connections
struct TlsConfig {
  bool verify_certificates = true;
  std::string ca_bundle_path;  // Empty = system default
};

struct TimeoutConfig {
  std::chrono::milliseconds connect{10000};
  std::chrono::milliseconds headers{300000};
  std::chrono::milliseconds body{300000};

  // Idle keep-alive
  std::chrono::milliseconds keep_alive{4000};
  std::chrono::milliseconds keep_alive_max{600000};
  std::chrono::milliseconds keep_alive_threshold{2000};
};

struct FramerConfig {
  // Content-length mismatch fails the request instead of warning
  bool strict_content_length = true;
};

// Connection pool configuration
struct PoolConfig {
  // Member cap when the pool creates members itself (0 = unbounded)
  size_t connections = 0;

  // Requests a member may have written but not completed
  size_t pipelining = 1;

  // Consecutive completions after which a member's weight is raised
  // (0 = never)
  size_t reward_after_successes = 10;

  TimeoutConfig timeouts;
  FramerConfig framer;
  TlsConfig tls;
};

}  // namespace tunnelpool

#endif  // TUNNELPOOL_CONFIG_H_
