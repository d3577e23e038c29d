// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// HTTP CONNECT tunnel for proxy support.
// Establishes a tunnel through an HTTP/HTTPS proxy to the target host.

#ifndef TUNNELPOOL_PROXY_HTTP_PROXY_H_
#define TUNNELPOOL_PROXY_HTTP_PROXY_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tunnelpool/config.h"
#include "tunnelpool/core/byte_stream.h"
#include "tunnelpool/error.h"
#include "tunnelpool/types.h"

namespace tunnelpool {
namespace proxy {

// Result of tunnel operations
enum class TunnelResult {
  kOk,         // Operation completed successfully
  kWantWrite,  // Need to write more data
  kWantRead,   // Need to read more data
  kError,      // Error occurred
};

// State of CONNECT tunnel handshake
enum class HttpTunnelState {
  kIdle,             // Not started
  kSendingRequest,   // Sending CONNECT request
  kReadingResponse,  // Reading proxy response
  kConnected,        // Tunnel established
  kError,            // Error occurred
};

// proxy-authorization ("Basic ..." or the token verbatim) followed by the
// configured extra headers. Sent with every CONNECT and forwarded request.
Headers BuildProxyHeaders(const ProxyConfig& proxy);

// Standard base64 with padding
std::string Base64Encode(std::string_view input);

// HTTP CONNECT tunnel handler.
// Non-blocking state machine for establishing proxy tunnels.
class HttpProxyTunnel {
 public:
  HttpProxyTunnel(std::string_view target_host, uint16_t target_port,
                  const ProxyConfig& proxy);

  // Start the tunnel handshake (call once the proxy stream is ready)
  TunnelResult Start();

  // Continue handshake when the stream is writable
  TunnelResult OnWritable(core::ByteStream* stream);

  // Continue handshake when the stream is readable
  TunnelResult OnReadable(core::ByteStream* stream);

  HttpTunnelState state() const { return state_; }
  bool IsConnected() const { return state_ == HttpTunnelState::kConnected; }
  bool HasError() const { return state_ == HttpTunnelState::kError; }
  bool WantsWrite() const {
    return state_ == HttpTunnelState::kSendingRequest;
  }
  bool WantsRead() const {
    return state_ == HttpTunnelState::kReadingResponse;
  }

  // Proxy status code once a response was parsed, 0 before
  int status_code() const { return status_code_; }
  const Error& error() const { return error_; }
  const std::string& request() const { return request_; }

  static constexpr size_t kMaxResponseSize = 8192;

 private:
  void BuildRequest(const ProxyConfig& proxy);
  TunnelResult ParseResponse();
  TunnelResult Fail(Error error);

  std::string target_host_;
  uint16_t target_port_;

  HttpTunnelState state_ = HttpTunnelState::kIdle;
  Error error_;
  int status_code_ = 0;

  // Request buffer
  std::string request_;
  size_t request_sent_ = 0;

  // Response buffer
  std::vector<char> response_buf_;
};

}  // namespace proxy
}  // namespace tunnelpool

#endif  // TUNNELPOOL_PROXY_HTTP_PROXY_H_
