// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// SOCKS tunnel for proxy support.
// Establishes a tunnel through a SOCKS4/4a/5 proxy to the target host.

#ifndef TUNNELPOOL_PROXY_SOCKS_PROXY_H_
#define TUNNELPOOL_PROXY_SOCKS_PROXY_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tunnelpool/config.h"
#include "tunnelpool/core/byte_stream.h"
#include "tunnelpool/error.h"
#include "tunnelpool/proxy/http_proxy.h"  // For TunnelResult

namespace tunnelpool {
namespace proxy {

// SOCKS5 handshake state machine
enum class Socks5State {
  kIdle,                 // Not started
  kSendingGreeting,      // Sending version + auth methods
  kReadingAuthMethod,    // Reading server's chosen auth method
  kSendingAuth,          // Sending username/password auth
  kReadingAuthResult,    // Reading auth result
  kSendingConnect,       // Sending CONNECT request
  kReadingConnectReply,  // Reading CONNECT reply
  kConnected,            // Tunnel established
  kError,                // Error occurred
};

// SOCKS4/4a handshake state machine
enum class Socks4State {
  kIdle,            // Not started
  kSendingConnect,  // Sending CONNECT request
  kReadingReply,    // Reading reply
  kConnected,       // Tunnel established
  kError,           // Error occurred
};

// SOCKS proxy tunnel handler.
// Non-blocking state machine for establishing SOCKS4/4a/5 proxy tunnels.
// Hostnames are never resolved locally: SOCKS4 switches to 4a framing and
// SOCKS5 sends a domain address for anything that is not an IP literal.
// Replies are read exactly, so no tunnel bytes are consumed.
class SocksProxyTunnel {
 public:
  SocksProxyTunnel(const ProxyConfig& proxy, std::string_view target_host,
                   uint16_t target_port);

  // Start the tunnel handshake (call after TCP connect to proxy)
  TunnelResult Start();

  // Continue handshake when the stream is writable
  TunnelResult OnWritable(core::ByteStream* stream);

  // Continue handshake when the stream is readable
  TunnelResult OnReadable(core::ByteStream* stream);

  // State accessors
  bool IsConnected() const;
  bool HasError() const;
  const Error& error() const { return error_; }

  // For use by the negotiator to drive the state machine
  bool WantsWrite() const;
  bool WantsRead() const;

  Socks4State socks4_state() const { return socks4_state_; }
  Socks5State socks5_state() const { return socks5_state_; }

  // Bytes of the message currently being sent
  const std::vector<uint8_t>& send_buffer() const { return send_buf_; }

 private:
  bool IsSocks5() const { return proxy_type_ == ProxyType::kSocks5; }

  // Shared I/O: flush send_buf_, or read until recv_buf_ holds want bytes.
  TunnelResult Flush(core::ByteStream* stream);
  TunnelResult Fill(core::ByteStream* stream, size_t want);

  // SOCKS5 protocol methods
  TunnelResult Socks5OnWritable(core::ByteStream* stream);
  TunnelResult Socks5OnReadable(core::ByteStream* stream);
  void BuildSocks5Greeting();
  void BuildSocks5Auth();
  void BuildSocks5Connect();
  TunnelResult ParseSocks5AuthMethod();
  TunnelResult ParseSocks5AuthResult();
  TunnelResult ParseSocks5ConnectReply(core::ByteStream* stream);

  // SOCKS4/4a protocol methods
  TunnelResult Socks4OnWritable(core::ByteStream* stream);
  TunnelResult Socks4OnReadable(core::ByteStream* stream);
  void BuildSocks4Connect();
  TunnelResult ParseSocks4Reply();

  TunnelResult Fail(Error error);

  ProxyType proxy_type_;
  std::string target_host_;
  uint16_t target_port_;
  std::string proxy_username_;
  std::string proxy_password_;

  // SOCKS5 state
  Socks5State socks5_state_ = Socks5State::kIdle;

  // SOCKS4 state
  Socks4State socks4_state_ = Socks4State::kIdle;

  Error error_;

  // Send buffer
  std::vector<uint8_t> send_buf_;
  size_t send_offset_ = 0;

  // Receive buffer
  std::vector<uint8_t> recv_buf_;
  static constexpr size_t kMaxRecvSize = 512;
};

}  // namespace proxy
}  // namespace tunnelpool

#endif  // TUNNELPOOL_PROXY_SOCKS_PROXY_H_
