// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// Turns a socket connected to a proxy (or directly to the target) into a
// ready byte stream: optional TLS to the proxy, the CONNECT or SOCKS
// handshake, then optional TLS to the target.

#ifndef TUNNELPOOL_PROXY_TUNNEL_NEGOTIATOR_H_
#define TUNNELPOOL_PROXY_TUNNEL_NEGOTIATOR_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "tunnelpool/config.h"
#include "tunnelpool/core/byte_stream.h"
#include "tunnelpool/error.h"
#include "tunnelpool/proxy/http_proxy.h"
#include "tunnelpool/proxy/socks_proxy.h"

namespace tunnelpool {
namespace proxy {

// Where the tunnel should lead
struct TunnelTarget {
  std::string host;  // Hostname or IP literal, no brackets
  uint16_t port = 0;
  bool secure = false;  // https: origin, TLS after the tunnel
};

struct NegotiatorOptions {
  // Runs before a failed negotiation closes the socket
  std::function<void(const Error&)> on_close;
};

enum class NegotiationPhase {
  kProxyTls,   // TLS handshake with an https proxy
  kTunnel,     // CONNECT or SOCKS exchange
  kTargetTls,  // TLS handshake with the target through the tunnel
};

const char* NegotiationPhaseName(NegotiationPhase phase);

// One negotiation attempt. Negotiating ends in Connected or Failed; both are
// terminal. NOT thread-safe - drive from the reactor thread.
class ProxyTunnelNegotiator {
 public:
  struct Negotiating {
    NegotiationPhase phase;
  };
  struct Connected {
    bool forwarding;  // Plain http through an http proxy, no tunnel
  };
  struct Failed {
    Error error;
  };
  using State = std::variant<Negotiating, Connected, Failed>;

  // tls creates encrypted streams for https proxies and https targets.
  ProxyTunnelNegotiator(ProxyConfig proxy, TunnelTarget target,
                        core::StreamFactory* tls,
                        NegotiatorOptions options = {});
  ~ProxyTunnelNegotiator();

  // Non-copyable, non-movable
  ProxyTunnelNegotiator(const ProxyTunnelNegotiator&) = delete;
  ProxyTunnelNegotiator& operator=(const ProxyTunnelNegotiator&) = delete;
  ProxyTunnelNegotiator(ProxyTunnelNegotiator&&) = delete;
  ProxyTunnelNegotiator& operator=(ProxyTunnelNegotiator&&) = delete;

  // Takes ownership of a connected socket and makes as much progress as it
  // can without blocking.
  TunnelResult Start(util::socket_t fd);

  // Continue negotiating on socket readiness.
  TunnelResult OnReadable();
  TunnelResult OnWritable();

  // Readiness the negotiation is waiting for
  bool WantsRead() const;
  bool WantsWrite() const;

  const State& state() const { return state_; }
  bool IsNegotiating() const {
    return std::holds_alternative<Negotiating>(state_);
  }
  bool IsConnected() const { return std::holds_alternative<Connected>(state_); }
  bool HasError() const { return std::holds_alternative<Failed>(state_); }

  // Failure reason; empty unless HasError()
  const Error& error() const;

  // Plain http target behind an http proxy: requests go out in absolute form
  bool forwarding() const;

  // Socket of the current stream, kInvalidSocket once released or closed
  util::socket_t fd() const;

  // Hands over the ready stream. Only valid once connected.
  std::unique_ptr<core::ByteStream> TakeStream();

  // Number of TLS streams created (proxy and target handshakes)
  int tls_upgrades() const { return tls_upgrades_; }

  const ProxyConfig& proxy() const { return proxy_; }
  const TunnelTarget& target() const { return target_; }

 private:
  TunnelResult Step(bool readable);
  TunnelResult Handshake();
  TunnelResult Tunnel(bool readable);

  // Moves to the phase after from, or to Connected.
  void Advance(NegotiationPhase from);
  void EnterTunnel();
  void UpgradeToTls(NegotiationPhase phase, const std::string& servername);
  TunnelResult Fail(Error error);

  ProxyConfig proxy_;
  TunnelTarget target_;
  core::StreamFactory* tls_;
  NegotiatorOptions options_;

  State state_;
  TunnelResult waiting_ = TunnelResult::kWantWrite;

  std::unique_ptr<core::ByteStream> stream_;
  core::PlainStream* plain_ = nullptr;  // stream_ while unencrypted

  std::unique_ptr<HttpProxyTunnel> http_;
  std::unique_ptr<SocksProxyTunnel> socks_;

  int tls_upgrades_ = 0;
};

}  // namespace proxy
}  // namespace tunnelpool

#endif  // TUNNELPOOL_PROXY_TUNNEL_NEGOTIATOR_H_
