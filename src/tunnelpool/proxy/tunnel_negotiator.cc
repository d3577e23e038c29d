// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/proxy/tunnel_negotiator.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace tunnelpool {
namespace proxy {

const char* NegotiationPhaseName(NegotiationPhase phase) {
  switch (phase) {
    case NegotiationPhase::kProxyTls:
      return "proxy-tls";
    case NegotiationPhase::kTunnel:
      return "tunnel";
    case NegotiationPhase::kTargetTls:
      return "target-tls";
  }
  return "unknown";
}

ProxyTunnelNegotiator::ProxyTunnelNegotiator(ProxyConfig proxy,
                                             TunnelTarget target,
                                             core::StreamFactory* tls,
                                             NegotiatorOptions options)
    : proxy_(std::move(proxy)),
      target_(std::move(target)),
      tls_(tls),
      options_(std::move(options)),
      state_(Negotiating{NegotiationPhase::kTunnel}) {}

ProxyTunnelNegotiator::~ProxyTunnelNegotiator() = default;

TunnelResult ProxyTunnelNegotiator::Start(util::socket_t fd) {
  auto plain = std::make_unique<core::PlainStream>(fd);
  plain_ = plain.get();
  stream_ = std::move(plain);

  if (proxy_.type != ProxyType::kNone) {
    if (Error invalid = proxy_.Validate()) {
      return Fail(std::move(invalid));
    }
  }

  bool needs_tls = target_.secure || proxy_.type == ProxyType::kHttps;
  if (needs_tls && tls_ == nullptr) {
    return Fail(Error::Tls("No TLS context for " + target_.host));
  }

  if (proxy_.type == ProxyType::kHttps) {
    UpgradeToTls(NegotiationPhase::kProxyTls, proxy_.host);
  } else if (proxy_.type != ProxyType::kNone) {
    EnterTunnel();
  } else if (target_.secure) {
    UpgradeToTls(NegotiationPhase::kTargetTls, target_.host);
  } else {
    state_ = Connected{false};
    return TunnelResult::kOk;
  }

  return Step(false);
}

TunnelResult ProxyTunnelNegotiator::OnReadable() { return Step(true); }

TunnelResult ProxyTunnelNegotiator::OnWritable() { return Step(false); }

bool ProxyTunnelNegotiator::WantsRead() const {
  return IsNegotiating() && waiting_ == TunnelResult::kWantRead;
}

bool ProxyTunnelNegotiator::WantsWrite() const {
  return IsNegotiating() && waiting_ == TunnelResult::kWantWrite;
}

const Error& ProxyTunnelNegotiator::error() const {
  static const Error kNoError;
  if (const auto* failed = std::get_if<Failed>(&state_)) {
    return failed->error;
  }
  return kNoError;
}

bool ProxyTunnelNegotiator::forwarding() const {
  const auto* connected = std::get_if<Connected>(&state_);
  return connected != nullptr && connected->forwarding;
}

util::socket_t ProxyTunnelNegotiator::fd() const {
  return stream_ ? stream_->fd() : util::kInvalidSocket;
}

std::unique_ptr<core::ByteStream> ProxyTunnelNegotiator::TakeStream() {
  if (!IsConnected()) {
    return nullptr;
  }
  plain_ = nullptr;
  return std::move(stream_);
}

TunnelResult ProxyTunnelNegotiator::Step(bool readable) {
  // A phase may switch direction once per event
  bool flipped = false;
  while (true) {
    const auto* negotiating = std::get_if<Negotiating>(&state_);
    if (negotiating == nullptr) {
      return IsConnected() ? TunnelResult::kOk : TunnelResult::kError;
    }

    NegotiationPhase phase = negotiating->phase;
    TunnelResult result = (phase == NegotiationPhase::kTunnel)
                              ? Tunnel(readable)
                              : Handshake();

    switch (result) {
      case TunnelResult::kOk:
        // Next phase starts by writing
        Advance(phase);
        readable = false;
        flipped = false;
        break;

      case TunnelResult::kError:
        return result;

      case TunnelResult::kWantRead:
        waiting_ = result;
        if (readable || flipped) {
          return result;
        }
        readable = true;
        flipped = true;
        break;

      case TunnelResult::kWantWrite:
        waiting_ = result;
        if (!readable || flipped) {
          return result;
        }
        readable = false;
        flipped = true;
        break;
    }
  }
}

TunnelResult ProxyTunnelNegotiator::Handshake() {
  switch (stream_->Handshake()) {
    case core::IoResult::kOk:
      return TunnelResult::kOk;
    case core::IoResult::kWantRead:
      return TunnelResult::kWantRead;
    case core::IoResult::kWantWrite:
      return TunnelResult::kWantWrite;
    default:
      return Fail(Error::Tls(stream_->last_error()));
  }
}

TunnelResult ProxyTunnelNegotiator::Tunnel(bool readable) {
  TunnelResult result;
  if (http_) {
    result = readable ? http_->OnReadable(stream_.get())
                      : http_->OnWritable(stream_.get());
    if (result == TunnelResult::kError) {
      return Fail(http_->error());
    }
  } else {
    result = readable ? socks_->OnReadable(stream_.get())
                      : socks_->OnWritable(stream_.get());
    if (result == TunnelResult::kError) {
      return Fail(socks_->error());
    }
  }
  return result;
}

void ProxyTunnelNegotiator::Advance(NegotiationPhase from) {
  SPDLOG_DEBUG("negotiator: {} phase done for {}:{}",
               NegotiationPhaseName(from), target_.host, target_.port);

  if (from == NegotiationPhase::kProxyTls) {
    EnterTunnel();
    return;
  }

  if (from == NegotiationPhase::kTunnel && target_.secure) {
    UpgradeToTls(NegotiationPhase::kTargetTls, target_.host);
    return;
  }

  state_ = Connected{false};
}

void ProxyTunnelNegotiator::EnterTunnel() {
  if (proxy_.IsHttp() && !target_.secure) {
    // The proxy takes absolute-form requests directly
    state_ = Connected{true};
    return;
  }

  TunnelResult started;
  if (proxy_.IsHttp()) {
    http_ = std::make_unique<HttpProxyTunnel>(target_.host, target_.port,
                                              proxy_);
    started = http_->Start();
  } else {
    socks_ = std::make_unique<SocksProxyTunnel>(proxy_, target_.host,
                                                target_.port);
    started = socks_->Start();
  }

  if (started == TunnelResult::kError) {
    Fail(http_ ? http_->error() : socks_->error());
    return;
  }
  state_ = Negotiating{NegotiationPhase::kTunnel};
}

void ProxyTunnelNegotiator::UpgradeToTls(NegotiationPhase phase,
                                         const std::string& servername) {
  if (plain_ != nullptr) {
    util::socket_t fd = plain_->Release();
    plain_ = nullptr;
    stream_ = tls_->CreateTlsStream(fd, servername);
  } else {
    // Target TLS inside the https proxy's session
    stream_ = tls_->CreateTlsStream(std::move(stream_), servername);
  }
  ++tls_upgrades_;
  state_ = Negotiating{phase};
}

TunnelResult ProxyTunnelNegotiator::Fail(Error error) {
  SPDLOG_DEBUG("negotiator: {}:{} via {} failed: {}", target_.host,
               target_.port, ProxyTypeName(proxy_.type), error.ToString());

  if (options_.on_close) {
    options_.on_close(error);
  }

  plain_ = nullptr;
  stream_.reset();
  state_ = Failed{std::move(error)};
  return TunnelResult::kError;
}

}  // namespace proxy
}  // namespace tunnelpool
