// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/proxy/socks_proxy.h"

#include <arpa/inet.h>

#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "tunnelpool/proxy/socks_constants.h"
#include "tunnelpool/util/socket_utils.h"

namespace tunnelpool {
namespace proxy {

namespace {

void AppendPort(std::vector<uint8_t>* buf, uint16_t port) {
  // Network byte order
  buf->push_back(static_cast<uint8_t>((port >> 8) & 0xFF));
  buf->push_back(static_cast<uint8_t>(port & 0xFF));
}

}  // namespace

SocksProxyTunnel::SocksProxyTunnel(const ProxyConfig& proxy,
                                   std::string_view target_host,
                                   uint16_t target_port)
    : proxy_type_(proxy.type),
      target_host_(target_host),
      target_port_(target_port),
      proxy_username_(proxy.username),
      proxy_password_(proxy.password) {
  recv_buf_.reserve(kMaxRecvSize);
}

TunnelResult SocksProxyTunnel::Start() {
  if (proxy_type_ == ProxyType::kSocks5) {
    if (socks5_state_ != Socks5State::kIdle) {
      return Fail(Error::Tunnel("SOCKS5 tunnel already started"));
    }
    if (target_host_.size() > socks5::kMaxDomainLength) {
      return Fail(Error::Tunnel("SOCKS5 target hostname too long"));
    }
    if (proxy_username_.size() > socks5::kMaxCredentialLength ||
        proxy_password_.size() > socks5::kMaxCredentialLength) {
      return Fail(Error::Tunnel("SOCKS5 credentials too long"));
    }

    BuildSocks5Greeting();
    socks5_state_ = Socks5State::kSendingGreeting;
    return TunnelResult::kWantWrite;
  }

  if (proxy_type_ == ProxyType::kSocks4) {
    if (socks4_state_ != Socks4State::kIdle) {
      return Fail(Error::Tunnel("SOCKS4 tunnel already started"));
    }
    if (util::IsIpv6Literal(target_host_)) {
      return Fail(Error::Tunnel("SOCKS4 cannot reach IPv6 targets"));
    }

    BuildSocks4Connect();
    socks4_state_ = Socks4State::kSendingConnect;
    return TunnelResult::kWantWrite;
  }

  return Fail(Error::Tunnel("Unsupported proxy type"));
}

TunnelResult SocksProxyTunnel::OnWritable(core::ByteStream* stream) {
  return IsSocks5() ? Socks5OnWritable(stream) : Socks4OnWritable(stream);
}

TunnelResult SocksProxyTunnel::OnReadable(core::ByteStream* stream) {
  return IsSocks5() ? Socks5OnReadable(stream) : Socks4OnReadable(stream);
}

bool SocksProxyTunnel::IsConnected() const {
  if (IsSocks5()) {
    return socks5_state_ == Socks5State::kConnected;
  }
  return socks4_state_ == Socks4State::kConnected;
}

bool SocksProxyTunnel::HasError() const {
  if (IsSocks5()) {
    return socks5_state_ == Socks5State::kError;
  }
  return socks4_state_ == Socks4State::kError;
}

bool SocksProxyTunnel::WantsWrite() const {
  if (IsSocks5()) {
    return socks5_state_ == Socks5State::kSendingGreeting ||
           socks5_state_ == Socks5State::kSendingAuth ||
           socks5_state_ == Socks5State::kSendingConnect;
  }
  return socks4_state_ == Socks4State::kSendingConnect;
}

bool SocksProxyTunnel::WantsRead() const {
  if (IsSocks5()) {
    return socks5_state_ == Socks5State::kReadingAuthMethod ||
           socks5_state_ == Socks5State::kReadingAuthResult ||
           socks5_state_ == Socks5State::kReadingConnectReply;
  }
  return socks4_state_ == Socks4State::kReadingReply;
}

TunnelResult SocksProxyTunnel::Flush(core::ByteStream* stream) {
  while (send_offset_ < send_buf_.size()) {
    size_t sent = 0;
    core::IoResult io = stream->Write(send_buf_.data() + send_offset_,
                                      send_buf_.size() - send_offset_, &sent);
    send_offset_ += sent;

    if (io == core::IoResult::kError) {
      return Fail(Error::Tunnel("SOCKS proxy write failed: " +
                                stream->last_error()));
    }
    if (io == core::IoResult::kWantRead) {
      return TunnelResult::kWantRead;
    }
    if (sent == 0) {
      return TunnelResult::kWantWrite;
    }
  }
  return TunnelResult::kOk;
}

TunnelResult SocksProxyTunnel::Fill(core::ByteStream* stream, size_t want) {
  if (want > kMaxRecvSize) {
    return Fail(Error::Tunnel("SOCKS response too large"));
  }

  while (recv_buf_.size() < want) {
    uint8_t buf[kMaxRecvSize];
    core::IoResult io;
    ssize_t n = stream->Read(buf, want - recv_buf_.size(), &io);

    if (n < 0) {
      if (io == core::IoResult::kWantRead) {
        return TunnelResult::kWantRead;
      }
      if (io == core::IoResult::kWantWrite) {
        return TunnelResult::kWantWrite;
      }
      return Fail(Error::Tunnel("SOCKS proxy read failed: " +
                                stream->last_error()));
    }

    if (n == 0) {
      return Fail(Error::Tunnel("SOCKS proxy closed connection"));
    }

    recv_buf_.insert(recv_buf_.end(), buf, buf + n);
  }
  return TunnelResult::kOk;
}

// =============================================================================
// SOCKS5 Implementation
// =============================================================================

TunnelResult SocksProxyTunnel::Socks5OnWritable(core::ByteStream* stream) {
  if (!WantsWrite()) {
    return WantsRead() ? TunnelResult::kWantRead : TunnelResult::kError;
  }

  TunnelResult flushed = Flush(stream);
  if (flushed != TunnelResult::kOk) {
    return flushed;
  }

  // All data sent, transition to reading state
  recv_buf_.clear();

  switch (socks5_state_) {
    case Socks5State::kSendingGreeting:
      socks5_state_ = Socks5State::kReadingAuthMethod;
      return TunnelResult::kWantRead;

    case Socks5State::kSendingAuth:
      socks5_state_ = Socks5State::kReadingAuthResult;
      return TunnelResult::kWantRead;

    case Socks5State::kSendingConnect:
      socks5_state_ = Socks5State::kReadingConnectReply;
      return TunnelResult::kWantRead;

    default:
      return Fail(Error::Internal("Invalid SOCKS5 state in OnWritable"));
  }
}

TunnelResult SocksProxyTunnel::Socks5OnReadable(core::ByteStream* stream) {
  TunnelResult filled;

  switch (socks5_state_) {
    case Socks5State::kReadingAuthMethod:
      filled = Fill(stream, socks5::kMethodReplySize);
      return filled == TunnelResult::kOk ? ParseSocks5AuthMethod() : filled;

    case Socks5State::kReadingAuthResult:
      filled = Fill(stream, socks5::kAuthReplySize);
      return filled == TunnelResult::kOk ? ParseSocks5AuthResult() : filled;

    case Socks5State::kReadingConnectReply:
      return ParseSocks5ConnectReply(stream);

    default:
      if (WantsWrite()) {
        return Socks5OnWritable(stream);
      }
      return Fail(Error::Internal("Invalid SOCKS5 state in OnReadable"));
  }
}

void SocksProxyTunnel::BuildSocks5Greeting() {
  // Greeting format: VER | NMETHODS | METHODS
  send_buf_.clear();
  send_offset_ = 0;
  send_buf_.push_back(kSocks5Version);

  if (!proxy_username_.empty()) {
    // Offer both no-auth and password auth
    send_buf_.push_back(2);
    send_buf_.push_back(socks5::kAuthNone);
    send_buf_.push_back(socks5::kAuthPassword);
  } else {
    send_buf_.push_back(1);
    send_buf_.push_back(socks5::kAuthNone);
  }
}

void SocksProxyTunnel::BuildSocks5Auth() {
  // Password auth subnegotiation format (RFC 1929):
  // VER | ULEN | UNAME | PLEN | PASSWD
  send_buf_.clear();
  send_offset_ = 0;
  send_buf_.push_back(socks5::kAuthPasswordVersion);

  send_buf_.push_back(static_cast<uint8_t>(proxy_username_.size()));
  send_buf_.insert(send_buf_.end(), proxy_username_.begin(),
                   proxy_username_.end());

  send_buf_.push_back(static_cast<uint8_t>(proxy_password_.size()));
  send_buf_.insert(send_buf_.end(), proxy_password_.begin(),
                   proxy_password_.end());
}

void SocksProxyTunnel::BuildSocks5Connect() {
  // Connect request format:
  // VER | CMD | RSV | ATYP | DST.ADDR | DST.PORT
  send_buf_.clear();
  send_offset_ = 0;
  send_buf_.push_back(kSocks5Version);
  send_buf_.push_back(socks5::kCmdConnect);
  send_buf_.push_back(socks5::kReserved);

  // Literals go out as text too; the proxy resolves or parses the name
  send_buf_.push_back(socks5::kAtypDomain);
  send_buf_.push_back(static_cast<uint8_t>(target_host_.size()));
  send_buf_.insert(send_buf_.end(), target_host_.begin(), target_host_.end());

  AppendPort(&send_buf_, target_port_);
}

TunnelResult SocksProxyTunnel::ParseSocks5AuthMethod() {
  // Response format: VER | METHOD
  if (recv_buf_[0] != kSocks5Version) {
    return Fail(Error::Tunnel("Invalid SOCKS5 version from proxy"));
  }

  uint8_t method = recv_buf_[1];
  recv_buf_.clear();

  if (method == socks5::kAuthNoAcceptable) {
    return Fail(Error::Tunnel(
        "SOCKS5 proxy: no acceptable authentication method", method));
  }

  if (method == socks5::kAuthPassword) {
    if (proxy_username_.empty()) {
      return Fail(Error::Tunnel(
          "SOCKS5 proxy requires authentication but no credentials"));
    }

    BuildSocks5Auth();
    socks5_state_ = Socks5State::kSendingAuth;
    return TunnelResult::kWantWrite;
  }

  if (method == socks5::kAuthNone) {
    BuildSocks5Connect();
    socks5_state_ = Socks5State::kSendingConnect;
    return TunnelResult::kWantWrite;
  }

  return Fail(Error::Tunnel("SOCKS5 proxy selected unsupported auth method",
                            method));
}

TunnelResult SocksProxyTunnel::ParseSocks5AuthResult() {
  // Response format: VER | STATUS
  if (recv_buf_[0] != socks5::kAuthPasswordVersion) {
    return Fail(Error::Tunnel("Invalid SOCKS5 auth version"));
  }

  uint8_t status = recv_buf_[1];
  recv_buf_.clear();

  if (status != socks5::kAuthSuccess) {
    return Fail(Error::Tunnel("SOCKS5 authentication failed", status));
  }

  BuildSocks5Connect();
  socks5_state_ = Socks5State::kSendingConnect;
  return TunnelResult::kWantWrite;
}

TunnelResult SocksProxyTunnel::ParseSocks5ConnectReply(
    core::ByteStream* stream) {
  TunnelResult filled = Fill(stream, socks5::kReplyHeaderSize);
  if (filled != TunnelResult::kOk) {
    return filled;
  }

  if (recv_buf_[0] != kSocks5Version) {
    return Fail(Error::Tunnel("Invalid SOCKS5 version in connect reply"));
  }

  uint8_t rep = recv_buf_[1];
  if (rep != socks5::kRepSucceeded) {
    return Fail(Error::Tunnel(std::string("SOCKS5 connect failed: ") +
                                  socks5::ReplyCodeToString(rep),
                              rep));
  }

  // The bound address is read and discarded
  size_t bound_len = 0;
  switch (recv_buf_[3]) {
    case socks5::kAtypIpv4:
      bound_len = socks5::kIpv4Size;
      break;
    case socks5::kAtypIpv6:
      bound_len = socks5::kIpv6Size;
      break;
    case socks5::kAtypDomain:
      // One length octet precedes the name
      filled = Fill(stream, socks5::kReplyHeaderSize + 1);
      if (filled != TunnelResult::kOk) {
        return filled;
      }
      bound_len = 1 + recv_buf_[socks5::kReplyHeaderSize];
      break;
    default:
      return Fail(Error::Tunnel("Unknown address type in SOCKS5 reply"));
  }

  filled = Fill(stream, socks5::kReplyHeaderSize + bound_len + kPortSize);
  if (filled != TunnelResult::kOk) {
    return filled;
  }

  socks5_state_ = Socks5State::kConnected;
  SPDLOG_DEBUG("proxy: SOCKS5 tunnel to {}:{} established", target_host_,
               target_port_);
  return TunnelResult::kOk;
}

// =============================================================================
// SOCKS4/4a Implementation
// =============================================================================

TunnelResult SocksProxyTunnel::Socks4OnWritable(core::ByteStream* stream) {
  if (socks4_state_ != Socks4State::kSendingConnect) {
    return WantsRead() ? TunnelResult::kWantRead : TunnelResult::kError;
  }

  TunnelResult flushed = Flush(stream);
  if (flushed != TunnelResult::kOk) {
    return flushed;
  }

  recv_buf_.clear();
  socks4_state_ = Socks4State::kReadingReply;
  return TunnelResult::kWantRead;
}

TunnelResult SocksProxyTunnel::Socks4OnReadable(core::ByteStream* stream) {
  if (socks4_state_ == Socks4State::kSendingConnect) {
    return Socks4OnWritable(stream);
  }
  if (socks4_state_ != Socks4State::kReadingReply) {
    return Fail(Error::Internal("Invalid SOCKS4 state in OnReadable"));
  }

  TunnelResult filled = Fill(stream, socks4::kReplySize);
  if (filled != TunnelResult::kOk) {
    return filled;
  }
  return ParseSocks4Reply();
}

void SocksProxyTunnel::BuildSocks4Connect() {
  // SOCKS4 request format:
  // VN | CD | DSTPORT | DSTIP | USERID | NULL [| HOSTNAME | NULL]
  send_buf_.clear();
  send_offset_ = 0;
  send_buf_.push_back(kSocks4Version);
  send_buf_.push_back(socks4::kCmdConnect);
  AppendPort(&send_buf_, target_port_);

  uint8_t ipv4[4];
  bool use_socks4a = inet_pton(AF_INET, target_host_.c_str(), ipv4) != 1;

  if (use_socks4a) {
    send_buf_.insert(send_buf_.end(), std::begin(socks4::kSocks4aPlaceholder),
                     std::end(socks4::kSocks4aPlaceholder));
  } else {
    send_buf_.insert(send_buf_.end(), ipv4, ipv4 + 4);
  }

  // Empty USERID
  send_buf_.push_back(0x00);

  if (use_socks4a) {
    send_buf_.insert(send_buf_.end(), target_host_.begin(), target_host_.end());
    send_buf_.push_back(0x00);
  }
}

TunnelResult SocksProxyTunnel::ParseSocks4Reply() {
  // Reply format: VN | CD | DSTPORT | DSTIP
  // VN should be 0 (some proxies return 0x04)
  if (recv_buf_[0] != 0x00 && recv_buf_[0] != kSocks4Version) {
    return Fail(Error::Tunnel("Invalid SOCKS4 version in reply"));
  }

  uint8_t cd = recv_buf_[1];
  if (cd != socks4::kRepGranted) {
    return Fail(Error::Tunnel(std::string("SOCKS4 connect failed: ") +
                                  socks4::ReplyCodeToString(cd),
                              cd));
  }

  socks4_state_ = Socks4State::kConnected;
  SPDLOG_DEBUG("proxy: SOCKS4 tunnel to {}:{} established", target_host_,
               target_port_);
  return TunnelResult::kOk;
}

TunnelResult SocksProxyTunnel::Fail(Error error) {
  spdlog::error("proxy: {}", error.ToString());
  error_ = std::move(error);
  if (IsSocks5()) {
    socks5_state_ = Socks5State::kError;
  } else {
    socks4_state_ = Socks4State::kError;
  }
  return TunnelResult::kError;
}

}  // namespace proxy
}  // namespace tunnelpool
