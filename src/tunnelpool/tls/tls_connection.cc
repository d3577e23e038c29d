// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/tls/tls_connection.h"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "tunnelpool/util/socket_utils.h"

namespace tunnelpool {
namespace tls {

namespace {

constexpr size_t kMaxRecordSize = 16384;

// One full record plus header and padding fits either half of the pair
constexpr size_t kBioPairSize = kMaxRecordSize + 2048;

}  // namespace

TlsConnection::TlsConnection(TlsContextFactory* factory, util::socket_t fd,
                             std::string_view servername)
    : fd_(fd), servername_(servername) {
  ssl_.reset(factory->CreateSsl());
  if (!ssl_) {
    SetError("Failed to create SSL object");
    return;
  }

  if (SSL_set_fd(ssl_.get(), fd) != 1) {
    SetError("Failed to set SSL fd");
    return;
  }

  Configure(factory);
}

TlsConnection::TlsConnection(TlsContextFactory* factory,
                             std::unique_ptr<core::ByteStream> transport,
                             std::string_view servername)
    : servername_(servername), transport_(std::move(transport)) {
  ssl_.reset(factory->CreateSsl());
  if (!ssl_) {
    SetError("Failed to create SSL object");
    return;
  }

  BIO* internal = nullptr;
  BIO* network = nullptr;
  if (BIO_new_bio_pair(&internal, kBioPairSize, &network, kBioPairSize) !=
      1) {
    SetError("Failed to create BIO pair");
    return;
  }
  // The SSL object takes the internal half
  SSL_set_bio(ssl_.get(), internal, internal);
  transport_bio_.reset(network);

  Configure(factory);
}

TlsConnection::~TlsConnection() {
  // Frees the internal half of the pair before the network half
  ssl_.reset();
  transport_bio_.reset();
  transport_.reset();
  if (fd_ != util::kInvalidSocket) {
    util::CloseSocket(fd_);
  }
}

void TlsConnection::Configure(TlsContextFactory* factory) {
  // SNI is not sent for IP literals
  bool literal = util::IsIpv4Literal(servername_) ||
                 util::IsIpv6Literal(servername_);
  if (!servername_.empty() && !literal) {
    SSL_set_tlsext_host_name(ssl_.get(), servername_.c_str());
  }

  if (factory->verify_certificates() && !servername_.empty()) {
    X509_VERIFY_PARAM* param = SSL_get0_param(ssl_.get());
    int ok = literal
                 ? X509_VERIFY_PARAM_set1_ip_asc(param, servername_.c_str())
                 : X509_VERIFY_PARAM_set1_host(param, servername_.c_str(),
                                               servername_.size());
    if (ok != 1) {
      SetError("Failed to set verification name");
      return;
    }
  }

  SSL_set_connect_state(ssl_.get());
}

template <typename Call>
int TlsConnection::CallSsl(Call call, core::IoResult* result) {
  while (true) {
    ERR_clear_error();
    int ret = call();

    if (transport_ && FlushTransport() == core::IoResult::kError) {
      *result = core::IoResult::kError;
      return -1;
    }
    if (ret > 0) {
      *result = core::IoResult::kOk;
      return ret;
    }

    int err = SSL_get_error(ssl_.get(), ret);
    if (!transport_ ||
        (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE)) {
      *result = HandleSslError(ret);
      return ret;
    }

    if (err == SSL_ERROR_WANT_WRITE) {
      // The pair was drained into transport_out_
      continue;
    }

    core::IoResult filled = FillTransport();
    switch (filled) {
      case core::IoResult::kOk:
        continue;

      case core::IoResult::kEof:
        if (transport_eof_) {
          *result = core::IoResult::kEof;
          state_ = TlsState::kClosed;
          return 0;
        }
        // Lets the SSL object see the end of the stream
        transport_eof_ = true;
        BIO_shutdown_wr(transport_bio_.get());
        continue;

      case core::IoResult::kError:
        *result = core::IoResult::kError;
        return -1;

      default:
        // Unsent records need writability before anything can come back
        *result = HasPendingOutput() ? core::IoResult::kWantWrite : filled;
        return -1;
    }
  }
}

core::IoResult TlsConnection::Handshake() {
  if (state_ == TlsState::kConnected) {
    return core::IoResult::kOk;
  }

  if (state_ != TlsState::kHandshaking) {
    if (last_error_.empty()) {
      SetError("Invalid state for handshake");
    }
    return core::IoResult::kError;
  }

  core::IoResult result;
  int ret = CallSsl([this] { return SSL_do_handshake(ssl_.get()); }, &result);

  if (ret == 1) {
    state_ = TlsState::kConnected;
    SPDLOG_DEBUG("tls: handshake with {} complete (alpn '{}'{})", servername_,
                 AlpnProtocol(), layered() ? ", inside tunnel" : "");
    return core::IoResult::kOk;
  }

  if (result == core::IoResult::kEof) {
    SetError("Connection closed during TLS handshake");
    return core::IoResult::kError;
  }
  return result;
}

ssize_t TlsConnection::Read(uint8_t* dest, size_t max_len,
                            core::IoResult* result) {
  if (state_ != TlsState::kConnected) {
    *result = core::IoResult::kError;
    return -1;
  }

  int to_read = static_cast<int>(std::min(max_len, kMaxRecordSize));
  int ret = CallSsl([&] { return SSL_read(ssl_.get(), dest, to_read); },
                    result);

  if (ret > 0) {
    return ret;
  }
  if (*result == core::IoResult::kEof) {
    return 0;
  }
  return -1;
}

core::IoResult TlsConnection::Write(const uint8_t* data, size_t len,
                                    size_t* written) {
  *written = 0;
  if (state_ != TlsState::kConnected) {
    return core::IoResult::kError;
  }

  // New records wait until the transport took the previous ones
  if (HasPendingOutput()) {
    core::IoResult flushed = Flush();
    if (flushed != core::IoResult::kOk) {
      return flushed;
    }
  }
  if (len == 0) {
    return core::IoResult::kOk;
  }

  // Caller should call again if more data needs to be written.
  int to_write = static_cast<int>(std::min(len, kMaxRecordSize));
  core::IoResult result;
  int ret = CallSsl([&] { return SSL_write(ssl_.get(), data, to_write); },
                    &result);

  if (ret > 0) {
    *written = static_cast<size_t>(ret);
    return (*written < len) ? core::IoResult::kWantWrite
                            : core::IoResult::kOk;
  }
  return result;
}

core::IoResult TlsConnection::Flush() {
  if (!transport_) {
    return core::IoResult::kOk;
  }
  return FlushTransport();
}

void TlsConnection::Shutdown() {
  if (state_ != TlsState::kConnected) {
    return;
  }

  state_ = TlsState::kShuttingDown;
  ERR_clear_error();
  if (SSL_shutdown(ssl_.get()) >= 0) {
    state_ = TlsState::kClosed;
  }

  if (transport_) {
    // close_notify for the target, then for the proxy
    if (FlushTransport() != core::IoResult::kError) {
      transport_->Shutdown();
    }
  }
}

std::string_view TlsConnection::AlpnProtocol() const {
  if (!ssl_ || state_ != TlsState::kConnected) {
    return "";
  }

  const unsigned char* proto = nullptr;
  unsigned int proto_len = 0;
  SSL_get0_alpn_selected(ssl_.get(), &proto, &proto_len);

  if (proto == nullptr) {
    return "";
  }
  return {reinterpret_cast<const char*>(proto), proto_len};
}

core::IoResult TlsConnection::FlushTransport() {
  char buf[kMaxRecordSize];
  while (true) {
    int n = BIO_read(transport_bio_.get(), buf, static_cast<int>(sizeof(buf)));
    if (n <= 0) {
      break;
    }
    transport_out_.append(buf, static_cast<size_t>(n));
  }

  while (!transport_out_.empty()) {
    size_t written = 0;
    core::IoResult io = transport_->Write(
        reinterpret_cast<const uint8_t*>(transport_out_.data()),
        transport_out_.size(), &written);
    transport_out_.erase(0, written);

    if (io == core::IoResult::kError || io == core::IoResult::kEof) {
      SetError("Tunnel write failed: " + transport_->last_error());
      return core::IoResult::kError;
    }
    if (written == 0) {
      return core::IoResult::kWantWrite;
    }
  }
  return core::IoResult::kOk;
}

core::IoResult TlsConnection::FillTransport() {
  if (transport_eof_) {
    return core::IoResult::kEof;
  }

  size_t room = BIO_ctrl_get_write_guarantee(transport_bio_.get());
  if (room == 0) {
    return core::IoResult::kWantRead;
  }

  uint8_t buf[kMaxRecordSize];
  core::IoResult io;
  ssize_t n = transport_->Read(buf, std::min(room, sizeof(buf)), &io);
  if (n > 0) {
    BIO_write(transport_bio_.get(), buf, static_cast<int>(n));
    return core::IoResult::kOk;
  }
  if (n == 0) {
    return core::IoResult::kEof;
  }
  if (io == core::IoResult::kError) {
    SetError("Tunnel read failed: " + transport_->last_error());
    return core::IoResult::kError;
  }
  return io;
}

core::IoResult TlsConnection::HandleSslError(int ssl_ret) {
  int err = SSL_get_error(ssl_.get(), ssl_ret);

  switch (err) {
    case SSL_ERROR_WANT_READ:
      return core::IoResult::kWantRead;

    case SSL_ERROR_WANT_WRITE:
      return core::IoResult::kWantWrite;

    case SSL_ERROR_ZERO_RETURN:
      // Clean shutdown
      state_ = TlsState::kClosed;
      return core::IoResult::kEof;

    case SSL_ERROR_SYSCALL: {
      // EOF without close_notify
      if (ssl_ret == 0) {
        state_ = TlsState::kClosed;
        return core::IoResult::kEof;
      }
      SetError("SSL syscall error: " + util::GetLastSocketErrorString());
      return core::IoResult::kError;
    }

    case SSL_ERROR_SSL: {
      // Protocol error
      unsigned long openssl_err = ERR_get_error();
      char err_buf[256];
      ERR_error_string_n(openssl_err, err_buf, sizeof(err_buf));
      SetError(std::string("SSL error: ") + err_buf);
      return core::IoResult::kError;
    }

    default:
      SetError("Unknown SSL error");
      return core::IoResult::kError;
  }
}

void TlsConnection::SetError(const std::string& msg) {
  state_ = TlsState::kError;
  last_error_ = msg;
}

}  // namespace tls
}  // namespace tunnelpool
