// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_TLS_TLS_CONNECTION_H_
#define TUNNELPOOL_TLS_TLS_CONNECTION_H_

#include <openssl/ssl.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "tunnelpool/core/byte_stream.h"
#include "tunnelpool/tls/tls_context.h"

namespace tunnelpool {
namespace tls {

// SSL object deleter
struct SslDeleter {
  void operator()(SSL* ssl) {
    if (ssl != nullptr) {
      SSL_free(ssl);
    }
  }
};

using SslPtr = std::unique_ptr<SSL, SslDeleter>;

struct BioDeleter {
  void operator()(BIO* bio) {
    if (bio != nullptr) {
      BIO_free(bio);
    }
  }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

enum class TlsState {
  kHandshaking,
  kConnected,
  kShuttingDown,
  kClosed,
  kError,
};

// Client TLS stream with non-blocking I/O. Owns either the socket or the
// transport stream it runs inside; in the latter case records travel through
// a BIO pair and fd() is the transport's socket.
class TlsConnection : public core::ByteStream {
 public:
  TlsConnection(TlsContextFactory* factory, util::socket_t fd,
                std::string_view servername);
  TlsConnection(TlsContextFactory* factory,
                std::unique_ptr<core::ByteStream> transport,
                std::string_view servername);
  ~TlsConnection() override;

  // Non-copyable, non-movable
  TlsConnection(const TlsConnection&) = delete;
  TlsConnection& operator=(const TlsConnection&) = delete;
  TlsConnection(TlsConnection&&) = delete;
  TlsConnection& operator=(TlsConnection&&) = delete;

  util::socket_t fd() const override {
    return transport_ ? transport_->fd() : fd_;
  }

  // Returns kOk when complete, kWantRead/kWantWrite when I/O needed.
  core::IoResult Handshake() override;

  ssize_t Read(uint8_t* dest, size_t max_len,
               core::IoResult* result) override;

  // Single SSL_write per call, capped at one record.
  core::IoResult Write(const uint8_t* data, size_t len,
                       size_t* written) override;

  core::IoResult Flush() override;
  bool HasPendingOutput() const override {
    return !transport_out_.empty();
  }

  // Best-effort close_notify; the socket is closed by the destructor.
  void Shutdown() override;

  bool secure() const override { return true; }
  const std::string& last_error() const override { return last_error_; }

  TlsState state() const { return state_; }
  const std::string& servername() const { return servername_; }
  bool layered() const { return transport_ != nullptr; }

  // Negotiated ALPN protocol, empty before the handshake completes
  std::string_view AlpnProtocol() const;

 private:
  void Configure(TlsContextFactory* factory);

  // Runs one SSL call, moving records to and from the transport as needed.
  template <typename Call>
  int CallSsl(Call call, core::IoResult* result);

  // Transport side of the BIO pair
  core::IoResult FlushTransport();
  core::IoResult FillTransport();

  core::IoResult HandleSslError(int ssl_ret);
  void SetError(const std::string& msg);

  util::socket_t fd_ = util::kInvalidSocket;
  std::string servername_;
  SslPtr ssl_;
  std::unique_ptr<core::ByteStream> transport_;
  BioPtr transport_bio_;
  std::string transport_out_;  // Records not yet taken by the transport
  bool transport_eof_ = false;
  TlsState state_ = TlsState::kHandshaking;
  std::string last_error_;
};

}  // namespace tls
}  // namespace tunnelpool

#endif  // TUNNELPOOL_TLS_TLS_CONNECTION_H_
