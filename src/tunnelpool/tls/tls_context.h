// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_TLS_TLS_CONTEXT_H_
#define TUNNELPOOL_TLS_TLS_CONTEXT_H_

#include <openssl/ssl.h>

#include <memory>
#include <string>
#include <string_view>

#include "tunnelpool/config.h"
#include "tunnelpool/core/byte_stream.h"

namespace tunnelpool {
namespace tls {

// Custom deleters for OpenSSL types
struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) {
    if (ctx != nullptr) {
      SSL_CTX_free(ctx);
    }
  }
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

// Client TLS context shared by every connection of a pool. Produces
// TlsConnection streams for proxy and target handshakes.
class TlsContextFactory : public core::StreamFactory {
 public:
  // Throws std::runtime_error if the context cannot be configured.
  explicit TlsContextFactory(const TlsConfig& config);
  ~TlsContextFactory() override;

  // Non-copyable, non-movable
  TlsContextFactory(const TlsContextFactory&) = delete;
  TlsContextFactory& operator=(const TlsContextFactory&) = delete;
  TlsContextFactory(TlsContextFactory&&) = delete;
  TlsContextFactory& operator=(TlsContextFactory&&) = delete;

  SSL_CTX* ctx() const { return ctx_.get(); }
  bool verify_certificates() const { return config_.verify_certificates; }

  // Create a new SSL object for a connection
  SSL* CreateSsl();

  std::unique_ptr<core::ByteStream> CreateTlsStream(
      util::socket_t fd, std::string_view servername) override;
  std::unique_ptr<core::ByteStream> CreateTlsStream(
      std::unique_ptr<core::ByteStream> transport,
      std::string_view servername) override;

 private:
  void ConfigureProtocolVersions();
  void ConfigureAlpn();
  void ConfigureCertificateVerification();

  SslCtxPtr ctx_;
  TlsConfig config_;
};

}  // namespace tls
}  // namespace tunnelpool

#endif  // TUNNELPOOL_TLS_TLS_CONTEXT_H_
