// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/tls/tls_context.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <stdexcept>
#include <utility>

#include "tunnelpool/tls/tls_connection.h"

namespace tunnelpool {
namespace tls {

TlsContextFactory::TlsContextFactory(const TlsConfig& config)
    : config_(config) {
  // Create TLS client context
  ctx_.reset(SSL_CTX_new(TLS_client_method()));
  if (!ctx_) {
    throw std::runtime_error("Failed to create SSL_CTX");
  }

  ConfigureProtocolVersions();
  ConfigureAlpn();
  ConfigureCertificateVerification();

  // Sessions are not reused across connections
  SSL_CTX_set_session_cache_mode(ctx_.get(), SSL_SESS_CACHE_OFF);
}

TlsContextFactory::~TlsContextFactory() = default;

SSL* TlsContextFactory::CreateSsl() { return SSL_new(ctx_.get()); }

std::unique_ptr<core::ByteStream> TlsContextFactory::CreateTlsStream(
    util::socket_t fd, std::string_view servername) {
  return std::make_unique<TlsConnection>(this, fd, servername);
}

std::unique_ptr<core::ByteStream> TlsContextFactory::CreateTlsStream(
    std::unique_ptr<core::ByteStream> transport, std::string_view servername) {
  return std::make_unique<TlsConnection>(this, std::move(transport),
                                         servername);
}

void TlsContextFactory::ConfigureProtocolVersions() {
  if (SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION) != 1) {
    throw std::runtime_error("Failed to set minimum TLS version");
  }
}

void TlsContextFactory::ConfigureAlpn() {
  // The transport frames HTTP/1.1 only
  static const unsigned char kAlpnProtos[] = {
      8, 'h', 't', 't', 'p', '/', '1', '.', '1'
  };

  // Returns 0 on success
  if (SSL_CTX_set_alpn_protos(ctx_.get(), kAlpnProtos, sizeof(kAlpnProtos)) !=
      0) {
    throw std::runtime_error("Failed to set ALPN protocols");
  }
}

void TlsContextFactory::ConfigureCertificateVerification() {
  if (!config_.verify_certificates) {
    SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_NONE, nullptr);
    return;
  }

  SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);

  if (!config_.ca_bundle_path.empty()) {
    if (SSL_CTX_load_verify_locations(
            ctx_.get(), config_.ca_bundle_path.c_str(), nullptr) != 1) {
      throw std::runtime_error("Failed to load CA certificates from: " +
                               config_.ca_bundle_path);
    }
    return;
  }

  // Default CA paths (/etc/ssl/certs, etc.)
  if (SSL_CTX_set_default_verify_paths(ctx_.get()) != 1) {
    throw std::runtime_error("Failed to set default CA paths");
  }
}

}  // namespace tls
}  // namespace tunnelpool
