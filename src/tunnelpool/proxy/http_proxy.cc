// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/proxy/http_proxy.h"

#include <openssl/evp.h>
#include <picohttpparser.h>

#include <utility>

#include <spdlog/spdlog.h>

#include "tunnelpool/util/socket_utils.h"

namespace tunnelpool {
namespace proxy {

namespace {

constexpr size_t kMaxResponseHeaders = 64;

// host:port, with brackets around IPv6 literals
std::string Authority(std::string_view host, uint16_t port) {
  std::string out;
  if (util::IsIpv6Literal(host)) {
    out += '[';
    out += host;
    out += ']';
  } else {
    out += host;
  }
  out += ':';
  out += std::to_string(port);
  return out;
}

}  // namespace

std::string Base64Encode(std::string_view input) {
  std::string output(4 * ((input.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                          reinterpret_cast<const unsigned char*>(input.data()),
                          static_cast<int>(input.size()));
  output.resize(static_cast<size_t>(n));
  return output;
}

Headers BuildProxyHeaders(const ProxyConfig& proxy) {
  Headers headers;
  if (!proxy.token.empty()) {
    headers.push_back({"proxy-authorization", proxy.token});
  } else if (!proxy.username.empty()) {
    headers.push_back(
        {"proxy-authorization",
         "Basic " + Base64Encode(proxy.username + ":" + proxy.password)});
  }
  headers.insert(headers.end(), proxy.headers.begin(), proxy.headers.end());
  return headers;
}

HttpProxyTunnel::HttpProxyTunnel(std::string_view target_host,
                                 uint16_t target_port,
                                 const ProxyConfig& proxy)
    : target_host_(target_host), target_port_(target_port) {
  BuildRequest(proxy);
  response_buf_.reserve(1024);
}

TunnelResult HttpProxyTunnel::Start() {
  if (state_ != HttpTunnelState::kIdle) {
    return Fail(Error::Tunnel("Tunnel already started"));
  }

  state_ = HttpTunnelState::kSendingRequest;
  request_sent_ = 0;

  return TunnelResult::kWantWrite;
}

TunnelResult HttpProxyTunnel::OnWritable(core::ByteStream* stream) {
  if (state_ != HttpTunnelState::kSendingRequest) {
    return TunnelResult::kError;
  }

  // Send remaining request data
  const auto* data =
      reinterpret_cast<const uint8_t*>(request_.data()) + request_sent_;
  size_t remaining = request_.size() - request_sent_;

  size_t sent = 0;
  core::IoResult result = stream->Write(data, remaining, &sent);
  request_sent_ += sent;

  if (result == core::IoResult::kError) {
    return Fail(Error::Tunnel("Proxy write failed: " + stream->last_error()));
  }
  if (result == core::IoResult::kWantRead) {
    return TunnelResult::kWantRead;
  }

  if (request_sent_ < request_.size()) {
    // More to send
    return TunnelResult::kWantWrite;
  }

  // Request fully sent, wait for response
  state_ = HttpTunnelState::kReadingResponse;
  return TunnelResult::kWantRead;
}

TunnelResult HttpProxyTunnel::OnReadable(core::ByteStream* stream) {
  if (state_ == HttpTunnelState::kSendingRequest) {
    // TLS proxies may need a read to make write progress
    return OnWritable(stream);
  }
  if (state_ != HttpTunnelState::kReadingResponse) {
    return TunnelResult::kError;
  }

  while (true) {
    char buf[1024];
    core::IoResult io;
    ssize_t n = stream->Read(reinterpret_cast<uint8_t*>(buf), sizeof(buf), &io);

    if (n < 0) {
      if (io == core::IoResult::kWantRead) {
        return TunnelResult::kWantRead;
      }
      if (io == core::IoResult::kWantWrite) {
        return TunnelResult::kWantWrite;
      }
      return Fail(Error::Tunnel("Proxy read failed: " + stream->last_error()));
    }

    if (n == 0) {
      return Fail(Error::Tunnel("Proxy closed connection"));
    }

    if (response_buf_.size() + static_cast<size_t>(n) > kMaxResponseSize) {
      return Fail(Error::Tunnel("Proxy response too large"));
    }

    response_buf_.insert(response_buf_.end(), buf, buf + n);

    TunnelResult result = ParseResponse();
    if (result != TunnelResult::kWantRead) {
      return result;
    }
  }
}

void HttpProxyTunnel::BuildRequest(const ProxyConfig& proxy) {
  std::string authority = Authority(target_host_, target_port_);

  request_ = "CONNECT ";
  request_ += authority;
  request_ += " HTTP/1.1\r\n";

  request_ += "host: ";
  request_ += authority;
  request_ += "\r\n";

  for (const auto& [name, value] : BuildProxyHeaders(proxy)) {
    request_ += name;
    request_ += ": ";
    request_ += value;
    request_ += "\r\n";
  }

  request_ += "\r\n";
}

TunnelResult HttpProxyTunnel::ParseResponse() {
  int minor_version = 0;
  int status = 0;
  const char* msg = nullptr;
  size_t msg_len = 0;
  phr_header headers[kMaxResponseHeaders];
  size_t num_headers = kMaxResponseHeaders;

  int ret = phr_parse_response(response_buf_.data(), response_buf_.size(),
                               &minor_version, &status, &msg, &msg_len,
                               headers, &num_headers, 0);

  if (ret == -2) {
    // Haven't received full headers yet
    return TunnelResult::kWantRead;
  }

  if (ret == -1) {
    return Fail(Error::Tunnel("Invalid proxy response"));
  }

  status_code_ = status;

  if (status == 200) {
    if (static_cast<size_t>(ret) != response_buf_.size()) {
      return Fail(Error::Tunnel("Unexpected data after proxy response",
                                status));
    }
    state_ = HttpTunnelState::kConnected;
    SPDLOG_DEBUG("proxy: CONNECT {}:{} established", target_host_,
                 target_port_);
    return TunnelResult::kOk;
  }

  std::string reason;
  switch (status) {
    case 407:
      reason = "Proxy authentication required";
      break;
    case 403:
      reason = "Proxy denied access";
      break;
    case 502:
      reason = "Proxy bad gateway";
      break;
    case 503:
      reason = "Proxy service unavailable";
      break;
    default:
      reason = "Proxy returned status " + std::to_string(status);
      break;
  }

  return Fail(Error::Tunnel("Proxy connect failed: " + reason, status));
}

TunnelResult HttpProxyTunnel::Fail(Error error) {
  spdlog::error("proxy: CONNECT {}:{}: {}", target_host_, target_port_,
                error.ToString());
  error_ = std::move(error);
  state_ = HttpTunnelState::kError;
  return TunnelResult::kError;
}

}  // namespace proxy
}  // namespace tunnelpool
