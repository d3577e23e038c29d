// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/config.h"

#include "tunnelpool/util/url_parser.h"

namespace tunnelpool {

namespace {

// CONNECT request lines are joined with CRLF
bool HasLineBreak(std::string_view text) {
  return text.find_first_of("\r\n") != std::string_view::npos;
}

}  // namespace

const char* ProxyTypeName(ProxyType type) {
  switch (type) {
    case ProxyType::kNone:
      return "none";
    case ProxyType::kHttp:
      return "http";
    case ProxyType::kHttps:
      return "https";
    case ProxyType::kSocks4:
      return "socks4";
    case ProxyType::kSocks5:
      return "socks5";
  }
  return "unknown";
}

Error ProxyConfig::Validate() const {
  if (!token.empty() && !username.empty()) {
    return Error::InvalidArgument(
        "proxy token cannot be combined with basic credentials");
  }
  if (type == ProxyType::kSocks4 && !password.empty()) {
    return Error::InvalidArgument("SOCKS4 proxies do not support passwords");
  }
  if (HasLineBreak(token)) {
    return Error::InvalidArgument("proxy token contains a line break");
  }
  for (const auto& header : headers) {
    if (header.name.empty() || HasLineBreak(header.name) ||
        header.name.find(':') != std::string::npos) {
      return Error::InvalidArgument("invalid proxy header name");
    }
    if (HasLineBreak(header.value)) {
      return Error::InvalidArgument("proxy header " + header.name +
                                    " contains a line break");
    }
  }
  return {};
}

Error ParseProxyUri(std::string_view uri, ProxyConfig* config) {
  util::ParsedUrl url;
  if (!util::ParseUrl(uri, &url)) {
    return Error::InvalidArgument("Invalid proxy URL");
  }

  if (url.scheme == "http") {
    config->type = ProxyType::kHttp;
  } else if (url.scheme == "https") {
    config->type = ProxyType::kHttps;
  } else if (url.scheme == "socks4") {
    config->type = ProxyType::kSocks4;
  } else if (url.scheme == "socks5") {
    config->type = ProxyType::kSocks5;
  } else {
    return Error::InvalidArgument(
        "Invalid proxy URL protocol: expected http:, https:, socks4: or "
        "socks5:");
  }

  config->host = url.host;
  config->port = url.port;
  config->username = url.username;
  config->password = url.password;
  return config->Validate();
}

}  // namespace tunnelpool
