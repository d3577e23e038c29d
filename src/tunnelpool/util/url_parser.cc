// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/util/url_parser.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tunnelpool {
namespace util {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string ParsedUrl::HostPort() const {
  std::string out;
  if (host.find(':') != std::string::npos) {
    out = "[" + host + "]";
  } else {
    out = host;
  }
  return out + ":" + std::to_string(port);
}

std::string ParsedUrl::PathWithQuery() const {
  if (query.empty()) {
    return path;
  }
  return path + "?" + query;
}

uint16_t DefaultPort(std::string_view scheme) {
  if (scheme == "https") return 443;
  if (scheme == "http") return 80;
  if (scheme == "socks4" || scheme == "socks5") return 1080;
  return 0;
}

bool PercentDecode(std::string_view in, std::string* out) {
  out->clear();
  out->reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      out->push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size()) {
      return false;
    }
    int hi = HexValue(in[i + 1]);
    int lo = HexValue(in[i + 2]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out->push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return true;
}

bool ParseUrl(std::string_view url, ParsedUrl* result) {
  if (result == nullptr) {
    return false;
  }
  *result = ParsedUrl{};

  std::string_view remaining = url;

  // Parse scheme
  auto scheme_end = remaining.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return false;
  }
  result->scheme = std::string(remaining.substr(0, scheme_end));
  for (char& c : result->scheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  remaining = remaining.substr(scheme_end + 3);
  result->port = DefaultPort(result->scheme);

  size_t authority_end = std::min(remaining.find('/'), remaining.find('?'));
  if (authority_end == std::string_view::npos) {
    authority_end = remaining.size();
  }

  std::string_view authority = remaining.substr(0, authority_end);

  // Userinfo
  auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    std::string_view userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);

    auto colon = userinfo.find(':');
    std::string_view user = userinfo.substr(0, colon);
    if (!PercentDecode(user, &result->username)) {
      return false;
    }
    if (colon != std::string_view::npos &&
        !PercentDecode(userinfo.substr(colon + 1), &result->password)) {
      return false;
    }
  }

  // Host and port
  std::string_view host = authority;
  std::string_view port_str;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    host = authority.substr(1, close - 1);
    std::string_view rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        return false;
      }
      port_str = rest.substr(1);
    }
  } else {
    auto port_sep = authority.rfind(':');
    if (port_sep != std::string_view::npos) {
      host = authority.substr(0, port_sep);
      port_str = authority.substr(port_sep + 1);
    }
  }

  if (!port_str.empty()) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(),
                                     port_str.data() + port_str.size(), value);
    if (ec != std::errc() || ptr != port_str.data() + port_str.size() ||
        value == 0 || value > 65535) {
      return false;
    }
    result->port = static_cast<uint16_t>(value);
  }
  result->host = std::string(host);

  remaining = remaining.substr(authority_end);

  // Path and query
  auto query_start = remaining.find('?');
  std::string_view path = remaining.substr(0, query_start);
  result->path = path.empty() ? "/" : std::string(path);
  if (query_start != std::string_view::npos) {
    std::string_view query = remaining.substr(query_start + 1);
    result->query = std::string(query.substr(0, query.find('#')));
  }
  auto fragment = result->path.find('#');
  if (fragment != std::string::npos) {
    result->path.resize(fragment);
  }

  return !result->host.empty() && result->port != 0;
}

}  // namespace util
}  // namespace tunnelpool
