// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_UTIL_URL_PARSER_H_
#define TUNNELPOOL_UTIL_URL_PARSER_H_

#include <cstdint>
#include <string>
#include <string_view>

namespace tunnelpool {
namespace util {

// Parsed URL components
struct ParsedUrl {
  std::string scheme;    // "https"
  std::string username;  // Percent-decoded userinfo
  std::string password;
  std::string host;      // "example.com" (IPv6 without brackets)
  uint16_t port = 0;     // Explicit port or the scheme default
  std::string path;      // "/api/v1/resource"
  std::string query;     // "foo=bar"

  // host:port, with IPv6 hosts bracketed
  std::string HostPort() const;

  // Full path including query (for HTTP request)
  std::string PathWithQuery() const;

  bool IsHttps() const { return scheme == "https"; }
};

// Default port for http, https, socks4 and socks5; 0 otherwise.
uint16_t DefaultPort(std::string_view scheme);

// Parse a URL string of the form scheme://[user[:pass]@]host[:port][/path]
// Returns false if URL is invalid
bool ParseUrl(std::string_view url, ParsedUrl* result);

// Decode %XX escapes. Returns false on a malformed escape.
bool PercentDecode(std::string_view in, std::string* out);

}  // namespace util
}  // namespace tunnelpool

#endif  // TUNNELPOOL_UTIL_URL_PARSER_H_
