// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/proxy/socks_proxy.h"
#include "tunnelpool/proxy/socks_constants.h"
#include "tunnelpool/config.h"

#include <cassert>
#include <print>
#include <string>

#include "scripted_stream.h"

using namespace tunnelpool;
using namespace tunnelpool::proxy;
using tunnelpool::testing::Bytes;
using tunnelpool::testing::ScriptedStream;

namespace {

ProxyConfig Socks(ProxyType type, std::string user = "",
                  std::string pass = "") {
  ProxyConfig config;
  config.type = type;
  config.host = "proxy.local";
  config.port = 1080;
  config.username = std::move(user);
  config.password = std::move(pass);
  return config;
}

// Reply with an IPv4 bound address
const std::vector<uint8_t> kSocks5Ok = {0x05, 0x00, 0x00, 0x01, 0, 0,
                                        0,    0,    0x00, 0x00};

}  // namespace

void TestSocks5NoAuthDomain() {
  std::print("Testing SOCKS5 no-auth with domain target... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "example.com", 443);
  assert(!tunnel.IsConnected());
  assert(!tunnel.HasError());

  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(tunnel.WantsWrite());
  assert(!tunnel.WantsRead());

  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  assert(stream.TakeWritten() == Bytes({0x05, 0x01, 0x00}));
  assert(tunnel.socks5_state() == Socks5State::kReadingAuthMethod);

  // Nothing from the proxy yet
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantRead);

  stream.Feed({0x05, 0x00});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantWrite);
  assert(tunnel.socks5_state() == Socks5State::kSendingConnect);

  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  assert(stream.TakeWritten() == Bytes({0x05, 0x01, 0x00, 0x03, 11}) +
                                     "example.com" + Bytes({0x01, 0xBB}));

  stream.Feed(kSocks5Ok);
  stream.FeedText("tunnel-bytes");
  assert(tunnel.OnReadable(&stream) == TunnelResult::kOk);
  assert(tunnel.IsConnected());

  // The reply is consumed exactly
  assert(stream.Unread() == "tunnel-bytes");

  std::println("PASSED");
}

void TestSocks5PasswordAuth() {
  std::print("Testing SOCKS5 username/password auth... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5, "user", "pass"),
                          "example.com", 80);

  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  assert(stream.TakeWritten() == Bytes({0x05, 0x02, 0x00, 0x02}));

  stream.Feed({0x05, 0x02});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantWrite);
  assert(tunnel.socks5_state() == Socks5State::kSendingAuth);

  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  assert(stream.TakeWritten() ==
         Bytes({0x01, 4}) + "user" + Bytes({4}) + "pass");

  stream.Feed({0x01, 0x00});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantWrite);
  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  stream.TakeWritten();

  stream.Feed(kSocks5Ok);
  assert(tunnel.OnReadable(&stream) == TunnelResult::kOk);

  std::println("PASSED");
}

void TestSocks5AuthRejected() {
  std::print("Testing SOCKS5 rejected credentials... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5, "user", "wrong"),
                          "example.com", 80);
  tunnel.Start();
  tunnel.OnWritable(&stream);
  stream.Feed({0x05, 0x02});
  tunnel.OnReadable(&stream);
  tunnel.OnWritable(&stream);

  stream.Feed({0x01, 0x01});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kError);
  assert(tunnel.HasError());
  assert(tunnel.error().code() == ErrorCode::kTunnelError);

  std::println("PASSED");
}

void TestSocks5NoAcceptableMethod() {
  std::print("Testing SOCKS5 no acceptable method fails before CONNECT... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "example.com", 443);
  tunnel.Start();
  tunnel.OnWritable(&stream);
  assert(stream.TakeWritten() == Bytes({0x05, 0x01, 0x00}));

  stream.Feed({0x05, 0xFF});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kError);
  assert(tunnel.HasError());
  assert(tunnel.error().code() == ErrorCode::kTunnelError);
  assert(tunnel.error().status() == 0xFF);
  assert(tunnel.error().message() ==
         "SOCKS5 proxy: no acceptable authentication method");

  // No CONNECT request was sent
  assert(stream.TakeWritten().empty());
  assert(!tunnel.WantsWrite());

  std::println("PASSED");
}

void TestSocks5ConnectRefused() {
  std::print("Testing SOCKS5 connect failure reply... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "example.com", 443);
  tunnel.Start();
  tunnel.OnWritable(&stream);
  stream.Feed({0x05, 0x00});
  tunnel.OnReadable(&stream);
  tunnel.OnWritable(&stream);

  stream.Feed({0x05, socks5::kRepConnectionRefused, 0x00, 0x01});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kError);
  assert(tunnel.error().status() == 0x05);
  assert(tunnel.error().message() ==
         "SOCKS5 connect failed: connection refused");

  std::println("PASSED");
}

void TestSocks5IpTargets() {
  std::print("Testing SOCKS5 IP literal targets go out as names... ");

  {
    ScriptedStream stream;
    SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "10.1.2.3", 8080);
    tunnel.Start();
    tunnel.OnWritable(&stream);
    stream.TakeWritten();
    stream.Feed({0x05, 0x00});
    tunnel.OnReadable(&stream);
    tunnel.OnWritable(&stream);
    assert(stream.TakeWritten() == Bytes({0x05, 0x01, 0x00, 0x03, 8}) +
                                       "10.1.2.3" + Bytes({0x1F, 0x90}));
  }

  {
    ScriptedStream stream;
    SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "::1", 443);
    tunnel.Start();
    tunnel.OnWritable(&stream);
    stream.TakeWritten();
    stream.Feed({0x05, 0x00});
    tunnel.OnReadable(&stream);
    tunnel.OnWritable(&stream);

    assert(stream.TakeWritten() ==
           Bytes({0x05, 0x01, 0x00, 0x03, 3}) + "::1" + Bytes({0x01, 0xBB}));
  }

  std::println("PASSED");
}

void TestSocks5BoundAddressForms() {
  std::print("Testing SOCKS5 bound address forms are skipped... ");

  // Domain bound address, delivered in pieces
  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "example.com", 443);
  tunnel.Start();
  tunnel.OnWritable(&stream);
  stream.Feed({0x05, 0x00});
  tunnel.OnReadable(&stream);
  tunnel.OnWritable(&stream);

  stream.Feed({0x05, 0x00, 0x00});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantRead);
  stream.Feed({0x03, 4, 'h', 'o'});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantRead);
  stream.Feed({'s', 't', 0x00, 0x50});
  stream.FeedText("GET");
  assert(tunnel.OnReadable(&stream) == TunnelResult::kOk);
  assert(stream.Unread() == "GET");

  // IPv6 bound address
  ScriptedStream stream6;
  SocksProxyTunnel tunnel6(Socks(ProxyType::kSocks5), "example.com", 443);
  tunnel6.Start();
  tunnel6.OnWritable(&stream6);
  stream6.Feed({0x05, 0x00});
  tunnel6.OnReadable(&stream6);
  tunnel6.OnWritable(&stream6);

  std::vector<uint8_t> reply = {0x05, 0x00, 0x00, 0x04};
  reply.resize(4 + 16 + 2, 0);
  stream6.Feed(reply);
  assert(tunnel6.OnReadable(&stream6) == TunnelResult::kOk);
  assert(stream6.Unread().empty());

  std::println("PASSED");
}

void TestSocks4Ipv4() {
  std::print("Testing SOCKS4 with IPv4 target... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks4, "alice"), "127.0.0.1", 80);

  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(tunnel.socks4_state() == Socks4State::kSendingConnect);
  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  // Credentials never reach the USERID field
  assert(stream.TakeWritten() ==
         Bytes({0x04, 0x01, 0x00, 80, 127, 0, 0, 1, 0}));

  stream.Feed({0x00, 0x5A, 0, 0, 0, 0, 0, 0});
  stream.FeedText("payload");
  assert(tunnel.OnReadable(&stream) == TunnelResult::kOk);
  assert(tunnel.IsConnected());
  assert(stream.Unread() == "payload");

  std::println("PASSED");
}

void TestSocks4aHostname() {
  std::print("Testing SOCKS4a with hostname target... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks4), "example.com", 443);

  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(tunnel.OnWritable(&stream) == TunnelResult::kWantRead);
  assert(stream.TakeWritten() ==
         Bytes({0x04, 0x01, 0x01, 0xBB, 0, 0, 0, 1, 0}) + "example.com" +
             Bytes({0}));

  // Partial reply
  stream.Feed({0x00, 0x5A, 0, 0});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kWantRead);
  stream.Feed({0, 0, 0, 0});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kOk);

  std::println("PASSED");
}

void TestSocks4Rejected() {
  std::print("Testing SOCKS4 rejected reply... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks4), "example.com", 443);
  tunnel.Start();
  tunnel.OnWritable(&stream);

  stream.Feed({0x00, 0x5B, 0, 0, 0, 0, 0, 0});
  assert(tunnel.OnReadable(&stream) == TunnelResult::kError);
  assert(tunnel.HasError());
  assert(tunnel.error().status() == 0x5B);
  assert(tunnel.error().message() ==
         "SOCKS4 connect failed: request rejected or failed");

  std::println("PASSED");
}

void TestSocks4Ipv6Unsupported() {
  std::print("Testing SOCKS4 rejects IPv6 targets... ");

  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks4), "2001:db8::1", 443);
  assert(tunnel.Start() == TunnelResult::kError);
  assert(tunnel.HasError());
  assert(tunnel.error().code() == ErrorCode::kTunnelError);

  std::println("PASSED");
}

void TestProxyClosesEarly() {
  std::print("Testing proxy closing mid-handshake... ");

  ScriptedStream stream;
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "example.com", 443);
  tunnel.Start();
  tunnel.OnWritable(&stream);

  stream.Feed({0x05});
  stream.Close();
  assert(tunnel.OnReadable(&stream) == TunnelResult::kError);
  assert(tunnel.error().message() == "SOCKS proxy closed connection");

  std::println("PASSED");
}

void TestPartialWrites() {
  std::print("Testing partial writes... ");

  ScriptedStream stream;
  stream.LimitWrites(2);
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks4), "example.com", 443);
  tunnel.Start();

  // 21 request bytes, two per write call; flushing continues while the
  // stream makes progress
  int calls = 0;
  TunnelResult result;
  do {
    result = tunnel.OnWritable(&stream);
    ++calls;
  } while (result == TunnelResult::kWantWrite);
  assert(result == TunnelResult::kWantRead);
  assert(calls == 1);
  assert(stream.TakeWritten().size() == 21);

  std::println("PASSED");
}

void TestWriteFailure() {
  std::print("Testing write failure... ");

  ScriptedStream stream;
  stream.FailWrites();
  SocksProxyTunnel tunnel(Socks(ProxyType::kSocks5), "example.com", 443);
  tunnel.Start();
  assert(tunnel.OnWritable(&stream) == TunnelResult::kError);
  assert(tunnel.error().code() == ErrorCode::kTunnelError);

  std::println("PASSED");
}

int main() {
  std::println("=== SOCKS Proxy Unit Tests ===");

  TestSocks5NoAuthDomain();
  TestSocks5PasswordAuth();
  TestSocks5AuthRejected();
  TestSocks5NoAcceptableMethod();
  TestSocks5ConnectRefused();
  TestSocks5IpTargets();
  TestSocks5BoundAddressForms();
  TestSocks4Ipv4();
  TestSocks4aHostname();
  TestSocks4Rejected();
  TestSocks4Ipv6Unsupported();
  TestProxyClosesEarly();
  TestPartialWrites();
  TestWriteFailure();

  std::println("\nAll SOCKS proxy tests passed!");
  return 0;
}
