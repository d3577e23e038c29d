// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_POOL_SOCKET_MEMBER_H_
#define TUNNELPOOL_POOL_SOCKET_MEMBER_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tunnelpool/config.h"
#include "tunnelpool/core/byte_stream.h"
#include "tunnelpool/core/reactor.h"
#include "tunnelpool/core/timer.h"
#include "tunnelpool/http1/request_framer.h"
#include "tunnelpool/pool/pool_member.h"
#include "tunnelpool/proxy/tunnel_negotiator.h"
#include "tunnelpool/util/url_parser.h"

namespace tunnelpool {
namespace pool {

enum class SocketState {
  kIdle,         // No socket
  kConnecting,   // TCP connect in progress
  kNegotiating,  // Proxy tunnel and/or TLS handshake
  kConnected,
  kClosing,      // Finishing in-flight work before a graceful close
  kClosed,
  kError,
};

const char* SocketStateName(SocketState state);

struct SocketMemberOptions {
  std::string origin;  // "https://example.com:8443"
  ProxyConfig proxy;   // Connect() then targets the proxy
  PoolConfig config;

  // TLS for https origins and https proxies; not owned
  core::StreamFactory* tls = nullptr;

  // Non-fatal conditions, e.g. a lenient content-length mismatch
  std::function<void(const Error&)> on_warning;
};

// PoolMember over one non-blocking socket driven by the reactor.
//
// Requests accepted before the socket is usable wait in a local queue.
// Writes go through a RequestFramer; response bytes are relayed unparsed to
// the oldest running request's OnData, and the response layer reports
// DeliverHeaders/FinishResponse back.
//
// on_closed and on_destroyed callbacks are posted to the reactor, so the
// owner may delete the member from them.
//
// NOT thread-safe - use from the reactor thread only.
class SocketMember : public PoolMember,
                     public core::EventHandler,
                     public http1::FrameSink {
 public:
  static constexpr size_t kHighWaterMark = 64 * 1024;
  static constexpr size_t kReadChunkSize = 16384;

  SocketMember(core::Reactor* reactor, SocketMemberOptions options);
  ~SocketMember() override;

  // Starts a non-blocking connect to a literal address (the proxy's when
  // proxied). Remembered for reconnects.
  Error Connect(std::string_view ip, uint16_t port);

  // Adopts a connected socket; negotiation still runs. No reconnects.
  Error Attach(util::socket_t fd);

  // PoolMember
  bool Dispatch(DispatchRequest request) override;
  void Close(std::function<void()> on_closed) override;
  void Destroy(const Error& error,
               std::function<void()> on_destroyed) override;
  bool CanConnect() const override;

  // Response side. Headers of the oldest running request.
  void DeliverHeaders(int status, const Headers& headers);

  // Completes the oldest running request. keep_alive_hint_ms is the server's
  // Keep-Alive timeout, 0 when it sent none.
  void FinishResponse(const Headers& trailers, uint64_t keep_alive_hint_ms = 0);

  // Re-arms reading after OnData or OnHeaders asked to pause.
  void Resume();

  // core::EventHandler
  int fd() const override { return fd_; }
  void OnReadable() override;
  void OnWritable() override;
  void OnError(int error_code) override;
  void OnClose() override {}

  // http1::FrameSink
  bool WriteBytes(std::string_view data) override;
  void RefreshTimeout(core::TimeoutKind kind) override;
  void SetWriting(bool writing) override { writing_body_ = writing; }
  void OnFrameFinished() override { frame_finished_ = true; }
  bool IsDestroyed() const override { return destroyed() || !stream_; }
  size_t in_flight() const override { return pending_ + running_; }
  size_t pipelining() const override;

  SocketState state() const { return state_; }
  bool forwarding() const { return forwarding_; }
  bool paused() const { return paused_; }
  std::optional<core::TimeoutKind> armed_timeout() const;
  uint64_t keep_alive_timeout_ms() const { return keep_alive_.timeout_ms(); }
  size_t buffered_bytes() const { return out_buf_.size() - out_offset_; }
  const SocketInfo& socket_info() const { return socket_info_; }

 private:
  struct Exchange {
    uint64_t id;
    DispatchRequest request;
    std::unique_ptr<http1::RequestFramer> framer;
    bool throw_on_error = false;
    bool failed = false;  // Terminal callback already delivered
  };
  using ExchangePtr = std::unique_ptr<Exchange>;

  // Connection setup
  Error StartConnect();
  void BeginNegotiation();
  void HandleNegotiation(proxy::TunnelResult result);
  void OnReady();
  void FailConnection(const Error& error);

  // Request flow
  void Pump();
  void StartRequest(ExchangePtr exchange);
  void PumpBody();
  void FinishWrite();
  http1::FrameOptions BuildFrameOptions(const DispatchOptions& options) const;
  void OnAbort(uint64_t id, const Error& reason);
  Exchange* ResponseTarget();

  // Socket I/O
  bool FlushOut();
  void ReadSome();
  void UpdateInterest();

  // Teardown
  void DestroySocket(const Error& error);
  void CloseTransport();
  void MaybeFinishClose();
  void FailQueued(const Error& error);
  void MaybeEmitDrained();

  // Timers
  void ArmTimeout(core::TimeoutKind kind);
  void StopTimeout();
  void OnTimeout(core::TimeoutKind kind);
  void EnterIdle();

  SocketInfo CurrentSocketInfo() const;

  core::Reactor* reactor_;
  SocketMemberOptions options_;
  util::ParsedUrl target_;
  std::string host_header_;
  Error setup_error_;  // Unusable origin

  SocketState state_ = SocketState::kIdle;
  util::socket_t fd_ = util::kInvalidSocket;
  bool owns_fd_ = false;  // Raw socket before negotiation takes it
  bool registered_ = false;
  core::EventType interest_ = core::EventType::kNone;

  std::string connect_ip_;
  uint16_t connect_port_ = 0;
  bool attached_ = false;

  std::unique_ptr<proxy::ProxyTunnelNegotiator> negotiator_;
  std::unique_ptr<core::ByteStream> stream_;
  bool forwarding_ = false;

  // Request pipeline: queue_ -> writing_ -> inflight_
  std::deque<ExchangePtr> queue_;
  ExchangePtr writing_;
  std::deque<ExchangePtr> inflight_;
  uint64_t next_exchange_id_ = 1;
  bool writing_body_ = false;
  bool frame_finished_ = false;
  bool body_blocked_ = false;

  std::string out_buf_;
  size_t out_offset_ = 0;
  bool paused_ = false;
  bool reset_after_response_ = false;

  core::Timer connect_timer_;
  core::Timer timer_;
  std::optional<core::TimeoutKind> armed_kind_;
  core::KeepAlivePolicy keep_alive_;
  uint64_t idle_since_ms_ = 0;

  SocketInfo socket_info_;

  std::function<void()> on_closed_;

  // Outlives callbacks handed to requests and the reactor
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace pool
}  // namespace tunnelpool

#endif  // TUNNELPOOL_POOL_SOCKET_MEMBER_H_
