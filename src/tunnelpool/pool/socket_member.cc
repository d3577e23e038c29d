// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/pool/socket_member.h"

#include <algorithm>
#include <charconv>
#include <utility>

#include <spdlog/spdlog.h>

#include "tunnelpool/proxy/http_proxy.h"
#include "tunnelpool/util/socket_utils.h"

namespace tunnelpool {
namespace pool {

namespace {

bool HeaderNameEquals(std::string_view a, std::string_view b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char x, char y) {
                      if (x >= 'A' && x <= 'Z') x += 32;
                      if (y >= 'A' && y <= 'Z') y += 32;
                      return x == y;
                    });
}

std::optional<uint64_t> ContentLengthHeader(const Headers& headers) {
  for (const auto& [name, value] : headers) {
    if (!HeaderNameEquals(name, "content-length")) {
      continue;
    }
    uint64_t length = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec == std::errc() && ptr == value.data() + value.size()) {
      return length;
    }
  }
  return std::nullopt;
}

}  // namespace

const char* SocketStateName(SocketState state) {
  switch (state) {
    case SocketState::kIdle:
      return "idle";
    case SocketState::kConnecting:
      return "connecting";
    case SocketState::kNegotiating:
      return "negotiating";
    case SocketState::kConnected:
      return "connected";
    case SocketState::kClosing:
      return "closing";
    case SocketState::kClosed:
      return "closed";
    case SocketState::kError:
      return "error";
  }
  return "unknown";
}

SocketMember::SocketMember(core::Reactor* reactor, SocketMemberOptions options)
    : PoolMember(options.origin),
      reactor_(reactor),
      options_(std::move(options)),
      connect_timer_(reactor),
      timer_(reactor),
      keep_alive_(
          static_cast<uint64_t>(options_.config.timeouts.keep_alive.count()),
          static_cast<uint64_t>(
              options_.config.timeouts.keep_alive_max.count()),
          static_cast<uint64_t>(
              options_.config.timeouts.keep_alive_threshold.count())) {
  if (!util::ParseUrl(options_.origin, &target_) ||
      (target_.scheme != "http" && target_.scheme != "https")) {
    setup_error_ = Error::InvalidArgument("invalid origin: " + options_.origin);
    state_ = SocketState::kError;
    return;
  }

  if (target_.port == util::DefaultPort(target_.scheme)) {
    host_header_ = util::IsIpv6Literal(target_.host) ? "[" + target_.host + "]"
                                                      : target_.host;
  } else {
    host_header_ = target_.HostPort();
  }
}

SocketMember::~SocketMember() {
  alive_.reset();
  CloseTransport();

  // Nothing may be left without a terminal callback
  Error error = Error::PoolDestroyed();
  FailQueued(error);
  if (writing_) {
    writing_->request.Fail(error);
  }
  for (auto& exchange : inflight_) {
    exchange->request.Fail(error);
  }
}

size_t SocketMember::pipelining() const {
  return std::max<size_t>(options_.config.pipelining, 1);
}

std::optional<core::TimeoutKind> SocketMember::armed_timeout() const {
  if (!timer_.active()) {
    return std::nullopt;
  }
  return armed_kind_;
}

// =============================================================================
// Connection setup
// =============================================================================

Error SocketMember::Connect(std::string_view ip, uint16_t port) {
  if (setup_error_) {
    return setup_error_;
  }
  if (closed()) {
    return Error::PoolClosed();
  }
  if (state_ != SocketState::kIdle) {
    return Error::InvalidArgument("member already has a socket");
  }
  connect_ip_ = ip;
  connect_port_ = port;
  return StartConnect();
}

Error SocketMember::Attach(util::socket_t fd) {
  if (setup_error_) {
    return setup_error_;
  }
  if (closed()) {
    return Error::PoolClosed();
  }
  if (state_ != SocketState::kIdle) {
    return Error::InvalidArgument("member already has a socket");
  }
  if (!util::SetNonBlocking(fd)) {
    return Error::Socket("Failed to set non-blocking: " +
                         util::GetLastSocketErrorString());
  }

  attached_ = true;
  fd_ = fd;
  owns_fd_ = true;
  state_ = SocketState::kConnecting;
  UpdateInterest();
  return {};
}

Error SocketMember::StartConnect() {
  bool ipv6 = util::IsIpv6Literal(connect_ip_);
  if (!ipv6 && !util::IsIpv4Literal(connect_ip_)) {
    return Error::InvalidArgument("not an IP address: " + connect_ip_);
  }

  util::socket_t sock = util::CreateTcpSocket(ipv6);
  if (sock == util::kInvalidSocket) {
    return Error::Socket("Failed to create socket: " +
                         util::GetLastSocketErrorString());
  }
  util::ConfigureSocket(sock);

  if (util::ConnectNonBlocking(sock, connect_ip_, connect_port_, ipv6) < 0) {
    Error error = Error::Socket("connect failed: " +
                                util::GetLastSocketErrorString());
    util::CloseSocket(sock);
    return error;
  }

  fd_ = sock;
  owns_fd_ = true;
  state_ = SocketState::kConnecting;

  // Completion (even an immediate one) is reported by writability
  UpdateInterest();

  auto timeout =
      static_cast<uint64_t>(options_.config.timeouts.connect.count());
  if (timeout > 0) {
    connect_timer_.Start(timeout, [this] {
      FailConnection(Error::ConnectTimeout("Connect Timeout Error"));
    });
  }

  SPDLOG_DEBUG("member {}: connecting to {}:{}", origin(), connect_ip_,
               connect_port_);
  return {};
}

void SocketMember::BeginNegotiation() {
  state_ = SocketState::kNegotiating;

  proxy::TunnelTarget target{target_.host, target_.port, target_.IsHttps()};
  ProxyConfig proxy = options_.proxy.IsEnabled() ? options_.proxy
                                                 : ProxyConfig{};

  proxy::NegotiatorOptions negotiator_options;
  negotiator_options.on_close = [this](const Error&) {
    if (registered_) {
      reactor_->Remove(this);
      registered_ = false;
      interest_ = core::EventType::kNone;
    }
  };

  negotiator_ = std::make_unique<proxy::ProxyTunnelNegotiator>(
      std::move(proxy), std::move(target), options_.tls,
      std::move(negotiator_options));

  // The negotiator owns the socket from here on
  owns_fd_ = false;
  HandleNegotiation(negotiator_->Start(fd_));
}

void SocketMember::HandleNegotiation(proxy::TunnelResult result) {
  switch (result) {
    case proxy::TunnelResult::kOk:
      stream_ = negotiator_->TakeStream();
      forwarding_ = negotiator_->forwarding();
      negotiator_.reset();
      OnReady();
      return;

    case proxy::TunnelResult::kError: {
      Error error = negotiator_->error();
      negotiator_.reset();
      fd_ = util::kInvalidSocket;
      FailConnection(error);
      return;
    }

    default:
      UpdateInterest();
      return;
  }
}

void SocketMember::OnReady() {
  connect_timer_.Stop();
  state_ = SocketState::kConnected;
  socket_info_ = util::GetSocketInfo(fd_);
  SetConnected(true);
  UpdateInterest();

  SPDLOG_DEBUG("member {}: connected{}", origin(),
               forwarding_ ? " (forwarding through proxy)" : "");

  Pump();
  if (state_ != SocketState::kConnected) {
    return;  // Lost while writing queued requests
  }
  if (size() == 0) {
    EnterIdle();
  }

  Emit(MemberEventType::kConnected);
  MaybeFinishClose();
}

void SocketMember::FailConnection(const Error& error) {
  Error err = error;
  spdlog::error("member {}: connection failed while {}: {}", origin(),
                SocketStateName(state_), err.ToString());

  connect_timer_.Stop();
  StopTimeout();
  CloseTransport();
  SetConnected(false);
  state_ = closed() ? SocketState::kClosed : SocketState::kIdle;
  RecordFailure();

  // Requests waiting for this connection cannot be served by it
  FailQueued(err);

  Emit(MemberEventType::kConnectionError, err);
  MaybeFinishClose();
}

// =============================================================================
// Request flow
// =============================================================================

bool SocketMember::Dispatch(DispatchRequest request) {
  if (destroyed()) {
    request.Fail(Error::PoolDestroyed());
    return false;
  }
  if (closed()) {
    request.Fail(Error::PoolClosed());
    return false;
  }
  if (setup_error_) {
    request.Fail(setup_error_);
    return false;
  }
  if (request.aborted()) {
    request.Fail(request.options().signal->reason());
    return size() < pipelining();
  }
  if (state_ == SocketState::kIdle && attached_ && connect_ip_.empty()) {
    request.Fail(Error::Socket("socket closed", socket_info_));
    return false;
  }

  bool throw_on_error = request.options().throw_on_error.value_or(
      options_.proxy.IsEnabled());
  uint64_t id = next_exchange_id_++;

  std::weak_ptr<bool> alive = alive_;
  request.WatchAbort([this, alive, id](const Error& reason) {
    if (!alive.expired()) {
      OnAbort(id, reason);
    }
  });

  auto exchange = std::make_unique<Exchange>(
      Exchange{id, std::move(request), nullptr, throw_on_error, false});
  queue_.push_back(std::move(exchange));
  ++queued_;

  if (state_ == SocketState::kIdle && !connect_ip_.empty()) {
    Error error = StartConnect();
    if (error) {
      FailConnection(error);
      return false;
    }
  }

  Pump();
  return size() < pipelining();
}

void SocketMember::Pump() {
  while (state_ == SocketState::kConnected && stream_ && !writing_ &&
         !queue_.empty() && in_flight() < pipelining()) {
    // A connection that is about to reset takes no more requests
    if (reset_after_response_) {
      break;
    }
    ExchangePtr exchange = std::move(queue_.front());
    queue_.pop_front();
    --queued_;
    StartRequest(std::move(exchange));
  }
}

void SocketMember::StartRequest(ExchangePtr exchange) {
  if (exchange->request.settled()) {
    return;
  }

  http1::FrameOptions frame = BuildFrameOptions(exchange->request.options());
  Error invalid = http1::RequestFramer::Validate(frame);
  if (invalid) {
    exchange->request.Fail(invalid);
    return;
  }

  if (armed_kind_ == core::TimeoutKind::kIdle) {
    keep_alive_.RecordIdlePeriod(reactor_->now_ms() - idle_since_ms_);
    StopTimeout();
  }

  ++pending_;
  uint64_t id = exchange->id;
  exchange->framer = std::make_unique<http1::RequestFramer>(
      this, std::move(frame), options_.on_warning);
  writing_ = std::move(exchange);
  writing_body_ = true;
  frame_finished_ = false;
  body_blocked_ = false;

  if (inflight_.empty()) {
    ArmTimeout(core::TimeoutKind::kHeaders);
  }

  SPDLOG_TRACE("member {}: writing {} {}", origin(),
               writing_->request.options().method,
               writing_->request.options().path);

  std::weak_ptr<bool> alive = alive_;
  if (DispatchHandler* handler = writing_->request.handler()) {
    handler->OnConnect([this, alive, id](const Error& reason) {
      if (!alive.expired()) {
        OnAbort(id, reason);
      }
    });
  }

  // Aborted from OnConnect
  if (!writing_ || writing_->id != id) {
    return;
  }
  PumpBody();
}

void SocketMember::PumpBody() {
  Exchange* exchange = writing_.get();
  if (exchange == nullptr || body_blocked_) {
    return;
  }
  uint64_t id = exchange->id;
  const auto& body = exchange->request.options().body;

  std::string chunk;
  while (body && body->Read(&chunk)) {
    if (chunk.empty()) {
      continue;
    }

    Result<bool> written = exchange->framer->Write(ByteSpan(chunk));
    if (!written) {
      DestroySocket(written.error);
      return;
    }
    if (!FlushOut()) {
      return;
    }

    if (DispatchHandler* handler = exchange->request.handler()) {
      handler->OnBodySent(ByteSpan(chunk));
    }

    // Aborted from OnBodySent
    if (!writing_ || writing_->id != id) {
      return;
    }

    if (!written.value && buffered_bytes() >= kHighWaterMark) {
      body_blocked_ = true;
      UpdateInterest();
      return;
    }
  }

  FinishWrite();
}

void SocketMember::FinishWrite() {
  uint64_t id = writing_->id;

  Error error = writing_->framer->End();
  if (error) {
    DestroySocket(error);
    return;
  }
  if (!FlushOut()) {
    return;
  }
  if (!writing_ || writing_->id != id || !frame_finished_) {
    return;
  }

  frame_finished_ = false;
  writing_->framer.reset();
  --pending_;
  ++running_;
  inflight_.push_back(std::move(writing_));

  // Next pipelined request
  Pump();
}

http1::FrameOptions SocketMember::BuildFrameOptions(
    const DispatchOptions& options) const {
  http1::FrameOptions frame;
  frame.method = options.method;
  frame.host = host_header_;
  frame.headers = options.headers;

  if (forwarding_) {
    // Absolute form for the proxy
    frame.path = target_.scheme + "://" + host_header_ + options.path;
    Headers proxy_headers = proxy::BuildProxyHeaders(options_.proxy);
    frame.headers.insert(frame.headers.end(), proxy_headers.begin(),
                         proxy_headers.end());
  } else {
    frame.path = options.path;
  }

  frame.content_length = options.content_length;
  if (!frame.content_length) {
    frame.content_length = ContentLengthHeader(options.headers);
  }

  frame.expects_payload = options.ExpectsPayload();
  frame.upgrade = options.upgrade;
  frame.strict_content_length = options_.config.framer.strict_content_length;
  frame.timeout_kind = core::TimeoutKind::kHeaders;
  return frame;
}

void SocketMember::OnAbort(uint64_t id, const Error& reason) {
  Error err = reason;

  auto queued = std::find_if(queue_.begin(), queue_.end(),
                             [id](const auto& e) { return e->id == id; });
  if (queued != queue_.end()) {
    ExchangePtr exchange = std::move(*queued);
    queue_.erase(queued);
    --queued_;
    exchange->request.Fail(err);
    MaybeEmitDrained();
    return;
  }

  Exchange* active = nullptr;
  if (writing_ && writing_->id == id) {
    active = writing_.get();
  } else {
    for (auto& exchange : inflight_) {
      if (exchange->id == id) {
        active = exchange.get();
        break;
      }
    }
  }
  if (active == nullptr) {
    return;
  }

  SPDLOG_DEBUG("member {}: request aborted on the wire, dropping socket",
               origin());

  // Partial protocol state cannot be reused
  active->failed = true;
  active->request.Fail(err);
  DestroySocket(Error::Socket("aborted", CurrentSocketInfo()));
}

SocketMember::Exchange* SocketMember::ResponseTarget() {
  if (!inflight_.empty()) {
    return inflight_.front().get();
  }
  return writing_.get();
}

void SocketMember::DeliverHeaders(int status, const Headers& headers) {
  Exchange* exchange = ResponseTarget();
  if (exchange == nullptr || exchange->failed) {
    return;
  }

  if (armed_kind_ == core::TimeoutKind::kHeaders) {
    ArmTimeout(core::TimeoutKind::kBody);
  }

  if (exchange->throw_on_error && status >= 400) {
    exchange->failed = true;
    exchange->request.Fail(Error::ResponseStatus(status));
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  DispatchHandler* handler = exchange->request.handler();
  if (handler == nullptr) {
    return;
  }
  bool more = handler->OnHeaders(status, headers, [this, alive] {
    if (!alive.expired()) {
      Resume();
    }
  });

  if (!more && stream_) {
    paused_ = true;
    UpdateInterest();
  }
}

void SocketMember::FinishResponse(const Headers& trailers,
                                  uint64_t keep_alive_hint_ms) {
  if (inflight_.empty()) {
    return;
  }

  ExchangePtr exchange = std::move(inflight_.front());
  inflight_.pop_front();
  --running_;
  RecordSuccess();

  if (keep_alive_hint_ms > 0 &&
      !keep_alive_.ApplyServerHint(keep_alive_hint_ms)) {
    reset_after_response_ = true;
  }

  exchange->request.Complete(trailers);

  if (!stream_) {
    return;  // Lost from the completion callback
  }

  StopTimeout();
  if (!inflight_.empty() || writing_) {
    ArmTimeout(core::TimeoutKind::kHeaders);
  }

  if (reset_after_response_ && in_flight() == 0) {
    DestroySocket(Error::Socket("reset", CurrentSocketInfo()));
    return;
  }

  Pump();
  if (!stream_) {
    return;
  }
  if (size() == 0) {
    EnterIdle();
  }

  MaybeFinishClose();
  MaybeEmitDrained();
}

void SocketMember::Resume() {
  if (!paused_) {
    return;
  }
  paused_ = false;
  UpdateInterest();
}

// =============================================================================
// Socket I/O
// =============================================================================

void SocketMember::OnWritable() {
  switch (state_) {
    case SocketState::kConnecting:
      if (!util::IsConnected(fd_)) {
        FailConnection(Error::Socket(
            "connect failed: " + util::GetLastSocketErrorString(),
            CurrentSocketInfo()));
        return;
      }
      BeginNegotiation();
      return;

    case SocketState::kNegotiating:
      HandleNegotiation(negotiator_->OnWritable());
      return;

    case SocketState::kConnected:
    case SocketState::kClosing:
      if (!FlushOut()) {
        return;
      }
      if (body_blocked_ && buffered_bytes() < kHighWaterMark / 2) {
        body_blocked_ = false;
        PumpBody();
      }
      return;

    default:
      return;
  }
}

void SocketMember::OnReadable() {
  switch (state_) {
    case SocketState::kNegotiating:
      HandleNegotiation(negotiator_->OnReadable());
      return;

    case SocketState::kConnected:
    case SocketState::kClosing:
      ReadSome();
      return;

    default:
      return;
  }
}

void SocketMember::OnError(int error_code) {
  Error error = Error::Socket(util::GetSocketErrorString(error_code),
                              CurrentSocketInfo());
  if (state_ == SocketState::kConnecting ||
      state_ == SocketState::kNegotiating) {
    FailConnection(error);
  } else {
    DestroySocket(error);
  }
}

bool SocketMember::WriteBytes(std::string_view data) {
  out_buf_.append(data);
  return buffered_bytes() < kHighWaterMark;
}

void SocketMember::RefreshTimeout(core::TimeoutKind kind) {
  if (armed_kind_ == kind && timer_.active()) {
    timer_.Refresh();
  }
}

bool SocketMember::FlushOut() {
  if (!stream_) {
    return false;
  }

  while (out_offset_ < out_buf_.size()) {
    size_t written = 0;
    core::IoResult io = stream_->Write(
        reinterpret_cast<const uint8_t*>(out_buf_.data()) + out_offset_,
        out_buf_.size() - out_offset_, &written);
    out_offset_ += written;
    socket_info_.bytes_written += written;

    if (io == core::IoResult::kError) {
      DestroySocket(Error::Socket("write failed: " + stream_->last_error(),
                                  CurrentSocketInfo()));
      return false;
    }
    if (io == core::IoResult::kWantRead || written == 0) {
      break;
    }
  }

  if (out_offset_ == out_buf_.size() && stream_->HasPendingOutput() &&
      stream_->Flush() == core::IoResult::kError) {
    DestroySocket(Error::Socket("write failed: " + stream_->last_error(),
                                CurrentSocketInfo()));
    return false;
  }

  if (out_offset_ == out_buf_.size()) {
    out_buf_.clear();
    out_offset_ = 0;
  } else if (out_offset_ >= kHighWaterMark) {
    out_buf_.erase(0, out_offset_);
    out_offset_ = 0;
  }

  UpdateInterest();
  return true;
}

void SocketMember::ReadSome() {
  uint8_t buf[kReadChunkSize];

  while (stream_ && !paused_) {
    core::IoResult io;
    ssize_t n = stream_->Read(buf, sizeof(buf), &io);

    if (n > 0) {
      socket_info_.bytes_read += static_cast<uint64_t>(n);

      Exchange* exchange = ResponseTarget();
      if (exchange == nullptr) {
        DestroySocket(Error::Socket("unexpected data from server",
                                    CurrentSocketInfo()));
        return;
      }
      if (armed_kind_ == core::TimeoutKind::kBody) {
        timer_.Refresh();
      }
      if (exchange->failed) {
        continue;  // Body of a response already reported as failed
      }

      DispatchHandler* handler = exchange->request.handler();
      bool more =
          handler == nullptr ||
          handler->OnData(ByteSpan(buf, static_cast<size_t>(n)));
      if (!stream_) {
        return;
      }
      if (!more) {
        paused_ = true;
        UpdateInterest();
        return;
      }
      continue;
    }

    if (n == 0) {
      DestroySocket(Error::Socket("other side closed", CurrentSocketInfo()));
      return;
    }
    if (io == core::IoResult::kWantRead || io == core::IoResult::kWantWrite) {
      return;
    }
    DestroySocket(Error::Socket("read failed: " + stream_->last_error(),
                                CurrentSocketInfo()));
    return;
  }
}

void SocketMember::UpdateInterest() {
  if (fd_ == util::kInvalidSocket) {
    return;
  }

  core::EventType events = core::EventType::kNone;
  switch (state_) {
    case SocketState::kConnecting:
      events = core::EventType::kWrite;
      break;
    case SocketState::kNegotiating:
      events = (negotiator_ && negotiator_->WantsWrite())
                   ? core::EventType::kWrite
                   : core::EventType::kRead;
      break;
    case SocketState::kConnected:
    case SocketState::kClosing:
      if (!paused_) {
        events = core::EventType::kRead;
      }
      if (buffered_bytes() > 0 || (stream_ && stream_->HasPendingOutput())) {
        events = events | core::EventType::kWrite;
      }
      break;
    default:
      return;
  }

  if (!registered_) {
    registered_ = reactor_->Add(this, events);
    if (!registered_) {
      spdlog::error("member {}: failed to register fd {}", origin(), fd_);
    }
  } else if (events != interest_) {
    reactor_->Modify(this, events);
  }
  interest_ = events;
}

// =============================================================================
// Teardown
// =============================================================================

void SocketMember::DestroySocket(const Error& error) {
  Error err = error;
  bool was_connected = connected();

  connect_timer_.Stop();
  StopTimeout();

  if (writing_ && writing_->framer) {
    Error violation = writing_->framer->Destroy(err);
    if (violation) {
      err = violation;
    }
  }

  CloseTransport();

  ExchangePtr writing = std::move(writing_);
  std::deque<ExchangePtr> inflight = std::move(inflight_);
  inflight_.clear();
  pending_ = 0;
  running_ = 0;
  writing_body_ = false;
  frame_finished_ = false;
  reset_after_response_ = false;

  SetConnected(false);
  state_ = closed() ? SocketState::kClosed : SocketState::kIdle;

  // Oldest first
  bool failed_any = false;
  for (auto& exchange : inflight) {
    if (!exchange->request.settled()) {
      exchange->request.Fail(err);
      failed_any = true;
    }
  }
  if (writing && !writing->request.settled()) {
    writing->request.Fail(err);
    failed_any = true;
  }
  if (failed_any) {
    RecordFailure();
  }

  if (was_connected) {
    SPDLOG_DEBUG("member {}: disconnected: {}", origin(), err.ToString());
    Emit(MemberEventType::kDisconnected, err);
  }

  // Queued requests never touched the lost socket
  if (!queue_.empty()) {
    if (!connect_ip_.empty() && !destroyed()) {
      Error connect_error = StartConnect();
      if (connect_error) {
        FailConnection(connect_error);
        return;
      }
    } else {
      FailQueued(err);
    }
  }

  MaybeFinishClose();
}

void SocketMember::CloseTransport() {
  if (registered_) {
    reactor_->Remove(this);
    registered_ = false;
  }
  interest_ = core::EventType::kNone;

  negotiator_.reset();
  stream_.reset();
  if (owns_fd_ && fd_ != util::kInvalidSocket) {
    util::CloseSocket(fd_);
  }
  owns_fd_ = false;
  fd_ = util::kInvalidSocket;

  out_buf_.clear();
  out_offset_ = 0;
  paused_ = false;
  body_blocked_ = false;
  forwarding_ = false;
}

void SocketMember::FailQueued(const Error& error) {
  std::deque<ExchangePtr> queue = std::move(queue_);
  queue_.clear();
  queued_ = 0;
  for (auto& exchange : queue) {
    exchange->request.Fail(error);
  }
}

void SocketMember::MaybeEmitDrained() {
  if (busy() && connected() && size() < pipelining()) {
    Emit(MemberEventType::kDrained);
  }
}

void SocketMember::MaybeFinishClose() {
  if (!closed()) {
    return;
  }
  if (size() > 0) {
    if (state_ == SocketState::kConnected) {
      state_ = SocketState::kClosing;
    }
    return;
  }

  if (fd_ != util::kInvalidSocket || stream_ || negotiator_) {
    bool was_connected = connected();
    if (stream_) {
      stream_->Shutdown();
    }
    connect_timer_.Stop();
    StopTimeout();
    CloseTransport();
    SetConnected(false);
    if (was_connected) {
      SPDLOG_DEBUG("member {}: closed", origin());
      Emit(MemberEventType::kDisconnected, Error::PoolClosed());
    }
  }
  state_ = SocketState::kClosed;

  if (on_closed_) {
    auto on_closed = std::move(on_closed_);
    on_closed_ = nullptr;
    reactor_->Post(std::move(on_closed));
  }
}

void SocketMember::Close(std::function<void()> on_closed) {
  if (on_closed) {
    if (state_ == SocketState::kClosed) {
      reactor_->Post(std::move(on_closed));
      return;
    }
    auto previous = std::move(on_closed_);
    on_closed_ = [previous = std::move(previous),
                  on_closed = std::move(on_closed)] {
      if (previous) {
        previous();
      }
      on_closed();
    };
  }

  MarkClosed();
  MaybeFinishClose();
}

bool SocketMember::CanConnect() const {
  if (closed() || setup_error_) {
    return false;
  }
  switch (state_) {
    case SocketState::kConnecting:
    case SocketState::kNegotiating:
    case SocketState::kConnected:
      return true;
    case SocketState::kIdle:
      // An adopted socket that died has nothing to reconnect to
      return !connect_ip_.empty();
    default:
      return false;
  }
}

void SocketMember::Destroy(const Error& error,
                           std::function<void()> on_destroyed) {
  Error err = error;
  MarkDestroyed();

  FailQueued(err);
  DestroySocket(err);
  state_ = SocketState::kClosed;

  if (on_destroyed) {
    reactor_->Post(std::move(on_destroyed));
  }
}

// =============================================================================
// Timers
// =============================================================================

void SocketMember::ArmTimeout(core::TimeoutKind kind) {
  StopTimeout();

  uint64_t timeout_ms = 0;
  switch (kind) {
    case core::TimeoutKind::kIdle:
      timeout_ms = keep_alive_.timeout_ms();
      break;
    case core::TimeoutKind::kHeaders:
      timeout_ms =
          static_cast<uint64_t>(options_.config.timeouts.headers.count());
      break;
    case core::TimeoutKind::kBody:
      timeout_ms = static_cast<uint64_t>(options_.config.timeouts.body.count());
      break;
  }
  if (timeout_ms == 0) {
    return;  // Disabled
  }

  armed_kind_ = kind;
  timer_.Start(timeout_ms, [this, kind] { OnTimeout(kind); });
}

void SocketMember::StopTimeout() {
  timer_.Stop();
  armed_kind_.reset();
}

void SocketMember::OnTimeout(core::TimeoutKind kind) {
  armed_kind_.reset();
  SPDLOG_DEBUG("member {}: {} timeout", origin(), core::TimeoutKindName(kind));

  switch (kind) {
    case core::TimeoutKind::kIdle:
      DestroySocket(Error::Socket("socket idle timeout", CurrentSocketInfo()));
      return;
    case core::TimeoutKind::kHeaders:
      DestroySocket(Error::HeadersTimeout());
      return;
    case core::TimeoutKind::kBody:
      DestroySocket(Error::BodyTimeout());
      return;
  }
}

void SocketMember::EnterIdle() {
  idle_since_ms_ = reactor_->now_ms();
  ArmTimeout(core::TimeoutKind::kIdle);
}

SocketInfo SocketMember::CurrentSocketInfo() const {
  SocketInfo info = fd_ != util::kInvalidSocket ? util::GetSocketInfo(fd_)
                                                : socket_info_;
  info.bytes_written = socket_info_.bytes_written;
  info.bytes_read = socket_info_.bytes_read;
  return info;
}

}  // namespace pool
}  // namespace tunnelpool
