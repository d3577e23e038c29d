// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/pool/socket_member.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <thread>

#include "tunnelpool/core/reactor.h"
#include "tunnelpool/pool/connection_pool.h"

using namespace tunnelpool;
using namespace tunnelpool::pool;

namespace {

constexpr const char* kOrigin = "http://backend.local:8080";

struct RecordingHandler : DispatchHandler {
  int status = 0;
  std::string data;
  std::string body_sent;
  int completed = 0;
  std::optional<Error> error;
  std::function<void()> on_body_sent;

  bool OnHeaders(int s, const Headers&, std::function<void()>) override {
    status = s;
    return true;
  }
  bool OnData(ByteSpan chunk) override {
    data.append(chunk.as_string_view());
    return true;
  }
  void OnBodySent(ByteSpan chunk) override {
    body_sent.append(chunk.as_string_view());
    if (on_body_sent) on_body_sent();
  }
  void OnComplete(const Headers&) override { ++completed; }
  void OnError(const Error& e) override { error = e; }
};

// Test-side end of a connection
class Peer {
 public:
  explicit Peer(int fd) : fd_(fd) {
    fcntl(fd_, F_SETFL, fcntl(fd_, F_GETFL, 0) | O_NONBLOCK);
  }
  ~Peer() {
    if (fd_ >= 0) close(fd_);
  }

  void Send(std::string_view data) {
    ssize_t n = send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    assert(n == static_cast<ssize_t>(data.size()));
    (void)n;
  }

  // Appends whatever is readable to received
  void Drain() {
    char buf[4096];
    for (;;) {
      ssize_t n = recv(fd_, buf, sizeof(buf), 0);
      if (n > 0) {
        received.append(buf, static_cast<size_t>(n));
        continue;
      }
      if (n == 0) eof = true;
      return;
    }
  }

  std::string received;
  bool eof = false;

 private:
  int fd_;
};

template <typename Pred>
bool RunUntil(core::Reactor& reactor, Pred done, int max_iterations = 2000) {
  for (int i = 0; i < max_iterations; ++i) {
    if (done()) return true;
    reactor.RunOnce();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return done();
}

SocketMemberOptions Options(size_t pipelining = 1) {
  SocketMemberOptions options;
  options.origin = kOrigin;
  options.config.pipelining = pipelining;
  return options;
}

DispatchOptions Get(std::string path = "/") {
  DispatchOptions options;
  options.origin = kOrigin;
  options.path = std::move(path);
  return options;
}

// Member attached to one end of a socketpair, the other end is the peer
struct Fixture {
  core::Reactor reactor;
  std::unique_ptr<SocketMember> member;
  std::unique_ptr<Peer> peer;

  explicit Fixture(SocketMemberOptions options = Options()) {
    int fds[2];
    int rc = socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(rc == 0);
    (void)rc;
    member = std::make_unique<SocketMember>(&reactor, std::move(options));
    Error error = member->Attach(fds[0]);
    assert(!error);
    peer = std::make_unique<Peer>(fds[1]);
  }

  bool PeerReceived(std::string_view needle) {
    return RunUntil(reactor, [&] {
      peer->Drain();
      return peer->received.find(needle) != std::string::npos;
    });
  }

  bool PeerSeesClose() {
    return RunUntil(reactor, [&] {
      peer->Drain();
      return peer->eof;
    });
  }
};

}  // namespace

void TestRequestOnTheWire() {
  std::print("Testing request is written once connected... ");

  Fixture f;
  auto handler = std::make_shared<RecordingHandler>();
  DispatchOptions options = Get("/items");
  options.headers.push_back({"accept", "*/*"});

  bool free = f.member->Dispatch(DispatchRequest(options, handler));
  assert(!free);
  assert(f.member->queued() == 1);
  assert(!f.member->connected());

  assert(f.PeerReceived("\r\n\r\n"));
  assert(f.member->connected());
  assert(f.member->state() == SocketState::kConnected);
  assert(f.peer->received ==
         "GET /items HTTP/1.1\r\n"
         "host: backend.local:8080\r\n"
         "connection: keep-alive\r\n"
         "accept: */*\r\n"
         "\r\n");
  assert(f.member->queued() == 0);
  assert(f.member->running() == 1);
  assert(f.member->armed_timeout() == core::TimeoutKind::kHeaders);

  std::string response = "HTTP/1.1 200 OK\r\ncontent-length: 2\r\n\r\nhi";
  f.peer->Send(response);
  assert(RunUntil(f.reactor,
                  [&] { return handler->data.size() == response.size(); }));
  assert(handler->data == response);

  f.member->DeliverHeaders(200, {});
  assert(handler->status == 200);
  assert(f.member->armed_timeout() == core::TimeoutKind::kBody);

  f.member->FinishResponse({});
  assert(handler->completed == 1);
  assert(!handler->error);
  assert(f.member->size() == 0);
  assert(f.member->consecutive_successes() == 1);
  assert(f.member->armed_timeout() == core::TimeoutKind::kIdle);

  std::println("PASSED");
}

void TestPipelinedRequests() {
  std::print("Testing pipelined requests... ");

  Fixture f(Options(2));
  auto first = std::make_shared<RecordingHandler>();
  auto second = std::make_shared<RecordingHandler>();
  auto third = std::make_shared<RecordingHandler>();

  assert(f.member->Dispatch(DispatchRequest(Get("/1"), first)));
  assert(!f.member->Dispatch(DispatchRequest(Get("/2"), second)));
  assert(!f.member->Dispatch(DispatchRequest(Get("/3"), third)));
  assert(f.member->queued() == 3);

  assert(f.PeerReceived("GET /2 HTTP/1.1"));
  assert(f.PeerReceived("GET /2 HTTP/1.1\r\nhost: backend.local:8080\r\n"
                        "connection: keep-alive\r\n\r\n"));
  assert(f.member->running() == 2);
  assert(f.member->queued() == 1);
  assert(f.peer->received.find("GET /3") == std::string::npos);

  f.member->DeliverHeaders(200, {});
  f.member->FinishResponse({});
  assert(first->completed == 1);
  assert(second->completed == 0);

  // Completion made room for the third
  assert(f.PeerReceived("GET /3 HTTP/1.1"));
  assert(f.member->queued() == 0);
  assert(f.member->running() == 2);

  f.member->FinishResponse({});
  f.member->FinishResponse({});
  assert(second->completed == 1);
  assert(third->completed == 1);
  assert(f.member->size() == 0);

  std::println("PASSED");
}

void TestFixedLengthBody() {
  std::print("Testing request body... ");

  Fixture f;
  auto handler = std::make_shared<RecordingHandler>();
  DispatchOptions options = Get("/upload");
  options.method = "POST";
  options.body = std::make_shared<StringBody>("hello world", 4);
  options.content_length = 11;

  f.member->Dispatch(DispatchRequest(options, handler));
  assert(f.PeerReceived("hello world"));
  assert(f.peer->received ==
         "POST /upload HTTP/1.1\r\n"
         "host: backend.local:8080\r\n"
         "connection: keep-alive\r\n"
         "content-length: 11\r\n\r\n"
         "hello world");
  assert(handler->body_sent == "hello world");
  assert(f.member->running() == 1);
  assert(f.member->pending() == 0);

  std::println("PASSED");
}

void TestThrowOnErrorStatus() {
  std::print("Testing error status fails the request... ");

  Fixture f;
  auto handler = std::make_shared<RecordingHandler>();
  DispatchOptions options = Get();
  options.throw_on_error = true;

  f.member->Dispatch(DispatchRequest(options, handler));
  assert(f.PeerReceived("\r\n\r\n"));

  f.member->DeliverHeaders(503, {});
  assert(handler->error);
  assert(handler->error->code() == ErrorCode::kResponseStatus);
  assert(handler->error->status() == 503);
  assert(handler->status == 0);

  // Body of the failed response is dropped
  f.peer->Send("oops");
  f.reactor.RunOnce();
  assert(handler->data.empty());

  f.member->FinishResponse({});
  assert(handler->completed == 0);
  assert(f.member->size() == 0);
  assert(f.member->connected());

  std::println("PASSED");
}

void TestPeerCloses() {
  std::print("Testing peer closing mid-response... ");

  Fixture f;
  auto handler = std::make_shared<RecordingHandler>();
  f.member->Dispatch(DispatchRequest(Get(), handler));
  assert(f.PeerReceived("\r\n\r\n"));

  f.peer.reset();
  assert(RunUntil(f.reactor, [&] { return handler->error.has_value(); }));
  assert(handler->error->code() == ErrorCode::kSocketError);
  assert(handler->error->message() == "other side closed");
  assert(!f.member->connected());
  assert(f.member->state() == SocketState::kIdle);
  assert(f.member->size() == 0);
  assert(f.member->consecutive_successes() == 0);
  assert(!f.member->CanConnect());

  // An attached socket is not reconnected
  auto next = std::make_shared<RecordingHandler>();
  f.member->Dispatch(DispatchRequest(Get(), next));
  assert(next->error);
  assert(next->error->code() == ErrorCode::kSocketError);

  std::println("PASSED");
}

void TestUnexpectedData() {
  std::print("Testing data with no request in flight... ");

  Fixture f;
  assert(RunUntil(f.reactor, [&] { return f.member->connected(); }));
  assert(f.member->armed_timeout() == core::TimeoutKind::kIdle);

  f.peer->Send("HTTP/1.1 200 OK\r\n\r\n");
  assert(RunUntil(f.reactor, [&] { return !f.member->connected(); }));
  assert(f.PeerSeesClose());

  std::println("PASSED");
}

void TestAbortWhileWriting() {
  std::print("Testing abort while the body is written... ");

  Fixture f;
  AbortController controller;
  auto handler = std::make_shared<RecordingHandler>();
  handler->on_body_sent = [&] { controller.Abort(); };

  DispatchOptions options = Get("/upload");
  options.method = "PUT";
  options.body = std::make_shared<StringBody>("aaaabbbbcccc", 4);
  options.content_length = 12;
  options.signal = controller.signal();

  f.member->Dispatch(DispatchRequest(options, handler));
  assert(RunUntil(f.reactor, [&] { return handler->error.has_value(); }));
  assert(handler->error->code() == ErrorCode::kRequestAborted);
  assert(handler->body_sent == "aaaa");
  assert(handler->completed == 0);

  // The half-written request makes the connection unusable
  assert(!f.member->connected());
  assert(f.member->size() == 0);
  assert(f.PeerSeesClose());
  assert(f.peer->received.find("bbbb") == std::string::npos);

  std::println("PASSED");
}

void TestAbortedMemberLeavesRotation() {
  std::print("Testing aborted member leaves the rotation... ");

  Fixture f;
  PoolConfig config;
  int disconnects = 0;
  PoolCallbacks callbacks;
  callbacks.on_disconnect = [&](const std::string&, PoolMember*,
                                const Error&) { ++disconnects; };
  ConnectionPool pool(kOrigin, config, std::move(callbacks));
  SocketMember* member = f.member.get();
  pool.AddMember(std::move(f.member));

  AbortController controller;
  auto handler = std::make_shared<RecordingHandler>();
  DispatchOptions options = Get("/upload");
  options.method = "POST";
  options.body = std::make_shared<StringBody>("aaaabbbb", 4);
  options.content_length = 8;
  options.signal = controller.signal();
  handler->on_body_sent = [&] {
    assert(member->connected());
    assert(pool.Stats().connected == 1);
    controller.Abort();
  };
  pool.Dispatch(options, handler);

  assert(RunUntil(f.reactor, [&] { return handler->error.has_value(); }));
  assert(handler->error->code() == ErrorCode::kRequestAborted);
  assert(disconnects == 1);
  assert(pool.Stats().connected == 0);
  assert(pool.balancer().Next() == nullptr);
  // An adopted socket cannot be reopened, so the pool lets the member go
  assert(pool.member_count() == 0);
  assert(f.PeerSeesClose());

  std::println("PASSED");
}

void TestAbortWhileQueued() {
  std::print("Testing abort of a queued request... ");

  Fixture f;
  AbortController controller;
  auto handler = std::make_shared<RecordingHandler>();
  DispatchOptions options = Get();
  options.signal = controller.signal();

  f.member->Dispatch(DispatchRequest(options, handler));
  assert(f.member->queued() == 1);
  controller.Abort();
  assert(handler->error);
  assert(handler->error->code() == ErrorCode::kRequestAborted);
  assert(f.member->queued() == 0);

  // Nothing reaches the wire
  assert(RunUntil(f.reactor, [&] { return f.member->connected(); }));
  f.peer->Drain();
  assert(f.peer->received.empty());

  std::println("PASSED");
}

void TestGracefulClose() {
  std::print("Testing graceful close... ");

  Fixture f;
  auto handler = std::make_shared<RecordingHandler>();
  f.member->Dispatch(DispatchRequest(Get(), handler));
  assert(f.PeerReceived("\r\n\r\n"));

  bool closed = false;
  f.member->Close([&] { closed = true; });
  assert(f.member->state() == SocketState::kClosing);
  assert(!f.member->IsFree());

  // New work is refused
  auto late = std::make_shared<RecordingHandler>();
  f.member->Dispatch(DispatchRequest(Get(), late));
  assert(late->error);
  assert(late->error->code() == ErrorCode::kPoolClosed);

  f.member->DeliverHeaders(200, {});
  f.member->FinishResponse({});
  assert(handler->completed == 1);
  assert(f.member->state() == SocketState::kClosed);

  // Posted to the reactor
  assert(!closed);
  assert(RunUntil(f.reactor, [&] { return closed; }));
  assert(f.PeerSeesClose());

  std::println("PASSED");
}

void TestDestroy() {
  std::print("Testing destroy fails everything... ");

  Fixture f(Options(2));
  auto running = std::make_shared<RecordingHandler>();
  auto second = std::make_shared<RecordingHandler>();
  f.member->Dispatch(DispatchRequest(Get("/a"), running));
  assert(f.PeerReceived("GET /a"));

  f.member->Dispatch(DispatchRequest(Get("/b"), second));
  assert(f.PeerReceived("GET /b"));
  assert(f.member->running() == 2);

  bool destroyed = false;
  f.member->Destroy(Error::PoolDestroyed(), [&] { destroyed = true; });
  assert(running->error);
  assert(running->error->code() == ErrorCode::kPoolDestroyed);
  assert(second->error);
  assert(second->error->code() == ErrorCode::kPoolDestroyed);
  assert(f.member->destroyed());
  assert(f.member->state() == SocketState::kClosed);
  assert(RunUntil(f.reactor, [&] { return destroyed; }));

  std::println("PASSED");
}

void TestInvalidOrigin() {
  std::print("Testing invalid origin... ");

  core::Reactor reactor;
  SocketMemberOptions options = Options();
  options.origin = "ftp://backend.local";
  SocketMember member(&reactor, std::move(options));
  assert(member.state() == SocketState::kError);
  assert(std::string(SocketStateName(member.state())) == "error");
  assert(!member.CanConnect());

  Error error = member.Connect("127.0.0.1", 80);
  assert(error.code() == ErrorCode::kInvalidArgument);

  auto handler = std::make_shared<RecordingHandler>();
  member.Dispatch(DispatchRequest(Get(), handler));
  assert(handler->error);
  assert(handler->error->code() == ErrorCode::kInvalidArgument);

  std::println("PASSED");
}

void TestConnectOverTcp() {
  std::print("Testing connect over TCP... ");

  int listener = socket(AF_INET, SOCK_STREAM, 0);
  assert(listener >= 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  int rc = bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  assert(rc == 0);
  rc = listen(listener, 4);
  assert(rc == 0);
  socklen_t len = sizeof(addr);
  rc = getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len);
  assert(rc == 0);
  (void)rc;
  uint16_t port = ntohs(addr.sin_port);

  core::Reactor reactor;
  SocketMember member(&reactor, Options());
  assert(member.Connect("localhost", port).code() ==
         ErrorCode::kInvalidArgument);
  Error error = member.Connect("127.0.0.1", port);
  assert(!error);
  assert(member.state() == SocketState::kConnecting);

  auto handler = std::make_shared<RecordingHandler>();
  member.Dispatch(DispatchRequest(Get("/tcp"), handler));
  assert(RunUntil(reactor, [&] { return member.running() == 1; }));
  assert(member.socket_info().remote_address == "127.0.0.1");
  assert(member.socket_info().remote_port == port);

  Peer peer(accept(listener, nullptr, nullptr));
  assert(RunUntil(reactor, [&] {
    peer.Drain();
    return peer.received.find("\r\n\r\n") != std::string::npos;
  }));
  assert(peer.received.starts_with("GET /tcp HTTP/1.1\r\n"));

  member.DeliverHeaders(204, {});
  member.FinishResponse({});
  assert(handler->completed == 1);

  close(listener);
  std::println("PASSED");
}

int main() {
  std::println("=== Socket Member Unit Tests ===");

  TestRequestOnTheWire();
  TestPipelinedRequests();
  TestFixedLengthBody();
  TestThrowOnErrorStatus();
  TestPeerCloses();
  TestUnexpectedData();
  TestAbortWhileWriting();
  TestAbortedMemberLeavesRotation();
  TestAbortWhileQueued();
  TestGracefulClose();
  TestDestroy();
  TestInvalidOrigin();
  TestConnectOverTcp();

  std::println("\nAll socket member tests passed!");
  return 0;
}
