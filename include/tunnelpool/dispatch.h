// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_DISPATCH_H_
#define TUNNELPOOL_DISPATCH_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tunnelpool/error.h"
#include "tunnelpool/types.h"

namespace tunnelpool {

// Cancellation flag shared between a caller and the transport.
// Fires at most once; listeners run synchronously from Abort().
class AbortSignal {
 public:
  using Listener = std::function<void(const Error&)>;

  bool aborted() const { return aborted_; }
  const Error& reason() const { return reason_; }

  uint64_t Subscribe(Listener listener);
  void Unsubscribe(uint64_t id);

 private:
  friend class AbortController;

  void Fire(Error reason);

  bool aborted_ = false;
  Error reason_;
  uint64_t next_id_ = 1;
  std::vector<std::pair<uint64_t, Listener>> listeners_;
};

class AbortController {
 public:
  AbortController() : signal_(std::make_shared<AbortSignal>()) {}

  const std::shared_ptr<AbortSignal>& signal() const { return signal_; }

  void Abort(Error reason = Error::Aborted()) {
    signal_->Fire(std::move(reason));
  }

 private:
  std::shared_ptr<AbortSignal> signal_;
};

// Pull-based request body.
class BodySource {
 public:
  virtual ~BodySource() = default;

  // Stores the next piece of the body in chunk. Returns false once the body
  // is exhausted.
  virtual bool Read(std::string* chunk) = 0;
};

// In-memory body handed out in fixed-size chunks.
class StringBody : public BodySource {
 public:
  explicit StringBody(std::string data, size_t chunk_size = 16384)
      : data_(std::move(data)), chunk_size_(chunk_size) {}

  bool Read(std::string* chunk) override;

 private:
  std::string data_;
  size_t chunk_size_;
  size_t offset_ = 0;
};

struct DispatchOptions {
  std::string origin;  // "https://example.com:8443"
  std::string method = "GET";
  std::string path = "/";
  Headers headers;

  // Null for requests without a body
  std::shared_ptr<BodySource> body;

  // Declared body length. Unset with a body means chunked encoding.
  std::optional<uint64_t> content_length;

  std::shared_ptr<AbortSignal> signal;

  // Fail 4xx/5xx responses through OnError. Unset means true when the
  // connection goes through a proxy, false otherwise.
  std::optional<bool> throw_on_error;

  bool upgrade = false;

  // PUT, POST and PATCH carry a payload even when it is empty.
  bool ExpectsPayload() const;
};

// Receives the outcome of one dispatched request. Exactly one of
// OnComplete or OnError is called, once.
class DispatchHandler {
 public:
  virtual ~DispatchHandler() = default;

  // abort fails the request from the handler side.
  virtual void OnConnect(std::function<void(const Error&)> abort) {
    (void)abort;
  }

  // Return false to pause delivery until resume is called.
  virtual bool OnHeaders(int status, const Headers& headers,
                         std::function<void()> resume) {
    (void)status;
    (void)headers;
    (void)resume;
    return true;
  }

  // Return false to pause reading from the connection.
  virtual bool OnData(ByteSpan chunk) {
    (void)chunk;
    return true;
  }

  virtual void OnBodySent(ByteSpan chunk) { (void)chunk; }

  virtual void OnComplete(const Headers& trailers) = 0;
  virtual void OnError(const Error& error) = 0;
};

// A request and its handler. Owned by exactly one of the pool queue, a
// member queue, or the member's in-flight list at any time.
class DispatchRequest {
 public:
  DispatchRequest(DispatchOptions options,
                  std::shared_ptr<DispatchHandler> handler)
      : options_(std::move(options)),
        handler_(std::move(handler)),
        settled_(std::make_shared<bool>(false)) {}

  ~DispatchRequest() { UnwatchAbort(); }

  DispatchRequest(DispatchRequest&& other) noexcept
      : options_(std::move(other.options_)),
        handler_(std::move(other.handler_)),
        settled_(std::move(other.settled_)),
        abort_id_(std::exchange(other.abort_id_, 0)) {}

  DispatchRequest& operator=(DispatchRequest&& other) noexcept {
    if (this != &other) {
      UnwatchAbort();
      options_ = std::move(other.options_);
      handler_ = std::move(other.handler_);
      settled_ = std::move(other.settled_);
      abort_id_ = std::exchange(other.abort_id_, 0);
    }
    return *this;
  }

  // Non-copyable
  DispatchRequest(const DispatchRequest&) = delete;
  DispatchRequest& operator=(const DispatchRequest&) = delete;

  const DispatchOptions& options() const { return options_; }
  DispatchHandler* handler() const { return handler_.get(); }

  // A moved-from request counts as settled.
  bool settled() const { return !settled_ || *settled_; }
  bool aborted() const {
    return options_.signal && options_.signal->aborted();
  }

  // Terminal callbacks. Calls after the first are ignored.
  void Complete(const Headers& trailers);
  void Fail(const Error& error);

  // Fails this request through its handler. Stays valid after the request
  // object moves or dies.
  std::function<void(const Error&)> Failer() const;

  // Runs on_abort when the signal fires. Replaces an earlier watch.
  void WatchAbort(AbortSignal::Listener on_abort);
  void UnwatchAbort();

 private:
  DispatchOptions options_;
  std::shared_ptr<DispatchHandler> handler_;
  std::shared_ptr<bool> settled_;
  uint64_t abort_id_ = 0;
};

}  // namespace tunnelpool

#endif  // TUNNELPOOL_DISPATCH_H_
