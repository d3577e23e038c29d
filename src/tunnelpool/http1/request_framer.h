// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// HTTP/1.1 request framing: request line and headers, then the body as a
// fixed-length or chunked payload.

#ifndef TUNNELPOOL_HTTP1_REQUEST_FRAMER_H_
#define TUNNELPOOL_HTTP1_REQUEST_FRAMER_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "tunnelpool/core/timer.h"
#include "tunnelpool/error.h"
#include "tunnelpool/types.h"

namespace tunnelpool {
namespace http1 {

// The connection a framer writes into.
class FrameSink {
 public:
  virtual ~FrameSink() = default;

  // Queues bytes for the socket. Returns false when the send buffer is over
  // its high-water mark; the bytes are accepted either way.
  virtual bool WriteBytes(std::string_view data) = 0;

  // Restarts the connection timer if it is currently guarding kind.
  virtual void RefreshTimeout(core::TimeoutKind kind) = 0;

  // Marks whether a request body is being written.
  virtual void SetWriting(bool writing) = 0;

  // The request is fully on the wire; the connection may take more work.
  virtual void OnFrameFinished() = 0;

  virtual bool IsDestroyed() const = 0;

  // Requests being written or written and not yet completed
  virtual size_t in_flight() const = 0;
  virtual size_t pipelining() const = 0;
};

struct FrameOptions {
  std::string method = "GET";
  std::string path = "/";
  std::string host;  // host[:port] for the host header
  Headers headers;

  // Unset means chunked
  std::optional<uint64_t> content_length;

  // PUT/POST/PATCH: an empty body still sends content-length: 0
  bool expects_payload = false;

  bool keep_alive = true;
  bool upgrade = false;

  bool strict_content_length = true;

  // Timer refreshed by writes
  core::TimeoutKind timeout_kind = core::TimeoutKind::kHeaders;
};

enum class FrameState {
  kHeaderPending,  // Nothing written yet
  kBody,           // Header and some body written
  kFinished,
  kDestroyed,
};

// Writes one request into a FrameSink. At most one framer per connection is
// in its write phase at a time.
class RequestFramer {
 public:
  using WarningCallback = std::function<void(const Error&)>;

  // on_warning receives non-fatal conditions (lenient length mismatch).
  // Without it they are logged.
  RequestFramer(FrameSink* sink, FrameOptions options,
                WarningCallback on_warning = {});

  // Non-copyable
  RequestFramer(const RequestFramer&) = delete;
  RequestFramer& operator=(const RequestFramer&) = delete;

  // Rejects request lines and headers that cannot be framed safely.
  static Error Validate(const FrameOptions& options);

  // Writes a body chunk (the header goes out with the first one). Value is
  // false when the sink wants the caller to wait for writability.
  Result<bool> Write(ByteSpan chunk);

  // Finishes the request. Returns a content-length mismatch in strict mode.
  Error End();

  // Abandons the request. Returns an invariant violation if other requests
  // are in flight on a connection that does not pipeline.
  Error Destroy(const Error& error);

  uint64_t bytes_written() const { return bytes_written_; }
  std::optional<uint64_t> declared_length() const {
    return options_.content_length;
  }
  core::TimeoutKind timeout_kind() const { return options_.timeout_kind; }
  FrameState state() const { return state_; }
  bool finished() const { return state_ == FrameState::kFinished; }

  // Request line and headers, without the framing header and blank line
  const std::string& header() const { return header_; }

 private:
  std::string BuildHeader() const;
  void Warn(const Error& error);

  FrameSink* sink_;
  FrameOptions options_;
  WarningCallback on_warning_;
  std::string header_;
  uint64_t bytes_written_ = 0;
  uint64_t chunks_written_ = 0;
  bool warned_ = false;  // One mismatch warning per frame
  FrameState state_ = FrameState::kHeaderPending;
};

}  // namespace http1
}  // namespace tunnelpool

#endif  // TUNNELPOOL_HTTP1_REQUEST_FRAMER_H_
