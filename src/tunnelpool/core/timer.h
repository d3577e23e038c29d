// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_CORE_TIMER_H_
#define TUNNELPOOL_CORE_TIMER_H_

#include <uv.h>

#include <cstdint>
#include <functional>

#include "tunnelpool/core/reactor.h"

namespace tunnelpool {
namespace core {

// What an armed connection timer is guarding.
enum class TimeoutKind {
  kIdle,     // Keep-alive, no request in flight
  kHeaders,  // Request being written or waiting for the first response byte
  kBody,     // Between response chunks
};

const char* TimeoutKindName(TimeoutKind kind);

// One-shot libuv timer owned by a single object on the loop thread.
// The uv handle is heap-allocated and released from its close callback, so
// the Timer may be destroyed at any point, including from its own callback.
class Timer {
 public:
  explicit Timer(Reactor* reactor);
  ~Timer();

  // Non-copyable, non-movable
  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;
  Timer(Timer&&) = delete;
  Timer& operator=(Timer&&) = delete;

  void Start(uint64_t timeout_ms, std::function<void()> callback);

  // Restart the countdown with the current timeout. No-op when not armed.
  void Refresh();

  void Stop();

  bool active() const { return active_; }
  uint64_t timeout_ms() const { return timeout_ms_; }

 private:
  static void OnTimeout(uv_timer_t* handle);
  static void OnClose(uv_handle_t* handle);

  uv_timer_t* handle_ = nullptr;
  std::function<void()> callback_;
  uint64_t timeout_ms_ = 0;
  bool active_ = false;
};

// Adapts the idle keep-alive timeout to how long connections actually sit
// idle: an idle period longer than the threshold grows the next timeout by
// half, capped at the maximum.
class KeepAlivePolicy {
 public:
  KeepAlivePolicy(uint64_t timeout_ms, uint64_t max_timeout_ms,
                  uint64_t threshold_ms)
      : timeout_ms_(timeout_ms),
        max_timeout_ms_(max_timeout_ms),
        threshold_ms_(threshold_ms) {}

  // Called when a connection leaves the idle state.
  void RecordIdlePeriod(uint64_t idle_ms);

  // Applies a server-advertised keep-alive timeout ("Keep-Alive: timeout=N").
  // Returns false when the hint leaves no usable idle window, in which case
  // the connection must not be reused.
  bool ApplyServerHint(uint64_t hint_ms);

  uint64_t timeout_ms() const { return timeout_ms_; }

 private:
  uint64_t timeout_ms_;
  uint64_t max_timeout_ms_;
  uint64_t threshold_ms_;
};

}  // namespace core
}  // namespace tunnelpool

#endif  // TUNNELPOOL_CORE_TIMER_H_
