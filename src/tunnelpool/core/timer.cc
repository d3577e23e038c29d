// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/core/timer.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tunnelpool {
namespace core {

const char* TimeoutKindName(TimeoutKind kind) {
  switch (kind) {
    case TimeoutKind::kIdle:
      return "idle";
    case TimeoutKind::kHeaders:
      return "headers";
    case TimeoutKind::kBody:
      return "body";
  }
  return "unknown";
}

Timer::Timer(Reactor* reactor) : handle_(new uv_timer_t) {
  if (uv_timer_init(reactor->loop(), handle_) != 0) {
    delete handle_;
    throw std::runtime_error("Failed to initialize timer");
  }
  handle_->data = this;
}

Timer::~Timer() {
  uv_timer_stop(handle_);
  handle_->data = nullptr;
  uv_close(reinterpret_cast<uv_handle_t*>(handle_), OnClose);
}

void Timer::Start(uint64_t timeout_ms, std::function<void()> callback) {
  callback_ = std::move(callback);
  timeout_ms_ = timeout_ms;
  active_ = true;
  uv_timer_start(handle_, OnTimeout, timeout_ms_, 0);
}

void Timer::Refresh() {
  if (!active_) {
    return;
  }
  uv_timer_start(handle_, OnTimeout, timeout_ms_, 0);
}

void Timer::Stop() {
  active_ = false;
  uv_timer_stop(handle_);
}

void Timer::OnTimeout(uv_timer_t* handle) {
  auto* timer = static_cast<Timer*>(handle->data);
  if (!timer || !timer->active_) {
    return;
  }
  timer->active_ = false;

  // The callback may re-arm or destroy this timer
  auto callback = std::move(timer->callback_);
  timer->callback_ = nullptr;
  if (callback) {
    callback();
  }
}

void Timer::OnClose(uv_handle_t* handle) {
  delete reinterpret_cast<uv_timer_t*>(handle);
}

void KeepAlivePolicy::RecordIdlePeriod(uint64_t idle_ms) {
  if (idle_ms <= threshold_ms_) {
    return;
  }
  timeout_ms_ = std::min(max_timeout_ms_, timeout_ms_ + timeout_ms_ / 2);
}

bool KeepAlivePolicy::ApplyServerHint(uint64_t hint_ms) {
  if (hint_ms <= threshold_ms_) {
    return false;
  }
  timeout_ms_ = std::min(hint_ms - threshold_ms_, max_timeout_ms_);
  return true;
}

}  // namespace core
}  // namespace tunnelpool
