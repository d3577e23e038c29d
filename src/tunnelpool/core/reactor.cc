// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/core/reactor.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace tunnelpool {
namespace core {

namespace {

uv_handle_t* AsHandle(void* h) { return static_cast<uv_handle_t*>(h); }

}  // namespace

Reactor::Reactor() {
  if (uv_loop_init(&loop_) != 0) {
    throw std::runtime_error("Failed to initialize libuv loop");
  }

  int rc = uv_async_init(&loop_, &wakeup_, OnWakeup);
  if (rc == 0) {
    wakeup_.data = this;
    rc = uv_timer_init(&loop_, &deadline_);
    if (rc != 0) {
      uv_close(AsHandle(&wakeup_), nullptr);
    }
  }
  if (rc != 0) {
    uv_run(&loop_, UV_RUN_DEFAULT);
    uv_loop_close(&loop_);
    throw std::runtime_error(std::string("Failed to initialize reactor: ") +
                             uv_strerror(rc));
  }
  deadline_.data = this;

  Refresh();
}

Reactor::~Reactor() {
  auto watches = std::move(watches_);
  watches_.clear();
  for (auto& [fd, watch] : watches) {
    CloseWatch(std::move(watch));
  }

  uv_timer_stop(&deadline_);
  uv_close(AsHandle(&deadline_), nullptr);
  uv_close(AsHandle(&wakeup_), nullptr);

  // Lets the close callbacks release every watch
  uv_run(&loop_, UV_RUN_DEFAULT);
  uv_loop_close(&loop_);
}

bool Reactor::Add(EventHandler* handler, EventType events) {
  if (handler == nullptr || handler->fd() < 0 ||
      watches_.contains(handler->fd())) {
    return false;
  }

  auto watch = std::make_unique<Watch>();
  watch->handler = handler;
  if (uv_poll_init(&loop_, &watch->poll, handler->fd()) != 0) {
    return false;
  }
  watch->poll.data = watch.get();

  if (uv_poll_start(&watch->poll, static_cast<int>(events), OnPoll) != 0) {
    watch->handler = nullptr;
    CloseWatch(std::move(watch));
    return false;
  }

  watches_.emplace(handler->fd(), std::move(watch));
  return true;
}

bool Reactor::Modify(EventHandler* handler, EventType events) {
  if (handler == nullptr) {
    return false;
  }
  auto it = watches_.find(handler->fd());
  if (it == watches_.end() || it->second->handler != handler) {
    return false;
  }
  return uv_poll_start(&it->second->poll, static_cast<int>(events), OnPoll) ==
         0;
}

bool Reactor::Remove(EventHandler* handler) {
  if (handler == nullptr) {
    return false;
  }
  auto it = watches_.find(handler->fd());
  if (it == watches_.end() || it->second->handler != handler) {
    return false;
  }

  std::unique_ptr<Watch> watch = std::move(it->second);
  watches_.erase(it);
  watch->handler = nullptr;
  CloseWatch(std::move(watch));
  return true;
}

void Reactor::Run() {
  running_.store(true, std::memory_order_release);
  Spin();
}

void Reactor::RunOnce() {
  Refresh();
  DrainPosted();
  uv_run(&loop_, UV_RUN_NOWAIT);
  Refresh();
}

void Reactor::RunFor(int timeout_ms) {
  running_.store(true, std::memory_order_release);
  uv_timer_start(&deadline_, OnDeadline,
                 static_cast<uint64_t>(timeout_ms < 0 ? 0 : timeout_ms), 0);
  Spin();
  uv_timer_stop(&deadline_);
}

void Reactor::Stop() {
  running_.store(false, std::memory_order_release);
  uv_async_send(&wakeup_);
}

void Reactor::Post(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    posted_.push_back(std::move(callback));
  }
  has_posted_.store(true, std::memory_order_release);
  uv_async_send(&wakeup_);
}

void Reactor::Spin() {
  while (running()) {
    Refresh();
    DrainPosted();
    uv_run(&loop_, UV_RUN_ONCE);
  }
  Refresh();
}

void Reactor::Refresh() {
  uv_update_time(&loop_);
  now_ms_ = uv_now(&loop_);
}

void Reactor::DrainPosted() {
  if (!has_posted_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  std::vector<std::function<void()>> batch;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    batch.swap(posted_);
  }
  // Callbacks posted from here wait for the next drain
  for (auto& callback : batch) {
    callback();
  }
}

void Reactor::CloseWatch(std::unique_ptr<Watch> watch) {
  // Freed by the close callback
  Watch* raw = watch.release();
  uv_poll_stop(&raw->poll);
  uv_close(AsHandle(&raw->poll), [](uv_handle_t* handle) {
    delete static_cast<Watch*>(handle->data);
  });
}

void Reactor::OnPoll(uv_poll_t* poll, int status, int events) {
  auto* watch = static_cast<Watch*>(poll->data);
  if (watch->handler == nullptr) {
    return;
  }

  if (status < 0) {
    watch->handler->OnError(-status);
    return;
  }

  // Each callback may remove the handler
  if ((events & UV_READABLE) != 0) {
    watch->handler->OnReadable();
  }
  if ((events & UV_WRITABLE) != 0 && watch->handler != nullptr) {
    watch->handler->OnWritable();
  }
  if ((events & UV_DISCONNECT) != 0 && watch->handler != nullptr) {
    watch->handler->OnClose();
  }
}

void Reactor::OnDeadline(uv_timer_t* timer) {
  static_cast<Reactor*>(timer->data)->Stop();
}

void Reactor::OnWakeup(uv_async_t* async) {
  static_cast<Reactor*>(async->data)->DrainPosted();
}

}  // namespace core
}  // namespace tunnelpool
