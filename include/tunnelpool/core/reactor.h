// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_CORE_REACTOR_H_
#define TUNNELPOOL_CORE_REACTOR_H_

#include <uv.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace tunnelpool {
namespace core {

// Readiness interest, expressed in libuv poll flags
enum class EventType : uint32_t {
  kNone = 0,
  kRead = UV_READABLE,
  kWrite = UV_WRITABLE,
  kReadWrite = UV_READABLE | UV_WRITABLE,
};

inline EventType operator|(EventType a, EventType b) {
  return static_cast<EventType>(static_cast<uint32_t>(a) |
                                static_cast<uint32_t>(b));
}

// Receives readiness notifications for one file descriptor.
class EventHandler {
 public:
  virtual ~EventHandler() = default;

  virtual int fd() const = 0;
  virtual void OnReadable() = 0;
  virtual void OnWritable() = 0;
  virtual void OnError(int error_code) = 0;
  virtual void OnClose() = 0;
};

// Single-threaded libuv loop driving every pool member of a process.
// Post() and Stop() may be called from any thread; everything else belongs
// to the loop thread.
class Reactor {
 public:
  // Throws std::runtime_error if libuv cannot be initialized.
  Reactor();
  ~Reactor();

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  // Starts watching handler->fd(). Fails if the fd is already watched.
  bool Add(EventHandler* handler, EventType events);

  // Replaces the interest set of a watched handler.
  bool Modify(EventHandler* handler, EventType events);

  // Stops watching. Must happen before the fd is closed; safe from inside
  // the handler's own callbacks.
  bool Remove(EventHandler* handler);

  // Runs until Stop().
  void Run();
  // One non-blocking pass over ready events and posted callbacks.
  void RunOnce();
  // Runs until Stop() or until timeout_ms elapses.
  void RunFor(int timeout_ms);
  void Stop();

  bool running() const { return running_.load(std::memory_order_acquire); }

  // Loop time in milliseconds, refreshed around each iteration
  uint64_t now_ms() const { return now_ms_; }

  void Post(std::function<void()> callback);

  size_t handler_count() const { return watches_.size(); }

  uv_loop_t* loop() { return &loop_; }

 private:
  struct Watch {
    uv_poll_t poll;
    EventHandler* handler;  // Null once removed
  };

  void Spin();
  void Refresh();
  void DrainPosted();
  void CloseWatch(std::unique_ptr<Watch> watch);

  static void OnPoll(uv_poll_t* poll, int status, int events);
  static void OnDeadline(uv_timer_t* timer);
  static void OnWakeup(uv_async_t* async);

  uv_loop_t loop_;
  uv_async_t wakeup_;
  uv_timer_t deadline_;
  std::atomic<bool> running_{false};
  uint64_t now_ms_ = 0;

  std::unordered_map<int, std::unique_ptr<Watch>> watches_;

  std::mutex posted_mutex_;
  std::vector<std::function<void()>> posted_;
  std::atomic<bool> has_posted_{false};
};

}  // namespace core
}  // namespace tunnelpool

#endif  // TUNNELPOOL_CORE_REACTOR_H_
