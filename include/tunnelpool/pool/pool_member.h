// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_POOL_POOL_MEMBER_H_
#define TUNNELPOOL_POOL_POOL_MEMBER_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <utility>

#include "tunnelpool/dispatch.h"
#include "tunnelpool/error.h"

namespace tunnelpool {
namespace pool {

class PoolMember;

enum class MemberEventType {
  kConnected,
  kDisconnected,
  kConnectionError,
  kDrained,  // Spare capacity again after refusing work
};

const char* MemberEventName(MemberEventType type);

struct MemberEvent {
  MemberEventType type;
  PoolMember* member;
  Error error;
};

// Carries member lifecycle events to the owning pool. Events sent while the
// consumer is running are queued and handled by the same loop, so the
// consumer never re-enters itself.
class LifecycleChannel {
 public:
  using Consumer = std::function<void(const MemberEvent&)>;

  explicit LifecycleChannel(Consumer consumer)
      : consumer_(std::move(consumer)) {}

  // Non-copyable, non-movable
  LifecycleChannel(const LifecycleChannel&) = delete;
  LifecycleChannel& operator=(const LifecycleChannel&) = delete;
  LifecycleChannel(LifecycleChannel&&) = delete;
  LifecycleChannel& operator=(LifecycleChannel&&) = delete;

  void Send(MemberEvent event);

  // Drops queued events of a member that is going away
  void Forget(const PoolMember* member);

  size_t pending() const { return events_.size(); }

 private:
  Consumer consumer_;
  std::deque<MemberEvent> events_;
  bool pumping_ = false;
};

// One connection-capable endpoint tracked by a ConnectionPool.
//
// Counters:
//   queued  - accepted but waiting for the connection to become usable
//   pending - assigned to the connection, request not fully written
//   running - written, response not complete
// size() is always their sum.
class PoolMember {
 public:
  static constexpr int kDefaultWeight = 100;

  // weight is clamped to [1, 100] when the member joins a balancer.
  explicit PoolMember(std::string origin, int weight = kDefaultWeight)
      : origin_(std::move(origin)), weight_(weight) {}
  virtual ~PoolMember() = default;

  // Non-copyable, non-movable
  PoolMember(const PoolMember&) = delete;
  PoolMember& operator=(const PoolMember&) = delete;
  PoolMember(PoolMember&&) = delete;
  PoolMember& operator=(PoolMember&&) = delete;

  // Takes the request. Returns false when the member has no spare capacity
  // afterwards; the request is accepted either way.
  virtual bool Dispatch(DispatchRequest request) = 0;

  // Finishes in-flight and queued work, refuses new work, then closes.
  virtual void Close(std::function<void()> on_closed) = 0;

  // Fails all work with error and closes immediately.
  virtual void Destroy(const Error& error,
                       std::function<void()> on_destroyed) = 0;

  // Connected, or able to become connected without outside help. Members
  // that cannot are never handed work while down.
  virtual bool CanConnect() const { return !closed_; }

  const std::string& origin() const { return origin_; }
  int weight() const { return weight_; }
  bool connected() const { return connected_; }
  bool busy() const { return busy_; }
  bool closed() const { return closed_; }
  bool destroyed() const { return destroyed_; }

  size_t pending() const { return pending_; }
  size_t running() const { return running_; }
  size_t queued() const { return queued_; }
  size_t size() const { return pending_ + running_ + queued_; }

  size_t consecutive_successes() const { return consecutive_successes_; }

  // Eligible for new work from the balancer
  bool IsFree() const {
    return connected_ && !busy_ && !closed_ && !destroyed_;
  }

 protected:
  void Emit(MemberEventType type, Error error = {});

  // Dropping the connection also clears busy
  void SetConnected(bool connected);
  void MarkClosed() { closed_ = true; }
  void MarkDestroyed() {
    destroyed_ = true;
    closed_ = true;
  }

  void RecordSuccess() { ++consecutive_successes_; }
  void RecordFailure() { consecutive_successes_ = 0; }

  size_t pending_ = 0;
  size_t running_ = 0;
  size_t queued_ = 0;

 private:
  friend class ConnectionPool;
  friend class WeightedRoundRobinBalancer;

  void Attach(LifecycleChannel* channel) { channel_ = channel; }
  void SetBusy(bool busy) { busy_ = busy && connected_; }
  void set_weight(int weight) { weight_ = weight; }
  void ResetSuccesses() { consecutive_successes_ = 0; }

  std::string origin_;
  int weight_ = kDefaultWeight;
  bool connected_ = false;
  bool busy_ = false;
  bool closed_ = false;
  bool destroyed_ = false;
  size_t consecutive_successes_ = 0;
  LifecycleChannel* channel_ = nullptr;
};

}  // namespace pool
}  // namespace tunnelpool

#endif  // TUNNELPOOL_POOL_POOL_MEMBER_H_
