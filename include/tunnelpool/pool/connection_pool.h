// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_POOL_CONNECTION_POOL_H_
#define TUNNELPOOL_POOL_CONNECTION_POOL_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "tunnelpool/config.h"
#include "tunnelpool/dispatch.h"
#include "tunnelpool/error.h"
#include "tunnelpool/pool/balancer.h"
#include "tunnelpool/pool/pool_member.h"
#include "tunnelpool/pool/request_queue.h"

namespace tunnelpool {
namespace pool {

// Aggregate counters. pending, queued and size include the pool queue.
struct PoolStats {
  size_t connected = 0;
  size_t free = 0;
  size_t pending = 0;
  size_t queued = 0;
  size_t running = 0;
  size_t size = 0;
};

struct PoolCallbacks {
  // Edge-triggered: the pool stopped refusing work
  std::function<void(const std::string& origin)> on_drain;
  std::function<void(const std::string& origin, PoolMember* member)>
      on_connect;
  std::function<void(const std::string& origin, PoolMember* member,
                     const Error& error)>
      on_disconnect;
  std::function<void(const std::string& origin, PoolMember* member,
                     const Error& error)>
      on_connection_error;
};

// Creates a member for the origin when the pool has none free and is under
// its connection cap. The member should already be connecting.
using MemberFactory =
    std::function<std::unique_ptr<PoolMember>(const std::string& origin)>;

// Balances requests for one origin across its members and queues them when
// every member is at capacity.
//
// NOT thread-safe: the pool and its members live on one event loop.
class ConnectionPool {
 public:
  ConnectionPool(std::string origin, PoolConfig config,
                 PoolCallbacks callbacks = {}, MemberFactory factory = {});
  ~ConnectionPool();

  // Non-copyable, non-movable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;
  ConnectionPool(ConnectionPool&&) = delete;
  ConnectionPool& operator=(ConnectionPool&&) = delete;

  // Returns false when the caller should hold further dispatches until
  // on_drain. The handler always gets exactly one terminal callback.
  bool Dispatch(DispatchOptions options,
                std::shared_ptr<DispatchHandler> handler);

  PoolMember* AddMember(std::unique_ptr<PoolMember> member);

  // Stops routing to the member and closes it gracefully.
  void RemoveMember(PoolMember* member);

  PoolStats Stats() const;

  // Refuses new dispatches. on_closed runs once the queue is empty and every
  // member has closed.
  void Close(std::function<void()> on_closed = {});

  // Fails every queued request with error, then destroys every member.
  void Destroy(const Error& error, std::function<void()> on_destroyed = {});

  const std::string& origin() const { return origin_; }
  const PoolConfig& config() const { return config_; }
  bool needs_drain() const { return needs_drain_; }
  bool closed() const { return closed_; }
  bool destroyed() const { return destroyed_; }
  size_t member_count() const { return members_.size(); }
  size_t queued() const { return queue_.size(); }

  WeightedRoundRobinBalancer& balancer() { return balancer_; }

 private:
  bool Route(DispatchRequest request);
  void Enqueue(DispatchRequest request);
  PoolMember* AcquireMember();

  void OnMemberEvent(const MemberEvent& event);
  void Drain(PoolMember* member);
  void RetireIfDead(PoolMember* member);

  void CloseMembers();
  void MaybeFinishClose();
  bool IsActiveMember(const PoolMember* member) const;

  std::string origin_;
  PoolConfig config_;
  PoolCallbacks callbacks_;
  MemberFactory factory_;

  std::vector<std::unique_ptr<PoolMember>> members_;
  std::vector<std::unique_ptr<PoolMember>> retiring_;  // Removed, closing

  WeightedRoundRobinBalancer balancer_;
  RequestQueue<DispatchRequest> queue_;
  LifecycleChannel channel_;

  bool needs_drain_ = false;
  bool closed_ = false;
  bool destroyed_ = false;
  bool closing_members_ = false;
  bool close_done_ = false;
  size_t members_open_ = 0;
  std::function<void()> on_closed_;

  // Outlives callbacks handed to members
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace pool
}  // namespace tunnelpool

#endif  // TUNNELPOOL_POOL_CONNECTION_POOL_H_
