// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/pool/connection_pool.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace tunnelpool {
namespace pool {

ConnectionPool::ConnectionPool(std::string origin, PoolConfig config,
                               PoolCallbacks callbacks, MemberFactory factory)
    : origin_(std::move(origin)),
      config_(std::move(config)),
      callbacks_(std::move(callbacks)),
      factory_(std::move(factory)),
      channel_([this](const MemberEvent& event) { OnMemberEvent(event); }) {}

ConnectionPool::~ConnectionPool() {
  alive_.reset();

  while (auto request = queue_.Shift()) {
    request->Fail(Error::PoolDestroyed());
  }

  // Members outlive the channel; stop them from reporting into it
  for (auto& member : members_) {
    member->Attach(nullptr);
  }
  for (auto& member : retiring_) {
    member->Attach(nullptr);
  }
}

bool ConnectionPool::Dispatch(DispatchOptions options,
                              std::shared_ptr<DispatchHandler> handler) {
  DispatchRequest request(std::move(options), std::move(handler));

  if (destroyed_) {
    request.Fail(Error::PoolDestroyed());
    return false;
  }
  if (closed_) {
    request.Fail(Error::PoolClosed());
    return false;
  }
  if (request.aborted()) {
    request.Fail(request.options().signal->reason());
    return !needs_drain_;
  }

  // Requests already waiting keep their place
  if (!queue_.IsEmpty()) {
    Enqueue(std::move(request));
    return false;
  }

  return Route(std::move(request));
}

bool ConnectionPool::Route(DispatchRequest request) {
  PoolMember* member = AcquireMember();
  if (member == nullptr) {
    Enqueue(std::move(request));
    return false;
  }

  if (!member->Dispatch(std::move(request))) {
    member->SetBusy(true);
    needs_drain_ = !balancer_.HasAvailable();
  }
  return !needs_drain_;
}

void ConnectionPool::Enqueue(DispatchRequest request) {
  needs_drain_ = true;
  request.WatchAbort(request.Failer());
  queue_.Push(std::move(request));
  SPDLOG_TRACE("pool {}: queued request, {} waiting", origin_, queue_.size());
}

PoolMember* ConnectionPool::AcquireMember() {
  if (PoolMember* member = balancer_.Next()) {
    return member;
  }

  // A member still connecting holds requests until it is up
  size_t depth = std::max<size_t>(config_.pipelining, 1);
  for (auto& member : members_) {
    if (!member->connected() && member->CanConnect() &&
        member->size() < depth) {
      return member.get();
    }
  }

  if (!factory_ || closed_) {
    return nullptr;
  }
  if (config_.connections != 0 && members_.size() >= config_.connections) {
    return nullptr;
  }

  std::unique_ptr<PoolMember> member = factory_(origin_);
  if (!member) {
    return nullptr;
  }
  SPDLOG_DEBUG("pool {}: creating member {}", origin_, members_.size() + 1);
  return AddMember(std::move(member));
}

PoolMember* ConnectionPool::AddMember(std::unique_ptr<PoolMember> member) {
  PoolMember* raw = member.get();
  raw->Attach(&channel_);
  members_.push_back(std::move(member));
  balancer_.Add(raw);

  if (needs_drain_ && raw->IsFree()) {
    channel_.Send({MemberEventType::kDrained, raw, {}});
  }
  return raw;
}

void ConnectionPool::RemoveMember(PoolMember* member) {
  auto it = std::find_if(members_.begin(), members_.end(),
                         [member](const auto& m) { return m.get() == member; });
  if (it == members_.end()) {
    return;
  }

  channel_.Forget(member);
  balancer_.Remove(member);
  retiring_.push_back(std::move(*it));
  members_.erase(it);

  if (!queue_.IsEmpty() && !balancer_.HasAvailable()) {
    needs_drain_ = true;
  }

  std::weak_ptr<bool> alive = alive_;
  member->Close([this, alive, member] {
    if (alive.expired()) {
      return;
    }
    channel_.Forget(member);
    std::erase_if(retiring_,
                  [member](const auto& m) { return m.get() == member; });
    MaybeFinishClose();
  });
}

PoolStats ConnectionPool::Stats() const {
  PoolStats stats;
  stats.queued = queue_.size();
  stats.pending = queue_.size();
  stats.size = queue_.size();

  for (const auto& member : members_) {
    if (member->connected()) {
      ++stats.connected;
    }
    if (member->IsFree()) {
      ++stats.free;
    }
    stats.pending += member->pending();
    stats.queued += member->queued();
    stats.running += member->running();
    stats.size += member->size();
  }
  return stats;
}

void ConnectionPool::Close(std::function<void()> on_closed) {
  if (on_closed) {
    if (close_done_) {
      on_closed();
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

  if (closed_) {
    return;
  }
  closed_ = true;

  if (queue_.IsEmpty()) {
    CloseMembers();
  }
}

void ConnectionPool::Destroy(const Error& error,
                             std::function<void()> on_destroyed) {
  if (destroyed_) {
    if (on_destroyed) {
      on_destroyed();
    }
    return;
  }
  destroyed_ = true;
  closed_ = true;
  needs_drain_ = false;

  SPDLOG_DEBUG("pool {}: destroy with {} queued: {}", origin_, queue_.size(),
               error.ToString());

  // Already-dispatched requests belong to their members
  while (auto request = queue_.Shift()) {
    request->Fail(error);
  }

  std::vector<PoolMember*> targets;
  for (auto& member : members_) {
    targets.push_back(member.get());
  }
  for (auto& member : retiring_) {
    targets.push_back(member.get());
  }

  struct Countdown {
    size_t remaining;
    std::function<void()> done;
  };
  auto countdown = std::make_shared<Countdown>(
      Countdown{targets.size() + 1, std::move(on_destroyed)});

  std::weak_ptr<bool> alive = alive_;
  auto finish = [this, alive, countdown] {
    if (--countdown->remaining > 0) {
      return;
    }
    if (!alive.expired() && !close_done_) {
      close_done_ = true;
      auto on_closed = std::move(on_closed_);
      on_closed_ = nullptr;
      if (on_closed) {
        on_closed();
      }
    }
    if (countdown->done) {
      countdown->done();
    }
  };

  for (PoolMember* member : targets) {
    member->Destroy(error, finish);
  }
  finish();
}

void ConnectionPool::OnMemberEvent(const MemberEvent& event) {
  PoolMember* member = event.member;
  bool active = IsActiveMember(member);

  SPDLOG_TRACE("pool {}: member {} ({})", origin_,
               MemberEventName(event.type), active ? "active" : "retiring");

  switch (event.type) {
    case MemberEventType::kConnected:
      if (callbacks_.on_connect) {
        callbacks_.on_connect(origin_, member);
      }
      if (active) {
        Drain(member);
      }
      break;

    case MemberEventType::kDisconnected:
      if (callbacks_.on_disconnect) {
        callbacks_.on_disconnect(origin_, member, event.error);
      }
      RetireIfDead(member);
      break;

    case MemberEventType::kConnectionError:
      if (active) {
        balancer_.Penalize(member);
        member->ResetSuccesses();
      }
      if (callbacks_.on_connection_error) {
        callbacks_.on_connection_error(origin_, member, event.error);
      }
      RetireIfDead(member);
      break;

    case MemberEventType::kDrained:
      if (!active) {
        break;
      }
      member->SetBusy(false);
      if (config_.reward_after_successes > 0 &&
          member->consecutive_successes() >= config_.reward_after_successes) {
        balancer_.Reward(member);
        member->ResetSuccesses();
      }
      Drain(member);
      break;
  }
}

void ConnectionPool::Drain(PoolMember* member) {
  if (destroyed_) {
    return;
  }

  while (member->IsFree()) {
    std::optional<DispatchRequest> request = queue_.Shift();
    if (!request) {
      break;
    }
    request->UnwatchAbort();
    if (request->settled()) {
      continue;  // Aborted while queued
    }
    if (!member->Dispatch(std::move(*request))) {
      member->SetBusy(true);
    }
  }

  // Fire on_drain once per transition out of the needs-drain state
  if (member->IsFree() && needs_drain_) {
    needs_drain_ = false;
    if (callbacks_.on_drain) {
      callbacks_.on_drain(origin_);
    }
  }

  if (closed_ && queue_.IsEmpty()) {
    CloseMembers();
  }
}

void ConnectionPool::CloseMembers() {
  if (closing_members_) {
    return;
  }
  closing_members_ = true;

  std::vector<PoolMember*> targets;
  for (auto& member : members_) {
    targets.push_back(member.get());
  }
  members_open_ = targets.size();

  std::weak_ptr<bool> alive = alive_;
  for (PoolMember* member : targets) {
    member->Close([this, alive] {
      if (alive.expired()) {
        return;
      }
      --members_open_;
      MaybeFinishClose();
    });
  }
  MaybeFinishClose();
}

void ConnectionPool::MaybeFinishClose() {
  if (!closing_members_ || close_done_ || members_open_ > 0 ||
      !retiring_.empty()) {
    return;
  }
  close_done_ = true;
  SPDLOG_DEBUG("pool {}: closed", origin_);

  auto on_closed = std::move(on_closed_);
  on_closed_ = nullptr;
  if (on_closed) {
    on_closed();
  }
}

void ConnectionPool::RetireIfDead(PoolMember* member) {
  if (closed_ || destroyed_ || !IsActiveMember(member) || member->closed() ||
      member->connected() || member->CanConnect()) {
    return;
  }
  SPDLOG_DEBUG("pool {}: retiring member that cannot reconnect", origin_);
  RemoveMember(member);
}

bool ConnectionPool::IsActiveMember(const PoolMember* member) const {
  return balancer_.Contains(member);
}

}  // namespace pool
}  // namespace tunnelpool
