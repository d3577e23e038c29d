// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/pool/pool_member.h"

#include <algorithm>
#include <utility>

namespace tunnelpool {
namespace pool {

const char* MemberEventName(MemberEventType type) {
  switch (type) {
    case MemberEventType::kConnected:
      return "connect";
    case MemberEventType::kDisconnected:
      return "disconnect";
    case MemberEventType::kConnectionError:
      return "connectionError";
    case MemberEventType::kDrained:
      return "drain";
  }
  return "unknown";
}

void LifecycleChannel::Send(MemberEvent event) {
  events_.push_back(std::move(event));
  if (pumping_) {
    return;
  }

  pumping_ = true;
  while (!events_.empty()) {
    MemberEvent next = std::move(events_.front());
    events_.pop_front();
    consumer_(next);
  }
  pumping_ = false;
}

void LifecycleChannel::Forget(const PoolMember* member) {
  std::erase_if(events_, [member](const MemberEvent& event) {
    return event.member == member;
  });
}

void PoolMember::Emit(MemberEventType type, Error error) {
  if (channel_ != nullptr) {
    channel_->Send({type, this, std::move(error)});
  }
}

void PoolMember::SetConnected(bool connected) {
  connected_ = connected;
  if (!connected) {
    busy_ = false;
  }
}

}  // namespace pool
}  // namespace tunnelpool
