// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/pool/balancer.h"

#include <algorithm>
#include <numeric>

#include <spdlog/spdlog.h>

namespace tunnelpool {
namespace pool {

void WeightedRoundRobinBalancer::Add(PoolMember* member) {
  if (member == nullptr || Contains(member)) {
    return;
  }
  member->set_weight(
      std::clamp(member->weight(), kMinWeight, kMaxWeight));
  members_.push_back(member);
  Recompute();
}

void WeightedRoundRobinBalancer::Remove(PoolMember* member) {
  auto it = std::find(members_.begin(), members_.end(), member);
  if (it == members_.end()) {
    return;
  }
  int removed = static_cast<int>(it - members_.begin());
  members_.erase(it);

  // Keep the cursor on the member that followed the removed one
  if (removed <= index_) {
    --index_;
  }
  Recompute();
}

PoolMember* WeightedRoundRobinBalancer::Next() {
  if (members_.empty()) {
    return nullptr;
  }

  int n = static_cast<int>(members_.size());

  // Enough steps for the current weight to fall from max to gcd once more
  size_t max_steps =
      members_.size() * static_cast<size_t>(max_weight_ / gcd_ + 1);

  for (size_t step = 0; step < max_steps; ++step) {
    index_ = (index_ + 1) % n;
    if (index_ == 0) {
      current_weight_ -= gcd_;
      if (current_weight_ <= 0) {
        current_weight_ = max_weight_;
      }
    }

    PoolMember* member = members_[static_cast<size_t>(index_)];
    if (member->weight() >= current_weight_ && member->IsFree()) {
      return member;
    }
  }

  return nullptr;
}

void WeightedRoundRobinBalancer::Penalize(PoolMember* member) {
  int weight = std::max(kMinWeight, member->weight() - kWeightStep);
  SPDLOG_DEBUG("balancer: penalize {} weight {} -> {}", member->origin(),
               member->weight(), weight);
  member->set_weight(weight);
  Recompute();
}

void WeightedRoundRobinBalancer::Reward(PoolMember* member) {
  int weight = std::min(kMaxWeight, member->weight() + kWeightStep);
  SPDLOG_DEBUG("balancer: reward {} weight {} -> {}", member->origin(),
               member->weight(), weight);
  member->set_weight(weight);
  Recompute();
}

bool WeightedRoundRobinBalancer::HasAvailable() const {
  return std::any_of(members_.begin(), members_.end(),
                     [](const PoolMember* m) { return m->IsFree(); });
}

bool WeightedRoundRobinBalancer::Contains(const PoolMember* member) const {
  return std::find(members_.begin(), members_.end(), member) !=
         members_.end();
}

void WeightedRoundRobinBalancer::Recompute() {
  gcd_ = 0;
  max_weight_ = 0;
  for (const PoolMember* member : members_) {
    gcd_ = std::gcd(gcd_, member->weight());
    max_weight_ = std::max(max_weight_, member->weight());
  }

  if (members_.empty()) {
    index_ = -1;
    current_weight_ = 0;
    return;
  }

  if (index_ >= static_cast<int>(members_.size())) {
    index_ = -1;
  }
  current_weight_ = std::min(current_weight_, max_weight_);
}

}  // namespace pool
}  // namespace tunnelpool
