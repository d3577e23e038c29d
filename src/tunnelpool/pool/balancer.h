// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_POOL_BALANCER_H_
#define TUNNELPOOL_POOL_BALANCER_H_

#include <cstddef>
#include <vector>

#include "tunnelpool/pool/pool_member.h"

namespace tunnelpool {
namespace pool {

// Interleaved weighted round robin (LVS/Nginx style). A cursor walks the
// member list; each wrap lowers the current weight by the GCD of all
// weights, and a member is eligible while its weight is at least the current
// weight. Over one cycle each member is picked weight/gcd times.
//
// Members are not owned. NOT thread-safe.
class WeightedRoundRobinBalancer {
 public:
  static constexpr int kMaxWeight = 100;
  static constexpr int kMinWeight = 1;
  static constexpr int kWeightStep = 15;

  void Add(PoolMember* member);
  void Remove(PoolMember* member);

  // Next free member, or nullptr if every member is busy or disconnected.
  PoolMember* Next();

  // Connection failure: weight -= 15, floor 1
  void Penalize(PoolMember* member);

  // Sustained success: weight += 15, cap 100
  void Reward(PoolMember* member);

  bool HasAvailable() const;
  bool Contains(const PoolMember* member) const;

  int gcd() const { return gcd_; }
  int max_weight() const { return max_weight_; }
  int current_weight() const { return current_weight_; }
  size_t size() const { return members_.size(); }
  const std::vector<PoolMember*>& members() const { return members_; }

 private:
  // Refresh gcd and max weight after any membership or weight change
  void Recompute();

  std::vector<PoolMember*> members_;
  int gcd_ = 0;
  int max_weight_ = 0;
  int current_weight_ = 0;
  int index_ = -1;
};

}  // namespace pool
}  // namespace tunnelpool

#endif  // TUNNELPOOL_POOL_BALANCER_H_
