// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// FIFO queue of pending dispatches built from fixed-size ring segments.
// Push and Shift never move stored elements; a full segment links a new one
// at the head and a drained segment is unlinked from the tail.

#ifndef TUNNELPOOL_POOL_REQUEST_QUEUE_H_
#define TUNNELPOOL_POOL_REQUEST_QUEUE_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace tunnelpool {
namespace pool {

template <typename T>
class FixedRingSegment {
 public:
  static constexpr size_t kCapacity = 2048;
  static constexpr size_t kMask = kCapacity - 1;

  FixedRingSegment() : slots_(kCapacity) {}

  // One slot stays free to tell full from empty
  bool IsEmpty() const { return top_ == bottom_; }
  bool IsFull() const { return ((top_ + 1) & kMask) == bottom_; }

  void Push(T item) {
    slots_[top_].emplace(std::move(item));
    top_ = (top_ + 1) & kMask;
  }

  std::optional<T> Shift() {
    if (IsEmpty()) {
      return std::nullopt;
    }
    std::optional<T> item(std::move(*slots_[bottom_]));
    slots_[bottom_].reset();
    bottom_ = (bottom_ + 1) & kMask;
    return item;
  }

  size_t size() const { return (top_ - bottom_) & kMask; }

  std::unique_ptr<FixedRingSegment> next;

 private:
  std::vector<std::optional<T>> slots_;
  size_t top_ = 0;
  size_t bottom_ = 0;
};

// NOT thread-safe. Owned by a single pool on its event loop.
template <typename T>
class RequestQueue {
 public:
  RequestQueue()
      : tail_(std::make_unique<FixedRingSegment<T>>()), head_(tail_.get()) {}

  // Non-copyable, non-movable
  RequestQueue(const RequestQueue&) = delete;
  RequestQueue& operator=(const RequestQueue&) = delete;
  RequestQueue(RequestQueue&&) = delete;
  RequestQueue& operator=(RequestQueue&&) = delete;

  bool IsEmpty() const { return head_->IsEmpty(); }

  void Push(T item) {
    if (head_->IsFull()) {
      head_->next = std::make_unique<FixedRingSegment<T>>();
      head_ = head_->next.get();
    }
    head_->Push(std::move(item));
    ++size_;
  }

  std::optional<T> Shift() {
    std::optional<T> item = tail_->Shift();
    if (tail_->IsEmpty() && tail_->next) {
      tail_ = std::move(tail_->next);
    }
    if (item) {
      --size_;
    }
    return item;
  }

  size_t size() const { return size_; }

  // Number of linked segments
  size_t segment_count() const {
    size_t count = 0;
    for (auto* segment = tail_.get(); segment; segment = segment->next.get()) {
      ++count;
    }
    return count;
  }

 private:
  std::unique_ptr<FixedRingSegment<T>> tail_;  // Read end, owns the chain
  FixedRingSegment<T>* head_;                  // Write end
  size_t size_ = 0;
};

}  // namespace pool
}  // namespace tunnelpool

#endif  // TUNNELPOOL_POOL_REQUEST_QUEUE_H_
