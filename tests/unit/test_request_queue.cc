// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/pool/request_queue.h"

#include <cassert>
#include <memory>
#include <print>
#include <string>

using tunnelpool::pool::FixedRingSegment;
using tunnelpool::pool::RequestQueue;

void TestEmptyQueue() {
  std::print("Testing empty queue... ");

  RequestQueue<int> queue;
  assert(queue.IsEmpty());
  assert(queue.size() == 0);
  assert(!queue.Shift().has_value());
  assert(queue.segment_count() == 1);

  std::println("PASSED");
}

void TestFifoOrder() {
  std::print("Testing FIFO order... ");

  RequestQueue<std::string> queue;
  queue.Push("a");
  queue.Push("b");
  queue.Push("c");
  assert(queue.size() == 3);

  assert(*queue.Shift() == "a");
  queue.Push("d");
  assert(*queue.Shift() == "b");
  assert(*queue.Shift() == "c");
  assert(*queue.Shift() == "d");
  assert(queue.IsEmpty());
  assert(!queue.Shift().has_value());

  std::println("PASSED");
}

void TestSegmentCapacity() {
  std::print("Testing segment capacity... ");

  FixedRingSegment<int> segment;
  size_t pushed = 0;
  while (!segment.IsFull()) {
    segment.Push(static_cast<int>(pushed++));
  }
  // One slot is kept free
  assert(pushed == FixedRingSegment<int>::kCapacity - 1);
  assert(segment.size() == pushed);

  assert(*segment.Shift() == 0);
  assert(!segment.IsFull());

  std::println("PASSED");
}

void TestGrowsAcrossSegments() {
  std::print("Testing growth across segments... ");

  RequestQueue<int> queue;
  constexpr int kCount = 5000;
  for (int i = 0; i < kCount; ++i) {
    queue.Push(i);
  }
  assert(queue.size() == kCount);
  assert(queue.segment_count() == 3);

  for (int i = 0; i < kCount; ++i) {
    auto item = queue.Shift();
    assert(item.has_value());
    assert(*item == i);
  }
  assert(queue.IsEmpty());

  // Drained segments are unlinked
  assert(queue.segment_count() == 1);

  std::println("PASSED");
}

void TestMoveOnlyItems() {
  std::print("Testing move-only items... ");

  RequestQueue<std::unique_ptr<int>> queue;
  queue.Push(std::make_unique<int>(7));
  queue.Push(std::make_unique<int>(8));

  auto first = queue.Shift();
  assert(first.has_value() && **first == 7);
  auto second = queue.Shift();
  assert(second.has_value() && **second == 8);
  assert(queue.IsEmpty());

  std::println("PASSED");
}

void TestWrapAround() {
  std::print("Testing ring wrap-around... ");

  RequestQueue<int> queue;
  int next_in = 0;
  int next_out = 0;
  for (int i = 0; i < 10; ++i) {
    queue.Push(next_in++);
  }

  // A fixed window moves through the ring many times
  for (int round = 0; round < 10000; ++round) {
    queue.Push(next_in++);
    assert(*queue.Shift() == next_out++);
  }
  assert(queue.size() == 10);
  assert(queue.segment_count() == 1);

  while (auto item = queue.Shift()) {
    assert(*item == next_out++);
  }
  assert(next_out == next_in);
  assert(queue.IsEmpty());

  std::println("PASSED");
}

int main() {
  std::println("=== RequestQueue Unit Tests ===");

  TestEmptyQueue();
  TestFifoOrder();
  TestSegmentCapacity();
  TestGrowsAcrossSegments();
  TestMoveOnlyItems();
  TestWrapAround();

  std::println("\nAll request queue tests passed!");
  return 0;
}
