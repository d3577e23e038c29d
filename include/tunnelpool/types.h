// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_TYPES_H_
#define TUNNELPOOL_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tunnelpool/error.h"

namespace tunnelpool {

// HTTP header pair
struct Header {
  std::string name;
  std::string value;
};

// Collection of HTTP headers, in wire order
using Headers = std::vector<Header>;

// Result type for operations that can fail
template <typename T>
struct Result {
  T value;
  Error error;

  explicit operator bool() const { return error.ok(); }
  bool ok() const { return error.ok(); }

  static Result Ok(T val) { return {std::move(val), {}}; }

  static Result Err(Error err) { return {{}, std::move(err)}; }
};

// Non-owning view of bytes
struct ByteSpan {
  const uint8_t* data;
  size_t size;

  ByteSpan() : data(nullptr), size(0) {}
  ByteSpan(const uint8_t* d, size_t s) : data(d), size(s) {}
  ByteSpan(const char* d, size_t s)
      : data(reinterpret_cast<const uint8_t*>(d)), size(s) {}

  explicit ByteSpan(std::string_view sv)
      : data(reinterpret_cast<const uint8_t*>(sv.data())), size(sv.size()) {}

  bool empty() const { return size == 0; }

  std::string_view as_string_view() const {
    return {reinterpret_cast<const char*>(data), size};
  }
};

}  // namespace tunnelpool

#endif  // TUNNELPOOL_TYPES_H_
