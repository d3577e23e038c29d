// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// In-memory ByteStream for driving tunnel state machines without sockets.

#ifndef TUNNELPOOL_TESTS_UNIT_SCRIPTED_STREAM_H_
#define TUNNELPOOL_TESTS_UNIT_SCRIPTED_STREAM_H_

#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include "tunnelpool/core/byte_stream.h"

namespace tunnelpool {
namespace testing {

class ScriptedStream : public core::ByteStream {
 public:
  util::socket_t fd() const override { return util::kInvalidSocket; }

  ssize_t Read(uint8_t* dest, size_t max_len,
               core::IoResult* result) override {
    size_t available = incoming_.size() - read_offset_;
    if (available == 0) {
      if (eof_) {
        *result = core::IoResult::kEof;
        return 0;
      }
      *result = core::IoResult::kWantRead;
      return -1;
    }
    size_t n = std::min(available, max_len);
    std::memcpy(dest, incoming_.data() + read_offset_, n);
    read_offset_ += n;
    *result = core::IoResult::kOk;
    return static_cast<ssize_t>(n);
  }

  core::IoResult Write(const uint8_t* data, size_t len,
                       size_t* written) override {
    if (fail_writes_) {
      *written = 0;
      last_error_ = "broken pipe";
      return core::IoResult::kError;
    }
    size_t n = std::min(len, write_limit_);
    written_.append(reinterpret_cast<const char*>(data), n);
    *written = n;
    return n < len ? core::IoResult::kWantWrite : core::IoResult::kOk;
  }

  const std::string& last_error() const override { return last_error_; }

  // Bytes the peer sends next
  void Feed(const std::vector<uint8_t>& bytes) {
    incoming_.append(bytes.begin(), bytes.end());
  }
  void FeedText(std::string_view text) { incoming_.append(text); }

  void Close() { eof_ = true; }
  void FailWrites() { fail_writes_ = true; }
  void LimitWrites(size_t limit) { write_limit_ = limit; }

  // Everything written so far, then cleared
  std::string TakeWritten() {
    std::string out = std::move(written_);
    written_.clear();
    return out;
  }

  // Fed bytes not consumed yet
  std::string Unread() const { return incoming_.substr(read_offset_); }

 private:
  std::string incoming_;
  size_t read_offset_ = 0;
  std::string written_;
  std::string last_error_;
  size_t write_limit_ = static_cast<size_t>(-1);
  bool eof_ = false;
  bool fail_writes_ = false;
};

inline std::string Bytes(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace testing
}  // namespace tunnelpool

#endif  // TUNNELPOOL_TESTS_UNIT_SCRIPTED_STREAM_H_
