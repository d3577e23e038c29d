// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/core/byte_stream.h"

#include "tunnelpool/util/socket_utils.h"

namespace tunnelpool {
namespace core {

PlainStream::~PlainStream() {
  if (fd_ != util::kInvalidSocket) {
    util::CloseSocket(fd_);
  }
}

ssize_t PlainStream::Read(uint8_t* dest, size_t max_len, IoResult* result) {
  ssize_t n = util::RecvNonBlocking(fd_, dest, max_len);
  if (n > 0) {
    *result = IoResult::kOk;
    return n;
  }
  if (n == 0) {
    *result = IoResult::kEof;
    return 0;
  }
  if (n == -1) {
    *result = IoResult::kWantRead;
    return -1;
  }
  last_error_ = util::GetLastSocketErrorString();
  *result = IoResult::kError;
  return -1;
}

IoResult PlainStream::Write(const uint8_t* data, size_t len,
                            size_t* written) {
  *written = 0;
  if (len == 0) {
    return IoResult::kOk;
  }

  ssize_t n = util::SendNonBlocking(fd_, data, len);
  if (n == -1) {
    return IoResult::kWantWrite;
  }
  if (n < 0) {
    last_error_ = util::GetLastSocketErrorString();
    return IoResult::kError;
  }

  *written = static_cast<size_t>(n);
  return (*written < len) ? IoResult::kWantWrite : IoResult::kOk;
}

void PlainStream::Shutdown() {
  if (fd_ != util::kInvalidSocket) {
    ::shutdown(fd_, SHUT_WR);
  }
}

util::socket_t PlainStream::Release() {
  util::socket_t fd = fd_;
  fd_ = util::kInvalidSocket;
  return fd;
}

}  // namespace core
}  // namespace tunnelpool
