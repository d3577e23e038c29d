// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

// Byte stream over a connected socket, optionally encrypted.

#ifndef TUNNELPOOL_CORE_BYTE_STREAM_H_
#define TUNNELPOOL_CORE_BYTE_STREAM_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "tunnelpool/util/platform.h"

namespace tunnelpool {
namespace core {

enum class IoResult {
  kOk,
  kWantRead,
  kWantWrite,
  kEof,
  kError,
};

// Non-blocking stream. Owns its socket.
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  virtual util::socket_t fd() const = 0;

  // Drive a pending handshake. Returns kOk once the stream carries data.
  virtual IoResult Handshake() { return IoResult::kOk; }

  // Returns bytes read. Otherwise returns 0 on EOF or -1, with result set.
  virtual ssize_t Read(uint8_t* dest, size_t max_len, IoResult* result) = 0;

  // Writes a prefix of data. kWantWrite means some bytes remain.
  virtual IoResult Write(const uint8_t* data, size_t len,
                         size_t* written) = 0;

  // Pushes out bytes buffered below the caller's writes. kWantWrite means
  // some remain.
  virtual IoResult Flush() { return IoResult::kOk; }
  virtual bool HasPendingOutput() const { return false; }

  virtual void Shutdown() {}

  virtual bool secure() const { return false; }

  virtual const std::string& last_error() const = 0;
};

// Unencrypted stream over a TCP (or socketpair) socket.
class PlainStream : public ByteStream {
 public:
  explicit PlainStream(util::socket_t fd) : fd_(fd) {}
  ~PlainStream() override;

  // Non-copyable, non-movable
  PlainStream(const PlainStream&) = delete;
  PlainStream& operator=(const PlainStream&) = delete;
  PlainStream(PlainStream&&) = delete;
  PlainStream& operator=(PlainStream&&) = delete;

  util::socket_t fd() const override { return fd_; }
  ssize_t Read(uint8_t* dest, size_t max_len, IoResult* result) override;
  IoResult Write(const uint8_t* data, size_t len, size_t* written) override;
  void Shutdown() override;
  const std::string& last_error() const override { return last_error_; }

  // Gives up the socket without closing it.
  util::socket_t Release();

 private:
  util::socket_t fd_;
  std::string last_error_;
};

// Produces encrypted streams. Implemented by the TLS context.
class StreamFactory {
 public:
  virtual ~StreamFactory() = default;

  // Wraps a connected socket in a client TLS stream and takes ownership of
  // fd. Setup failures surface from the first Handshake() call.
  virtual std::unique_ptr<ByteStream> CreateTlsStream(
      util::socket_t fd, std::string_view servername) = 0;

  // Runs a client TLS session inside an established stream, typically an
  // https proxy connection carrying a tunnel to an https target.
  virtual std::unique_ptr<ByteStream> CreateTlsStream(
      std::unique_ptr<ByteStream> transport, std::string_view servername) = 0;
};

}  // namespace core
}  // namespace tunnelpool

#endif  // TUNNELPOOL_CORE_BYTE_STREAM_H_
