// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#ifndef TUNNELPOOL_ERROR_H_
#define TUNNELPOOL_ERROR_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tunnelpool {

// Error codes reported by the transport
enum class ErrorCode {
  kOk = 0,

  // Timeouts
  kConnectTimeout,
  kHeadersTimeout,
  kBodyTimeout,

  // Connection errors
  kSocketError,
  kTunnelError,
  kTlsError,

  // Request errors
  kContentLengthMismatch,
  kRequestAborted,
  kResponseStatus,
  kInvalidArgument,

  // Pool lifecycle
  kPoolClosed,
  kPoolDestroyed,

  kInternalError,
};

// Stable identifier for an error code, e.g. "UND_ERR_CONNECT_TIMEOUT".
std::string_view ErrorCodeName(ErrorCode code);

// Socket context attached to socket-level failures
struct SocketInfo {
  std::string local_address;
  uint16_t local_port = 0;
  std::string remote_address;
  uint16_t remote_port = 0;
  uint64_t bytes_written = 0;
  uint64_t bytes_read = 0;
};

// Error information with code and message
class Error {
 public:
  Error() : code_(ErrorCode::kOk) {}
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  // Factory methods
  static Error Ok() { return {}; }

  static Error ConnectTimeout(std::string_view msg) {
    return {ErrorCode::kConnectTimeout, std::string(msg)};
  }

  static Error HeadersTimeout() {
    return {ErrorCode::kHeadersTimeout, "Headers Timeout Error"};
  }

  static Error BodyTimeout() {
    return {ErrorCode::kBodyTimeout, "Body Timeout Error"};
  }

  static Error Socket(std::string_view msg, SocketInfo info = {}) {
    Error error(ErrorCode::kSocketError, std::string(msg));
    error.socket_ = std::move(info);
    return error;
  }

  // status is the proxy's HTTP status or the SOCKS reply code, when known.
  static Error Tunnel(std::string_view msg, std::optional<int> status = {}) {
    Error error(ErrorCode::kTunnelError, std::string(msg));
    error.status_ = status;
    return error;
  }

  static Error Tls(std::string_view msg) {
    return {ErrorCode::kTlsError, std::string(msg)};
  }

  static Error ContentLengthMismatch() {
    return {ErrorCode::kContentLengthMismatch,
            "Request body length does not match content-length header"};
  }

  static Error Aborted() {
    return {ErrorCode::kRequestAborted, "Request aborted"};
  }

  // Raised for 4xx/5xx responses when the request asked to throw on error.
  static Error ResponseStatus(int status) {
    Error error(ErrorCode::kResponseStatus,
                "Response status code " + std::to_string(status));
    error.status_ = status;
    return error;
  }

  static Error InvalidArgument(std::string_view msg) {
    return {ErrorCode::kInvalidArgument, std::string(msg)};
  }

  static Error PoolClosed() {
    return {ErrorCode::kPoolClosed, "The client is closed"};
  }

  static Error PoolDestroyed() {
    return {ErrorCode::kPoolDestroyed, "The client is destroyed"};
  }

  static Error Internal(std::string_view msg) {
    return {ErrorCode::kInternalError, std::string(msg)};
  }

  // Check if error occurred
  explicit operator bool() const { return code_ != ErrorCode::kOk; }
  bool ok() const { return code_ == ErrorCode::kOk; }

  // Accessors
  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::optional<int> status() const { return status_; }
  const std::optional<SocketInfo>& socket() const { return socket_; }

  // "UND_ERR_SOCKET: other side closed (127.0.0.1:8080)"
  std::string ToString() const;

 private:
  ErrorCode code_;
  std::string message_;
  std::optional<int> status_;
  std::optional<SocketInfo> socket_;
};

}  // namespace tunnelpool

#endif  // TUNNELPOOL_ERROR_H_
