// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/error.h"

#include <spdlog/fmt/fmt.h>

namespace tunnelpool {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "OK";
    case ErrorCode::kConnectTimeout:
      return "UND_ERR_CONNECT_TIMEOUT";
    case ErrorCode::kHeadersTimeout:
      return "UND_ERR_HEADERS_TIMEOUT";
    case ErrorCode::kBodyTimeout:
      return "UND_ERR_BODY_TIMEOUT";
    case ErrorCode::kSocketError:
      return "UND_ERR_SOCKET";
    case ErrorCode::kTunnelError:
      return "UND_ERR_PRX_TLS";
    case ErrorCode::kTlsError:
      return "UND_ERR_TLS";
    case ErrorCode::kContentLengthMismatch:
      return "UND_ERR_REQ_CONTENT_LENGTH_MISMATCH";
    case ErrorCode::kRequestAborted:
      return "UND_ERR_ABORTED";
    case ErrorCode::kResponseStatus:
      return "UND_ERR_RESPONSE_STATUS_CODE";
    case ErrorCode::kInvalidArgument:
      return "UND_ERR_INVALID_ARG";
    case ErrorCode::kPoolClosed:
      return "UND_ERR_CLOSED";
    case ErrorCode::kPoolDestroyed:
      return "UND_ERR_DESTROYED";
    case ErrorCode::kInternalError:
      return "UND_ERR_INTERNAL";
  }
  return "UND_ERR";
}

std::string Error::ToString() const {
  std::string out = fmt::format("{}: {}", ErrorCodeName(code_), message_);
  if (status_) {
    out += fmt::format(" (status {})", *status_);
  }
  if (socket_ && !socket_->remote_address.empty()) {
    out += fmt::format(" ({}:{})", socket_->remote_address,
                       socket_->remote_port);
  }
  return out;
}

}  // namespace tunnelpool
