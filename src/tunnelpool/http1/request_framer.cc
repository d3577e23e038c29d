// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/http1/request_framer.h"

#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace tunnelpool {
namespace http1 {

namespace {

// Case-insensitive header name comparison
bool HeaderNameEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') ca += 32;
    if (cb >= 'A' && cb <= 'Z') cb += 32;
    if (ca != cb) return false;
  }
  return true;
}

// RFC 9110 token characters
bool IsToken(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
              (c >= 'A' && c <= 'Z');
    switch (c) {
      case '!': case '#': case '$': case '%': case '&': case '\'':
      case '*': case '+': case '-': case '.': case '^': case '_':
      case '`': case '|': case '~':
        ok = true;
        break;
      default:
        break;
    }
    if (!ok) return false;
  }
  return true;
}

bool HasLineBreak(std::string_view s) {
  return s.find_first_of(std::string_view("\r\n\0", 3)) !=
         std::string_view::npos;
}

// Framing headers are owned by the framer
constexpr std::string_view kReservedHeaders[] = {
    "connection", "keep-alive", "upgrade", "transfer-encoding", "expect",
};

}  // namespace

RequestFramer::RequestFramer(FrameSink* sink, FrameOptions options,
                             WarningCallback on_warning)
    : sink_(sink),
      options_(std::move(options)),
      on_warning_(std::move(on_warning)) {
  header_ = BuildHeader();
}

Error RequestFramer::Validate(const FrameOptions& options) {
  if (!IsToken(options.method)) {
    return Error::InvalidArgument("invalid request method");
  }
  if (options.path.empty() || HasLineBreak(options.path) ||
      options.path.find(' ') != std::string::npos) {
    return Error::InvalidArgument("invalid request path");
  }
  for (const auto& [name, value] : options.headers) {
    if (!IsToken(name)) {
      return Error::InvalidArgument("invalid header name: " + name);
    }
    if (HasLineBreak(value)) {
      return Error::InvalidArgument("invalid " + name + " header");
    }
    for (std::string_view reserved : kReservedHeaders) {
      if (HeaderNameEquals(name, reserved)) {
        return Error::InvalidArgument("invalid " + name + " header");
      }
    }
  }
  return {};
}

std::string RequestFramer::BuildHeader() const {
  std::string out;
  out.reserve(256);

  // Request line: METHOD PATH HTTP/1.1\r\n
  out += options_.method;
  out += ' ';
  out += options_.path;
  out += " HTTP/1.1\r\n";

  bool has_host = false;
  for (const auto& header : options_.headers) {
    if (HeaderNameEquals(header.name, "host")) {
      has_host = true;
      break;
    }
  }
  if (!has_host && !options_.host.empty()) {
    out += "host: ";
    out += options_.host;
    out += "\r\n";
  }

  if (options_.upgrade) {
    out += "connection: upgrade\r\n";
  } else if (options_.keep_alive) {
    out += "connection: keep-alive\r\n";
  } else {
    out += "connection: close\r\n";
  }

  for (const auto& [name, value] : options_.headers) {
    // Length framing is emitted with the body
    if (HeaderNameEquals(name, "content-length")) continue;
    out += name;
    out += ": ";
    out += value;
    out += "\r\n";
  }

  return out;
}

Result<bool> RequestFramer::Write(ByteSpan chunk) {
  if (state_ == FrameState::kFinished || state_ == FrameState::kDestroyed ||
      sink_->IsDestroyed()) {
    return Result<bool>::Ok(false);
  }
  if (chunk.empty()) {
    return Result<bool>::Ok(true);
  }

  const auto& declared = options_.content_length;
  if (declared && bytes_written_ + chunk.size > *declared) {
    Error mismatch = Error::ContentLengthMismatch();
    if (options_.strict_content_length) {
      return Result<bool>::Err(std::move(mismatch));
    }
    Warn(mismatch);
  }

  std::string out;
  if (state_ == FrameState::kHeaderPending) {
    out = header_;
    if (declared) {
      out += fmt::format("content-length: {}\r\n\r\n", *declared);
    } else {
      out += "transfer-encoding: chunked\r\n\r\n";
    }
    state_ = FrameState::kBody;
  }

  if (!declared) {
    // Chunk data is closed by the next chunk's leading CRLF or the
    // terminator
    if (chunks_written_ > 0) {
      out += "\r\n";
    }
    out += fmt::format("{:x}\r\n", chunk.size);
    ++chunks_written_;
  }
  out.append(chunk.as_string_view());

  bytes_written_ += chunk.size;

  bool ready = sink_->WriteBytes(out);
  sink_->RefreshTimeout(options_.timeout_kind);
  return Result<bool>::Ok(ready);
}

Error RequestFramer::End() {
  if (state_ == FrameState::kFinished || state_ == FrameState::kDestroyed) {
    return {};
  }
  state_ = FrameState::kFinished;
  sink_->SetWriting(false);

  if (sink_->IsDestroyed()) {
    return {};
  }

  const auto& declared = options_.content_length;

  if (bytes_written_ == 0) {
    if (options_.expects_payload) {
      sink_->WriteBytes(header_ + "content-length: 0\r\n\r\n");
    } else {
      sink_->WriteBytes(header_ + "\r\n");
    }
  } else if (!declared) {
    sink_->WriteBytes("\r\n0\r\n\r\n");
  }

  if (declared && bytes_written_ != *declared) {
    Error mismatch = Error::ContentLengthMismatch();
    if (options_.strict_content_length) {
      return mismatch;
    }
    Warn(mismatch);
  }

  sink_->RefreshTimeout(options_.timeout_kind);
  sink_->OnFrameFinished();
  return {};
}

Error RequestFramer::Destroy(const Error& error) {
  if (state_ == FrameState::kDestroyed) {
    return {};
  }
  state_ = FrameState::kDestroyed;
  sink_->SetWriting(false);

  if (error && sink_->pipelining() <= 1 && sink_->in_flight() > 1) {
    spdlog::error("framer: {} requests in flight on a non-pipelined "
                  "connection", sink_->in_flight());
    return Error::Internal("pipeline should only contain this request");
  }
  return {};
}

void RequestFramer::Warn(const Error& error) {
  if (warned_) {
    return;
  }
  warned_ = true;
  if (on_warning_) {
    on_warning_(error);
    return;
  }
  spdlog::warn("{}", error.ToString());
}

}  // namespace http1
}  // namespace tunnelpool
