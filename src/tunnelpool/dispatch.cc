// Copyright 2026 TunnelPool Authors
// SPDX-License-Identifier: MIT

#include "tunnelpool/dispatch.h"

#include <algorithm>

namespace tunnelpool {

uint64_t AbortSignal::Subscribe(Listener listener) {
  uint64_t id = next_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void AbortSignal::Unsubscribe(uint64_t id) {
  std::erase_if(listeners_,
                [id](const auto& entry) { return entry.first == id; });
}

void AbortSignal::Fire(Error reason) {
  if (aborted_) {
    return;
  }
  aborted_ = true;
  reason_ = std::move(reason);

  // Listeners may unsubscribe themselves while running
  auto listeners = std::move(listeners_);
  listeners_.clear();
  for (auto& [id, listener] : listeners) {
    listener(reason_);
  }
}

bool StringBody::Read(std::string* chunk) {
  if (offset_ >= data_.size()) {
    return false;
  }
  size_t len = std::min(chunk_size_, data_.size() - offset_);
  chunk->assign(data_, offset_, len);
  offset_ += len;
  return true;
}

bool DispatchOptions::ExpectsPayload() const {
  return method == "PUT" || method == "POST" || method == "PATCH";
}

void DispatchRequest::Complete(const Headers& trailers) {
  if (settled()) {
    return;
  }
  *settled_ = true;
  UnwatchAbort();
  if (handler_) {
    handler_->OnComplete(trailers);
  }
}

void DispatchRequest::Fail(const Error& error) {
  Failer()(error);
  UnwatchAbort();
}

std::function<void(const Error&)> DispatchRequest::Failer() const {
  return [handler = handler_, settled = settled_](const Error& error) {
    if (!settled || *settled) {
      return;
    }
    *settled = true;
    if (handler) {
      handler->OnError(error);
    }
  };
}

void DispatchRequest::WatchAbort(AbortSignal::Listener on_abort) {
  UnwatchAbort();
  if (options_.signal && !options_.signal->aborted()) {
    abort_id_ = options_.signal->Subscribe(std::move(on_abort));
  }
}

void DispatchRequest::UnwatchAbort() {
  if (abort_id_ != 0 && options_.signal) {
    options_.signal->Unsubscribe(abort_id_);
  }
  abort_id_ = 0;
}

}  // namespace tunnelpool
