// Copyright (C) 2023 THL A29 Limited, a Tencent company. All rights reserved.
//
// Licensed under the BSD 3-Clause License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of the
// License at
//
// https://opensource.org/licenses/BSD-3-Clause
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#include "stowage/io/pipe.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "stowage/base/logging.h"

namespace stowage {

PipeEnds MakePipe(std::size_t capacity) {
  STOWAGE_CHECK_GT(capacity, 0, "Pipe capacity must be positive.");
  auto state = std::make_shared<detail::PipeState>();
  state->capacity = capacity;
  PipeEnds ends;
  ends.reader.reset(new PipeReader(state));
  ends.writer.reset(new PipeWriter(state));
  return ends;
}

PipeReader::~PipeReader() { (void)Close(); }

Expected<std::size_t, Status> PipeReader::Read(void* buffer,
                                               std::size_t size) {
  std::unique_lock lk(state_->lock);
  if (state_->reader_closed) {
    return Status(IoStatus::ClosedPipe, "read on closed pipe");
  }
  if (!size) {
    return std::size_t(0);
  }
  state_->cv.wait(lk, [&] {
    return !state_->buffer.empty() || state_->writer_closed ||
           state_->reader_closed;
  });
  if (state_->reader_closed) {
    return Status(IoStatus::ClosedPipe, "read on closed pipe");
  }
  if (!state_->buffer.empty()) {
    auto bytes = std::min(size, state_->buffer.size());
    memcpy(buffer, state_->buffer.data(), bytes);
    state_->buffer.erase(0, bytes);
    state_->cv.notify_all();
    return bytes;
  }
  if (!state_->writer_error.ok()) {
    return state_->writer_error;
  }
  return std::size_t(0);
}

Status PipeReader::Close() {
  CloseWithError(Status(IoStatus::ClosedPipe, "write on closed pipe"));
  return {};
}

void PipeReader::CloseWithError(Status status) {
  std::scoped_lock _(state_->lock);
  if (state_->reader_closed) {
    return;
  }
  state_->reader_closed = true;
  state_->reader_error = std::move(status);
  state_->buffer.clear();
  state_->cv.notify_all();
}

PipeWriter::~PipeWriter() { Close(); }

Status PipeWriter::Write(std::string_view data) {
  std::unique_lock lk(state_->lock);
  while (true) {
    if (state_->writer_closed) {
      return Status(IoStatus::ClosedPipe, "write on closed pipe");
    }
    if (state_->reader_closed) {
      return state_->reader_error.ok()
                 ? Status(IoStatus::ClosedPipe, "write on closed pipe")
                 : state_->reader_error;
    }
    if (data.empty()) {
      return {};
    }
    auto space = state_->capacity - state_->buffer.size();
    if (space) {
      auto bytes = std::min(space, data.size());
      state_->buffer.append(data.data(), bytes);
      data.remove_prefix(bytes);
      state_->cv.notify_all();
      continue;
    }
    state_->cv.wait(lk, [&] {
      return state_->buffer.size() < state_->capacity ||
             state_->reader_closed || state_->writer_closed;
    });
  }
}

void PipeWriter::Close() { CloseWithError(Status()); }

void PipeWriter::CloseWithError(Status status) {
  std::scoped_lock _(state_->lock);
  if (state_->writer_closed) {
    return;
  }
  state_->writer_closed = true;
  state_->writer_error = std::move(status);
  state_->cv.notify_all();
}

}  // namespace stowage
