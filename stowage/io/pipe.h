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

#ifndef STOWAGE_IO_PIPE_H_
#define STOWAGE_IO_PIPE_H_

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "stowage/io/reader.h"

namespace stowage {

namespace detail {

struct PipeState;

}  // namespace detail

struct PipeEnds;

// Read end of a pipe created by `MakePipe`.
//
// Reads block while the pipe is empty. Once the write end is closed and all
// buffered bytes are consumed, reads report end of stream (or the error the
// writer closed the pipe with).
class PipeReader : public ReadCloser {
 public:
  ~PipeReader() override;

  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override;

  // Subsequent writes fail with `IoStatus::ClosedPipe`.
  Status Close() override;

  // Subsequent writes fail with `status`.
  void CloseWithError(Status status);

 private:
  friend PipeEnds MakePipe(std::size_t capacity);
  explicit PipeReader(std::shared_ptr<detail::PipeState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::PipeState> state_;
};

// Write end of a pipe created by `MakePipe`.
//
// Writes block while the pipe is full.
class PipeWriter : public Writer {
 public:
  // Closes the pipe (as if by `Close()`) if it's not closed yet.
  ~PipeWriter() override;

  Status Write(std::string_view data) override;

  // Reader sees end of stream after consuming what's buffered.
  void Close();

  // Reader sees `status` after consuming what's buffered. A successful
  // `status` is treated as `Close()`.
  void CloseWithError(Status status);

 private:
  friend PipeEnds MakePipe(std::size_t capacity);
  explicit PipeWriter(std::shared_ptr<detail::PipeState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::PipeState> state_;
};

struct PipeEnds {
  std::unique_ptr<PipeReader> reader;
  std::unique_ptr<PipeWriter> writer;
};

// Creates a bounded, in-memory, synchronous pipe to pass bytes between two
// threads. At most `capacity` bytes are buffered.
PipeEnds MakePipe(std::size_t capacity);

///////////////////////////////////////
// Implementation goes below.        //
///////////////////////////////////////

namespace detail {

struct PipeState {
  std::mutex lock;
  std::condition_variable cv;
  std::size_t capacity;
  std::string buffer;
  bool writer_closed = false;
  Status writer_error;
  bool reader_closed = false;
  Status reader_error;
};

}  // namespace detail

}  // namespace stowage

#endif  // STOWAGE_IO_PIPE_H_
