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

#ifndef STOWAGE_IO_READER_H_
#define STOWAGE_IO_READER_H_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stowage/base/crypto/digest.h"
#include "stowage/base/expected.h"
#include "stowage/base/status.h"

namespace stowage {

// Status codes raised by streams in this directory. They're kept apart from
// the protocol-level codes so both may travel through the same `Status`.
enum class IoStatus {
  ClosedPipe = 101,
  Truncated = 102,
};

// A source of bytes.
class Reader {
 public:
  virtual ~Reader() = default;

  // Reads at most `size` bytes into `buffer`. Returns number of bytes read, `0`
  // indicates end of stream. A read may return fewer bytes than requested
  // even if the stream has not reached its end.
  virtual Expected<std::size_t, Status> Read(void* buffer,
                                             std::size_t size) = 0;

  // Number of bytes remaining, if known in advance.
  virtual std::optional<std::uint64_t> Size() const { return std::nullopt; }
};

// A reader owning some resource (e.g., a network stream), which should be
// released via `Close()` once the caller is done with it.
class ReadCloser : public Reader {
 public:
  // Closing a reader twice is a no-op.
  virtual Status Close() = 0;
};

// A sink of bytes.
class Writer {
 public:
  virtual ~Writer() = default;

  // Either all of `data` is written, or an error is returned.
  virtual Status Write(std::string_view data) = 0;
};

// Reads from an in-memory string.
class StringReader : public ReadCloser {
 public:
  explicit StringReader(std::string data) : data_(std::move(data)) {}

  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override;
  std::optional<std::uint64_t> Size() const override {
    return data_.size() - offset_;
  }
  Status Close() override { return {}; }

 private:
  std::string data_;
  std::size_t offset_ = 0;
};

// Appends everything written to an in-memory string.
class StringWriter : public Writer {
 public:
  Status Write(std::string_view data) override {
    data_.append(data);
    return {};
  }

  const std::string& data() const noexcept { return data_; }

 private:
  std::string data_;
};

// Computes MD5 of everything read through it.
class HashingReader : public Reader {
 public:
  // `from` may be `nullptr`, in which case this reader is empty.
  explicit HashingReader(Reader* from) : from_(from) {}

  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override;
  std::optional<std::uint64_t> Size() const override;

  // Number of bytes read so far.
  std::uint64_t BytesRead() const noexcept { return bytes_read_; }

  // Lowercase hex-encoded MD5 digest of bytes read so far. Further reads are
  // not allowed once this method is called.
  std::string HexDigest();

 private:
  Reader* from_;
  Md5Hasher hasher_;
  std::uint64_t bytes_read_ = 0;
};

// Reads at most `limit` bytes from `from`, then reports end of stream.
class LimitedReader : public Reader {
 public:
  LimitedReader(Reader* from, std::uint64_t limit)
      : from_(from), remaining_(limit) {}

  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override;
  std::optional<std::uint64_t> Size() const override;

 private:
  Reader* from_;
  std::uint64_t remaining_;
};

// Reads from each of `readers` in turn, until the last one is exhausted.
class MultiReader : public Reader {
 public:
  // Readers are not owned.
  explicit MultiReader(std::vector<Reader*> readers)
      : readers_(std::move(readers)) {}

  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override;
  std::optional<std::uint64_t> Size() const override;

 private:
  std::vector<Reader*> readers_;
  std::size_t current_ = 0;
};

// Reads `from` until end of stream, or until `max_bytes` were read.
Expected<std::string, Status> ReadAll(
    Reader* from,
    std::size_t max_bytes = std::numeric_limits<std::size_t>::max());

// Copies everything from `from` to `to`. Returns number of bytes copied.
Expected<std::uint64_t, Status> Copy(Reader* from, Writer* to);

}  // namespace stowage

#endif  // STOWAGE_IO_READER_H_
