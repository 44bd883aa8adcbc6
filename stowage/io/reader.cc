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

#include "stowage/io/reader.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "stowage/base/encoding/hex.h"
#include "stowage/base/logging.h"

namespace stowage {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

}  // namespace

Expected<std::size_t, Status> StringReader::Read(void* buffer,
                                                 std::size_t size) {
  auto bytes = std::min(size, data_.size() - offset_);
  memcpy(buffer, data_.data() + offset_, bytes);
  offset_ += bytes;
  return bytes;
}

Expected<std::size_t, Status> HashingReader::Read(void* buffer,
                                                  std::size_t size) {
  if (!from_) {
    return std::size_t(0);
  }
  auto bytes = from_->Read(buffer, size);
  if (bytes && *bytes) {
    hasher_.Update(std::string_view(static_cast<const char*>(buffer), *bytes));
    bytes_read_ += *bytes;
  }
  return bytes;
}

std::optional<std::uint64_t> HashingReader::Size() const {
  if (!from_) {
    return 0;
  }
  return from_->Size();
}

std::string HashingReader::HexDigest() { return EncodeHex(hasher_.Final()); }

Expected<std::size_t, Status> LimitedReader::Read(void* buffer,
                                                  std::size_t size) {
  if (!remaining_) {
    return std::size_t(0);
  }
  auto bytes = from_->Read(buffer, std::min<std::uint64_t>(size, remaining_));
  if (bytes) {
    STOWAGE_CHECK_LE(*bytes, remaining_);
    remaining_ -= *bytes;
  }
  return bytes;
}

std::optional<std::uint64_t> LimitedReader::Size() const {
  if (auto size = from_->Size()) {
    return std::min(*size, remaining_);
  }
  return std::nullopt;
}

Expected<std::size_t, Status> MultiReader::Read(void* buffer,
                                                std::size_t size) {
  while (current_ != readers_.size()) {
    auto bytes = readers_[current_]->Read(buffer, size);
    if (!bytes || *bytes != 0 || !size) {
      return bytes;
    }
    ++current_;
  }
  return std::size_t(0);
}

std::optional<std::uint64_t> MultiReader::Size() const {
  std::uint64_t total = 0;
  for (auto i = current_; i != readers_.size(); ++i) {
    auto size = readers_[i]->Size();
    if (!size) {
      return std::nullopt;
    }
    total += *size;
  }
  return total;
}

Expected<std::string, Status> ReadAll(Reader* from, std::size_t max_bytes) {
  std::string result;
  if (auto size = from->Size()) {
    result.reserve(std::min<std::uint64_t>(*size, max_bytes));
  }
  char buffer[kCopyBufferSize];
  while (result.size() < max_bytes) {
    auto bytes =
        from->Read(buffer, std::min(sizeof(buffer), max_bytes - result.size()));
    if (!bytes) {
      return bytes.error();
    }
    if (*bytes == 0) {
      break;
    }
    result.append(buffer, *bytes);
  }
  return result;
}

Expected<std::uint64_t, Status> Copy(Reader* from, Writer* to) {
  std::uint64_t copied = 0;
  char buffer[kCopyBufferSize];
  while (true) {
    auto bytes = from->Read(buffer, sizeof(buffer));
    if (!bytes) {
      return bytes.error();
    }
    if (*bytes == 0) {
      return copied;
    }
    if (auto status = to->Write(std::string_view(buffer, *bytes));
        !status.ok()) {
      return status;
    }
    copied += *bytes;
  }
}

}  // namespace stowage
