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

#ifndef STOWAGE_SWIFT_DOWNLOAD_H_
#define STOWAGE_SWIFT_DOWNLOAD_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/io/reader.h"
#include "stowage/swift/headers.h"

namespace stowage::swift {

// Body of a downloaded object, not yet read.
//
// Exactly one of `AsString()`, `AsBytes()` or `AsReadCloser()` may be called.
// Subsequent calls fail with `SwiftStatus::AlreadyConsumed`. If none of them is
// called, the body is closed on destruction.
class DownloadedObject {
 public:
  DownloadedObject(int status, ObjectHeaders headers,
                   std::unique_ptr<ReadCloser> body);
  ~DownloadedObject();

  DownloadedObject(DownloadedObject&&) = default;
  DownloadedObject& operator=(DownloadedObject&&) = default;

  // 200 for full downloads, 206 for range requests.
  int status() const noexcept { return status_; }

  // Headers of the response.
  const ObjectHeaders& headers() const noexcept { return headers_; }

  // Reads the whole body and closes it.
  Expected<std::string, Status> AsString();
  Expected<std::vector<std::uint8_t>, Status> AsBytes();

  // Transfers the body stream to the caller, who is responsible for closing
  // it. Each `Read` returns whatever is available at that moment.
  Expected<std::unique_ptr<ReadCloser>, Status> AsReadCloser();

 private:
  Expected<std::unique_ptr<ReadCloser>, Status> Consume();

 private:
  int status_;
  ObjectHeaders headers_;
  std::unique_ptr<ReadCloser> body_;
  bool consumed_ = false;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_DOWNLOAD_H_
