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

#include "stowage/swift/download.h"

#include <utility>

#include "stowage/base/logging.h"
#include "stowage/swift/status.h"

namespace stowage::swift {

DownloadedObject::DownloadedObject(int status, ObjectHeaders headers,
                                   std::unique_ptr<ReadCloser> body)
    : status_(status), headers_(std::move(headers)), body_(std::move(body)) {}

DownloadedObject::~DownloadedObject() {
  if (body_) {
    if (auto status = body_->Close(); !status.ok()) {
      STOWAGE_VLOG(1, "Failed to close unconsumed download: {}",
                   status.ToString());
    }
  }
}

Expected<std::string, Status> DownloadedObject::AsString() {
  auto body = Consume();
  if (!body) {
    return body.error();
  }
  auto&& reader = *body;
  auto result = ReadAll(reader.get());
  auto status = reader->Close();
  if (!result) {
    return result.error();
  }
  if (!status.ok()) {
    return status;
  }
  return result;
}

Expected<std::vector<std::uint8_t>, Status> DownloadedObject::AsBytes() {
  auto str = AsString();
  if (!str) {
    return str.error();
  }
  return std::vector<std::uint8_t>(str->begin(), str->end());
}

Expected<std::unique_ptr<ReadCloser>, Status>
DownloadedObject::AsReadCloser() {
  return Consume();
}

Expected<std::unique_ptr<ReadCloser>, Status> DownloadedObject::Consume() {
  if (consumed_) {
    return Status(SwiftStatus::AlreadyConsumed,
                  "body of downloaded object was already consumed");
  }
  consumed_ = true;
  if (!body_) {
    return std::unique_ptr<ReadCloser>(std::make_unique<StringReader>(""));
  }
  return std::move(body_);
}

}  // namespace stowage::swift
