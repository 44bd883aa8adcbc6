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

#include "stowage/swift/status.h"

#include <string>
#include <utility>

#include "stowage/base/string.h"

namespace stowage::swift {

std::string UnexpectedStatusCodeError::ToString() const {
  std::vector<std::string> codes;
  for (auto&& e : expected_status_codes) {
    codes.push_back(std::to_string(e));
  }
  auto msg = Format("expected {} response, got {} instead", Join(codes, "/"),
                    status_code);
  if (!body.empty()) {
    msg += ": " + body;
  }
  return msg;
}

std::string MalformedHeaderError::ToString() const {
  return "Bad header " + key + ": " + reason;
}

std::string BulkObjectError::ToString() const {
  return Format("{}/{}: {} {}", container_name, object_name, status_code,
                StatusText(status_code));
}

std::string BulkError::ToString() const {
  auto result = Format("{} {}", status_code, StatusText(status_code));
  if (!archive_error.empty()) {
    result += ": " + archive_error;
  }
  if (!object_errors.empty()) {
    result += Format(" (+{} object errors)", object_errors.size());
  }
  return result;
}

Status MakeUnexpectedStatusCodeStatus(UnexpectedStatusCodeError error) {
  auto desc = error.ToString();
  return Status(SwiftStatus::UnexpectedStatusCode, std::move(desc),
                std::move(error));
}

Status MakeMalformedHeaderStatus(std::string key, std::string reason) {
  MalformedHeaderError error{std::move(key), std::move(reason)};
  auto desc = error.ToString();
  return Status(SwiftStatus::MalformedHeader, std::move(desc),
                std::move(error));
}

Status MakeBulkStatus(BulkError error) {
  auto desc = error.ToString();
  return Status(SwiftStatus::BulkFailure, std::move(desc), std::move(error));
}

bool Is(const Status& status, int code) {
  if (status.code() != static_cast<int>(SwiftStatus::UnexpectedStatusCode)) {
    return false;
  }
  auto error = status.payload<UnexpectedStatusCodeError>();
  return error && error->status_code == code;
}

bool Is(const Status& status, HttpStatus code) {
  return Is(status, static_cast<int>(code));
}

}  // namespace stowage::swift
