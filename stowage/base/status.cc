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

#include "stowage/base/status.h"

#include "stowage/base/logging.h"

namespace stowage {

Status::Status(int status, std::string desc) {
  if (status == 0) {
    if (!desc.empty()) {
      STOWAGE_LOG_ERROR_EVERY_SECOND(
          "Status `SUCCESS` may not carry description, but [{}] is given.",
          desc);
    }
    // NOTHING else.
  } else {
    state_ = std::make_shared<State>();
    state_->status = status;
    state_->desc = std::move(desc);
  }
}

const std::string& Status::message() const noexcept {
  static const std::string kEmpty;
  return !state_ ? kEmpty : state_->desc;
}

std::string Status::ToString() const {
  return fmt::format(
      "[{}] {}", code(),
      !ok() ? message() : "The operation completed successfully.");
}

}  // namespace stowage
