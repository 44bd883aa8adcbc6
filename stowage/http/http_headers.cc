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

#include "stowage/http/http_headers.h"

#include <algorithm>
#include <string>

namespace stowage {

std::optional<std::string_view> HttpHeaders::TryGet(
    std::string_view key) const noexcept {
  for (auto&& [k, v] : fields_) {
    if (IEquals(k, key)) {
      return v;
    }
  }
  return std::nullopt;
}

void HttpHeaders::Set(std::string key, std::string value) {
  auto iter = std::find_if(fields_.begin(), fields_.end(),
                           [&](auto&& e) { return IEquals(e.first, key); });
  if (iter == fields_.end()) {
    Append(std::move(key), std::move(value));
    return;
  }
  iter->second = std::move(value);
  // Drop the other occurrences, if any.
  fields_.erase(std::remove_if(iter + 1, fields_.end(),
                               [&](auto&& e) { return IEquals(e.first, key); }),
                fields_.end());
}

void HttpHeaders::Append(std::string key, std::string value) {
  fields_.emplace_back(std::move(key), std::move(value));
}

bool HttpHeaders::Remove(std::string_view key) noexcept {
  auto was = fields_.size();
  fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                               [&](auto&& e) { return IEquals(e.first, key); }),
                fields_.end());
  return was != fields_.size();
}

std::string HttpHeaders::ToString() const {
  std::string result;
  for (auto&& [k, v] : fields_) {
    result += k + ": " + v + "\r\n";
  }
  return result;
}

}  // namespace stowage
