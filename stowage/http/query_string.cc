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

#include "stowage/http/query_string.h"

#include <algorithm>
#include <string>

#include "stowage/base/encoding/percent.h"

namespace stowage {

std::optional<std::string_view> QueryString::TryGet(
    std::string_view key) const noexcept {
  for (auto&& [k, v] : pairs_) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

void QueryString::Append(std::string key, std::string value) {
  pairs_.emplace_back(std::move(key), std::move(value));
}

void QueryString::Set(std::string key, std::string value) {
  for (auto&& [k, v] : pairs_) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  Append(std::move(key), std::move(value));
}

void QueryString::Remove(std::string_view key) {
  pairs_.erase(std::remove_if(pairs_.begin(), pairs_.end(),
                              [&](auto&& e) { return e.first == key; }),
               pairs_.end());
}

std::string QueryString::ToString() const {
  std::string result;
  for (auto&& [k, v] : pairs_) {
    if (!result.empty()) {
      result.push_back('&');
    }
    EncodePercent(k, &result);
    if (!v.empty()) {
      result.push_back('=');
      EncodePercent(v, &result);
    }
  }
  return result;
}

std::optional<QueryString> TryParseTraits<QueryString, void>::TryParse(
    std::string_view s) {
  QueryString result;
  for (auto&& e : Split(s, '&')) {
    auto pos = e.find('=');
    auto key = DecodePercent(e.substr(0, pos), true);
    std::optional<std::string> value;
    if (pos == std::string_view::npos) {
      value.emplace();
    } else {
      value = DecodePercent(e.substr(pos + 1), true);
    }
    if (!key || !value) {
      return std::nullopt;
    }
    result.Append(std::move(*key), std::move(*value));
  }
  return result;
}

}  // namespace stowage
