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

#ifndef STOWAGE_HTTP_QUERY_STRING_H_
#define STOWAGE_HTTP_QUERY_STRING_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stowage/base/string.h"

namespace stowage {

// Represents a query string, as an ordered list of key-value pairs.
//
// When parsing, this class treats `+` (plus sign) specially and decodes it (if
// any) to whitespace.
//
// https://www.w3.org/Addressing/URL/uri-spec.txt:
//
// > Within the query string, the plus sign is reserved as shorthand notation
// > for a space.  Therefore, real plus signs must be encoded. [...]
class QueryString {
 public:
  QueryString() = default;

  // Get value of the first occurrence of the given key, or `std::nullopt` if
  // none.
  std::optional<std::string_view> TryGet(std::string_view key) const noexcept;

  // Same as `TryGet` except that `std::nullopt` is returned on conversion
  // failure .
  template <class T>
  std::optional<T> TryGet(std::string_view key) const {
    auto value = TryGet(key);
    return value ? TryParse<T>(*value) : std::nullopt;
  }

  // Appends a pair. Keys are not deduplicated.
  void Append(std::string key, std::string value);

  // Replaces value of the first occurrence of `key`, or appends a new pair.
  void Set(std::string key, std::string value);

  // Removes all occurrences of `key`.
  void Remove(std::string_view key);

  // For iterating through KV-pairs.
  auto begin() const noexcept { return pairs_.begin(); }
  auto end() const noexcept { return pairs_.end(); }
  bool empty() const noexcept { return pairs_.empty(); }
  std::size_t size() const noexcept { return pairs_.size(); }

  // Percent-encoded string representation (without leading `?`). Pairs appear
  // in insertion order. A pair with empty value is written as `key` alone.
  std::string ToString() const;

 private:
  std::vector<std::pair<std::string, std::string>> pairs_;
};

// Parse `QueryString` from its string representation.
template <>
struct TryParseTraits<QueryString, void> {
  static std::optional<QueryString> TryParse(std::string_view s);
};

}  // namespace stowage

#endif  // STOWAGE_HTTP_QUERY_STRING_H_
