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

#ifndef STOWAGE_HTTP_HTTP_HEADERS_H_
#define STOWAGE_HTTP_HTTP_HEADERS_H_

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stowage/base/string.h"

namespace stowage {

// Holds header fields of an HTTP message.
//
// https://tools.ietf.org/html/rfc7230#section-3.2.2
//
// > The order in which header fields with the same field name are received is
// > therefore significant to the interpretation of the combined field value;
// > a proxy MUST NOT change the order of these field values when forwarding a
// > message.
//
// Therefore fields are kept in insertion order, and several fields may share
// the same name. Field names are compared case-insensitively.
class HttpHeaders {
  using Fields = std::vector<std::pair<std::string, std::string>>;

 public:
  using iterator = Fields::iterator;
  using const_iterator = Fields::const_iterator;

  HttpHeaders() = default;
  HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> fields)
      : fields_(fields) {}

  iterator begin() noexcept { return fields_.begin(); }
  const_iterator begin() const noexcept { return fields_.begin(); }
  iterator end() noexcept { return fields_.end(); }
  const_iterator end() const noexcept { return fields_.end(); }

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }
  void clear() noexcept { fields_.clear(); }

  bool contains(std::string_view key) const noexcept {
    return !!TryGet(key);
  }

  // `key` is case-insensitive. Returns `std::nullopt` if not found. If there
  // are several fields with the same name, the first one is returned.
  std::optional<std::string_view> TryGet(std::string_view key) const noexcept;

  template <class T>
  std::optional<T> TryGet(std::string_view key) const {
    auto p = TryGet(key);
    if (p) {
      return TryParse<T>(*p);
    }
    return std::nullopt;
  }

  // Set a header field. If it exists, the first occurrence is overwritten and
  // the rest are removed.
  void Set(std::string key, std::string value);

  // Append new field at the end.
  void Append(std::string key, std::string value);

  // `key` is case-insensitive. Returns true if key originally exists in the
  // header.
  bool Remove(std::string_view key) noexcept;

  // Primarily for debugging purpose.
  std::string ToString() const;

 private:
  Fields fields_;
};

}  // namespace stowage

#endif  // STOWAGE_HTTP_HTTP_HEADERS_H_
