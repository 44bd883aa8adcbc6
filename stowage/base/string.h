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

#ifndef STOWAGE_BASE_STRING_H_
#define STOWAGE_BASE_STRING_H_

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "fmt/format.h"

namespace stowage {

template <class T, class = void>
struct TryParseTraits;

// Try parse `s` as `T`.
template <class T, class... Args>
inline std::optional<T> TryParse(std::string_view s, const Args&... args) {
  return TryParseTraits<T>::TryParse(s, args...);
}

// @sa: `std::format`
template <class... Args>
std::string Format(fmt::format_string<Args...> fmt, Args&&... args) {
  return fmt::format(fmt, std::forward<Args>(args)...);
}

// `std::string(_view)::starts_with/ends_with` is not available until C++20, so
// we roll our own here.
bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);

// Case-insensitive version of `StartsWith`.
bool IStartsWith(std::string_view s, std::string_view prefix);

// Trim whitespace at both end of the string.
std::string_view Trim(std::string_view str);

// Split string by `delim`.
std::vector<std::string_view> Split(std::string_view s, char delim,
                                    bool keep_empty = false);
std::vector<std::string_view> Split(std::string_view s, std::string_view delim,
                                    bool keep_empty = false);

// Join strings in `parts`, delimited by `delim`.
std::string Join(const std::vector<std::string_view>& parts,
                 std::string_view delim);
std::string Join(const std::vector<std::string>& parts,
                 std::string_view delim);
std::string Join(const std::initializer_list<std::string_view>& parts,
                 std::string_view delim);

// Case insensitive-comparison. ASCII only.
bool IEquals(std::string_view first, std::string_view second);

// Implementation goes below.

template <class T>
struct TryParseTraits<T, std::enable_if_t<std::is_integral_v<T>>> {
  static std::optional<T> TryParse(std::string_view s, int base = 10);
};

template <class T>
struct TryParseTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static std::optional<T> TryParse(std::string_view s);
};

}  // namespace stowage

#endif  // STOWAGE_BASE_STRING_H_
