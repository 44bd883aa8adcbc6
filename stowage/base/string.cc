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

#include "stowage/base/string.h"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "stowage/base/logging.h"

namespace stowage {

namespace {

constexpr std::array<char, 256> kLowerChars = []() {
  std::array<char, 256> cs{};
  for (std::size_t index = 0; index != 256; ++index) {
    if (index >= 'A' && index <= 'Z') {
      cs[index] = index ^ 32;
    } else {
      cs[index] = index;
    }
  }
  return cs;
}();

char ToLower(char c) { return kLowerChars[static_cast<unsigned char>(c)]; }

template <class T>
void JoinImpl(const T& parts, std::string_view delim, std::string* result) {
  std::size_t size = 0;
  for (auto&& e : parts) {
    size += e.size() + delim.size();
  }
  result->clear();
  if (!size) {
    return;
  }
  size -= delim.size();
  result->reserve(size);
  for (auto iter = parts.begin(); iter != parts.end(); ++iter) {
    if (iter != parts.begin()) {
      result->append(delim.begin(), delim.end());
    }
    result->append(iter->begin(), iter->end());
  }
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}

bool IStartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() &&
         IEquals(s.substr(0, prefix.size()), prefix);
}

std::string_view Trim(std::string_view str) {
  std::size_t s = 0, e = str.size();
  while (s != e && IsSpace(str[s])) {
    ++s;
  }
  while (e != s && IsSpace(str[e - 1])) {
    --e;
  }
  return str.substr(s, e - s);
}

std::vector<std::string_view> Split(std::string_view s, char delim,
                                    bool keep_empty) {
  return Split(s, std::string_view(&delim, 1), keep_empty);
}

std::vector<std::string_view> Split(std::string_view s, std::string_view delim,
                                    bool keep_empty) {
  std::vector<std::string_view> splited;
  if (s.empty()) {
    return splited;
  }
  auto current = s;
  STOWAGE_CHECK(!delim.empty());
  while (true) {
    auto pos = current.find(delim);
    if (pos != 0 || keep_empty) {
      splited.push_back(current.substr(0, pos));
    }  // Empty part otherwise.
    if (pos == std::string_view::npos) {
      break;
    }
    current = current.substr(pos + delim.size());
    if (current.empty()) {
      if (keep_empty) {
        splited.push_back("");
      }
      break;
    }
  }
  return splited;
}

std::string Join(const std::vector<std::string_view>& parts,
                 std::string_view delim) {
  std::string result;
  JoinImpl(parts, delim, &result);
  return result;
}

std::string Join(const std::vector<std::string>& parts,
                 std::string_view delim) {
  std::string result;
  JoinImpl(parts, delim, &result);
  return result;
}

std::string Join(const std::initializer_list<std::string_view>& parts,
                 std::string_view delim) {
  std::string result;
  JoinImpl(parts, delim, &result);
  return result;
}

bool IEquals(std::string_view first, std::string_view second) {
  if (first.size() != second.size()) {
    return false;
  }
  for (std::size_t index = 0; index != first.size(); ++index) {
    if (ToLower(first[index]) != ToLower(second[index])) {
      return false;
    }
  }
  return true;
}

template <class T>
std::optional<T>
TryParseTraits<T, std::enable_if_t<std::is_integral_v<T>>>::TryParse(
    std::string_view s, int base) {
  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return {};
  }
  return value;
}

template <class T>
std::optional<T>
TryParseTraits<T, std::enable_if_t<std::is_floating_point_v<T>>>::TryParse(
    std::string_view s) {
  if (s.empty() || IsSpace(s.front())) {
    return std::nullopt;
  }
  std::string buffer(s);
  struct LastErrorStasher {
    LastErrorStasher() : last_errno(errno) { errno = 0; }
    ~LastErrorStasher() { errno = last_errno; }
    int last_errno;
  } _;

  char* end;
  auto result = std::strtod(buffer.c_str(), &end);
  if (end != buffer.c_str() + buffer.size() || errno == ERANGE) {
    return std::nullopt;
  }
  return static_cast<T>(result);
}

template struct TryParseTraits<char>;
template struct TryParseTraits<signed char>;
template struct TryParseTraits<unsigned char>;
template struct TryParseTraits<short>;           // NOLINT
template struct TryParseTraits<unsigned short>;  // NOLINT
template struct TryParseTraits<int>;
template struct TryParseTraits<unsigned int>;
template struct TryParseTraits<long>;                // NOLINT
template struct TryParseTraits<unsigned long>;       // NOLINT
template struct TryParseTraits<long long>;           // NOLINT
template struct TryParseTraits<unsigned long long>;  // NOLINT
template struct TryParseTraits<float>;
template struct TryParseTraits<double>;

}  // namespace stowage
