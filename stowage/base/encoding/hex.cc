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

#include "stowage/base/encoding/hex.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace stowage {

namespace {

constexpr char kHexCharsLowercase[] = "0123456789abcdef";
constexpr char kHexCharsUppercase[] = "0123456789ABCDEF";

int ValueOfHexChar(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  } else if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  } else if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string EncodeHex(std::string_view from, bool uppercase) {
  std::string result;
  EncodeHex(from, &result, uppercase);
  return result;
}

void EncodeHex(std::string_view from, std::string* to, bool uppercase) {
  auto chars = uppercase ? kHexCharsUppercase : kHexCharsLowercase;
  to->reserve(to->size() + from.size() * 2);
  for (auto&& e : from) {
    auto index = static_cast<std::uint8_t>(e);
    to->append({chars[index >> 4], chars[index & 0xF]});
  }
}

bool DecodeHex(std::string_view from, std::string* to) {
  if (from.size() % 2 != 0) {
    return false;
  }
  to->reserve(to->size() + from.size() / 2);
  for (std::size_t i = 0; i != from.size(); i += 2) {
    auto high = ValueOfHexChar(from[i]), low = ValueOfHexChar(from[i + 1]);
    if (high == -1 || low == -1) {
      return false;
    }
    to->push_back(static_cast<char>(high * 16 + low));
  }
  return true;
}

}  // namespace stowage
