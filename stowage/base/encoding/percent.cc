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

#include "stowage/base/encoding/percent.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "stowage/base/encoding/hex.h"

using namespace std::literals;

namespace stowage {

namespace {

// Alphabets / numeric characters need not to be listed in `unescaped_chars`.
constexpr std::array<bool, 256> GenerateUnescapedCharBitmap(
    std::string_view unescaped_chars) {
  std::array<bool, 256> result{};
  for (auto&& e : unescaped_chars) {
    result[static_cast<std::uint8_t>(e)] = true;
  }
  for (int i = 0; i != 10; ++i) {
    result[i + '0'] = true;
  }
  for (int i = 0; i != 26; ++i) {
    result[i + 'a'] = true;
    result[i + 'A'] = true;
  }
  return result;
}

constexpr std::array<std::array<bool, 256>, 2> kUnescapedChars = {
    GenerateUnescapedCharBitmap("_-.~"sv),
    GenerateUnescapedCharBitmap("_-.~/"sv)};

}  // namespace

std::string EncodePercent(std::string_view from,
                          const PercentEncodingOptions& options) {
  std::string result;
  EncodePercent(from, &result, options);
  return result;
}

std::optional<std::string> DecodePercent(std::string_view from,
                                         bool decode_plus_sign_as_whitespace) {
  std::string result;
  if (DecodePercent(from, &result, decode_plus_sign_as_whitespace)) {
    return result;
  }
  return std::nullopt;
}

void EncodePercent(std::string_view from, std::string* to,
                   const PercentEncodingOptions& options) {
  auto&& unescaped = kUnescapedChars[static_cast<int>(options.style)];
  for (auto&& e : from) {
    if (unescaped[static_cast<std::uint8_t>(e)]) {
      to->push_back(e);
    } else {
      // @sa: RFC3986:
      //
      // > For consistency, URI producers and normalizers should use uppercase
      // > hexadecimal digits for all percent encodings.
      to->push_back('%');
      EncodeHex(std::string_view(&e, 1), to, true);
    }
  }
}

bool DecodePercent(std::string_view from, std::string* to,
                   bool decode_plus_sign_as_whitespace) {
  // We may over-allocate here, that won't hurt.
  to->reserve(from.size());
  for (std::size_t i = 0; i != from.size();) {
    if (from[i] == '%') {
      if (i + 3 > from.size() || !DecodeHex(from.substr(i + 1, 2), to)) {
        return false;
      }
      i += 3;
    } else if (decode_plus_sign_as_whitespace && from[i] == '+') {
      to->push_back(' ');
      ++i;
    } else {
      to->push_back(from[i++]);
    }
  }
  return true;
}

}  // namespace stowage
