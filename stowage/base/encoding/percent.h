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

#ifndef STOWAGE_BASE_ENCODING_PERCENT_H_
#define STOWAGE_BASE_ENCODING_PERCENT_H_

#include <optional>
#include <string>
#include <string_view>

namespace stowage {

enum class PercentEncodingStyle {
  // Only RFC3986 unreserved characters are kept as is. This is what query
  // string values and single path segments need.
  Rfc3986 = 0,

  // Same as `Rfc3986`, but `/` is kept, so a whole path (e.g. an object name
  // with pseudo-directories) can be encoded in one go.
  Rfc3986Path = 1
};

struct PercentEncodingOptions {
  PercentEncodingStyle style = PercentEncodingStyle::Rfc3986;
};

// Encode string as pct-encoded.
std::string EncodePercent(std::string_view from,
                          const PercentEncodingOptions& options = {});

// Decode pct-encoded string.
//
// If `decode_plus_sign_as_whitespace` is set, plus sign (`+`) is decoded as
// whitespace. This option is provided to decode things such as query string
// (some implementation uses a legacy encoding scheme and encodes whitespace as
// such).
std::optional<std::string> DecodePercent(
    std::string_view from, bool decode_plus_sign_as_whitespace = false);

void EncodePercent(std::string_view from, std::string* to,
                   const PercentEncodingOptions& options = {});
bool DecodePercent(std::string_view from, std::string* to,
                   bool decode_plus_sign_as_whitespace = false);

}  // namespace stowage

#endif  // STOWAGE_BASE_ENCODING_PERCENT_H_
