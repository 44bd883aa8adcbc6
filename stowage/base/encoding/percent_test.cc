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

#include "gtest/gtest.h"

#include "stowage/base/encoding/hex.h"

namespace stowage {

TEST(PercentEncoding, Rfc3986) {
  EXPECT_EQ("a%20b%2Fc~d_e-f.g", EncodePercent("a b/c~d_e-f.g"));
  EXPECT_EQ("%E4%BD%A0%E5%A5%BD", EncodePercent("\xe4\xbd\xa0\xe5\xa5\xbd"));
}

TEST(PercentEncoding, Rfc3986Path) {
  PercentEncodingOptions opts;
  opts.style = PercentEncodingStyle::Rfc3986Path;
  EXPECT_EQ("dir/sub%20dir/file%3F.txt",
            EncodePercent("dir/sub dir/file?.txt", opts));
}

TEST(PercentEncoding, Decode) {
  EXPECT_EQ("a b/c", DecodePercent("a%20b%2Fc"));
  EXPECT_EQ("a b", DecodePercent("a+b", true));
  EXPECT_EQ("a+b", DecodePercent("a+b"));
  EXPECT_FALSE(DecodePercent("%2"));
  EXPECT_FALSE(DecodePercent("%zz"));
}

TEST(HexEncoding, All) {
  EXPECT_EQ("00ff10", EncodeHex(std::string("\x00\xff\x10", 3)));
  EXPECT_EQ("00FF10", EncodeHex(std::string("\x00\xff\x10", 3), true));
  std::string decoded;
  EXPECT_TRUE(DecodeHex("00Ff10", &decoded));
  EXPECT_EQ(std::string("\x00\xff\x10", 3), decoded);
  EXPECT_FALSE(DecodeHex("0", &decoded));
  EXPECT_FALSE(DecodeHex("zz", &decoded));
}

}  // namespace stowage
