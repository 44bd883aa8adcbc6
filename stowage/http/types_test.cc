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

#include "stowage/http/types.h"

#include "gtest/gtest.h"

namespace stowage {

TEST(HttpTypes, Stringify) {
  EXPECT_EQ("GET", ToStringView(HttpMethod::Get));
  EXPECT_EQ("DELETE", ToStringView(HttpMethod::Delete));
  EXPECT_EQ("Not Found", ToStringView(HttpStatus::NotFound));
  EXPECT_EQ("Bad Request", StatusText(400));
  EXPECT_EQ("", StatusText(299));
  EXPECT_EQ("", StatusText(-1));
  EXPECT_EQ("", StatusText(1000));
}

TEST(HttpTypes, ParseMethod) {
  EXPECT_EQ(HttpMethod::Put, TryParse<HttpMethod>("PUT"));
  EXPECT_FALSE(TryParse<HttpMethod>("put"));
  EXPECT_FALSE(TryParse<HttpMethod>("UNSPECIFIED"));
}

}  // namespace stowage
