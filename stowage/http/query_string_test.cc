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

#include "gtest/gtest.h"

namespace stowage {

TEST(QueryString, Build) {
  QueryString qs;
  qs.Append("format", "json");
  qs.Append("prefix", "a b/c");
  qs.Append("multipart-manifest", "put");
  qs.Append("symlink", "");
  EXPECT_EQ("format=json&prefix=a%20b%2Fc&multipart-manifest=put&symlink",
            qs.ToString());
  qs.Set("format", "xml");
  EXPECT_EQ("xml", qs.TryGet("format"));
  qs.Remove("prefix");
  EXPECT_FALSE(qs.TryGet("prefix"));
  EXPECT_EQ(3, qs.size());
}

TEST(QueryString, Parse) {
  auto qs = TryParse<QueryString>("limit=10&marker=a%2Fb&prefix=x+y&flag");
  ASSERT_TRUE(qs);
  EXPECT_EQ(10, qs->TryGet<int>("limit"));
  EXPECT_EQ("a/b", qs->TryGet("marker"));
  EXPECT_EQ("x y", qs->TryGet("prefix"));
  EXPECT_EQ("", qs->TryGet("flag"));
  EXPECT_FALSE(TryParse<QueryString>("a=%zz"));
}

}  // namespace stowage
