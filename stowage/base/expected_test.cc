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

#include "stowage/base/expected.h"

#include <charconv>
#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"

namespace stowage {

Expected<int, std::errc> to_int(std::string_view s) {
  int value;
  auto [_, err] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (err == std::errc{}) {
    return value;
  }
  return Unexpected(err);
}

Expected<std::string, std::errc> hello_loop(int n) {
  std::string result;
  while (n--) {
    result += "Hello World\n";
  }
  return result;
}

TEST(Expected, Normal) {
  EXPECT_EQ(to_int("42").value(), 42);
  auto foo = to_int("foo");
  EXPECT_FALSE(foo.has_value());
  EXPECT_EQ(foo.error(), std::errc::invalid_argument);
  EXPECT_EQ(to_int("5000000000").error(), std::errc::result_out_of_range);
  EXPECT_EQ(to_int("foo").value_or(7), 7);

  Expected<std::vector<int>, int> ex2(std::vector<int>{1, 2});
  EXPECT_TRUE(ex2);
  EXPECT_EQ(2, ex2->size());
}

TEST(Expected, AndThen) {
  auto ok = to_int("2").and_then(hello_loop);
  ASSERT_TRUE(ok);
  EXPECT_EQ("Hello World\nHello World\n", *ok);

  auto result = to_int("a123").and_then([](int) -> Expected<void, std::errc> {
    ADD_FAILURE();
    return {};
  });
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), std::errc::invalid_argument);
}

TEST(Expected, Void) {
  Expected<void, int> success;
  EXPECT_TRUE(success);
  Expected<void, int> failure(Unexpected(5));
  ASSERT_FALSE(failure);
  EXPECT_EQ(5, failure.error());
}

}  // namespace stowage
