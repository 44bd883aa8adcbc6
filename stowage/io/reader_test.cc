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

#include "stowage/io/reader.h"

#include <string>

#include "gtest/gtest.h"

namespace stowage {

// Hides the size of the underlying reader.
class OpaqueReader : public Reader {
 public:
  explicit OpaqueReader(Reader* from) : from_(from) {}
  Expected<std::size_t, Status> Read(void* buffer, std::size_t size) override {
    return from_->Read(buffer, std::min<std::size_t>(size, 3));
  }

 private:
  Reader* from_;
};

TEST(StringReader, Read) {
  StringReader reader("hello world");
  EXPECT_EQ(11, reader.Size());
  char buffer[5];
  ASSERT_EQ(5, *reader.Read(buffer, sizeof(buffer)));
  EXPECT_EQ("hello", std::string(buffer, 5));
  EXPECT_EQ(6, reader.Size());
  EXPECT_EQ(" world", *ReadAll(&reader));
  EXPECT_EQ(0, *reader.Read(buffer, sizeof(buffer)));
}

TEST(ReadAll, Bounded) {
  StringReader reader("0123456789");
  OpaqueReader opaque(&reader);
  EXPECT_EQ("0123", *ReadAll(&opaque, 4));
  EXPECT_EQ("456789", *ReadAll(&opaque));
}

TEST(HashingReader, Digest) {
  StringReader reader("test");
  OpaqueReader opaque(&reader);
  HashingReader hashing(&opaque);
  EXPECT_FALSE(hashing.Size());
  EXPECT_EQ("test", *ReadAll(&hashing));
  EXPECT_EQ(4, hashing.BytesRead());
  EXPECT_EQ("098f6bcd4621d373cade4e832627b4f6", hashing.HexDigest());
}

TEST(HashingReader, Null) {
  HashingReader hashing(nullptr);
  EXPECT_EQ(0, hashing.Size());
  EXPECT_EQ("", *ReadAll(&hashing));
  EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", hashing.HexDigest());
}

TEST(LimitedReader, Limit) {
  StringReader reader("0123456789");
  LimitedReader limited(&reader, 4);
  EXPECT_EQ(4, limited.Size());
  EXPECT_EQ("0123", *ReadAll(&limited));
}

TEST(MultiReader, Concatenates) {
  StringReader first("hello"), empty(""), second(" world");
  MultiReader reader({&first, &empty, &second});
  EXPECT_EQ(11, reader.Size());
  EXPECT_EQ("hello world", *ReadAll(&reader));
  EXPECT_EQ(0, reader.Size());
}

TEST(MultiReader, UnknownSize) {
  StringReader first("abc"), second("defgh");
  OpaqueReader opaque(&second);
  MultiReader reader({&first, &opaque});
  EXPECT_FALSE(reader.Size());
  EXPECT_EQ("abcdefgh", *ReadAll(&reader));
}

TEST(Copy, All) {
  StringReader reader(std::string(200000, 'x'));
  StringWriter writer;
  auto copied = Copy(&reader, &writer);
  ASSERT_TRUE(copied);
  EXPECT_EQ(200000, *copied);
  EXPECT_EQ(std::string(200000, 'x'), writer.data());
}

}  // namespace stowage
