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

#include "stowage/swift/download.h"

#include <memory>
#include <string>

#include "gtest/gtest.h"

#include "stowage/swift/status.h"

namespace stowage::swift {

namespace {

class TrackedReader : public StringReader {
 public:
  TrackedReader(std::string data, bool* closed)
      : StringReader(std::move(data)), closed_(closed) {}

  Status Close() override {
    *closed_ = true;
    return {};
  }

 private:
  bool* closed_;
};

DownloadedObject MakeDownload(std::string body, bool* closed) {
  ObjectHeaders headers;
  headers.ContentType().Set("text/plain");
  return DownloadedObject(200, headers,
                          std::make_unique<TrackedReader>(body, closed));
}

}  // namespace

TEST(DownloadedObject, AsString) {
  bool closed = false;
  auto download = MakeDownload("hello", &closed);
  EXPECT_EQ(200, download.status());
  EXPECT_EQ("text/plain", download.headers().ContentType().Get());
  auto body = download.AsString();
  ASSERT_TRUE(body);
  EXPECT_EQ("hello", *body);
  EXPECT_TRUE(closed);
}

TEST(DownloadedObject, AsBytes) {
  bool closed = false;
  auto download = MakeDownload("\x01\x02", &closed);
  auto body = download.AsBytes();
  ASSERT_TRUE(body);
  EXPECT_EQ((std::vector<std::uint8_t>{1, 2}), *body);
}

TEST(DownloadedObject, AlreadyConsumed) {
  bool closed = false;
  auto download = MakeDownload("hello", &closed);
  ASSERT_TRUE(download.AsString());
  auto again = download.AsBytes();
  ASSERT_FALSE(again);
  EXPECT_EQ(static_cast<int>(SwiftStatus::AlreadyConsumed),
            again.error().code());
  EXPECT_FALSE(download.AsReadCloser());
}

TEST(DownloadedObject, AsReadCloserTransfersOwnership) {
  bool closed = false;
  std::unique_ptr<ReadCloser> reader;
  {
    auto download = MakeDownload("hello", &closed);
    auto result = download.AsReadCloser();
    ASSERT_TRUE(result);
    reader = std::move(*result);
  }
  EXPECT_FALSE(closed);
  EXPECT_EQ("hello", *ReadAll(reader.get()));
  ASSERT_TRUE(reader->Close().ok());
  EXPECT_TRUE(closed);
}

TEST(DownloadedObject, ClosedIfNotConsumed) {
  bool closed = false;
  {
    auto download = MakeDownload("hello", &closed);
  }
  EXPECT_TRUE(closed);
}

TEST(DownloadedObject, MovedFromDoesNotClose) {
  bool closed = false;
  auto download = MakeDownload("hello", &closed);
  {
    auto moved = std::move(download);
    EXPECT_FALSE(closed);
    EXPECT_EQ("hello", *moved.AsString());
  }
  EXPECT_TRUE(closed);
}

}  // namespace stowage::swift
