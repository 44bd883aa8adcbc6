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

#include "stowage/swift/headers.h"

#include <chrono>

#include "gtest/gtest.h"

#include "stowage/swift/status.h"

namespace stowage::swift {

TEST(Headers, StringField) {
  ObjectHeaders hdr;
  EXPECT_FALSE(hdr.ContentType().Exists());
  EXPECT_EQ("", hdr.ContentType().Get());
  hdr.ContentType().Set("application/json");
  EXPECT_EQ("application/json", hdr.raw()->TryGet("content-type"));
  hdr.ContentType().Clear();
  EXPECT_TRUE(hdr.ContentType().Exists());
  EXPECT_EQ("", hdr.ContentType().Get());
  hdr.ContentType().Del();
  EXPECT_FALSE(hdr.ContentType().Exists());
}

TEST(Headers, Uint64Field) {
  ContainerHeaders hdr(HttpHeaders{{"X-Container-Object-Count", "42"},
                                   {"X-Container-Bytes-Used", "1024"}});
  EXPECT_EQ(42, hdr.ObjectCount().Get());
  EXPECT_EQ(1024, hdr.BytesUsed().Get());
  EXPECT_EQ(0, hdr.ObjectCountQuota().Get());
  EXPECT_TRUE(hdr.Validate().ok());

  hdr.ObjectCountQuota().Set(100);
  EXPECT_EQ("100", hdr.raw()->TryGet("X-Container-Meta-Quota-Count"));
  EXPECT_EQ(100, hdr.ObjectCountQuota().Get());
}

TEST(Headers, ValidateReportsFirstMalformedField) {
  ObjectHeaders hdr(HttpHeaders{{"Content-Length", "abc"}});
  EXPECT_EQ(0, hdr.SizeBytes().Get());
  auto status = hdr.Validate();
  ASSERT_EQ(static_cast<int>(SwiftStatus::MalformedHeader), status.code());
  auto error = status.payload<MalformedHeaderError>();
  ASSERT_TRUE(error);
  EXPECT_EQ("Content-Length", error->key);
  EXPECT_EQ("Bad header Content-Length: invalid unsigned integer [abc]",
            status.message());

  AccountHeaders account(HttpHeaders{{"X-Timestamp", "yesterday"}});
  EXPECT_EQ("X-Timestamp",
            account.Validate().payload<MalformedHeaderError>()->key);

  // Empty values are not malformed.
  ObjectHeaders empty(HttpHeaders{{"Content-Length", ""}});
  EXPECT_TRUE(empty.Validate().ok());
}

TEST(Headers, Timestamps) {
  ObjectHeaders hdr(
      HttpHeaders{{"X-Timestamp", "1522059834.30982"},
                  {"Last-Modified", "Mon, 26 Mar 2018 10:23:54 GMT"}});
  EXPECT_TRUE(hdr.Validate().ok());
  auto created = std::chrono::duration_cast<std::chrono::milliseconds>(
      hdr.CreatedAt().Get().time_since_epoch());
  EXPECT_EQ(1522059834309, created.count());
  EXPECT_EQ(std::chrono::system_clock::from_time_t(1522059834),
            hdr.UpdatedAt().Get());

  hdr.ExpiresAt().Set(std::chrono::system_clock::from_time_t(1600000000));
  EXPECT_EQ("1600000000", hdr.raw()->TryGet("X-Delete-At"));

  ObjectHeaders bad(HttpHeaders{{"Last-Modified", "2018-03-26"}});
  EXPECT_FALSE(bad.Validate().ok());
  EXPECT_EQ(std::chrono::system_clock::time_point(), bad.UpdatedAt().Get());

  // Representable as a double but not by the clock.
  ObjectHeaders huge(HttpHeaders{{"X-Timestamp", "1e20"}});
  EXPECT_EQ(static_cast<int>(SwiftStatus::MalformedHeader),
            huge.Validate().code());
  EXPECT_EQ(std::chrono::system_clock::time_point(), huge.CreatedAt().Get());
}

TEST(Headers, Metadata) {
  ObjectHeaders hdr(HttpHeaders{{"x-object-meta-Owner", "alice"},
                                {"Content-Type", "text/plain"}});
  EXPECT_EQ("alice", hdr.Metadata().Get("owner"));
  EXPECT_TRUE(hdr.Metadata().Exists("OWNER"));
  EXPECT_EQ(std::vector<std::string>{"Owner"}, hdr.Metadata().Keys());

  hdr.Metadata().Set("Color", "blue");
  EXPECT_EQ("blue", hdr.raw()->TryGet("X-Object-Meta-Color"));

  // Clearing keeps an empty header, which removes the key on the server.
  hdr.Metadata().Clear("Owner");
  EXPECT_TRUE(hdr.Metadata().Exists("Owner"));
  EXPECT_EQ("", hdr.raw()->TryGet("X-Object-Meta-Owner"));

  hdr.Metadata().Del("Owner");
  EXPECT_FALSE(hdr.Metadata().Exists("Owner"));
}

TEST(Headers, LargeObjectFields) {
  ObjectHeaders hdr(HttpHeaders{{"X-Static-Large-Object", "True"},
                                {"X-Object-Manifest", "segments/prefix"}});
  EXPECT_TRUE(hdr.IsStaticLargeObject().Get());
  EXPECT_EQ("segments/prefix", hdr.DynamicLargeObjectManifest().Get());
  EXPECT_FALSE(ObjectHeaders().IsStaticLargeObject().Get());
}

TEST(Headers, ToRequestHeaders) {
  AccountHeaders prior(HttpHeaders{{"X-Account-Meta-A", "1"},
                                   {"X-Account-Meta-B", "2"}});
  AccountHeaders updated = prior;
  updated.Metadata().Set("b", "3");
  updated.Metadata().Set("c", "4");

  auto all = updated.ToRequestHeaders();
  EXPECT_EQ(3, all.size());

  auto diff = updated.ToRequestHeaders(&prior);
  ASSERT_EQ(2, diff.size());
  EXPECT_EQ("3", diff.TryGet("X-Account-Meta-B"));
  EXPECT_EQ("4", diff.TryGet("X-Account-Meta-C"));
  EXPECT_FALSE(diff.TryGet("X-Account-Meta-A"));
}

TEST(Headers, ToRequestHeadersRemovesDroppedMetadata) {
  ContainerHeaders prior(HttpHeaders{{"X-Container-Meta-A", "1"},
                                     {"X-Container-Meta-B", "2"},
                                     {"X-Container-Read", ".r:*"}});
  ContainerHeaders updated = prior;
  updated.Metadata().Del("a");
  updated.ReadAcl().Del();

  auto diff = updated.ToRequestHeaders(&prior);
  ASSERT_EQ(1, diff.size());
  EXPECT_EQ("", diff.TryGet("x-container-meta-a"));
  EXPECT_FALSE(diff.TryGet("X-Container-Meta-B"));
  // Only metadata is removed implicitly.
  EXPECT_FALSE(diff.TryGet("X-Container-Read"));
}

TEST(Headers, ReadOnlyView) {
  const ObjectHeaders hdr(HttpHeaders{{"Etag", "abc"}});
  EXPECT_EQ("abc", hdr.Etag().Get());
  EXPECT_TRUE(hdr.Etag().Exists());
}

}  // namespace stowage::swift
