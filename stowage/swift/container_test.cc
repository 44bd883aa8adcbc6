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

#include "stowage/swift/container.h"

#include <memory>
#include <string>

#include "gtest/gtest.h"

#include "stowage/swift/account.h"
#include "stowage/swift/status.h"
#include "stowage/testing/fake_swift.h"
#include "stowage/testing/main.h"

namespace stowage::swift {

using stowage::testing::FakeSwift;

class ContainerTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeSwift> transport_ = std::make_shared<FakeSwift>();
  Account account_{transport_};
};

TEST_F(ContainerTest, CreateAndDelete) {
  auto container = account_.GetContainer("c");
  EXPECT_EQ("c", container.Name());
  EXPECT_EQ(&account_, container.account());

  auto exists = container.Exists();
  ASSERT_TRUE(exists);
  EXPECT_FALSE(*exists);

  ASSERT_TRUE(container.Create().ok());
  exists = container.Exists();
  ASSERT_TRUE(exists);
  EXPECT_TRUE(*exists);

  ASSERT_TRUE(container.Delete().ok());
  exists = container.Exists();
  ASSERT_TRUE(exists);
  EXPECT_FALSE(*exists);

  auto status = container.Delete();
  EXPECT_TRUE(Is(status, HttpStatus::NotFound));
  EXPECT_TRUE(Is(status, 404));
}

TEST_F(ContainerTest, ExistsPassesOtherErrorsThrough) {
  auto container = account_.GetContainer("c");
  transport_->InjectStatus(503);
  auto exists = container.Exists();
  ASSERT_FALSE(exists);
  EXPECT_TRUE(Is(exists.error(), HttpStatus::ServiceUnavailable));
  EXPECT_FALSE(Is(exists.error(), HttpStatus::NotFound));
}

TEST_F(ContainerTest, MalformedNameIsRejectedLocally) {
  auto container = account_.GetContainer("a/b");
  auto exists = container.Exists();
  ASSERT_FALSE(exists);
  EXPECT_EQ(static_cast<int>(SwiftStatus::MalformedContainerName),
            exists.error().code());
  EXPECT_FALSE(container.Create().ok());
  EXPECT_FALSE(container.GetObject("o").Exists());
  EXPECT_EQ(0, transport_->TotalRequestCount());
}

TEST_F(ContainerTest, EmptyNameIsRejectedLocally) {
  auto container = account_.GetContainer("");
  auto status = container.Delete();
  EXPECT_EQ(static_cast<int>(SwiftStatus::NoContainerName), status.code());
  EXPECT_EQ(0, transport_->TotalRequestCount());
}

TEST_F(ContainerTest, DeleteNonEmpty) {
  auto container = account_.GetContainer("c");
  ASSERT_TRUE(container.Create().ok());
  ASSERT_TRUE(container.GetObject("o").Upload(nullptr).ok());
  auto status = container.Delete();
  ASSERT_FALSE(status.ok());
  EXPECT_TRUE(Is(status, HttpStatus::Conflict));
  auto error = status.payload<UnexpectedStatusCodeError>();
  ASSERT_TRUE(error);
  EXPECT_EQ(409, error->status_code);
  EXPECT_NE(std::string::npos, error->body.find("Conflict"));
}

TEST_F(ContainerTest, Headers) {
  auto container = account_.GetContainer("c");
  ContainerHeaders create;
  create.Metadata().Set("owner", "alice");
  create.ReadAcl().Set(".r:*");
  create.ObjectCountQuota().Set(100);
  ASSERT_TRUE(container.Create(&create).ok());

  StringReader content("hello");
  ASSERT_TRUE(container.GetObject("o").Upload(&content).ok());

  auto headers = container.Headers();
  ASSERT_TRUE(headers);
  EXPECT_EQ("alice", headers->Metadata().Get("owner"));
  EXPECT_EQ(".r:*", headers->ReadAcl().Get());
  EXPECT_EQ(100, headers->ObjectCountQuota().Get());
  EXPECT_EQ("default", headers->StoragePolicy().Get());
  EXPECT_EQ(1, headers->ObjectCount().Get());
  EXPECT_EQ(5, headers->BytesUsed().Get());
}

TEST_F(ContainerTest, UpdateOnlyTouchesGivenHeaders) {
  auto container = account_.GetContainer("c");
  ContainerHeaders create;
  create.Metadata().Set("owner", "alice");
  create.Metadata().Set("team", "storage");
  ASSERT_TRUE(container.Create(&create).ok());

  ContainerHeaders update;
  update.Metadata().Set("owner", "bob");
  update.Metadata().Clear("team");
  update.WriteAcl().Set("AUTH_test:*");
  ASSERT_TRUE(container.Update(update).ok());

  auto headers = container.Headers();
  ASSERT_TRUE(headers);
  EXPECT_EQ("bob", headers->Metadata().Get("owner"));
  EXPECT_FALSE(headers->Metadata().Exists("team"));
  EXPECT_EQ("AUTH_test:*", headers->WriteAcl().Get());
}

TEST_F(ContainerTest, UpdateFromFetchedHeaders) {
  auto container = account_.GetContainer("c");
  ContainerHeaders create;
  create.Metadata().Set("owner", "alice");
  create.Metadata().Set("stale", "yes");
  ASSERT_TRUE(container.Create(&create).ok());

  auto fetched = container.Headers();
  ASSERT_TRUE(fetched);
  ContainerHeaders wanted = *fetched;
  wanted.Metadata().Del("stale");
  wanted.Metadata().Set("team", "storage");
  ASSERT_TRUE(
      container.Update(ContainerHeaders(wanted.ToRequestHeaders(&*fetched)))
          .ok());

  auto headers = container.Headers();
  ASSERT_TRUE(headers);
  EXPECT_EQ("alice", headers->Metadata().Get("owner"));
  EXPECT_EQ("storage", headers->Metadata().Get("team"));
  EXPECT_FALSE(headers->Metadata().Exists("stale"));
}

TEST_F(ContainerTest, UpdateMissing) {
  ContainerHeaders update;
  update.Metadata().Set("owner", "bob");
  auto status = account_.GetContainer("c").Update(update);
  EXPECT_TRUE(Is(status, HttpStatus::NotFound));
}

TEST_F(ContainerTest, HeadersAreCachedUntilInvalidated) {
  auto container = account_.GetContainer("c");
  ASSERT_TRUE(container.Create().ok());
  ASSERT_TRUE(container.Headers());
  ASSERT_TRUE(container.Headers());
  EXPECT_EQ(1, transport_->RequestCount(HttpMethod::Head, "c"));
  container.Invalidate();
  ASSERT_TRUE(container.Headers());
  EXPECT_EQ(2, transport_->RequestCount(HttpMethod::Head, "c"));
}

TEST_F(ContainerTest, EnsureExists) {
  auto container = account_.GetContainer("c");
  ASSERT_TRUE(container.EnsureExists().ok());
  ASSERT_TRUE(container.EnsureExists().ok());
  EXPECT_EQ(1, transport_->RequestCount(HttpMethod::Put, "c"));
  EXPECT_TRUE(transport_->ContainerExists("c"));
}

TEST_F(ContainerTest, CreateIsIdempotent) {
  auto container = account_.GetContainer("c");
  ASSERT_TRUE(container.Create().ok());
  ContainerHeaders update;
  update.Metadata().Set("owner", "bob");
  ASSERT_TRUE(container.Create(&update).ok());  // `202 Accepted`.
  auto headers = container.Headers();
  ASSERT_TRUE(headers);
  EXPECT_EQ("bob", headers->Metadata().Get("owner"));
}

TEST_F(ContainerTest, NameIsEncoded) {
  auto container = account_.GetContainer("my container");
  ASSERT_TRUE(container.Create().ok());
  EXPECT_EQ(1, transport_->RequestCount(HttpMethod::Put, "my%20container"));
  EXPECT_TRUE(transport_->ContainerExists("my container"));
}

}  // namespace stowage::swift

STOWAGE_TEST_MAIN
