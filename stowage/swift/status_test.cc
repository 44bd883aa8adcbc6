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

#include "stowage/swift/status.h"

#include "gtest/gtest.h"

namespace stowage::swift {

TEST(SwiftStatus, UnexpectedStatusCode) {
  auto status = MakeUnexpectedStatusCodeStatus({{200}, 404, {}, ""});
  EXPECT_EQ(static_cast<int>(SwiftStatus::UnexpectedStatusCode),
            status.code());
  EXPECT_EQ("expected 200 response, got 404 instead", status.message());

  auto with_body = MakeUnexpectedStatusCodeStatus(
      {{201, 202}, 500, {}, "something broke"});
  EXPECT_EQ("expected 201/202 response, got 500 instead: something broke",
            with_body.message());
  ASSERT_TRUE(with_body.payload<UnexpectedStatusCodeError>());
  EXPECT_EQ(500, with_body.payload<UnexpectedStatusCodeError>()->status_code);
}

TEST(SwiftStatus, Is) {
  auto status = MakeUnexpectedStatusCodeStatus({{200}, 404, {}, ""});
  EXPECT_TRUE(Is(status, HttpStatus::NotFound));
  EXPECT_TRUE(Is(status, 404));
  EXPECT_FALSE(Is(status, HttpStatus::NoContent));
  // Acceptable codes do not count.
  EXPECT_FALSE(Is(status, HttpStatus::OK));

  EXPECT_FALSE(Is(Status(), HttpStatus::NotFound));
  EXPECT_FALSE(Is(Status(SwiftStatus::ChecksumMismatch, "mismatch"),
                  HttpStatus::NotFound));
  // Same numeric code, but a different kind of failure.
  EXPECT_FALSE(Is(Status(SwiftStatus::UnexpectedStatusCode, "no payload"),
                  HttpStatus::NotFound));
}

TEST(SwiftStatus, MalformedHeader) {
  auto status =
      MakeMalformedHeaderStatus("Content-Length", "not an unsigned integer");
  EXPECT_EQ(static_cast<int>(SwiftStatus::MalformedHeader), status.code());
  EXPECT_EQ("Bad header Content-Length: not an unsigned integer",
            status.message());
  EXPECT_EQ("Content-Length", status.payload<MalformedHeaderError>()->key);
}

TEST(SwiftStatus, Bulk) {
  BulkObjectError object_error{"c", "o", 404};
  EXPECT_EQ("c/o: 404 Not Found", object_error.ToString());

  BulkError error{400, "archive err", {object_error, object_error}};
  auto status = MakeBulkStatus(error);
  EXPECT_EQ("400 Bad Request: archive err (+2 object errors)",
            status.message());
  ASSERT_TRUE(status.payload<BulkError>());
  EXPECT_EQ(2, status.payload<BulkError>()->object_errors.size());

  EXPECT_EQ("502 Bad Gateway", (BulkError{502, "", {}}).ToString());
}

}  // namespace stowage::swift
