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

#include "stowage/swift/bulk.h"

#include "gtest/gtest.h"

namespace stowage::swift {

TEST(Bulk, Success) {
  auto resp = ParseBulkResponse(
      R"({"Response Status": "200 OK", "Response Body": "",
          "Number Deleted": 3, "Number Not Found": 1, "Errors": []})");
  ASSERT_TRUE(resp);
  EXPECT_EQ(200, resp->status_code);
  EXPECT_EQ(3, resp->deleted);
  EXPECT_EQ(1, resp->not_found);
  EXPECT_TRUE(ToStatus(*resp).ok());
}

TEST(Bulk, ObjectErrors) {
  auto resp = ParseBulkResponse(
      R"({"Response Status": "400 Bad Request", "Response Body": "",
          "Number Files Created": 2,
          "Errors": [["/c/dir/a%20b", "404 Not Found"],
                     ["/c2", "409 Conflict"]]})");
  ASSERT_TRUE(resp);
  EXPECT_EQ(2, resp->files_created);
  ASSERT_EQ(2, resp->errors.size());
  EXPECT_EQ("c", resp->errors[0].container_name);
  EXPECT_EQ("dir/a b", resp->errors[0].object_name);
  EXPECT_EQ(404, resp->errors[0].status_code);
  EXPECT_EQ("c2", resp->errors[1].container_name);
  EXPECT_EQ("", resp->errors[1].object_name);

  auto status = ToStatus(*resp);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(static_cast<int>(SwiftStatus::BulkFailure), status.code());
  EXPECT_EQ("400 Bad Request (+2 object errors)", status.message());
  auto payload = status.payload<BulkError>();
  ASSERT_TRUE(payload);
  EXPECT_EQ(2, payload->object_errors.size());
  EXPECT_EQ("c/dir/a b: 404 Not Found", payload->object_errors[0].ToString());
}

TEST(Bulk, ArchiveError) {
  auto resp = ParseBulkResponse(
      R"({"Response Status": "400 Bad Request",
          "Response Body": "Invalid Tar File: truncated header",
          "Number Files Created": 0, "Errors": []})");
  ASSERT_TRUE(resp);
  auto status = ToStatus(*resp);
  EXPECT_EQ("400 Bad Request: Invalid Tar File: truncated header",
            status.message());
}

TEST(Bulk, PartialSuccessIsStillAFailure) {
  auto resp = ParseBulkResponse(
      R"({"Response Status": "200 OK",
          "Errors": [["/c/o", "401 Unauthorized"]]})");
  ASSERT_TRUE(resp);
  EXPECT_FALSE(ToStatus(*resp).ok());
}

TEST(Bulk, Malformed) {
  EXPECT_FALSE(ParseBulkResponse("oops"));
  EXPECT_FALSE(ParseBulkResponse(R"({"Response Status": "OK"})"));
  EXPECT_FALSE(ParseBulkResponse(
      R"({"Response Status": "200 OK", "Errors": [["/c/o"]]})"));
}

}  // namespace stowage::swift
