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

#include "stowage/swift/capabilities.h"

#include "gtest/gtest.h"

#include "stowage/swift/status.h"

namespace stowage::swift {

TEST(Capabilities, Parse) {
  auto caps = ParseCapabilities(R"({
    "swift": {
      "version": "2.17.0",
      "max_file_size": 5368709122,
      "container_listing_limit": 10000,
      "policies": [{"name": "gold", "default": true}, {"name": "silver"}]
    },
    "bulk_delete": {
      "max_deletes_per_request": 10000,
      "max_failed_deletes": 1000
    },
    "slo": {"max_manifest_segments": 1000, "min_segment_size": 1},
    "tempurl": {"methods": ["GET", "HEAD", "PUT", "POST", "DELETE"]},
    "container_quotas": {}
  })");
  ASSERT_TRUE(caps);
  EXPECT_EQ("2.17.0", caps->swift.version);
  EXPECT_EQ(5368709122, caps->swift.max_file_size);
  EXPECT_EQ(10000, caps->swift.container_listing_limit);
  EXPECT_EQ(0, caps->swift.max_meta_count);
  EXPECT_EQ((std::vector<std::string>{"gold", "silver"}),
            caps->swift.policies);

  ASSERT_TRUE(caps->bulk_delete);
  EXPECT_EQ(10000, caps->bulk_delete->max_deletes_per_request);
  EXPECT_FALSE(caps->bulk_upload);
  ASSERT_TRUE(caps->slo);
  EXPECT_EQ(1000, caps->slo->max_manifest_segments);
  ASSERT_TRUE(caps->tempurl);
  EXPECT_EQ(5, caps->tempurl->methods.size());
  EXPECT_FALSE(caps->symlink);
  EXPECT_EQ(5, caps->sections.size());
}

TEST(Capabilities, Malformed) {
  auto caps = ParseCapabilities("<html>Not Found</html>");
  ASSERT_FALSE(caps);
  EXPECT_EQ(static_cast<int>(SwiftStatus::MalformedResponse),
            caps.error().code());
  EXPECT_FALSE(ParseCapabilities("[1, 2]"));
}

}  // namespace stowage::swift
