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

#include "stowage/swift/request.h"

#include <memory>
#include <string>

#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "stowage/swift/status.h"
#include "stowage/testing/main.h"
#include "stowage/testing/mock_transport.h"

using namespace std::literals;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::StrictMock;

namespace stowage::swift {

using stowage::testing::HttpHeaderEq;
using stowage::testing::MockTransport;
using stowage::testing::RequestTo;
using stowage::testing::ReturnResponse;

TEST(Request, MalformedContainerNameIsRejectedLocally) {
  StrictMock<MockTransport> transport;  // No call is expected.
  Request req;
  req.operation = Operation::ContainerHeaders;
  req.container_name = "a/b";
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ(static_cast<int>(SwiftStatus::MalformedContainerName),
            result.error().code());
  EXPECT_EQ("container name may not contain slashes", result.error().message());
}

TEST(Request, ObjectWithoutContainerIsRejectedLocally) {
  StrictMock<MockTransport> transport;
  Request req;
  req.operation = Operation::ObjectHeaders;
  req.object_name = "obj";
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ(static_cast<int>(SwiftStatus::NoContainerName),
            result.error().code());
  EXPECT_EQ("missing container name", result.error().message());
}

TEST(Request, ObjectOperationRequiresObjectName) {
  StrictMock<MockTransport> transport;
  Request req;
  req.operation = Operation::ObjectDownload;
  req.container_name = "c";
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ(static_cast<int>(SwiftStatus::NoObjectName),
            result.error().code());

  req.container_name = "";
  result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ(static_cast<int>(SwiftStatus::NoContainerName),
            result.error().code());
}

TEST(Request, PathIsEncoded) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport,
              Perform(RequestTo(HttpMethod::Head,
                                "my%20container/dir/file%3F%231.txt")))
      .WillOnce(ReturnResponse(200, HttpHeaders(), ""));
  Request req;
  req.operation = Operation::ObjectHeaders;
  req.container_name = "my container";
  req.object_name = "dir/file?#1.txt";
  auto result = Execute(&transport, req);
  ASSERT_TRUE(result);
  EXPECT_EQ(200, result->status());
}

TEST(Request, OptionsTakePrecedence) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport,
              Perform(AllOf(RequestTo(HttpMethod::Get, "c?limit=5&prefix=x"),
                            HttpHeaderEq("X-Newest", "true"),
                            HttpHeaderEq("Accept", "application/json"))))
      .WillOnce(ReturnResponse(200, HttpHeaders(), "[]"));

  RequestOptions opts;
  opts.headers.Set("Accept", "application/json");
  opts.headers.Set("X-Newest", "true");
  opts.values.Set("limit", "5");

  Request req;
  req.operation = Operation::ListObjects;
  req.container_name = "c";
  req.headers.Set("Accept", "text/plain");
  req.values.Set("limit", "1000");
  req.values.Set("prefix", "x");
  req.options = &opts;
  auto result = Execute(&transport, req);
  ASSERT_TRUE(result);
  EXPECT_EQ("[]", *result->ReadBody());
}

TEST(Request, AbsoluteUrl) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport,
              Perform(AllOf(Field(&TransportRequest::url,
                                  "https://swift.example.com/info"s),
                            Field(&TransportRequest::path, ""s))))
      .WillOnce(ReturnResponse(200, HttpHeaders(), "{}"));
  Request req;
  req.operation = Operation::Capabilities;
  req.url = "https://swift.example.com/info";
  EXPECT_TRUE(Execute(&transport, req));
}

TEST(Request, UnexpectedStatusCode) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport, Perform(RequestTo(HttpMethod::Put, "c")))
      .WillOnce(ReturnResponse(
          507, HttpHeaders({{"Content-Type", "text/plain"}}), "Disk full"));
  Request req;
  req.operation = Operation::ContainerCreate;
  req.container_name = "c";
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ("expected 201/202 response, got 507 instead: Disk full",
            result.error().message());
  EXPECT_TRUE(Is(result.error(), 507));
  EXPECT_FALSE(Is(result.error(), 404));

  auto payload = result.error().payload<UnexpectedStatusCodeError>();
  ASSERT_TRUE(payload);
  EXPECT_EQ((std::vector<int>{201, 202}), payload->expected_status_codes);
  EXPECT_EQ("text/plain", *payload->headers.TryGet("content-type"));
}

TEST(Request, ErrorBodyIsTruncated) {
  google::FlagSaver saver;
  FLAGS_stowage_swift_error_body_max_bytes = 4;

  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport, Perform(_))
      .WillOnce(ReturnResponse(500, HttpHeaders(), "something bad"));
  Request req;
  req.method = HttpMethod::Get;
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ("expected 200 response, got 500 instead: some",
            result.error().message());
}

TEST(Request, HeadBodyIsNotCaptured) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport, Perform(_))
      .WillOnce(ReturnResponse(404, HttpHeaders(), "ignored"));
  Request req;
  req.operation = Operation::ContainerHeaders;
  req.container_name = "c";
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ("expected 204/200 response, got 404 instead",
            result.error().message());
}

TEST(Request, ExplicitStatusCodes) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport, Perform(_))
      .WillOnce(ReturnResponse(409, HttpHeaders(), ""));
  Request req;
  req.operation = Operation::ContainerDelete;
  req.container_name = "c";
  req.expected_status_codes = {204, 409};
  auto result = Execute(&transport, req);
  ASSERT_TRUE(result);
  EXPECT_EQ(409, result->status());
}

TEST(Request, TransportFailurePropagates) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport, Perform(_))
      .WillOnce(::testing::Return(::testing::ByMove(
          MockTransport::PerformResult(Status(SwiftStatus::TransportFailure,
                                              "Connection refused")))));
  Request req;
  req.method = HttpMethod::Head;
  auto result = Execute(&transport, req);
  ASSERT_FALSE(result);
  EXPECT_EQ(static_cast<int>(SwiftStatus::TransportFailure),
            result.error().code());
}

TEST(Request, DrainAndClose) {
  StrictMock<MockTransport> transport;
  EXPECT_CALL(transport, Perform(_))
      .WillOnce(ReturnResponse(200, HttpHeaders(), std::string(100000, 'x')));
  Request req;
  req.method = HttpMethod::Get;
  auto result = Execute(&transport, req);
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->DrainAndClose().ok());
  EXPECT_EQ(nullptr, result->body());
}

TEST(Request, LastPathComponent) {
  EXPECT_EQ("AUTH_abc", LastPathComponent("https://host/v1/AUTH_abc"));
  EXPECT_EQ("AUTH_abc", LastPathComponent("https://host/v1/AUTH_abc/"));
}

}  // namespace stowage::swift

STOWAGE_TEST_MAIN
