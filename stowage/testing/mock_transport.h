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

#ifndef STOWAGE_TESTING_MOCK_TRANSPORT_H_
#define STOWAGE_TESTING_MOCK_TRANSPORT_H_

#include <memory>
#include <string>
#include <utility>

#include "gmock/gmock.h"

#include "stowage/io/reader.h"
#include "stowage/swift/transport.h"

namespace stowage::testing {

// Usage:
//
//   MockTransport transport;
//   EXPECT_CALL(transport,
//               Perform(RequestTo(HttpMethod::Head, "container")))
//       .WillOnce(Return(MakeResponse(204)));
class MockTransport : public swift::Transport {
 public:
  explicit MockTransport(
      std::string endpoint_url = "https://swift.example.com/v1/AUTH_test/")
      : endpoint_url_(std::move(endpoint_url)) {}

  using PerformResult = Expected<swift::TransportResponse, Status>;

  MOCK_METHOD1(Perform, PerformResult(const swift::TransportRequest&));

  std::string EndpointUrl() const override { return endpoint_url_; }

  std::unique_ptr<swift::Transport> Clone(
      const std::string& endpoint_url) const override {
    return std::make_unique<::testing::NiceMock<MockTransport>>(endpoint_url);
  }

 private:
  std::string endpoint_url_;
};

// gmock needs copyable return values, while responses own their body. This
// action builds a fresh response on each invocation.
ACTION_P3(ReturnResponse, status, headers, body) {
  swift::TransportResponse response;
  response.status = status;
  response.headers = headers;
  response.body = std::make_unique<StringReader>(body);
  return Expected<swift::TransportResponse, Status>(std::move(response));
}

MATCHER_P2(RequestTo, method, path, "") {
  return arg.method == method && arg.path == path;
}

MATCHER_P2(HttpHeaderEq, key, val, "Http Header eq") {
  auto&& opt = arg.headers.TryGet(key);
  return opt && std::string(*opt) == val;
}

MATCHER_P(HttpHeaderAbsent, key, "") { return !arg.headers.contains(key); }

}  // namespace stowage::testing

#endif  // STOWAGE_TESTING_MOCK_TRANSPORT_H_
