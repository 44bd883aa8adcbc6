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

#include <algorithm>
#include <string>
#include <utility>

#include "gflags/gflags.h"

#include "stowage/base/encoding/percent.h"
#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/swift/status.h"

DEFINE_int32(stowage_swift_error_body_max_bytes, 4096,
             "At most this many bytes of the body of an unexpected response "
             "are captured into the resulting error, for diagnostic purpose.");

namespace stowage::swift {

namespace {

const std::vector<int>& GetExpectedStatusCodes(const Request& request,
                                               HttpMethod method) {
  if (!request.expected_status_codes.empty()) {
    return request.expected_status_codes;
  }
  if (request.operation) {
    return ExpectedStatusCodesOf(*request.operation);
  }
  return DefaultStatusCodesOf(method);
}

// Converts an unexpected response into an error. The response body is
// consumed and closed.
Status ClassifyFailure(HttpMethod method, const std::vector<int>& expected,
                       TransportResponse response) {
  UnexpectedStatusCodeError error;
  error.expected_status_codes = expected;
  error.status_code = response.status;
  if (method != HttpMethod::Head && response.body) {
    auto body = ReadAll(response.body.get(),
                        FLAGS_stowage_swift_error_body_max_bytes);
    if (body) {
      error.body = std::move(*body);
    } else {
      STOWAGE_VLOG(1, "Failed to read body of an unexpected response: {}",
                   body.error().ToString());
    }
  }
  if (response.body) {
    if (auto status = response.body->Close(); !status.ok()) {
      STOWAGE_VLOG(1, "Failed to close response body: {}", status.ToString());
    }
  }
  error.headers = std::move(response.headers);
  return MakeUnexpectedStatusCodeStatus(std::move(error));
}

}  // namespace

Status ValidateResourceNames(OperationTarget target,
                             const std::string& container_name,
                             const std::string& object_name) {
  if (container_name.empty() &&
      (target != OperationTarget::Account || !object_name.empty())) {
    return Status(SwiftStatus::NoContainerName, "missing container name");
  }
  if (container_name.find('/') != std::string::npos) {
    return Status(SwiftStatus::MalformedContainerName,
                  "container name may not contain slashes");
  }
  if (target == OperationTarget::Object && object_name.empty()) {
    return Status(SwiftStatus::NoObjectName, "missing object name");
  }
  return {};
}

Response::Response(int status, HttpHeaders headers,
                   std::unique_ptr<ReadCloser> body)
    : status_(status), headers_(std::move(headers)), body_(std::move(body)) {}

Response::~Response() {
  if (body_) {
    if (auto status = body_->Close(); !status.ok()) {
      STOWAGE_VLOG(1, "Failed to close response body: {}", status.ToString());
    }
  }
}

Expected<std::string, Status> Response::ReadBody() {
  if (!body_) {
    return std::string();
  }
  auto result = ReadAll(body_.get());
  auto status = body_->Close();
  body_.reset();
  if (!result) {
    return result.error();
  }
  if (!status.ok()) {
    return status;
  }
  return result;
}

Status Response::DrainAndClose() {
  if (!body_) {
    return {};
  }
  char buffer[8192];
  Status result;
  while (true) {
    auto bytes = body_->Read(buffer, sizeof(buffer));
    if (!bytes) {
      result = bytes.error();
      break;
    }
    if (*bytes == 0) {
      break;
    }
  }
  auto status = body_->Close();
  body_.reset();
  return result.ok() ? status : result;
}

std::string EncodeResourcePath(const std::string& container_name,
                               const std::string& object_name) {
  if (container_name.empty()) {
    return {};
  }
  auto path = EncodePercent(container_name);
  if (!object_name.empty()) {
    path += "/";
    path += EncodePercent(object_name, {PercentEncodingStyle::Rfc3986Path});
  }
  return path;
}

std::string LastPathComponent(const std::string& url) {
  auto trimmed = std::string_view(url);
  while (EndsWith(trimmed, "/")) {
    trimmed.remove_suffix(1);
  }
  auto pos = trimmed.find_last_of('/');
  return std::string(pos == std::string_view::npos ? trimmed
                                                   : trimmed.substr(pos + 1));
}

Expected<Response, Status> Execute(Transport* transport,
                                   const Request& request) {
  STOWAGE_CHECK(transport, "No transport was given.");
  auto target = request.operation ? TargetOf(*request.operation)
                                  : OperationTarget::Account;
  if (auto status = ValidateResourceNames(target, request.container_name,
                                          request.object_name);
      !status.ok()) {
    return status;
  }

  auto method = request.method;
  if (method == HttpMethod::Unspecified) {
    STOWAGE_CHECK(request.operation, "Neither method nor operation is given.");
    method = MethodOf(*request.operation);
  }

  TransportRequest treq;
  treq.method = method;
  treq.url = request.url;
  treq.headers = request.headers;
  treq.body = request.body;
  treq.content_length = request.content_length;

  auto values = request.values;
  if (request.options) {
    for (auto&& [k, v] : request.options->headers) {
      treq.headers.Set(k, v);
    }
    for (auto&& [k, v] : request.options->values) {
      values.Set(k, v);
    }
  }
  if (request.url.empty()) {
    treq.path = EncodeResourcePath(request.container_name, request.object_name);
  }
  if (!values.empty()) {
    (treq.url.empty() ? treq.path : treq.url) += "?" + values.ToString();
  }

  STOWAGE_VLOG(1, "{} [{}]", ToStringView(method),
               treq.url.empty() ? transport->EndpointUrl() + treq.path
                                : treq.url);

  auto result = transport->Perform(treq);
  if (!result) {
    STOWAGE_VLOG(1, "Failed to perform {} request: {}", ToStringView(method),
                 result.error().ToString());
    return result.error();
  }

  auto&& expected = GetExpectedStatusCodes(request, method);
  if (std::find(expected.begin(), expected.end(), result->status) ==
      expected.end()) {
    STOWAGE_VLOG(1, "Unexpected status code {} for {} request.",
                 result->status, ToStringView(method));
    return ClassifyFailure(method, expected, std::move(*result));
  }
  STOWAGE_VLOG(1, "Got status code {}.", result->status);
  return Response(result->status, std::move(result->headers),
                  std::move(result->body));
}

}  // namespace stowage::swift
