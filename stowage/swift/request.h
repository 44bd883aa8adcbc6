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

#ifndef STOWAGE_SWIFT_REQUEST_H_
#define STOWAGE_SWIFT_REQUEST_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gflags/gflags_declare.h"

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/http/http_headers.h"
#include "stowage/http/query_string.h"
#include "stowage/http/types.h"
#include "stowage/io/reader.h"
#include "stowage/swift/operation.h"
#include "stowage/swift/transport.h"

DECLARE_int32(stowage_swift_error_body_max_bytes);

namespace stowage::swift {

// Extra headers and query values for a single request. Most operations accept
// an optional pointer to this structure.
struct RequestOptions {
  HttpHeaders headers;
  QueryString values;
};

struct Request {
  // If not specified, the method of `operation` is used.
  HttpMethod method = HttpMethod::Unspecified;

  // Both may be empty for account-level requests. `object_name` may not be
  // non-empty if `container_name` is empty.
  std::string container_name;
  std::string object_name;

  // Headers / query values chosen by the operation itself.
  HttpHeaders headers;
  QueryString values;

  // Supplied by the user. Takes precedence over `headers` / `values` above.
  // Not owned, may be `nullptr`.
  const RequestOptions* options = nullptr;

  // Not owned, may be `nullptr`.
  Reader* body = nullptr;
  std::optional<std::uint64_t> content_length;

  // Status codes that indicate success. If empty, codes of `operation` (or the
  // method's default, if there's no `operation` either) are used.
  std::vector<int> expected_status_codes;
  std::optional<Operation> operation;

  // If non-empty, overrides the URL computed from container / object name.
  // Used for requests outside of the account (e.g. `GET /info`).
  std::string url;
};

// A response whose status code was expected. The body is closed on
// destruction unless it's released to the caller.
class Response {
 public:
  Response(int status, HttpHeaders headers, std::unique_ptr<ReadCloser> body);
  ~Response();

  Response(Response&&) = default;
  Response& operator=(Response&&) = default;

  int status() const noexcept { return status_; }
  const HttpHeaders& headers() const noexcept { return headers_; }
  HttpHeaders* mutable_headers() noexcept { return &headers_; }

  // `nullptr` once released or closed.
  ReadCloser* body() const noexcept { return body_.get(); }
  std::unique_ptr<ReadCloser> ReleaseBody() noexcept {
    return std::move(body_);
  }

  // Reads the whole body and closes it.
  Expected<std::string, Status> ReadBody();

  // Discards the rest of the body and closes it.
  Status DrainAndClose();

 private:
  int status_;
  HttpHeaders headers_;
  std::unique_ptr<ReadCloser> body_;
};

// Performs `request` via `transport`. Never retries.
//
// Names are validated locally before anything is sent, and status codes other
// than the expected ones are reported as `SwiftStatus::UnexpectedStatusCode`
// carrying the response (including a prefix of its body, see
// `--stowage_swift_error_body_max_bytes`).
Expected<Response, Status> Execute(Transport* transport,
                                   const Request& request);

// Checks names of the resource an operation on `target` acts on. Fails with
// `SwiftStatus::NoContainerName`, `MalformedContainerName` or `NoObjectName`.
Status ValidateResourceNames(OperationTarget target,
                             const std::string& container_name,
                             const std::string& object_name);

// Path of the resource named by `container_name` / `object_name`, relative to
// the account, percent-encoded. Names are not validated.
std::string EncodeResourcePath(const std::string& container_name,
                               const std::string& object_name);

// Returns the last path component of `url`, e.g. `AUTH_abc` for
// `https://host/v1/AUTH_abc/`.
std::string LastPathComponent(const std::string& url);

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_REQUEST_H_
