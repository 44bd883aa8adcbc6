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

#ifndef STOWAGE_SWIFT_STATUS_H_
#define STOWAGE_SWIFT_STATUS_H_

#include <string>
#include <string_view>
#include <vector>

#include "stowage/base/status.h"
#include "stowage/http/http_headers.h"
#include "stowage/http/types.h"

namespace stowage {

enum class SwiftStatus {
  Success = 0,  // Hardly used.

  // Detected locally, before any request is sent.
  NoContainerName = 1,
  MalformedContainerName = 2,
  NoObjectName = 3,
  AccountMismatch = 4,
  SegmentInvalid = 5,
  AlreadyConsumed = 6,
  InvalidArgument = 7,

  // The server responded with a status code we didn't expect. Carries
  // `swift::UnexpectedStatusCodeError`.
  UnexpectedStatusCode = 10,

  // Carries `swift::MalformedHeaderError`.
  MalformedHeader = 11,
  MalformedResponse = 12,

  // Etag returned by the server does not match what we've sent.
  ChecksumMismatch = 13,

  // Carries `swift::BulkError`.
  BulkFailure = 14,

  NotSupported = 15,
  NotLarge = 16,
  TransportFailure = 17,
  IoError = 18,
};

namespace swift {

// Payload of `SwiftStatus::UnexpectedStatusCode`.
struct UnexpectedStatusCodeError {
  std::vector<int> expected_status_codes;
  int status_code = 0;
  HttpHeaders headers;
  // Captured for diagnostics only. Possibly truncated.
  std::string body;

  // E.g. "expected 201/202 response, got 404 instead: <body>".
  std::string ToString() const;
};

// Payload of `SwiftStatus::MalformedHeader`.
struct MalformedHeaderError {
  std::string key;
  std::string reason;

  // E.g. "Bad header Content-Length: not an unsigned integer".
  std::string ToString() const;
};

// Failure on a single object in a bulk operation. Only reported as part of
// `BulkError`.
struct BulkObjectError {
  std::string container_name;
  std::string object_name;
  int status_code = 0;

  // E.g. "container/object: 404 Not Found".
  std::string ToString() const;
};

// Payload of `SwiftStatus::BulkFailure`.
struct BulkError {
  // Overall status code of the operation.
  int status_code = 0;
  // Error unpacking the archive, or the reason why the request was rejected
  // as a whole. May be empty.
  std::string archive_error;
  std::vector<BulkObjectError> object_errors;

  // Object errors are condensed into a count, so as to fit into one line.
  std::string ToString() const;
};

Status MakeUnexpectedStatusCodeStatus(UnexpectedStatusCodeError error);
Status MakeMalformedHeaderStatus(std::string key, std::string reason);
Status MakeBulkStatus(BulkError error);

// Tests if `status` is an unexpected-status-code failure whose actual status
// code is `code`.
//
//   auto status = container.Delete();
//   if (swift::Is(status, HttpStatus::NotFound)) {
//     // Not there, just what we wanted.
//   }
bool Is(const Status& status, int code);
bool Is(const Status& status, HttpStatus code);

}  // namespace swift

}  // namespace stowage

#endif  // STOWAGE_SWIFT_STATUS_H_
