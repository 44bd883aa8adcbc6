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

#ifndef STOWAGE_SWIFT_BULK_H_
#define STOWAGE_SWIFT_BULK_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/swift/status.h"

namespace stowage::swift {

// Archive formats understood by `Account::BulkUpload`.
enum class BulkUploadFormat { Tar, TarGzip, TarBzip2 };

// Value of `extract-archive` query for `format`.
std::string_view ToStringView(BulkUploadFormat format) noexcept;

// Decoded body of a response to bulk delete or archive extraction. Such
// responses are always `200 OK` on HTTP level, the actual outcome is
// described here.
struct BulkResponse {
  // Leading code of `Response Status`, e.g. 400 for `400 Bad Request`.
  int status_code = 0;
  std::string response_body;

  std::uint64_t files_created = 0;
  std::uint64_t deleted = 0;
  std::uint64_t not_found = 0;

  std::vector<BulkObjectError> errors;
};

// Decodes JSON response body of a bulk operation.
Expected<BulkResponse, Status> ParseBulkResponse(std::string_view body);

// Returns a failure carrying `BulkError` if `response` describes one (non-2xx
// overall status, or some object errors), success otherwise.
Status ToStatus(const BulkResponse& response);

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_BULK_H_
