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

#ifndef STOWAGE_SWIFT_CAPABILITIES_H_
#define STOWAGE_SWIFT_CAPABILITIES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"

namespace stowage::swift {

// Describes what the service supports, as reported by `GET /info`.
//
// Middlewares not enabled on the server are `std::nullopt`. Limits not
// reported are zero.
struct Capabilities {
  struct Core {
    std::string version;
    std::uint64_t account_listing_limit = 0;
    std::uint64_t container_listing_limit = 0;
    std::uint64_t max_account_name_length = 0;
    std::uint64_t max_container_name_length = 0;
    std::uint64_t max_file_size = 0;
    std::uint64_t max_header_size = 0;
    std::uint64_t max_meta_count = 0;
    std::uint64_t max_meta_name_length = 0;
    std::uint64_t max_meta_overall_size = 0;
    std::uint64_t max_meta_value_length = 0;
    std::uint64_t max_object_name_length = 0;
    bool strict_cors_mode = false;
    std::vector<std::string> policies;
  };

  struct BulkDelete {
    std::uint64_t max_deletes_per_request = 0;
    std::uint64_t max_failed_deletes = 0;
  };

  struct BulkUpload {
    std::uint64_t max_containers_per_extraction = 0;
    std::uint64_t max_failed_extractions = 0;
  };

  struct StaticLargeObject {
    std::uint64_t max_manifest_segments = 0;
    std::uint64_t max_manifest_size = 0;
    std::uint64_t min_segment_size = 0;
  };

  struct TempUrl {
    std::vector<std::string> methods;
    std::vector<std::string> incoming_allow_headers;
    std::vector<std::string> incoming_remove_headers;
    std::vector<std::string> outgoing_allow_headers;
    std::vector<std::string> outgoing_remove_headers;
  };

  struct Symlink {
    std::uint64_t symloop_max = 0;
  };

  Core swift;
  std::optional<BulkDelete> bulk_delete;
  std::optional<BulkUpload> bulk_upload;
  std::optional<StaticLargeObject> slo;
  std::optional<TempUrl> tempurl;
  std::optional<Symlink> symlink;

  // Names of all top-level sections present, including those not modelled
  // above (e.g. `container_quotas`), sorted.
  std::vector<std::string> sections;
};

// Parses body of `GET /info`. Returns `SwiftStatus::MalformedResponse` if
// `body` is not a JSON object.
Expected<Capabilities, Status> ParseCapabilities(std::string_view body);

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_CAPABILITIES_H_
