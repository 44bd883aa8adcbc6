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

#ifndef STOWAGE_SWIFT_TRANSPORT_H_
#define STOWAGE_SWIFT_TRANSPORT_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/http/http_headers.h"
#include "stowage/http/types.h"
#include "stowage/io/reader.h"

namespace stowage::swift {

struct TransportRequest {
  HttpMethod method = HttpMethod::Get;

  // Relative to the endpoint URL (e.g. `container/object?query`). Must already
  // be percent-encoded. Empty if the request targets the account itself.
  std::string path;

  // If non-empty, an absolute URL to use instead of `path` (e.g. for
  // `GET /info`, which lives outside of the account).
  std::string url;

  HttpHeaders headers;

  // Request body, not owned. `nullptr` if there's none.
  Reader* body = nullptr;

  // Sent as `Content-Length` if known, otherwise the body is sent chunked.
  std::optional<std::uint64_t> content_length;
};

struct TransportResponse {
  int status = 0;
  HttpHeaders headers;
  // Never `nullptr`. It's the caller's responsibility to close it.
  std::unique_ptr<ReadCloser> body;
};

// The transport performs HTTP requests against a single account of the
// storage service. It's responsible for authentication (e.g. by adding
// `X-Auth-Token`), connection management and timeouts.
//
// This interface also eases implementing testing facilities.
class Transport {
 public:
  virtual ~Transport() = default;

  // Performs `request`. Returns a failure only if no response was received
  // at all. Any HTTP status is a successful transport-level result.
  virtual Expected<TransportResponse, Status> Perform(
      const TransportRequest& request) = 0;

  // URL of the account this transport talks to, with trailing slash, e.g.
  // `https://swift.example.com/v1/AUTH_abc/`.
  virtual std::string EndpointUrl() const = 0;

  // Creates a transport for another account of the same cluster, sharing the
  // credentials of this one.
  virtual std::unique_ptr<Transport> Clone(
      const std::string& endpoint_url) const = 0;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_TRANSPORT_H_
