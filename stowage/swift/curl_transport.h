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

#ifndef STOWAGE_SWIFT_CURL_TRANSPORT_H_
#define STOWAGE_SWIFT_CURL_TRANSPORT_H_

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "gflags/gflags_declare.h"

#include "stowage/swift/transport.h"

DECLARE_int32(stowage_swift_timeout_ms);
DECLARE_string(stowage_swift_user_agent);

namespace stowage::swift {

// Performs requests with libcurl, authenticated by a token obtained
// elsewhere (e.g. from Keystone).
//
// Each request is carried out on a dedicated thread. The response body is
// streamed to the caller through a bounded pipe as it arrives, so huge
// objects may be downloaded without buffering them in memory. Closing the
// body early aborts the transfer.
//
//   CurlTransport::Options opts;
//   opts.endpoint_url = "https://swift.example.com/v1/AUTH_abc";
//   opts.auth_token = token;
//   Account account(std::make_shared<CurlTransport>(opts));
class CurlTransport : public Transport {
 public:
  struct Options {
    // URL of the account. A trailing slash is added if missing.
    std::string endpoint_url;

    // Sent as `X-Auth-Token`. Not sent if empty.
    std::string auth_token;

    // Applies to the whole transfer, including reading the response body.
    // Defaults to `FLAGS_stowage_swift_timeout_ms` if not set. Zero disables
    // timeout.
    std::chrono::milliseconds timeout{-1};

    // Defaults to `FLAGS_stowage_swift_user_agent`.
    std::string user_agent;

    // Size of the buffer between the transfer thread and the response body.
    std::size_t body_buffer_size = 64 * 1024;
  };

  explicit CurlTransport(Options options);

  Expected<TransportResponse, Status> Perform(
      const TransportRequest& request) override;
  std::string EndpointUrl() const override { return options_.endpoint_url; }
  std::unique_ptr<Transport> Clone(
      const std::string& endpoint_url) const override;

 private:
  Options options_;
};

namespace detail {

// `Key: value`, or `Key;` if `value` is empty (which is how libcurl is told
// to send an empty header instead of removing it).
std::string FormatCurlHeader(std::string_view key, std::string_view value);

}  // namespace detail

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_CURL_TRANSPORT_H_
