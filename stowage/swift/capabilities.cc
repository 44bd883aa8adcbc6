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

#include <string>
#include <vector>

#include "json/json.h"

#include "stowage/base/logging.h"
#include "stowage/swift/status.h"

namespace stowage::swift {

namespace {

std::uint64_t GetUint64(const Json::Value& section, const char* key) {
  auto&& value = section[key];
  if (value.isUInt64()) {
    return value.asUInt64();
  }
  return 0;
}

std::vector<std::string> GetStringList(const Json::Value& section,
                                       const char* key) {
  std::vector<std::string> result;
  auto&& value = section[key];
  if (!value.isArray()) {
    return result;
  }
  for (auto&& e : value) {
    if (e.isString()) {
      result.push_back(e.asString());
    }
  }
  return result;
}

}  // namespace

Expected<Capabilities, Status> ParseCapabilities(std::string_view body) {
  Json::Value parsed;
  if (!Json::Reader().parse(body.data(), body.data() + body.size(), parsed) ||
      !parsed.isObject()) {
    STOWAGE_VLOG(1, "Unrecognized capabilities: {}", body);
    return Status(SwiftStatus::MalformedResponse,
                  "response to GET /info is not a JSON object");
  }

  // Lookups through a non-const `Json::Value` insert missing keys.
  const Json::Value& root = parsed;
  Capabilities result;
  result.sections = root.getMemberNames();

  if (auto&& swift = root["swift"]; swift.isObject()) {
    auto&& core = result.swift;
    core.version = swift["version"].asString();
    core.account_listing_limit = GetUint64(swift, "account_listing_limit");
    core.container_listing_limit = GetUint64(swift, "container_listing_limit");
    core.max_account_name_length = GetUint64(swift, "max_account_name_length");
    core.max_container_name_length =
        GetUint64(swift, "max_container_name_length");
    core.max_file_size = GetUint64(swift, "max_file_size");
    core.max_header_size = GetUint64(swift, "max_header_size");
    core.max_meta_count = GetUint64(swift, "max_meta_count");
    core.max_meta_name_length = GetUint64(swift, "max_meta_name_length");
    core.max_meta_overall_size = GetUint64(swift, "max_meta_overall_size");
    core.max_meta_value_length = GetUint64(swift, "max_meta_value_length");
    core.max_object_name_length = GetUint64(swift, "max_object_name_length");
    core.strict_cors_mode = swift["strict_cors_mode"].isBool() &&
                            swift["strict_cors_mode"].asBool();
    if (auto&& policies = swift["policies"]; policies.isArray()) {
      for (auto&& e : policies) {
        if (e.isObject() && e["name"].isString()) {
          core.policies.push_back(e["name"].asString());
        }
      }
    }
  }
  if (auto&& e = root["bulk_delete"]; e.isObject()) {
    result.bulk_delete = Capabilities::BulkDelete{
        GetUint64(e, "max_deletes_per_request"),
        GetUint64(e, "max_failed_deletes")};
  }
  if (auto&& e = root["bulk_upload"]; e.isObject()) {
    result.bulk_upload = Capabilities::BulkUpload{
        GetUint64(e, "max_containers_per_extraction"),
        GetUint64(e, "max_failed_extractions")};
  }
  if (auto&& e = root["slo"]; e.isObject()) {
    result.slo = Capabilities::StaticLargeObject{
        GetUint64(e, "max_manifest_segments"),
        GetUint64(e, "max_manifest_size"), GetUint64(e, "min_segment_size")};
  }
  if (auto&& e = root["tempurl"]; e.isObject()) {
    result.tempurl = Capabilities::TempUrl{
        GetStringList(e, "methods"),
        GetStringList(e, "incoming_allow_headers"),
        GetStringList(e, "incoming_remove_headers"),
        GetStringList(e, "outgoing_allow_headers"),
        GetStringList(e, "outgoing_remove_headers")};
  }
  if (auto&& e = root["symlink"]; e.isObject()) {
    result.symlink = Capabilities::Symlink{GetUint64(e, "symloop_max")};
  }
  return result;
}

}  // namespace stowage::swift
