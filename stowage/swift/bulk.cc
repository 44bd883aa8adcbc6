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

#include "stowage/swift/bulk.h"

#include <optional>
#include <string>
#include <utility>

#include "json/json.h"

#include "stowage/base/encoding/percent.h"
#include "stowage/base/logging.h"
#include "stowage/base/string.h"

using namespace std::literals;

namespace stowage::swift {

namespace {

// Swift reports status as `"400 Bad Request"`.
std::optional<int> ParseStatusLine(std::string_view s) {
  auto code = s.substr(0, s.find(' '));
  return TryParse<int>(code);
}

// `/container/object`, possibly percent-encoded.
BulkObjectError ParseObjectError(std::string_view path, int status_code) {
  BulkObjectError result;
  result.status_code = status_code;
  if (StartsWith(path, "/")) {
    path.remove_prefix(1);
  }
  auto decoded = DecodePercent(path).value_or(std::string(path));
  auto pos = decoded.find('/');
  if (pos == std::string::npos) {
    result.container_name = std::move(decoded);
  } else {
    result.container_name = decoded.substr(0, pos);
    result.object_name = decoded.substr(pos + 1);
  }
  return result;
}

std::uint64_t GetCount(const Json::Value& root, const char* key) {
  auto&& value = root[key];
  return value.isUInt64() ? value.asUInt64() : 0;
}

Status Malformed(std::string_view body, std::string_view reason) {
  STOWAGE_VLOG(1, "Unrecognized bulk response ({}): {}", reason, body);
  return Status(SwiftStatus::MalformedResponse,
                Format("malformed bulk response: {}", reason));
}

}  // namespace

std::string_view ToStringView(BulkUploadFormat format) noexcept {
  switch (format) {
    case BulkUploadFormat::Tar:
      return "tar";
    case BulkUploadFormat::TarGzip:
      return "tar.gz";
    case BulkUploadFormat::TarBzip2:
      return "tar.bz2";
  }
  return "tar";
}

Expected<BulkResponse, Status> ParseBulkResponse(std::string_view body) {
  Json::Value parsed;
  if (!Json::Reader().parse(body.data(), body.data() + body.size(), parsed) ||
      !parsed.isObject()) {
    return Malformed(body, "not a JSON object");
  }
  const Json::Value& root = parsed;

  BulkResponse result;
  auto&& status_line = root["Response Status"];
  auto code = status_line.isString() ? ParseStatusLine(status_line.asString())
                                     : std::nullopt;
  if (!code) {
    return Malformed(body, "bad `Response Status`");
  }
  result.status_code = *code;
  if (auto&& rb = root["Response Body"]; rb.isString()) {
    result.response_body = rb.asString();
  }
  result.files_created = GetCount(root, "Number Files Created");
  result.deleted = GetCount(root, "Number Deleted");
  result.not_found = GetCount(root, "Number Not Found");

  auto&& errors = root["Errors"];
  if (!errors.isNull() && !errors.isArray()) {
    return Malformed(body, "`Errors` is not an array");
  }
  for (auto&& e : errors) {
    if (!e.isArray() || e.size() != 2 || !e[0].isString() ||
        !e[1].isString()) {
      return Malformed(body, "unrecognized entry in `Errors`");
    }
    auto object_code = ParseStatusLine(e[1].asString());
    if (!object_code) {
      return Malformed(body, "bad status in `Errors`");
    }
    result.errors.push_back(ParseObjectError(e[0].asString(), *object_code));
  }
  return result;
}

Status ToStatus(const BulkResponse& response) {
  if (response.status_code >= 200 && response.status_code < 300 &&
      response.errors.empty()) {
    return {};
  }
  BulkError error;
  error.status_code = response.status_code;
  error.archive_error = response.response_body;
  error.object_errors = response.errors;
  return MakeBulkStatus(std::move(error));
}

}  // namespace stowage::swift
