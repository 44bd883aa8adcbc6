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

#include "stowage/swift/iterator.h"

#include <time.h>

#include <string>
#include <utility>

#include "json/json.h"

#include "stowage/base/encoding/percent.h"
#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/swift/account.h"
#include "stowage/swift/status.h"

namespace stowage::swift {

namespace {

Status MakeMalformedListingStatus(std::string_view reason) {
  return Status(SwiftStatus::MalformedResponse,
                Format("malformed listing: {}", reason));
}

std::uint64_t GetUint64(const Json::Value& entry, const char* key) {
  auto&& value = entry[key];
  return value.isUInt64() ? value.asUInt64() : 0;
}

std::string GetString(const Json::Value& entry, const char* key) {
  auto&& value = entry[key];
  return value.isString() ? value.asString() : std::string();
}

// Listings report time as `2016-08-04T14:07:22.123456`, in UTC.
std::chrono::system_clock::time_point ParseListingTimestamp(
    const std::string& s) {
  std::tm tm{};
  auto rest = strptime(s.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
  if (!rest) {
    return {};
  }
  auto result = std::chrono::system_clock::from_time_t(timegm(&tm));
  if (*rest == '.') {
    std::string digits;
    for (++rest; *rest >= '0' && *rest <= '9' && digits.size() < 6; ++rest) {
      digits.push_back(*rest);
    }
    digits.resize(6, '0');
    result += std::chrono::microseconds(TryParse<int>(digits).value_or(0));
  }
  return result;
}

// `/v1/AUTH_abc/container/object` -> `container/object`.
std::string StripAccountPath(std::string_view path) {
  auto decoded = DecodePercent(path).value_or(std::string(path));
  std::size_t pos = 0;
  for (int i = 0; i != 3; ++i) {
    pos = decoded.find('/', i == 0 ? 0 : pos + 1);
    if (pos == std::string::npos) {
      return decoded;
    }
  }
  return decoded.substr(pos + 1);
}

Expected<std::vector<std::string>, Status> FetchNames(Transport* transport,
                                                     const Request& req) {
  auto resp = Execute(transport, req);
  if (!resp) {
    return resp.error();
  }
  auto body = resp->ReadBody();
  if (!body) {
    return body.error();
  }
  std::vector<std::string> names;
  for (auto&& e : Split(*body, '\n')) {
    names.emplace_back(e);
  }
  return names;
}

Expected<Json::Value, Status> FetchEntries(Transport* transport,
                                           const Request& req) {
  auto resp = Execute(transport, req);
  if (!resp) {
    return resp.error();
  }
  auto body = resp->ReadBody();
  if (!body) {
    return body.error();
  }
  Json::Value entries(Json::arrayValue);
  if (body->empty()) {  // `204 No Content`.
    return entries;
  }
  if (!Json::Reader().parse(*body, entries) || !entries.isArray()) {
    STOWAGE_VLOG(1, "Unrecognized listing: {}", *body);
    return MakeMalformedListingStatus("not a JSON array");
  }
  return entries;
}

template <class T, class F>
Status ForEachInPages(F&& next_page, const std::function<Status(T)>& cb) {
  while (true) {
    auto page = next_page();
    if (!page) {
      return page.error();
    }
    if (page->empty()) {
      return {};
    }
    for (auto&& e : *page) {
      if (auto status = cb(std::move(e)); !status.ok()) {
        return status;
      }
    }
  }
}

template <class T, class F>
Expected<std::vector<T>, Status> CollectPages(F&& next_page) {
  std::vector<T> result;
  auto status = ForEachInPages<T>(std::forward<F>(next_page),
                                  [&](T e) -> Status {
                                    result.push_back(std::move(e));
                                    return {};
                                  });
  if (!status.ok()) {
    return status;
  }
  return result;
}

}  // namespace

Expected<std::vector<Container>, Status> ContainerIterator::NextPage(
    int limit) {
  auto names =
      FetchNames(account_->transport(), MakeRequest(limit, false));
  if (!names) {
    return names.error();
  }
  std::vector<Container> result;
  for (auto&& e : *names) {
    result.emplace_back(account_, e);
  }
  if (!names->empty()) {
    marker_ = names->back();
  }
  return result;
}

Expected<std::vector<ContainerInfo>, Status>
ContainerIterator::NextPageDetailed(int limit) {
  auto entries =
      FetchEntries(account_->transport(), MakeRequest(limit, true));
  if (!entries) {
    return entries.error();
  }
  std::vector<ContainerInfo> result;
  for (auto&& e : *entries) {
    auto name = GetString(e, "name");
    if (name.empty()) {
      return MakeMalformedListingStatus("container without name");
    }
    result.push_back(ContainerInfo{
        Container(account_, name), GetUint64(e, "count"),
        GetUint64(e, "bytes"),
        ParseListingTimestamp(GetString(e, "last_modified"))});
  }
  if (!result.empty()) {
    marker_ = result.back().container.Name();
  }
  return result;
}

Status ContainerIterator::ForEach(const std::function<Status(Container)>& cb) {
  return ForEachInPages<Container>([this] { return NextPage(); }, cb);
}

Status ContainerIterator::ForEachDetailed(
    const std::function<Status(ContainerInfo)>& cb) {
  return ForEachInPages<ContainerInfo>([this] { return NextPageDetailed(); },
                                       cb);
}

Expected<std::vector<Container>, Status> ContainerIterator::Collect() {
  return CollectPages<Container>([this] { return NextPage(); });
}

Expected<std::vector<ContainerInfo>, Status>
ContainerIterator::CollectDetailed() {
  return CollectPages<ContainerInfo>([this] { return NextPageDetailed(); });
}

Request ContainerIterator::MakeRequest(int limit, bool detailed) const {
  Request req;
  req.operation = Operation::ListContainers;
  req.options = options;
  if (detailed) {
    req.values.Set("format", "json");
  }
  if (!prefix.empty()) {
    req.values.Set("prefix", prefix);
  }
  if (!marker_.empty()) {
    req.values.Set("marker", marker_);
  }
  if (limit > 0) {
    req.values.Set("limit", std::to_string(limit));
  }
  return req;
}

Expected<std::vector<Object>, Status> ObjectIterator::NextPage(int limit) {
  auto names = FetchNames(container_->account()->transport(),
                          MakeRequest(limit, false));
  if (!names) {
    return names.error();
  }
  std::vector<Object> result;
  for (auto&& e : *names) {
    result.emplace_back(container_, e);
  }
  if (!names->empty()) {
    marker_ = names->back();
  }
  return result;
}

Expected<std::vector<ObjectInfo>, Status> ObjectIterator::NextPageDetailed(
    int limit) {
  auto entries = FetchEntries(container_->account()->transport(),
                              MakeRequest(limit, true));
  if (!entries) {
    return entries.error();
  }
  std::vector<ObjectInfo> result;
  for (auto&& e : *entries) {
    if (auto subdir = GetString(e, "subdir"); !subdir.empty()) {
      ObjectInfo info{Object(container_, subdir)};
      info.subdirectory = subdir;
      result.push_back(std::move(info));
      continue;
    }
    auto name = GetString(e, "name");
    if (name.empty()) {
      return MakeMalformedListingStatus("object without name");
    }
    ObjectInfo info{Object(container_, name)};
    info.size_bytes = GetUint64(e, "bytes");
    info.content_type = GetString(e, "content_type");
    info.etag = GetString(e, "hash");
    info.last_modified = ParseListingTimestamp(GetString(e, "last_modified"));
    if (auto symlink = GetString(e, "symlink_path"); !symlink.empty()) {
      info.symlink_target = StripAccountPath(symlink);
    }
    result.push_back(std::move(info));
  }
  if (!result.empty()) {
    marker_ = result.back().object.Name();
  }
  return result;
}

Status ObjectIterator::ForEach(const std::function<Status(Object)>& cb) {
  return ForEachInPages<Object>([this] { return NextPage(); }, cb);
}

Status ObjectIterator::ForEachDetailed(
    const std::function<Status(ObjectInfo)>& cb) {
  return ForEachInPages<ObjectInfo>([this] { return NextPageDetailed(); }, cb);
}

Expected<std::vector<Object>, Status> ObjectIterator::Collect() {
  return CollectPages<Object>([this] { return NextPage(); });
}

Expected<std::vector<ObjectInfo>, Status> ObjectIterator::CollectDetailed() {
  return CollectPages<ObjectInfo>([this] { return NextPageDetailed(); });
}

Request ObjectIterator::MakeRequest(int limit, bool detailed) const {
  Request req;
  req.operation = Operation::ListObjects;
  req.container_name = container_->Name();
  req.options = options;
  if (detailed) {
    req.values.Set("format", "json");
  }
  if (!prefix.empty()) {
    req.values.Set("prefix", prefix);
  }
  if (!delimiter.empty()) {
    req.values.Set("delimiter", delimiter);
  }
  if (!marker_.empty()) {
    req.values.Set("marker", marker_);
  }
  if (limit > 0) {
    req.values.Set("limit", std::to_string(limit));
  }
  return req;
}

}  // namespace stowage::swift
