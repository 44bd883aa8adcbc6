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

#include "stowage/swift/large_object.h"

#include <algorithm>
#include <string>
#include <utility>

#include "json/json.h"

#include "stowage/base/encoding/percent.h"
#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/swift/account.h"
#include "stowage/swift/iterator.h"
#include "stowage/swift/status.h"

namespace stowage::swift {

namespace {

// Segments are peeked at before being uploaded, so that no empty segment is
// created at the end of input.
constexpr std::size_t kPeekSize = 64 * 1024;

// Splits `/container/object` (or `container/object`).
std::pair<std::string, std::string> SplitPath(std::string_view path) {
  if (StartsWith(path, "/")) {
    path.remove_prefix(1);
  }
  auto pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), ""};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

// Longest common prefix of segment names, with trailing digits (our segment
// index) removed.
std::string GuessSegmentPrefix(const std::vector<SegmentInfo>& segments) {
  if (segments.empty()) {
    return {};
  }
  std::string prefix = segments.front().object.Name();
  for (auto&& e : segments) {
    auto&& name = e.object.Name();
    auto mismatch = std::mismatch(prefix.begin(), prefix.end(), name.begin(),
                                  name.end());
    prefix.erase(mismatch.first, prefix.end());
  }
  while (!prefix.empty() && prefix.back() >= '0' && prefix.back() <= '9') {
    prefix.pop_back();
  }
  return prefix;
}

Status MakeSegmentInvalidStatus(std::string desc) {
  return Status(SwiftStatus::SegmentInvalid, std::move(desc));
}

}  // namespace

LargeObject::LargeObject(Object* object, LargeObjectStrategy strategy,
                         std::string segment_container,
                         std::string segment_prefix)
    : object_(object),
      strategy_(strategy),
      segment_container_(std::move(segment_container)),
      segment_prefix_(std::move(segment_prefix)) {}

Status LargeObject::AddSegment(SegmentInfo segment) {
  if (!segment.object.account()->IsEqualTo(*object_->account())) {
    return Status(SwiftStatus::AccountMismatch,
                  "segment is not in the same account as the large object");
  }
  if (strategy_ == LargeObjectStrategy::Dynamic) {
    if (segment.object.container()->Name() != segment_container_ ||
        !StartsWith(segment.object.Name(), segment_prefix_)) {
      return MakeSegmentInvalidStatus(
          Format("segment [{}] is not under [{}/{}]",
                 segment.object.FullName(), segment_container_,
                 segment_prefix_));
    }
    if (!segment.range.empty()) {
      return MakeSegmentInvalidStatus(
          "dynamic large objects do not support segment ranges");
    }
    if (!segments_.empty() &&
        segment.object.Name() <= segments_.back().object.Name()) {
      return MakeSegmentInvalidStatus(
          Format("segment [{}] would not sort after the last segment",
                 segment.object.FullName()));
    }
  }
  segments_.push_back(std::move(segment));
  return {};
}

Status LargeObject::Append(Reader* contents, std::uint64_t segment_size,
                           const RequestOptions* options) {
  if (!segment_size) {
    return Status(SwiftStatus::InvalidArgument,
                  "segment size must be positive");
  }
  auto container = GetSegmentContainer(segment_container_);
  while (true) {
    std::string head(std::min<std::uint64_t>(segment_size, kPeekSize), 0);
    auto bytes = contents->Read(head.data(), head.size());
    if (!bytes) {
      return bytes.error();
    }
    if (*bytes == 0) {
      return {};
    }
    head.resize(*bytes);

    StringReader head_reader(std::move(head));
    LimitedReader tail_reader(contents, segment_size - *bytes);
    MultiReader segment_reader({&head_reader, &tail_reader});
    HashingReader hashing(&segment_reader);

    Object segment(container, NextSegmentName());
    if (auto status = segment.Upload(&hashing, nullptr, options);
        !status.ok()) {
      return status;
    }
    auto size = hashing.BytesRead();
    STOWAGE_VLOG(1, "Uploaded segment [{}] of {} bytes.", segment.FullName(),
                 size);
    if (auto status = AddSegment(
            SegmentInfo{std::move(segment), size, hashing.HexDigest(), ""});
        !status.ok()) {
      return status;
    }
    if (size < segment_size) {
      return {};  // `contents` is exhausted.
    }
  }
}

Status LargeObject::Truncate(const TruncateOptions* options) {
  static const TruncateOptions kDefaultTruncateOptions{};
  auto&& topts = options ? *options : kDefaultTruncateOptions;
  if (topts.delete_segments && !segments_.empty()) {
    std::vector<Object*> objects;
    for (auto&& e : segments_) {
      objects.push_back(&e.object);
    }
    auto result = object_->account()->BulkDelete(objects, {});
    if (!result) {
      return result.error();
    }
  }
  segments_.clear();
  return {};
}

Status LargeObject::WriteManifest(const RequestOptions* options) {
  Request req;
  req.operation = Operation::ObjectUpload;
  req.container_name = object_->container()->Name();
  req.object_name = object_->Name();
  req.options = options;

  std::string manifest;
  if (strategy_ == LargeObjectStrategy::Static) {
    Json::Value segments(Json::arrayValue);
    for (auto&& e : segments_) {
      Json::Value entry;
      entry["path"] = "/" + e.object.FullName();
      entry["size_bytes"] = Json::UInt64(e.size_bytes);
      if (!e.etag.empty()) {
        entry["etag"] = e.etag;
      }
      if (!e.range.empty()) {
        entry["range"] = e.range;
      }
      segments.append(entry);
    }
    manifest = Json::FastWriter().write(segments);
    req.values.Set("multipart-manifest", "put");
  } else {
    req.headers.Set("X-Object-Manifest",
                    EncodePercent(segment_container_) + "/" +
                        EncodePercent(segment_prefix_,
                                      {PercentEncodingStyle::Rfc3986Path}));
  }
  StringReader reader(std::move(manifest));
  req.body = &reader;
  req.content_length = reader.Size();

  auto resp = Execute(object_->account()->transport(), req);
  if (!resp) {
    return resp.error();
  }
  object_->Invalidate();
  return resp->DrainAndClose();
}

Container* LargeObject::GetSegmentContainer(const std::string& name) {
  for (auto&& e : containers_) {
    if (e->Name() == name) {
      return e.get();
    }
  }
  containers_.push_back(
      std::make_unique<Container>(object_->account(), name));
  return containers_.back().get();
}

std::string LargeObject::NextSegmentName() const {
  return Format("{}{:010d}", segment_prefix_, segments_.size());
}

Expected<LargeObject, Status> Object::AsLargeObject() {
  auto headers = Headers();
  if (!headers) {
    return headers.error();
  }

  if (headers->IsStaticLargeObject().Get()) {
    auto req = MakeRequest(Operation::SloManifestGet, nullptr);
    req.values.Set("multipart-manifest", "get");
    auto resp = Execute(account()->transport(), req);
    if (!resp) {
      return resp.error();
    }
    auto body = resp->ReadBody();
    if (!body) {
      return body.error();
    }
    Json::Value parsed;
    if (!Json::Reader().parse(*body, parsed) || !parsed.isArray()) {
      STOWAGE_VLOG(1, "Unrecognized SLO manifest of [{}]: {}", FullName(),
                   *body);
      return Status(SwiftStatus::MalformedResponse,
                    "SLO manifest is not a JSON array");
    }
    const Json::Value& entries = parsed;

    LargeObject result(this, LargeObjectStrategy::Static, "", "");
    for (auto&& e : entries) {
      auto&& name = e["name"];
      if (!name.isString()) {
        return Status(SwiftStatus::MalformedResponse,
                      "SLO manifest entry without name");
      }
      auto [container_name, object_name] = SplitPath(name.asString());
      SegmentInfo segment{
          Object(result.GetSegmentContainer(container_name), object_name)};
      segment.size_bytes = e["bytes"].isUInt64() ? e["bytes"].asUInt64() : 0;
      segment.etag = e["hash"].isString() ? e["hash"].asString() : "";
      segment.range = e["range"].isString() ? e["range"].asString() : "";
      result.segments_.push_back(std::move(segment));
    }
    if (!result.segments_.empty()) {
      auto&& first = result.segments_.front().object;
      result.segment_container_ = first.container()->Name();
      bool same_container = std::all_of(
          result.segments_.begin(), result.segments_.end(), [&](auto&& e) {
            return e.object.container()->Name() == result.segment_container_;
          });
      if (same_container) {
        result.segment_prefix_ = GuessSegmentPrefix(result.segments_);
      }
    }
    return std::move(result);
  }

  if (headers->DynamicLargeObjectManifest().Exists()) {
    auto manifest = headers->DynamicLargeObjectManifest().Get();
    auto [encoded_container, encoded_prefix] = SplitPath(manifest);
    auto container_name =
        DecodePercent(encoded_container).value_or(encoded_container);
    auto prefix = DecodePercent(encoded_prefix).value_or(encoded_prefix);
    if (container_name.empty()) {
      return MakeMalformedHeaderStatus("X-Object-Manifest",
                                       "missing segment container");
    }

    LargeObject result(this, LargeObjectStrategy::Dynamic, container_name,
                       prefix);
    ObjectIterator iter(result.GetSegmentContainer(container_name));
    iter.prefix = prefix;
    auto listing = iter.CollectDetailed();
    if (!listing) {
      return listing.error();
    }
    for (auto&& e : *listing) {
      result.segments_.push_back(
          SegmentInfo{std::move(e.object), e.size_bytes, e.etag, ""});
    }
    return std::move(result);
  }

  return Status(SwiftStatus::NotLarge, Format("[{}] is not a large object",
                                              FullName()));
}

Expected<LargeObject, Status> Object::AsNewLargeObject(
    const SegmentingOptions& segmenting_options,
    const TruncateOptions* truncate_options) {
  auto&& sopts = segmenting_options;
  if (auto status = ValidateResourceNames(OperationTarget::Container,
                                          sopts.segment_container, "");
      !status.ok()) {
    return status;
  }
  auto prefix = sopts.segment_prefix;
  if (prefix.empty()) {
    if (sopts.strategy == LargeObjectStrategy::Dynamic) {
      return Status(SwiftStatus::InvalidArgument,
                    "segment prefix is required for dynamic large objects");
    }
    prefix = name_ + "/";
  }

  auto exists = Exists();
  if (!exists) {
    return exists.error();
  }
  if (*exists) {
    auto previous = AsLargeObject();
    if (previous) {
      if (auto status = previous->Truncate(truncate_options); !status.ok()) {
        return status;
      }
    } else if (previous.error().code() !=
               static_cast<int>(SwiftStatus::NotLarge)) {
      return previous.error();
    }
  }
  return LargeObject(this, sopts.strategy, sopts.segment_container, prefix);
}

}  // namespace stowage::swift
