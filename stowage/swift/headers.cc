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

#include "stowage/swift/headers.h"

#include <time.h>

#include <cmath>
#include <string>

#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/swift/status.h"

using namespace std::literals;

namespace stowage::swift {

namespace {

std::optional<std::chrono::system_clock::time_point> ParseUnixTimestamp(
    std::string_view s) {
  auto seconds = TryParse<double>(s);
  // Anything past `max()` would overflow the clock's representation.
  constexpr auto kMaxSeconds = std::chrono::duration<double>(
                                   std::chrono::system_clock::duration::max())
                                   .count();
  if (!seconds || *seconds < 0 || !std::isfinite(*seconds) ||
      *seconds >= kMaxSeconds) {
    return std::nullopt;
  }
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::duration<double>(*seconds)));
}

bool IsMetadataKey(std::string_view key) {
  for (auto&& prefix :
       {"X-Account-Meta-"sv, "X-Container-Meta-"sv, "X-Object-Meta-"sv}) {
    if (IStartsWith(key, prefix)) {
      return true;
    }
  }
  return false;
}

std::optional<std::chrono::system_clock::time_point> ParseHttpTimestamp(
    std::string_view s) {
  std::string str(s);
  struct tm tm = {};
  auto end = strptime(str.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  if (!end || *end != 0) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}  // namespace

namespace detail {

std::string_view FieldBase::Raw() const {
  return view_->TryGet(key_).value_or(""sv);
}

void FieldBase::SetRaw(std::string value) {
  STOWAGE_CHECK(headers_, "Modifying read-only header [{}].", key_);
  headers_->Set(std::string(key_), std::move(value));
}

void FieldBase::RemoveRaw() {
  STOWAGE_CHECK(headers_, "Modifying read-only header [{}].", key_);
  headers_->Remove(key_);
}

}  // namespace detail

std::uint64_t FieldUint64::Get() const {
  return TryParse<std::uint64_t>(Raw()).value_or(0);
}

Status FieldUint64::Validate() const {
  auto value = Raw();
  if (!value.empty() && !TryParse<std::uint64_t>(value)) {
    return MakeMalformedHeaderStatus(std::string(key_),
                                     Format("invalid unsigned integer [{}]",
                                            value));
  }
  return {};
}

std::uint64_t FieldUint64Readonly::Get() const {
  return TryParse<std::uint64_t>(Raw()).value_or(0);
}

Status FieldUint64Readonly::Validate() const {
  auto value = Raw();
  if (!value.empty() && !TryParse<std::uint64_t>(value)) {
    return MakeMalformedHeaderStatus(std::string(key_),
                                     Format("invalid unsigned integer [{}]",
                                            value));
  }
  return {};
}

std::chrono::system_clock::time_point FieldTimestamp::Get() const {
  return ParseUnixTimestamp(Raw()).value_or(
      std::chrono::system_clock::time_point());
}

void FieldTimestamp::Set(std::chrono::system_clock::time_point value) {
  SetRaw(std::to_string(
      std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch())
          .count()));
}

Status FieldTimestamp::Validate() const {
  auto value = Raw();
  if (!value.empty() && !ParseUnixTimestamp(value)) {
    return MakeMalformedHeaderStatus(
        std::string(key_), Format("invalid UNIX timestamp [{}]", value));
  }
  return {};
}

std::chrono::system_clock::time_point FieldHttpTimestamp::Get() const {
  return ParseHttpTimestamp(Raw()).value_or(
      std::chrono::system_clock::time_point());
}

Status FieldHttpTimestamp::Validate() const {
  auto value = Raw();
  if (!value.empty() && !ParseHttpTimestamp(value)) {
    return MakeMalformedHeaderStatus(
        std::string(key_), Format("invalid HTTP timestamp [{}]", value));
  }
  return {};
}

bool FieldBoolReadonly::Get() const { return IEquals(Raw(), "true"); }

bool FieldMetadata::Exists(std::string_view key) const {
  return view_->contains(FullKey(key));
}

std::string FieldMetadata::Get(std::string_view key) const {
  return std::string(view_->TryGet(FullKey(key)).value_or(""sv));
}

void FieldMetadata::Set(std::string_view key, std::string value) {
  STOWAGE_CHECK(headers_, "Modifying read-only metadata [{}].", key);
  headers_->Set(FullKey(key), std::move(value));
}

void FieldMetadata::Clear(std::string_view key) { Set(key, ""); }

void FieldMetadata::Del(std::string_view key) {
  STOWAGE_CHECK(headers_, "Modifying read-only metadata [{}].", key);
  headers_->Remove(FullKey(key));
}

std::vector<std::string> FieldMetadata::Keys() const {
  std::vector<std::string> keys;
  for (auto&& [k, v] : *view_) {
    if (IStartsWith(k, prefix_)) {
      keys.push_back(k.substr(prefix_.size()));
    }
  }
  return keys;
}

std::string FieldMetadata::FullKey(std::string_view key) const {
  std::string result(prefix_);
  result.append(key);
  return result;
}

HttpHeaders Headers::ToRequestHeaders(const Headers* prior) const {
  if (!prior) {
    return raw_;
  }
  HttpHeaders result;
  for (auto&& [k, v] : raw_) {
    auto was = prior->raw().TryGet(k);
    if (!was || *was != v) {
      result.Append(k, v);
    }
  }
  // An empty value is how Swift is told to remove metadata.
  for (auto&& [k, v] : prior->raw()) {
    if (IsMetadataKey(k) && !raw_.contains(k) && !result.contains(k)) {
      result.Append(k, "");
    }
  }
  return result;
}

// Defines both the mutable and the read-only accessor of a field.
#define STOWAGE_SWIFT_DEFINE_FIELD(Class, Type, Name, Key)          \
  Type Class::Name() { return Type(&raw_, std::string_view(Key)); } \
  const Type Class::Name() const {                                  \
    return Type(static_cast<const HttpHeaders*>(&raw_),             \
                std::string_view(Key));                             \
  }

#define STOWAGE_SWIFT_DEFINE_READONLY_FIELD(Class, Type, Name, Key) \
  Type Class::Name() const { return Type(&raw_, std::string_view(Key)); }

#define STOWAGE_SWIFT_VALIDATE(field)                 \
  if (auto status = field.Validate(); !status.ok()) { \
    return status;                                    \
  }

STOWAGE_SWIFT_DEFINE_READONLY_FIELD(AccountHeaders, FieldUint64Readonly,
                                    BytesUsed, "X-Account-Bytes-Used")
STOWAGE_SWIFT_DEFINE_READONLY_FIELD(AccountHeaders, FieldUint64Readonly,
                                    ContainerCount, "X-Account-Container-Count")
STOWAGE_SWIFT_DEFINE_READONLY_FIELD(AccountHeaders, FieldUint64Readonly,
                                    ObjectCount, "X-Account-Object-Count")
STOWAGE_SWIFT_DEFINE_FIELD(AccountHeaders, FieldUint64, BytesUsedQuota,
                           "X-Account-Meta-Quota-Bytes")
STOWAGE_SWIFT_DEFINE_FIELD(AccountHeaders, FieldTimestamp, CreatedAt,
                           "X-Timestamp")
STOWAGE_SWIFT_DEFINE_FIELD(AccountHeaders, FieldMetadata, Metadata,
                           "X-Account-Meta-")
STOWAGE_SWIFT_DEFINE_FIELD(AccountHeaders, FieldString, TempUrlKey,
                           "X-Account-Meta-Temp-URL-Key")
STOWAGE_SWIFT_DEFINE_FIELD(AccountHeaders, FieldString, TempUrlKey2,
                           "X-Account-Meta-Temp-URL-Key-2")

Status AccountHeaders::Validate() const {
  STOWAGE_SWIFT_VALIDATE(BytesUsed());
  STOWAGE_SWIFT_VALIDATE(ContainerCount());
  STOWAGE_SWIFT_VALIDATE(ObjectCount());
  STOWAGE_SWIFT_VALIDATE(BytesUsedQuota());
  STOWAGE_SWIFT_VALIDATE(CreatedAt());
  return {};
}

STOWAGE_SWIFT_DEFINE_READONLY_FIELD(ContainerHeaders, FieldUint64Readonly,
                                    BytesUsed, "X-Container-Bytes-Used")
STOWAGE_SWIFT_DEFINE_READONLY_FIELD(ContainerHeaders, FieldUint64Readonly,
                                    ObjectCount, "X-Container-Object-Count")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldUint64, BytesUsedQuota,
                           "X-Container-Meta-Quota-Bytes")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldUint64, ObjectCountQuota,
                           "X-Container-Meta-Quota-Count")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldTimestamp, CreatedAt,
                           "X-Timestamp")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, HistoryLocation,
                           "X-History-Location")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, VersionsLocation,
                           "X-Versions-Location")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, ReadAcl,
                           "X-Container-Read")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, WriteAcl,
                           "X-Container-Write")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, StoragePolicy,
                           "X-Storage-Policy")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, SyncKey,
                           "X-Container-Sync-Key")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, SyncTo,
                           "X-Container-Sync-To")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, TempUrlKey,
                           "X-Container-Meta-Temp-URL-Key")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldString, TempUrlKey2,
                           "X-Container-Meta-Temp-URL-Key-2")
STOWAGE_SWIFT_DEFINE_FIELD(ContainerHeaders, FieldMetadata, Metadata,
                           "X-Container-Meta-")

Status ContainerHeaders::Validate() const {
  STOWAGE_SWIFT_VALIDATE(BytesUsed());
  STOWAGE_SWIFT_VALIDATE(ObjectCount());
  STOWAGE_SWIFT_VALIDATE(BytesUsedQuota());
  STOWAGE_SWIFT_VALIDATE(ObjectCountQuota());
  STOWAGE_SWIFT_VALIDATE(CreatedAt());
  return {};
}

STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString, ContentDisposition,
                           "Content-Disposition")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString, ContentEncoding,
                           "Content-Encoding")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString, ContentType,
                           "Content-Type")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString, Etag, "Etag")
STOWAGE_SWIFT_DEFINE_READONLY_FIELD(ObjectHeaders, FieldUint64Readonly,
                                    SizeBytes, "Content-Length")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldTimestamp, ExpiresAt,
                           "X-Delete-At")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldUint64, ExpiresAfter,
                           "X-Delete-After")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldTimestamp, CreatedAt,
                           "X-Timestamp")
STOWAGE_SWIFT_DEFINE_READONLY_FIELD(ObjectHeaders, FieldHttpTimestamp,
                                    UpdatedAt, "Last-Modified")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString, SymlinkTarget,
                           "X-Symlink-Target")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString, SymlinkTargetAccount,
                           "X-Symlink-Target-Account")
STOWAGE_SWIFT_DEFINE_READONLY_FIELD(ObjectHeaders, FieldBoolReadonly,
                                    IsStaticLargeObject,
                                    "X-Static-Large-Object")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldString,
                           DynamicLargeObjectManifest, "X-Object-Manifest")
STOWAGE_SWIFT_DEFINE_FIELD(ObjectHeaders, FieldMetadata, Metadata,
                           "X-Object-Meta-")

Status ObjectHeaders::Validate() const {
  STOWAGE_SWIFT_VALIDATE(SizeBytes());
  STOWAGE_SWIFT_VALIDATE(ExpiresAt());
  STOWAGE_SWIFT_VALIDATE(ExpiresAfter());
  STOWAGE_SWIFT_VALIDATE(CreatedAt());
  STOWAGE_SWIFT_VALIDATE(UpdatedAt());
  return {};
}

#undef STOWAGE_SWIFT_VALIDATE
#undef STOWAGE_SWIFT_DEFINE_READONLY_FIELD
#undef STOWAGE_SWIFT_DEFINE_FIELD

}  // namespace stowage::swift
