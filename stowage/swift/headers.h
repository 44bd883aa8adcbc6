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

#ifndef STOWAGE_SWIFT_HEADERS_H_
#define STOWAGE_SWIFT_HEADERS_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "stowage/base/status.h"
#include "stowage/http/http_headers.h"

// Typed views over raw Swift headers.
//
// Each field accessor returns a lightweight proxy bound to the header set it
// came from. Proxies obtained from a const header set are read-only:
//
//   ObjectHeaders hdr;
//   hdr.ContentType().Set("application/json");
//   hdr.Metadata().Set("owner", "alice");
//   hdr.ExpiresAfter().Set(3600);
//
//   const ObjectHeaders& fetched = ...;
//   fetched.SizeBytes().Get();  // `0` if absent.

namespace stowage::swift {

namespace detail {

// Common part of all field proxies.
class FieldBase {
 public:
  FieldBase(HttpHeaders* headers, std::string_view key)
      : view_(headers), headers_(headers), key_(key) {}
  FieldBase(const HttpHeaders* headers, std::string_view key)
      : view_(headers), key_(key) {}

  // Tests if the header is present (even if empty).
  bool Exists() const { return view_->contains(key_); }

  std::string_view key() const noexcept { return key_; }

 protected:
  std::string_view Raw() const;
  void SetRaw(std::string value);
  void RemoveRaw();

  const HttpHeaders* view_;
  HttpHeaders* headers_ = nullptr;  // `nullptr` for read-only proxies.
  std::string_view key_;
};

}  // namespace detail

// A header with string value.
class FieldString : public detail::FieldBase {
 public:
  using FieldBase::FieldBase;

  // Empty string if absent.
  std::string Get() const { return std::string(Raw()); }

  void Set(std::string value) { SetRaw(std::move(value)); }

  // Set to empty value. For metadata-style headers this instructs the server
  // to remove the value.
  void Clear() { SetRaw(""); }

  // Remove the header from the header set. Nothing is sent for it.
  void Del() { RemoveRaw(); }
};

// A header with unsigned integer value.
class FieldUint64 : public detail::FieldBase {
 public:
  using FieldBase::FieldBase;

  // `0` if absent or malformed. Use `Validate()` to detect the latter.
  std::uint64_t Get() const;
  void Set(std::uint64_t value) { SetRaw(std::to_string(value)); }
  void Clear() { SetRaw(""); }
  void Del() { RemoveRaw(); }

  Status Validate() const;
};

// Same as `FieldUint64`, for headers only the server may set.
class FieldUint64Readonly : public detail::FieldBase {
 public:
  FieldUint64Readonly(const HttpHeaders* headers, std::string_view key)
      : FieldBase(headers, key) {}

  std::uint64_t Get() const;
  Status Validate() const;
};

// A header holding a UNIX timestamp with optional fraction, as in
// `X-Timestamp: 1522059834.30982` or `X-Delete-At: 1522059834`.
class FieldTimestamp : public detail::FieldBase {
 public:
  using FieldBase::FieldBase;

  // Epoch if absent or malformed.
  std::chrono::system_clock::time_point Get() const;

  // Written with second precision.
  void Set(std::chrono::system_clock::time_point value);
  void Clear() { SetRaw(""); }
  void Del() { RemoveRaw(); }

  Status Validate() const;
};

// A read-only header holding an RFC 1123 date, e.g.
// `Last-Modified: Wed, 21 Oct 2015 07:28:00 GMT`.
class FieldHttpTimestamp : public detail::FieldBase {
 public:
  FieldHttpTimestamp(const HttpHeaders* headers, std::string_view key)
      : FieldBase(headers, key) {}

  // Epoch if absent or malformed.
  std::chrono::system_clock::time_point Get() const;
  Status Validate() const;
};

// A read-only boolean header, e.g. `X-Static-Large-Object: True`.
class FieldBoolReadonly : public detail::FieldBase {
 public:
  FieldBoolReadonly(const HttpHeaders* headers, std::string_view key)
      : FieldBase(headers, key) {}

  // `false` unless the value is `true` (case-insensitively).
  bool Get() const;
};

// User metadata, stored as headers with a fixed, case-insensitive prefix such
// as `X-Object-Meta-`. Keys used with this class don't include the prefix.
class FieldMetadata {
 public:
  FieldMetadata(HttpHeaders* headers, std::string_view prefix)
      : view_(headers), headers_(headers), prefix_(prefix) {}
  FieldMetadata(const HttpHeaders* headers, std::string_view prefix)
      : view_(headers), prefix_(prefix) {}

  bool Exists(std::string_view key) const;

  // Empty string if absent.
  std::string Get(std::string_view key) const;

  void Set(std::string_view key, std::string value);

  // Keeps the header with empty value, which instructs the server to remove
  // the key.
  void Clear(std::string_view key);

  // Remove the header from the header set. Nothing is sent for it.
  void Del(std::string_view key);

  // Keys (without prefix) of all metadata present, in order of appearance.
  std::vector<std::string> Keys() const;

 private:
  std::string FullKey(std::string_view key) const;

  const HttpHeaders* view_;
  HttpHeaders* headers_ = nullptr;
  std::string_view prefix_;
};

// Semantic view over a raw header set.
class Headers {
 public:
  Headers() = default;
  explicit Headers(HttpHeaders raw) : raw_(std::move(raw)) {}
  Headers(const Headers&) = default;
  Headers(Headers&&) = default;
  Headers& operator=(const Headers&) = default;
  Headers& operator=(Headers&&) = default;
  virtual ~Headers() = default;

  // Raw access, for headers that are not modelled.
  HttpHeaders* raw() noexcept { return &raw_; }
  const HttpHeaders& raw() const noexcept { return raw_; }

  // Returns a failure (`SwiftStatus::MalformedHeader`) for the first modelled
  // field that does not parse.
  virtual Status Validate() const { return {}; }

  // Computes headers to send in a request. If `prior` is `nullptr` (e.g. when
  // creating something), all headers are returned. Otherwise only those whose
  // value differs from `prior` are, plus an empty value for each metadata key
  // present in `prior` but no longer here, which removes it on the server.
  //
  // This is for callers building an update from headers they fetched:
  //
  //   auto fetched = *container.Headers();
  //   ContainerHeaders wanted = fetched;
  //   wanted.Metadata().Del("stale");
  //   container.Update(ContainerHeaders(wanted.ToRequestHeaders(&fetched)));
  HttpHeaders ToRequestHeaders(const Headers* prior = nullptr) const;

 protected:
  HttpHeaders raw_;
};

class AccountHeaders : public Headers {
 public:
  using Headers::Headers;

  FieldUint64Readonly BytesUsed() const;
  FieldUint64Readonly ContainerCount() const;
  FieldUint64Readonly ObjectCount() const;
  FieldUint64 BytesUsedQuota();
  const FieldUint64 BytesUsedQuota() const;
  FieldTimestamp CreatedAt();
  const FieldTimestamp CreatedAt() const;
  FieldMetadata Metadata();
  const FieldMetadata Metadata() const;
  FieldString TempUrlKey();
  const FieldString TempUrlKey() const;
  FieldString TempUrlKey2();
  const FieldString TempUrlKey2() const;

  Status Validate() const override;
};

class ContainerHeaders : public Headers {
 public:
  using Headers::Headers;

  FieldUint64Readonly BytesUsed() const;
  FieldUint64Readonly ObjectCount() const;
  FieldUint64 BytesUsedQuota();
  const FieldUint64 BytesUsedQuota() const;
  FieldUint64 ObjectCountQuota();
  const FieldUint64 ObjectCountQuota() const;
  FieldTimestamp CreatedAt();
  const FieldTimestamp CreatedAt() const;
  FieldString HistoryLocation();
  const FieldString HistoryLocation() const;
  FieldString VersionsLocation();
  const FieldString VersionsLocation() const;
  FieldString ReadAcl();
  const FieldString ReadAcl() const;
  FieldString WriteAcl();
  const FieldString WriteAcl() const;
  FieldString StoragePolicy();
  const FieldString StoragePolicy() const;
  FieldString SyncKey();
  const FieldString SyncKey() const;
  FieldString SyncTo();
  const FieldString SyncTo() const;
  FieldString TempUrlKey();
  const FieldString TempUrlKey() const;
  FieldString TempUrlKey2();
  const FieldString TempUrlKey2() const;
  FieldMetadata Metadata();
  const FieldMetadata Metadata() const;

  Status Validate() const override;
};

class ObjectHeaders : public Headers {
 public:
  using Headers::Headers;

  FieldString ContentDisposition();
  const FieldString ContentDisposition() const;
  FieldString ContentEncoding();
  const FieldString ContentEncoding() const;
  FieldString ContentType();
  const FieldString ContentType() const;
  FieldString Etag();
  const FieldString Etag() const;
  FieldUint64Readonly SizeBytes() const;
  FieldTimestamp ExpiresAt();
  const FieldTimestamp ExpiresAt() const;
  FieldUint64 ExpiresAfter();
  const FieldUint64 ExpiresAfter() const;
  FieldTimestamp CreatedAt();
  const FieldTimestamp CreatedAt() const;
  FieldHttpTimestamp UpdatedAt() const;
  FieldString SymlinkTarget();
  const FieldString SymlinkTarget() const;
  FieldString SymlinkTargetAccount();
  const FieldString SymlinkTargetAccount() const;
  FieldBoolReadonly IsStaticLargeObject() const;
  FieldString DynamicLargeObjectManifest();
  const FieldString DynamicLargeObjectManifest() const;
  FieldMetadata Metadata();
  const FieldMetadata Metadata() const;

  Status Validate() const override;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_HEADERS_H_
