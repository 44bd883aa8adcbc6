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

#include "stowage/swift/object.h"

#include <exception>
#include <thread>
#include <utility>

#include "gflags/gflags.h"

#include "stowage/base/crypto/digest.h"
#include "stowage/base/encoding/hex.h"
#include "stowage/base/encoding/percent.h"
#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/io/pipe.h"
#include "stowage/swift/account.h"
#include "stowage/swift/bulk.h"
#include "stowage/swift/container.h"
#include "stowage/swift/large_object.h"
#include "stowage/swift/status.h"

DEFINE_int32(stowage_swift_upload_pipe_buffer_size, 1 << 20,
             "Capacity, in bytes, of the in-memory pipe between the writer "
             "callback and the request body in `Object::UploadWithWriter`.");

using namespace std::literals;

namespace stowage::swift {

namespace {

std::string_view StripQuotes(std::string_view s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

// Path component of `url`, decoded. `https://host/v1/AUTH_abc/` ->
// `/v1/AUTH_abc/`.
std::string GetUrlPath(const std::string& url) {
  auto scheme_end = url.find("://");
  auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  auto path_start = url.find('/', host_start);
  if (path_start == std::string::npos) {
    return "/";
  }
  auto path = url.substr(path_start);
  return DecodePercent(path).value_or(path);
}

}  // namespace

Object::Object(Container* container, std::string name)
    : container_(container), name_(std::move(name)) {}

Account* Object::account() const noexcept { return container_->account(); }

std::string Object::FullName() const {
  return container_->Name() + "/" + name_;
}

Expected<ObjectHeaders, Status> Object::Headers() {
  if (headers_) {
    return *headers_;
  }
  auto resp = Execute(account()->transport(),
                      MakeRequest(Operation::ObjectHeaders, nullptr));
  if (!resp) {
    return resp.error();
  }
  ObjectHeaders fetched(resp->headers());
  if (auto status = fetched.Validate(); !status.ok()) {
    STOWAGE_VLOG(1, "Malformed headers of object [{}]: {}", FullName(),
                 status.message());
    return status;
  }
  headers_ = std::move(fetched);
  return *headers_;
}

Expected<bool, Status> Object::Exists() {
  auto headers = Headers();
  if (headers) {
    return true;
  }
  if (Is(headers.error(), HttpStatus::NotFound)) {
    return false;
  }
  return headers.error();
}

void Object::Invalidate() { headers_ = std::nullopt; }

Status Object::Update(const ObjectHeaders& headers,
                      const RequestOptions* options) {
  auto req = MakeRequest(Operation::ObjectUpdate, options);
  req.headers = headers.ToRequestHeaders();
  auto resp = Execute(account()->transport(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

Status Object::Upload(Reader* content, const UploadOptions* upload_options,
                      const RequestOptions* options) {
  static const UploadOptions kDefaultUploadOptions{};
  auto&& uopts = upload_options ? *upload_options : kDefaultUploadOptions;

  auto req = MakeRequest(Operation::ObjectUpload, options);
  req.headers = uopts.headers.ToRequestHeaders();

  // Etag of a manifest is computed by the service from its segments. If the
  // caller gave us an Etag, the service verifies it for us.
  bool is_manifest = req.headers.contains("X-Object-Manifest") ||
                     (options && options->values.TryGet("multipart-manifest"));
  bool has_etag = req.headers.contains("Etag") ||
                  (options && options->headers.contains("Etag"));

  HashingReader hashing(content);
  req.body = &hashing;
  req.content_length = hashing.Size();

  auto resp = Execute(account()->transport(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();

  if (uopts.verify_checksum && !is_manifest && !has_etag) {
    if (auto etag = resp->headers().TryGet("Etag")) {
      auto digest = hashing.HexDigest();
      if (!IEquals(StripQuotes(*etag), digest)) {
        STOWAGE_VLOG(1, "Checksum mismatch on [{}]: sent [{}], got [{}].",
                     FullName(), digest, *etag);
        return Status(SwiftStatus::ChecksumMismatch,
                      "Etag on uploaded object does not match MD5 checksum "
                      "of uploaded data");
      }
    }
  }
  return resp->DrainAndClose();
}

Status Object::UploadWithWriter(const UploadOptions* upload_options,
                                const RequestOptions* options,
                                std::function<Status(Writer*)> callback) {
  auto pipe = MakePipe(FLAGS_stowage_swift_upload_pipe_buffer_size);
  Status callback_status;
  std::exception_ptr callback_exception;

  std::thread producer([&, writer = pipe.writer.get()] {
    try {
      callback_status = callback(writer);
    } catch (...) {
      callback_exception = std::current_exception();
    }
    if (callback_exception) {
      writer->CloseWithError(Status(SwiftStatus::IoError,
                                    "writer callback raised an exception"));
    } else {
      writer->CloseWithError(callback_status);  // `Close()` on success.
    }
  });

  auto upload_status = Upload(pipe.reader.get(), upload_options, options);
  if (upload_status.ok()) {
    (void)pipe.reader->Close();
  } else {
    // Unblocks the callback if it's still writing.
    pipe.reader->CloseWithError(upload_status);
  }
  producer.join();

  if (callback_exception) {
    std::rethrow_exception(callback_exception);
  }
  if (!upload_status.ok()) {
    return upload_status;
  }
  return callback_status;
}

Expected<DownloadedObject, Status> Object::Download(
    const RequestOptions* options) {
  auto resp = Execute(account()->transport(),
                      MakeRequest(Operation::ObjectDownload, options));
  if (!resp) {
    return resp.error();
  }
  ObjectHeaders headers(resp->headers());
  // Only a full download tells us the object's headers.
  if (resp->status() == static_cast<int>(HttpStatus::OK)) {
    if (auto status = headers.Validate(); !status.ok()) {
      STOWAGE_VLOG(1, "Malformed headers of object [{}]: {}", FullName(),
                   status.message());
      return status;
    }
    headers_ = headers;
  }
  return DownloadedObject(resp->status(), std::move(headers),
                          resp->ReleaseBody());
}

Status Object::Delete(const DeleteOptions* delete_options,
                      const RequestOptions* options) {
  std::optional<LargeObject> large_object;
  if (delete_options && delete_options->delete_segments) {
    auto headers = Headers();
    if (!headers) {
      return headers.error();
    }
    if (headers->IsStaticLargeObject().Get()) {
      // The service deletes the segments for us.
      auto req = MakeRequest(Operation::SloManifestDelete, options);
      req.values.Set("multipart-manifest", "delete");
      req.headers.Set("Accept", "application/json");
      auto resp = Execute(account()->transport(), req);
      if (!resp) {
        return resp.error();
      }
      Invalidate();
      auto body = resp->ReadBody();
      if (!body) {
        return body.error();
      }
      auto parsed = ParseBulkResponse(*body);
      if (!parsed) {
        return parsed.error();
      }
      return ToStatus(*parsed);
    }
    if (headers->DynamicLargeObjectManifest().Exists()) {
      auto lo = AsLargeObject();
      if (!lo) {
        return lo.error();
      }
      large_object.emplace(std::move(*lo));
    }
  }

  auto resp = Execute(account()->transport(),
                      MakeRequest(Operation::ObjectDelete, options));
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  if (auto status = resp->DrainAndClose(); !status.ok()) {
    return status;
  }
  if (large_object) {
    TruncateOptions truncate_options;
    truncate_options.delete_segments = true;
    return large_object->Truncate(&truncate_options);
  }
  return {};
}

Status Object::CopyTo(Object* target, const CopyOptions* copy_options,
                      const RequestOptions* options) {
  if (auto status = ValidateResourceNames(OperationTarget::Object,
                                          container_->Name(), name_);
      !status.ok()) {
    return status;
  }
  static const CopyOptions kDefaultCopyOptions{};
  auto&& copts = copy_options ? *copy_options : kDefaultCopyOptions;

  auto req = target->MakeRequest(Operation::ObjectCopy, options);
  req.headers = copts.headers.ToRequestHeaders();
  req.headers.Set("X-Copy-From",
                  "/" + EncodeResourcePath(container_->Name(), name_));
  if (!account()->IsEqualTo(*target->account())) {
    req.headers.Set("X-Copy-From-Account", account()->Name());
  }
  if (copts.fresh_metadata) {
    req.headers.Set("X-Fresh-Metadata", "true");
  }
  req.content_length = 0;

  auto resp = Execute(target->account()->transport(), req);
  if (!resp) {
    return resp.error();
  }
  target->Invalidate();
  return resp->DrainAndClose();
}

Status Object::MoveTo(Object* target, const CopyOptions* copy_options,
                      const RequestOptions* copy_request_options,
                      const RequestOptions* delete_request_options) {
  if (auto status = CopyTo(target, copy_options, copy_request_options);
      !status.ok()) {
    return status;
  }
  return Delete(nullptr, delete_request_options);
}

Status Object::SymlinkTo(const Object& target,
                         const SymlinkOptions* symlink_options,
                         const RequestOptions* options) {
  if (auto status = ValidateResourceNames(
          OperationTarget::Object, target.container()->Name(), target.Name());
      !status.ok()) {
    return status;
  }
  static const SymlinkOptions kDefaultSymlinkOptions{};
  auto&& sopts = symlink_options ? *symlink_options : kDefaultSymlinkOptions;

  auto req = MakeRequest(Operation::ObjectUpload, options);
  req.headers = sopts.headers.ToRequestHeaders();
  req.headers.Set("X-Symlink-Target", EncodeResourcePath(
                                          target.container()->Name(),
                                          target.Name()));
  if (!account()->IsEqualTo(*target.account())) {
    req.headers.Set("X-Symlink-Target-Account", target.account()->Name());
  }
  req.content_length = 0;

  auto resp = Execute(account()->transport(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

std::string Object::TempUrl(std::string_view key, HttpMethod method,
                            std::chrono::system_clock::time_point expires)
    const {
  auto expires_at =
      std::chrono::duration_cast<std::chrono::seconds>(
          expires.time_since_epoch())
          .count();
  auto path = GetUrlPath(account()->transport()->EndpointUrl());
  if (!EndsWith(path, "/")) {
    path += "/";
  }
  path += container_->Name() + "/" + name_;
  auto signature = EncodeHex(HmacSha1(
      key, Format("{}\n{}\n{}", ToStringView(method), expires_at, path)));
  return Format("{}?temp_url_sig={}&temp_url_expires={}", Url(), signature,
                expires_at);
}

std::string Object::Url() const {
  auto url = account()->transport()->EndpointUrl();
  if (!EndsWith(url, "/")) {
    url += "/";
  }
  return url + EncodeResourcePath(container_->Name(), name_);
}

Request Object::MakeRequest(Operation op,
                            const RequestOptions* options) const {
  Request req;
  req.operation = op;
  req.container_name = container_->Name();
  req.object_name = name_;
  req.options = options;
  return req;
}

}  // namespace stowage::swift
