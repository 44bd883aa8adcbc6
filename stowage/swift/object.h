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

#ifndef STOWAGE_SWIFT_OBJECT_H_
#define STOWAGE_SWIFT_OBJECT_H_

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "gflags/gflags_declare.h"

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/http/types.h"
#include "stowage/io/reader.h"
#include "stowage/swift/download.h"
#include "stowage/swift/headers.h"
#include "stowage/swift/request.h"

DECLARE_int32(stowage_swift_upload_pipe_buffer_size);

namespace stowage::swift {

class Account;
class Container;
class LargeObject;
struct SegmentingOptions;
struct TruncateOptions;

struct UploadOptions {
  // Sent along with the object. If `Etag` is set here, the service verifies
  // the content against it, and no local verification is done.
  ObjectHeaders headers;

  // Compare `Etag` returned by the service with MD5 of what was sent. Always
  // skipped for large object manifests.
  bool verify_checksum = true;
};

struct DeleteOptions {
  // If the object is a large object, delete its segments as well.
  bool delete_segments = false;
};

struct CopyOptions {
  // If set, metadata of the source is not copied, only what's given in
  // `headers` is applied to the target.
  bool fresh_metadata = false;

  // Applied to the target object.
  ObjectHeaders headers;
};

struct SymlinkOptions {
  // Applied to the symlink itself.
  ObjectHeaders headers;
};

// An object in a container.
//
// The name may contain slashes (pseudo-directories), and may not be empty.
class Object {
 public:
  // No I/O is performed.
  Object(Container* container, std::string name);

  Container* container() const noexcept { return container_; }
  Account* account() const noexcept;
  const std::string& Name() const noexcept { return name_; }

  // `container/object`.
  std::string FullName() const;

  // Headers of this object. Fetched on first call and cached thereafter.
  Expected<ObjectHeaders, Status> Headers();

  // Tests if the object exists. A `404` is not an error here.
  Expected<bool, Status> Exists();

  // Drops cached headers, if any.
  void Invalidate();

  // Replaces metadata of this object. Note that unlike containers, all
  // metadata not present in `headers` is removed by the service.
  Status Update(const ObjectHeaders& headers,
                const RequestOptions* options = nullptr);

  // Uploads `content` as the object's new content. `content` may be `nullptr`
  // for an empty object. If `content` knows its size, it's sent as
  // `Content-Length`, otherwise chunked transfer encoding is used.
  Status Upload(Reader* content, const UploadOptions* upload_options = nullptr,
                const RequestOptions* options = nullptr);

  // Same as `Upload`, except that content is produced by `callback` writing to
  // the writer it's given. The callback runs in a dedicated thread, and is
  // joined before this method returns. Exceptions escaping `callback` are
  // rethrown here.
  Status UploadWithWriter(const UploadOptions* upload_options,
                          const RequestOptions* options,
                          std::function<Status(Writer*)> callback);

  // Downloads the object. Use `Range` in `options` for partial downloads.
  Expected<DownloadedObject, Status> Download(
      const RequestOptions* options = nullptr);

  Status Delete(const DeleteOptions* delete_options = nullptr,
                const RequestOptions* options = nullptr);

  // Server-side copy of this object to `target`. `target` may live in
  // another container or (if the cluster permits) another account.
  Status CopyTo(Object* target, const CopyOptions* copy_options = nullptr,
                const RequestOptions* options = nullptr);

  // `CopyTo` followed by `Delete` of this object.
  Status MoveTo(Object* target, const CopyOptions* copy_options = nullptr,
                const RequestOptions* copy_request_options = nullptr,
                const RequestOptions* delete_request_options = nullptr);

  // Makes this object a symlink pointing to `target`.
  Status SymlinkTo(const Object& target,
                   const SymlinkOptions* symlink_options = nullptr,
                   const RequestOptions* options = nullptr);

  // Returns a view of this object as a large object. Fails with
  // `SwiftStatus::NotLarge` if it's not one.
  Expected<LargeObject, Status> AsLargeObject();

  // Starts a new large object at this name. If the object already exists as a
  // large object, it's truncated per `truncate_options` (by default, old
  // segments are deleted). The object itself is not changed until
  // `LargeObject::WriteManifest` is called.
  Expected<LargeObject, Status> AsNewLargeObject(
      const SegmentingOptions& segmenting_options,
      const TruncateOptions* truncate_options = nullptr);

  // Generates a temporary URL granting `method` on this object until
  // `expires`, signed with `key` (a temp URL key of the account or the
  // container).
  std::string TempUrl(std::string_view key, HttpMethod method,
                      std::chrono::system_clock::time_point expires) const;

  // URL of this object, percent-encoded.
  std::string Url() const;

 private:
  Request MakeRequest(Operation op, const RequestOptions* options) const;

 private:
  Container* container_;
  std::string name_;
  std::optional<ObjectHeaders> headers_;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_OBJECT_H_
