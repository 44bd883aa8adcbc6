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

#ifndef STOWAGE_SWIFT_ACCOUNT_H_
#define STOWAGE_SWIFT_ACCOUNT_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/io/reader.h"
#include "stowage/swift/bulk.h"
#include "stowage/swift/capabilities.h"
#include "stowage/swift/container.h"
#include "stowage/swift/headers.h"
#include "stowage/swift/request.h"
#include "stowage/swift/transport.h"

namespace stowage::swift {

class ContainerIterator;

// Outcome of `Account::BulkDelete`.
struct BulkDeleteResult {
  std::uint64_t deleted = 0;
  std::uint64_t not_found = 0;
};

// An account of the storage service. This is the root of the entity
// hierarchy, everything else is derived from it.
//
// Handles derived from an account keep a pointer to it, therefore the account
// must outlive them. Handles are not thread-safe.
class Account {
 public:
  // `transport` may not be `nullptr`.
  explicit Account(std::shared_ptr<Transport> transport);

  // Last path component of the endpoint URL, e.g. `AUTH_abc`.
  const std::string& Name() const noexcept { return name_; }

  Transport* transport() const noexcept { return transport_.get(); }

  // Tests if both handles refer to the same account.
  bool IsEqualTo(const Account& other) const;

  // Returns a handle to another account of the same cluster, using the same
  // credentials. Requires reseller admin permissions on most clusters.
  //
  // No I/O is performed.
  Account SwitchAccount(const std::string& account_name) const;

  // Headers of this account. Fetched on first call and cached thereafter.
  Expected<AccountHeaders, Status> Headers();

  // Tests if the account exists. A `404` is not an error here.
  Expected<bool, Status> Exists();

  // Drops cached headers, if any.
  void Invalidate();

  // Updates headers of this account. Headers not present in `headers` are
  // left unchanged.
  Status Update(const AccountHeaders& headers,
                const RequestOptions* options = nullptr);

  // Creates this account. Requires reseller admin permissions.
  Status Create(const AccountHeaders* headers = nullptr,
                const RequestOptions* options = nullptr);

  // No I/O is performed.
  Container GetContainer(std::string name);

  // Lists containers of this account.
  ContainerIterator Containers();

  // Capabilities of the cluster. Fetched on first call and cached for the
  // lifetime of this handle.
  Expected<Capabilities, Status> GetCapabilities();

  // Uploads an archive and extracts its members into objects.
  //
  // `upload_path` is either empty (each top-level directory in the archive
  // becomes a container), a container name, or `container/prefix`. Returns
  // number of objects created.
  Expected<std::uint64_t, Status> BulkUpload(
      const std::string& upload_path, BulkUploadFormat format, Reader* archive,
      const RequestOptions* options = nullptr);

  // Deletes objects, then containers, in as few requests as possible. All of
  // them must belong to this account. Entities not found are counted but are
  // not errors.
  //
  // Caches of the given handles are invalidated.
  Expected<BulkDeleteResult, Status> BulkDelete(
      const std::vector<Object*>& objects,
      const std::vector<Container*>& containers,
      const RequestOptions* options = nullptr);

 private:
  friend class ContainerIterator;

  Expected<BulkDeleteResult, Status> BulkDeletePaths(
      const std::vector<std::string>& paths, std::uint64_t chunk_size,
      const RequestOptions* options);
  Expected<BulkDeleteResult, Status> DeleteOneByOne(
      const std::vector<Object*>& objects,
      const std::vector<Container*>& containers,
      const RequestOptions* options);

 private:
  std::shared_ptr<Transport> transport_;
  std::string name_;
  std::optional<AccountHeaders> headers_;
  std::optional<Capabilities> capabilities_;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_ACCOUNT_H_
