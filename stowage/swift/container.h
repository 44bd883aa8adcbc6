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

#ifndef STOWAGE_SWIFT_CONTAINER_H_
#define STOWAGE_SWIFT_CONTAINER_H_

#include <optional>
#include <string>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/swift/headers.h"
#include "stowage/swift/object.h"
#include "stowage/swift/request.h"

namespace stowage::swift {

class Account;
class ObjectIterator;

// A container of an account.
//
// The name is not checked on construction. An empty name or one containing a
// slash fails every operation locally.
class Container {
 public:
  // No I/O is performed.
  Container(Account* account, std::string name);

  Account* account() const noexcept { return account_; }
  const std::string& Name() const noexcept { return name_; }

  // Headers of this container. Fetched on first call and cached thereafter.
  Expected<ContainerHeaders, Status> Headers();

  // Tests if the container exists. A `404` is not an error here.
  Expected<bool, Status> Exists();

  // Drops cached headers, if any.
  void Invalidate();

  // Headers not present in `headers` are left unchanged.
  Status Update(const ContainerHeaders& headers,
                const RequestOptions* options = nullptr);

  // Creates the container, or updates its headers if it exists already.
  Status Create(const ContainerHeaders* headers = nullptr,
                const RequestOptions* options = nullptr);

  // The container must be empty.
  Status Delete(const RequestOptions* options = nullptr);

  // Creates the container unless it exists already. Headers of an existing
  // container are left untouched.
  Status EnsureExists();

  // No I/O is performed.
  Object GetObject(std::string name);

  // Lists objects of this container.
  ObjectIterator Objects();

 private:
  Request MakeRequest(Operation op, const RequestOptions* options) const;

 private:
  Account* account_;
  std::string name_;
  std::optional<ContainerHeaders> headers_;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_CONTAINER_H_
