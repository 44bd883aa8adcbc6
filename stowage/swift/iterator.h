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

#ifndef STOWAGE_SWIFT_ITERATOR_H_
#define STOWAGE_SWIFT_ITERATOR_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/swift/container.h"
#include "stowage/swift/object.h"
#include "stowage/swift/request.h"

namespace stowage::swift {

class Account;

// Entry of a detailed container listing.
struct ContainerInfo {
  Container container;
  std::uint64_t object_count = 0;
  std::uint64_t bytes_used = 0;
  // Epoch if the service did not report it.
  std::chrono::system_clock::time_point last_modified;
};

// Entry of a detailed object listing.
struct ObjectInfo {
  Object object;

  // Set for pseudo-directories reported when listing with a delimiter. Other
  // fields are left empty in this case.
  std::string subdirectory;

  std::uint64_t size_bytes = 0;
  std::string content_type;
  std::string etag;
  std::chrono::system_clock::time_point last_modified;

  // Target of the symlink, as `container/object`, if the object is one.
  std::string symlink_target;
};

// Iterates over containers of an account, in lexicographical order.
//
//   auto iter = account.Containers();
//   iter.prefix = "logs-";
//   auto all = iter.Collect();
class ContainerIterator {
 public:
  explicit ContainerIterator(Account* account) : account_(account) {}

  // Only list containers whose names start with `prefix`.
  std::string prefix;

  // Not owned, may be `nullptr`.
  const RequestOptions* options = nullptr;

  // Returns the next page of at most `limit` containers (`0` lets the service
  // decide). An empty page indicates the end of listing.
  Expected<std::vector<Container>, Status> NextPage(int limit = 0);
  Expected<std::vector<ContainerInfo>, Status> NextPageDetailed(int limit = 0);

  // Calls `cb` on each (remaining) container, until the end of listing or
  // `cb` fails.
  Status ForEach(const std::function<Status(Container)>& cb);
  Status ForEachDetailed(const std::function<Status(ContainerInfo)>& cb);

  // Lists all (remaining) containers.
  Expected<std::vector<Container>, Status> Collect();
  Expected<std::vector<ContainerInfo>, Status> CollectDetailed();

 private:
  Request MakeRequest(int limit, bool detailed) const;

 private:
  Account* account_;
  std::string marker_;
};

// Iterates over objects of a container, in lexicographical order.
class ObjectIterator {
 public:
  explicit ObjectIterator(Container* container) : container_(container) {}

  // Only list objects whose names start with `prefix`.
  std::string prefix;

  // If set, names are rolled up into pseudo-directories at the first
  // occurrence of `delimiter` after `prefix`. Such pseudo-directories appear
  // as objects named after the directory (including delimiter), or with
  // `ObjectInfo::subdirectory` set in detailed listings.
  std::string delimiter;

  // Not owned, may be `nullptr`.
  const RequestOptions* options = nullptr;

  Expected<std::vector<Object>, Status> NextPage(int limit = 0);
  Expected<std::vector<ObjectInfo>, Status> NextPageDetailed(int limit = 0);

  Status ForEach(const std::function<Status(Object)>& cb);
  Status ForEachDetailed(const std::function<Status(ObjectInfo)>& cb);

  Expected<std::vector<Object>, Status> Collect();
  Expected<std::vector<ObjectInfo>, Status> CollectDetailed();

 private:
  Request MakeRequest(int limit, bool detailed) const;

 private:
  Container* container_;
  std::string marker_;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_ITERATOR_H_
