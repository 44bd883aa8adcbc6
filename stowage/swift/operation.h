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

#ifndef STOWAGE_SWIFT_OPERATION_H_
#define STOWAGE_SWIFT_OPERATION_H_

#include <string_view>
#include <vector>

#include "stowage/http/types.h"

namespace stowage::swift {

// Operations we perform against the service. Each of them has its own set of
// acceptable status codes, as the service is not exactly consistent in this
// regard.
enum class Operation {
  AccountHeaders,
  AccountCreate,
  AccountUpdate,
  ContainerHeaders,
  ContainerCreate,
  ContainerUpdate,
  ContainerDelete,
  ObjectHeaders,
  ObjectUpload,
  ObjectUpdate,
  ObjectDelete,
  ObjectDownload,
  ObjectCopy,
  ListContainers,
  ListObjects,
  Capabilities,
  BulkUpload,
  BulkDelete,
  SloManifestDelete,
  SloManifestGet,
};

// Operations on containers require a container name, operations on objects
// require both names.
enum class OperationTarget { Account, Container, Object };

std::string_view ToStringView(Operation op) noexcept;

// HTTP method used by `op`.
HttpMethod MethodOf(Operation op) noexcept;

// Kind of entity `op` acts on.
OperationTarget TargetOf(Operation op) noexcept;

// Status codes indicating success of `op`.
const std::vector<int>& ExpectedStatusCodesOf(Operation op) noexcept;

// Status codes indicating success of a request not associated with any
// `Operation`.
const std::vector<int>& DefaultStatusCodesOf(HttpMethod method) noexcept;

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_OPERATION_H_
