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

#include "stowage/swift/operation.h"

#include <iterator>
#include <string_view>
#include <vector>

#include "stowage/base/logging.h"

using namespace std::literals;

namespace stowage::swift {

namespace {

struct OperationDesc {
  Operation op;
  std::string_view name;
  OperationTarget target;
  HttpMethod method;
  std::vector<int> expected;
};

// Indexed by `Operation`.
const OperationDesc kOperations[] = {
    {Operation::AccountHeaders, "AccountHeaders"sv, OperationTarget::Account,
     HttpMethod::Head, {204, 200}},
    {Operation::AccountCreate, "AccountCreate"sv, OperationTarget::Account,
     HttpMethod::Put, {201, 202}},
    {Operation::AccountUpdate, "AccountUpdate"sv, OperationTarget::Account,
     HttpMethod::Post, {204}},
    {Operation::ContainerHeaders, "ContainerHeaders"sv,
     OperationTarget::Container, HttpMethod::Head, {204, 200}},
    {Operation::ContainerCreate, "ContainerCreate"sv,
     OperationTarget::Container, HttpMethod::Put, {201, 202}},
    {Operation::ContainerUpdate, "ContainerUpdate"sv,
     OperationTarget::Container, HttpMethod::Post, {204}},
    {Operation::ContainerDelete, "ContainerDelete"sv,
     OperationTarget::Container, HttpMethod::Delete, {204}},
    {Operation::ObjectHeaders, "ObjectHeaders"sv, OperationTarget::Object,
     HttpMethod::Head, {200}},
    {Operation::ObjectUpload, "ObjectUpload"sv, OperationTarget::Object,
     HttpMethod::Put, {201}},
    {Operation::ObjectUpdate, "ObjectUpdate"sv, OperationTarget::Object,
     HttpMethod::Post, {202}},
    {Operation::ObjectDelete, "ObjectDelete"sv, OperationTarget::Object,
     HttpMethod::Delete, {204}},
    {Operation::ObjectDownload, "ObjectDownload"sv, OperationTarget::Object,
     HttpMethod::Get, {200, 206}},
    {Operation::ObjectCopy, "ObjectCopy"sv, OperationTarget::Object,
     HttpMethod::Put, {201}},
    {Operation::ListContainers, "ListContainers"sv, OperationTarget::Account,
     HttpMethod::Get, {200, 204}},
    {Operation::ListObjects, "ListObjects"sv, OperationTarget::Container,
     HttpMethod::Get, {200, 204}},
    {Operation::Capabilities, "Capabilities"sv, OperationTarget::Account,
     HttpMethod::Get, {200}},
    {Operation::BulkUpload, "BulkUpload"sv, OperationTarget::Account,
     HttpMethod::Put, {200, 201}},
    {Operation::BulkDelete, "BulkDelete"sv, OperationTarget::Account,
     HttpMethod::Post, {200}},
    {Operation::SloManifestDelete, "SloManifestDelete"sv,
     OperationTarget::Object, HttpMethod::Delete, {200}},
    {Operation::SloManifestGet, "SloManifestGet"sv, OperationTarget::Object,
     HttpMethod::Get, {200}},
};

const OperationDesc& GetDesc(Operation op) {
  auto index = static_cast<std::size_t>(op);
  STOWAGE_CHECK_LT(index, std::size(kOperations));
  auto&& desc = kOperations[index];
  STOWAGE_CHECK(desc.op == op, "Operation table is out of order.");
  return desc;
}

}  // namespace

std::string_view ToStringView(Operation op) noexcept {
  return GetDesc(op).name;
}

HttpMethod MethodOf(Operation op) noexcept { return GetDesc(op).method; }

OperationTarget TargetOf(Operation op) noexcept {
  return GetDesc(op).target;
}

const std::vector<int>& ExpectedStatusCodesOf(Operation op) noexcept {
  return GetDesc(op).expected;
}

const std::vector<int>& DefaultStatusCodesOf(HttpMethod method) noexcept {
  static const std::vector<int> kGet = {200}, kHead = {200, 204},
                                kPut = {201}, kPost = {202, 204},
                                kDelete = {204}, kNone = {};
  switch (method) {
    case HttpMethod::Get:
      return kGet;
    case HttpMethod::Head:
      return kHead;
    case HttpMethod::Put:
      return kPut;
    case HttpMethod::Post:
      return kPost;
    case HttpMethod::Delete:
      return kDelete;
    default:
      return kNone;
  }
}

}  // namespace stowage::swift
