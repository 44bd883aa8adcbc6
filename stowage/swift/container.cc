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

#include "stowage/swift/container.h"

#include <utility>

#include "stowage/base/logging.h"
#include "stowage/swift/account.h"
#include "stowage/swift/iterator.h"
#include "stowage/swift/status.h"

namespace stowage::swift {

Container::Container(Account* account, std::string name)
    : account_(account), name_(std::move(name)) {}

Expected<ContainerHeaders, Status> Container::Headers() {
  if (headers_) {
    return *headers_;
  }
  auto resp = Execute(account_->transport(),
                      MakeRequest(Operation::ContainerHeaders, nullptr));
  if (!resp) {
    return resp.error();
  }
  ContainerHeaders fetched(resp->headers());
  if (auto status = fetched.Validate(); !status.ok()) {
    STOWAGE_VLOG(1, "Malformed headers of container [{}]: {}", name_,
                 status.message());
    return status;
  }
  headers_ = std::move(fetched);
  return *headers_;
}

Expected<bool, Status> Container::Exists() {
  auto headers = Headers();
  if (headers) {
    return true;
  }
  if (Is(headers.error(), HttpStatus::NotFound)) {
    return false;
  }
  return headers.error();
}

void Container::Invalidate() { headers_ = std::nullopt; }

Status Container::Update(const ContainerHeaders& headers,
                         const RequestOptions* options) {
  auto req = MakeRequest(Operation::ContainerUpdate, options);
  req.headers = headers.ToRequestHeaders();
  auto resp = Execute(account_->transport(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

Status Container::Create(const ContainerHeaders* headers,
                         const RequestOptions* options) {
  auto req = MakeRequest(Operation::ContainerCreate, options);
  if (headers) {
    req.headers = headers->ToRequestHeaders();
  }
  auto resp = Execute(account_->transport(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

Status Container::Delete(const RequestOptions* options) {
  auto resp = Execute(account_->transport(),
                      MakeRequest(Operation::ContainerDelete, options));
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

Status Container::EnsureExists() {
  auto exists = Exists();
  if (!exists) {
    return exists.error();
  }
  if (*exists) {
    return {};
  }
  return Create();
}

Object Container::GetObject(std::string name) {
  return Object(this, std::move(name));
}

ObjectIterator Container::Objects() { return ObjectIterator(this); }

Request Container::MakeRequest(Operation op,
                               const RequestOptions* options) const {
  Request req;
  req.operation = op;
  req.container_name = name_;
  req.options = options;
  return req;
}

}  // namespace stowage::swift
