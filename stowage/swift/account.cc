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

#include "stowage/swift/account.h"

#include <algorithm>
#include <string>
#include <utility>

#include "stowage/base/logging.h"
#include "stowage/base/string.h"
#include "stowage/swift/iterator.h"
#include "stowage/swift/object.h"
#include "stowage/swift/operation.h"
#include "stowage/swift/status.h"

using namespace std::literals;

namespace stowage::swift {

namespace {

// Used if the service does not tell us its limit.
constexpr std::uint64_t kDefaultMaxDeletesPerRequest = 10000;

// `https://host:8080/v1/AUTH_abc/` -> `https://host:8080/info`.
std::string GetInfoUrl(const std::string& endpoint_url) {
  auto scheme_end = endpoint_url.find("://");
  auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  auto path_start = endpoint_url.find('/', host_start);
  return endpoint_url.substr(0, path_start) + "/info";
}

Status MakeNotSupportedStatus() {
  return Status(SwiftStatus::NotSupported,
                "operation not supported by this Swift server");
}

}  // namespace

Account::Account(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {
  STOWAGE_CHECK(transport_, "No transport was given.");
  name_ = LastPathComponent(transport_->EndpointUrl());
}

bool Account::IsEqualTo(const Account& other) const {
  return transport_->EndpointUrl() == other.transport_->EndpointUrl();
}

Account Account::SwitchAccount(const std::string& account_name) const {
  auto url = transport_->EndpointUrl();
  while (EndsWith(url, "/")) {
    url.pop_back();
  }
  url = url.substr(0, url.find_last_of('/') + 1) + account_name + "/";
  return Account(transport_->Clone(url));
}

Expected<AccountHeaders, Status> Account::Headers() {
  if (headers_) {
    return *headers_;
  }
  Request req;
  req.operation = Operation::AccountHeaders;
  auto resp = Execute(transport_.get(), req);
  if (!resp) {
    return resp.error();
  }
  AccountHeaders fetched(resp->headers());
  if (auto status = fetched.Validate(); !status.ok()) {
    STOWAGE_VLOG(1, "Malformed headers of account [{}]: {}", name_,
                 status.message());
    return status;
  }
  headers_ = std::move(fetched);
  return *headers_;
}

Expected<bool, Status> Account::Exists() {
  auto headers = Headers();
  if (headers) {
    return true;
  }
  if (Is(headers.error(), HttpStatus::NotFound)) {
    return false;
  }
  return headers.error();
}

void Account::Invalidate() { headers_ = std::nullopt; }

Status Account::Update(const AccountHeaders& headers,
                       const RequestOptions* options) {
  Request req;
  req.operation = Operation::AccountUpdate;
  req.headers = headers.ToRequestHeaders();
  req.options = options;
  auto resp = Execute(transport_.get(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

Status Account::Create(const AccountHeaders* headers,
                       const RequestOptions* options) {
  Request req;
  req.operation = Operation::AccountCreate;
  if (headers) {
    req.headers = headers->ToRequestHeaders();
  }
  req.options = options;
  auto resp = Execute(transport_.get(), req);
  if (!resp) {
    return resp.error();
  }
  Invalidate();
  return resp->DrainAndClose();
}

Container Account::GetContainer(std::string name) {
  return Container(this, std::move(name));
}

ContainerIterator Account::Containers() { return ContainerIterator(this); }

Expected<Capabilities, Status> Account::GetCapabilities() {
  if (capabilities_) {
    return *capabilities_;
  }
  Request req;
  req.operation = Operation::Capabilities;
  req.url = GetInfoUrl(transport_->EndpointUrl());
  auto resp = Execute(transport_.get(), req);
  if (!resp) {
    return resp.error();
  }
  auto body = resp->ReadBody();
  if (!body) {
    return body.error();
  }
  auto caps = ParseCapabilities(*body);
  if (!caps) {
    return caps.error();
  }
  capabilities_ = std::move(*caps);
  return *capabilities_;
}

Expected<std::uint64_t, Status> Account::BulkUpload(
    const std::string& upload_path, BulkUploadFormat format, Reader* archive,
    const RequestOptions* options) {
  auto caps = GetCapabilities();
  if (!caps) {
    return caps.error();
  }
  if (!caps->bulk_upload) {
    return MakeNotSupportedStatus();
  }

  std::string_view path = upload_path;
  while (StartsWith(path, "/")) {
    path.remove_prefix(1);
  }
  Request req;
  req.operation = Operation::BulkUpload;
  if (auto pos = path.find('/'); pos == std::string_view::npos) {
    req.container_name = std::string(path);
  } else {
    req.container_name = std::string(path.substr(0, pos));
    req.object_name = std::string(path.substr(pos + 1));
  }
  req.values.Set("extract-archive", std::string(ToStringView(format)));
  req.headers.Set("Accept", "application/json");
  req.body = archive;
  req.content_length = archive ? archive->Size() : 0;
  req.options = options;

  auto resp = Execute(transport_.get(), req);
  if (!resp) {
    return resp.error();
  }
  auto body = resp->ReadBody();
  if (!body) {
    return body.error();
  }
  auto parsed = ParseBulkResponse(*body);
  if (!parsed) {
    return parsed.error();
  }
  if (auto status = ToStatus(*parsed); !status.ok()) {
    return status;
  }
  return parsed->files_created;
}

Expected<BulkDeleteResult, Status> Account::BulkDelete(
    const std::vector<Object*>& objects,
    const std::vector<Container*>& containers,
    const RequestOptions* options) {
  for (auto&& e : objects) {
    if (!e->account()->IsEqualTo(*this)) {
      return Status(SwiftStatus::AccountMismatch,
                    Format("object [{}] belongs to another account",
                           e->FullName()));
    }
  }
  for (auto&& e : containers) {
    if (!e->account()->IsEqualTo(*this)) {
      return Status(SwiftStatus::AccountMismatch,
                    Format("container [{}] belongs to another account",
                           e->Name()));
    }
  }
  if (objects.empty() && containers.empty()) {
    return BulkDeleteResult();
  }

  // Names are validated before anything is sent, so that a bad name fails
  // the whole batch whichever way it ends up being deleted.
  std::vector<std::string> paths;
  for (auto&& e : objects) {
    if (auto status = ValidateResourceNames(
            OperationTarget::Object, e->container()->Name(), e->Name());
        !status.ok()) {
      return status;
    }
    paths.push_back("/" + EncodeResourcePath(e->container()->Name(),
                                             e->Name()));
  }
  for (auto&& e : containers) {
    if (auto status =
            ValidateResourceNames(OperationTarget::Container, e->Name(), "");
        !status.ok()) {
      return status;
    }
    paths.push_back("/" + EncodeResourcePath(e->Name(), ""));
  }

  auto caps = GetCapabilities();
  if (!caps && !Is(caps.error(), HttpStatus::NotFound)) {
    return caps.error();
  }
  if (!caps || !caps->bulk_delete) {
    STOWAGE_VLOG(1, "Bulk delete is not available, deleting one by one.");
    return DeleteOneByOne(objects, containers, options);
  }

  auto chunk_size = caps->bulk_delete->max_deletes_per_request;
  auto result = BulkDeletePaths(
      paths, chunk_size ? chunk_size : kDefaultMaxDeletesPerRequest, options);
  for (auto&& e : objects) {
    e->Invalidate();
  }
  for (auto&& e : containers) {
    e->Invalidate();
  }
  return result;
}

Expected<BulkDeleteResult, Status> Account::BulkDeletePaths(
    const std::vector<std::string>& paths, std::uint64_t chunk_size,
    const RequestOptions* options) {
  BulkDeleteResult result;
  for (std::size_t offset = 0; offset < paths.size(); offset += chunk_size) {
    auto end = std::min<std::size_t>(offset + chunk_size, paths.size());
    std::string body;
    for (auto i = offset; i != end; ++i) {
      body += paths[i];
      body += "\n";
    }
    StringReader reader(std::move(body));

    Request req;
    req.operation = Operation::BulkDelete;
    req.values.Set("bulk-delete", "");
    req.headers.Set("Content-Type", "text/plain");
    req.headers.Set("Accept", "application/json");
    req.body = &reader;
    req.content_length = reader.Size();
    req.options = options;

    auto resp = Execute(transport_.get(), req);
    if (!resp) {
      return resp.error();
    }
    auto resp_body = resp->ReadBody();
    if (!resp_body) {
      return resp_body.error();
    }
    auto parsed = ParseBulkResponse(*resp_body);
    if (!parsed) {
      return parsed.error();
    }
    if (auto status = ToStatus(*parsed); !status.ok()) {
      return status;
    }
    result.deleted += parsed->deleted;
    result.not_found += parsed->not_found;
  }
  return result;
}

Expected<BulkDeleteResult, Status> Account::DeleteOneByOne(
    const std::vector<Object*>& objects,
    const std::vector<Container*>& containers,
    const RequestOptions* options) {
  BulkDeleteResult result;
  auto count = [&](const Status& status) -> Status {
    if (status.ok()) {
      ++result.deleted;
    } else if (Is(status, HttpStatus::NotFound)) {
      ++result.not_found;
    } else {
      return status;
    }
    return {};
  };
  for (auto&& e : objects) {
    if (auto status = count(e->Delete(nullptr, options)); !status.ok()) {
      return status;
    }
  }
  for (auto&& e : containers) {
    if (auto status = count(e->Delete(options)); !status.ok()) {
      return status;
    }
  }
  return result;
}

}  // namespace stowage::swift
