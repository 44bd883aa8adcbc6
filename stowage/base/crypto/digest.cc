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

#include "stowage/base/crypto/digest.h"

#include <string>

#include "openssl/evp.h"
#include "openssl/hmac.h"

#include "stowage/base/logging.h"

namespace stowage {

namespace {

std::string HmacImpl(const EVP_MD* evp_md, std::string_view key,
                     std::string_view data) {
  unsigned char buffer[EVP_MAX_MD_SIZE];  // NOLINT.
  unsigned int size = 0;
  auto result =
      HMAC(evp_md, key.data(), key.size(),
           reinterpret_cast<const unsigned char*>(data.data()),  // NOLINT.
           data.size(), buffer, &size);
  STOWAGE_CHECK(result, "HMAC failed.");
  return std::string(reinterpret_cast<char*>(buffer), size);
}

}  // namespace

std::string Md5(std::string_view data) {
  Md5Hasher hasher;
  hasher.Update(data);
  return hasher.Final();
}

std::string HmacSha1(std::string_view key, std::string_view data) {
  return HmacImpl(EVP_sha1(), key, data);
}

void Md5Hasher::Deleter::operator()(EVP_MD_CTX* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
  STOWAGE_CHECK(ctx_, "Failed to allocate digest context.");
  STOWAGE_CHECK_EQ(EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr), 1);
}

Md5Hasher::~Md5Hasher() = default;

void Md5Hasher::Update(std::string_view data) {
  STOWAGE_CHECK(digest_.empty(), "`Update` called after `Final`.");
  STOWAGE_CHECK_EQ(EVP_DigestUpdate(ctx_.get(), data.data(), data.size()), 1);
}

std::string Md5Hasher::Final() {
  if (digest_.empty()) {
    unsigned char buffer[EVP_MAX_MD_SIZE];  // NOLINT.
    unsigned int size = 0;
    STOWAGE_CHECK_EQ(EVP_DigestFinal_ex(ctx_.get(), buffer, &size), 1);
    digest_.assign(reinterpret_cast<char*>(buffer), size);
  }
  return digest_;
}

}  // namespace stowage
