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

#ifndef STOWAGE_BASE_CRYPTO_DIGEST_H_
#define STOWAGE_BASE_CRYPTO_DIGEST_H_

#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace stowage {

// Hash `data` using MD5.
//
// The resulting value is NOT hex-encoded.
std::string Md5(std::string_view data);

// HMAC-SHA1. Not hex-encoded either.
std::string HmacSha1(std::string_view key, std::string_view data);

// Incrementally computes MD5 of everything passed to `Update`.
class Md5Hasher {
 public:
  Md5Hasher();
  ~Md5Hasher();

  void Update(std::string_view data);

  // Returns digest of all data seen so far. Further `Update`s are not allowed
  // after this call, but `Final()` itself may be called repeatedly.
  std::string Final();

 private:
  struct Deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept;
  };
  std::unique_ptr<EVP_MD_CTX, Deleter> ctx_;
  std::string digest_;
};

}  // namespace stowage

#endif  // STOWAGE_BASE_CRYPTO_DIGEST_H_
