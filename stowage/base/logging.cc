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

#include "stowage/base/logging.h"

#include <chrono>

namespace stowage::internal::logging {

bool ShouldLogEverySecond(std::atomic<std::chrono::nanoseconds>* last,
                          std::chrono::seconds interval) {
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  auto was = last->load(std::memory_order_relaxed);
  if (was + interval > now) {
    return false;
  }
  // Only one of the racing callers wins the slot.
  return last->compare_exchange_strong(was, now, std::memory_order_relaxed);
}

}  // namespace stowage::internal::logging
