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

#ifndef STOWAGE_BASE_STATUS_H_
#define STOWAGE_BASE_STATUS_H_

#include <any>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace stowage {

namespace detail {

template <class T, bool = std::is_enum_v<T>>
struct is_int_enum : std::false_type {};

template <class T>
struct is_int_enum<T, true>
    : std::is_same<std::underlying_type_t<T>, int> {};

}  // namespace detail

// This class describes status code, as its name implies.
//
// `0` is treated as success, other values are failures. A failure may carry a
// typed payload describing it in more detail (e.g. the response that caused
// it), retrievable via `payload<T>()`.
class Status {
 public:
  Status() noexcept = default;
  explicit Status(int status, std::string desc = {});

  // If an enum type is inherited from `int` (which is the default), we allow
  // constructing `Status` from that type without further casting.
  //
  // Special note: `Status` treats 0 as success. If enumerator with value 0 in
  // `T` is not a successful status, you need to take special care when using
  // it.
  template <class T, class = std::enable_if_t<detail::is_int_enum<T>::value>>
  explicit Status(T status, std::string desc = {})
      : Status(static_cast<int>(status), std::move(desc)) {}

  // Constructs a failure carrying `payload`.
  template <class T, class P,
            class = std::enable_if_t<detail::is_int_enum<T>::value>>
  Status(T status, std::string desc, P payload)
      : Status(static_cast<int>(status), std::move(desc)) {
    if (state_) {
      state_->payload = std::move(payload);
    }
  }

  // Test if this object represents a successful status.
  bool ok() const noexcept { return !state_; }

  // Get status value.
  int code() const noexcept { return !state_ ? 0 : state_->status; }

  // Get description of the status.
  const std::string& message() const noexcept;

  // Returns the payload if it's of type `T`, `nullptr` otherwise.
  template <class T>
  const T* payload() const noexcept {
    return state_ ? std::any_cast<T>(&state_->payload) : nullptr;
  }

  // Returns a human readable string describing the status.
  std::string ToString() const;

 private:
  struct State {
    int status;
    std::string desc;
    std::any payload;
  };
  // For successful state, we use `nullptr` here. (For performance reasons.).
  std::shared_ptr<State> state_;
};

}  // namespace stowage

#endif  // STOWAGE_BASE_STATUS_H_
