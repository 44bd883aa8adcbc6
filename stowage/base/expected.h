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

#ifndef STOWAGE_BASE_EXPECTED_H_
#define STOWAGE_BASE_EXPECTED_H_

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "stowage/base/logging.h"

// @sa: http://www.open-std.org/jtc1/sc22/wg21/docs/papers/2018/p0323r6.html

namespace stowage {

template <typename T, typename E>
class Expected;

struct unexpect_t {
  explicit unexpect_t() = default;
};

inline constexpr unexpect_t unexpect{};

namespace detail {

template <typename T>
constexpr bool is_expected_v = false;

template <typename T, typename E>
constexpr bool is_expected_v<Expected<T, E>> = true;

template <class Self, class F>
inline constexpr auto and_then_impl(Self&& self, F&& f) {
  using self_value_t = typename std::decay_t<Self>::value_type;
  if constexpr (std::is_void_v<self_value_t>) {
    using Ret = std::invoke_result_t<F>;
    static_assert(detail::is_expected_v<Ret>, "F must return an expected");
    return self ? std::invoke(std::forward<F>(f))
                : Ret(unexpect, std::forward<Self>(self).error());
  } else {
    using Ret = std::invoke_result_t<F, self_value_t>;
    static_assert(detail::is_expected_v<Ret>, "F must return an expected");
    return self ? std::invoke(std::forward<F>(f),
                              std::forward<Self>(self).value())
                : Ret(unexpect, std::forward<Self>(self).error());
  }
}

}  // namespace detail

template <class E>
class Unexpected {
 public:
  constexpr explicit Unexpected(E e) : unex_(std::move(e)) {}

  [[nodiscard]] constexpr const E& error() const& noexcept { return unex_; }
  [[nodiscard]] constexpr E& error() & noexcept { return unex_; }
  [[nodiscard]] constexpr E&& error() && noexcept { return std::move(unex_); }

 private:
  E unex_;
};

template <typename E>
Unexpected(E) -> Unexpected<E>;

// A low quality mimic of `std::expected<>` (P0323R6), reduced to what we use.
template <class T, class E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  constexpr Expected() = default;
  template <class U, class = std::enable_if_t<std::is_constructible_v<T, U> &&
                                              std::is_convertible_v<U&&, T>>>
  constexpr /* implicit */ Expected(U&& value)
      : value_(std::in_place_index<0>, std::forward<U>(value)) {}
  constexpr /* implicit */ Expected(E error)
      : value_(std::in_place_index<1>, std::move(error)) {}

  template <class G,
            class = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  constexpr /* implicit */ Expected(const Unexpected<G>& u)
      : value_(std::in_place_index<1>, u.error()) {}
  template <class G, class = std::enable_if_t<std::is_constructible_v<E, G>>>
  constexpr /* implicit */ Expected(Unexpected<G>&& u)
      : value_(std::in_place_index<1>, std::move(u).error()) {}

  template <class... Args,
            class = std::enable_if_t<std::is_constructible_v<E, Args...>>>
  constexpr explicit Expected(unexpect_t, Args&&... args)
      : value_(std::in_place_index<1>, std::forward<Args>(args)...) {}

  constexpr T* operator->() { return &value(); }
  constexpr const T* operator->() const { return &value(); }
  constexpr T& operator*() { return value(); }
  constexpr const T& operator*() const { return value(); }
  constexpr bool has_value() const noexcept { return value_.index() == 0; }
  constexpr explicit operator bool() const noexcept {
    return value_.index() == 0;
  }
  [[nodiscard]] constexpr T& value() & {
    STOWAGE_CHECK(has_value(), "Expected has no value");
    return std::get<0>(value_);
  }
  [[nodiscard]] constexpr const T& value() const& {
    STOWAGE_CHECK(has_value(), "Expected has no value");
    return std::get<0>(value_);
  }
  [[nodiscard]] constexpr T&& value() && {
    STOWAGE_CHECK(has_value(), "Expected has no value");
    return std::move(std::get<0>(value_));
  }

  [[nodiscard]] constexpr E& error() & {
    STOWAGE_CHECK(!has_value(), "Expected has no error");
    return std::get<1>(value_);
  }
  [[nodiscard]] constexpr const E& error() const& {
    STOWAGE_CHECK(!has_value(), "Expected has no error");
    return std::get<1>(value_);
  }
  [[nodiscard]] constexpr E&& error() && {
    STOWAGE_CHECK(!has_value(), "Expected has no error");
    return std::move(std::get<1>(value_));
  }

  template <class U>
  constexpr T value_or(U&& alternative) const& {
    if (*this) {
      return value();
    } else {
      return std::forward<U>(alternative);
    }
  }

  template <class F>
  constexpr auto and_then(F&& f) & {
    return detail::and_then_impl(*this, std::forward<F>(f));
  }

  template <class F>
  constexpr auto and_then(F&& f) const& {
    return detail::and_then_impl(*this, std::forward<F>(f));
  }

  template <class F>
  constexpr auto and_then(F&& f) && {
    return detail::and_then_impl(std::move(*this), std::forward<F>(f));
  }

 private:
  std::variant<T, E> value_;
};

template <class E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  constexpr Expected() = default;
  constexpr /* implicit */ Expected(E error) : error_(std::move(error)) {}

  template <class G,
            class = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  constexpr /* implicit */ Expected(const Unexpected<G>& u)
      : error_(u.error()) {}
  template <class G, class = std::enable_if_t<std::is_constructible_v<E, G>>>
  constexpr /* implicit */ Expected(Unexpected<G>&& u)
      : error_(std::move(u).error()) {}

  template <class... Args,
            class = std::enable_if_t<std::is_constructible_v<E, Args...>>>
  constexpr explicit Expected(unexpect_t, Args&&... args)
      : error_(std::forward<Args>(args)...) {}

  constexpr explicit operator bool() const noexcept { return !error_; }
  constexpr bool has_value() const noexcept { return !error_; }
  constexpr E& error() & { return *error_; }
  constexpr const E& error() const& { return *error_; }
  constexpr E&& error() && { return std::move(*error_); }

  template <class F>
  constexpr auto and_then(F&& f) const& {
    return detail::and_then_impl(*this, std::forward<F>(f));
  }

 private:
  std::optional<E> error_;
};

}  // namespace stowage

#endif  // STOWAGE_BASE_EXPECTED_H_
