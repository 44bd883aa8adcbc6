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

#ifndef STOWAGE_BASE_LOGGING_H_
#define STOWAGE_BASE_LOGGING_H_

#include <atomic>
#include <chrono>
#include <exception>
#include <string>
#include <string_view>

#include "fmt/format.h"
#include "glog/logging.h"

#include "stowage/base/likely.h"

// Macros here wrap glog with `fmt`-style formatting, e.g.:
//
// STOWAGE_LOG_INFO("Uploaded [{}] bytes to [{}].", size, name);
//
// #define STOWAGE_CHECK(expr, ...)
// #define STOWAGE_CHECK_EQ(val1, val2, ...)
// #define STOWAGE_CHECK_NE(val1, val2, ...)
// #define STOWAGE_CHECK_LE(val1, val2, ...)
// #define STOWAGE_CHECK_LT(val1, val2, ...)
// #define STOWAGE_CHECK_GE(val1, val2, ...)
// #define STOWAGE_CHECK_GT(val1, val2, ...)
//
// #define STOWAGE_VLOG(n, ...)
// #define STOWAGE_LOG_INFO(...)
// #define STOWAGE_LOG_WARNING(...)
// #define STOWAGE_LOG_ERROR(...)
// #define STOWAGE_LOG_FATAL(...)
//
// #define STOWAGE_LOG_INFO_EVERY_SECOND(...)
// #define STOWAGE_LOG_WARNING_EVERY_SECOND(...)
// #define STOWAGE_LOG_ERROR_EVERY_SECOND(...)

#define STOWAGE_CHECK(expr, ...)                                            \
  do {                                                                      \
    if (STOWAGE_UNLIKELY(!(expr))) {                                        \
      ::google::LogMessageFatal(__FILE__, __LINE__).stream()                \
          << "Check failed: " #expr " "                                     \
          << ::stowage::internal::logging::FormatLog(__FILE__, __LINE__,    \
                                                     ##__VA_ARGS__);        \
    }                                                                       \
  } while (0)

// `val1` and `val2` are evaluated exactly once.
#define STOWAGE_DETAIL_LOGGING_CHECK_OP(op, val1, val2, ...)                \
  do {                                                                      \
    auto&& stowage_anonymous_x = (val1);                                    \
    auto&& stowage_anonymous_y = (val2);                                    \
    if (STOWAGE_UNLIKELY(!(stowage_anonymous_x op stowage_anonymous_y))) {  \
      ::google::LogMessageFatal(__FILE__, __LINE__).stream()                \
          << "Check failed: " #val1 " " #op " " #val2 " "                   \
          << ::stowage::internal::logging::FormatLog(__FILE__, __LINE__,    \
                                                     ##__VA_ARGS__);        \
    }                                                                       \
  } while (0)

#define STOWAGE_CHECK_EQ(val1, val2, ...) \
  STOWAGE_DETAIL_LOGGING_CHECK_OP(==, val1, val2, ##__VA_ARGS__)
#define STOWAGE_CHECK_NE(val1, val2, ...) \
  STOWAGE_DETAIL_LOGGING_CHECK_OP(!=, val1, val2, ##__VA_ARGS__)
#define STOWAGE_CHECK_LE(val1, val2, ...) \
  STOWAGE_DETAIL_LOGGING_CHECK_OP(<=, val1, val2, ##__VA_ARGS__)
#define STOWAGE_CHECK_LT(val1, val2, ...) \
  STOWAGE_DETAIL_LOGGING_CHECK_OP(<, val1, val2, ##__VA_ARGS__)
#define STOWAGE_CHECK_GE(val1, val2, ...) \
  STOWAGE_DETAIL_LOGGING_CHECK_OP(>=, val1, val2, ##__VA_ARGS__)
#define STOWAGE_CHECK_GT(val1, val2, ...) \
  STOWAGE_DETAIL_LOGGING_CHECK_OP(>, val1, val2, ##__VA_ARGS__)

#define STOWAGE_VLOG(n, ...)                                          \
  LOG_IF(INFO, STOWAGE_UNLIKELY(VLOG_IS_ON(n)))                       \
      << ::stowage::internal::logging::FormatLog(__FILE__, __LINE__,  \
                                                 __VA_ARGS__)

#define STOWAGE_LOG_INFO(...)                                            \
  LOG(INFO) << ::stowage::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                       __VA_ARGS__)
#define STOWAGE_LOG_WARNING(...)                                  \
  LOG(WARNING) << ::stowage::internal::logging::FormatLog(        \
      __FILE__, __LINE__, __VA_ARGS__)
#define STOWAGE_LOG_ERROR(...)                                           \
  LOG(ERROR) << ::stowage::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                        __VA_ARGS__)
#define STOWAGE_LOG_FATAL(...)                                           \
  LOG(FATAL) << ::stowage::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                        __VA_ARGS__)

// Inspired by brpc's `LOG_EVERY_SECOND`.
#define STOWAGE_LOG_INFO_EVERY_SECOND(...) \
  STOWAGE_DETAIL_LOGGING_LOG_EVERY_N_SECOND_IMPL(1, INFO, __VA_ARGS__)
#define STOWAGE_LOG_WARNING_EVERY_SECOND(...) \
  STOWAGE_DETAIL_LOGGING_LOG_EVERY_N_SECOND_IMPL(1, WARNING, __VA_ARGS__)
#define STOWAGE_LOG_ERROR_EVERY_SECOND(...) \
  STOWAGE_DETAIL_LOGGING_LOG_EVERY_N_SECOND_IMPL(1, ERROR, __VA_ARGS__)

///////////////////////////////////////
// Implementation goes below.        //
///////////////////////////////////////

namespace stowage::internal::logging {

// Returns `true` if the caller at this call site should write now. `last` is
// the call site's own timestamp slot.
bool ShouldLogEverySecond(std::atomic<std::chrono::nanoseconds>* last,
                          std::chrono::seconds interval);

inline std::string FormatLog(const char* file, int line) { return {}; }

// Never throws. A malformed format string is reported in the log message
// itself rather than crashing the program.
template <class... Ts>
std::string FormatLog(const char* file, int line, std::string_view fmt,
                      const Ts&... args) noexcept {
  try {
    return fmt::format(fmt::runtime(fmt), args...);
  } catch (const std::exception& xcpt) {
    return fmt::format("Failed to format log at [{}:{}] ({}): {}", file, line,
                       fmt, xcpt.what());
  }
}

}  // namespace stowage::internal::logging

#define STOWAGE_DETAIL_LOGGING_LOG_EVERY_N_SECOND_IMPL(N, severity, ...)   \
  do {                                                                    \
    static ::std::atomic<::std::chrono::nanoseconds>                      \
        stowage_anonymous_log_last_occurs{};                              \
    if (::stowage::internal::logging::ShouldLogEverySecond(               \
            &stowage_anonymous_log_last_occurs, ::std::chrono::seconds(N))) { \
      LOG(severity) << ::stowage::internal::logging::FormatLog(           \
          __FILE__, __LINE__, __VA_ARGS__);                               \
    }                                                                     \
  } while (0)

#endif  // STOWAGE_BASE_LOGGING_H_
