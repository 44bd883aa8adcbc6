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

#ifndef STOWAGE_HTTP_TYPES_H_
#define STOWAGE_HTTP_TYPES_H_

#include <optional>
#include <string_view>

#include "stowage/base/string.h"

namespace stowage {

enum class HttpMethod {
  Unspecified,  // Used as a placeholder. Do not use it.
  Head,
  Get,
  Post,
  Put,
  Delete,
  Options,
  Patch
};

// @sa: https://developer.mozilla.org/en-US/docs/Web/HTTP/Status
enum class HttpStatus {
  Continue = 100,
  SwitchingProtocols = 101,
  OK = 200,
  Created = 201,
  Accepted = 202,
  NonAuthoritativeInformation = 203,
  NoContent = 204,
  ResetContent = 205,
  PartialContent = 206,
  MultipleChoices = 300,
  MovedPermanently = 301,
  Found = 302,
  SeeOther = 303,
  NotModified = 304,
  TemporaryRedirect = 307,
  PermanentRedirect = 308,
  BadRequest = 400,
  Unauthorized = 401,
  PaymentRequired = 402,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  NotAcceptable = 406,
  ProxyAuthenticationRequired = 407,
  RequestTimeout = 408,
  Conflict = 409,
  Gone = 410,
  LengthRequired = 411,
  PreconditionFailed = 412,
  PayloadTooLarge = 413,
  URITooLong = 414,
  UnsupportedMediaType = 415,
  RangeNotSatisfiable = 416,
  ExpectationFailed = 417,
  UnprocessableEntity = 422,
  TooEarly = 425,
  UpgradeRequired = 426,
  PreconditionRequired = 428,
  TooManyRequests = 429,
  RequestHeaderFieldsTooLarge = 431,
  UnavailableForLegalReasons = 451,
  InternalServerError = 500,
  NotImplemented = 501,
  BadGateway = 502,
  ServiceUnavailable = 503,
  GatewayTimeout = 504,
  HTTPVersionNotSupported = 505,
  InsufficientStorage = 507
};

std::string_view ToStringView(HttpMethod method) noexcept;

// Reason phrase of `status`, empty if unknown.
std::string_view ToStringView(HttpStatus status) noexcept;

// Same as above, for raw status codes received from the wire.
std::string_view StatusText(int status) noexcept;

template <>
struct TryParseTraits<HttpMethod> {
  static std::optional<HttpMethod> TryParse(std::string_view s);
};

}  // namespace stowage

#endif  // STOWAGE_HTTP_TYPES_H_
