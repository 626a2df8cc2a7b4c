// Copyright 2022 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef GCP_AUTH_INTERNAL_REST_RESPONSE_H
#define GCP_AUTH_INTERNAL_REST_RESPONSE_H

#include "gcp_auth/status.h"
#include "gcp_auth/version.h"
#include <cstdint>
#include <string>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// HTTP status codes with special meaning for token endpoints.
enum HttpStatusCode : std::int32_t {
  kOk = 200,
  kBadRequest = 400,
  kUnauthorized = 401,
  kForbidden = 403,
  kNotFound = 404,
  kRequestTimeout = 408,
  kTooManyRequests = 429,
  kInternalServerError = 500,
  kServiceUnavailable = 503,
};

/// An HTTP response. The payload can be extracted once.
class RestResponse {
 public:
  virtual ~RestResponse() = default;
  virtual HttpStatusCode StatusCode() const = 0;
  virtual std::string ExtractPayload() && = 0;
};

/**
 * Converts an HTTP status code to a `StatusCode`.
 *
 * Codes in `[100, 300)` map to `kOk`. Codes outside `[100, 600)` map to
 * `kUnknown`. 408 and 429 map to `kUnavailable`, as do 500, 502 and 503.
 */
StatusCode MapHttpCodeToStatus(std::int32_t code);

/// True for codes in `[400, 500)`.
bool IsClientErrorCode(std::int32_t code);

bool IsHttpSuccess(RestResponse const& response);
bool IsHttpError(RestResponse const& response);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_REST_RESPONSE_H
