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

#include "gcp_auth/internal/rest_response.h"

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

struct CodeMapping {
  std::int32_t http_code;
  StatusCode code;
};

// Codes with a specific mapping. Any other code maps by its class.
constexpr CodeMapping kSpecificCodes[] = {
    {304, StatusCode::kFailedPrecondition},
    {400, StatusCode::kInvalidArgument},
    {401, StatusCode::kUnauthenticated},
    {403, StatusCode::kPermissionDenied},
    {404, StatusCode::kNotFound},
    {405, StatusCode::kPermissionDenied},
    {408, StatusCode::kUnavailable},
    {409, StatusCode::kAborted},
    {410, StatusCode::kNotFound},
    {412, StatusCode::kFailedPrecondition},
    {413, StatusCode::kOutOfRange},
    {429, StatusCode::kUnavailable},
    {500, StatusCode::kUnavailable},
    {502, StatusCode::kUnavailable},
    {503, StatusCode::kUnavailable},
};

StatusCode MapHttpCodeClass(std::int32_t code) {
  switch (code / 100) {
    case 1:
    case 2:
      return StatusCode::kOk;
    case 4:
      return StatusCode::kInvalidArgument;
    case 5:
      return StatusCode::kInternal;
    default:
      // libcurl follows redirects, a 3xx code here is unexpected.
      return StatusCode::kUnknown;
  }
}

}  // namespace

StatusCode MapHttpCodeToStatus(std::int32_t code) {
  if (code < 100 || code >= 600) return StatusCode::kUnknown;
  for (auto const& m : kSpecificCodes) {
    if (m.http_code == code) return m.code;
  }
  return MapHttpCodeClass(code);
}

bool IsClientErrorCode(std::int32_t code) { return code >= 400 && code < 500; }

bool IsHttpSuccess(RestResponse const& response) {
  auto const code = response.StatusCode();
  return code >= 200 && code < 300;
}

bool IsHttpError(RestResponse const& response) {
  return !IsHttpSuccess(response);
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
