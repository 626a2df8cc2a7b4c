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

#ifndef GCP_AUTH_INTERNAL_REST_PARSE_JSON_ERROR_H
#define GCP_AUTH_INTERNAL_REST_PARSE_JSON_ERROR_H

#include "gcp_auth/version.h"
#include <cstdint>
#include <string>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * Extracts a human-readable message from an error response payload.
 *
 * OAuth2 and metadata endpoints do not agree on an error format. When the
 * payload is JSON the result is the first of:
 * - a top-level `"message"` string,
 * - a top-level `"error"` string, or the `"message"` of an `"error"` object,
 * - the longest string value found anywhere in the document.
 *
 * In all other cases the payload is returned unchanged.
 */
std::string ParseJsonErrorDetail(std::string payload);

/// Formats an error response as `<uri> - <http_status_code>: <detail>`.
std::string FormatHttpError(std::string const& uri,
                            std::int32_t http_status_code, std::string payload);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_REST_PARSE_JSON_ERROR_H
