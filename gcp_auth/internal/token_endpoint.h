// Copyright 2024 Google LLC
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

#ifndef GCP_AUTH_INTERNAL_TOKEN_ENDPOINT_H
#define GCP_AUTH_INTERNAL_TOKEN_ENDPOINT_H

#include "gcp_auth/internal/rest_response.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Access tokens issued by Google are valid for one hour.
auto constexpr kAccessTokenLifetime = std::chrono::seconds(3600);

/// The OAuth2 token endpoint for service accounts and authorized users.
auto constexpr kDefaultTokenUri = "https://oauth2.googleapis.com/token";

/**
 * Returns the body of a successful token endpoint response.
 *
 * Transport failures become `kTransport` errors, and HTTP errors become
 * `kTokenEndpoint` errors, both annotated with @p uri.
 */
StatusOr<std::string> ReadTokenEndpointResponse(
    StatusOr<std::unique_ptr<rest_internal::RestResponse>> response,
    std::string const& uri);

/**
 * Parses an OAuth2 access token response.
 *
 * The response must be a JSON object with an `access_token` string and a
 * non-negative `expires_in` number of seconds. The token expires at
 * `now + expires_in`.
 */
StatusOr<Token> ParseAccessTokenResponse(
    std::string const& payload, std::chrono::system_clock::time_point now);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_TOKEN_ENDPOINT_H
