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

#ifndef GCP_AUTH_INTERNAL_MAKE_AUTH_ERROR_H
#define GCP_AUTH_INTERNAL_MAKE_AUTH_ERROR_H

#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/make_status.h"
#include "gcp_auth/status.h"
#include "gcp_auth/version.h"
#include <cstdint>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

auto constexpr kProviderKey = "provider";
auto constexpr kUriKey = "uri";
auto constexpr kHttpStatusCodeKey = "http_status_code";
auto constexpr kFatalKey = "fatal";
auto constexpr kConnectErrorKey = "connect_error";

/// A malformed key file, marked as fatal.
Status CredentialShapeError(std::string msg, ErrorInfoBuilder b);

/// The key was rejected by OpenSSL or signing failed, marked as fatal.
Status CryptoError(std::string msg, ErrorInfoBuilder b);

Status TransportError(std::string msg, ErrorInfoBuilder b);

/**
 * Converts a `RestClient` failure into a `kTransport` error.
 *
 * The status code and the `connect_error` metadata of @p cause are preserved.
 */
Status TransportError(Status const& cause, std::string const& uri,
                      ErrorInfoBuilder b);

/**
 * An HTTP error returned by a token endpoint.
 *
 * The status code is derived from @p http_status_code. Any 4xx other than
 * 408 (Request Timeout) and 429 (Too Many Requests) is marked as fatal.
 */
Status TokenEndpointError(std::string const& uri,
                          std::int32_t http_status_code, std::string payload,
                          ErrorInfoBuilder b);

/// A successful response that could not be parsed, marked as fatal.
Status BadResponseError(std::string msg, ErrorInfoBuilder b);

Status SubprocessError(std::string msg, ErrorInfoBuilder b);
Status RevokedError(std::string msg, ErrorInfoBuilder b);

/// An access token that cannot be used in a header, marked as fatal.
Status InvalidTokenShapeError(std::string msg, ErrorInfoBuilder b);

Status NoProviderFoundError(std::string msg, ErrorInfoBuilder b);

/// Returns @p status with the `fatal` metadata set.
Status MakeFatal(Status status);

/// Returns true if the `fatal` metadata of @p status is `"true"`.
bool IsFatal(Status const& status);

/// Returns true if @p status reports a failure to reach the remote host.
bool IsConnectError(Status const& status);

/// Sets the `provider` metadata of @p status, unless it is already set.
Status WithProvider(Status status, std::string const& provider);

/**
 * Converts any error into an authentication error.
 *
 * Authentication errors are returned unchanged. Unavailable and deadline
 * errors become `kTransport` errors, cancellations become `kRevoked` errors,
 * and anything else becomes a fatal `kBadResponse` error.
 */
Status AsAuthError(Status status);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_MAKE_AUTH_ERROR_H
