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

#ifndef GCP_AUTH_AUTH_ERROR_H
#define GCP_AUTH_AUTH_ERROR_H

#include "gcp_auth/status.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <iosfwd>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// The `ErrorInfo::domain()` of errors raised by the authentication core.
auto constexpr kAuthErrorDomain = "gcp-auth";

/**
 * The kinds of authentication errors.
 *
 * Each kind is reported as the `ErrorInfo::reason()` of a `Status` in the
 * `kAuthErrorDomain` domain. The `ErrorInfo::metadata()` may include:
 * - `provider`: the name of the credential provider, e.g. `service-account`.
 * - `uri`: the token endpoint contacted.
 * - `http_status_code`: the HTTP status returned by the token endpoint.
 * - `fatal`: `"true"` if retrying the operation cannot succeed.
 */
enum class AuthErrorKind {
  /// Detection exhausted all the credential providers.
  kNoProviderFound,
  /// A key file, or the environment pointing to it, is malformed.
  kCredentialShape,
  /// The private key was rejected, or signing failed.
  kCrypto,
  /// Connecting to, or reading from, the token endpoint failed.
  kTransport,
  /// The token endpoint returned an HTTP error.
  kTokenEndpoint,
  /// The token endpoint response could not be parsed.
  kBadResponse,
  /// The `gcloud` CLI failed or produced no output.
  kSubprocess,
  /// The cached token was revoked.
  kRevoked,
  /// The access token contains bytes not allowed in an HTTP header.
  kInvalidTokenShape,
};

/// Returns the `ErrorInfo::reason()` used for @p kind, e.g. `CRYPTO`.
std::string AuthErrorKindName(AuthErrorKind kind);

std::ostream& operator<<(std::ostream& os, AuthErrorKind kind);

/// Returns the kind of an authentication error, or `absl::nullopt`.
absl::optional<AuthErrorKind> GetAuthErrorKind(Status const& status);

/// Returns true if @p status was raised by the authentication core.
inline bool IsAuthError(Status const& status) {
  return GetAuthErrorKind(status).has_value();
}

/// Returns true if @p status is an authentication error marked as fatal.
bool IsFatalAuthError(Status const& status);

/// Returns the name of the provider that raised @p status, if known.
std::string ProviderName(Status const& status);

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_AUTH_ERROR_H
