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

#ifndef GCP_AUTH_TOKEN_PROVIDER_H
#define GCP_AUTH_TOKEN_PROVIDER_H

#include "gcp_auth/completion_queue.h"
#include "gcp_auth/future.h"
#include "gcp_auth/provider_kind.h"
#include "gcp_auth/scopes.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token.h"
#include "gcp_auth/version.h"
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * A source of OAuth2 access tokens.
 *
 * Each call to `AsyncGetToken()` performs a single attempt to obtain a new
 * token. Retries, caching, and coalescing of concurrent requests are the
 * responsibility of the caller, typically an `Auth` handle.
 *
 * Implementations never block the calling thread. Any blocking work, such as
 * HTTP requests or running subprocesses, is scheduled on @p cq.
 *
 * Errors are reported using the `kAuthErrorDomain` domain, see
 * `AuthErrorKind`.
 */
class TokenProvider {
 public:
  virtual ~TokenProvider() = default;

  virtual future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                                Scopes const& scopes) = 0;

  virtual ProviderKind kind() const = 0;

  /// A human readable description, e.g. `service-account(foo@bar.com)`.
  virtual std::string name() const = 0;

  /// True if the provider uses the scopes passed to `AsyncGetToken()`.
  virtual bool requires_scopes() const = 0;
};

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TOKEN_PROVIDER_H
