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

#ifndef GCP_AUTH_AUTH_H
#define GCP_AUTH_AUTH_H

#include "gcp_auth/auth_header.h"
#include "gcp_auth/options.h"
#include "gcp_auth/project_id.h"
#include "gcp_auth/provider_kind.h"
#include "gcp_auth/scopes.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
class Auth;
namespace internal {
class AuthImpl;
Auth MakeAuthFromImpl(std::shared_ptr<AuthImpl> impl);
}  // namespace internal

/**
 * A handle to the credentials used by an application.
 *
 * An `Auth` handle caches a single access token, shared by all the copies of
 * the handle. The token is refreshed in the background when it expires or is
 * revoked. Concurrent requests for a header while a refresh is in progress
 * all wait for the same refresh.
 *
 * Copies are cheap. When the last copy is destroyed any refresh in progress
 * is cancelled, and any background threads created for the handle are
 * stopped.
 *
 * @par Example
 * @code
 * auto auth = gcp_auth::MakeAuth();
 * if (!auth) throw std::move(auth).status();
 * auto header = auth->WaitForHeader();
 * if (!header) throw std::move(header).status();
 * request.AddHeader("authorization", header->value);
 * @endcode
 */
class Auth {
 public:
  /**
   * Returns a header usable now, or a future satisfied after a refresh.
   *
   * This function never blocks.
   */
  HeaderResult GetHeader() const;

  /// Returns a valid header, blocking until a refresh completes if needed.
  StatusOr<AuthHeader> WaitForHeader() const;

  /**
   * Discards the cached token.
   *
   * Call this when a service rejects the current token. If @p start_new is
   * true a refresh starts immediately.
   */
  void Revoke(bool start_new) const;

  /**
   * Returns a new handle requesting tokens with a different set of scopes.
   *
   * The new handle has its own cache, and shares the provider and background
   * threads with this handle.
   */
  Auth WithScopes(Scopes scopes) const;

  ProjectId const& project_id() const;
  ProviderKind provider_kind() const;
  std::string const& provider_name() const;
  Scopes const& scopes() const;

 private:
  friend Auth internal::MakeAuthFromImpl(std::shared_ptr<internal::AuthImpl>);
  explicit Auth(std::shared_ptr<internal::AuthImpl> impl)
      : impl_(std::move(impl)) {}

  std::shared_ptr<internal::AuthImpl> impl_;
};

/**
 * Detects the credentials available in the environment.
 *
 * The providers are tried in order: the emulators (if any `*_EMULATOR_HOST`
 * variable is set), a service account key named by
 * `GOOGLE_APPLICATION_CREDENTIALS`, the metadata server, the `gcloud` CLI,
 * and finally Application Default Credentials. The first provider that loads
 * and resolves a project id is used.
 *
 * This function blocks until detection completes. If the application
 * supplies a `CompletionQueueOption` it must be running.
 *
 * @returns a `kNotFound` error with reason `NO_PROVIDER_FOUND` if no provider
 *     loads.
 */
StatusOr<Auth> MakeAuth(Options opts = {});

/**
 * Creates a handle for a service account, using the contents of a JSON key
 * file.
 */
StatusOr<Auth> MakeServiceAccountAuth(std::string const& json_object,
                                      Options opts = {});

/// Creates a handle for a provider created by the application.
Auth MakeAuthFromProvider(std::shared_ptr<TokenProvider> provider,
                          ProjectId project_id, Options opts = {});

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_AUTH_H
