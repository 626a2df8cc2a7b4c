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

#ifndef GCP_AUTH_INTERNAL_AUTH_IMPL_H
#define GCP_AUTH_INTERNAL_AUTH_IMPL_H

#include "gcp_auth/auth.h"
#include "gcp_auth/background_threads.h"
#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/internal/token_cache.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * The state shared by all the copies of an `Auth` handle.
 *
 * The token cache is declared last, so it is destroyed first. That cancels
 * any refresh in progress before the background threads stop.
 */
class AuthImpl {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  /**
   * Creates the cache for @p result.
   *
   * If @p result includes a token request it becomes the first refresh.
   * @p options must contain the `Refresh*Option` values, see
   * `PopulateAuthOptions()`.
   */
  AuthImpl(std::shared_ptr<BackgroundThreads> background,
           LoadProviderResult result, Scopes scopes, Options const& options,
           CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  HeaderResult GetHeader() { return cache_->GetValid(); }
  void Revoke(bool start_new) { cache_->Revoke(start_new); }

  std::shared_ptr<AuthImpl> WithScopes(Scopes scopes) const;

  std::shared_ptr<BackgroundThreads> const& background() const {
    return background_;
  }
  std::shared_ptr<TokenProvider> const& provider() const { return provider_; }
  ProjectId const& project_id() const { return project_id_; }
  ProviderKind kind() const { return kind_; }
  std::string const& name() const { return name_; }
  Scopes const& scopes() const { return scopes_; }

 private:
  std::shared_ptr<BackgroundThreads> background_;
  std::shared_ptr<TokenProvider> provider_;
  ProjectId project_id_;
  ProviderKind kind_;
  std::string name_;
  Scopes scopes_;
  Options options_;
  CurrentTimeFn current_time_fn_;
  std::shared_ptr<TokenCache> cache_;
};

/// Runs the provider detection and creates an `Auth` handle.
StatusOr<Auth> MakeAuth(Options opts, HttpClientFactory client_factory);

/// Creates a service account handle, tests override @p client_factory.
StatusOr<Auth> MakeServiceAccountAuth(std::string const& json_object,
                                      Options opts,
                                      HttpClientFactory client_factory);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_AUTH_IMPL_H
