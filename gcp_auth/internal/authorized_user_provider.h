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

#ifndef GCP_AUTH_INTERNAL_AUTHORIZED_USER_PROVIDER_H
#define GCP_AUTH_INTERNAL_AUTHORIZED_USER_PROVIDER_H

#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/internal/token_endpoint.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Object to hold information used to instantiate an AuthorizedUserProvider.
struct AuthorizedUserInfo {
  std::string client_id;
  std::string client_secret;
  std::string refresh_token;
  std::string token_uri;
  absl::optional<std::string> quota_project_id;
};

/// Parses a refresh token JSON object, as created by `gcloud`.
StatusOr<AuthorizedUserInfo> ParseAuthorizedUserCredentials(
    std::string const& content, std::string const& source,
    std::string const& default_token_uri = kDefaultTokenUri);

/**
 * Obtains access tokens by exchanging a user's refresh token.
 *
 * These credentials are typically created with
 * `gcloud auth application-default login`.
 */
class AuthorizedUserProvider
    : public TokenProvider,
      public std::enable_shared_from_this<AuthorizedUserProvider> {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  AuthorizedUserProvider(
      AuthorizedUserInfo info, Options options,
      HttpClientFactory client_factory,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override;
  ProviderKind kind() const override { return ProviderKind::kAuthorizedUser; }
  std::string name() const override { return "authorized-user"; }
  bool requires_scopes() const override { return false; }

  /// Blocking request for a new access token.
  StatusOr<Token> GetToken() const;

 private:
  AuthorizedUserInfo info_;
  Options options_;
  HttpClientFactory client_factory_;
  CurrentTimeFn current_time_fn_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_AUTHORIZED_USER_PROVIDER_H
