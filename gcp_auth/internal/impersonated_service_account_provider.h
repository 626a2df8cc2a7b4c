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

#ifndef GCP_AUTH_INTERNAL_IMPERSONATED_SERVICE_ACCOUNT_PROVIDER_H
#define GCP_AUTH_INTERNAL_IMPERSONATED_SERVICE_ACCOUNT_PROVIDER_H

#include "gcp_auth/internal/authorized_user_provider.h"
#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

struct ImpersonatedServiceAccountInfo {
  AuthorizedUserInfo source_credentials;
  std::string service_account_impersonation_url;
  std::vector<std::string> delegates;
};

/**
 * Parses an `impersonated_service_account` credentials file.
 *
 * Only `authorized_user` source credentials are supported.
 */
StatusOr<ImpersonatedServiceAccountInfo>
ParseImpersonatedServiceAccountCredentials(std::string const& content,
                                           std::string const& source);

/**
 * Extracts the project from the impersonated service account email.
 *
 * For example, `.../serviceAccounts/sa@my-project.iam.gserviceaccount.com:...`
 * returns `my-project`.
 */
absl::optional<std::string> ProjectIdFromImpersonationUrl(
    std::string const& url);

/// Creates the body for a `generateAccessToken` request.
std::string MakeImpersonationRequestBody(
    std::vector<std::string> const& delegates, Scopes const& scopes);

/// Parses the `{"accessToken": ..., "expireTime": ...}` response.
StatusOr<Token> ParseImpersonationResponse(
    std::string const& payload, std::chrono::system_clock::time_point now);

/**
 * Obtains access tokens for a service account impersonated by a user.
 *
 * A token for the user is obtained from `source`, and used to call the IAM
 * Credentials `generateAccessToken` endpoint.
 *
 * @see https://cloud.google.com/iam/docs/create-short-lived-credentials-direct
 */
class ImpersonatedServiceAccountProvider
    : public TokenProvider,
      public std::enable_shared_from_this<ImpersonatedServiceAccountProvider> {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  ImpersonatedServiceAccountProvider(
      std::shared_ptr<AuthorizedUserProvider> source,
      std::string impersonation_url, std::vector<std::string> delegates,
      Options options, HttpClientFactory client_factory,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override;
  ProviderKind kind() const override {
    return ProviderKind::kImpersonatedServiceAccount;
  }
  std::string name() const override;
  bool requires_scopes() const override { return true; }

  /// Blocking request for a new access token.
  StatusOr<Token> GetToken(Scopes const& scopes) const;

 private:
  std::shared_ptr<AuthorizedUserProvider> source_;
  std::string impersonation_url_;
  std::vector<std::string> delegates_;
  Options options_;
  HttpClientFactory client_factory_;
  CurrentTimeFn current_time_fn_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_IMPERSONATED_SERVICE_ACCOUNT_PROVIDER_H
