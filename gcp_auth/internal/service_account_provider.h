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

#ifndef GCP_AUTH_INTERNAL_SERVICE_ACCOUNT_PROVIDER_H
#define GCP_AUTH_INTERNAL_SERVICE_ACCOUNT_PROVIDER_H

#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/internal/token_endpoint.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Object to hold information used to instantiate a `ServiceAccountProvider`.
struct ServiceAccountInfo {
  std::string client_email;
  std::string private_key_id;
  std::string private_key;
  std::string token_uri;
  std::string project_id;
};

/**
 * Parses the contents of a JSON service account key file.
 *
 * The `client_email`, `private_key`, `project_id`, and `token_uri` fields are
 * required. Application default credentials files created by `gcloud` may not
 * include a `token_uri` field: pass a non-empty @p default_token_uri to accept
 * such files.
 *
 * Errors are reported as `kCredentialShape` errors.
 */
StatusOr<ServiceAccountInfo> ParseServiceAccountKey(
    std::string const& content, std::string const& source,
    std::string const& default_token_uri = {});

/**
 * Returns the JWT header and payload for an access token request.
 *
 * If @p scopes is empty the `cloud-platform` scope is used.
 */
std::pair<std::string, std::string> AssertionComponents(
    ServiceAccountInfo const& info, Scopes const& scopes,
    std::chrono::system_clock::time_point now);

/// The form data for an access token request, including the signed JWT.
StatusOr<std::vector<std::pair<std::string, std::string>>>
CreateServiceAccountRefreshPayload(ServiceAccountInfo const& info,
                                   Scopes const& scopes,
                                   std::chrono::system_clock::time_point now);

/**
 * Obtains access tokens for a service account using a JWT bearer grant.
 *
 * Each token request creates a JWT signed with the service account private
 * key and exchanges it for an access token at the `token_uri` endpoint.
 *
 * @see https://developers.google.com/identity/protocols/oauth2/service-account
 */
class ServiceAccountProvider
    : public TokenProvider,
      public std::enable_shared_from_this<ServiceAccountProvider> {
 public:
  /**
   * Creates an instance of ServiceAccountProvider.
   *
   * @p current_time_fn is used in the claims and to compute the expiration;
   * tests override it.
   */
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  ServiceAccountProvider(
      ServiceAccountInfo info, Options options,
      HttpClientFactory client_factory,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override;
  ProviderKind kind() const override { return ProviderKind::kServiceAccount; }
  std::string name() const override;
  bool requires_scopes() const override { return true; }

  std::string const& client_email() const { return info_.client_email; }
  std::string const& project_id() const { return info_.project_id; }

 private:
  StatusOr<Token> ExchangeAssertion(
      std::vector<std::pair<std::string, std::string>> const& form_data,
      std::chrono::system_clock::time_point now) const;

  ServiceAccountInfo info_;
  Options options_;
  HttpClientFactory client_factory_;
  CurrentTimeFn current_time_fn_;
};

/**
 * Loads a service account from the file named by
 * `GOOGLE_APPLICATION_CREDENTIALS`.
 *
 * The provider is not available if the variable is unset, or if the file
 * contains other types of credentials.
 */
ProbeOutcome TryLoadServiceAccountFromEnv(Options const& options,
                                          HttpClientFactory client_factory);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_SERVICE_ACCOUNT_PROVIDER_H
