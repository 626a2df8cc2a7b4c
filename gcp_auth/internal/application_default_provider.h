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

#ifndef GCP_AUTH_INTERNAL_APPLICATION_DEFAULT_PROVIDER_H
#define GCP_AUTH_INTERNAL_APPLICATION_DEFAULT_PROVIDER_H

#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/options.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Wraps the provider found by the Application Default Credentials search.
class ApplicationDefaultProvider : public TokenProvider {
 public:
  explicit ApplicationDefaultProvider(std::shared_ptr<TokenProvider> inner)
      : inner_(std::move(inner)) {}

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override {
    return inner_->AsyncGetToken(cq, scopes);
  }
  ProviderKind kind() const override {
    return ProviderKind::kApplicationDefault;
  }
  std::string name() const override;
  bool requires_scopes() const override { return inner_->requires_scopes(); }

  std::shared_ptr<TokenProvider> const& inner() const { return inner_; }

 private:
  std::shared_ptr<TokenProvider> inner_;
};

/**
 * Creates a provider from a JSON credentials file.
 *
 * Supports `service_account`, `authorized_user`, and
 * `impersonated_service_account` files. Fails if the type is not supported,
 * or if no project can be determined from the file.
 */
StatusOr<LoadProviderResult> LoadCredentialsFile(
    std::string const& contents, std::string const& source,
    Options const& options, HttpClientFactory client_factory);

/**
 * Searches for Application Default Credentials.
 *
 * In order, tries the file named by `GOOGLE_APPLICATION_CREDENTIALS`, the file
 * created by `gcloud auth application-default login`, and the metadata
 * server.
 *
 * @see https://cloud.google.com/docs/authentication/application-default-credentials
 */
ProbeOutcome TryLoadApplicationDefault(CompletionQueue& cq,
                                       Options const& options,
                                       HttpClientFactory client_factory);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_APPLICATION_DEFAULT_PROVIDER_H
