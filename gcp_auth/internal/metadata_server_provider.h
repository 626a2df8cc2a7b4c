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

#ifndef GCP_AUTH_INTERNAL_METADATA_SERVER_PROVIDER_H
#define GCP_AUTH_INTERNAL_METADATA_SERVER_PROVIDER_H

#include "gcp_auth/internal/http_client_factory.h"
#include "gcp_auth/internal/load_provider_result.h"
#include "gcp_auth/options.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/token_provider.h"
#include "gcp_auth/version.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// The path for access tokens of the default service account.
auto constexpr kMetadataTokenPath =
    "/computeMetadata/v1/instance/service-accounts/default/token";
auto constexpr kMetadataProjectIdPath = "/computeMetadata/v1/project/project-id";

/**
 * Obtains access tokens from the GCE metadata server.
 *
 * This is available on Compute Engine, GKE, Cloud Run, and other GCP
 * environments. The host is configured with `MetadataHostOption`. The server
 * returns tokens for the scopes configured for the VM, the scopes in each
 * request are ignored.
 */
class MetadataServerProvider
    : public TokenProvider,
      public std::enable_shared_from_this<MetadataServerProvider> {
 public:
  using CurrentTimeFn =
      std::function<std::chrono::system_clock::time_point()>;

  MetadataServerProvider(
      Options options, HttpClientFactory client_factory,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  future<StatusOr<Token>> AsyncGetToken(CompletionQueue& cq,
                                        Scopes const& scopes) override;
  ProviderKind kind() const override { return ProviderKind::kMetadataServer; }
  std::string name() const override;
  bool requires_scopes() const override { return false; }

  /// Blocking request for a new access token.
  StatusOr<Token> GetToken() const;

  /**
   * Blocking request for the project id.
   *
   * Returns a `kBadResponse` error if the server returns an empty project.
   */
  StatusOr<std::string> GetProjectId() const;

 private:
  std::string Url(char const* path) const;
  StatusOr<std::string> DoGet(std::string const& url) const;

  Options options_;
  HttpClientFactory client_factory_;
  CurrentTimeFn current_time_fn_;
};

/**
 * Probes the metadata server.
 *
 * The first token request starts concurrently with the project id request.
 * If the server cannot be reached the provider is not available.
 */
ProbeOutcome TryLoadMetadataServer(CompletionQueue& cq, Options const& options,
                                   HttpClientFactory client_factory);

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_METADATA_SERVER_PROVIDER_H
