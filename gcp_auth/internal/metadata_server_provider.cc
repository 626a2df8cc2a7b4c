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

#include "gcp_auth/internal/metadata_server_provider.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/internal/async_blocking.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/token_endpoint.h"
#include "gcp_auth/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

MetadataServerProvider::MetadataServerProvider(Options options,
                                               HttpClientFactory client_factory,
                                               CurrentTimeFn current_time_fn)
    : options_(std::move(options)),
      client_factory_(std::move(client_factory)),
      current_time_fn_(std::move(current_time_fn)) {}

future<StatusOr<Token>> MetadataServerProvider::AsyncGetToken(
    CompletionQueue& cq, Scopes const&) {
  auto self = shared_from_this();
  return AsyncRunBlocking<Token>(cq, [self] { return self->GetToken(); });
}

std::string MetadataServerProvider::name() const {
  return absl::StrCat("metadata-server(",
                      options_.get<MetadataHostOption>(), ")");
}

StatusOr<Token> MetadataServerProvider::GetToken() const {
  auto const now = current_time_fn_();
  auto payload = DoGet(Url(kMetadataTokenPath));
  if (!payload) return std::move(payload).status();
  return ParseAccessTokenResponse(*payload, now);
}

StatusOr<std::string> MetadataServerProvider::GetProjectId() const {
  auto const url = Url(kMetadataProjectIdPath);
  auto payload = DoGet(url);
  if (!payload) return std::move(payload).status();
  auto project_id = std::string(absl::StripAsciiWhitespace(*payload));
  if (project_id.empty()) {
    return BadResponseError(
        "the metadata server returned an empty project id",
        GCP_AUTH_ERROR_INFO().WithMetadata(kUriKey, url));
  }
  return project_id;
}

std::string MetadataServerProvider::Url(char const* path) const {
  return absl::StrCat("http://", options_.get<MetadataHostOption>(), path);
}

StatusOr<std::string> MetadataServerProvider::DoGet(
    std::string const& url) const {
  rest_internal::RestRequest request;
  request.SetPath(url);
  request.AddHeader("metadata-flavor", "Google");
  auto client = client_factory_(options_);
  return ReadTokenEndpointResponse(client->Get(request), url);
}

ProbeOutcome TryLoadMetadataServer(CompletionQueue& cq, Options const& options,
                                   HttpClientFactory client_factory) {
  auto provider =
      std::make_shared<MetadataServerProvider>(options, std::move(client_factory));
  auto token = provider->AsyncGetToken(cq, Scopes{});
  auto project_id = provider->GetProjectId();
  if (!project_id) {
    token.cancel();
    if (IsConnectError(project_id.status())) {
      GCP_AUTH_LOG(DEBUG) << "metadata server not reachable: "
                          << project_id.status();
      return absl::optional<LoadProviderResult>{};
    }
    return std::move(project_id).status();
  }
  return absl::make_optional(LoadProviderResult{
      std::move(provider), ProjectId(*std::move(project_id)), std::move(token)});
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
