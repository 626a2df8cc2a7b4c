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

#include "gcp_auth/internal/authorized_user_provider.h"
#include "gcp_auth/internal/async_blocking.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "absl/strings/str_cat.h"
#include <nlohmann/json.hpp>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

namespace {

// Copies the string field `name` into `out`. Absent optional fields leave
// `out` unchanged.
Status ReadStringField(nlohmann::json const& credentials,
                       std::string const& name, bool required,
                       std::string const& source, std::string& out) {
  auto error = [&](char const* problem) {
    return CredentialShapeError(
        absl::StrCat("Invalid AuthorizedUserCredentials, the ", name,
                     " field ", problem, " on data loaded from ", source),
        GCP_AUTH_ERROR_INFO());
  };
  auto const it = credentials.find(name);
  if (it == credentials.end()) {
    return required ? error("is missing") : Status{};
  }
  if (!it->is_string()) return error("is not a string");
  auto value = it->get<std::string>();
  if (required && value.empty()) return error("is empty");
  out = std::move(value);
  return Status{};
}

}  // namespace

StatusOr<AuthorizedUserInfo> ParseAuthorizedUserCredentials(
    std::string const& content, std::string const& source,
    std::string const& default_token_uri) {
  auto const credentials = nlohmann::json::parse(content, nullptr, false);
  if (!credentials.is_object()) {
    return CredentialShapeError(
        absl::StrCat("Invalid AuthorizedUserCredentials, parsing failed on "
                     "data from ",
                     source),
        GCP_AUTH_ERROR_INFO());
  }

  AuthorizedUserInfo info;
  // Files created by gcloud may not have a "token_uri" attribute.
  info.token_uri = default_token_uri;
  std::string quota_project;
  struct {
    char const* name;
    bool required;
    std::string* out;
  } const fields[] = {
      {"client_id", true, &info.client_id},
      {"client_secret", true, &info.client_secret},
      {"refresh_token", true, &info.refresh_token},
      {"token_uri", false, &info.token_uri},
      {"quota_project_id", false, &quota_project},
  };
  for (auto const& f : fields) {
    auto status =
        ReadStringField(credentials, f.name, f.required, source, *f.out);
    if (!status.ok()) return status;
  }
  if (!quota_project.empty()) info.quota_project_id = std::move(quota_project);
  return info;
}

AuthorizedUserProvider::AuthorizedUserProvider(AuthorizedUserInfo info,
                                               Options options,
                                               HttpClientFactory client_factory,
                                               CurrentTimeFn current_time_fn)
    : info_(std::move(info)),
      options_(std::move(options)),
      client_factory_(std::move(client_factory)),
      current_time_fn_(std::move(current_time_fn)) {}

future<StatusOr<Token>> AuthorizedUserProvider::AsyncGetToken(
    CompletionQueue& cq, Scopes const&) {
  auto self = shared_from_this();
  return AsyncRunBlocking<Token>(cq, [self] { return self->GetToken(); });
}

StatusOr<Token> AuthorizedUserProvider::GetToken() const {
  auto const now = current_time_fn_();
  std::vector<std::pair<std::string, std::string>> const form_data = {
      {"grant_type", "refresh_token"},
      {"client_id", info_.client_id},
      {"client_secret", info_.client_secret},
      {"refresh_token", info_.refresh_token},
  };
  auto client = client_factory_(options_);
  auto payload = ReadTokenEndpointResponse(
      client->Post(rest_internal::RestRequest(info_.token_uri), form_data),
      info_.token_uri);
  if (!payload) return std::move(payload).status();
  return ParseAccessTokenResponse(*payload, now);
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
