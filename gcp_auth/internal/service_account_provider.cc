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

#include "gcp_auth/internal/service_account_provider.h"
#include "gcp_auth/internal/async_blocking.h"
#include "gcp_auth/internal/credentials_file.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/make_jwt_assertion.h"
#include "gcp_auth/log.h"
#include "absl/strings/str_cat.h"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

namespace {

enum class FieldRule { kRequired, kNonEmptyIfPresent, kOptional };

// Returns the string value of `name`, or an empty string if it is absent and
// `rule` allows that.
StatusOr<std::string> StringField(nlohmann::json const& key,
                                  std::string const& name, FieldRule rule,
                                  std::string const& source) {
  auto invalid = [&](char const* problem) {
    return CredentialShapeError(
        absl::StrCat("Invalid service account key, the ", name, " field ",
                     problem, ", on data loaded from ", source),
        GCP_AUTH_ERROR_INFO());
  };
  auto const it = key.find(name);
  if (it == key.end()) {
    if (rule == FieldRule::kRequired) return invalid("is missing");
    return std::string{};
  }
  if (!it->is_string()) return invalid("is present and is not a string");
  auto value = it->get<std::string>();
  if (value.empty() && rule != FieldRule::kOptional) return invalid("is empty");
  return value;
}

}  // namespace

StatusOr<ServiceAccountInfo> ParseServiceAccountKey(
    std::string const& content, std::string const& source,
    std::string const& default_token_uri) {
  auto const key = nlohmann::json::parse(content, nullptr, false);
  if (!key.is_object()) {
    return CredentialShapeError(
        absl::StrCat("Invalid service account key, parsing failed on data "
                     "loaded from ",
                     source),
        GCP_AUTH_ERROR_INFO());
  }

  auto const token_uri_rule = default_token_uri.empty()
                                  ? FieldRule::kRequired
                                  : FieldRule::kNonEmptyIfPresent;
  ServiceAccountInfo info;
  struct {
    char const* name;
    FieldRule rule;
    std::string* value;
  } const fields[] = {
      {"client_email", FieldRule::kRequired, &info.client_email},
      {"private_key", FieldRule::kRequired, &info.private_key},
      {"private_key_id", FieldRule::kOptional, &info.private_key_id},
      {"token_uri", token_uri_rule, &info.token_uri},
      {"project_id", FieldRule::kRequired, &info.project_id},
  };
  for (auto const& f : fields) {
    auto value = StringField(key, f.name, f.rule, source);
    if (!value) return std::move(value).status();
    *f.value = *std::move(value);
  }
  if (info.token_uri.empty()) info.token_uri = default_token_uri;
  return info;
}

std::pair<std::string, std::string> AssertionComponents(
    ServiceAccountInfo const& info, Scopes const& scopes,
    std::chrono::system_clock::time_point now) {
  nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
  if (!info.private_key_id.empty()) header["kid"] = info.private_key_id;

  // Scopes must be specified in a space separated string.
  auto scope = scopes.empty() ? std::string(scopes::kCloudPlatform)
                              : scopes.Encode();

  // Only convert to integers for the timestamps since the epoch, `time_t`
  // may be a floating point type.
  auto const expiration = now + kAccessTokenLifetime;
  auto const iat =
      static_cast<std::intmax_t>(std::chrono::system_clock::to_time_t(now));
  auto const exp = static_cast<std::intmax_t>(
      std::chrono::system_clock::to_time_t(expiration));
  nlohmann::json payload = {{"iss", info.client_email},
                            {"scope", scope},
                            {"aud", info.token_uri},
                            {"iat", iat},
                            {"exp", exp}};
  return std::make_pair(header.dump(), payload.dump());
}

StatusOr<std::vector<std::pair<std::string, std::string>>>
CreateServiceAccountRefreshPayload(ServiceAccountInfo const& info,
                                   Scopes const& scopes,
                                   std::chrono::system_clock::time_point now) {
  std::string header;
  std::string payload;
  std::tie(header, payload) = AssertionComponents(info, scopes, now);
  auto assertion = MakeJWTAssertionNoThrow(header, payload, info.private_key);
  if (!assertion) return std::move(assertion).status();
  return std::vector<std::pair<std::string, std::string>>{
      {"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
      {"assertion", *std::move(assertion)}};
}

ServiceAccountProvider::ServiceAccountProvider(ServiceAccountInfo info,
                                               Options options,
                                               HttpClientFactory client_factory,
                                               CurrentTimeFn current_time_fn)
    : info_(std::move(info)),
      options_(std::move(options)),
      client_factory_(std::move(client_factory)),
      current_time_fn_(std::move(current_time_fn)) {}

future<StatusOr<Token>> ServiceAccountProvider::AsyncGetToken(
    CompletionQueue& cq, Scopes const& scopes) {
  auto const now = current_time_fn_();
  // Signing is cheap, only the HTTP request runs in the background.
  auto form_data = CreateServiceAccountRefreshPayload(info_, scopes, now);
  if (!form_data) {
    return make_ready_future(StatusOr<Token>(std::move(form_data).status()));
  }
  auto self = shared_from_this();
  auto data = *std::move(form_data);
  return AsyncRunBlocking<Token>(cq, [self, data, now]() {
    return self->ExchangeAssertion(data, now);
  });
}

std::string ServiceAccountProvider::name() const {
  return absl::StrCat("service-account(", info_.client_email, ")");
}

StatusOr<Token> ServiceAccountProvider::ExchangeAssertion(
    std::vector<std::pair<std::string, std::string>> const& form_data,
    std::chrono::system_clock::time_point now) const {
  rest_internal::RestRequest request;
  request.SetPath(info_.token_uri);
  auto client = client_factory_(options_);
  auto payload = ReadTokenEndpointResponse(client->Post(request, form_data),
                                           info_.token_uri);
  if (!payload) return std::move(payload).status();
  return ParseAccessTokenResponse(*payload, now);
}

ProbeOutcome TryLoadServiceAccountFromEnv(Options const& options,
                                          HttpClientFactory client_factory) {
  auto path = AdcFilePathFromEnvVarOrEmpty();
  if (path.empty()) return absl::optional<LoadProviderResult>{};
  auto contents = ReadCredentialsFile(path);
  if (!contents) return std::move(contents).status();
  auto type = CredentialsFileType(*contents, path);
  if (!type) return std::move(type).status();
  if (*type != "service_account") {
    GCP_AUTH_LOG(DEBUG) << "credentials file " << path << " has type <"
                        << *type << ">, not a service account";
    return absl::optional<LoadProviderResult>{};
  }
  auto info = ParseServiceAccountKey(*contents, path);
  if (!info) return std::move(info).status();
  auto project_id = info->project_id;
  auto provider = std::make_shared<ServiceAccountProvider>(
      *std::move(info), options, std::move(client_factory));
  return absl::make_optional(LoadProviderResult{
      std::move(provider), ProjectId(std::move(project_id)), {}});
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
