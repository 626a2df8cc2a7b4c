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

#include "gcp_auth/internal/impersonated_service_account_provider.h"
#include "gcp_auth/internal/async_blocking.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/parse_rfc3339.h"
#include "gcp_auth/internal/token_endpoint.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include <nlohmann/json.hpp>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

StatusOr<ImpersonatedServiceAccountInfo>
ParseImpersonatedServiceAccountCredentials(std::string const& content,
                                           std::string const& source) {
  auto credentials = nlohmann::json::parse(content, nullptr, false);
  if (!credentials.is_object()) {
    return CredentialShapeError(
        "Invalid ImpersonatedServiceAccountCredentials, parsing failed on "
        "data from " + source,
        GCP_AUTH_ERROR_INFO());
  }
  auto url = credentials.find("service_account_impersonation_url");
  if (url == credentials.end() || !url->is_string() ||
      url->get<std::string>().empty()) {
    return CredentialShapeError(
        "Invalid ImpersonatedServiceAccountCredentials, the "
        "service_account_impersonation_url field is missing or invalid on "
        "data loaded from " + source,
        GCP_AUTH_ERROR_INFO());
  }

  std::vector<std::string> delegates;
  auto d = credentials.find("delegates");
  if (d != credentials.end() && !d->is_null()) {
    if (!d->is_array()) {
      return CredentialShapeError(
          "Invalid ImpersonatedServiceAccountCredentials, the delegates "
          "field is not an array on data loaded from " + source,
          GCP_AUTH_ERROR_INFO());
    }
    for (auto const& e : *d) {
      if (!e.is_string()) {
        return CredentialShapeError(
            "Invalid ImpersonatedServiceAccountCredentials, the delegates "
            "field contains a non-string value on data loaded from " + source,
            GCP_AUTH_ERROR_INFO());
      }
      delegates.push_back(e.get<std::string>());
    }
  }

  auto s = credentials.find("source_credentials");
  if (s == credentials.end() || !s->is_object()) {
    return CredentialShapeError(
        "Invalid ImpersonatedServiceAccountCredentials, the "
        "source_credentials field is missing or invalid on data loaded "
        "from " + source,
        GCP_AUTH_ERROR_INFO());
  }
  auto const type = s->value("type", "authorized_user");
  if (type != "authorized_user") {
    return CredentialShapeError(
        "Unsupported source_credentials type (" + type +
            ") in impersonated service account credentials loaded from " +
            source,
        GCP_AUTH_ERROR_INFO());
  }
  auto user = ParseAuthorizedUserCredentials(s->dump(), source);
  if (!user) return std::move(user).status();
  return ImpersonatedServiceAccountInfo{
      *std::move(user), url->get<std::string>(), std::move(delegates)};
}

absl::optional<std::string> ProjectIdFromImpersonationUrl(
    std::string const& url) {
  auto start = url.find('@');
  if (start == std::string::npos) return absl::nullopt;
  ++start;
  auto end = url.find('.', start);
  if (end == std::string::npos || end == start) return absl::nullopt;
  return url.substr(start, end - start);
}

std::string MakeImpersonationRequestBody(
    std::vector<std::string> const& delegates, Scopes const& scopes) {
  auto scope = scopes.empty()
                   ? std::vector<std::string>{scopes::kCloudPlatform}
                   : scopes.AsVector();
  nlohmann::json payload{
      {"delegates", delegates},
      {"scope", scope},
      {"lifetime", std::to_string(kAccessTokenLifetime.count()) + "s"},
  };
  return payload.dump();
}

StatusOr<Token> ParseImpersonationResponse(
    std::string const& payload, std::chrono::system_clock::time_point now) {
  auto parsed = nlohmann::json::parse(payload, nullptr, false);
  if (!parsed.is_object()) {
    return BadResponseError("cannot parse response as a JSON object",
                            GCP_AUTH_ERROR_INFO());
  }
  auto token = parsed.find("accessToken");
  if (token == parsed.end() || !token->is_string()) {
    return BadResponseError(
        "missing or invalid `accessToken` field in generateAccessToken "
        "response",
        GCP_AUTH_ERROR_INFO());
  }
  auto expire_time = parsed.find("expireTime");
  if (expire_time == parsed.end() || !expire_time->is_string()) {
    return BadResponseError(
        "missing or invalid `expireTime` field in generateAccessToken "
        "response",
        GCP_AUTH_ERROR_INFO());
  }
  auto expiry = ParseRfc3339(expire_time->get<std::string>());
  if (!expiry) {
    return BadResponseError(
        "invalid format for `expireTime` field in generateAccessToken "
        "response: " + expiry.status().message(),
        GCP_AUTH_ERROR_INFO());
  }
  return Token::Create(token->get<std::string>(), now, *expiry);
}

ImpersonatedServiceAccountProvider::ImpersonatedServiceAccountProvider(
    std::shared_ptr<AuthorizedUserProvider> source,
    std::string impersonation_url, std::vector<std::string> delegates,
    Options options, HttpClientFactory client_factory,
    CurrentTimeFn current_time_fn)
    : source_(std::move(source)),
      impersonation_url_(std::move(impersonation_url)),
      delegates_(std::move(delegates)),
      options_(std::move(options)),
      client_factory_(std::move(client_factory)),
      current_time_fn_(std::move(current_time_fn)) {}

future<StatusOr<Token>> ImpersonatedServiceAccountProvider::AsyncGetToken(
    CompletionQueue& cq, Scopes const& scopes) {
  auto self = shared_from_this();
  return AsyncRunBlocking<Token>(
      cq, [self, scopes] { return self->GetToken(scopes); });
}

std::string ImpersonatedServiceAccountProvider::name() const {
  return absl::StrCat("impersonated-service-account(", impersonation_url_,
                      ")");
}

StatusOr<Token> ImpersonatedServiceAccountProvider::GetToken(
    Scopes const& scopes) const {
  auto source_token = source_->GetToken();
  if (!source_token) return std::move(source_token).status();

  auto const now = current_time_fn_();
  rest_internal::RestRequest request;
  request.SetPath(impersonation_url_);
  request.AddHeader("authorization", source_token->authorization_header());
  request.AddHeader("content-type", "application/json");
  auto const body = MakeImpersonationRequestBody(delegates_, scopes);
  auto client = client_factory_(options_);
  auto payload = ReadTokenEndpointResponse(
      client->Post(request, std::vector<absl::Span<char const>>{
                                absl::MakeConstSpan(body)}),
      impersonation_url_);
  if (!payload) return std::move(payload).status();
  return ParseImpersonationResponse(*payload, now);
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
