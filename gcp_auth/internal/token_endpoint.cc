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

#include "gcp_auth/internal/token_endpoint.h"
#include "gcp_auth/internal/make_auth_error.h"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

// Larger values overflow `system_clock::time_point` on some platforms. No
// token endpoint issues tokens valid for anywhere near this long.
auto constexpr kMaxExpiresIn = std::chrono::hours(24 * 365 * 100);

}  // namespace

StatusOr<std::string> ReadTokenEndpointResponse(
    StatusOr<std::unique_ptr<rest_internal::RestResponse>> response,
    std::string const& uri) {
  if (!response) {
    return TransportError(response.status(), uri, GCP_AUTH_ERROR_INFO());
  }
  auto& r = **response;
  if (rest_internal::IsHttpError(r)) {
    auto const code = r.StatusCode();
    return TokenEndpointError(uri, code, std::move(r).ExtractPayload(),
                              GCP_AUTH_ERROR_INFO());
  }
  return std::move(r).ExtractPayload();
}

StatusOr<Token> ParseAccessTokenResponse(
    std::string const& payload, std::chrono::system_clock::time_point now) {
  auto json = nlohmann::json::parse(payload, nullptr, false);
  if (!json.is_object()) {
    return BadResponseError(
        "the token response is not a JSON object: " + payload,
        GCP_AUTH_ERROR_INFO());
  }
  auto token = json.find("access_token");
  if (token == json.end() || !token->is_string()) {
    return BadResponseError(
        "the token response does not contain a valid `access_token` field",
        GCP_AUTH_ERROR_INFO());
  }
  // Values that do not fit in `std::int64_t` read back as negative numbers.
  auto expires_in = json.find("expires_in");
  auto const seconds = expires_in != json.end() &&
                               expires_in->is_number_integer()
                           ? expires_in->get<std::int64_t>()
                           : -1;
  if (seconds < 0 || seconds > kMaxExpiresIn.count()) {
    return BadResponseError(
        "the token response does not contain a valid `expires_in` field",
        GCP_AUTH_ERROR_INFO());
  }
  auto const expiry = now + std::chrono::seconds(seconds);
  return Token::Create(token->get<std::string>(), now, expiry);
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
