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
#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/make_status.h"
#include "gcp_auth/testing_util/mock_rest_client.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <string>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::gcp_auth::testing_util::AuthErrorIs;
using ::gcp_auth::testing_util::IsOkAndHolds;
using ::gcp_auth::testing_util::MakeMockResponse;
using ::gcp_auth::testing_util::StatusIs;
using ::testing::HasSubstr;

auto constexpr kUri = "https://test.invalid/token";

TEST(ParseAccessTokenResponse, Success) {
  auto const now = std::chrono::system_clock::now();
  auto token = ParseAccessTokenResponse(
      R"js({"access_token": "at-1", "expires_in": 3600,
            "token_type": "Bearer"})js",
      now);
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->access_token(), "at-1");
  EXPECT_EQ(token->acquired_at(), now);
  EXPECT_EQ(token->expiry(), now + std::chrono::seconds(3600));
  EXPECT_EQ(token->authorization_header(), "Bearer at-1");
}

TEST(ParseAccessTokenResponse, ShortLivedTokensAreInvalid) {
  auto const now = std::chrono::system_clock::now();
  auto zero = ParseAccessTokenResponse(
      R"js({"access_token": "at-1", "expires_in": 0})js", now);
  ASSERT_STATUS_OK(zero);
  EXPECT_FALSE(zero->IsValid(now));

  auto skew = ParseAccessTokenResponse(
      R"js({"access_token": "at-1", "expires_in": 60})js", now);
  ASSERT_STATUS_OK(skew);
  EXPECT_FALSE(skew->IsValid(now));
}

TEST(ParseAccessTokenResponse, LongLivedToken) {
  auto const now = std::chrono::system_clock::now();
  auto const ten_years = std::chrono::hours(24 * 365 * 10);
  auto token = ParseAccessTokenResponse(
      R"js({"access_token": "at-1", "expires_in": )js" +
          std::to_string(std::chrono::seconds(ten_years).count()) + "}",
      now);
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->expiry(), now + ten_years);
}

TEST(ParseAccessTokenResponse, Errors) {
  auto const now = std::chrono::system_clock::now();
  for (std::string const payload : {
           "not-json",
           R"js(["access_token", "expires_in"])js",
           R"js({"expires_in": 3600})js",
           R"js({"access_token": 42, "expires_in": 3600})js",
           R"js({"access_token": "at-1"})js",
           R"js({"access_token": "at-1", "expires_in": "3600"})js",
           R"js({"access_token": "at-1", "expires_in": -1})js",
           R"js({"access_token": "at-1", "expires_in": 1.5})js",
           R"js({"access_token": "at-1", "expires_in": 10000000000000})js",
           R"js({"access_token": "at-1",
                 "expires_in": 18446744073709551615})js",
       }) {
    SCOPED_TRACE("Testing with " + payload);
    auto token = ParseAccessTokenResponse(payload, now);
    EXPECT_THAT(token, StatusIs(StatusCode::kInternal));
    EXPECT_THAT(token.status(), AuthErrorIs(AuthErrorKind::kBadResponse));
    EXPECT_TRUE(IsFatalAuthError(token.status()));
  }
}

TEST(ParseAccessTokenResponse, InvalidTokenShape) {
  auto const now = std::chrono::system_clock::now();
  auto token = ParseAccessTokenResponse(
      R"js({"access_token": "at\n1", "expires_in": 3600})js", now);
  EXPECT_THAT(token.status(), AuthErrorIs(AuthErrorKind::kInvalidTokenShape));
}

TEST(ReadTokenEndpointResponse, Success) {
  auto payload = ReadTokenEndpointResponse(
      MakeMockResponse(rest_internal::kOk, "the-payload"), kUri);
  EXPECT_THAT(payload, IsOkAndHolds("the-payload"));
}

TEST(ReadTokenEndpointResponse, HttpError) {
  auto payload = ReadTokenEndpointResponse(
      MakeMockResponse(rest_internal::kBadRequest,
                       R"js({"error": "invalid_grant"})js"),
      kUri);
  EXPECT_THAT(payload,
              StatusIs(StatusCode::kInvalidArgument,
                       "https://test.invalid/token - 400: invalid_grant"));
  EXPECT_THAT(payload.status(), AuthErrorIs(AuthErrorKind::kTokenEndpoint));
  EXPECT_TRUE(IsFatalAuthError(payload.status()));
}

TEST(ReadTokenEndpointResponse, TransportError) {
  auto payload = ReadTokenEndpointResponse(
      UnavailableError("cannot connect", GCP_AUTH_ERROR_INFO()), kUri);
  EXPECT_THAT(payload,
              StatusIs(StatusCode::kUnavailable, HasSubstr("cannot connect")));
  EXPECT_THAT(payload.status(), AuthErrorIs(AuthErrorKind::kTransport));
  EXPECT_FALSE(IsFatalAuthError(payload.status()));
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
