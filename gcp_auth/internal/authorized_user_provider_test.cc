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
#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/background_threads_impl.h"
#include "gcp_auth/testing_util/mock_rest_client.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include "gcp_auth/testing_util/test_keys.h"
#include <gmock/gmock.h>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::gcp_auth::testing_util::AuthErrorIs;
using ::gcp_auth::testing_util::MakeMockResponse;
using ::gcp_auth::testing_util::MakeTestAuthorizedUserFile;
using ::gcp_auth::testing_util::MockRestClient;
using ::gcp_auth::testing_util::StatusIs;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

using FormData = std::vector<std::pair<std::string, std::string>>;

std::chrono::system_clock::time_point FixedTime() {
  return std::chrono::system_clock::from_time_t(1700000000);
}

TEST(ParseAuthorizedUserCredentials, Success) {
  auto info = ParseAuthorizedUserCredentials(
      MakeTestAuthorizedUserFile("test-quota-project"), "test-data");
  ASSERT_STATUS_OK(info);
  EXPECT_EQ(info->client_id, "test-client-id");
  EXPECT_EQ(info->client_secret, "test-client-secret");
  EXPECT_EQ(info->refresh_token, "test-refresh-token");
  EXPECT_EQ(info->token_uri, "https://oauth2.googleapis.com/token");
  EXPECT_EQ(info->quota_project_id.value_or(""), "test-quota-project");
}

TEST(ParseAuthorizedUserCredentials, TokenUriOverride) {
  auto const contents = R"js({
      "client_id": "a", "client_secret": "b", "refresh_token": "c",
      "token_uri": "https://test.invalid/token"})js";
  auto info = ParseAuthorizedUserCredentials(contents, "test-data");
  ASSERT_STATUS_OK(info);
  EXPECT_EQ(info->token_uri, "https://test.invalid/token");
  EXPECT_FALSE(info->quota_project_id.has_value());
}

TEST(ParseAuthorizedUserCredentials, Invalid) {
  std::vector<std::string> const cases = {
      R"js(not-json)js",
      R"js({"client_secret": "b", "refresh_token": "c"})js",
      R"js({"client_id": "a", "refresh_token": "c"})js",
      R"js({"client_id": "a", "client_secret": "b"})js",
      R"js({"client_id": "", "client_secret": "b", "refresh_token": "c"})js",
      R"js({"client_id": 7, "client_secret": "b", "refresh_token": "c"})js",
      R"js({"client_id": "a", "client_secret": "b", "refresh_token": "c",
            "token_uri": true})js",
  };
  for (auto const& c : cases) {
    SCOPED_TRACE("Testing with " + c);
    auto info = ParseAuthorizedUserCredentials(c, "test-data");
    EXPECT_THAT(info, StatusIs(StatusCode::kInvalidArgument,
                               HasSubstr("test-data")));
    EXPECT_THAT(info.status(), AuthErrorIs(AuthErrorKind::kCredentialShape));
  }
}

AuthorizedUserInfo TestInfo() {
  return AuthorizedUserInfo{"test-client-id", "test-client-secret",
                            "test-refresh-token",
                            "https://test.invalid/token", absl::nullopt};
}

TEST(AuthorizedUserProvider, AsyncGetToken) {
  auto factory = [](Options const&) {
    auto client = absl::make_unique<MockRestClient>();
    EXPECT_CALL(*client, Post(_, ::testing::An<FormData const&>()))
        .WillOnce([](rest_internal::RestRequest const& request,
                     FormData const& form) {
          EXPECT_EQ(request.path(), "https://test.invalid/token");
          EXPECT_THAT(form, UnorderedElementsAre(
                                Pair("grant_type", "refresh_token"),
                                Pair("client_id", "test-client-id"),
                                Pair("client_secret", "test-client-secret"),
                                Pair("refresh_token", "test-refresh-token")));
          return MakeMockResponse(
              rest_internal::kOk,
              R"js({"access_token": "user-token", "expires_in": 1800,
                    "token_type": "Bearer"})js");
        });
    return std::unique_ptr<rest_internal::RestClient>(std::move(client));
  };
  auto provider = std::make_shared<AuthorizedUserProvider>(
      TestInfo(), Options{}, factory, FixedTime);
  EXPECT_EQ(provider->kind(), ProviderKind::kAuthorizedUser);
  EXPECT_EQ(provider->name(), "authorized-user");
  EXPECT_FALSE(provider->requires_scopes());

  AutomaticallyCreatedBackgroundThreads background;
  auto cq = background.cq();
  auto token = provider->AsyncGetToken(cq, Scopes{}).get();
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->access_token(), "user-token");
  EXPECT_EQ(token->expiry(), FixedTime() + std::chrono::seconds(1800));
}

TEST(AuthorizedUserProvider, RevokedRefreshToken) {
  auto factory = [](Options const&) {
    auto client = absl::make_unique<MockRestClient>();
    EXPECT_CALL(*client, Post(_, ::testing::An<FormData const&>()))
        .WillOnce([](rest_internal::RestRequest const&, FormData const&) {
          return MakeMockResponse(
              rest_internal::kBadRequest,
              R"js({"error": "invalid_grant",
                    "error_description": "Token has been expired or revoked."})js");
        });
    return std::unique_ptr<rest_internal::RestClient>(std::move(client));
  };
  auto provider = std::make_shared<AuthorizedUserProvider>(
      TestInfo(), Options{}, factory, FixedTime);
  auto token = provider->GetToken();
  EXPECT_THAT(token, StatusIs(StatusCode::kInvalidArgument,
                              HasSubstr("invalid_grant")));
  EXPECT_THAT(token.status(), AuthErrorIs(AuthErrorKind::kTokenEndpoint));
  EXPECT_TRUE(IsFatalAuthError(token.status()));
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
