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
#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/background_threads_impl.h"
#include "gcp_auth/testing_util/mock_rest_client.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::gcp_auth::testing_util::AuthErrorIs;
using ::gcp_auth::testing_util::MakeMockResponse;
using ::gcp_auth::testing_util::MockRestClient;
using ::gcp_auth::testing_util::StatusIs;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

using FormData = std::vector<std::pair<std::string, std::string>>;
using Payload = std::vector<absl::Span<char const>>;

auto constexpr kImpersonationUrl =
    "https://iamcredentials.googleapis.com/v1/projects/-/serviceAccounts/"
    "test-sa@test-project.iam.gserviceaccount.com:generateAccessToken";

std::chrono::system_clock::time_point FixedTime() {
  return std::chrono::system_clock::from_time_t(1700000000);
}

std::string TestCredentials() {
  return nlohmann::json{
      {"type", "impersonated_service_account"},
      {"service_account_impersonation_url", kImpersonationUrl},
      {"delegates",
       nlohmann::json::array({"d1@test-project.iam.gserviceaccount.com"})},
      {"source_credentials",
       {{"type", "authorized_user"},
        {"client_id", "test-client-id"},
        {"client_secret", "test-client-secret"},
        {"refresh_token", "test-refresh-token"}}},
  }
      .dump();
}

TEST(ParseImpersonatedServiceAccountCredentials, Success) {
  auto info =
      ParseImpersonatedServiceAccountCredentials(TestCredentials(), "test-data");
  ASSERT_STATUS_OK(info);
  EXPECT_EQ(info->service_account_impersonation_url, kImpersonationUrl);
  EXPECT_THAT(info->delegates,
              ElementsAre("d1@test-project.iam.gserviceaccount.com"));
  EXPECT_EQ(info->source_credentials.refresh_token, "test-refresh-token");
}

TEST(ParseImpersonatedServiceAccountCredentials, Invalid) {
  auto with = [](std::string const& key, nlohmann::json value) {
    auto json = nlohmann::json::parse(TestCredentials());
    if (value.is_null()) {
      json.erase(key);
    } else {
      json[key] = std::move(value);
    }
    return json.dump();
  };
  std::vector<std::string> const cases = {
      "not-json",
      with("service_account_impersonation_url", nullptr),
      with("service_account_impersonation_url", ""),
      with("delegates", "not-an-array"),
      with("delegates", nlohmann::json::array({1, 2})),
      with("source_credentials", nullptr),
      with("source_credentials", {{"type", "service_account"}}),
      with("source_credentials", {{"type", "authorized_user"}}),
  };
  for (auto const& c : cases) {
    SCOPED_TRACE("Testing with " + c);
    auto info = ParseImpersonatedServiceAccountCredentials(c, "test-data");
    EXPECT_THAT(info.status(), AuthErrorIs(AuthErrorKind::kCredentialShape));
  }
}

TEST(ProjectIdFromImpersonationUrl, Basic) {
  EXPECT_EQ(ProjectIdFromImpersonationUrl(kImpersonationUrl).value_or(""),
            "test-project");
  EXPECT_FALSE(ProjectIdFromImpersonationUrl("https://test.invalid/no-email")
                   .has_value());
  EXPECT_FALSE(ProjectIdFromImpersonationUrl("https://test.invalid/sa@.com")
                   .has_value());
  EXPECT_FALSE(
      ProjectIdFromImpersonationUrl("https://test.invalid/sa@no-dot")
          .has_value());
}

TEST(MakeImpersonationRequestBody, Basic) {
  auto body = nlohmann::json::parse(MakeImpersonationRequestBody(
      {"d1", "d2"}, Scopes{scopes::kPubSub, scopes::kCloudPlatform}));
  EXPECT_EQ(body["delegates"], nlohmann::json::array({"d1", "d2"}));
  auto const expected =
      Scopes{scopes::kPubSub, scopes::kCloudPlatform}.AsVector();
  EXPECT_EQ(body["scope"], nlohmann::json(expected));
  EXPECT_EQ(body["lifetime"], "3600s");
}

TEST(MakeImpersonationRequestBody, DefaultScope) {
  auto body = nlohmann::json::parse(MakeImpersonationRequestBody({}, Scopes{}));
  EXPECT_EQ(body["scope"], nlohmann::json::array({scopes::kCloudPlatform}));
  EXPECT_TRUE(body["delegates"].empty());
}

TEST(ParseImpersonationResponse, Success) {
  auto token = ParseImpersonationResponse(
      R"js({"accessToken": "sa-token", "expireTime": "2023-11-14T23:13:20Z"})js",
      FixedTime());
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->access_token(), "sa-token");
  EXPECT_EQ(token->acquired_at(), FixedTime());
  EXPECT_EQ(token->expiry(), FixedTime() + std::chrono::hours(1));
}

TEST(ParseImpersonationResponse, Invalid) {
  std::vector<std::string> const cases = {
      R"js(not-json)js",
      R"js({"expireTime": "2023-11-14T23:13:20Z"})js",
      R"js({"accessToken": 1, "expireTime": "2023-11-14T23:13:20Z"})js",
      R"js({"accessToken": "sa-token"})js",
      R"js({"accessToken": "sa-token", "expireTime": "tomorrow"})js",
  };
  for (auto const& c : cases) {
    SCOPED_TRACE("Testing with " + c);
    auto token = ParseImpersonationResponse(c, FixedTime());
    EXPECT_THAT(token, StatusIs(StatusCode::kInternal));
    EXPECT_THAT(token.status(), AuthErrorIs(AuthErrorKind::kBadResponse));
  }
}

std::shared_ptr<AuthorizedUserProvider> MakeSource(bool fail) {
  auto factory = [fail](Options const&) {
    auto client = absl::make_unique<MockRestClient>();
    EXPECT_CALL(*client, Post(_, ::testing::An<FormData const&>()))
        .WillOnce([fail](rest_internal::RestRequest const&, FormData const&) {
          if (fail) {
            return MakeMockResponse(rest_internal::kBadRequest,
                                    R"js({"error": "invalid_grant"})js");
          }
          return MakeMockResponse(
              rest_internal::kOk,
              R"js({"access_token": "user-token", "expires_in": 3600})js");
        });
    return std::unique_ptr<rest_internal::RestClient>(std::move(client));
  };
  return std::make_shared<AuthorizedUserProvider>(
      AuthorizedUserInfo{"a", "b", "c", "https://test.invalid/token",
                         absl::nullopt},
      Options{}, factory, FixedTime);
}

TEST(ImpersonatedServiceAccountProvider, AsyncGetToken) {
  auto factory = [](Options const&) {
    auto client = absl::make_unique<MockRestClient>();
    EXPECT_CALL(*client, Post(_, ::testing::An<Payload const&>()))
        .WillOnce([](rest_internal::RestRequest const& request,
                     Payload const& payload) {
          EXPECT_EQ(request.path(), kImpersonationUrl);
          EXPECT_THAT(request.GetHeader("authorization"),
                      ElementsAre("Bearer user-token"));
          std::string body;
          for (auto const& p : payload) body.append(p.begin(), p.end());
          auto json = nlohmann::json::parse(body);
          EXPECT_EQ(json["scope"], nlohmann::json::array({scopes::kPubSub}));
          EXPECT_EQ(json["delegates"], nlohmann::json::array({"d1"}));
          return MakeMockResponse(
              rest_internal::kOk,
              R"js({"accessToken": "sa-token",
                    "expireTime": "2023-11-14T23:13:20Z"})js");
        });
    return std::unique_ptr<rest_internal::RestClient>(std::move(client));
  };
  auto provider = std::make_shared<ImpersonatedServiceAccountProvider>(
      MakeSource(false), kImpersonationUrl, std::vector<std::string>{"d1"},
      Options{}, factory, FixedTime);
  EXPECT_EQ(provider->kind(), ProviderKind::kImpersonatedServiceAccount);
  EXPECT_TRUE(provider->requires_scopes());
  EXPECT_THAT(provider->name(), HasSubstr("test-sa@test-project"));

  AutomaticallyCreatedBackgroundThreads background;
  auto cq = background.cq();
  auto token = provider->AsyncGetToken(cq, Scopes{scopes::kPubSub}).get();
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->access_token(), "sa-token");
}

TEST(ImpersonatedServiceAccountProvider, SourceFailure) {
  auto factory = [](Options const&) {
    ADD_FAILURE() << "unexpected generateAccessToken request";
    return std::unique_ptr<rest_internal::RestClient>(
        absl::make_unique<MockRestClient>());
  };
  auto provider = std::make_shared<ImpersonatedServiceAccountProvider>(
      MakeSource(true), kImpersonationUrl, std::vector<std::string>{},
      Options{}, factory, FixedTime);
  auto token = provider->GetToken(Scopes{});
  EXPECT_THAT(token, StatusIs(StatusCode::kInvalidArgument,
                              HasSubstr("invalid_grant")));
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
