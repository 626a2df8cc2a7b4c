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

#include "gcp_auth/internal/auth_service.h"
#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/testing_util/mock_http_service.h"
#include "gcp_auth/testing_util/mock_rest_client.h"
#include "gcp_auth/testing_util/mock_token_provider.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <atomic>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::gcp_auth::testing_util::AuthErrorIs;
using ::gcp_auth::testing_util::MakeMockResponse;
using ::gcp_auth::testing_util::MockHttpService;
using ::gcp_auth::testing_util::MockTokenProvider;
using ::gcp_auth::testing_util::StatusIs;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

using ResponseType = StatusOr<std::unique_ptr<RestResponse>>;

// A provider returning `token-1`, `token-2`, ... on each call.
std::shared_ptr<MockTokenProvider> CountingProvider(
    std::shared_ptr<std::atomic<int>> calls) {
  auto provider = std::make_shared<NiceMock<MockTokenProvider>>();
  ON_CALL(*provider, name).WillByDefault(Return("mock-provider"));
  ON_CALL(*provider, kind)
      .WillByDefault(Return(ProviderKind::kServiceAccount));
  ON_CALL(*provider, AsyncGetToken)
      .WillByDefault([calls](CompletionQueue&, Scopes const&) {
        auto const n = ++*calls;
        auto const now = std::chrono::system_clock::now();
        return make_ready_future(Token::Create("token-" + std::to_string(n),
                                               now,
                                               now + std::chrono::hours(1)));
      });
  return provider;
}

Auth TestAuth(std::shared_ptr<TokenProvider> provider) {
  return MakeAuthFromProvider(std::move(provider), ProjectId("test-project"));
}

RestRequest Request() {
  RestRequest request;
  request.SetPath("https://test.invalid/v1/items");
  return request;
}

TEST(AuthService, AddsAuthorizationHeader) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto mock = std::make_shared<MockHttpService>();
  EXPECT_CALL(*mock, AsyncCall)
      .Times(2)
      .WillRepeatedly([](CompletionQueue&, HttpMethod,
                         RestRequest const& request, std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return make_ready_future(ResponseType(MakeMockResponse(kOk, "ok")));
      });
  AuthService service(mock, TestAuth(CountingProvider(calls)));
  CompletionQueue cq;

  // The first call waits for the initial refresh, the second uses the cache.
  for (int i = 0; i != 2; ++i) {
    auto response =
        service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
    ASSERT_STATUS_OK(response);
    EXPECT_EQ((*response)->StatusCode(), kOk);
  }
  EXPECT_EQ(calls->load(), 1);
}

TEST(AuthService, UnauthorizedRevokes) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto mock = std::make_shared<MockHttpService>();
  ::testing::InSequence sequence;
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return make_ready_future(
            ResponseType(MakeMockResponse(kUnauthorized, "expired")));
      });
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-2"));
        return make_ready_future(ResponseType(MakeMockResponse(kOk, "ok")));
      });
  AuthService service(mock, TestAuth(CountingProvider(calls)));
  CompletionQueue cq;

  // The 401 response is returned unchanged, the request is not retried.
  auto response = service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), kUnauthorized);

  response = service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), kOk);
  EXPECT_EQ(calls->load(), 2);
}

TEST(AuthService, ForbiddenRevokes) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto mock = std::make_shared<MockHttpService>();
  ::testing::InSequence sequence;
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return make_ready_future(
            ResponseType(MakeMockResponse(kForbidden, "denied")));
      });
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-2"));
        return make_ready_future(ResponseType(MakeMockResponse(kOk, "ok")));
      });
  AuthService service(mock, TestAuth(CountingProvider(calls)));
  CompletionQueue cq;

  auto response = service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), kForbidden);

  response = service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), kOk);
  EXPECT_EQ(calls->load(), 2);
}

TEST(AuthService, NotFoundDoesNotRevoke) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto mock = std::make_shared<MockHttpService>();
  ::testing::InSequence sequence;
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return make_ready_future(
            ResponseType(MakeMockResponse(kNotFound, "no such item")));
      });
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return make_ready_future(
            ResponseType(MakeMockResponse(kBadRequest, "bad request")));
      });
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const& request,
                   std::string const&) {
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return make_ready_future(ResponseType(MakeMockResponse(kOk, "ok")));
      });
  AuthService service(mock, TestAuth(CountingProvider(calls)));
  CompletionQueue cq;

  for (auto expected : {kNotFound, kBadRequest, kOk}) {
    auto response =
        service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
    ASSERT_STATUS_OK(response);
    EXPECT_EQ((*response)->StatusCode(), expected);
  }
  EXPECT_EQ(calls->load(), 1);
}

TEST(AuthService, RefreshFailure) {
  auto provider = std::make_shared<NiceMock<MockTokenProvider>>();
  ON_CALL(*provider, name).WillByDefault(Return("mock-provider"));
  ON_CALL(*provider, AsyncGetToken)
      .WillByDefault([](CompletionQueue&, Scopes const&) {
        return make_ready_future(StatusOr<Token>(internal::CredentialShapeError(
            "the key is malformed", GCP_AUTH_ERROR_INFO())));
      });
  auto mock = std::make_shared<MockHttpService>();
  EXPECT_CALL(*mock, AsyncCall).Times(0);
  AuthService service(mock, TestAuth(provider));
  CompletionQueue cq;

  auto response = service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
  EXPECT_THAT(response, StatusIs(StatusCode::kInvalidArgument));
  EXPECT_THAT(response.status(), AuthErrorIs(AuthErrorKind::kCredentialShape));
}

TEST(AuthService, TransportErrorsPassThrough) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto mock = std::make_shared<MockHttpService>();
  EXPECT_CALL(*mock, AsyncCall)
      .WillOnce([](CompletionQueue&, HttpMethod, RestRequest const&,
                   std::string const&) {
        return make_ready_future(ResponseType(internal::UnavailableError(
            "connection reset", GCP_AUTH_ERROR_INFO())));
      });
  AuthService service(mock, TestAuth(CountingProvider(calls)));
  CompletionQueue cq;
  auto response = service.AsyncCall(cq, HttpMethod::kGet, Request(), {}).get();
  EXPECT_THAT(response, StatusIs(StatusCode::kUnavailable));
  EXPECT_EQ(calls->load(), 1);
}

}  // namespace
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
