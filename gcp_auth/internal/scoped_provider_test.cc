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

#include "gcp_auth/internal/scoped_provider.h"
#include "gcp_auth/testing_util/mock_token_provider.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::gcp_auth::testing_util::MockTokenProvider;
using ::testing::_;
using ::testing::Return;

TEST(ScopedProvider, UsesFixedScopes) {
  auto const now = std::chrono::system_clock::from_time_t(1700000000);
  auto mock = std::make_shared<MockTokenProvider>();
  EXPECT_CALL(*mock, name).WillRepeatedly(Return("mock"));
  EXPECT_CALL(*mock, AsyncGetToken(_, Scopes{scopes::kPubSub}))
      .WillOnce([now](CompletionQueue&, Scopes const&) {
        return make_ready_future(
            Token::Create("scoped-token", now, now + std::chrono::hours(1)));
      });

  ScopedProvider provider(mock, Scopes{scopes::kPubSub});
  EXPECT_EQ(provider.kind(), ProviderKind::kScoped);
  EXPECT_EQ(provider.name(), "scoped(mock)");
  EXPECT_FALSE(provider.requires_scopes());
  EXPECT_EQ(provider.scopes(), Scopes{scopes::kPubSub});

  CompletionQueue cq;
  auto token =
      provider.AsyncGetToken(cq, Scopes{scopes::kCloudPlatform}).get();
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->access_token(), "scoped-token");
}

TEST(ScopedProvider, WithNewScopesSharesInner) {
  auto mock = std::make_shared<MockTokenProvider>();
  ScopedProvider provider(mock, Scopes{scopes::kPubSub});
  auto other = provider.WithNewScopes(Scopes{scopes::kCloudPlatform});
  EXPECT_EQ(other->inner(), provider.inner());
  EXPECT_EQ(other->scopes(), Scopes{scopes::kCloudPlatform});
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
