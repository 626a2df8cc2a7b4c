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

#include "gcp_auth/token.h"
#include "gcp_auth/auth_error.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <sstream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::gcp_auth::testing_util::AuthErrorIs;
using ::gcp_auth::testing_util::IsOk;
using ::gcp_auth::testing_util::StatusIs;
using ::testing::HasSubstr;
using ::testing::Not;
using std::chrono::minutes;
using std::chrono::seconds;

TEST(Token, Create) {
  auto const now = std::chrono::system_clock::now();
  auto token = Token::Create("test-token", now, now + minutes(60));
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->access_token(), "test-token");
  EXPECT_EQ(token->acquired_at(), now);
  EXPECT_EQ(token->expiry(), now + minutes(60));
  EXPECT_EQ(token->authorization_header(), "Bearer test-token");
}

TEST(Token, CreateAllowsTab) {
  auto const now = std::chrono::system_clock::now();
  EXPECT_THAT(Token::Create("a\tb", now, now + minutes(5)), IsOk());
}

TEST(Token, CreateRejectsInvalid) {
  auto const now = std::chrono::system_clock::now();
  for (std::string const t : {std::string{}, std::string{"a\nb"},
                              std::string{"a\rb"}, std::string{"a\x7f"},
                              std::string("a\0b", 3)}) {
    SCOPED_TRACE("Testing with <" + t + ">");
    auto token = Token::Create(t, now, now + minutes(60));
    EXPECT_THAT(token, StatusIs(StatusCode::kInvalidArgument));
    EXPECT_THAT(token.status(),
                AuthErrorIs(AuthErrorKind::kInvalidTokenShape));
  }
}

TEST(Token, ValidFor) {
  auto const now = std::chrono::system_clock::now();
  auto token = Token::Create("test-token", now, now + minutes(60));
  ASSERT_STATUS_OK(token);
  auto valid_for = token->ValidFor(now);
  ASSERT_TRUE(valid_for.has_value());
  EXPECT_EQ(*valid_for, minutes(60) - kTokenRefreshSkew);
  EXPECT_LE(*valid_for, token->expiry() - now);

  EXPECT_TRUE(token->IsValid(now + minutes(58)));
  EXPECT_FALSE(token->IsValid(now + minutes(59)));
  EXPECT_FALSE(token->IsValid(now + minutes(61)));
}

TEST(Token, ExpiresWithinSkewIsInvalid) {
  auto const now = std::chrono::system_clock::now();
  auto zero = Token::Create("test-token", now, now);
  ASSERT_STATUS_OK(zero);
  EXPECT_FALSE(zero->IsValid(now));

  auto skew = Token::Create("test-token", now, now + kTokenRefreshSkew);
  ASSERT_STATUS_OK(skew);
  EXPECT_FALSE(skew->IsValid(now));

  auto longer =
      Token::Create("test-token", now, now + kTokenRefreshSkew + seconds(1));
  ASSERT_STATUS_OK(longer);
  EXPECT_TRUE(longer->IsValid(now));
  EXPECT_EQ(longer->ValidFor(now).value(), seconds(1));
}

TEST(Token, Equality) {
  auto const now = std::chrono::system_clock::now();
  auto a = Token::Create("a", now, now + minutes(5)).value();
  auto b = Token::Create("a", now, now + minutes(5)).value();
  auto c = Token::Create("c", now, now + minutes(5)).value();
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

TEST(Token, StreamingIsRedacted) {
  auto const now = std::chrono::system_clock::now();
  auto token = Token::Create("abcd-secret-value", now, now + minutes(5));
  ASSERT_STATUS_OK(token);
  std::ostringstream os;
  os << *token;
  EXPECT_THAT(os.str(), HasSubstr("abcd[censored]"));
  EXPECT_THAT(os.str(), Not(HasSubstr("secret")));
}

}  // namespace
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
