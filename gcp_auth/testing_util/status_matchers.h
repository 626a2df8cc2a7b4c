// Copyright 2020 Google LLC
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

#ifndef GCP_AUTH_TESTING_UTIL_STATUS_MATCHERS_H
#define GCP_AUTH_TESTING_UTIL_STATUS_MATCHERS_H

#include "gcp_auth/auth_error.h"
#include "gcp_auth/status.h"
#include "gcp_auth/status_or.h"
#include "gcp_auth/version.h"
#include <gmock/gmock.h>
#include <ostream>
#include <string>
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util_internal {

inline Status const& StatusOf(Status const& status) { return status; }

template <typename T>
Status const& StatusOf(StatusOr<T> const& value) {
  return value.status();
}

// Matches the code and message of a `Status` or of a `StatusOr<T>`.
class StatusIsMatcher {
 public:
  StatusIsMatcher(::testing::Matcher<StatusCode> code,
                  ::testing::Matcher<std::string const&> message)
      : code_(std::move(code)), message_(std::move(message)) {}

  template <typename S>
  bool MatchAndExplain(S const& actual,
                       ::testing::MatchResultListener* listener) const {
    auto const& status = StatusOf(actual);
    *listener << "whose status is " << status;
    return code_.Matches(status.code()) && message_.Matches(status.message());
  }

  void DescribeTo(std::ostream* os) const {
    *os << "has a code that ";
    code_.DescribeTo(os);
    *os << " and a message that ";
    message_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "has a code that ";
    code_.DescribeNegationTo(os);
    *os << " or a message that ";
    message_.DescribeNegationTo(os);
  }

 private:
  ::testing::Matcher<StatusCode> code_;
  ::testing::Matcher<std::string const&> message_;
};

// Matches a `StatusOr<T>` holding a value. The value matcher is cast to
// `T const&` once the type of the `StatusOr<T>` is known.
template <typename ValueMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(ValueMatcher value)
      : value_(std::move(value)) {}

  template <typename T>
  bool MatchAndExplain(StatusOr<T> const& actual,
                       ::testing::MatchResultListener* listener) const {
    if (!actual) {
      *listener << "whose status is " << actual.status();
      return false;
    }
    *listener << "whose value ";
    return ::testing::MatcherCast<T const&>(value_).MatchAndExplain(*actual,
                                                                    listener);
  }

  void DescribeTo(std::ostream* os) const {
    *os << "is OK and holds a matching value";
  }
  void DescribeNegationTo(std::ostream* os) const {
    *os << "is not OK or holds a value that does not match";
  }

 private:
  ValueMatcher value_;
};

}  // namespace testing_util_internal

namespace testing_util {

/**
 * Matches a `Status` or `StatusOr<T>` whose code matches @p code and whose
 * message matches @p message.
 */
template <typename CodeMatcher, typename MessageMatcher>
::testing::PolymorphicMatcher<testing_util_internal::StatusIsMatcher> StatusIs(
    CodeMatcher&& code, MessageMatcher&& message) {
  return ::testing::MakePolymorphicMatcher(
      testing_util_internal::StatusIsMatcher(
          ::testing::MatcherCast<StatusCode>(std::forward<CodeMatcher>(code)),
          ::testing::MatcherCast<std::string const&>(
              std::forward<MessageMatcher>(message))));
}

template <typename CodeMatcher>
::testing::PolymorphicMatcher<testing_util_internal::StatusIsMatcher> StatusIs(
    CodeMatcher&& code) {
  return StatusIs(std::forward<CodeMatcher>(code), ::testing::_);
}

inline ::testing::PolymorphicMatcher<testing_util_internal::StatusIsMatcher>
IsOk() {
  return StatusIs(StatusCode::kOk);
}

/// Matches an OK `StatusOr<T>` whose value matches @p value.
template <typename ValueMatcher>
::testing::PolymorphicMatcher<testing_util_internal::IsOkAndHoldsMatcher<
    typename std::decay<ValueMatcher>::type>>
IsOkAndHolds(ValueMatcher&& value) {
  using Impl = testing_util_internal::IsOkAndHoldsMatcher<
      typename std::decay<ValueMatcher>::type>;
  return ::testing::MakePolymorphicMatcher(
      Impl(std::forward<ValueMatcher>(value)));
}

/**
 * Matches a `Status` reporting an authentication error of kind @p kind.
 *
 * @par Example:
 * @code
 *   EXPECT_THAT(token.status(), AuthErrorIs(AuthErrorKind::kTransport));
 * @endcode
 */
MATCHER_P(AuthErrorIs, kind,
          std::string(negation ? "isn't" : "is") +
              " an authentication error of kind " +
              ::testing::PrintToString(kind)) {
  auto const actual = ::gcp_auth::GetAuthErrorKind(arg);
  if (!actual) {
    *result_listener << "which is not an authentication error";
    return false;
  }
  *result_listener << "whose kind is " << *actual;
  return *actual == kind;
}

#define EXPECT_STATUS_OK(expression) \
  EXPECT_THAT(expression, ::gcp_auth::testing_util::IsOk())
#define ASSERT_STATUS_OK(expression) \
  ASSERT_THAT(expression, ::gcp_auth::testing_util::IsOk())

}  // namespace testing_util
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_TESTING_UTIL_STATUS_MATCHERS_H
