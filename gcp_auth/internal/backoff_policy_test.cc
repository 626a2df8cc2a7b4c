// Copyright 2018 Google LLC
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

#include "gcp_auth/internal/backoff_policy.h"
#include <gmock/gmock.h>
#include <stdexcept>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ms = std::chrono::milliseconds;
using ::testing::AllOf;
using ::testing::Ge;
using ::testing::Le;

TEST(ExponentialBackoffPolicy, FirstDelayIsInitial) {
  ExponentialBackoffPolicy tested(ms(10), ms(50));
  EXPECT_EQ(tested.OnCompletion(), ms(10));
}

TEST(ExponentialBackoffPolicy, DelaysAreBounded) {
  ExponentialBackoffPolicy tested(ms(10), ms(50));
  for (int i = 0; i != 20; ++i) {
    SCOPED_TRACE("iteration " + std::to_string(i));
    EXPECT_THAT(tested.OnCompletion().count(), AllOf(Ge(10), Le(50)));
  }
}

TEST(ExponentialBackoffPolicy, CloneStartsOver) {
  ExponentialBackoffPolicy original(ms(10), ms(50));
  for (int i = 0; i != 5; ++i) original.OnCompletion();
  auto clone = original.clone();
  EXPECT_EQ(clone->OnCompletion(), ms(10));
}

TEST(ExponentialBackoffPolicy, CappedAtMaximum) {
  ExponentialBackoffPolicy tested(ms(10), ms(10), 4.0);
  for (int i = 0; i != 5; ++i) EXPECT_EQ(tested.OnCompletion(), ms(10));
}

TEST(ExponentialBackoffPolicy, InvalidParameters) {
  EXPECT_THROW(ExponentialBackoffPolicy(ms(10), ms(50), 1.0),
               std::invalid_argument);
  EXPECT_THROW(ExponentialBackoffPolicy(ms(10), ms(50), 0.5),
               std::invalid_argument);
  EXPECT_THROW(ExponentialBackoffPolicy(ms(50), ms(10)),
               std::invalid_argument);
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
